// AppState.cpp
//
// Logging tag: [APP]. Status lines are the user-facing result of every action.

#include "AppState.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include "LocalFs.h"
#include "TransferEngine.h"

static QString batchLabel(const QVector<FileEntry> &entries)
{
    if (entries.size() == 1)
        return QString("'%1'").arg(entries.first().name);
    return QString("%1 entries").arg(entries.size());
}

AppState::AppState(ChannelFactory factory, const AppConfig &config, const QString &startDir)
    : m_factory(std::move(factory)),
      m_config(config),
      m_left(startDir),
      m_right(startDir)
{
    QString err;
    if (!m_left.loadLocal(&err)) {
        m_status = QString("Cannot read '%1': %2").arg(startDir, err);
        qWarning().noquote() << "[APP]" << m_status;
    }
}

AppState::~AppState()
{
    // Running workers own their sessions and are left to finish on their own.
    m_session.reset();
    EditRoundtrip::removeScratchDir();
}

void AppState::togglePanel()
{
    m_active = (m_active == PanelSide::Left) ? PanelSide::Right : PanelSide::Left;
}

QString AppState::layoutLine() const
{
    auto describe = [this](PanelSide side) {
        QString text;
        if (side == PanelSide::Left)
            text = "local:" + m_left.path();
        else
            text = m_session ? "remote:" + m_right.path() : QString("remote:(not connected)");
        if (side == m_active)
            text += "*";
        return text;
    };

    const PanelSide first  = m_panelsSwapped ? PanelSide::Right : PanelSide::Left;
    const PanelSide second = m_panelsSwapped ? PanelSide::Left : PanelSide::Right;
    return QString("[ %1 | %2 ]").arg(describe(first), describe(second));
}

bool AppState::activeSideAvailable() const
{
    return m_active == PanelSide::Left || isConnected();
}

// -----------------------------------------------------------------------------
// Connection
// -----------------------------------------------------------------------------
void AppState::beginConnect(const SshProfile &profile)
{
    if (profile.auth == AuthMethod::Password) {
        PasswordDialog d;
        d.profile = profile;
        m_dialog = d;
        return;
    }
    doConnect(profile, QString());
}

void AppState::submitPassword(const QString &password)
{
    const auto *d = std::get_if<PasswordDialog>(&m_dialog);
    if (!d)
        return;
    const SshProfile profile = d->profile;
    doConnect(profile, password);
}

void AppState::doConnect(const SshProfile &profile, const QString &password)
{
    if (m_session) {
        qInfo().noquote() << "[APP] existing session present -> closing before reconnect";
        m_session.reset();
    }

    SftpError err;
    std::unique_ptr<RemoteSession> s = RemoteSession::connect(profile, password, m_factory,
                                                              m_config.connectTimeoutSec, &err);
    if (!s) {
        if (auto *d = std::get_if<PasswordDialog>(&m_dialog))
            d->error = err.toString();
        else
            m_status = err.toString();
        return;
    }

    QVector<FileEntry> entries;
    SftpError listErr;
    bool listed = false;
    QString msg = QString("Connected: %1@%2").arg(s->user(), s->host());

    if (profile.hasRemoteStartPath()) {
        const QString raw = profile.remoteStartPath.trimmed();
        SftpError startErr;
        if (s->changeToAbsolute(raw, &entries, &startErr)) {
            listed = true;
            msg = QString("Connected: %1@%2 -> %3").arg(s->user(), s->host(), s->currentPath());
        } else {
            // Start directory is a convenience; fall back to the home listing.
            msg = QString("Start directory '%1' unreachable: %2").arg(raw, startErr.toString());
            qWarning().noquote() << "[APP]" << msg;
        }
    }

    if (!listed)
        listed = s->list(&entries, &listErr);

    if (listed)
        m_right.loadRemote(s->currentPath(), entries);
    else
        msg = QString("Connected, listing failed: %1").arg(listErr.toString());

    m_status  = msg;
    m_session = std::move(s);
    m_dialog  = NoDialog{};

    applyLocalStartPath(profile);
}

void AppState::applyLocalStartPath(const SshProfile &profile)
{
    if (!profile.hasLocalStartPath())
        return;

    const QString expanded = LocalFs::expandStartPath(profile.localStartPath);

    // A missing directory silently keeps the current local panel.
    if (!QFileInfo(expanded).isDir())
        return;

    m_left.setPath(expanded);
    m_left.setCursor(0);

    QString err;
    if (!m_left.loadLocal(&err))
        m_status += QString(" | Local start directory failed: %1").arg(err);
}

void AppState::disconnect()
{
    if (!m_session)
        return;

    m_session.reset();
    m_right.reset(m_left.path());
    m_status = QStringLiteral("Disconnected");
    qInfo().noquote() << "[APP] disconnected";
}

// -----------------------------------------------------------------------------
// Navigation
// -----------------------------------------------------------------------------
void AppState::enterSelected()
{
    if (m_active == PanelSide::Left) {
        QString err;
        if (!m_left.enterSelected(&err))
            m_status = QString("Cannot open directory: %1").arg(err);
        return;
    }

    if (!m_session)
        return;
    const FileEntry *e = m_right.currentEntry();
    if (!e || !e->isDir)
        return;

    QVector<FileEntry> entries;
    SftpError err;
    if (m_session->enterDirectory(e->name, &entries, &err))
        m_right.loadRemote(m_session->currentPath(), entries);
    else
        m_status = QString("Cannot open directory: %1").arg(err.toString());
}

void AppState::goUp()
{
    if (m_active == PanelSide::Left) {
        QString err;
        if (!m_left.goUp(&err))
            m_status = QString("Cannot change directory: %1").arg(err);
        return;
    }

    if (!m_session)
        return;

    QVector<FileEntry> entries;
    SftpError err;
    if (m_session->goUp(&entries, &err))
        m_right.loadRemote(m_session->currentPath(), entries);
    else
        m_status = QString("Cannot change directory: %1").arg(err.toString());
}

void AppState::refreshActive()
{
    if (m_active == PanelSide::Left) {
        QString err;
        if (!m_left.loadLocal(&err))
            m_status = QString("Local refresh failed: %1").arg(err);
        return;
    }
    refreshRemotePanel();
}

void AppState::refreshRemotePanel()
{
    if (!m_session)
        return;

    SftpError err;
    if (!MutationOps::refreshRemote(*m_session, m_right, &err))
        m_status = QString("Remote refresh failed: %1").arg(err.toString());
}

// -----------------------------------------------------------------------------
// Transfers
// -----------------------------------------------------------------------------
bool AppState::startUpload()
{
    if (!m_session)
        return false;
    if (isUploading()) {
        m_status = QStringLiteral("An upload is already running");
        return false;
    }

    const QVector<FileEntry> entries = m_left.selectedEntries();
    if (entries.isEmpty())
        return false;

    int total = 0;
    for (const FileEntry &e : entries)
        total += TransferEngine::countLocalFiles(QDir(m_left.path()).filePath(e.name));

    TransferRequest req;
    req.profile    = m_session->profile();
    req.password   = m_session->password();
    req.timeoutSec = m_config.transferTimeoutSec;
    req.factory    = m_session->channelFactory();
    req.entries    = entries;
    req.sourceDir  = m_left.path();
    req.destDir    = m_session->currentPath();
    req.progress   = std::make_shared<TransferProgress>(qMax(1, total));

    m_upload       = req.progress;
    m_uploadFuture = TransferEngine::startUpload(req);

    m_status = QString("Uploading %1...").arg(batchLabel(entries));
    m_left.clearMarks();
    return true;
}

bool AppState::startDownload()
{
    if (!m_session)
        return false;
    if (isDownloading()) {
        m_status = QStringLiteral("A download is already running");
        return false;
    }

    const QVector<FileEntry> entries = m_right.selectedEntries();
    if (entries.isEmpty())
        return false;

    TransferRequest req;
    req.profile    = m_session->profile();
    req.password   = m_session->password();
    req.timeoutSec = m_config.transferTimeoutSec;
    req.factory    = m_session->channelFactory();
    req.entries    = entries;
    req.sourceDir  = m_session->currentPath();
    req.destDir    = m_left.path();
    // Placeholder until the worker has counted the remote tree.
    req.progress   = std::make_shared<TransferProgress>(1);

    m_download       = req.progress;
    m_downloadFuture = TransferEngine::startDownload(req);

    m_status = QString("Downloading %1...").arg(batchLabel(entries));
    m_right.clearMarks();
    return true;
}

void AppState::pollTransfers()
{
    if (m_upload) {
        const TransferSnapshot s = m_upload->snapshot();
        if (s.state == TransferState::Done) {
            m_upload.reset();
            m_status = QStringLiteral("Upload complete");
            refreshRemotePanel();
        } else if (s.state == TransferState::Failed) {
            m_upload.reset();
            m_status = QString("Upload failed: %1").arg(s.error);
        }
    }

    if (m_download) {
        const TransferSnapshot s = m_download->snapshot();
        if (s.state == TransferState::Done) {
            m_download.reset();
            m_status = QStringLiteral("Download complete");
            QString err;
            if (!m_left.loadLocal(&err))
                m_status = QString("Local refresh failed: %1").arg(err);
        } else if (s.state == TransferState::Failed) {
            m_download.reset();
            m_status = QString("Download failed: %1").arg(s.error);
        }
    }
}

void AppState::waitForTransfers()
{
    m_uploadFuture.waitForFinished();
    m_downloadFuture.waitForFinished();
}

// -----------------------------------------------------------------------------
// Rename / mkdir / delete
// -----------------------------------------------------------------------------
void AppState::openRenameDialog()
{
    if (!activeSideAvailable())
        return;

    const FileEntry *e = activePanel().currentEntry();
    if (!e || e->isParent())
        return;

    RenameDialog d;
    d.side     = m_active;
    d.original = e->name;
    m_dialog = d;
}

void AppState::confirmRename(const QString &newName)
{
    const auto *d = std::get_if<RenameDialog>(&m_dialog);
    if (!d)
        return;
    const RenameDialog dlg = *d;
    m_dialog = NoDialog{};

    const QString name = newName.trimmed();
    if (name.isEmpty() || name == dlg.original)
        return;

    SftpError err;
    bool ok = false;
    if (dlg.side == PanelSide::Left) {
        ok = MutationOps::renameLocal(m_left, dlg.original, name, &err);
    } else {
        if (!m_session) return;
        ok = MutationOps::renameRemote(*m_session, m_right, dlg.original, name, &err);
    }

    m_status = ok ? QString("Renamed: %1 -> %2").arg(dlg.original, name)
                  : QString("Rename failed: %1").arg(err.toString());
}

void AppState::openMkdirDialog()
{
    if (!activeSideAvailable())
        return;

    MkdirDialog d;
    d.side = m_active;
    m_dialog = d;
}

void AppState::confirmMkdir(const QString &name)
{
    const auto *d = std::get_if<MkdirDialog>(&m_dialog);
    if (!d)
        return;
    const PanelSide side = d->side;
    m_dialog = NoDialog{};

    const QString n = name.trimmed();
    if (n.isEmpty())
        return;

    SftpError err;
    bool ok = false;
    if (side == PanelSide::Left) {
        ok = MutationOps::mkdirLocal(m_left, n, &err);
    } else {
        if (!m_session) return;
        ok = MutationOps::mkdirRemote(*m_session, m_right, n, &err);
    }

    m_status = ok ? QString("Directory '%1' created").arg(n)
                  : QString("Create directory failed: %1").arg(err.toString());
}

void AppState::openDeleteDialog()
{
    if (!activeSideAvailable())
        return;

    QVector<DeleteTarget> targets;
    for (const FileEntry &e : activePanel().selectedEntries())
        targets.push_back({e.name, e.isDir});
    if (targets.isEmpty())
        return;

    DeleteDialog d;
    d.side    = m_active;
    d.targets = targets;
    m_dialog = d;
}

void AppState::confirmDelete()
{
    const auto *d = std::get_if<DeleteDialog>(&m_dialog);
    if (!d)
        return;
    const DeleteDialog dlg = *d;
    m_dialog = NoDialog{};

    DeleteSummary s;
    if (dlg.side == PanelSide::Left) {
        s = MutationOps::deleteLocal(m_left, dlg.targets);
    } else {
        if (!m_session) return;
        s = MutationOps::deleteRemote(*m_session, m_right, dlg.targets);
    }

    if (!s.refreshError.isEmpty()) {
        m_status = QString("Listing failed: %1").arg(s.refreshError);
        return;
    }
    m_status = s.statusText(dlg.targets);

    if (dlg.side == PanelSide::Left) m_left.clearMarks();
    else m_right.clearMarks();
}

// -----------------------------------------------------------------------------
// Edit round-trip
// -----------------------------------------------------------------------------
bool AppState::prepareEdit(EditRequest *out)
{
    if (!activeSideAvailable())
        return false;

    const FileEntry *e = activePanel().currentEntry();
    if (!e || e->isDir || e->isParent()) {
        m_status = QStringLiteral("No editable entry selected");
        return false;
    }

    if (m_active == PanelSide::Left) {
        if (out) *out = EditRoundtrip::prepareLocal(m_left.path(), e->name);
        return true;
    }

    RemoteEdit r;
    SftpError err;
    if (!EditRoundtrip::prepareRemote(*m_session, e->name, &r, &err)) {
        m_status = QString("Download for editing failed: %1").arg(err.toString());
        return false;
    }
    if (out) *out = r;
    return true;
}

void AppState::finishEdit(const EditRequest &req)
{
    if (std::holds_alternative<LocalEdit>(req)) {
        QString err;
        m_status = m_left.loadLocal(&err) ? QStringLiteral("Editor closed")
                                          : QString("Local refresh failed: %1").arg(err);
        return;
    }

    const RemoteEdit &r = std::get<RemoteEdit>(req);
    SftpError err;
    const EditRoundtrip::Outcome outcome =
        EditRoundtrip::finishRemote(r, m_session.get(), m_config.transferTimeoutSec, &err);

    switch (outcome) {
    case EditRoundtrip::Outcome::Unchanged:
        m_status = QStringLiteral("No changes, nothing uploaded");
        break;
    case EditRoundtrip::Outcome::Discarded:
        m_status = QStringLiteral("Not connected, edit discarded");
        break;
    case EditRoundtrip::Outcome::Uploaded:
        m_status = QString("'%1' uploaded").arg(QFileInfo(r.scratchPath).fileName());
        refreshRemotePanel();
        break;
    case EditRoundtrip::Outcome::UploadFailed:
        m_status = QString("Upload failed: %1").arg(err.toString());
        refreshRemotePanel();
        break;
    }
}
