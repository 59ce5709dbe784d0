// EditRoundtrip.cpp
//
// Logging tag: [EDIT].

#include "EditRoundtrip.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include "RemotePath.h"
#include "TransferEngine.h"

static QDateTime fileMtime(const QString &path)
{
    return QFileInfo(path).fileTime(QFileDevice::FileModificationTime);
}

QString EditRoundtrip::scratchDir()
{
    return QDir(QDir::tempPath())
        .filePath(QString("twinpane-edit-%1").arg(QCoreApplication::applicationPid()));
}

void EditRoundtrip::removeScratchDir()
{
    QDir dir(scratchDir());
    if (!dir.exists())
        return;
    if (!dir.removeRecursively())
        qWarning().noquote() << QString("[EDIT] cannot remove scratch directory '%1'").arg(dir.path());
}

LocalEdit EditRoundtrip::prepareLocal(const QString &dir, const QString &name)
{
    LocalEdit e;
    e.path = QDir(dir).filePath(name);
    return e;
}

bool EditRoundtrip::prepareRemote(RemoteSession &session, const QString &name,
                                  RemoteEdit *out, SftpError *err)
{
    if (err) err->clear();

    const QString dir = scratchDir();
    if (!QDir().mkpath(dir)) {
        setError(err, SftpError::localIo(QString("cannot create scratch directory '%1'").arg(dir)));
        return false;
    }

    RemoteEdit r;
    r.remotePath  = remoteJoin(session.currentPath(), name);
    r.scratchPath = QDir(dir).filePath(name);

    if (!session.downloadFile(r.remotePath, r.scratchPath, err)) {
        qWarning().noquote() << QString("[EDIT] download '%1' failed: %2")
                                .arg(r.remotePath, err ? err->toString() : QString());
        return false;
    }

    r.mtimeBefore = fileMtime(r.scratchPath);
    qInfo().noquote() << QString("[EDIT] fetched '%1' -> '%2'").arg(r.remotePath, r.scratchPath);

    if (out) *out = r;
    return true;
}

EditRoundtrip::Outcome EditRoundtrip::finishRemote(const RemoteEdit &req, RemoteSession *session,
                                                   int timeoutSec, SftpError *err)
{
    if (err) err->clear();

    const QDateTime after = fileMtime(req.scratchPath);
    const bool changed = after.isValid() && req.mtimeBefore.isValid() && after > req.mtimeBefore;

    Outcome outcome = Outcome::Unchanged;

    if (changed && !session) {
        qInfo().noquote() << QString("[EDIT] '%1' changed but no session left, discarding").arg(req.remotePath);
        outcome = Outcome::Discarded;
    } else if (changed) {
        SftpError openErr;
        std::unique_ptr<SftpChannel> ch;
        if (session->channelFactory()) {
            ch = session->channelFactory()(session->profile(), session->password(), timeoutSec, &openErr);
        }
        if (!ch && !openErr.isError())
            openErr = SftpError::transport(QStringLiteral("no channel"));

        if (!ch) {
            setError(err, openErr);
            outcome = Outcome::UploadFailed;
        } else if (!TransferEngine::uploadFileReplacing(*ch, req.scratchPath, req.remotePath, err)) {
            outcome = Outcome::UploadFailed;
        } else {
            outcome = Outcome::Uploaded;
        }

        if (outcome == Outcome::Uploaded)
            qInfo().noquote() << QString("[EDIT] uploaded '%1'").arg(req.remotePath);
        else
            qWarning().noquote() << QString("[EDIT] upload '%1' failed: %2")
                                    .arg(req.remotePath, err ? err->toString() : QString());
    } else {
        qInfo().noquote() << QString("[EDIT] '%1' unchanged, no upload").arg(req.remotePath);
    }

    if (!QFile::remove(req.scratchPath))
        qWarning().noquote() << QString("[EDIT] cannot remove scratch file '%1'").arg(req.scratchPath);

    return outcome;
}

// -----------------------------------------------------------------------------
// Editor
// -----------------------------------------------------------------------------
static bool programOnPath(const QString &command)
{
    const QStringList parts = QProcess::splitCommand(command);
    if (parts.isEmpty())
        return false;
    return !QStandardPaths::findExecutable(parts.first()).isEmpty();
}

QString EditRoundtrip::resolveEditor(const QString &configured)
{
    QStringList candidates;
    candidates << configured.trimmed()
               << qEnvironmentVariable("EDITOR").trimmed()
               << qEnvironmentVariable("VISUAL").trimmed()
               << QStringLiteral("vim")
               << QStringLiteral("nano")
               << QStringLiteral("vi");

    for (const QString &c : candidates) {
        if (!c.isEmpty() && programOnPath(c))
            return c;
    }
    return QString();
}

bool EditRoundtrip::runEditor(const QString &editor, const QString &path, QString *err)
{
    if (err) err->clear();

    QStringList args = QProcess::splitCommand(editor);
    if (args.isEmpty()) {
        if (err) *err = QStringLiteral("No editor found (set edit/editor or $EDITOR)");
        return false;
    }
    const QString program = args.takeFirst();
    args << path;

    QProcess p;
    p.setProcessChannelMode(QProcess::ForwardedChannels);
    p.setInputChannelMode(QProcess::ForwardedInputChannel);
    p.start(program, args);
    if (!p.waitForStarted(-1)) {
        if (err) *err = QString("Cannot start editor '%1': %2").arg(program, p.errorString());
        return false;
    }
    p.waitForFinished(-1);

    qInfo().noquote() << QString("[EDIT] editor '%1' exited (code %2)").arg(program).arg(p.exitCode());
    return true;
}
