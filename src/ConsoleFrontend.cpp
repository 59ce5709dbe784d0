// ConsoleFrontend.cpp
//
// Logging tag: [APP]. Output for the user goes to stdout, diagnostics to the log.

#include "ConsoleFrontend.h"

#include <QCoreApplication>
#include <QDebug>
#include <QProcess>
#include <QSocketNotifier>

#include <termios.h>
#include <unistd.h>

#include "EditRoundtrip.h"
#include "ProfileStore.h"

static QString sizeText(const FileEntry &e)
{
    if (e.isDir) return QStringLiteral("<DIR>");
    if (!e.hasSize) return QString();
    return QString::number(e.size);
}

ConsoleFrontend::ConsoleFrontend(AppState *state, QVector<SshProfile> profiles, QObject *parent)
    : QObject(parent),
      m_state(state),
      m_profiles(std::move(profiles)),
      m_out(stdout)
{
    m_tick.setInterval(100);
    connect(&m_tick, &QTimer::timeout, this, &ConsoleFrontend::onTick);
}

ConsoleFrontend::~ConsoleFrontend()
{
    setEcho(true);
}

void ConsoleFrontend::start(const QString &initialCommand)
{
    if (!m_stdin.open(STDIN_FILENO, QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        qCritical().noquote() << "[APP] cannot open stdin:" << m_stdin.errorString();
        QCoreApplication::exit(1);
        return;
    }

    m_notifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &ConsoleFrontend::onStdinReady);

    m_tick.start();

    m_out << "twinpane - type 'help' for commands\n";
    if (!initialCommand.isEmpty())
        handleLine(initialCommand);
    reportStatus();
    prompt();
}

void ConsoleFrontend::prompt()
{
    if (m_pending == Pending::Password)
        m_out << "Password: ";
    else if (m_pending == Pending::DeleteConfirm)
        m_out << "Delete? [y/N] ";
    else
        m_out << (m_state->activeSide() == PanelSide::Left ? "local" : "remote")
              << ":" << m_state->activePanel().path() << "> ";
    m_out.flush();
}

void ConsoleFrontend::onStdinReady()
{
    const QByteArray raw = m_stdin.readLine();
    if (raw.isEmpty()) {
        quit();
        return;
    }

    if (!handleLine(QString::fromLocal8Bit(raw).trimmed())) {
        quit();
        return;
    }
    reportStatus();
    prompt();
}

void ConsoleFrontend::quit()
{
    m_tick.stop();
    if (m_notifier) m_notifier->setEnabled(false);
    setEcho(true);
    m_out << "\n";
    m_out.flush();
    QCoreApplication::quit();
}

void ConsoleFrontend::onTick()
{
    printProgress("upload", m_state->uploadProgress());
    printProgress("download", m_state->downloadProgress());

    const bool busy = m_state->isUploading() || m_state->isDownloading();
    m_state->pollTransfers();

    if (busy && m_state->statusMessage() != m_lastStatus) {
        m_out << "\n";
        reportStatus();
        prompt();
    }
}

void ConsoleFrontend::printProgress(const char *label, const ProgressHandle &h)
{
    QString &last = (qstrcmp(label, "upload") == 0) ? m_lastUploadLine : m_lastDownloadLine;
    if (!h) {
        last.clear();
        return;
    }

    const TransferSnapshot s = h->snapshot();
    if (s.isFinished())
        return;

    const QString file = s.fileFractionKnown()
        ? QString("%1 %2%").arg(s.currentFile).arg(qRound(s.fileFraction() * 100))
        : QString("%1 ...").arg(s.currentFile);

    const QString line = QString("[%1] %2 (%3/%4 files, %5%)")
                             .arg(QLatin1String(label), file)
                             .arg(s.filesDone)
                             .arg(s.filesTotal)
                             .arg(qRound(s.overallFraction() * 100));
    if (line == last)
        return;
    last = line;

    m_out << "\r" << line;
    m_out.flush();
}

void ConsoleFrontend::reportStatus()
{
    const QString s = m_state->statusMessage();
    if (s != m_lastStatus && !s.isEmpty())
        m_out << "-- " << s << "\n";
    m_lastStatus = s;

    if (const auto *d = std::get_if<PasswordDialog>(&m_state->dialog())) {
        if (!d->error.isEmpty())
            m_out << "-- " << d->error << "\n";
    }
    m_out.flush();
}

// -----------------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------------
bool ConsoleFrontend::handleLine(const QString &line)
{
    if (m_pending == Pending::Password) {
        m_pending = Pending::None;
        setEcho(true);
        m_out << "\n";
        if (line.isEmpty()) {
            m_state->cancelDialog();
            return true;
        }
        m_state->submitPassword(line);
        if (std::holds_alternative<PasswordDialog>(m_state->dialog())) {
            m_pending = Pending::Password;
            setEcho(false);
        }
        return true;
    }

    if (m_pending == Pending::DeleteConfirm) {
        m_pending = Pending::None;
        if (line.compare("y", Qt::CaseInsensitive) == 0 || line.compare("yes", Qt::CaseInsensitive) == 0)
            m_state->confirmDelete();
        else
            m_state->cancelDialog();
        return true;
    }

    QStringList args = QProcess::splitCommand(line);
    if (args.isEmpty())
        return true;
    const QString cmd = args.takeFirst().toLower();

    if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        return false;
    } else if (cmd == "help" || cmd == "?") {
        printHelp();
    } else if (cmd == "profiles") {
        printProfiles();
    } else if (cmd == "profile") {
        profileCommand(args);
    } else if (cmd == "connect") {
        connectTo(args.value(0));
    } else if (cmd == "disconnect") {
        m_state->disconnect();
    } else if (cmd == "ls") {
        printPanel();
    } else if (cmd == "refresh") {
        m_state->refreshActive();
    } else if (cmd == "tab") {
        m_state->togglePanel();
    } else if (cmd == "swap") {
        m_state->swapPanels();
        printLayout();
    } else if (cmd == "cd") {
        const QString name = args.value(0);
        if (name == "..")
            m_state->goUp();
        else if (selectByName(name))
            m_state->enterSelected();
    } else if (cmd == "up") {
        m_state->goUp();
    } else if (cmd == "sel") {
        selectByName(args.value(0));
    } else if (cmd == "mark") {
        if (args.isEmpty() || selectByName(args.value(0)))
            m_state->activePanel().toggleMark();
    } else if (cmd == "markall") {
        m_state->activePanel().markAll();
    } else if (cmd == "put") {
        m_state->startUpload();
    } else if (cmd == "get") {
        m_state->startDownload();
    } else if (cmd == "rename") {
        if (args.size() < 2) {
            m_out << "usage: rename <old> <new>\n";
        } else if (selectByName(args.value(0))) {
            m_state->openRenameDialog();
            m_state->confirmRename(args.value(1));
        }
    } else if (cmd == "mkdir") {
        if (args.isEmpty()) {
            m_out << "usage: mkdir <name>\n";
        } else {
            m_state->openMkdirDialog();
            m_state->confirmMkdir(args.value(0));
        }
    } else if (cmd == "rm") {
        if (!args.isEmpty() && !selectByName(args.value(0)))
            return true;
        m_state->openDeleteDialog();
        if (const auto *d = std::get_if<DeleteDialog>(&m_state->dialog())) {
            for (const DeleteTarget &t : d->targets)
                m_out << "  " << t.name << (t.isDir ? "/" : "") << "\n";
            m_pending = Pending::DeleteConfirm;
        }
    } else if (cmd == "edit") {
        if (args.isEmpty() || selectByName(args.value(0)))
            editSelected();
    } else {
        m_out << "unknown command '" << cmd << "' (try 'help')\n";
    }

    m_out.flush();
    return true;
}

bool ConsoleFrontend::selectByName(const QString &name)
{
    PanelModel &p = m_state->activePanel();

    bool isIndex = false;
    const int idx = name.toInt(&isIndex);
    if (isIndex && idx >= 0 && idx < p.entries().size()) {
        p.setCursor(idx);
        return true;
    }

    for (int i = 0; i < p.entries().size(); ++i) {
        if (p.entries()[i].name == name) {
            p.setCursor(i);
            return true;
        }
    }
    m_out << "no entry '" << name << "'\n";
    return false;
}

void ConsoleFrontend::connectTo(const QString &which)
{
    if (m_profiles.isEmpty()) {
        m_out << "no profiles\n";
        return;
    }

    const SshProfile *p = nullptr;
    bool isIndex = false;
    const int idx = which.toInt(&isIndex);
    if (which.isEmpty())
        p = &m_profiles.first();
    else if (isIndex && idx >= 0 && idx < m_profiles.size())
        p = &m_profiles[idx];
    else
        p = ProfileStore::findByName(m_profiles, which);

    if (!p) {
        m_out << "no profile '" << which << "'\n";
        return;
    }

    m_state->beginConnect(*p);
    if (std::holds_alternative<PasswordDialog>(m_state->dialog())) {
        m_pending = Pending::Password;
        setEcho(false);
    }
}

void ConsoleFrontend::profileCommand(const QStringList &args)
{
    const QString sub = args.value(0).toLower();
    QString err;

    if (sub == "add" && args.size() >= 3) {
        SshProfile p;
        p.name = args.value(1);
        if (!ProfileStore::parseDestination(args.value(2), &p, &err)
            || (args.size() > 3 && !ProfileStore::setField(&p, "auth", args.value(3), &err))
            || (args.size() > 4 && !ProfileStore::setField(&p, "key", args.value(4), &err))
            || !ProfileStore::upsert(m_profiles, p, &err)) {
            m_out << "-- " << err << "\n";
            return;
        }
        m_out << "-- Profile '" << p.name << "' saved\n";
    } else if (sub == "set" && args.size() >= 3) {
        const SshProfile *found = ProfileStore::findByName(m_profiles, args.value(1));
        if (!found) {
            m_out << "-- No profile '" << args.value(1) << "'\n";
            return;
        }
        SshProfile p = *found;
        if (!ProfileStore::setField(&p, args.value(2), args.value(3), &err)
            || !ProfileStore::upsert(m_profiles, p, &err)) {
            m_out << "-- " << err << "\n";
            return;
        }
        m_out << "-- Profile '" << p.name << "' saved\n";
    } else if (sub == "rm" && args.size() == 2) {
        if (!ProfileStore::remove(m_profiles, args.value(1), &err)) {
            m_out << "-- " << err << "\n";
            return;
        }
        m_out << "-- Profile '" << args.value(1) << "' removed\n";
    } else {
        m_out << "usage: profile add <name> <user@host[:port]> [key|password] [key-file]\n"
                 "       profile set <name> <host|port|user|auth|key|remote|local> [value]\n"
                 "       profile rm <name>\n";
    }
}

void ConsoleFrontend::editSelected()
{
    EditRequest req;
    if (!m_state->prepareEdit(&req))
        return;

    const QString path = std::holds_alternative<LocalEdit>(req)
                             ? std::get<LocalEdit>(req).path
                             : std::get<RemoteEdit>(req).scratchPath;

    const QString editor = EditRoundtrip::resolveEditor(m_state->config().editor);

    // The editor owns the terminal until it exits.
    m_notifier->setEnabled(false);
    m_tick.stop();

    QString err;
    if (!EditRoundtrip::runEditor(editor, path, &err))
        m_out << "-- " << err << "\n";

    m_tick.start();
    m_notifier->setEnabled(true);

    m_state->finishEdit(req);
}

void ConsoleFrontend::setEcho(bool on)
{
    if (!isatty(STDIN_FILENO))
        return;

    termios t;
    if (tcgetattr(STDIN_FILENO, &t) != 0)
        return;
    if (on) t.c_lflag |= ECHO;
    else    t.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSANOW, &t);
}

// -----------------------------------------------------------------------------
// Output
// -----------------------------------------------------------------------------
void ConsoleFrontend::printHelp()
{
    m_out << "profiles               list profiles\n"
             "profile add|set|rm ...  edit saved profiles (run 'profile' for usage)\n"
             "connect [name|index]   connect (password profiles prompt)\n"
             "disconnect             close the remote session\n"
             "ls                     list the active panel\n"
             "tab / swap             switch active panel / swap display sides\n"
             "cd <name|..> / up      navigate the active panel\n"
             "sel <name|index>       move the cursor\n"
             "mark [name] / markall  toggle marks\n"
             "put / get              upload marked local / download marked remote\n"
             "rename <old> <new>     rename on the active panel\n"
             "mkdir <name>           create a directory on the active panel\n"
             "rm [name]              delete marked entries (or the cursor entry)\n"
             "edit [name]            open in $EDITOR, re-upload remote files if changed\n"
             "refresh                re-read the active panel\n"
             "quit\n";
}

void ConsoleFrontend::printProfiles()
{
    for (int i = 0; i < m_profiles.size(); ++i) {
        const SshProfile &p = m_profiles[i];
        m_out << QString("%1  %2  %3@%4:%5 (%6)\n")
                     .arg(i)
                     .arg(p.name, p.user, p.host)
                     .arg(p.port)
                     .arg(authMethodToString(p.auth));
    }
}

void ConsoleFrontend::printLayout()
{
    m_out << m_state->layoutLine() << "\n";
}

void ConsoleFrontend::printPanel()
{
    printLayout();

    const bool remote = m_state->activeSide() == PanelSide::Right;
    if (remote && !m_state->isConnected()) {
        m_out << "(not connected)\n";
        return;
    }

    const PanelModel &p = m_state->activePanel();
    m_out << (remote ? "remote " : "local ") << p.path() << "\n";

    for (int i = 0; i < p.entries().size(); ++i) {
        const FileEntry &e = p.entries()[i];
        m_out << (i == p.cursor() ? ">" : " ")
              << (p.isMarked(i) ? "*" : " ")
              << QString("%1 ").arg(i, 3)
              << QString("%1 ").arg(e.permissions, 9)
              << QString("%1 ").arg(sizeText(e), 12)
              << QString("%1 ").arg(e.modified.isValid() ? e.modified.toString("yyyy-MM-dd HH:mm") : QString(), 16)
              << e.name << (e.isDir && !e.isParent() ? "/" : "")
              << "\n";
    }
}
