// LibsshSftpChannel.cpp
//
// Purpose:
//   libssh-backed implementation of the SFTP operation set used by the file
//   manager: realpath, stat, readdir, open/read/write, chmod, rename, mkdir, unlink,
//   rmdir.
//
// Design notes:
//   - One ssh_session and one sftp_session per channel object. Background
//     transfer workers each open their own channel.
//   - Host keys are checked against known_hosts and the result logged; an
//     unknown host does not block the connection.

#include "LibsshSftpChannel.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <fcntl.h>
#include <sys/stat.h>

// ------------------------------------------------------------
// Small helper to turn libssh's last error into QString
// ------------------------------------------------------------
static QString libsshError(ssh_session s)
{
    if (!s) return QStringLiteral("libssh: null session");
    return QString::fromLocal8Bit(ssh_get_error(s));
}

// SFTP status codes carry the useful part of most remote failures.
static QString sftpStatusText(int code)
{
    switch (code) {
    case SSH_FX_OK:                  return QString();
    case SSH_FX_EOF:                 return QStringLiteral("End of file");
    case SSH_FX_NO_SUCH_FILE:        return QStringLiteral("No such file or directory");
    case SSH_FX_PERMISSION_DENIED:   return QStringLiteral("Permission denied");
    case SSH_FX_FAILURE:             return QStringLiteral("Failure");
    case SSH_FX_BAD_MESSAGE:         return QStringLiteral("Bad message");
    case SSH_FX_NO_CONNECTION:       return QStringLiteral("No connection");
    case SSH_FX_CONNECTION_LOST:     return QStringLiteral("Connection lost");
    case SSH_FX_OP_UNSUPPORTED:      return QStringLiteral("Operation unsupported");
    case SSH_FX_INVALID_HANDLE:      return QStringLiteral("Invalid handle");
    case SSH_FX_NO_SUCH_PATH:        return QStringLiteral("No such path");
    case SSH_FX_FILE_ALREADY_EXISTS: return QStringLiteral("File already exists");
    case SSH_FX_WRITE_PROTECT:       return QStringLiteral("Write protected");
    case SSH_FX_NO_MEDIA:            return QStringLiteral("No media");
    default:                         return QStringLiteral("SFTP error %1").arg(code);
    }
}

static RemoteAttributes toAttributes(sftp_attributes a, const QString &fullPath)
{
    RemoteAttributes e;
    e.name     = QString::fromUtf8(a->name ? a->name : "");
    e.fullPath = fullPath;

    if (a->flags & SSH_FILEXFER_ATTR_SIZE) {
        e.hasSize = true;
        e.size    = (quint64)a->size;
    }
    if (a->flags & SSH_FILEXFER_ATTR_PERMISSIONS) {
        e.hasPerms = true;
        e.perms    = (quint32)a->permissions;
    }
    e.mtime = (qint64)a->mtime;
    e.isDir = (a->type == SSH_FILEXFER_TYPE_DIRECTORY)
              || ((a->permissions & S_IFMT) == S_IFDIR);
    return e;
}

// ------------------------------------------------------------
// Remote file handle
// ------------------------------------------------------------
class LibsshSftpFile : public SftpFile
{
public:
    LibsshSftpFile(ssh_session session, sftp_session sftp, sftp_file f)
        : m_session(session), m_sftp(sftp), m_file(f) {}

    ~LibsshSftpFile() override
    {
        if (m_file) sftp_close(m_file);
    }

    qint64 read(char *buf, qint64 maxLen) override
    {
        const ssize_t n = sftp_read(m_file, buf, (size_t)maxLen);
        return (qint64)n;
    }

    qint64 write(const char *buf, qint64 len) override
    {
        const ssize_t n = sftp_write(m_file, buf, (size_t)len);
        return (qint64)n;
    }

    QString errorString() const override
    {
        const QString status = sftpStatusText(sftp_get_error(m_sftp));
        return status.isEmpty() ? libsshError(m_session) : status;
    }

private:
    ssh_session  m_session;
    sftp_session m_sftp;
    sftp_file    m_file;
};

// ------------------------------------------------------------
// Construction / teardown
// ------------------------------------------------------------
LibsshSftpChannel::LibsshSftpChannel(ssh_session session, sftp_session sftp)
    : m_session(session), m_sftp(sftp)
{
}

LibsshSftpChannel::~LibsshSftpChannel()
{
    if (m_sftp) sftp_free(m_sftp);
    if (m_session) {
        ssh_disconnect(m_session);
        ssh_free(m_session);
    }
}

QString LibsshSftpChannel::resolveKeyPath(const QString &keyFile)
{
    const QString raw = keyFile.trimmed();
    if (raw.isEmpty())
        return QDir::homePath() + "/.ssh/id_rsa";
    if (raw == "~")
        return QDir::homePath();
    if (raw.startsWith("~/"))
        return QDir::homePath() + raw.mid(1);
    return raw;
}

QString LibsshSftpChannel::lastError() const
{
    const QString status = sftpStatusText(sftp_get_error(m_sftp));
    return status.isEmpty() ? libsshError(m_session) : status;
}

// ------------------------------------------------------------
// open(): TCP connect + handshake + auth + SFTP init
// ------------------------------------------------------------
std::unique_ptr<SftpChannel> LibsshSftpChannel::open(const SshProfile &profile,
                                                     const QString &password,
                                                     int timeoutSec,
                                                     SftpError *err)
{
    if (err) err->clear();

    const QString host = profile.host.trimmed();
    const QString user = profile.user.trimmed();
    const int port = (profile.port > 0) ? profile.port : 22;

    if (host.isEmpty()) {
        setError(err, SftpError::transport(QStringLiteral("No host specified.")));
        return nullptr;
    }

    // Resolve the key file before touching the network.
    QString keyPath;
    if (profile.auth == AuthMethod::Key) {
        keyPath = resolveKeyPath(profile.keyFile);
        if (!QFileInfo::exists(keyPath)) {
            qWarning().noquote() << QString("[SFTP] key file missing for %1@%2").arg(user, host);
            setError(err, SftpError::keyNotFound(keyPath));
            return nullptr;
        }
    }

    qInfo().noquote() << QString("[SFTP] connect start user='%1' host='%2' port=%3 auth=%4")
                         .arg(user, host)
                         .arg(port)
                         .arg(authMethodToString(profile.auth));

    ssh_session s = ssh_new();
    if (!s) {
        setError(err, SftpError::transport(QStringLiteral("ssh_new() failed.")));
        return nullptr;
    }

    auto fail = [&](const SftpError &e) -> std::unique_ptr<SftpChannel> {
        qWarning().noquote() << QString("[SFTP] connect FAILED user='%1' host='%2': %3")
                                .arg(user, host, e.toString());
        setError(err, e);
        ssh_disconnect(s);
        ssh_free(s);
        return nullptr;
    };

    auto optSet = [&](enum ssh_options_e opt, const void *val, const char *what) {
        if (ssh_options_set(s, opt, val) != SSH_OK) {
            qWarning().noquote() << QString("[SFTP] ssh_options_set(%1) failed: %2")
                                    .arg(QString::fromLatin1(what), libsshError(s));
        }
    };

    const QByteArray hostUtf8 = host.toUtf8();
    const QByteArray userUtf8 = user.toUtf8();
    optSet(SSH_OPTIONS_HOST, hostUtf8.constData(), "HOST");
    if (!user.isEmpty())
        optSet(SSH_OPTIONS_USER, userUtf8.constData(), "USER");
    optSet(SSH_OPTIONS_PORT, &port, "PORT");

    long timeout = timeoutSec > 0 ? timeoutSec : 10;
    optSet(SSH_OPTIONS_TIMEOUT, &timeout, "TIMEOUT");

    if (ssh_connect(s) != SSH_OK)
        return fail(SftpError::transport(libsshError(s)));

    qInfo().noquote() << QString("[SFTP] ssh_connect OK host='%1' port=%2").arg(host).arg(port);

    switch (ssh_session_is_known_server(s)) {
    case SSH_KNOWN_HOSTS_OK:
        break;
    case SSH_KNOWN_HOSTS_CHANGED:
        qWarning().noquote() << QString("[SFTP] host key for '%1' CHANGED since last seen").arg(host);
        break;
    case SSH_KNOWN_HOSTS_OTHER:
        qWarning().noquote() << QString("[SFTP] host key type for '%1' differs from known_hosts").arg(host);
        break;
    case SSH_KNOWN_HOSTS_UNKNOWN:
    case SSH_KNOWN_HOSTS_NOT_FOUND:
        qInfo().noquote() << QString("[SFTP] host '%1' not in known_hosts").arg(host);
        break;
    case SSH_KNOWN_HOSTS_ERROR:
        qWarning().noquote() << QString("[SFTP] known_hosts check failed: %1").arg(libsshError(s));
        break;
    }

    int rc = SSH_AUTH_DENIED;
    if (profile.auth == AuthMethod::Password) {
        QByteArray pw = password.toUtf8();
        rc = ssh_userauth_password(s, nullptr, pw.constData());
        pw.fill('\0');
    } else {
        ssh_key key = nullptr;
        const QByteArray p = QFile::encodeName(keyPath);
        if (ssh_pki_import_privkey_file(p.constData(), nullptr, nullptr, nullptr, &key) != SSH_OK) {
            return fail(SftpError::authentication(
                QStringLiteral("cannot load private key '%1'").arg(keyPath)));
        }
        rc = ssh_userauth_publickey(s, nullptr, key);
        ssh_key_free(key);
    }

    if (rc == SSH_AUTH_ERROR)
        return fail(SftpError::transport(libsshError(s)));
    if (rc != SSH_AUTH_SUCCESS)
        return fail(SftpError::authentication(QString()));

    sftp_session sftp = sftp_new(s);
    if (!sftp)
        return fail(SftpError::transport(QStringLiteral("sftp_new failed: %1").arg(libsshError(s))));

    if (sftp_init(sftp) != SSH_OK) {
        const QString e = libsshError(s);
        sftp_free(sftp);
        return fail(SftpError::transport(QStringLiteral("sftp_init failed: %1").arg(e)));
    }

    qInfo().noquote() << QString("[SFTP] connect OK user='%1' host='%2' port=%3")
                         .arg(user, host)
                         .arg(port);

    return std::unique_ptr<SftpChannel>(new LibsshSftpChannel(s, sftp));
}

// ------------------------------------------------------------
// SFTP primitives
// ------------------------------------------------------------
bool LibsshSftpChannel::canonicalize(const QString &path, QString *out, QString *err)
{
    if (err) err->clear();

    char *real = sftp_canonicalize_path(m_sftp, path.toUtf8().constData());
    if (!real) {
        if (err) *err = QString("realpath '%1': %2").arg(path, lastError());
        return false;
    }

    if (out) *out = QString::fromUtf8(real);
    ssh_string_free_char(real);
    return true;
}

bool LibsshSftpChannel::stat(const QString &path, RemoteAttributes *out, QString *err)
{
    if (err) err->clear();

    sftp_attributes a = sftp_stat(m_sftp, path.toUtf8().constData());
    if (!a) {
        if (err) *err = QString("stat '%1': %2").arg(path, lastError());
        return false;
    }

    RemoteAttributes e = toAttributes(a, path);
    const int slash = path.lastIndexOf('/');
    e.name = slash < 0 ? path : path.mid(slash + 1);
    sftp_attributes_free(a);

    if (out) *out = e;
    return true;
}

bool LibsshSftpChannel::listDir(const QString &path, QVector<RemoteAttributes> *out, QString *err)
{
    if (err) err->clear();
    if (out) out->clear();

    sftp_dir dir = sftp_opendir(m_sftp, path.toUtf8().constData());
    if (!dir) {
        if (err) *err = QString("opendir '%1': %2").arg(path, lastError());
        return false;
    }

    QVector<RemoteAttributes> items;

    while (sftp_attributes a = sftp_readdir(m_sftp, dir)) {
        const QString name = QString::fromUtf8(a->name ? a->name : "");
        if (name == "." || name == "..") {
            sftp_attributes_free(a);
            continue;
        }

        const QString full = path.endsWith('/') ? (path + name) : (path + "/" + name);
        items.push_back(toAttributes(a, full));
        sftp_attributes_free(a);
    }

    if (!sftp_dir_eof(dir)) {
        if (err) *err = QString("readdir '%1': %2").arg(path, lastError());
        sftp_closedir(dir);
        return false;
    }

    sftp_closedir(dir);

    if (out) *out = items;
    return true;
}

std::unique_ptr<SftpFile> LibsshSftpChannel::openForRead(const QString &path, QString *err)
{
    if (err) err->clear();

    sftp_file f = sftp_open(m_sftp, path.toUtf8().constData(), O_RDONLY, 0);
    if (!f) {
        if (err) *err = QString("open '%1': %2").arg(path, lastError());
        return nullptr;
    }
    return std::unique_ptr<SftpFile>(new LibsshSftpFile(m_session, m_sftp, f));
}

std::unique_ptr<SftpFile> LibsshSftpChannel::openForWrite(const QString &path, int mode, QString *err)
{
    if (err) err->clear();

    sftp_file f = sftp_open(m_sftp, path.toUtf8().constData(),
                            O_WRONLY | O_CREAT | O_TRUNC, (mode_t)mode);
    if (!f) {
        if (err) *err = QString("create '%1': %2").arg(path, lastError());
        return nullptr;
    }
    return std::unique_ptr<SftpFile>(new LibsshSftpFile(m_session, m_sftp, f));
}

bool LibsshSftpChannel::chmod(const QString &path, int mode, QString *err)
{
    if (err) err->clear();

    if (sftp_chmod(m_sftp, path.toUtf8().constData(), (mode_t)(mode & 07777)) != SSH_OK) {
        if (err) *err = QString("chmod '%1': %2").arg(path, lastError());
        return false;
    }
    return true;
}

bool LibsshSftpChannel::rename(const QString &oldPath, const QString &newPath, QString *err)
{
    if (err) err->clear();

    if (sftp_rename(m_sftp, oldPath.toUtf8().constData(), newPath.toUtf8().constData()) != SSH_OK) {
        if (err) *err = QString("rename '%1' -> '%2': %3").arg(oldPath, newPath, lastError());
        return false;
    }
    return true;
}

bool LibsshSftpChannel::mkdir(const QString &path, int mode, bool *alreadyExists, QString *err)
{
    if (err) err->clear();
    if (alreadyExists) *alreadyExists = false;

    if (sftp_mkdir(m_sftp, path.toUtf8().constData(), (mode_t)mode) == SSH_OK)
        return true;

    const int code = sftp_get_error(m_sftp);
    const QString cause = lastError();

    // OpenSSH's sftp-server answers SSH_FX_FAILURE for an existing directory.
    if (code == SSH_FX_FILE_ALREADY_EXISTS || code == SSH_FX_FAILURE) {
        RemoteAttributes st;
        if (stat(path, &st) && st.isDir) {
            if (alreadyExists) *alreadyExists = true;
            if (err) *err = QString("mkdir '%1': File already exists").arg(path);
            return false;
        }
    }

    if (err) *err = QString("mkdir '%1': %2").arg(path, cause);
    return false;
}

bool LibsshSftpChannel::unlink(const QString &path, QString *err)
{
    if (err) err->clear();

    if (sftp_unlink(m_sftp, path.toUtf8().constData()) != SSH_OK) {
        if (err) *err = QString("unlink '%1': %2").arg(path, lastError());
        return false;
    }
    return true;
}

bool LibsshSftpChannel::rmdir(const QString &path, QString *err)
{
    if (err) err->clear();

    if (sftp_rmdir(m_sftp, path.toUtf8().constData()) != SSH_OK) {
        if (err) *err = QString("rmdir '%1': %2").arg(path, lastError());
        return false;
    }
    return true;
}
