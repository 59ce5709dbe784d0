// RemoteSession.cpp
//
// Logging tag: [SESSION]. Never log the retained password.

#include "RemoteSession.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QDir>

#include <sodium.h>
#include <algorithm>

#include "RemotePath.h"

FileEntry fileEntryFromRemote(const RemoteAttributes &a)
{
    FileEntry e;
    e.name  = a.name;
    e.isDir = a.isDir;
    if (!a.isDir && a.hasSize) {
        e.hasSize = true;
        e.size    = a.size;
    }
    if (a.mtime > 0)
        e.modified = QDateTime::fromSecsSinceEpoch(a.mtime);
    if (a.hasPerms)
        e.permissions = formatPermissions(a.perms);
    return e;
}

RemoteSession::RemoteSession(std::unique_ptr<SftpChannel> channel,
                             const SshProfile &profile,
                             const QString &password,
                             const ChannelFactory &factory,
                             const QString &home)
    : m_channel(std::move(channel)),
      m_profile(profile),
      m_password(password),
      m_factory(factory),
      m_homePath(home),
      m_currentPath(home)
{
}

RemoteSession::~RemoteSession()
{
    qInfo().noquote() << QString("[SESSION] closing %1@%2").arg(m_profile.user, m_profile.host);

    // Best-effort wipe of the retained password.
    if (!m_password.isEmpty()) {
        QChar *d = m_password.data();
        const size_t n = (size_t)m_password.size() * sizeof(QChar);
        if (sodium_init() >= 0) sodium_memzero(d, n);
        else std::fill(d, d + m_password.size(), QChar(0));
        m_password.clear();
    }
}

std::unique_ptr<RemoteSession> RemoteSession::connect(const SshProfile &profile,
                                                      const QString &password,
                                                      const ChannelFactory &factory,
                                                      int timeoutSec,
                                                      SftpError *err)
{
    if (err) err->clear();

    if (!factory) {
        setError(err, SftpError::transport(QStringLiteral("No channel factory configured.")));
        return nullptr;
    }

    SftpError openErr;
    std::unique_ptr<SftpChannel> ch = factory(profile, password, timeoutSec, &openErr);
    if (!ch) {
        if (!openErr.isError())
            openErr = SftpError::transport(QStringLiteral("unknown error"));
        qWarning().noquote() << QString("[SESSION] connect FAILED %1@%2: %3")
                                .arg(profile.user, profile.host, openErr.toString());
        setError(err, openErr);
        return nullptr;
    }

    QString home;
    QString why;
    if (!ch->canonicalize(QStringLiteral("."), &home, &why)) {
        qWarning().noquote() << QString("[SESSION] cannot resolve home on %1: %2").arg(profile.host, why);
        setError(err, SftpError::remotePath(why));
        return nullptr;
    }

    qInfo().noquote() << QString("[SESSION] connected %1@%2 home='%3'")
                         .arg(profile.user, profile.host, home);

    return std::unique_ptr<RemoteSession>(
        new RemoteSession(std::move(ch), profile, password, factory, home));
}

// ------------------------------------------------------------
// Listing / navigation
// ------------------------------------------------------------
bool RemoteSession::listPath(const QString &path, QVector<FileEntry> *out, SftpError *err)
{
    QVector<RemoteAttributes> raw;
    QString why;
    if (!m_channel->listDir(path, &raw, &why)) {
        qWarning().noquote() << QString("[SESSION] list '%1' failed: %2").arg(path, why);
        setError(err, SftpError::remotePath(why));
        return false;
    }

    QVector<FileEntry> children;
    children.reserve(raw.size());
    for (const RemoteAttributes &a : raw)
        children.push_back(fileEntryFromRemote(a));

    if (out) *out = buildListing(children, isRemoteRoot(path));
    return true;
}

bool RemoteSession::list(QVector<FileEntry> *out, SftpError *err)
{
    if (err) err->clear();
    return listPath(m_currentPath, out, err);
}

bool RemoteSession::enterDirectory(const QString &name, QVector<FileEntry> *out, SftpError *err)
{
    if (err) err->clear();

    const QString target = (name == "..") ? remoteParent(m_currentPath)
                                          : remoteJoin(m_currentPath, name);

    if (!listPath(target, out, err))
        return false;

    m_currentPath = target;
    return true;
}

bool RemoteSession::changeToAbsolute(const QString &rawPath, QVector<FileEntry> *out, SftpError *err)
{
    if (err) err->clear();

    const QString expanded = expandRemoteTilde(rawPath.trimmed(), m_homePath);

    QString canonical;
    QString why;
    if (!m_channel->canonicalize(expanded, &canonical, &why)) {
        setError(err, SftpError::remotePath(QString("path not found '%1': %2").arg(expanded, why)));
        return false;
    }

    RemoteAttributes st;
    if (!m_channel->stat(canonical, &st, &why)) {
        setError(err, SftpError::remotePath(QString("stat failed: %1").arg(why)));
        return false;
    }
    if (!st.isDir) {
        setError(err, SftpError::remotePath(QString("'%1' is not a directory").arg(canonical)));
        return false;
    }

    if (!listPath(canonical, out, err))
        return false;

    m_currentPath = canonical;
    qInfo().noquote() << QString("[SESSION] changed to '%1'").arg(canonical);
    return true;
}

bool RemoteSession::goUp(QVector<FileEntry> *out, SftpError *err)
{
    if (err) err->clear();

    const QString target = remoteParent(m_currentPath);
    if (!listPath(target, out, err))
        return false;

    m_currentPath = target;
    return true;
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------
bool RemoteSession::rename(const QString &oldName, const QString &newName, SftpError *err)
{
    if (err) err->clear();

    QString why;
    if (!m_channel->rename(remoteJoin(m_currentPath, oldName), remoteJoin(m_currentPath, newName), &why)) {
        setError(err, SftpError::remotePath(why));
        return false;
    }
    return true;
}

bool RemoteSession::mkdir(const QString &name, SftpError *err)
{
    if (err) err->clear();

    QString why;
    bool exists = false;
    if (!m_channel->mkdir(remoteJoin(m_currentPath, name), 0755, &exists, &why)) {
        setError(err, SftpError::remotePath(why));
        return false;
    }
    return true;
}

bool RemoteSession::deleteFile(const QString &name, SftpError *err)
{
    if (err) err->clear();

    QString why;
    if (!m_channel->unlink(remoteJoin(m_currentPath, name), &why)) {
        setError(err, SftpError::remotePath(why));
        return false;
    }
    return true;
}

bool RemoteSession::deleteDirectory(const QString &name, SftpError *err)
{
    if (err) err->clear();
    return removeRecursive(remoteJoin(m_currentPath, name), err);
}

bool RemoteSession::removeRecursive(const QString &path, SftpError *err)
{
    QVector<RemoteAttributes> children;
    QString why;
    if (!m_channel->listDir(path, &children, &why)) {
        setError(err, SftpError::remotePath(why));
        return false;
    }

    for (const RemoteAttributes &c : children) {
        const QString child = remoteJoin(path, c.name);
        if (c.isDir) {
            if (!removeRecursive(child, err))
                return false;
        } else if (!m_channel->unlink(child, &why)) {
            setError(err, SftpError::remotePath(why));
            return false;
        }
    }

    if (!m_channel->rmdir(path, &why)) {
        setError(err, SftpError::remotePath(why));
        return false;
    }
    return true;
}

// ------------------------------------------------------------
// Synchronous download over the live channel
// ------------------------------------------------------------
bool RemoteSession::downloadFile(const QString &remotePath, const QString &localPath, SftpError *err)
{
    if (err) err->clear();

    QString why;
    std::unique_ptr<SftpFile> in = m_channel->openForRead(remotePath, &why);
    if (!in) {
        setError(err, SftpError::remotePath(why));
        return false;
    }

    QFile out(localPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(err, SftpError::localIo(QString("%1: %2").arg(localPath, out.errorString())));
        return false;
    }

    QByteArray buf(64 * 1024, Qt::Uninitialized);
    while (true) {
        const qint64 n = in->read(buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            setError(err, SftpError::remotePath(QString("read '%1': %2").arg(remotePath, in->errorString())));
            out.close();
            out.remove();
            return false;
        }
        if (out.write(buf.constData(), n) != n) {
            setError(err, SftpError::localIo(QString("%1: %2").arg(localPath, out.errorString())));
            out.close();
            out.remove();
            return false;
        }
    }

    if (!out.flush()) {
        setError(err, SftpError::localIo(QString("%1: %2").arg(localPath, out.errorString())));
        out.close();
        out.remove();
        return false;
    }
    out.close();
    return true;
}
