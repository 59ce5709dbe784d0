// SftpChannel.h
//
// Purpose:
//   Abstract seam over one authenticated SFTP channel. RemoteSession,
//   TransferEngine and EditRoundtrip are written against this interface;
//   LibsshSftpChannel is the production implementation.
//
// Threading:
//   A channel is used by exactly one thread at a time. Background work never
//   shares a channel with the foreground; it opens its own via ChannelFactory.

#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>
#include <functional>
#include <memory>

#include "SftpError.h"
#include "SshProfile.h"

// Remote stat/listing record (minimal metadata for a file manager view).
struct RemoteAttributes
{
    QString name;       // basename
    QString fullPath;   // path as listed/stat'ed
    bool    isDir   = false;

    bool    hasSize = false;
    quint64 size    = 0;      // bytes
    bool    hasPerms = false;
    quint32 perms   = 0;      // st_mode (permissions + type bits)
    qint64  mtime   = 0;      // seconds since epoch, 0 = unknown
};

// Open remote file handle. Closed on destruction.
class SftpFile
{
public:
    virtual ~SftpFile() = default;

    // Returns bytes read (0 = EOF) or -1 on error.
    virtual qint64 read(char *buf, qint64 maxLen) = 0;

    // Returns bytes written or -1 on error.
    virtual qint64 write(const char *buf, qint64 len) = 0;

    virtual QString errorString() const = 0;
};

class SftpChannel
{
public:
    virtual ~SftpChannel() = default;

    // realpath: resolves symlinks and "..", fails if the path does not exist.
    virtual bool canonicalize(const QString &path, QString *out, QString *err = nullptr) = 0;

    virtual bool stat(const QString &path, RemoteAttributes *out, QString *err = nullptr) = 0;

    // Non-recursive; "." and ".." are never returned.
    virtual bool listDir(const QString &path, QVector<RemoteAttributes> *out, QString *err = nullptr) = 0;

    virtual std::unique_ptr<SftpFile> openForRead(const QString &path, QString *err = nullptr) = 0;

    // Create + truncate.
    virtual std::unique_ptr<SftpFile> openForWrite(const QString &path, int mode, QString *err = nullptr) = 0;

    // Permission bits only (mode & 07777).
    virtual bool chmod(const QString &path, int mode, QString *err = nullptr) = 0;

    virtual bool rename(const QString &oldPath, const QString &newPath, QString *err = nullptr) = 0;

    // alreadyExists is set when the failure means "a directory is already there".
    virtual bool mkdir(const QString &path, int mode, bool *alreadyExists, QString *err = nullptr) = 0;

    virtual bool unlink(const QString &path, QString *err = nullptr) = 0;
    virtual bool rmdir(const QString &path, QString *err = nullptr) = 0;
};

// Opens one fresh, authenticated channel per call.
// `timeoutSec` bounds the transport connect/read timeout.
using ChannelFactory = std::function<std::unique_ptr<SftpChannel>(const SshProfile &profile,
                                                                   const QString &password,
                                                                   int timeoutSec,
                                                                   SftpError *err)>;
