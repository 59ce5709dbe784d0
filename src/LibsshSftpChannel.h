// LibsshSftpChannel.h
//
// Purpose:
//   Production SftpChannel backed by libssh:
//     - TCP connect with a bounded timeout
//     - Authentication by private key file or password
//     - One SFTP subsystem per channel, freed on destruction
//
// Never log secrets (passwords, passphrases).

#pragma once

#include <memory>

#include "SftpChannel.h"

// Forward-declare libssh handle types to avoid pulling libssh headers into the header.
struct ssh_session_struct;
using ssh_session = ssh_session_struct*;
struct sftp_session_struct;
using sftp_session = sftp_session_struct*;

class LibsshSftpChannel : public SftpChannel
{
public:
    ~LibsshSftpChannel() override;

    LibsshSftpChannel(const LibsshSftpChannel &) = delete;
    LibsshSftpChannel &operator=(const LibsshSftpChannel &) = delete;

    // Connects and authenticates. Signature matches ChannelFactory.
    static std::unique_ptr<SftpChannel> open(const SshProfile &profile,
                                             const QString &password,
                                             int timeoutSec,
                                             SftpError *err);

    // Key path used for key auth: explicit path with "~" expanded, else ~/.ssh/id_rsa.
    static QString resolveKeyPath(const QString &keyFile);

    bool canonicalize(const QString &path, QString *out, QString *err = nullptr) override;
    bool stat(const QString &path, RemoteAttributes *out, QString *err = nullptr) override;
    bool listDir(const QString &path, QVector<RemoteAttributes> *out, QString *err = nullptr) override;
    std::unique_ptr<SftpFile> openForRead(const QString &path, QString *err = nullptr) override;
    std::unique_ptr<SftpFile> openForWrite(const QString &path, int mode, QString *err = nullptr) override;
    bool chmod(const QString &path, int mode, QString *err = nullptr) override;
    bool rename(const QString &oldPath, const QString &newPath, QString *err = nullptr) override;
    bool mkdir(const QString &path, int mode, bool *alreadyExists, QString *err = nullptr) override;
    bool unlink(const QString &path, QString *err = nullptr) override;
    bool rmdir(const QString &path, QString *err = nullptr) override;

private:
    LibsshSftpChannel(ssh_session session, sftp_session sftp);

    QString lastError() const;

    ssh_session  m_session = nullptr;
    sftp_session m_sftp    = nullptr;
};
