// RemoteSession.h
//
// Purpose:
//   The live, foreground SFTP session of the file manager:
//     - Owns one authenticated SftpChannel
//     - Tracks the current remote directory and the login home directory
//     - Produces sorted listings for the remote panel
//     - Single remote mutations scoped to the current directory
//
// Lifetime:
//   Created on successful authentication, destroyed on disconnect or exit.
//   Never reconnects on its own. Background work must open its own channel
//   through channelFactory().

#pragma once

#include <QString>
#include <QVector>
#include <memory>

#include "FileEntry.h"
#include "SftpChannel.h"
#include "SftpError.h"
#include "SshProfile.h"

class RemoteSession
{
public:
    ~RemoteSession();

    RemoteSession(const RemoteSession &) = delete;
    RemoteSession &operator=(const RemoteSession &) = delete;

    // Opens a channel via `factory`, then resolves the home directory
    // (realpath of "."). The current directory starts at home.
    static std::unique_ptr<RemoteSession> connect(const SshProfile &profile,
                                                  const QString &password,
                                                  const ChannelFactory &factory,
                                                  int timeoutSec,
                                                  SftpError *err = nullptr);

    const SshProfile &profile() const { return m_profile; }
    QString host() const { return m_profile.host; }
    QString user() const { return m_profile.user; }

    // Retained for fresh sessions (transfer workers, edit upload).
    QString password() const { return m_password; }
    const ChannelFactory &channelFactory() const { return m_factory; }

    QString currentPath() const { return m_currentPath; }
    QString homePath() const { return m_homePath; }

    SftpChannel &channel() { return *m_channel; }

    // Listing of the current directory ("..", then dirs, then files).
    bool list(QVector<FileEntry> *out, SftpError *err = nullptr);

    // ".." goes to the parent; anything else is joined without checking it is
    // a directory. On a failed listing the previous directory is kept.
    bool enterDirectory(const QString &name, QVector<FileEntry> *out, SftpError *err = nullptr);

    // Expands "~", canonicalizes, requires a directory, then lists it.
    bool changeToAbsolute(const QString &rawPath, QVector<FileEntry> *out, SftpError *err = nullptr);

    // No-op at "/" (still re-lists).
    bool goUp(QVector<FileEntry> *out, SftpError *err = nullptr);

    bool rename(const QString &oldName, const QString &newName, SftpError *err = nullptr);
    bool mkdir(const QString &name, SftpError *err = nullptr);
    bool deleteFile(const QString &name, SftpError *err = nullptr);

    // Depth-first: files unlinked and subdirectories recursed in listing
    // order, then the directory itself removed. Stops at the first failure;
    // nothing already removed is restored.
    bool deleteDirectory(const QString &name, SftpError *err = nullptr);

    // Synchronous whole-file copy over the live channel (no progress).
    bool downloadFile(const QString &remotePath, const QString &localPath, SftpError *err = nullptr);

private:
    RemoteSession(std::unique_ptr<SftpChannel> channel,
                  const SshProfile &profile,
                  const QString &password,
                  const ChannelFactory &factory,
                  const QString &home);

    bool listPath(const QString &path, QVector<FileEntry> *out, SftpError *err);
    bool removeRecursive(const QString &path, SftpError *err);

    std::unique_ptr<SftpChannel> m_channel;
    SshProfile     m_profile;
    QString        m_password;
    ChannelFactory m_factory;
    QString        m_homePath;
    QString        m_currentPath;
};

// Remote stat record -> panel entry (size only for files, permissions string from mode).
FileEntry fileEntryFromRemote(const RemoteAttributes &a);
