// TransferEngine.h
//
// Purpose:
//   Batch upload/download between a local directory and a remote directory.
//   Each batch runs on a worker thread with its own freshly authenticated
//   channel (never the foreground session) and reports through a shared
//   TransferProgress record.
//
// Batch policy:
//   - Entries are processed in the order given; directories recurse.
//   - The first failure marks the batch Failed; nothing after it is attempted.
//   - Files already transferred stay in place (no rollback).
//   - No mid-transfer cancellation.

#pragma once

#include <QFuture>
#include <QString>
#include <QVector>

#include "FileEntry.h"
#include "SftpChannel.h"
#include "SftpError.h"
#include "SshProfile.h"
#include "TransferProgress.h"

struct TransferRequest
{
    SshProfile     profile;
    QString        password;
    int            timeoutSec = 30;
    ChannelFactory factory;

    QVector<FileEntry> entries;  // top-level entries, in processing order
    QString sourceDir;
    QString destDir;

    ProgressHandle progress;
};

class TransferEngine
{
public:
    static constexpr qint64 kChunkSize = 64 * 1024;

    // Spawn the batch on the transfer pool. The returned future finishes once
    // the worker has released its channel.
    static QFuture<void> startUpload(const TransferRequest &req);
    static QFuture<void> startDownload(const TransferRequest &req);

    // Blocking batch bodies (run on the worker).
    static void uploadBatch(const TransferRequest &req);

    // Also rewrites files_total with the real recursive count before the
    // first byte moves.
    static void downloadBatch(const TransferRequest &req);

    // Regular files under `path` (1 for a file, 0 if unreadable).
    static int countLocalFiles(const QString &path);
    static int countRemoteFiles(SftpChannel &ch, const QString &path);

    // Single-file upload to an explicit path. Data goes to "<target>.twinpane.part"
    // first and replaces the target only after the last byte, so a failed
    // upload leaves the original untouched.
    //   - a symlink is followed: the file it points to is replaced, the link stays
    //   - the original's permission bits carry over to the new file
    //   - when the server refuses to rename over an existing file the original
    //     is moved to "<target>.twinpane.bak" and moved back if the swap fails
    static bool uploadFileReplacing(SftpChannel &ch,
                                    const QString &localPath,
                                    const QString &remotePath,
                                    SftpError *err = nullptr);
};
