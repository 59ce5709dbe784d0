// EditRoundtrip.h
//
// Purpose:
//   "Edit" on a panel entry:
//     1) remote file -> downloaded into a process-scoped scratch directory
//        over the live session; its mtime is captured right away
//     2) an external editor runs on the local path (exit code ignored)
//     3) if the scratch file's mtime is now strictly newer, it is uploaded
//        over the original through a FRESH channel (the live one may have
//        timed out while the editor was open); otherwise nothing is sent
//     4) the scratch file is always deleted
//
//   Local files are edited in place; the local panel is simply reloaded.

#pragma once

#include <QDateTime>
#include <QString>
#include <variant>

#include "RemoteSession.h"
#include "SftpError.h"

struct LocalEdit
{
    QString path;
};

struct RemoteEdit
{
    QString   scratchPath;
    QString   remotePath;
    QDateTime mtimeBefore;
};

using EditRequest = std::variant<LocalEdit, RemoteEdit>;

class EditRoundtrip
{
public:
    enum class Outcome {
        Unchanged,      // mtime not newer, no upload
        Uploaded,
        UploadFailed,
        Discarded       // no live session left, nothing uploaded
    };

    // <tmp>/twinpane-edit-<pid>
    static QString scratchDir();

    // Deletes scratchDir() and whatever is left in it.
    static void removeScratchDir();

    static LocalEdit prepareLocal(const QString &dir, const QString &name);

    // Synchronous download over the live session.
    static bool prepareRemote(RemoteSession &session, const QString &name,
                              RemoteEdit *out, SftpError *err = nullptr);

    // `session` may be null (disconnected while the editor ran). Uses the
    // session's profile, password and factory to open a fresh channel.
    static Outcome finishRemote(const RemoteEdit &req, RemoteSession *session,
                                int timeoutSec, SftpError *err = nullptr);

    // Configured command, then $EDITOR, $VISUAL, vim, nano, vi; each only if
    // its program is found on PATH. Empty when none is usable.
    static QString resolveEditor(const QString &configured);

    // Runs `editor path` attached to the terminal and waits for it.
    // Returns false only when the editor could not be started.
    static bool runEditor(const QString &editor, const QString &path, QString *err = nullptr);
};
