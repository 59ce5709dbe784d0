// MutationOps.h
//
// Purpose:
//   Rename / create-directory / delete on either panel. Everything runs
//   synchronously on the foreground. Remote mutations go through the live
//   RemoteSession and finish with a re-list so the panel matches the server.
//
// Delete is best-effort: every target is attempted even after failures, and
// only the success count plus the last error are reported.

#pragma once

#include <QString>
#include <QVector>

#include "PanelModel.h"
#include "RemoteSession.h"
#include "SftpError.h"

struct DeleteTarget
{
    QString name;
    bool    isDir = false;
};

struct DeleteSummary
{
    int     succeeded = 0;
    int     total     = 0;
    QString lastError;      // "'<name>': <cause>" of the last failure
    QString refreshError;   // set when the listing refresh afterwards failed

    bool hasFailures() const { return succeeded < total; }

    // "3 entries deleted", "'a.txt' deleted" or "2/3 deleted, error: ..."
    QString statusText(const QVector<DeleteTarget> &targets) const;
};

namespace MutationOps {

// Remote side. On success the panel is reloaded from the session; a failed
// reload is reported through `err` as well.
bool renameRemote(RemoteSession &session, PanelModel &panel,
                  const QString &oldName, const QString &newName, SftpError *err = nullptr);
bool mkdirRemote(RemoteSession &session, PanelModel &panel,
                 const QString &name, SftpError *err = nullptr);

// Refreshes the listing exactly once, after the last target.
DeleteSummary deleteRemote(RemoteSession &session, PanelModel &panel,
                           const QVector<DeleteTarget> &targets);

// Local side, relative to panel.path(); the panel is reloaded afterwards.
bool renameLocal(PanelModel &panel, const QString &oldName, const QString &newName,
                 SftpError *err = nullptr);
bool mkdirLocal(PanelModel &panel, const QString &name, SftpError *err = nullptr);
DeleteSummary deleteLocal(PanelModel &panel, const QVector<DeleteTarget> &targets);

// Re-list the session's current directory into `panel`.
bool refreshRemote(RemoteSession &session, PanelModel &panel, SftpError *err = nullptr);

} // namespace MutationOps
