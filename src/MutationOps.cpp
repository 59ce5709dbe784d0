#include "MutationOps.h"

#include <QDebug>

#include "LocalFs.h"

QString DeleteSummary::statusText(const QVector<DeleteTarget> &targets) const
{
    if (!lastError.isEmpty())
        return QString("%1/%2 deleted, error: %3").arg(succeeded).arg(total).arg(lastError);
    if (total == 1 && !targets.isEmpty())
        return QString("'%1' deleted").arg(targets.first().name);
    return QString("%1 entries deleted").arg(succeeded);
}

namespace MutationOps {

bool refreshRemote(RemoteSession &session, PanelModel &panel, SftpError *err)
{
    QVector<FileEntry> entries;
    if (!session.list(&entries, err))
        return false;
    panel.loadRemote(session.currentPath(), entries);
    return true;
}

// -----------------------------------------------------------------------------
// Remote
// -----------------------------------------------------------------------------
bool renameRemote(RemoteSession &session, PanelModel &panel,
                  const QString &oldName, const QString &newName, SftpError *err)
{
    if (!session.rename(oldName, newName, err)) {
        qWarning().noquote() << QString("[MUTATE] remote rename '%1' -> '%2' failed: %3")
                                .arg(oldName, newName, err ? err->message : QString());
        return false;
    }
    qInfo().noquote() << QString("[MUTATE] remote rename '%1' -> '%2'").arg(oldName, newName);
    return refreshRemote(session, panel, err);
}

bool mkdirRemote(RemoteSession &session, PanelModel &panel, const QString &name, SftpError *err)
{
    if (!session.mkdir(name, err)) {
        qWarning().noquote() << QString("[MUTATE] remote mkdir '%1' failed: %2")
                                .arg(name, err ? err->message : QString());
        return false;
    }
    qInfo().noquote() << QString("[MUTATE] remote mkdir '%1'").arg(name);
    return refreshRemote(session, panel, err);
}

DeleteSummary deleteRemote(RemoteSession &session, PanelModel &panel,
                           const QVector<DeleteTarget> &targets)
{
    DeleteSummary s;
    s.total = targets.size();

    for (const DeleteTarget &t : targets) {
        SftpError e;
        const bool ok = t.isDir ? session.deleteDirectory(t.name, &e)
                                : session.deleteFile(t.name, &e);
        if (ok) {
            ++s.succeeded;
        } else {
            s.lastError = QString("'%1': %2").arg(t.name, e.toString());
            qWarning().noquote() << QString("[MUTATE] remote delete %1").arg(s.lastError);
        }
    }

    qInfo().noquote() << QString("[MUTATE] remote delete %1/%2").arg(s.succeeded).arg(s.total);

    SftpError listErr;
    if (!refreshRemote(session, panel, &listErr))
        s.refreshError = listErr.toString();
    return s;
}

// -----------------------------------------------------------------------------
// Local
// -----------------------------------------------------------------------------
bool renameLocal(PanelModel &panel, const QString &oldName, const QString &newName, SftpError *err)
{
    QString why;
    if (!LocalFs::rename(panel.path(), oldName, newName, &why)) {
        setError(err, SftpError::localIo(why));
        return false;
    }
    qInfo().noquote() << QString("[MUTATE] local rename '%1' -> '%2'").arg(oldName, newName);

    if (!panel.loadLocal(&why)) {
        setError(err, SftpError::localIo(why));
        return false;
    }
    return true;
}

bool mkdirLocal(PanelModel &panel, const QString &name, SftpError *err)
{
    QString why;
    if (!LocalFs::mkdir(panel.path(), name, &why)) {
        setError(err, SftpError::localIo(why));
        return false;
    }
    qInfo().noquote() << QString("[MUTATE] local mkdir '%1'").arg(name);

    if (!panel.loadLocal(&why)) {
        setError(err, SftpError::localIo(why));
        return false;
    }
    return true;
}

DeleteSummary deleteLocal(PanelModel &panel, const QVector<DeleteTarget> &targets)
{
    DeleteSummary s;
    s.total = targets.size();

    for (const DeleteTarget &t : targets) {
        QString why;
        if (LocalFs::remove(panel.path(), t.name, t.isDir, &why))
            ++s.succeeded;
        else
            s.lastError = QString("'%1': %2").arg(t.name, SftpError::localIo(why).toString());
    }

    qInfo().noquote() << QString("[MUTATE] local delete %1/%2").arg(s.succeeded).arg(s.total);

    QString why;
    if (!panel.loadLocal(&why))
        s.refreshError = SftpError::localIo(why).toString();
    return s;
}

} // namespace MutationOps
