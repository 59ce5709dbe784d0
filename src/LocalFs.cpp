#include "LocalFs.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace LocalFs {

bool listDir(const QString &dir, QVector<FileEntry> *out, QString *err)
{
    if (err) err->clear();
    if (out) out->clear();

    QDir d(dir);
    if (!d.exists()) {
        if (err) *err = QString("Directory '%1' does not exist").arg(dir);
        return false;
    }
    if (!QFileInfo(dir).isReadable()) {
        if (err) *err = QString("Permission denied: '%1'").arg(dir);
        return false;
    }

    const QFileInfoList infos = d.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System
                                                | QDir::NoDotAndDotDot,
                                                QDir::NoSort);

    QVector<FileEntry> items;
    items.reserve(infos.size());
    for (const QFileInfo &fi : infos) {
        FileEntry e;
        e.name  = fi.fileName();
        e.isDir = fi.isDir();
        if (!e.isDir) {
            e.hasSize = true;
            e.size    = (quint64)fi.size();
        }
        e.modified = fi.lastModified();
        items.push_back(e);
    }

    if (out) *out = items;
    return true;
}

QString expandStartPath(const QString &raw)
{
    const QString p = raw.trimmed();
    if (p.isEmpty())
        return QString();
    if (p == "~")
        return QDir::homePath();
    if (p.startsWith("~/"))
        return QDir::homePath() + p.mid(1);
    return p;
}

bool isRoot(const QString &dir)
{
    return QDir(dir).isRoot();
}

QString parentDir(const QString &dir)
{
    QDir d(dir);
    if (d.isRoot())
        return d.absolutePath();
    d.cdUp();
    return d.absolutePath();
}

bool rename(const QString &dir, const QString &oldName, const QString &newName, QString *err)
{
    if (err) err->clear();

    const QString from = QDir(dir).filePath(oldName);
    const QString to   = QDir(dir).filePath(newName);

    if (QFileInfo::exists(to)) {
        if (err) *err = QString("'%1' already exists").arg(newName);
        return false;
    }

    QFile f(from);
    if (f.rename(to))
        return true;

    // QFile::rename refuses directories on some platforms; QDir handles them.
    if (QFileInfo(from).isDir() && QDir(dir).rename(oldName, newName))
        return true;

    if (err) *err = QString("rename '%1' -> '%2': %3").arg(oldName, newName, f.errorString());
    return false;
}

bool mkdir(const QString &dir, const QString &name, QString *err)
{
    if (err) err->clear();

    QDir d(dir);
    if (d.exists(name)) {
        if (err) *err = QString("'%1' already exists").arg(name);
        return false;
    }
    if (!d.mkdir(name)) {
        if (err) *err = QString("mkdir '%1' failed").arg(d.filePath(name));
        return false;
    }
    return true;
}

bool remove(const QString &dir, const QString &name, bool isDir, QString *err)
{
    if (err) err->clear();

    const QString path = QDir(dir).filePath(name);

    // A link is removed itself, never the tree it points to.
    if (QFileInfo(path).isSymLink()) {
        QFile link(path);
        if (!link.remove()) {
            if (err) *err = QString("remove '%1': %2").arg(path, link.errorString());
            return false;
        }
        return true;
    }

    if (isDir) {
        if (!QDir(path).removeRecursively()) {
            if (err) *err = QString("remove directory '%1' failed").arg(path);
            return false;
        }
        return true;
    }

    QFile f(path);
    if (!f.remove()) {
        if (err) *err = QString("remove '%1': %2").arg(path, f.errorString());
        return false;
    }
    return true;
}

} // namespace LocalFs
