#pragma once

#include <QString>
#include <QVector>

#include "FileEntry.h"

// Local filesystem side of the file manager: directory reads and the
// mutation primitives for the local panel.
namespace LocalFs {

// Non-recursive read of `dir` ("." and ".." excluded, hidden files included).
bool listDir(const QString &dir, QVector<FileEntry> *out, QString *err = nullptr);

// "~" -> home, "~/x" -> home + "/x". Blank input yields an empty string.
QString expandStartPath(const QString &raw);

bool isRoot(const QString &dir);

// Parent of `dir`; "/" stays "/".
QString parentDir(const QString &dir);

bool rename(const QString &dir, const QString &oldName, const QString &newName, QString *err = nullptr);
bool mkdir(const QString &dir, const QString &name, QString *err = nullptr);

// Directories are removed recursively. A symlink is removed itself, even
// when it points at a directory.
bool remove(const QString &dir, const QString &name, bool isDir, QString *err = nullptr);

} // namespace LocalFs
