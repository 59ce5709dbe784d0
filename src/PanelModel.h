#pragma once

#include <QSet>
#include <QString>
#include <QVector>

#include "FileEntry.h"

// PanelModel
// ----------
// Snapshot of one side's directory listing plus cursor and marks. The local
// and the remote panel share this shape, so transfer and delete code never
// needs to know which side it is looking at.
//
// Invariants:
//   - cursor() is a valid index whenever entries() is non-empty
//   - marks are positions in the current listing; every reload clears them
//   - ".." can never be marked or selected for an operation
class PanelModel
{
public:
    explicit PanelModel(const QString &path = QString());

    QString path() const { return m_path; }
    void setPath(const QString &path) { m_path = path; }

    const QVector<FileEntry> &entries() const { return m_entries; }
    int  cursor() const { return m_cursor; }
    bool isEmpty() const { return m_entries.isEmpty(); }

    // nullptr when the listing is empty.
    const FileEntry *currentEntry() const;

    void setCursor(int index);
    void moveUp();
    void moveDown();

    const QSet<int> &marked() const { return m_marked; }
    bool isMarked(int index) const { return m_marked.contains(index); }

    void toggleMark();
    void markAll();    // all eligible marked -> none, otherwise all
    void clearMarks();

    // Marked entries in listing order, else the cursor entry. Never "..".
    QVector<FileEntry> selectedEntries() const;

    // Local side. On failure the previous listing and path are kept.
    bool loadLocal(QString *err = nullptr);
    bool enterSelected(QString *err = nullptr);
    bool goUp(QString *err = nullptr);

    // Remote side: replace path + listing, cursor back to the top.
    void loadRemote(const QString &path, const QVector<FileEntry> &entries);

    // Empty listing at `path` (e.g. after disconnect).
    void reset(const QString &path);

private:
    void clampCursor();

    QString            m_path;
    QVector<FileEntry> m_entries;
    int                m_cursor = 0;
    QSet<int>          m_marked;
};
