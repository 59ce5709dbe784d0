#pragma once

#include <QMutex>
#include <QString>
#include <QtGlobal>
#include <memory>

enum class TransferState {
    Running,
    Done,
    Failed
};

// Point-in-time copy of a transfer's progress, taken under the lock.
struct TransferSnapshot
{
    TransferState state = TransferState::Running;
    QString error;          // set when Failed
    QString currentFile;
    quint64 bytesDone  = 0; // current file
    quint64 bytesTotal = 0; // current file, 0 = unknown
    int     filesDone  = 0;
    int     filesTotal = 0;

    bool isFinished() const { return state != TransferState::Running; }

    // Per-file fraction is indeterminate when the size is unknown.
    bool   fileFractionKnown() const { return bytesTotal > 0; }
    double fileFraction() const;
    double overallFraction() const;
};

// Shared progress record of one transfer batch.
//
// Exactly one writer (the batch worker) and any number of readers (the
// foreground tick). Done/Failed are terminal: once reached, every further
// write is ignored, so a late finish() never downgrades a failure.
class TransferProgress
{
public:
    explicit TransferProgress(int filesTotal);

    TransferSnapshot snapshot() const;

    TransferState state() const;
    bool isFailed() const;

    // Writer side
    void setFilesTotal(int total);
    void beginFile(const QString &name, quint64 bytesTotal);
    void addBytes(quint64 n);
    void fileDone();
    void finish();
    void fail(const QString &message);

private:
    mutable QMutex   m_mutex;
    TransferSnapshot m_s;
};

using ProgressHandle = std::shared_ptr<TransferProgress>;
