#include "TransferProgress.h"

#include <QMutexLocker>
#include <algorithm>

double TransferSnapshot::fileFraction() const
{
    if (bytesTotal == 0)
        return 0.0;
    return std::clamp((double)bytesDone / (double)bytesTotal, 0.0, 1.0);
}

double TransferSnapshot::overallFraction() const
{
    if (filesTotal <= 0)
        return 1.0;
    return std::clamp((double)filesDone / (double)filesTotal, 0.0, 1.0);
}

TransferProgress::TransferProgress(int filesTotal)
{
    m_s.filesTotal = filesTotal;
}

TransferSnapshot TransferProgress::snapshot() const
{
    QMutexLocker lock(&m_mutex);
    return m_s;
}

TransferState TransferProgress::state() const
{
    QMutexLocker lock(&m_mutex);
    return m_s.state;
}

bool TransferProgress::isFailed() const
{
    return state() == TransferState::Failed;
}

void TransferProgress::setFilesTotal(int total)
{
    QMutexLocker lock(&m_mutex);
    if (m_s.isFinished()) return;
    m_s.filesTotal = total;
}

void TransferProgress::beginFile(const QString &name, quint64 bytesTotal)
{
    QMutexLocker lock(&m_mutex);
    if (m_s.isFinished()) return;
    m_s.currentFile = name;
    m_s.bytesDone   = 0;
    m_s.bytesTotal  = bytesTotal;
}

void TransferProgress::addBytes(quint64 n)
{
    QMutexLocker lock(&m_mutex);
    if (m_s.isFinished()) return;
    m_s.bytesDone += n;
    if (m_s.bytesTotal > 0)
        m_s.bytesDone = std::min(m_s.bytesDone, m_s.bytesTotal);
}

void TransferProgress::fileDone()
{
    QMutexLocker lock(&m_mutex);
    if (m_s.isFinished()) return;
    ++m_s.filesDone;
}

void TransferProgress::finish()
{
    QMutexLocker lock(&m_mutex);
    if (m_s.state == TransferState::Running)
        m_s.state = TransferState::Done;
}

void TransferProgress::fail(const QString &message)
{
    QMutexLocker lock(&m_mutex);
    if (m_s.state != TransferState::Running) return;
    m_s.state = TransferState::Failed;
    m_s.error = message;
}
