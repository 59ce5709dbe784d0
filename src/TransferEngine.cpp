// TransferEngine.cpp
//
// Logging tags: [XFER][UPLOAD], [XFER][DOWNLOAD].

#include "TransferEngine.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

#include <memory>

#include "RemotePath.h"

namespace {

// Dedicated pool: one upload and one download may run side by side.
// Never deleted, so process exit abandons whatever batch is still running.
QThreadPool *transferPool()
{
    static QThreadPool *pool = [] {
        auto *p = new QThreadPool;
        p->setMaxThreadCount(2);
        return p;
    }();
    return pool;
}

bool writeAll(SftpFile &f, const char *data, qint64 len)
{
    while (len > 0) {
        const qint64 w = f.write(data, len);
        if (w <= 0) return false;
        data += w;
        len  -= w;
    }
    return true;
}

std::unique_ptr<SftpChannel> openFresh(const TransferRequest &req, SftpError *err)
{
    if (!req.factory) {
        setError(err, SftpError::transport(QStringLiteral("No channel factory configured.")));
        return nullptr;
    }

    SftpError e;
    std::unique_ptr<SftpChannel> ch = req.factory(req.profile, req.password, req.timeoutSec, &e);
    if (!ch && !e.isError())
        e = SftpError::transport(QStringLiteral("unknown error"));
    if (!ch) setError(err, e);
    return ch;
}

// ------------------------------------------------------------
// Upload helpers
// ------------------------------------------------------------
bool uploadFile(SftpChannel &ch,
                const QString &localPath,
                const QString &remoteDir,
                TransferProgress &prog,
                SftpError *err)
{
    const QString name   = QFileInfo(localPath).fileName();
    const QString remote = remoteJoin(remoteDir, name);

    QFile in(localPath);
    if (!in.open(QIODevice::ReadOnly)) {
        setError(err, SftpError::localIo(QString("%1: %2").arg(localPath, in.errorString())));
        return false;
    }

    prog.beginFile(name, (quint64)in.size());

    QString why;
    std::unique_ptr<SftpFile> out = ch.openForWrite(remote, 0644, &why);
    if (!out) {
        setError(err, SftpError::remotePath(why));
        return false;
    }

    QByteArray buf(TransferEngine::kChunkSize, Qt::Uninitialized);
    while (true) {
        const qint64 n = in.read(buf.data(), buf.size());
        if (n < 0) {
            setError(err, SftpError::localIo(QString("%1: %2").arg(localPath, in.errorString())));
            return false;
        }
        if (n == 0)
            break;

        if (!writeAll(*out, buf.constData(), n)) {
            setError(err, SftpError::remotePath(QString("write '%1': %2").arg(remote, out->errorString())));
            return false;
        }
        prog.addBytes((quint64)n);
    }

    out.reset();
    prog.fileDone();
    return true;
}

bool uploadDir(SftpChannel &ch,
               const QString &localDir,
               const QString &remoteParent,
               TransferProgress &prog,
               SftpError *err)
{
    const QString remoteDir = remoteJoin(remoteParent, QFileInfo(localDir).fileName());

    // An existing directory is fine: repeated uploads merge into it.
    QString why;
    bool exists = false;
    if (!ch.mkdir(remoteDir, 0755, &exists, &why) && !exists) {
        setError(err, SftpError::remotePath(why));
        return false;
    }

    QDir d(localDir);
    if (!d.exists()) {
        setError(err, SftpError::localIo(QString("%1: directory vanished").arg(localDir)));
        return false;
    }

    const QFileInfoList children = d.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System
                                                   | QDir::NoDotAndDotDot,
                                                   QDir::Name);
    for (const QFileInfo &c : children) {
        const bool ok = c.isDir() ? uploadDir(ch, c.absoluteFilePath(), remoteDir, prog, err)
                                  : uploadFile(ch, c.absoluteFilePath(), remoteDir, prog, err);
        if (!ok) return false;
    }
    return true;
}

// ------------------------------------------------------------
// Download helpers
// ------------------------------------------------------------
bool downloadFile(SftpChannel &ch,
                  const RemoteAttributes &src,
                  const QString &remotePath,
                  const QString &localDir,
                  TransferProgress &prog,
                  SftpError *err)
{
    const QString name  = remoteFileName(remotePath);
    const QString local = QDir(localDir).filePath(name);

    // Unknown or zero size stays 0: per-file progress is indeterminate.
    prog.beginFile(name, src.hasSize ? src.size : 0);

    QString why;
    std::unique_ptr<SftpFile> in = ch.openForRead(remotePath, &why);
    if (!in) {
        setError(err, SftpError::remotePath(why));
        return false;
    }

    QFile out(local);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(err, SftpError::localIo(QString("%1: %2").arg(local, out.errorString())));
        return false;
    }

    QByteArray buf(TransferEngine::kChunkSize, Qt::Uninitialized);
    while (true) {
        const qint64 n = in->read(buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            setError(err, SftpError::remotePath(QString("read '%1': %2").arg(remotePath, in->errorString())));
            return false;
        }
        if (out.write(buf.constData(), n) != n) {
            setError(err, SftpError::localIo(QString("%1: %2").arg(local, out.errorString())));
            return false;
        }
        prog.addBytes((quint64)n);
    }

    // The last chunk may still sit in QFile's buffer.
    if (!out.flush()) {
        setError(err, SftpError::localIo(QString("%1: %2").arg(local, out.errorString())));
        return false;
    }
    out.close();
    prog.fileDone();
    return true;
}

bool downloadDir(SftpChannel &ch,
                 const QString &remoteDir,
                 const QString &localParent,
                 TransferProgress &prog,
                 SftpError *err)
{
    const QString local = QDir(localParent).filePath(remoteFileName(remoteDir));

    if (!QFileInfo(local).isDir() && !QDir().mkdir(local)) {
        setError(err, SftpError::localIo(QString("cannot create directory '%1'").arg(local)));
        return false;
    }

    QVector<RemoteAttributes> children;
    QString why;
    if (!ch.listDir(remoteDir, &children, &why)) {
        setError(err, SftpError::remotePath(why));
        return false;
    }

    for (const RemoteAttributes &c : children) {
        const QString child = remoteJoin(remoteDir, c.name);
        const bool ok = c.isDir ? downloadDir(ch, child, local, prog, err)
                                : downloadFile(ch, c, child, local, prog, err);
        if (!ok) return false;
    }
    return true;
}

} // namespace

// ------------------------------------------------------------
// Spawning
// ------------------------------------------------------------
QFuture<void> TransferEngine::startUpload(const TransferRequest &req)
{
    return QtConcurrent::run(transferPool(), [req]() { uploadBatch(req); });
}

QFuture<void> TransferEngine::startDownload(const TransferRequest &req)
{
    return QtConcurrent::run(transferPool(), [req]() { downloadBatch(req); });
}

// ------------------------------------------------------------
// Batch bodies
// ------------------------------------------------------------
void TransferEngine::uploadBatch(const TransferRequest &req)
{
    TransferProgress &prog = *req.progress;

    qInfo().noquote() << QString("[XFER][UPLOAD] start entries=%1 src='%2' dst='%3'")
                         .arg(req.entries.size())
                         .arg(req.sourceDir, req.destDir);

    SftpError err;
    bool ok = true;
    {
        std::unique_ptr<SftpChannel> ch = openFresh(req, &err);
        ok = (ch != nullptr);

        for (int i = 0; ok && i < req.entries.size(); ++i) {
            if (prog.isFailed())
                break;

            const QString local = QDir(req.sourceDir).filePath(req.entries[i].name);
            ok = QFileInfo(local).isDir() ? uploadDir(*ch, local, req.destDir, prog, &err)
                                          : uploadFile(*ch, local, req.destDir, prog, &err);
        }
    } // channel released before the terminal state is published

    if (ok) {
        prog.finish();
        qInfo().noquote() << "[XFER][UPLOAD] done";
    } else {
        prog.fail(err.toString());
        qWarning().noquote() << QString("[XFER][UPLOAD] FAILED: %1").arg(err.toString());
    }
}

void TransferEngine::downloadBatch(const TransferRequest &req)
{
    TransferProgress &prog = *req.progress;

    qInfo().noquote() << QString("[XFER][DOWNLOAD] start entries=%1 src='%2' dst='%3'")
                         .arg(req.entries.size())
                         .arg(req.sourceDir, req.destDir);

    SftpError err;
    bool ok = true;
    {
        std::unique_ptr<SftpChannel> ch = openFresh(req, &err);
        ok = (ch != nullptr);

        if (ok) {
            int total = 0;
            for (const FileEntry &e : req.entries)
                total += countRemoteFiles(*ch, remoteJoin(req.sourceDir, e.name));
            prog.setFilesTotal(qMax(1, total));
            qDebug().noquote() << QString("[XFER][DOWNLOAD] files_total=%1").arg(total);
        }

        for (int i = 0; ok && i < req.entries.size(); ++i) {
            if (prog.isFailed())
                break;

            const QString remote = remoteJoin(req.sourceDir, req.entries[i].name);

            RemoteAttributes st;
            QString why;
            if (!ch->stat(remote, &st, &why)) {
                err = SftpError::remotePath(why);
                ok = false;
                break;
            }

            ok = st.isDir ? downloadDir(*ch, remote, req.destDir, prog, &err)
                          : downloadFile(*ch, st, remote, req.destDir, prog, &err);
        }
    } // channel released before the terminal state is published

    if (ok) {
        prog.finish();
        qInfo().noquote() << "[XFER][DOWNLOAD] done";
    } else {
        prog.fail(err.toString());
        qWarning().noquote() << QString("[XFER][DOWNLOAD] FAILED: %1").arg(err.toString());
    }
}

// ------------------------------------------------------------
// Counting
// ------------------------------------------------------------
int TransferEngine::countLocalFiles(const QString &path)
{
    const QFileInfo fi(path);
    if (fi.isFile())
        return 1;
    if (!fi.isDir())
        return 0;

    int n = 0;
    const QFileInfoList children = QDir(path).entryInfoList(QDir::AllEntries | QDir::Hidden
                                                            | QDir::System | QDir::NoDotAndDotDot);
    for (const QFileInfo &c : children)
        n += countLocalFiles(c.absoluteFilePath());
    return n;
}

int TransferEngine::countRemoteFiles(SftpChannel &ch, const QString &path)
{
    RemoteAttributes st;
    if (!ch.stat(path, &st))
        return 0;
    if (!st.isDir)
        return 1;

    QVector<RemoteAttributes> children;
    if (!ch.listDir(path, &children))
        return 0;

    int n = 0;
    for (const RemoteAttributes &c : children)
        n += c.isDir ? countRemoteFiles(ch, remoteJoin(path, c.name)) : 1;
    return n;
}

// ------------------------------------------------------------
// Single-file replace (edit round-trip)
// ------------------------------------------------------------
bool TransferEngine::uploadFileReplacing(SftpChannel &ch,
                                         const QString &localPath,
                                         const QString &remotePath,
                                         SftpError *err)
{
    if (err) err->clear();

    QFile in(localPath);
    if (!in.open(QIODevice::ReadOnly)) {
        setError(err, SftpError::localIo(QString("%1: %2").arg(localPath, in.errorString())));
        return false;
    }

    // Resolve links so the link itself survives and the file behind it is replaced.
    QString target;
    if (!ch.canonicalize(remotePath, &target) || target.isEmpty())
        target = remotePath;

    int mode = 0644;
    bool hadOriginal = false;
    RemoteAttributes st;
    if (ch.stat(target, &st)) {
        hadOriginal = true;
        if (st.hasPerms)
            mode = (int)(st.perms & 07777);
    }

    const QString tmpPath    = target + ".twinpane.part";
    const QString backupPath = target + ".twinpane.bak";

    QString why;
    QString ignored;
    std::unique_ptr<SftpFile> out = ch.openForWrite(tmpPath, mode, &why);
    if (!out) {
        setError(err, SftpError::remotePath(why));
        return false;
    }

    QByteArray buf(kChunkSize, Qt::Uninitialized);
    while (true) {
        const qint64 n = in.read(buf.data(), buf.size());
        if (n == 0)
            break;

        QString failure;
        if (n < 0)
            failure = QString("%1: %2").arg(localPath, in.errorString());
        else if (!writeAll(*out, buf.constData(), n))
            failure = QString("write '%1': %2").arg(tmpPath, out->errorString());

        if (!failure.isEmpty()) {
            out.reset();
            ch.unlink(tmpPath, &ignored);
            setError(err, n < 0 ? SftpError::localIo(failure) : SftpError::remotePath(failure));
            return false;
        }
    }
    out.reset();

    // The server's umask may have narrowed the creation mode.
    if (hadOriginal && !ch.chmod(tmpPath, mode, &why))
        qWarning().noquote() << QString("[XFER][UPLOAD] keeping server default mode for '%1': %2")
                                .arg(target, why);

    if (ch.rename(tmpPath, target, &why))
        return true;

    if (!hadOriginal) {
        ch.unlink(tmpPath, &ignored);
        setError(err, SftpError::remotePath(why));
        return false;
    }

    // SFTPv3 servers refuse to rename over an existing file: swap via a backup.
    if (!ch.rename(target, backupPath, &why)) {
        ch.unlink(tmpPath, &ignored);
        setError(err, SftpError::remotePath(why));
        return false;
    }

    if (!ch.rename(tmpPath, target, &why)) {
        const QString swapError = why;
        if (!ch.rename(backupPath, target, &why)) {
            // Neither copy is deleted; both stay next to the target.
            qWarning().noquote() << QString("[XFER][UPLOAD] could not restore '%1' from '%2': %3")
                                    .arg(target, backupPath, why);
            setError(err, SftpError::remotePath(QString("%1 (original kept as '%2', upload kept as '%3')")
                                                    .arg(swapError, backupPath, tmpPath)));
            return false;
        }
        ch.unlink(tmpPath, &ignored);
        setError(err, SftpError::remotePath(swapError));
        return false;
    }

    if (!ch.unlink(backupPath, &why))
        qWarning().noquote() << QString("[XFER][UPLOAD] stale backup '%1': %2").arg(backupPath, why);
    return true;
}
