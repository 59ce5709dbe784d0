#include <QtTest>
#include <QElapsedTimer>
#include <QTemporaryDir>
#include <QThread>

#include "TransferEngine.h"
#include "mocks/FakeSftpServer.h"

class TestTransferEngine : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *remoteRoot = nullptr;
    QTemporaryDir *localDir = nullptr;
    FakeServerPtr server;

    void writeLocal(const QString &rel, const QByteArray &data)
    {
        const QString path = localDir->filePath(rel);
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        QCOMPARE(f.write(data), qint64(data.size()));
    }

    QByteArray readLocal(const QString &rel)
    {
        QFile f(localDir->filePath(rel));
        if (!f.open(QIODevice::ReadOnly))
            return QByteArray("<missing>");
        return f.readAll();
    }

    static QByteArray pattern(qint64 n)
    {
        QByteArray b(n, Qt::Uninitialized);
        for (qint64 i = 0; i < n; ++i)
            b[i] = char('a' + (i * 7) % 26);
        return b;
    }

    static FileEntry entry(const QString &name)
    {
        FileEntry e;
        e.name = name;
        return e;
    }

    TransferRequest request(const QVector<FileEntry> &entries, int filesTotal)
    {
        TransferRequest req;
        req.profile.host = "example";
        req.profile.user = "alice";
        req.factory = server->factory();
        req.entries = entries;
        req.progress = std::make_shared<TransferProgress>(filesTotal);
        return req;
    }

    TransferRequest uploadRequest(const QVector<FileEntry> &entries, int filesTotal)
    {
        TransferRequest req = request(entries, filesTotal);
        req.sourceDir = localDir->path();
        req.destDir = server->home();
        return req;
    }

    TransferRequest downloadRequest(const QVector<FileEntry> &entries)
    {
        TransferRequest req = request(entries, 1);
        req.sourceDir = server->home();
        req.destDir = localDir->path();
        return req;
    }

private slots:
    void init()
    {
        remoteRoot = new QTemporaryDir();
        localDir = new QTemporaryDir();
        QVERIFY(remoteRoot->isValid());
        QVERIFY(localDir->isValid());
        server = FakeSftpServer::create(remoteRoot->path());
    }

    void cleanup()
    {
        server.reset();
        delete remoteRoot;
        delete localDir;
        remoteRoot = nullptr;
        localDir = nullptr;
    }

    void testUploadPreservesContent()
    {
        const QByteArray empty;
        const QByteArray one("x");
        const QByteArray multi = pattern(TransferEngine::kChunkSize * 2 + 17);
        writeLocal("empty.bin", empty);
        writeLocal("one.bin", one);
        writeLocal("multi.bin", multi);

        TransferRequest req = uploadRequest({entry("empty.bin"), entry("one.bin"), entry("multi.bin")}, 3);
        TransferEngine::uploadBatch(req);

        const TransferSnapshot s = req.progress->snapshot();
        QVERIFY2(s.state == TransferState::Done, qPrintable(s.error));
        QCOMPARE(s.filesDone, 3);

        QVERIFY(server->exists("/home/alice/empty.bin"));
        QCOMPARE(server->readFile("/home/alice/empty.bin"), empty);
        QCOMPARE(server->readFile("/home/alice/one.bin"), one);
        QCOMPARE(server->readFile("/home/alice/multi.bin"), multi);
    }

    void testUploadUsesOneFreshSession()
    {
        writeLocal("a", "1");
        writeLocal("b", "2");

        TransferRequest req = uploadRequest({entry("a"), entry("b")}, 2);
        TransferEngine::uploadBatch(req);

        QVERIFY(req.progress->state() == TransferState::Done);
        QCOMPARE(server->sessionsOpened(), 1);
    }

    void testUploadDirectoryTwiceMerges()
    {
        writeLocal("proj/main.c", "int main;");
        writeLocal("proj/src/util.c", "int util;");

        TransferRequest first = uploadRequest({entry("proj")}, 2);
        TransferEngine::uploadBatch(first);
        QVERIFY2(first.progress->state() == TransferState::Done, qPrintable(first.progress->snapshot().error));

        writeLocal("proj/src/util.c", "int util2;");
        TransferRequest second = uploadRequest({entry("proj")}, 2);
        TransferEngine::uploadBatch(second);
        QVERIFY2(second.progress->state() == TransferState::Done, qPrintable(second.progress->snapshot().error));

        QCOMPARE(server->readFile("/home/alice/proj/main.c"), QByteArray("int main;"));
        QCOMPARE(server->readFile("/home/alice/proj/src/util.c"), QByteArray("int util2;"));
        QCOMPARE(second.progress->snapshot().filesDone, 2);
    }

    void testUploadStopsAtFirstFailure()
    {
        writeLocal("a", "1");
        writeLocal("b", "2");
        writeLocal("c", "3");
        server->failOpenForWrite("/home/alice/b");

        TransferRequest req = uploadRequest({entry("a"), entry("b"), entry("c")}, 3);
        TransferEngine::uploadBatch(req);

        const TransferSnapshot s = req.progress->snapshot();
        QVERIFY(s.state == TransferState::Failed);
        QVERIFY(s.error.contains("Permission denied"));
        QCOMPARE(s.filesDone, 1);

        QVERIFY(server->exists("/home/alice/a"));
        QVERIFY(!server->exists("/home/alice/c"));
    }

    void testUploadConnectFailure()
    {
        writeLocal("a", "1");
        server->setRefuseConnections(true);

        TransferRequest req = uploadRequest({entry("a")}, 1);
        TransferEngine::uploadBatch(req);

        const TransferSnapshot s = req.progress->snapshot();
        QVERIFY(s.state == TransferState::Failed);
        QVERIFY(s.error.startsWith("Connection failed"));
    }

    void testDownloadCountsFilesFirst()
    {
        server->writeFile("/home/alice/tree/one", "1");
        server->writeFile("/home/alice/tree/sub/two", "22");
        server->writeFile("/home/alice/tree/sub/three", "333");
        server->writeFile("/home/alice/single.txt", "single");

        TransferRequest req = downloadRequest({entry("tree"), entry("single.txt")});
        TransferEngine::downloadBatch(req);

        const TransferSnapshot s = req.progress->snapshot();
        QVERIFY2(s.state == TransferState::Done, qPrintable(s.error));
        QCOMPARE(s.filesTotal, 4);
        QCOMPARE(s.filesDone, 4);

        QCOMPARE(readLocal("tree/one"), QByteArray("1"));
        QCOMPARE(readLocal("tree/sub/two"), QByteArray("22"));
        QCOMPARE(readLocal("tree/sub/three"), QByteArray("333"));
        QCOMPARE(readLocal("single.txt"), QByteArray("single"));
    }

    void testDownloadEmptyDirectoryKeepsTotalAtOne()
    {
        server->mkpath("/home/alice/empty");

        TransferRequest req = downloadRequest({entry("empty")});
        TransferEngine::downloadBatch(req);

        const TransferSnapshot s = req.progress->snapshot();
        QVERIFY(s.state == TransferState::Done);
        QCOMPARE(s.filesTotal, 1);
        QVERIFY(QFileInfo(localDir->filePath("empty")).isDir());
    }

    void testDownloadMissingEntryFails()
    {
        TransferRequest req = downloadRequest({entry("ghost")});
        TransferEngine::downloadBatch(req);

        const TransferSnapshot s = req.progress->snapshot();
        QVERIFY(s.state == TransferState::Failed);
        QVERIFY(s.error.startsWith("Remote path error"));
    }

    void testDownloadReadFailure()
    {
        server->writeFile("/home/alice/a", "1");
        server->writeFile("/home/alice/b", "2");
        server->failOpenForRead("/home/alice/a");

        TransferRequest req = downloadRequest({entry("a"), entry("b")});
        TransferEngine::downloadBatch(req);

        QVERIFY(req.progress->state() == TransferState::Failed);
        QVERIFY(!QFile::exists(localDir->filePath("b")));
    }

    void testDownloadReportsFullDisk()
    {
        if (!QFile::exists("/dev/full"))
            QSKIP("no /dev/full on this system");

        server->writeFile("/home/alice/tiny", "tiny");
        QVERIFY(QFile::link("/dev/full", localDir->filePath("tiny")));

        TransferRequest req = downloadRequest({entry("tiny")});
        TransferEngine::downloadBatch(req);

        const TransferSnapshot s = req.progress->snapshot();
        QVERIFY(s.state == TransferState::Failed);
        QVERIFY(s.error.startsWith("Local I/O error"));
        QCOMPARE(s.filesDone, 0);
    }

    void testBackgroundProgressIsMonotonic()
    {
        writeLocal("big.bin", pattern(TransferEngine::kChunkSize * 40));
        writeLocal("small.bin", "s");

        TransferRequest req = uploadRequest({entry("big.bin"), entry("small.bin")}, 2);
        QFuture<void> f = TransferEngine::startUpload(req);

        int lastFiles = 0;
        quint64 lastBytes = 0;
        QString lastName;
        QElapsedTimer timer;
        timer.start();

        while (!req.progress->snapshot().isFinished() && timer.elapsed() < 30000) {
            const TransferSnapshot s = req.progress->snapshot();
            QVERIFY(s.filesDone >= lastFiles);
            if (s.currentFile == lastName)
                QVERIFY(s.bytesDone >= lastBytes);
            QVERIFY(s.bytesTotal == 0 || s.bytesDone <= s.bytesTotal);
            lastFiles = s.filesDone;
            lastBytes = s.bytesDone;
            lastName = s.currentFile;
            QThread::msleep(1);
        }

        f.waitForFinished();
        QVERIFY(req.progress->state() == TransferState::Done);
        QCOMPARE(req.progress->snapshot().filesDone, 2);
    }

    void testUploadThenDownloadRoundTrip()
    {
        const QByteArray sizes[] = {QByteArray(), QByteArray("1"),
                                    pattern(TransferEngine::kChunkSize * 3 + 1)};
        QVector<FileEntry> entries;
        for (int i = 0; i < 3; ++i) {
            const QString name = QString("f%1").arg(i);
            writeLocal(name, sizes[i]);
            entries << entry(name);
        }

        TransferRequest up = uploadRequest(entries, 3);
        TransferEngine::uploadBatch(up);
        QVERIFY(up.progress->state() == TransferState::Done);

        QTemporaryDir back;
        TransferRequest down = request(entries, 1);
        down.sourceDir = server->home();
        down.destDir = back.path();
        TransferEngine::downloadBatch(down);
        QVERIFY(down.progress->state() == TransferState::Done);

        for (int i = 0; i < 3; ++i) {
            QFile f(back.filePath(QString("f%1").arg(i)));
            QVERIFY(f.open(QIODevice::ReadOnly));
            QCOMPARE(f.readAll(), sizes[i]);
        }
    }

    void testSingleFileDownloadProgress()
    {
        const QByteArray payload = pattern(TransferEngine::kChunkSize * 64);
        server->writeFile("/home/alice/big.bin", payload);

        TransferRequest req = downloadRequest({entry("big.bin")});
        QFuture<void> f = TransferEngine::startDownload(req);

        quint64 lastBytes = 0;
        QElapsedTimer timer;
        timer.start();
        while (!req.progress->snapshot().isFinished() && timer.elapsed() < 30000) {
            const TransferSnapshot s = req.progress->snapshot();
            QVERIFY(s.bytesDone >= lastBytes);
            // files_done moves only at completion
            QVERIFY(s.filesDone == 0 || s.bytesDone == s.bytesTotal);
            lastBytes = s.bytesDone;
            QThread::msleep(1);
        }
        f.waitForFinished();

        const TransferSnapshot s = req.progress->snapshot();
        QVERIFY(s.state == TransferState::Done);
        QCOMPARE(s.bytesTotal, quint64(payload.size()));
        QCOMPARE(s.bytesDone, s.bytesTotal);
        QCOMPARE(s.filesDone, 1);
        QCOMPARE(s.filesTotal, 1);
    }

    void testCountLocalFiles()
    {
        writeLocal("d/a", "1");
        writeLocal("d/e/b", "2");
        writeLocal("f", "3");
        QCOMPARE(TransferEngine::countLocalFiles(localDir->filePath("d")), 2);
        QCOMPARE(TransferEngine::countLocalFiles(localDir->filePath("f")), 1);
        QCOMPARE(TransferEngine::countLocalFiles(localDir->filePath("missing")), 0);
    }

    void testUploadFileReplacing()
    {
        server->writeFile("/home/alice/conf", "old");
        writeLocal("conf", "new contents");

        SftpError err;
        auto ch = server->factory()(SshProfile(), QString(), 10, &err);
        QVERIFY(ch);

        QVERIFY(TransferEngine::uploadFileReplacing(*ch, localDir->filePath("conf"), "/home/alice/conf", &err));
        QCOMPARE(server->readFile("/home/alice/conf"), QByteArray("new contents"));
        QVERIFY(!server->exists("/home/alice/conf.twinpane.part"));
    }

    void testUploadFileReplacingKeepsOriginalOnFailure()
    {
        server->writeFile("/home/alice/conf", "old");
        server->failOpenForWrite("/home/alice/conf.twinpane.part");
        writeLocal("conf", "new");

        SftpError err;
        auto ch = server->factory()(SshProfile(), QString(), 10, &err);
        QVERIFY(ch);

        QVERIFY(!TransferEngine::uploadFileReplacing(*ch, localDir->filePath("conf"), "/home/alice/conf", &err));
        QVERIFY(err.kind == SftpError::Kind::RemotePath);
        QCOMPARE(server->readFile("/home/alice/conf"), QByteArray("old"));
    }

    void testUploadFileReplacingKeepsMode()
    {
        server->writeFile("/home/alice/run.sh", "#!/bin/sh\n");
        QVERIFY(server->setPermissions("/home/alice/run.sh", 0755));
        writeLocal("run.sh", "#!/bin/sh\necho hi\n");

        SftpError err;
        auto ch = server->factory()(SshProfile(), QString(), 10, &err);
        QVERIFY(ch);

        QVERIFY(TransferEngine::uploadFileReplacing(*ch, localDir->filePath("run.sh"), "/home/alice/run.sh", &err));
        QCOMPARE(server->readFile("/home/alice/run.sh"), QByteArray("#!/bin/sh\necho hi\n"));
        QCOMPARE(server->permissions("/home/alice/run.sh"), 0755);
        QVERIFY(!server->exists("/home/alice/run.sh.twinpane.part"));
        QVERIFY(!server->exists("/home/alice/run.sh.twinpane.bak"));
    }

    void testUploadFileReplacingFollowsSymlink()
    {
        server->writeFile("/home/alice/real.conf", "old");
        QVERIFY(QFile::link(server->hostPath("/home/alice/real.conf"),
                            server->hostPath("/home/alice/link.conf")));
        writeLocal("link.conf", "new");

        SftpError err;
        auto ch = server->factory()(SshProfile(), QString(), 10, &err);
        QVERIFY(ch);

        QVERIFY(TransferEngine::uploadFileReplacing(*ch, localDir->filePath("link.conf"), "/home/alice/link.conf", &err));
        QVERIFY(QFileInfo(server->hostPath("/home/alice/link.conf")).isSymLink());
        QCOMPARE(server->readFile("/home/alice/real.conf"), QByteArray("new"));
        QVERIFY(!server->exists("/home/alice/real.conf.twinpane.part"));
    }

    void testUploadFileReplacingRestoresOriginalWhenSwapFails()
    {
        server->writeFile("/home/alice/conf", "old");
        server->failRenameFrom("/home/alice/conf.twinpane.part");
        writeLocal("conf", "new");

        SftpError err;
        auto ch = server->factory()(SshProfile(), QString(), 10, &err);
        QVERIFY(ch);

        QVERIFY(!TransferEngine::uploadFileReplacing(*ch, localDir->filePath("conf"), "/home/alice/conf", &err));
        QVERIFY(err.kind == SftpError::Kind::RemotePath);
        QCOMPARE(server->readFile("/home/alice/conf"), QByteArray("old"));
        QVERIFY(!server->exists("/home/alice/conf.twinpane.part"));
        QVERIFY(!server->exists("/home/alice/conf.twinpane.bak"));
    }

    void testUploadFileReplacingKeepsBothCopiesWhenRestoreFails()
    {
        server->writeFile("/home/alice/conf", "old");
        server->failRenameFrom("/home/alice/conf.twinpane.part");
        server->failRenameFrom("/home/alice/conf.twinpane.bak");
        writeLocal("conf", "new");

        SftpError err;
        auto ch = server->factory()(SshProfile(), QString(), 10, &err);
        QVERIFY(ch);

        QVERIFY(!TransferEngine::uploadFileReplacing(*ch, localDir->filePath("conf"), "/home/alice/conf", &err));
        QVERIFY(err.message.contains("conf.twinpane.bak"));
        QCOMPARE(server->readFile("/home/alice/conf.twinpane.bak"), QByteArray("old"));
        QCOMPARE(server->readFile("/home/alice/conf.twinpane.part"), QByteArray("new"));
    }

    void testUploadFileReplacingCreatesMissingTarget()
    {
        writeLocal("fresh", "data");

        SftpError err;
        auto ch = server->factory()(SshProfile(), QString(), 10, &err);
        QVERIFY(ch);

        QVERIFY(TransferEngine::uploadFileReplacing(*ch, localDir->filePath("fresh"), "/home/alice/fresh", &err));
        QCOMPARE(server->readFile("/home/alice/fresh"), QByteArray("data"));
    }
};

QTEST_GUILESS_MAIN(TestTransferEngine)
#include "test_transferengine.moc"
