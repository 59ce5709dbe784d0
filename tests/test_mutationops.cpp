#include <QtTest>
#include <QTemporaryDir>

#include "MutationOps.h"
#include "mocks/FakeSftpServer.h"

class TestMutationOps : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *remoteRoot = nullptr;
    QTemporaryDir *localDir = nullptr;
    FakeServerPtr server;
    std::unique_ptr<RemoteSession> session;

    static QStringList names(const PanelModel &p)
    {
        QStringList out;
        for (const FileEntry &e : p.entries())
            out << e.name;
        return out;
    }

    void touchLocal(const QString &rel)
    {
        QFile f(localDir->filePath(rel));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("x");
    }

private slots:
    void init()
    {
        remoteRoot = new QTemporaryDir();
        localDir = new QTemporaryDir();
        server = FakeSftpServer::create(remoteRoot->path());

        SshProfile profile;
        profile.host = "example";
        profile.user = "alice";
        SftpError err;
        session = RemoteSession::connect(profile, QString(), server->factory(), 10, &err);
        QVERIFY2(session, qPrintable(err.toString()));
    }

    void cleanup()
    {
        session.reset();
        server.reset();
        delete remoteRoot;
        delete localDir;
        remoteRoot = nullptr;
        localDir = nullptr;
    }

    void testRemoteDeleteIsBestEffort()
    {
        server->writeFile("/home/alice/a", "1");
        server->writeFile("/home/alice/b", "2");
        server->writeFile("/home/alice/c", "3");
        server->failUnlink("/home/alice/b");

        PanelModel panel(session->currentPath());
        const int listingsBefore = server->listings("/home/alice");

        const QVector<DeleteTarget> targets{{"a", false}, {"b", false}, {"c", false}};
        const DeleteSummary s = MutationOps::deleteRemote(*session, panel, targets);

        QCOMPARE(s.succeeded, 2);
        QCOMPARE(s.total, 3);
        QVERIFY(s.hasFailures());
        QCOMPARE(s.lastError, QString("'b': Remote path error: Permission denied"));
        QCOMPARE(s.statusText(targets),
                 QString("2/3 deleted, error: 'b': Remote path error: Permission denied"));

        // All targets attempted, then one refresh
        QVERIFY(!server->exists("/home/alice/a"));
        QVERIFY(server->exists("/home/alice/b"));
        QVERIFY(!server->exists("/home/alice/c"));
        QCOMPARE(server->listings("/home/alice"), listingsBefore + 1);
        QCOMPARE(names(panel), QStringList({"..", "b"}));
    }

    void testRemoteDeleteDirectory()
    {
        server->writeFile("/home/alice/tree/deep/file", "1");
        PanelModel panel(session->currentPath());

        const QVector<DeleteTarget> targets{{"tree", true}};
        const DeleteSummary s = MutationOps::deleteRemote(*session, panel, targets);

        QVERIFY(!s.hasFailures());
        QCOMPARE(s.statusText(targets), QString("'tree' deleted"));
        QVERIFY(!server->exists("/home/alice/tree"));
    }

    void testStatusTextForBatch()
    {
        DeleteSummary s;
        s.total = 3;
        s.succeeded = 3;
        QCOMPARE(s.statusText({{"a", false}, {"b", false}, {"c", true}}), QString("3 entries deleted"));
    }

    void testRemoteRenameRefreshes()
    {
        server->writeFile("/home/alice/old", "1");
        PanelModel panel(session->currentPath());

        SftpError err;
        QVERIFY(MutationOps::renameRemote(*session, panel, "old", "new", &err));
        QCOMPARE(names(panel), QStringList({"..", "new"}));
    }

    void testRemoteRenameFailure()
    {
        PanelModel panel(session->currentPath());

        SftpError err;
        QVERIFY(!MutationOps::renameRemote(*session, panel, "ghost", "new", &err));
        QVERIFY(err.kind == SftpError::Kind::RemotePath);
    }

    void testRemoteMkdir()
    {
        PanelModel panel(session->currentPath());

        SftpError err;
        QVERIFY(MutationOps::mkdirRemote(*session, panel, "fresh", &err));
        QCOMPARE(names(panel), QStringList({"..", "fresh"}));
        QVERIFY(panel.entries()[1].isDir);

        QVERIFY(!MutationOps::mkdirRemote(*session, panel, "fresh", &err));
        QVERIFY(err.isError());
    }

    void testLocalMutations()
    {
        touchLocal("a");
        touchLocal("b");
        PanelModel panel(localDir->path());
        QVERIFY(panel.loadLocal());

        SftpError err;
        QVERIFY(MutationOps::renameLocal(panel, "a", "renamed", &err));
        QVERIFY(MutationOps::mkdirLocal(panel, "dir", &err));
        QCOMPARE(names(panel), QStringList({"..", "dir", "b", "renamed"}));

        QVERIFY(!MutationOps::renameLocal(panel, "b", "renamed", &err));
        QVERIFY(err.kind == SftpError::Kind::LocalIO);

        const QVector<DeleteTarget> targets{{"dir", true}, {"ghost", false}, {"b", false}};
        const DeleteSummary s = MutationOps::deleteLocal(panel, targets);
        QCOMPARE(s.succeeded, 2);
        QVERIFY(s.lastError.startsWith("'ghost': Local I/O error"));
        QCOMPARE(names(panel), QStringList({"..", "renamed"}));
    }
};

QTEST_GUILESS_MAIN(TestMutationOps)
#include "test_mutationops.moc"
