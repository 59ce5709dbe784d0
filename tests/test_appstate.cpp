#include <QtTest>
#include <QTemporaryDir>

#include "AppState.h"
#include "mocks/FakeSftpServer.h"

class TestAppState : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *remoteRoot = nullptr;
    QTemporaryDir *localDir = nullptr;
    FakeServerPtr server;
    AppState *state = nullptr;

    SshProfile keyProfile() const
    {
        SshProfile p;
        p.name = "box";
        p.host = "example";
        p.user = "alice";
        p.auth = AuthMethod::Key;
        return p;
    }

    static bool selectName(PanelModel &p, const QString &name)
    {
        for (int i = 0; i < p.entries().size(); ++i) {
            if (p.entries()[i].name == name) {
                p.setCursor(i);
                return true;
            }
        }
        return false;
    }

    static bool hasEntry(const PanelModel &p, const QString &name)
    {
        for (const FileEntry &e : p.entries()) {
            if (e.name == name)
                return true;
        }
        return false;
    }

    void writeLocal(const QString &rel, const QByteArray &data)
    {
        QFile f(localDir->filePath(rel));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(data);
    }

private slots:
    void init()
    {
        remoteRoot = new QTemporaryDir();
        localDir = new QTemporaryDir();
        server = FakeSftpServer::create(remoteRoot->path());
        writeLocal("local.txt", "local");
        state = new AppState(server->factory(), AppConfig(), localDir->path());
    }

    void cleanup()
    {
        if (state)
            state->waitForTransfers();
        delete state;
        state = nullptr;
        server.reset();
        delete remoteRoot;
        delete localDir;
        remoteRoot = nullptr;
        localDir = nullptr;
    }

    void testStartsDisconnectedWithLocalListing()
    {
        QVERIFY(!state->isConnected());
        QVERIFY(state->activeSide() == PanelSide::Left);
        QVERIFY(hasEntry(state->left(), "local.txt"));
        QVERIFY(state->right().isEmpty());
    }

    void testConnectWithKeyProfile()
    {
        server->writeFile("/home/alice/remote.txt", "r");
        state->beginConnect(keyProfile());

        QVERIFY(state->isConnected());
        QVERIFY(!state->hasDialog());
        QCOMPARE(state->statusMessage(), QString("Connected: alice@example"));
        QCOMPARE(state->right().path(), QString("/home/alice"));
        QVERIFY(hasEntry(state->right(), "remote.txt"));
    }

    void testRemoteStartPathWithTilde()
    {
        server->mkpath("/home/alice/projects");
        SshProfile p = keyProfile();
        p.remoteStartPath = "~/projects";

        state->beginConnect(p);
        QCOMPARE(state->right().path(), QString("/home/alice/projects"));
        QCOMPARE(state->statusMessage(), QString("Connected: alice@example -> /home/alice/projects"));
    }

    void testUnreachableStartPathFallsBackToHome()
    {
        SshProfile p = keyProfile();
        p.remoteStartPath = "/nonexistent";

        state->beginConnect(p);
        QVERIFY(state->isConnected());
        QCOMPARE(state->right().path(), QString("/home/alice"));
        QVERIFY(state->statusMessage().startsWith("Start directory '/nonexistent' unreachable:"));
        QVERIFY(state->statusMessage().contains("path not found"));
    }

    void testLocalStartPath()
    {
        QVERIFY(QDir(localDir->path()).mkdir("work"));
        SshProfile p = keyProfile();
        p.localStartPath = localDir->filePath("work");

        state->beginConnect(p);
        QCOMPARE(state->left().path(), localDir->filePath("work"));

        // Missing local start directory keeps the current panel
        state->disconnect();
        p.localStartPath = localDir->filePath("missing");
        state->beginConnect(p);
        QCOMPARE(state->left().path(), localDir->filePath("work"));
        QCOMPARE(state->statusMessage(), QString("Connected: alice@example"));
    }

    void testPasswordDialogKeepsErrorForRetry()
    {
        server->setRequiredPassword("s3cret");
        SshProfile p = keyProfile();
        p.auth = AuthMethod::Password;

        state->beginConnect(p);
        QVERIFY(std::holds_alternative<PasswordDialog>(state->dialog()));
        QVERIFY(!state->isConnected());

        state->submitPassword("wrong");
        const auto *d = std::get_if<PasswordDialog>(&state->dialog());
        QVERIFY(d);
        QVERIFY(d->error.startsWith("Authentication failed"));
        QVERIFY(!state->isConnected());

        state->submitPassword("s3cret");
        QVERIFY(state->isConnected());
        QVERIFY(!state->hasDialog());
        QCOMPARE(state->session()->password(), QString("s3cret"));
    }

    void testConnectFailureReportedInStatus()
    {
        server->setRefuseConnections(true);
        state->beginConnect(keyProfile());
        QVERIFY(!state->isConnected());
        QVERIFY(state->statusMessage().startsWith("Connection failed"));
    }

    void testDisconnectResetsRemotePanel()
    {
        state->beginConnect(keyProfile());
        QVERIFY(state->isConnected());

        state->disconnect();
        QVERIFY(!state->isConnected());
        QCOMPARE(state->statusMessage(), QString("Disconnected"));
        QCOMPARE(state->right().path(), state->left().path());
        QVERIFY(state->right().isEmpty());
    }

    void testTransfersRejectedWhileDisconnected()
    {
        QVERIFY(selectName(state->left(), "local.txt"));
        QVERIFY(!state->startUpload());
        QVERIFY(!state->startDownload());
        QVERIFY(!state->isUploading());
    }

    void testUploadCompletesAndRefreshesRemote()
    {
        state->beginConnect(keyProfile());
        QVERIFY(selectName(state->left(), "local.txt"));

        QVERIFY(state->startUpload());
        QVERIFY(state->isUploading());
        QCOMPARE(state->statusMessage(), QString("Uploading 'local.txt'..."));

        // Same direction is refused until the running one is collected
        QVERIFY(!state->startUpload());

        state->waitForTransfers();
        state->pollTransfers();

        QVERIFY(!state->isUploading());
        QCOMPARE(state->statusMessage(), QString("Upload complete"));
        QVERIFY(hasEntry(state->right(), "local.txt"));
        QCOMPARE(server->readFile("/home/alice/local.txt"), QByteArray("local"));
    }

    void testUploadFailureReported()
    {
        server->failOpenForWrite("/home/alice/local.txt");
        state->beginConnect(keyProfile());
        QVERIFY(selectName(state->left(), "local.txt"));

        QVERIFY(state->startUpload());
        state->waitForTransfers();
        state->pollTransfers();

        QVERIFY(!state->isUploading());
        QVERIFY(state->statusMessage().startsWith("Upload failed: Remote path error"));
    }

    void testDownloadCompletesAndRefreshesLocal()
    {
        server->writeFile("/home/alice/remote.txt", "remote");
        state->beginConnect(keyProfile());
        state->togglePanel();
        QVERIFY(selectName(state->right(), "remote.txt"));

        QVERIFY(state->startDownload());
        QVERIFY(state->isDownloading());

        state->waitForTransfers();
        state->pollTransfers();

        QCOMPARE(state->statusMessage(), QString("Download complete"));
        QVERIFY(hasEntry(state->left(), "remote.txt"));
    }

    void testRemoteNavigation()
    {
        server->mkpath("/home/alice/docs");
        state->beginConnect(keyProfile());
        state->togglePanel();

        QVERIFY(selectName(state->right(), "docs"));
        state->enterSelected();
        QCOMPARE(state->right().path(), QString("/home/alice/docs"));

        state->goUp();
        QCOMPARE(state->right().path(), QString("/home/alice"));
    }

    void testRenameMkdirDeleteDialogs()
    {
        state->beginConnect(keyProfile());
        state->togglePanel();

        state->openMkdirDialog();
        QVERIFY(std::holds_alternative<MkdirDialog>(state->dialog()));
        state->confirmMkdir("made");
        QCOMPARE(state->statusMessage(), QString("Directory 'made' created"));
        QVERIFY(hasEntry(state->right(), "made"));

        QVERIFY(selectName(state->right(), "made"));
        state->openRenameDialog();
        QVERIFY(std::holds_alternative<RenameDialog>(state->dialog()));
        state->confirmRename("moved");
        QCOMPARE(state->statusMessage(), QString("Renamed: made -> moved"));

        QVERIFY(selectName(state->right(), "moved"));
        state->openDeleteDialog();
        const auto *d = std::get_if<DeleteDialog>(&state->dialog());
        QVERIFY(d);
        QCOMPARE(d->targets.size(), 1);
        QVERIFY(d->targets.first().isDir);

        state->confirmDelete();
        QCOMPARE(state->statusMessage(), QString("'moved' deleted"));
        QVERIFY(!server->exists("/home/alice/moved"));
        QVERIFY(!state->hasDialog());
    }

    void testRenameDialogSkipsParentEntry()
    {
        state->left().setCursor(0);
        QVERIFY(state->left().currentEntry()->isParent());
        state->openRenameDialog();
        QVERIFY(!state->hasDialog());
    }

    void testCancelDialogDoesNothing()
    {
        QVERIFY(selectName(state->left(), "local.txt"));
        state->openDeleteDialog();
        QVERIFY(state->hasDialog());
        state->cancelDialog();
        QVERIFY(!state->hasDialog());
        QVERIFY(QFile::exists(localDir->filePath("local.txt")));
    }

    void testRemoteEditWithoutChanges()
    {
        server->writeFile("/home/alice/notes.txt", "n");
        state->beginConnect(keyProfile());
        state->togglePanel();
        QVERIFY(selectName(state->right(), "notes.txt"));

        EditRequest req;
        QVERIFY(state->prepareEdit(&req));
        QVERIFY(std::holds_alternative<RemoteEdit>(req));

        const int listingsBefore = server->totalListings();
        const int sessionsBefore = server->sessionsOpened();
        state->finishEdit(req);
        QCOMPARE(state->statusMessage(), QString("No changes, nothing uploaded"));
        QCOMPARE(server->totalListings(), listingsBefore);
        QCOMPARE(server->sessionsOpened(), sessionsBefore);
    }

    void testScratchDirectoryRemovedOnShutdown()
    {
        server->writeFile("/home/alice/notes.txt", "n");
        state->beginConnect(keyProfile());
        state->togglePanel();
        QVERIFY(selectName(state->right(), "notes.txt"));

        EditRequest req;
        QVERIFY(state->prepareEdit(&req));
        QVERIFY(QFileInfo(EditRoundtrip::scratchDir()).isDir());
        state->finishEdit(req);

        delete state;
        state = nullptr;
        QVERIFY(!QFileInfo::exists(EditRoundtrip::scratchDir()));

        state = new AppState(server->factory(), AppConfig(), localDir->path());
    }

    void testEditRejectsDirectory()
    {
        QVERIFY(QDir(localDir->path()).mkdir("d"));
        state->refreshActive();
        QVERIFY(selectName(state->left(), "d"));

        EditRequest req;
        QVERIFY(!state->prepareEdit(&req));
        QCOMPARE(state->statusMessage(), QString("No editable entry selected"));
    }

    void testSwapIsDisplayOnly()
    {
        state->swapPanels();
        QVERIFY(state->panelsSwapped());
        QVERIFY(state->activeSide() == PanelSide::Left);
        QVERIFY(hasEntry(state->left(), "local.txt"));
    }

    void testLayoutLineFollowsSwapAndFocus()
    {
        const QString local = "local:" + state->left().path();
        QCOMPARE(state->layoutLine(), QString("[ %1* | remote:(not connected) ]").arg(local));

        state->beginConnect(keyProfile());
        state->togglePanel();
        QCOMPARE(state->layoutLine(), QString("[ %1 | remote:/home/alice* ]").arg(local));

        state->swapPanels();
        QCOMPARE(state->layoutLine(), QString("[ remote:/home/alice* | %1 ]").arg(local));
    }
};

QTEST_GUILESS_MAIN(TestAppState)
#include "test_appstate.moc"
