// AppState.h
//
// Purpose:
//   Foreground controller of the file manager. Holds both panels, the live
//   remote session, the status line, the two transfer progress handles and
//   the one active dialog. Every user action of a front-end maps onto one
//   method here.
//
// Threading:
//   Owned and mutated by the foreground thread only. Transfer workers see
//   nothing of it except their ProgressHandle.

#pragma once

#include <QFuture>
#include <QString>
#include <QVector>
#include <memory>
#include <variant>

#include "AppConfig.h"
#include "EditRoundtrip.h"
#include "MutationOps.h"
#include "PanelModel.h"
#include "RemoteSession.h"
#include "SftpChannel.h"
#include "SshProfile.h"
#include "TransferProgress.h"

enum class PanelSide {
    Left,   // local
    Right   // remote
};

// -----------------------------
// Dialog states (one active at a time)
// -----------------------------
struct NoDialog {};

struct PasswordDialog
{
    SshProfile profile;
    QString    error;    // last connect failure, shown for retry
};

struct RenameDialog
{
    PanelSide side = PanelSide::Left;
    QString   original;
};

struct MkdirDialog
{
    PanelSide side = PanelSide::Left;
};

struct DeleteDialog
{
    PanelSide             side = PanelSide::Left;
    QVector<DeleteTarget> targets;
};

using ActiveDialog = std::variant<NoDialog, PasswordDialog, RenameDialog, MkdirDialog, DeleteDialog>;

class AppState
{
public:
    // `startDir` is the initial local directory (left panel).
    AppState(ChannelFactory factory, const AppConfig &config, const QString &startDir);
    ~AppState();

    AppState(const AppState &) = delete;
    AppState &operator=(const AppState &) = delete;

    // Panels
    PanelModel &left() { return m_left; }
    PanelModel &right() { return m_right; }
    const PanelModel &left() const { return m_left; }
    const PanelModel &right() const { return m_right; }

    PanelSide   activeSide() const { return m_active; }
    PanelModel &activePanel() { return m_active == PanelSide::Left ? m_left : m_right; }
    void togglePanel();

    // Display-only: remote rendered on the left.
    void swapPanels() { m_panelsSwapped = !m_panelsSwapped; }
    bool panelsSwapped() const { return m_panelsSwapped; }

    // "[ local:/a* | remote:/b ]" in display order; '*' marks the active panel.
    QString layoutLine() const;

    QString statusMessage() const { return m_status; }
    const AppConfig &config() const { return m_config; }

    // Dialogs
    const ActiveDialog &dialog() const { return m_dialog; }
    bool hasDialog() const { return !std::holds_alternative<NoDialog>(m_dialog); }
    void cancelDialog() { m_dialog = NoDialog{}; }

    // Connection
    bool isConnected() const { return m_session != nullptr; }
    RemoteSession *session() const { return m_session.get(); }

    // Password profiles open the password dialog; key profiles connect now.
    void beginConnect(const SshProfile &profile);
    void submitPassword(const QString &password);
    void disconnect();

    // Navigation on the active panel
    void enterSelected();
    void goUp();
    void refreshActive();

    // Transfers (left -> right is upload, right -> left is download)
    bool isUploading() const { return m_upload != nullptr; }
    bool isDownloading() const { return m_download != nullptr; }
    ProgressHandle uploadProgress() const { return m_upload; }
    ProgressHandle downloadProgress() const { return m_download; }

    // Rejected while not connected or while a transfer of the same direction runs.
    bool startUpload();
    bool startDownload();

    // One tick: Done refreshes the destination panel, Failed reports.
    void pollTransfers();

    // Blocks until the running workers have returned (tests, orderly quit).
    void waitForTransfers();

    // Rename / mkdir / delete
    void openRenameDialog();
    void confirmRename(const QString &newName);
    void openMkdirDialog();
    void confirmMkdir(const QString &name);
    void openDeleteDialog();
    void confirmDelete();

    // Edit round-trip; the front-end runs the editor in between.
    bool prepareEdit(EditRequest *out);
    void finishEdit(const EditRequest &req);

private:
    void doConnect(const SshProfile &profile, const QString &password);
    void applyLocalStartPath(const SshProfile &profile);
    void refreshRemotePanel();
    bool activeSideAvailable() const;

    ChannelFactory m_factory;
    AppConfig      m_config;

    PanelModel m_left;
    PanelModel m_right;
    PanelSide  m_active = PanelSide::Left;
    bool       m_panelsSwapped = false;

    QString m_status;
    ActiveDialog m_dialog;

    std::unique_ptr<RemoteSession> m_session;

    ProgressHandle m_upload;
    ProgressHandle m_download;
    QFuture<void>  m_uploadFuture;
    QFuture<void>  m_downloadFuture;
};
