#ifndef FILEOPERATIONSCONTROLLER_H
#define FILEOPERATIONSCONTROLLER_H

#include "transfer/ClipboardStore.h"
#include "transfer/NotificationCenter.h"
#include "transfer/TransferExecutor.h"
#include "transfer/TransferOperationTracker.h"

#include <QList>
#include <QObject>
#include <QPointer>
#include <QStringList>

class QThread;
class StorageProvider;
class TextClipboard;

// Orchestrates clipboard, transfers, tracking and notifications for the UI.
// Owns the clipboard entry, the operation list and the notification slot;
// consumers reach them through this object only.
//
// paste()/deleteEntries() run on the calling thread and return when done.
// startPaste()/startDelete() run the executor on a worker thread and finish
// (clipboard update, notifications, signals) back on this object's thread.
class FileOperationsController : public QObject {
    Q_OBJECT

public:
    struct Settings {
        int maxConflictAttempts = ConflictResolver::DefaultMaxAttempts;
        int notificationDurationMs = NotificationCenter::DefaultDurationMs;
    };

    FileOperationsController(StorageProvider& storage, TextClipboard* textClipboard,
                             const Settings& settings, QObject* parent = nullptr);
    FileOperationsController(StorageProvider& storage, TextClipboard* textClipboard,
                             QObject* parent = nullptr);
    ~FileOperationsController() override;

    ClipboardStore& clipboard() { return m_clipboard; }
    TransferOperationTracker& tracker() { return m_tracker; }
    NotificationCenter& notifications() { return m_notifications; }

    void copy(const QStringList& files, const QString& sourceDir);
    void cut(const QStringList& files, const QString& sourceDir);

    // Returns true if the paste completed. No clipboard entry -> false,
    // no operation is created.
    bool paste(const QString& destinationDir);
    bool deleteEntries(const QStringList& names, const QString& sourceDir);

    // Return the operation id, or an empty string if nothing was started
    QString startPaste(const QString& destinationDir);
    QString startDelete(const QStringList& names, const QString& sourceDir);

    void cancelOperation(const QString& operationId);
    bool acknowledge();

    // Validation and provider failures are reported as error notifications
    bool createFile(const QString& dir, const QString& name);
    bool createFolder(const QString& dir, const QString& name);
    bool renameEntry(const QString& dir, const QString& oldName, const QString& newName);

    bool hasRunningWorkers() const;

signals:
    void operationFinished(const QString& operationId, bool success);
    // Contents of 'path' changed and listings of it should be refreshed
    void directoryChanged(const QString& path);

private:
    struct PendingTransfer {
        QString operationId;
        TransferRequest request;
        bool clearClipboardOnSuccess = false;
        quint64 clipboardGeneration = 0;    // store generation the entry was read at
    };

    std::optional<PendingTransfer> preparePaste(const QString& destinationDir);
    PendingTransfer prepareDelete(const QStringList& names, const QString& sourceDir);
    bool execute(const PendingTransfer& transfer);
    void finish(const PendingTransfer& transfer, bool success);
    QString startWorker(const PendingTransfer& transfer);

    template <typename Fn>
    bool guarded(const QString& failureTitle, Fn&& fn);

    StorageProvider& m_storage;
    Settings m_settings;
    NotificationCenter m_notifications;
    TransferOperationTracker m_tracker;
    ClipboardStore m_clipboard;
    QList<QPointer<QThread>> m_workers;
};

#endif // FILEOPERATIONSCONTROLLER_H
