#include "transfer/FileOperationsController.h"
#include "storage/StorageProvider.h"
#include "FileOperations.h"
#include "Errors.h"

#include <QDebug>
#include <QThread>

FileOperationsController::FileOperationsController(StorageProvider& storage,
                                                   TextClipboard* textClipboard,
                                                   const Settings& settings,
                                                   QObject* parent)
    : QObject(parent)
    , m_storage(storage)
    , m_settings(settings)
    , m_notifications(settings.notificationDurationMs)
    , m_tracker(&m_notifications)
    , m_clipboard(textClipboard, &storage)
{
}

FileOperationsController::FileOperationsController(StorageProvider& storage,
                                                   TextClipboard* textClipboard,
                                                   QObject* parent)
    : FileOperationsController(storage, textClipboard, Settings{}, parent)
{
}

FileOperationsController::~FileOperationsController()
{
    for (const auto& op : m_tracker.operations())
        m_tracker.cancel(op.id);

    for (const QPointer<QThread>& worker : m_workers) {
        if (worker)
            worker->wait();
    }
}

void FileOperationsController::copy(const QStringList& files, const QString& sourceDir)
{
    m_clipboard.setCopy(files, sourceDir);
}

void FileOperationsController::cut(const QStringList& files, const QString& sourceDir)
{
    m_clipboard.setCut(files, sourceDir);
}

std::optional<FileOperationsController::PendingTransfer>
FileOperationsController::preparePaste(const QString& destinationDir)
{
    // Read before the entry, so a set in between leaves a stale generation
    const quint64 generation = m_clipboard.generation();
    const std::optional<ClipboardEntry> entry = m_clipboard.current();
    if (!entry || entry->files.isEmpty()) {
        qDebug() << "No files in clipboard";
        return std::nullopt;
    }

    PendingTransfer transfer;
    transfer.request.kind = entry->mode == ClipboardMode::Cut ? TransferKind::Move : TransferKind::Copy;
    transfer.request.sourceDir = entry->sourceDir;
    transfer.request.names = entry->files;
    transfer.request.destinationDir = destinationDir;
    transfer.clearClipboardOnSuccess = entry->mode == ClipboardMode::Cut;
    transfer.clipboardGeneration = generation;
    transfer.operationId = m_tracker.begin(transfer.request.kind, entry->files.size());

    qDebug() << "Paste" << entry->files << "from" << entry->sourceDir << "to" << destinationDir;
    return transfer;
}

FileOperationsController::PendingTransfer
FileOperationsController::prepareDelete(const QStringList& names, const QString& sourceDir)
{
    PendingTransfer transfer;
    transfer.request.kind = TransferKind::Delete;
    transfer.request.sourceDir = sourceDir;
    transfer.request.names = names;
    transfer.operationId = m_tracker.begin(TransferKind::Delete, names.size());

    qDebug() << "Delete" << names << "in" << sourceDir;
    return transfer;
}

bool FileOperationsController::execute(const PendingTransfer& transfer)
{
    TransferExecutor executor(m_storage, m_tracker, m_settings.maxConflictAttempts);
    return executor.run(transfer.operationId, transfer.request);
}

bool FileOperationsController::paste(const QString& destinationDir)
{
    const auto transfer = preparePaste(destinationDir);
    if (!transfer)
        return false;

    const bool success = execute(*transfer);
    finish(*transfer, success);
    return success;
}

bool FileOperationsController::deleteEntries(const QStringList& names, const QString& sourceDir)
{
    if (names.isEmpty())
        return false;

    const PendingTransfer transfer = prepareDelete(names, sourceDir);
    const bool success = execute(transfer);
    finish(transfer, success);
    return success;
}

QString FileOperationsController::startPaste(const QString& destinationDir)
{
    const auto transfer = preparePaste(destinationDir);
    if (!transfer)
        return QString();
    return startWorker(*transfer);
}

QString FileOperationsController::startDelete(const QStringList& names, const QString& sourceDir)
{
    if (names.isEmpty())
        return QString();
    return startWorker(prepareDelete(names, sourceDir));
}

QString FileOperationsController::startWorker(const PendingTransfer& transfer)
{
    QThread* worker = QThread::create([this, transfer]() {
        const bool success = execute(transfer);
        QMetaObject::invokeMethod(this, [this, transfer, success]() { finish(transfer, success); },
                                  Qt::QueuedConnection);
    });
    connect(worker, &QThread::finished, worker, &QObject::deleteLater);

    m_workers.removeAll(QPointer<QThread>());
    m_workers.append(worker);
    worker->start();

    return transfer.operationId;
}

bool FileOperationsController::hasRunningWorkers() const
{
    for (const QPointer<QThread>& worker : m_workers) {
        if (worker && worker->isRunning())
            return true;
    }
    return false;
}

void FileOperationsController::finish(const PendingTransfer& transfer, bool success)
{
    const TransferRequest& request = transfer.request;
    const int count = request.names.size();

    if (success) {
        // A copy/cut made while the paste ran stays on the clipboard
        if (transfer.clearClipboardOnSuccess)
            m_clipboard.clearIfUnchanged(transfer.clipboardGeneration);

        QString title = tr("Operation Complete");
        QString message;
        switch (request.kind) {
            case TransferKind::Copy:
                message = count > 1 ? tr("Successfully copied %1 items").arg(count)
                                    : tr("Successfully copied 1 item");
                break;
            case TransferKind::Move:
                message = count > 1 ? tr("Successfully moved %1 items").arg(count)
                                    : tr("Successfully moved 1 item");
                break;
            case TransferKind::Delete:
                title = tr("Delete Complete");
                message = count > 1 ? tr("Successfully deleted %1 items").arg(count)
                                    : tr("Successfully deleted 1 item");
                break;
        }
        m_notifications.post(NotificationStatus::Success, title, message);
    } else {
        const auto op = m_tracker.operation(transfer.operationId);
        const QString reason = op ? op->error : QString();
        const QString title = request.kind == TransferKind::Delete ? tr("Delete Failed")
                                                                   : tr("Operation Failed");
        m_notifications.post(NotificationStatus::Error, title,
                             reason.isEmpty() ? tr("Failed to complete the operation") : reason);
    }

    // Partial work is committed even on failure, so listings are stale either way
    if (request.kind == TransferKind::Delete) {
        emit directoryChanged(request.sourceDir);
    } else {
        emit directoryChanged(request.destinationDir);
        if (request.kind == TransferKind::Move)
            emit directoryChanged(request.sourceDir);
    }

    emit operationFinished(transfer.operationId, success);
}

void FileOperationsController::cancelOperation(const QString& operationId)
{
    m_tracker.cancel(operationId);
}

bool FileOperationsController::acknowledge()
{
    return m_tracker.acknowledge();
}

template <typename Fn>
bool FileOperationsController::guarded(const QString& failureTitle, Fn&& fn)
{
    try {
        fn();
        return true;
    }
    catch (const ValidationError& e) {
        m_notifications.post(NotificationStatus::Warning, tr("Invalid Name"), e.message());
    }
    catch (const ProviderError& e) {
        qWarning() << failureTitle << ":" << e.message();
        m_notifications.post(NotificationStatus::Error, failureTitle, e.message());
    }
    return false;
}

bool FileOperationsController::createFile(const QString& dir, const QString& name)
{
    return guarded(tr("Create File Failed"), [&]() {
        FileOperations::createNewFile(m_storage, dir, name);
        emit directoryChanged(dir);
    });
}

bool FileOperationsController::createFolder(const QString& dir, const QString& name)
{
    return guarded(tr("Create Folder Failed"), [&]() {
        FileOperations::createNewFolder(m_storage, dir, name);
        emit directoryChanged(dir);
    });
}

bool FileOperationsController::renameEntry(const QString& dir, const QString& oldName,
                                           const QString& newName)
{
    return guarded(tr("Rename Failed"), [&]() {
        FileOperations::renameEntry(m_storage, dir, oldName, newName);
        emit directoryChanged(dir);
    });
}
