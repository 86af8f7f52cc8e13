#include "transfer/TransferOperationTracker.h"
#include "transfer/NotificationCenter.h"

#include <QDebug>
#include <QMutexLocker>
#include <QUuid>

#include <algorithm>

TransferOperationTracker::TransferOperationTracker(NotificationCenter* notifications, QObject* parent)
    : QObject(parent)
    , m_notifications(notifications)
{
}

TransferOperationTracker::Record* TransferOperationTracker::findLocked(const QString& id)
{
    for (Record& r : m_records)
        if (r.op.id == id)
            return &r;
    return nullptr;
}

const TransferOperationTracker::Record* TransferOperationTracker::findLocked(const QString& id) const
{
    for (const Record& r : m_records)
        if (r.op.id == id)
            return &r;
    return nullptr;
}

QString TransferOperationTracker::begin(TransferKind kind, int totalItems)
{
    Record record;
    record.op.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    record.op.kind = kind;
    record.op.status = TransferStatus::Pending;
    record.op.totalItems = std::max(totalItems, 0);
    record.op.processedItems = 0;

    const QString id = record.op.id;
    {
        QMutexLocker lock(&m_mutex);
        m_records.append(record);
    }
    qDebug() << "Operation" << id << toString(kind) << "started," << totalItems << "item(s)";
    emit operationsChanged();
    return id;
}

void TransferOperationTracker::advance(const QString& id, int processedItems, const QString& currentFile)
{
    {
        QMutexLocker lock(&m_mutex);
        Record* r = findLocked(id);
        if (!r) {
            qWarning() << "advance: unknown operation" << id;
            return;
        }
        if (!r->op.isActive())
            return;

        r->op.status = TransferStatus::InProgress;
        r->op.processedItems = std::clamp(processedItems, r->op.processedItems, r->op.totalItems);
        r->op.currentFile = currentFile;
    }
    emit operationsChanged();
}

void TransferOperationTracker::complete(const QString& id)
{
    {
        QMutexLocker lock(&m_mutex);
        Record* r = findLocked(id);
        if (!r) {
            qWarning() << "complete: unknown operation" << id;
            return;
        }
        if (!r->op.isActive())
            return;

        r->op.status = TransferStatus::Completed;
        r->op.processedItems = r->op.totalItems;
        r->op.currentFile.clear();
    }
    emit operationsChanged();
}

void TransferOperationTracker::fail(const QString& id, const QString& message)
{
    {
        QMutexLocker lock(&m_mutex);
        Record* r = findLocked(id);
        if (!r) {
            qWarning() << "fail: unknown operation" << id;
            return;
        }
        if (!r->op.isActive())
            return;

        r->op.status = TransferStatus::Error;
        r->op.error = message;
    }
    qWarning() << "Operation" << id << "failed:" << message;
    emit operationsChanged();
}

void TransferOperationTracker::cancel(const QString& id)
{
    {
        QMutexLocker lock(&m_mutex);
        Record* r = findLocked(id);
        if (!r || !r->op.isActive())
            return;

        r->token.cancel();
        r->op.status = TransferStatus::Error;
        r->op.error = tr("Operation cancelled");
    }
    qDebug() << "Operation" << id << "cancelled";
    emit operationsChanged();
}

bool TransferOperationTracker::acknowledge()
{
    int completed = 0;
    {
        QMutexLocker lock(&m_mutex);
        const bool active = std::any_of(m_records.cbegin(), m_records.cend(),
                                        [](const Record& r) { return r.op.isActive(); });
        if (active)
            return false;

        completed = static_cast<int>(std::count_if(
            m_records.cbegin(), m_records.cend(),
            [](const Record& r) { return r.op.status == TransferStatus::Completed; }));
        m_records.clear();
    }
    emit operationsChanged();

    if (completed > 0 && m_notifications) {
        m_notifications->post(NotificationStatus::Success, tr("Operation Complete"),
                              completed > 1
                                  ? tr("Successfully completed %1 file operations").arg(completed)
                                  : tr("Successfully completed 1 file operation"));
    }
    return true;
}

CancellationToken TransferOperationTracker::token(const QString& id) const
{
    QMutexLocker lock(&m_mutex);
    if (const Record* r = findLocked(id))
        return r->token;

    // Unknown ids get an already tripped token so nothing runs for them
    CancellationToken dead;
    dead.cancel();
    return dead;
}

QVector<TransferOperation> TransferOperationTracker::operations() const
{
    QMutexLocker lock(&m_mutex);
    QVector<TransferOperation> ops;
    ops.reserve(m_records.size());
    for (const Record& r : m_records)
        ops.append(r.op);
    return ops;
}

std::optional<TransferOperation> TransferOperationTracker::operation(const QString& id) const
{
    QMutexLocker lock(&m_mutex);
    if (const Record* r = findLocked(id))
        return r->op;
    return std::nullopt;
}

bool TransferOperationTracker::hasActiveOperations() const
{
    QMutexLocker lock(&m_mutex);
    return std::any_of(m_records.cbegin(), m_records.cend(),
                       [](const Record& r) { return r.op.isActive(); });
}
