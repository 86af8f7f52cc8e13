#ifndef TRANSFEROPERATIONTRACKER_H
#define TRANSFEROPERATIONTRACKER_H

#include "transfer/TransferOperation.h"
#include "storage/CancellationToken.h"

#include <QMutex>
#include <QObject>
#include <QVector>

#include <optional>

class NotificationCenter;

// Owns the live list of TransferOperation records.
// Lifecycle: pending -> in_progress -> {completed, error}. Terminal states are
// final: later advance/complete/fail calls on the same id are ignored.
// Records are removed only by acknowledge(). Thread-safe.
class TransferOperationTracker : public QObject {
    Q_OBJECT

public:
    explicit TransferOperationTracker(NotificationCenter* notifications = nullptr,
                                      QObject* parent = nullptr);

    QString begin(TransferKind kind, int totalItems);
    void advance(const QString& id, int processedItems, const QString& currentFile);
    void complete(const QString& id);
    void fail(const QString& id, const QString& message);

    // Marks the operation as failed and trips its token. The executor stops
    // at its next check; a provider call already running is not interrupted
    // unless it polls the token itself.
    void cancel(const QString& id);

    // Clears every record once none is pending/in_progress.
    // Returns false (and keeps everything) while work is still active.
    bool acknowledge();

    CancellationToken token(const QString& id) const;
    QVector<TransferOperation> operations() const;
    std::optional<TransferOperation> operation(const QString& id) const;
    bool hasActiveOperations() const;

signals:
    void operationsChanged();

private:
    struct Record {
        TransferOperation op;
        CancellationToken token;
    };

    Record* findLocked(const QString& id);
    const Record* findLocked(const QString& id) const;

    mutable QMutex m_mutex;
    QVector<Record> m_records;
    NotificationCenter* m_notifications;
};

#endif // TRANSFEROPERATIONTRACKER_H
