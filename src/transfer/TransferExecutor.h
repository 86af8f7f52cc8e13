#ifndef TRANSFEREXECUTOR_H
#define TRANSFEREXECUTOR_H

#include "transfer/ConflictResolver.h"
#include "transfer/TransferOperation.h"
#include "storage/CancellationToken.h"

#include <QString>
#include <QStringList>

class StorageProvider;
class TransferOperationTracker;

struct TransferRequest {
    TransferKind kind = TransferKind::Copy;
    QString sourceDir;
    QStringList names;
    QString destinationDir;    // unused for Delete
};

// Runs one tracked operation item by item, strictly in sequence.
// The first failure stops the loop: items already done stay committed, the
// record goes to error and nothing further is attempted. For moves the source
// is removed only after its copy succeeded.
class TransferExecutor {
public:
    TransferExecutor(StorageProvider& storage, TransferOperationTracker& tracker,
                     int maxConflictAttempts = ConflictResolver::DefaultMaxAttempts);

    // Returns true if the operation reached completed
    bool run(const QString& operationId, const TransferRequest& request);

private:
    void transferItem(const TransferRequest& request, const QString& name,
                      const ConflictResolver& resolver, const CancellationToken& token);

    StorageProvider& m_storage;
    TransferOperationTracker& m_tracker;
    int m_maxConflictAttempts;
};

#endif // TRANSFEREXECUTOR_H
