#include "transfer/TransferExecutor.h"
#include "transfer/TransferOperationTracker.h"
#include "storage/StorageProvider.h"
#include "Errors.h"
#include "PathUtils.h"

#include <QDebug>
#include <QObject>

namespace {

QString failureMessage(TransferKind kind, const QString& name, const QString& reason)
{
    switch (kind) {
        case TransferKind::Copy:
            return QObject::tr("Failed to copy '%1': %2").arg(name, reason);
        case TransferKind::Move:
            return QObject::tr("Failed to move '%1': %2").arg(name, reason);
        case TransferKind::Delete:
            return QObject::tr("Failed to delete '%1': %2").arg(name, reason);
    }
    return reason;
}

} // anonymous namespace

TransferExecutor::TransferExecutor(StorageProvider& storage, TransferOperationTracker& tracker,
                                   int maxConflictAttempts)
    : m_storage(storage)
    , m_tracker(tracker)
    , m_maxConflictAttempts(maxConflictAttempts)
{
}

bool TransferExecutor::run(const QString& operationId, const TransferRequest& request)
{
    const CancellationToken token = m_tracker.token(operationId);
    const ConflictResolver resolver(m_storage, m_maxConflictAttempts);

    for (int index = 0; index < request.names.size(); ++index) {
        const QString& name = request.names.at(index);

        // cancel() already moved the record to error
        if (token.isCancelled())
            return false;

        m_tracker.advance(operationId, index, name);

        try {
            transferItem(request, name, resolver, token);
        }
        catch (const CancelledError&) {
            m_tracker.fail(operationId, QObject::tr("Operation cancelled"));
            return false;
        }
        catch (const ProviderError& e) {
            m_tracker.fail(operationId, failureMessage(request.kind, name, e.message()));
            return false;
        }
        catch (const std::exception& e) {
            m_tracker.fail(operationId, failureMessage(request.kind, name, QString::fromUtf8(e.what())));
            return false;
        }
    }

    if (token.isCancelled())
        return false;

    m_tracker.complete(operationId);
    return true;
}

void TransferExecutor::transferItem(const TransferRequest& request, const QString& name,
                                    const ConflictResolver& resolver, const CancellationToken& token)
{
    const QString srcPath = joinPath(request.sourceDir, name);

    if (request.kind == TransferKind::Delete) {
        m_storage.remove(srcPath, /*recursive=*/true, token);
        qDebug() << "Deleted" << srcPath;
        return;
    }

    const bool isDir = m_storage.stat(srcPath).isDirectory;
    const QString canonicalSourceDir = m_storage.canonicalPath(request.sourceDir);
    const QString canonicalDestination = m_storage.canonicalPath(request.destinationDir);
    const bool sameDir = isSamePath(canonicalSourceDir, canonicalDestination);

    // Moving into the directory it already lives in changes nothing
    if (request.kind == TransferKind::Move && sameDir) {
        qDebug() << "Skipping move of" << srcPath << "onto itself";
        return;
    }

    // Compared with links resolved, so a link pointing into the source is caught
    if (isDir && isSameOrDescendant(m_storage.canonicalPath(srcPath), canonicalDestination))
        throw ProviderError(QObject::tr("Cannot copy a directory into itself"));

    const auto style = sameDir ? ConflictResolver::Style::SameDirectoryCopy
                               : ConflictResolver::Style::Numbered;
    const QString desiredPath = joinPath(request.destinationDir, name);

    // Another writer may take the resolved name before the copy lands
    // there; pick a new name once in that case.
    QString dstPath = resolver.resolve(desiredPath, isDir, style);
    try {
        m_storage.copyRecursive(srcPath, dstPath, token);
    } catch (const AlreadyExistsError& e) {
        if (e.path() != dstPath)
            throw;
        qDebug() << dstPath << "was taken during the copy, resolving again";
        dstPath = resolver.resolve(desiredPath, isDir, style);
        m_storage.copyRecursive(srcPath, dstPath, token);
    }
    qDebug() << "Copied" << srcPath << "->" << dstPath;

    if (request.kind == TransferKind::Move) {
        // copyRecursive threw on any failure, so the copy is complete here
        m_storage.remove(srcPath, /*recursive=*/true, token);
        qDebug() << "Removed source" << srcPath;
    }
}
