#include "transfer/TransferOperation.h"

QString toString(TransferKind kind)
{
    switch (kind) {
        case TransferKind::Copy:   return QStringLiteral("copy");
        case TransferKind::Move:   return QStringLiteral("move");
        case TransferKind::Delete: return QStringLiteral("delete");
    }
    return QString();
}

QString toString(TransferStatus status)
{
    switch (status) {
        case TransferStatus::Pending:    return QStringLiteral("pending");
        case TransferStatus::InProgress: return QStringLiteral("in_progress");
        case TransferStatus::Completed:  return QStringLiteral("completed");
        case TransferStatus::Error:      return QStringLiteral("error");
    }
    return QString();
}
