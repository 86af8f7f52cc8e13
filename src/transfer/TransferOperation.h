#pragma once

#include <QMetaType>
#include <QString>

enum class TransferKind { Copy, Move, Delete };

enum class TransferStatus { Pending, InProgress, Completed, Error };

// Progress record of one copy/move/delete, as shown by the progress surface.
// currentFile and error are empty when unset.
struct TransferOperation {
    QString id;
    TransferKind kind = TransferKind::Copy;
    TransferStatus status = TransferStatus::Pending;
    int totalItems = 0;
    int processedItems = 0;
    QString currentFile;
    QString error;

    bool isActive() const
    {
        return status == TransferStatus::Pending || status == TransferStatus::InProgress;
    }
};

QString toString(TransferKind kind);
QString toString(TransferStatus status);

Q_DECLARE_METATYPE(TransferOperation)
