#include "transfer/ConflictResolver.h"
#include "storage/StorageProvider.h"
#include "Errors.h"
#include "PathUtils.h"

#include <QDebug>
#include <QObject>

ConflictResolver::ConflictResolver(StorageProvider& storage, int maxAttempts)
    : m_storage(storage)
    , m_maxAttempts(maxAttempts > 0 ? maxAttempts : DefaultMaxAttempts)
{
}

QString ConflictResolver::candidateName(const QString& name, bool isDirectory, int n, Style style)
{
    const auto [base, ext] = splitFileName(name, isDirectory);

    QString suffix;
    if (style == Style::SameDirectoryCopy)
        suffix = n == 1 ? QStringLiteral("Copy") : QStringLiteral("Copy %1").arg(n);
    else
        suffix = QString::number(n);

    return QStringLiteral("%1 (%2)%3").arg(base, suffix, ext);
}

QString ConflictResolver::resolve(const QString& desiredPath, bool isDirectory, Style style) const
{
    // A same-directory copy always collides with its own source
    if (style == Style::Numbered && !m_storage.exists(desiredPath))
        return desiredPath;

    const QString dir = parentPath(desiredPath);
    const QString name = fileNameOf(desiredPath);

    for (int n = 1; n <= m_maxAttempts; ++n) {
        const QString candidate = joinPath(dir, candidateName(name, isDirectory, n, style));
        if (!m_storage.exists(candidate)) {
            qDebug() << "Name conflict:" << desiredPath << "->" << candidate;
            return candidate;
        }
    }

    throw ConflictExhaustedError(
        QObject::tr("No free name for '%1' after %2 attempts").arg(name).arg(m_maxAttempts));
}
