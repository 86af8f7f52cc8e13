#include "storage/StorageProvider.h"
#include "PathUtils.h"

#include <QDir>

void StorageProvider::copyRecursive(const QString& src, const QString& dst,
                                    const CancellationToken& token)
{
    token.throwIfCancelled();

    if (!stat(src).isDirectory) {
        copyFile(src, dst, token);
        return;
    }

    // List before creating dst, in case dst lies inside src
    const QVector<DirEntry> entries = readDir(src);
    mkdir(dst);
    for (const DirEntry& entry : entries) {
        token.throwIfCancelled();
        copyRecursive(joinPath(src, entry.name), joinPath(dst, entry.name), token);
    }
}

bool StorageProvider::isDirectory(const QString& path)
{
    return exists(path) && stat(path).isDirectory;
}

QString StorageProvider::canonicalPath(const QString& path)
{
    return QDir::cleanPath(path);
}
