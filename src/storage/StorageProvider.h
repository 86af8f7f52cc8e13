#ifndef STORAGEPROVIDER_H
#define STORAGEPROVIDER_H

#include "storage/CancellationToken.h"

#include <QDateTime>
#include <QString>
#include <QVector>

struct DirEntry {
    QString name;
    bool isDirectory = false;
};

struct FileStat {
    qint64 size = 0;
    QDateTime modifiedTime;
    QDateTime createdTime;
    bool isDirectory = false;
};

// Storage capabilities the transfer engine consumes.
// Every failure is reported by throwing ProviderError (NotFoundError when
// the path is absent). Calls that may take long accept a cancellation token
// and check it per file.
class StorageProvider {
public:
    virtual ~StorageProvider() = default;

    virtual QVector<DirEntry> readDir(const QString& path) = 0;
    virtual FileStat stat(const QString& path) = 0;
    virtual bool exists(const QString& path) = 0;

    // Never overwrites: throws AlreadyExistsError if dst is occupied
    virtual void copyFile(const QString& src, const QString& dst,
                          const CancellationToken& token) = 0;

    virtual void remove(const QString& path, bool recursive,
                        const CancellationToken& token) = 0;

    // Throw AlreadyExistsError if the target is already occupied
    virtual void mkdir(const QString& path) = 0;
    virtual void writeEmptyFile(const QString& path) = 0;
    virtual void rename(const QString& src, const QString& dst) = 0;

    // Copy a file, or a directory tree, to dst.
    // Default implementation walks the tree with readDir/mkdir/copyFile.
    virtual void copyRecursive(const QString& src, const QString& dst,
                               const CancellationToken& token);

    virtual bool isDirectory(const QString& path);

    // Path with symbolic links resolved, used to compare locations.
    // Default implementation only cleans the string.
    virtual QString canonicalPath(const QString& path);
};

#endif // STORAGEPROVIDER_H
