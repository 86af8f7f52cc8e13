#ifndef LOCALSTORAGEPROVIDER_H
#define LOCALSTORAGEPROVIDER_H

#include "storage/StorageProvider.h"

#include <string>

// StorageProvider bound to the local filesystem through QFile/QDir.
// Files are copied into a ".part" sibling and renamed into place, so an
// interrupted copy never leaves a partial file under the final name.
class LocalStorageProvider : public StorageProvider {
public:
    struct Options {
        bool verifyCopies = false;          // compare digests before committing a copy
        std::string hashAlgorithm = "SHA-256";
        bool preserveTimestamps = true;
    };

    LocalStorageProvider() = default;
    explicit LocalStorageProvider(Options options);

    QVector<DirEntry> readDir(const QString& path) override;
    FileStat stat(const QString& path) override;
    bool exists(const QString& path) override;
    void copyFile(const QString& src, const QString& dst,
                  const CancellationToken& token) override;
    void remove(const QString& path, bool recursive,
                const CancellationToken& token) override;
    void mkdir(const QString& path) override;
    void writeEmptyFile(const QString& path) override;
    void rename(const QString& src, const QString& dst) override;
    QString canonicalPath(const QString& path) override;

    const Options& options() const { return m_options; }

private:
    void removeTree(const QString& path, const CancellationToken& token);

    Options m_options;
};

// Copy access/modification times and flush the copy to disk
void finalizeCopiedFile(const QString& srcPath, const QString& dstPath);

#endif // LOCALSTORAGEPROVIDER_H
