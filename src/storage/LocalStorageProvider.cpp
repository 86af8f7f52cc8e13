#include "storage/LocalStorageProvider.h"
#include "PathUtils.h"
#include "fileutils.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace {

// Dangling symlinks still occupy their name
bool occupied(const QFileInfo& info)
{
    return info.exists() || info.isSymLink();
}

} // anonymous namespace

LocalStorageProvider::LocalStorageProvider(Options options)
    : m_options(std::move(options))
{
}

QVector<DirEntry> LocalStorageProvider::readDir(const QString& path)
{
    QFileInfo info(path);
    if (!info.exists())
        throw NotFoundError(QObject::tr("'%1' does not exist").arg(path));
    if (!info.isDir())
        throw ProviderError(QObject::tr("'%1' is not a directory").arg(path));

    QDir dir(path);
    if (!dir.isReadable())
        throw ProviderError(QObject::tr("Cannot read directory '%1'").arg(path));

    const QFileInfoList list = dir.entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
        QDir::Name);

    QVector<DirEntry> entries;
    entries.reserve(list.size());
    for (const QFileInfo& fi : list)
        entries.append({fi.fileName(), fi.isDir() && !fi.isSymLink()});
    return entries;
}

FileStat LocalStorageProvider::stat(const QString& path)
{
    QFileInfo info(path);
    if (!occupied(info))
        throw NotFoundError(QObject::tr("'%1' does not exist").arg(path));

    FileStat st;
    st.size = info.size();
    st.modifiedTime = info.lastModified();
    st.createdTime = info.birthTime();
    st.isDirectory = info.isDir() && !info.isSymLink();
    return st;
}

bool LocalStorageProvider::exists(const QString& path)
{
    return occupied(QFileInfo(path));
}

void LocalStorageProvider::copyFile(const QString& src, const QString& dst,
                                    const CancellationToken& token)
{
    token.throwIfCancelled();

    QFileInfo srcInfo(src);
    if (!srcInfo.exists())
        throw NotFoundError(QObject::tr("'%1' does not exist").arg(src));
    if (exists(dst))
        throw AlreadyExistsError(QObject::tr("'%1' already exists").arg(dst), dst);

    const QString partPath = QString::fromStdString(
        fileutils::makeTempPartPath(dst.toStdString(), /*pathIsDir=*/false));

    if (!QFile::copy(src, partPath)) {
        QFile::remove(partPath);
        throw ProviderError(QObject::tr("Failed to copy:\n%1\nto\n%2").arg(src, dst));
    }

    if (m_options.verifyCopies) {
        bool same = false;
        try {
            same = fileutils::files_have_same_hash(src.toStdString(), partPath.toStdString(),
                                                   m_options.hashAlgorithm);
        } catch (const std::exception& e) {
            QFile::remove(partPath);
            throw ProviderError(QObject::tr("Cannot verify copy of '%1': %2")
                                    .arg(src, QString::fromUtf8(e.what())));
        }
        if (!same) {
            QFile::remove(partPath);
            throw ProviderError(QObject::tr("Copy of '%1' does not match its source").arg(src));
        }
    }

    if (m_options.preserveTimestamps)
        finalizeCopiedFile(src, partPath);

    if (token.isCancelled()) {
        QFile::remove(partPath);
        token.throwIfCancelled();
    }

    // rename() refuses to overwrite, so a racing writer at dst wins
    if (!QFile::rename(partPath, dst)) {
        QFile::remove(partPath);
        if (exists(dst))
            throw AlreadyExistsError(QObject::tr("'%1' already exists").arg(dst), dst);
        throw ProviderError(QObject::tr("Failed to copy:\n%1\nto\n%2").arg(src, dst));
    }
}

void LocalStorageProvider::remove(const QString& path, bool recursive,
                                  const CancellationToken& token)
{
    token.throwIfCancelled();

    QFileInfo info(path);
    if (!occupied(info))
        throw NotFoundError(QObject::tr("'%1' does not exist").arg(path));

    if (info.isDir() && !info.isSymLink()) {
        if (recursive) {
            removeTree(path, token);
            return;
        }
        if (!QDir().rmdir(path))
            throw ProviderError(QObject::tr("Failed to remove directory '%1'").arg(path));
        return;
    }

    if (!QFile::remove(path))
        throw ProviderError(QObject::tr("Failed to delete '%1'").arg(path));
}

void LocalStorageProvider::removeTree(const QString& path, const CancellationToken& token)
{
    const QVector<DirEntry> entries = readDir(path);
    for (const DirEntry& entry : entries) {
        token.throwIfCancelled();

        const QString child = joinPath(path, entry.name);
        if (entry.isDirectory) {
            removeTree(child, token);
        } else if (!QFile::remove(child)) {
            throw ProviderError(QObject::tr("Failed to delete '%1'").arg(child));
        }
    }

    if (!QDir().rmdir(path))
        throw ProviderError(QObject::tr("Failed to remove directory '%1'").arg(path));
}

void LocalStorageProvider::mkdir(const QString& path)
{
    if (exists(path))
        throw AlreadyExistsError(QObject::tr("'%1' already exists").arg(path), path);
    if (!QDir().mkdir(path))
        throw ProviderError(QObject::tr("Failed to create directory:\n%1").arg(path));
}

void LocalStorageProvider::writeEmptyFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
        if (exists(path))
            throw AlreadyExistsError(QObject::tr("'%1' already exists").arg(path), path);
        throw ProviderError(QObject::tr("Failed to create '%1': %2").arg(path, file.errorString()));
    }
    file.close();
}

void LocalStorageProvider::rename(const QString& src, const QString& dst)
{
    if (!exists(src))
        throw NotFoundError(QObject::tr("'%1' does not exist").arg(src));
    if (exists(dst))
        throw AlreadyExistsError(QObject::tr("'%1' already exists").arg(dst), dst);
    if (!QDir().rename(src, dst))
        throw ProviderError(QObject::tr("Failed to rename:\n%1\nto\n%2").arg(src, dst));
}

QString LocalStorageProvider::canonicalPath(const QString& path)
{
    // Missing paths have no canonical form
    const QString canonical = QFileInfo(path).canonicalFilePath();
    return canonical.isEmpty() ? QDir::cleanPath(QFileInfo(path).absoluteFilePath()) : canonical;
}

void finalizeCopiedFile(const QString& srcPath, const QString& dstPath)
{
    const QByteArray src = QFile::encodeName(srcPath);
    const QByteArray dst = QFile::encodeName(dstPath);

    struct stat srcStat;
    if (::stat(src.constData(), &srcStat) == 0) {
        struct timespec times[2];
        times[0] = srcStat.st_atim;  // access time
        times[1] = srcStat.st_mtim;  // modification time
        if (utimensat(AT_FDCWD, dst.constData(), times, 0) != 0)
            qDebug() << "Could not copy timestamps to" << dstPath;
    }

    // Sync file to disk (important for USB drives to prevent data loss)
    int fd = open(dst.constData(), O_RDONLY);
    if (fd >= 0) {
        fsync(fd);
        close(fd);
    }
}
