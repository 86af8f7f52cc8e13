#include "search/DirectoryWalker.h"

#include <QDebug>

DirectoryWalker::DirectoryWalker(const QString& rootPath, Options options, CancellationToken token)
    : m_options(options)
    , m_token(std::move(token))
{
    QFileInfo root(rootPath);
    if (root.isDir())
        enqueue(root);
}

void DirectoryWalker::enqueue(const QFileInfo& dir)
{
    if (hasFlag(m_options, Options::DetectCycles)) {
        const QString canonical = dir.canonicalFilePath();
        if (canonical.isEmpty() || m_visited.contains(canonical))
            return;  // unresolvable or already seen
        m_visited.insert(canonical);
    }
    m_pendingDirs.enqueue(dir.absoluteFilePath());
}

bool DirectoryWalker::loadNextDirectory()
{
    while (!m_pendingDirs.isEmpty()) {
        if (m_token.isCancelled())
            return false;

        const QString path = m_pendingDirs.dequeue();
        QDir dir(path);
        if (!dir.isReadable()) {
            qDebug() << "Skipping unreadable directory" << path;
            continue;
        }

        m_entries = dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                                      QDir::Name);
        m_index = 0;
        ++m_directoriesVisited;

        if (!m_entries.isEmpty())
            return true;
    }
    return false;
}

std::optional<QFileInfo> DirectoryWalker::next()
{
    if (m_token.isCancelled())
        return std::nullopt;

    if (m_index >= m_entries.size() && !loadNextDirectory())
        return std::nullopt;

    const QFileInfo fi = m_entries.at(m_index++);
    if (fi.isDir()) {
        const bool shouldEnter = !fi.isSymLink() || hasFlag(m_options, Options::FollowSymlinks);
        if (shouldEnter)
            enqueue(fi);
    }
    return fi;
}
