#pragma once

#include "storage/CancellationToken.h"

#include <QDir>
#include <QFileInfo>
#include <QQueue>
#include <QSet>

#include <optional>

// Level-order walk below a root directory: all entries of the root first,
// then those of its subdirectories, and so on. Shallow matches therefore
// surface before deep ones. Entries of one directory come in name order.
// The root itself is not reported.
class DirectoryWalker {
public:
    enum class Options {
        None = 0,
        FollowSymlinks = 1 << 0,     // Descend into symbolic links to directories
        DetectCycles = 1 << 1        // Never enter the same canonical directory twice
    };

    friend inline Options operator|(Options a, Options b) {
        return static_cast<Options>(static_cast<int>(a) | static_cast<int>(b));
    }
    friend inline bool hasFlag(Options options, Options flag) {
        return (static_cast<int>(options) & static_cast<int>(flag)) == static_cast<int>(flag);
    }

    DirectoryWalker(const QString& rootPath, Options options, CancellationToken token = {});

    // Next entry, or nullopt when the walk is exhausted or cancelled
    std::optional<QFileInfo> next();

    int directoriesVisited() const { return m_directoriesVisited; }

private:
    bool loadNextDirectory();
    void enqueue(const QFileInfo& dir);

    Options m_options;
    CancellationToken m_token;
    QQueue<QString> m_pendingDirs;
    QSet<QString> m_visited;          // canonical paths, DetectCycles only
    QFileInfoList m_entries;
    int m_index = 0;
    int m_directoriesVisited = 0;
};
