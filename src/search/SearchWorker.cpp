#include "search/SearchWorker.h"
#include "search/DirectoryWalker.h"

#include <QDebug>
#include <QFileInfo>

#include <algorithm>

SearchWorker::SearchWorker(const SearchCriteria& criteria, CancellationToken token, QObject* parent)
    : QObject(parent)
    , m_criteria(criteria)
    , m_token(std::move(token))
{
    m_criteria.skip = std::max(m_criteria.skip, 0);
    m_criteria.maxResults = std::max(m_criteria.maxResults, 1);
    m_criteria.batchSize = std::max(m_criteria.batchSize, 1);
}

void SearchWorker::startSearch()
{
    QFileInfo root(m_criteria.searchPath);
    if (!root.exists() || !root.isDir()) {
        emit searchFailed(tr("'%1' is not a directory").arg(m_criteria.searchPath));
        return;
    }

    auto options = DirectoryWalker::Options::DetectCycles;
    if (m_criteria.followSymlinks)
        options = options | DirectoryWalker::Options::FollowSymlinks;

    DirectoryWalker walker(m_criteria.searchPath, options, m_token);

    QVector<SearchResult> batch;
    batch.reserve(m_criteria.batchSize);

    int matches = 0;      // including skipped ones
    int reported = 0;
    bool hasMore = false;

    while (auto info = walker.next()) {
        if (!matchesName(info->fileName()))
            continue;

        ++matches;
        if (matches <= m_criteria.skip)
            continue;

        // One match past the limit is enough to know there is more
        if (reported >= m_criteria.maxResults) {
            hasMore = true;
            break;
        }

        SearchResult result;
        result.path = info->absoluteFilePath();
        result.name = info->fileName();
        result.isFile = info->isFile();
        result.size = info->isFile() ? info->size() : 0;
        result.modifiedTime = info->lastModified();
        batch.append(result);
        ++reported;

        if (batch.size() >= m_criteria.batchSize) {
            emit resultsReady(batch);
            batch.clear();
        }
    }

    if (m_token.isCancelled()) {
        qDebug() << "Search for" << m_criteria.query << "stopped after"
                 << walker.directoriesVisited() << "directories";
        return;
    }

    if (!batch.isEmpty())
        emit resultsReady(batch);

    // The extra match that set hasMore was not reported
    emit searchFinished(hasMore ? matches - 1 : matches, hasMore);
}

void SearchWorker::stopSearch()
{
    m_token.cancel();
}

bool SearchWorker::matchesName(const QString& fileName) const
{
    return fileName.contains(m_criteria.query, Qt::CaseInsensitive);
}
