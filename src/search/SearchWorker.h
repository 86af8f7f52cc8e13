#pragma once

#include "search/SearchTypes.h"
#include "storage/CancellationToken.h"

#include <QObject>
#include <QString>
#include <QVector>

struct SearchCriteria {
    QString searchPath;
    QString query;                 // case-insensitive substring of the entry name
    int skip = 0;                  // matches to pass over before reporting
    int maxResults = 100;          // reported matches per request
    int batchSize = 20;            // matches per resultsReady signal
    bool followSymlinks = true;
};

// Walks searchPath on a worker thread and reports matching entries in
// batches. Stops at maxResults; hasMore tells whether another match exists.
class SearchWorker : public QObject {
    Q_OBJECT

public:
    SearchWorker(const SearchCriteria& criteria, CancellationToken token, QObject* parent = nullptr);

public slots:
    void startSearch();
    void stopSearch();

signals:
    void resultsReady(const QVector<SearchResult>& batch);
    void searchFinished(int totalMatches, bool hasMore);
    void searchFailed(const QString& message);

private:
    bool matchesName(const QString& fileName) const;

    SearchCriteria m_criteria;
    CancellationToken m_token;
};
