#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QVector>

struct SearchRequest {
    quint64 id = 0;         // monotonic, highest id is the current request
    QString query;
    QString path;
    int skip = 0;           // matches already delivered (load more)
};

struct SearchResult {
    QString path;
    QString name;
    bool isFile = false;
    qint64 size = 0;
    QDateTime modifiedTime;
};

struct SearchSessionState {
    QVector<SearchResult> results;   // arrival order
    int totalMatches = 0;
    bool hasMore = false;
    bool isSearching = false;
};

Q_DECLARE_METATYPE(SearchResult)
