#ifndef LOCALSEARCHPROVIDER_H
#define LOCALSEARCHPROVIDER_H

#include "search/SearchProvider.h"
#include "search/SearchWorker.h"

#include <QPointer>

class QThread;

// Runs one SearchWorker on its own QThread per request.
// Cancelling the subscription trips the worker's token, so the walk stops
// at the next entry instead of running to the end.
class LocalSearchSubscription : public SearchSubscription {
    Q_OBJECT

public:
    LocalSearchSubscription(const SearchRequest& request, const SearchCriteria& criteria,
                            QObject* parent = nullptr);
    ~LocalSearchSubscription() override;

protected:
    void stopProducer() override;

private:
    void onBatch(const QVector<SearchResult>& batch);

    CancellationToken m_token;
    QPointer<QThread> m_thread;
};

class LocalSearchProvider : public SearchProvider {
public:
    struct Settings {
        int maxResults = 100;
        int batchSize = 20;
        bool followSymlinks = true;
    };

    LocalSearchProvider();
    explicit LocalSearchProvider(const Settings& settings);

    std::unique_ptr<SearchSubscription> startSearch(const SearchRequest& request) override;

private:
    Settings m_settings;
};

#endif // LOCALSEARCHPROVIDER_H
