#ifndef SEARCHPROVIDER_H
#define SEARCHPROVIDER_H

#include "search/SearchTypes.h"

#include <QObject>

#include <memory>

// Live producer of one search request. Every signal carries the id of the
// request it belongs to. After cancel() the producer is told to stop and no
// further signal is emitted, whatever is still in flight.
class SearchSubscription : public QObject {
    Q_OBJECT

public:
    explicit SearchSubscription(const SearchRequest& request, QObject* parent = nullptr);

    const SearchRequest& request() const { return m_request; }
    quint64 requestId() const { return m_request.id; }

    bool isCancelled() const { return m_cancelled; }
    bool isFinished() const { return m_finished; }
    void cancel();

signals:
    void started(quint64 requestId, const QString& query);
    void resultFound(quint64 requestId, const SearchResult& result);
    void finished(quint64 requestId, int totalMatches, bool hasMore);
    void failed(quint64 requestId, const QString& message);

protected:
    // Implementations stop their producer here; called once, from cancel()
    virtual void stopProducer() = 0;

    void deliverStarted();
    void deliverResult(const SearchResult& result);
    void deliverFinished(int totalMatches, bool hasMore);
    void deliverFailed(const QString& message);

private:
    SearchRequest m_request;
    bool m_cancelled = false;
    bool m_finished = false;
};

class SearchProvider {
public:
    virtual ~SearchProvider() = default;

    // Starts producing immediately. Destroying the subscription cancels it.
    virtual std::unique_ptr<SearchSubscription> startSearch(const SearchRequest& request) = 0;
};

#endif // SEARCHPROVIDER_H
