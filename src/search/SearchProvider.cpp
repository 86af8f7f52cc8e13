#include "search/SearchProvider.h"

SearchSubscription::SearchSubscription(const SearchRequest& request, QObject* parent)
    : QObject(parent)
    , m_request(request)
{
}

void SearchSubscription::cancel()
{
    if (m_cancelled)
        return;
    m_cancelled = true;
    if (!m_finished)
        stopProducer();
}

void SearchSubscription::deliverStarted()
{
    if (m_cancelled || m_finished)
        return;
    emit started(m_request.id, m_request.query);
}

void SearchSubscription::deliverResult(const SearchResult& result)
{
    if (m_cancelled || m_finished)
        return;
    emit resultFound(m_request.id, result);
}

void SearchSubscription::deliverFinished(int totalMatches, bool hasMore)
{
    if (m_cancelled || m_finished)
        return;
    m_finished = true;
    emit finished(m_request.id, totalMatches, hasMore);
}

void SearchSubscription::deliverFailed(const QString& message)
{
    if (m_cancelled || m_finished)
        return;
    m_finished = true;
    emit failed(m_request.id, message);
}
