#include "search/SearchSession.h"

#include <QDebug>

SearchSession::SearchSession(SearchProvider& provider, QObject* parent)
    : QObject(parent)
    , m_provider(provider)
{
    m_debounceTimer.setSingleShot(true);
    m_debounceTimer.setInterval(DefaultDebounceMs);
    connect(&m_debounceTimer, &QTimer::timeout, this, &SearchSession::issueRequest);
}

SearchSession::~SearchSession()
{
    dropSubscription();
}

void SearchSession::setDebounceInterval(int ms)
{
    m_debounceTimer.setInterval(ms >= 0 ? ms : DefaultDebounceMs);
}

void SearchSession::setPath(const QString& path)
{
    if (path == m_path)
        return;
    m_path = path;
    clear();
}

void SearchSession::setQuery(const QString& query)
{
    m_query = query;

    if (query.isEmpty()) {
        clear();
        return;
    }

    m_phase = Phase::Debouncing;
    m_debounceTimer.start();
}

void SearchSession::clear()
{
    m_debounceTimer.stop();
    m_query.clear();
    dropSubscription();
    m_state = SearchSessionState();
    m_phase = Phase::Idle;
    emit stateChanged();
}

void SearchSession::dropSubscription()
{
    if (!m_subscription)
        return;
    m_subscription->disconnect(this);
    m_subscription->cancel();
    m_subscription.reset();
}

void SearchSession::issueRequest()
{
    if (m_query.isEmpty()) {
        m_phase = Phase::Idle;
        return;
    }

    SearchRequest request;
    request.id = ++m_currentId;
    request.query = m_query;
    request.path = m_path;

    m_state = SearchSessionState();
    m_state.isSearching = true;
    m_phase = Phase::Searching;
    emit stateChanged();

    subscribe(request);
}

bool SearchSession::loadMore()
{
    if (m_query.isEmpty() || m_phase != Phase::Idle || m_state.isSearching || !m_state.hasMore)
        return false;

    SearchRequest request;
    request.id = ++m_currentId;
    request.query = m_query;
    request.path = m_path;
    request.skip = m_state.results.size();

    m_state.isSearching = true;
    m_phase = Phase::Searching;
    emit stateChanged();

    subscribe(request);
    return true;
}

void SearchSession::subscribe(const SearchRequest& request)
{
    dropSubscription();

    m_subscription = m_provider.startSearch(request);
    if (!m_subscription) {
        qWarning() << "Search provider refused request" << request.id;
        onFailed(request.id, tr("Search could not be started"));
        return;
    }

    SearchSubscription* sub = m_subscription.get();
    connect(sub, &SearchSubscription::started, this, &SearchSession::onStarted);
    connect(sub, &SearchSubscription::resultFound, this, &SearchSession::onResult);
    connect(sub, &SearchSubscription::finished, this, &SearchSession::onFinished);
    connect(sub, &SearchSubscription::failed, this, &SearchSession::onFailed);
}

void SearchSession::onStarted(quint64 requestId, const QString& query)
{
    qDebug() << "Search" << requestId << "started for" << query;
}

void SearchSession::onResult(quint64 requestId, const SearchResult& result)
{
    if (requestId != m_currentId)
        return;  // superseded

    m_state.results.append(result);
    emit stateChanged();
}

void SearchSession::onFinished(quint64 requestId, int totalMatches, bool hasMore)
{
    if (requestId != m_currentId)
        return;

    m_state.isSearching = false;
    m_state.totalMatches = totalMatches;
    m_state.hasMore = hasMore;
    if (m_phase == Phase::Searching)
        m_phase = Phase::Idle;
    emit stateChanged();
}

void SearchSession::onFailed(quint64 requestId, const QString& message)
{
    if (requestId != m_currentId)
        return;

    qWarning() << "Search" << requestId << "failed:" << message;
    m_state.isSearching = false;
    if (m_phase == Phase::Searching)
        m_phase = Phase::Idle;
    emit stateChanged();
}

void SearchSession::activate(const SearchResult& result)
{
    if (result.isFile)
        emit openRequested(result.path);
    else
        emit navigateRequested(result.path);

    clear();
}
