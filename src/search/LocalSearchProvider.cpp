#include "search/LocalSearchProvider.h"

#include <QDebug>
#include <QThread>

LocalSearchSubscription::LocalSearchSubscription(const SearchRequest& request,
                                                 const SearchCriteria& criteria,
                                                 QObject* parent)
    : SearchSubscription(request, parent)
{
    m_thread = new QThread;
    auto* worker = new SearchWorker(criteria, m_token);
    worker->moveToThread(m_thread);

    // Queued to this object before the worker starts posting results
    connect(m_thread, &QThread::started, this, &LocalSearchSubscription::deliverStarted);
    connect(m_thread, &QThread::started, worker, &SearchWorker::startSearch);
    connect(worker, &SearchWorker::resultsReady, this, &LocalSearchSubscription::onBatch);
    connect(worker, &SearchWorker::searchFinished, this, &LocalSearchSubscription::deliverFinished);
    connect(worker, &SearchWorker::searchFailed, this, &LocalSearchSubscription::deliverFailed);

    // Cleanup
    connect(worker, &SearchWorker::searchFinished, m_thread, &QThread::quit);
    connect(worker, &SearchWorker::searchFailed, m_thread, &QThread::quit);
    connect(m_thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(m_thread, &QThread::finished, m_thread, &QObject::deleteLater);

    m_thread->start();
}

LocalSearchSubscription::~LocalSearchSubscription()
{
    m_token.cancel();
    if (m_thread) {
        m_thread->quit();
        m_thread->wait();
    }
}

void LocalSearchSubscription::stopProducer()
{
    qDebug() << "Stopping search" << requestId();
    m_token.cancel();
    if (m_thread)
        m_thread->quit();
}

void LocalSearchSubscription::onBatch(const QVector<SearchResult>& batch)
{
    for (const SearchResult& result : batch)
        deliverResult(result);
}

LocalSearchProvider::LocalSearchProvider()
    : LocalSearchProvider(Settings{})
{
}

LocalSearchProvider::LocalSearchProvider(const Settings& settings)
    : m_settings(settings)
{
    qRegisterMetaType<SearchResult>();
    qRegisterMetaType<QVector<SearchResult>>();
}

std::unique_ptr<SearchSubscription> LocalSearchProvider::startSearch(const SearchRequest& request)
{
    SearchCriteria criteria;
    criteria.searchPath = request.path;
    criteria.query = request.query;
    criteria.skip = request.skip;
    criteria.maxResults = m_settings.maxResults;
    criteria.batchSize = m_settings.batchSize;
    criteria.followSymlinks = m_settings.followSymlinks;

    qDebug() << "Search" << request.id << "for" << request.query << "in" << request.path;
    return std::make_unique<LocalSearchSubscription>(request, criteria);
}
