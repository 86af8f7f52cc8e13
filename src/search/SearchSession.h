#ifndef SEARCHSESSION_H
#define SEARCHSESSION_H

#include "search/SearchProvider.h"
#include "search/SearchTypes.h"

#include <QObject>
#include <QTimer>

#include <memory>

// Incremental search behind a search box.
//
// Keystrokes restart a debounce timer; when it fires the session allocates
// the next request id, resets its state and subscribes to the provider.
// Starting a request cancels the previous subscription, and results are only
// accepted when they carry the current id, so output of a superseded request
// never reaches the state.
class SearchSession : public QObject {
    Q_OBJECT

public:
    enum class Phase { Idle, Debouncing, Searching };

    static constexpr int DefaultDebounceMs = 300;

    explicit SearchSession(SearchProvider& provider, QObject* parent = nullptr);
    ~SearchSession() override;

    void setDebounceInterval(int ms);
    int debounceInterval() const { return m_debounceTimer.interval(); }

    // Changing the path clears the query and results
    void setPath(const QString& path);
    QString path() const { return m_path; }

    void setQuery(const QString& query);
    QString query() const { return m_query; }

    // Back to idle with empty results, without waiting for the timer
    void clear();

    // Fetch the next page of the finished request. Returns false when there
    // is nothing more to fetch or a request is still running.
    bool loadMore();

    // Directories are navigated into, files are handed to the opener.
    // Either way the query is cleared afterwards.
    void activate(const SearchResult& result);

    const SearchSessionState& state() const { return m_state; }
    Phase phase() const { return m_phase; }
    quint64 currentRequestId() const { return m_currentId; }

signals:
    void stateChanged();
    void navigateRequested(const QString& path);
    void openRequested(const QString& path);

private:
    void issueRequest();
    void subscribe(const SearchRequest& request);
    void dropSubscription();

    void onStarted(quint64 requestId, const QString& query);
    void onResult(quint64 requestId, const SearchResult& result);
    void onFinished(quint64 requestId, int totalMatches, bool hasMore);
    void onFailed(quint64 requestId, const QString& message);

    SearchProvider& m_provider;
    QTimer m_debounceTimer;
    QString m_path;
    QString m_query;
    quint64 m_currentId = 0;
    std::unique_ptr<SearchSubscription> m_subscription;
    SearchSessionState m_state;
    Phase m_phase = Phase::Idle;
};

#endif // SEARCHSESSION_H
