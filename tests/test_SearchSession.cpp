#include <gtest/gtest.h>

#include "search/SearchSession.h"
#include "TestHelpers.h"

namespace {

struct SessionFixture : public ::testing::Test {
    SessionFixture()
        : session(provider)
    {
        session.setDebounceInterval(0);
        session.setPath("/home/user");
    }

    // Type a query and let the debounce timer fire
    FakeSubscription* search(const QString& query)
    {
        const int before = provider.requests.size();
        session.setQuery(query);
        if (!waitUntil([&]() { return provider.requests.size() > before; }))
            return nullptr;
        return provider.subscription(provider.requests.last().id);
    }

    FakeSearchProvider provider;
    SearchSession session;
};

} // anonymous namespace

TEST_F(SessionFixture, DebounceSendsOnlyLastQuery)
{
    session.setDebounceInterval(30);
    session.setQuery("i");
    session.setQuery("in");
    session.setQuery("inv");

    EXPECT_EQ(session.phase(), SearchSession::Phase::Debouncing);
    EXPECT_TRUE(provider.requests.isEmpty());

    ASSERT_TRUE(waitUntil([&]() { return !provider.requests.isEmpty(); }));
    waitUntil([]() { return false; }, 80);

    ASSERT_EQ(provider.requests.size(), 1);
    EXPECT_EQ(provider.requests.first().query, "inv");
    EXPECT_EQ(provider.requests.first().path, "/home/user");
    EXPECT_EQ(provider.requests.first().id, 1u);
    EXPECT_EQ(provider.requests.first().skip, 0);
    EXPECT_EQ(session.phase(), SearchSession::Phase::Searching);
    EXPECT_TRUE(session.state().isSearching);
}

TEST_F(SessionFixture, CollectsResultsOfCurrentRequest)
{
    FakeSubscription* sub = search("rep");
    ASSERT_NE(sub, nullptr);

    sub->pushStarted();
    sub->pushResult(makeResult("/home/user/a/report.txt", true));
    sub->pushResult(makeResult("/home/user/b/reports", false));
    sub->pushFinished(2, false);

    const SearchSessionState& state = session.state();
    ASSERT_EQ(state.results.size(), 2);
    EXPECT_EQ(state.results.at(0).name, "report.txt");
    EXPECT_EQ(state.results.at(1).name, "reports");
    EXPECT_EQ(state.totalMatches, 2);
    EXPECT_FALSE(state.hasMore);
    EXPECT_FALSE(state.isSearching);
    EXPECT_EQ(session.phase(), SearchSession::Phase::Idle);
}

TEST_F(SessionFixture, SupersededResultsAreDropped)
{
    for (int i = 1; i <= 7; ++i)
        ASSERT_NE(search(QStringLiteral("q%1").arg(i)), nullptr);
    EXPECT_EQ(session.currentRequestId(), 7u);

    QPointer<FakeSubscription> sub7 = provider.subscription(7);
    ASSERT_FALSE(sub7.isNull());

    FakeSubscription* sub8 = search("q8");
    ASSERT_NE(sub8, nullptr);
    EXPECT_EQ(session.currentRequestId(), 8u);

    // Starting 8 cancelled and released 7
    EXPECT_TRUE(provider.stopped.contains(7u));
    EXPECT_TRUE(sub7.isNull());

    emit sub8->resultFound(7, makeResult("/home/user/old", true));
    EXPECT_TRUE(session.state().results.isEmpty());

    sub8->pushResult(makeResult("/home/user/new", true));
    ASSERT_EQ(session.state().results.size(), 1);
    EXPECT_EQ(session.state().results.first().name, "new");

    emit sub8->finished(7, 99, true);
    EXPECT_TRUE(session.state().isSearching);
}

TEST_F(SessionFixture, EmptyQueryClearsImmediately)
{
    FakeSubscription* sub = search("report");
    ASSERT_NE(sub, nullptr);
    sub->pushResult(makeResult("/home/user/report", true));

    int changes = 0;
    QObject::connect(&session, &SearchSession::stateChanged, [&]() { ++changes; });

    session.setQuery("");
    EXPECT_EQ(changes, 1);
    EXPECT_EQ(session.phase(), SearchSession::Phase::Idle);
    EXPECT_TRUE(session.state().results.isEmpty());
    EXPECT_FALSE(session.state().isSearching);
    EXPECT_TRUE(provider.stopped.contains(1u));

    // Pending debounce is dropped too
    session.setDebounceInterval(10);
    session.setQuery("abc");
    session.clear();
    waitUntil([]() { return false; }, 50);
    EXPECT_EQ(provider.requests.size(), 1);
}

TEST_F(SessionFixture, FailureStopsSearchingOnly)
{
    FakeSubscription* sub = search("report");
    ASSERT_NE(sub, nullptr);
    sub->pushResult(makeResult("/home/user/report", true));
    sub->pushFailed("Permission denied");

    EXPECT_FALSE(session.state().isSearching);
    EXPECT_EQ(session.state().results.size(), 1);
    EXPECT_EQ(session.phase(), SearchSession::Phase::Idle);
}

TEST_F(SessionFixture, RefusedRequestEndsSearch)
{
    provider.refuse = true;
    session.setQuery("abc");
    ASSERT_TRUE(waitUntil([&]() { return !provider.requests.isEmpty(); }));

    EXPECT_FALSE(session.state().isSearching);
    EXPECT_EQ(session.phase(), SearchSession::Phase::Idle);
}

TEST_F(SessionFixture, LoadMoreAppends)
{
    FakeSubscription* first = search("log");
    ASSERT_NE(first, nullptr);
    EXPECT_FALSE(session.loadMore());   // still searching

    first->pushResult(makeResult("/home/user/a.log", true));
    first->pushResult(makeResult("/home/user/b.log", true));
    first->pushFinished(2, true);

    ASSERT_TRUE(session.loadMore());
    ASSERT_EQ(provider.requests.size(), 2);
    EXPECT_EQ(provider.requests.last().skip, 2);
    EXPECT_EQ(provider.requests.last().query, "log");
    EXPECT_EQ(session.state().results.size(), 2);
    EXPECT_TRUE(session.state().isSearching);

    FakeSubscription* second = provider.subscription(provider.requests.last().id);
    ASSERT_NE(second, nullptr);
    second->pushResult(makeResult("/home/user/c.log", true));
    second->pushFinished(3, false);

    ASSERT_EQ(session.state().results.size(), 3);
    EXPECT_EQ(session.state().results.last().name, "c.log");
    EXPECT_EQ(session.state().totalMatches, 3);
    EXPECT_FALSE(session.loadMore());
}

TEST_F(SessionFixture, ActivateRoutesByKind)
{
    QStringList opened;
    QStringList navigated;
    QObject::connect(&session, &SearchSession::openRequested,
                     [&](const QString& path) { opened.append(path); });
    QObject::connect(&session, &SearchSession::navigateRequested,
                     [&](const QString& path) { navigated.append(path); });

    FakeSubscription* sub = search("rep");
    ASSERT_NE(sub, nullptr);
    sub->pushResult(makeResult("/home/user/a/report.txt", true));
    sub->pushFinished(1, false);

    session.activate(makeResult("/home/user/a/report.txt", true));
    EXPECT_EQ(opened, QStringList{"/home/user/a/report.txt"});
    EXPECT_TRUE(session.query().isEmpty());
    EXPECT_TRUE(session.state().results.isEmpty());

    session.activate(makeResult("/home/user/b/reports", false));
    EXPECT_EQ(navigated, QStringList{"/home/user/b/reports"});
}

TEST_F(SessionFixture, PathChangeResets)
{
    FakeSubscription* sub = search("rep");
    ASSERT_NE(sub, nullptr);
    sub->pushResult(makeResult("/home/user/report", true));

    session.setPath("/tmp");
    EXPECT_TRUE(session.query().isEmpty());
    EXPECT_TRUE(session.state().results.isEmpty());
    EXPECT_TRUE(provider.stopped.contains(1u));

    ASSERT_NE(search("rep"), nullptr);
    EXPECT_EQ(provider.requests.last().path, "/tmp");
}
