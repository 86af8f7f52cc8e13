#include <gtest/gtest.h>

#include "search/DirectoryWalker.h"
#include "search/LocalSearchProvider.h"
#include "search/SearchSession.h"
#include "TestHelpers.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

namespace {

void touch(const QString& path)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
}

QStringList names(const QVector<SearchResult>& results)
{
    QStringList out;
    for (const SearchResult& r : results)
        out.append(r.name);
    return out;
}

bool searchDone(const SearchSession& session)
{
    return session.currentRequestId() > 0 && session.phase() == SearchSession::Phase::Idle;
}

} // anonymous namespace

TEST(DirectoryWalkerTest, LevelOrder)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    touch(tmp.filePath("b/deep/x.txt"));
    touch(tmp.filePath("a.txt"));
    touch(tmp.filePath("b/y.txt"));

    DirectoryWalker walker(tmp.path(), DirectoryWalker::Options::DetectCycles);
    QStringList seen;
    while (auto info = walker.next())
        seen.append(QDir(tmp.path()).relativeFilePath(info->absoluteFilePath()));

    EXPECT_EQ(seen, (QStringList{"a.txt", "b", "b/deep", "b/y.txt", "b/deep/x.txt"}));
    EXPECT_EQ(walker.directoriesVisited(), 3);
}

TEST(DirectoryWalkerTest, SymlinkCyclesTerminate)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    touch(tmp.filePath("d/f.txt"));
    ASSERT_TRUE(QFile::link(tmp.filePath("d"), tmp.filePath("d/loop")));

    DirectoryWalker walker(tmp.path(),
                           DirectoryWalker::Options::FollowSymlinks | DirectoryWalker::Options::DetectCycles);
    int count = 0;
    while (walker.next())
        ++count;
    // d, d/f.txt, d/loop
    EXPECT_EQ(count, 3);
}

TEST(DirectoryWalkerTest, StopsWhenCancelled)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    touch(tmp.filePath("a"));
    touch(tmp.filePath("b"));

    CancellationToken token;
    DirectoryWalker walker(tmp.path(), DirectoryWalker::Options::None, token);
    ASSERT_TRUE(walker.next().has_value());
    token.cancel();
    EXPECT_FALSE(walker.next().has_value());
}

TEST(LocalSearchProviderTest, FindsMatchesCaseInsensitively)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    touch(tmp.filePath("a/Report.txt"));
    touch(tmp.filePath("b/reports/q1.csv"));
    touch(tmp.filePath("notes.md"));

    LocalSearchProvider provider;
    SearchSession session(provider);
    session.setDebounceInterval(0);
    session.setPath(tmp.path());
    session.setQuery("rep");

    ASSERT_TRUE(waitUntil([&]() { return searchDone(session); }));

    const SearchSessionState& state = session.state();
    // Shallow first, then name order within a level
    EXPECT_EQ(names(state.results), (QStringList{"Report.txt", "reports"}));
    EXPECT_EQ(state.totalMatches, 2);
    EXPECT_FALSE(state.hasMore);
    EXPECT_FALSE(state.isSearching);

    EXPECT_TRUE(state.results.at(0).isFile);
    EXPECT_FALSE(state.results.at(1).isFile);
    EXPECT_EQ(state.results.at(0).path, QFileInfo(tmp.filePath("a/Report.txt")).absoluteFilePath());
}

TEST(LocalSearchProviderTest, PagesThroughLoadMore)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    for (int i = 0; i < 5; ++i)
        touch(tmp.filePath(QStringLiteral("match%1.log").arg(i)));
    touch(tmp.filePath("other.txt"));

    LocalSearchProvider::Settings settings;
    settings.maxResults = 3;
    settings.batchSize = 2;
    LocalSearchProvider provider(settings);
    SearchSession session(provider);
    session.setDebounceInterval(0);
    session.setPath(tmp.path());
    session.setQuery("match");

    ASSERT_TRUE(waitUntil([&]() { return searchDone(session); }));
    EXPECT_EQ(names(session.state().results),
              (QStringList{"match0.log", "match1.log", "match2.log"}));
    EXPECT_EQ(session.state().totalMatches, 3);
    EXPECT_TRUE(session.state().hasMore);

    ASSERT_TRUE(session.loadMore());
    const quint64 pageId = session.currentRequestId();
    ASSERT_TRUE(waitUntil([&]() {
        return session.phase() == SearchSession::Phase::Idle && session.currentRequestId() == pageId;
    }));
    EXPECT_EQ(session.state().results.size(), 5);
    EXPECT_EQ(session.state().results.last().name, "match4.log");
    EXPECT_EQ(session.state().totalMatches, 5);
    EXPECT_FALSE(session.state().hasMore);
}

TEST(LocalSearchProviderTest, MissingDirectoryFails)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    LocalSearchProvider provider;
    SearchSession session(provider);
    session.setDebounceInterval(0);
    session.setPath(tmp.filePath("gone"));
    session.setQuery("x");

    ASSERT_TRUE(waitUntil([&]() { return searchDone(session); }));
    EXPECT_TRUE(session.state().results.isEmpty());
    EXPECT_FALSE(session.state().isSearching);
}

TEST(LocalSearchProviderTest, CancelledSubscriptionGoesQuiet)
{
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    for (int i = 0; i < 50; ++i)
        touch(tmp.filePath(QStringLiteral("d%1/hit.txt").arg(i)));

    LocalSearchProvider provider;
    SearchRequest request;
    request.id = 42;
    request.query = "hit";
    request.path = tmp.path();

    std::unique_ptr<SearchSubscription> sub = provider.startSearch(request);
    ASSERT_TRUE(sub);
    int delivered = 0;
    QObject::connect(sub.get(), &SearchSubscription::resultFound,
                     [&](quint64, const SearchResult&) { ++delivered; });
    QObject::connect(sub.get(), &SearchSubscription::finished,
                     [&](quint64, int, bool) { ++delivered; });

    sub->cancel();
    EXPECT_TRUE(sub->isCancelled());

    waitUntil([]() { return false; }, 100);
    EXPECT_EQ(delivered, 0);
    sub.reset();
}
