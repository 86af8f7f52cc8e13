#include <gtest/gtest.h>

#include "transfer/TransferExecutor.h"
#include "transfer/TransferOperationTracker.h"
#include "TestHelpers.h"

namespace {

TransferRequest makeRequest(TransferKind kind, const QString& sourceDir,
                            const QStringList& names, const QString& destinationDir = QString())
{
    TransferRequest request;
    request.kind = kind;
    request.sourceDir = sourceDir;
    request.names = names;
    request.destinationDir = destinationDir;
    return request;
}

} // anonymous namespace

TEST(TransferExecutorTest, CopyRenamesOnConflict)
{
    FakeStorageProvider storage;
    storage.addFile("/src/a.txt", "new");
    storage.addFile("/dst/a.txt", "old");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Copy, 1);

    EXPECT_TRUE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"a.txt"}, "/dst")));

    EXPECT_EQ(storage.content("/dst/a.txt"), "old");
    EXPECT_EQ(storage.content("/dst/a (1).txt"), "new");
    EXPECT_TRUE(storage.has("/src/a.txt"));

    const auto op = tracker.operation(id);
    EXPECT_EQ(op->status, TransferStatus::Completed);
    EXPECT_EQ(op->processedItems, 1);
}

TEST(TransferExecutorTest, CopiesDirectoriesRecursively)
{
    FakeStorageProvider storage;
    storage.addFile("/src/photos/2024/img.jpg", "jpg");
    storage.addFile("/src/photos/cover.png", "png");
    storage.addDir("/dst");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Copy, 1);

    EXPECT_TRUE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"photos"}, "/dst")));
    EXPECT_TRUE(storage.isDir("/dst/photos/2024"));
    EXPECT_EQ(storage.content("/dst/photos/2024/img.jpg"), "jpg");
    EXPECT_EQ(storage.content("/dst/photos/cover.png"), "png");
}

TEST(TransferExecutorTest, MoveStopsAtFirstFailure)
{
    FakeStorageProvider storage;
    storage.addFile("/src/a");
    storage.addFile("/src/b");
    storage.addFile("/src/c");
    storage.addDir("/dst");
    storage.failCopyOf("/src/b");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Move, 3);

    EXPECT_FALSE(executor.run(id, makeRequest(TransferKind::Move, "/src", {"a", "b", "c"}, "/dst")));

    // a was moved, b and c stay where they were
    EXPECT_TRUE(storage.has("/dst/a"));
    EXPECT_FALSE(storage.has("/src/a"));
    EXPECT_TRUE(storage.has("/src/b"));
    EXPECT_TRUE(storage.has("/src/c"));
    EXPECT_FALSE(storage.has("/dst/b"));
    EXPECT_FALSE(storage.has("/dst/c"));
    EXPECT_EQ(storage.copiedFiles(), QStringList{"/src/a"});

    const auto op = tracker.operation(id);
    EXPECT_EQ(op->status, TransferStatus::Error);
    EXPECT_EQ(op->processedItems, 1);
    EXPECT_TRUE(op->error.contains("'b'"));
    EXPECT_TRUE(op->error.contains("Disk full"));
}

TEST(TransferExecutorTest, MoveKeepsSourceWhenCopyFails)
{
    FakeStorageProvider storage;
    storage.addFile("/src/report.pdf", "pdf");
    storage.addDir("/dst");
    storage.failCopyOf("/src/report.pdf");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Move, 1);

    EXPECT_FALSE(executor.run(id, makeRequest(TransferKind::Move, "/src", {"report.pdf"}, "/dst")));
    EXPECT_EQ(storage.content("/src/report.pdf"), "pdf");
    EXPECT_TRUE(storage.removedPaths().isEmpty());
}

TEST(TransferExecutorTest, DeleteStopsAtFirstFailure)
{
    FakeStorageProvider storage;
    storage.addFile("/src/x");
    storage.addFile("/src/y");
    storage.failRemoveOf("/src/x");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Delete, 2);

    EXPECT_FALSE(executor.run(id, makeRequest(TransferKind::Delete, "/src", {"x", "y"})));
    EXPECT_TRUE(storage.has("/src/x"));
    EXPECT_TRUE(storage.has("/src/y"));

    const auto op = tracker.operation(id);
    EXPECT_EQ(op->status, TransferStatus::Error);
    EXPECT_TRUE(op->error.startsWith("Failed to delete 'x'"));
}

TEST(TransferExecutorTest, DeleteRemovesTrees)
{
    FakeStorageProvider storage;
    storage.addFile("/src/dir/sub/f");
    storage.addFile("/src/keep");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Delete, 1);

    EXPECT_TRUE(executor.run(id, makeRequest(TransferKind::Delete, "/src", {"dir"})));
    EXPECT_FALSE(storage.has("/src/dir"));
    EXPECT_FALSE(storage.has("/src/dir/sub/f"));
    EXPECT_TRUE(storage.has("/src/keep"));
}

TEST(TransferExecutorTest, CopyIntoSameDirectoryMakesCopy)
{
    FakeStorageProvider storage;
    storage.addFile("/src/a.txt", "a");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Copy, 1);

    EXPECT_TRUE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"a.txt"}, "/src")));
    EXPECT_EQ(storage.content("/src/a (Copy).txt"), "a");
}

TEST(TransferExecutorTest, MoveIntoSameDirectoryIsNoop)
{
    FakeStorageProvider storage;
    storage.addFile("/src/a.txt", "a");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Move, 1);

    EXPECT_TRUE(executor.run(id, makeRequest(TransferKind::Move, "/src", {"a.txt"}, "/src/")));
    EXPECT_EQ(storage.children("/src"), QStringList{"a.txt"});
    EXPECT_TRUE(storage.copiedFiles().isEmpty());
}

TEST(TransferExecutorTest, RejectsCopyIntoOwnSubtree)
{
    FakeStorageProvider storage;
    storage.addFile("/src/dir/inner/f");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Copy, 1);

    EXPECT_FALSE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"dir"}, "/src/dir/inner")));
    EXPECT_TRUE(tracker.operation(id)->error.contains("into itself"));
    EXPECT_EQ(storage.children("/src/dir/inner"), QStringList{"f"});
}

TEST(TransferExecutorTest, ConflictExhaustionFailsOperation)
{
    FakeStorageProvider storage;
    storage.addFile("/src/a.txt");
    storage.addFile("/dst/a.txt");
    storage.addFile("/dst/a (1).txt");
    storage.addFile("/dst/a (2).txt");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker, 2);
    const QString id = tracker.begin(TransferKind::Copy, 1);

    EXPECT_FALSE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"a.txt"}, "/dst")));
    EXPECT_EQ(tracker.operation(id)->status, TransferStatus::Error);
    EXPECT_TRUE(storage.copiedFiles().isEmpty());
}

TEST(TransferExecutorTest, CancelStopsBetweenItems)
{
    FakeStorageProvider storage;
    storage.addFile("/src/a");
    storage.addFile("/src/b");
    storage.addFile("/src/c");
    storage.addDir("/dst");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Copy, 3);

    storage.beforeCopy = [&](const QString& src) {
        if (src == "/src/b")
            tracker.cancel(id);
    };

    EXPECT_FALSE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"a", "b", "c"}, "/dst")));
    EXPECT_TRUE(storage.has("/dst/a"));
    EXPECT_FALSE(storage.has("/dst/b"));
    EXPECT_FALSE(storage.has("/dst/c"));

    const auto op = tracker.operation(id);
    EXPECT_EQ(op->status, TransferStatus::Error);
    EXPECT_EQ(op->error, "Operation cancelled");
}

TEST(TransferExecutorTest, CancelReachesInsideDirectoryCopy)
{
    FakeStorageProvider storage;
    storage.addFile("/src/dir/1");
    storage.addFile("/src/dir/2");
    storage.addFile("/src/dir/3");
    storage.addDir("/dst");

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Copy, 1);

    storage.beforeCopy = [&](const QString& src) {
        if (src == "/src/dir/2")
            tracker.cancel(id);
    };

    EXPECT_FALSE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"dir"}, "/dst")));
    EXPECT_TRUE(storage.has("/dst/dir/1"));
    EXPECT_FALSE(storage.has("/dst/dir/2"));
    EXPECT_FALSE(storage.has("/dst/dir/3"));
}

TEST(TransferExecutorTest, ProgressAdvancesInOrder)
{
    FakeStorageProvider storage;
    storage.addFile("/src/a");
    storage.addFile("/src/b");
    storage.addFile("/src/c");
    storage.addDir("/dst");

    struct Step {
        TransferStatus status;
        int processed;
        QString currentFile;
    };
    QVector<Step> steps;

    TransferOperationTracker tracker;
    QObject::connect(&tracker, &TransferOperationTracker::operationsChanged, [&]() {
        const TransferOperation op = tracker.operations().first();
        steps.append({op.status, op.processedItems, op.currentFile});
    });

    const QString id = tracker.begin(TransferKind::Copy, 3);
    TransferExecutor executor(storage, tracker);
    ASSERT_TRUE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"a", "b", "c"}, "/dst")));

    ASSERT_EQ(steps.size(), 5);
    EXPECT_EQ(steps[0].status, TransferStatus::Pending);
    EXPECT_EQ(steps[0].processed, 0);

    const QStringList files{"a", "b", "c"};
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(steps[i + 1].status, TransferStatus::InProgress) << i;
        EXPECT_EQ(steps[i + 1].processed, i) << i;
        EXPECT_EQ(steps[i + 1].currentFile, files.at(i)) << i;
    }

    EXPECT_EQ(steps[4].status, TransferStatus::Completed);
    EXPECT_EQ(steps[4].processed, 3);
}

TEST(TransferExecutorTest, NameTakenDuringCopyIsResolvedAgain)
{
    FakeStorageProvider storage;
    storage.addFile("/src/a.txt", "mine");
    storage.addDir("/dst");

    // Another writer creates the target between resolve and copy
    bool raced = false;
    storage.beforeCopy = [&](const QString&) {
        if (raced)
            return;
        raced = true;
        storage.addFile("/dst/a.txt", "theirs");
    };

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Copy, 1);

    EXPECT_TRUE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"a.txt"}, "/dst")));
    EXPECT_EQ(storage.content("/dst/a.txt"), "theirs");
    EXPECT_EQ(storage.content("/dst/a (1).txt"), "mine");
}

TEST(TransferExecutorTest, NestedConflictIsNotRetried)
{
    FakeStorageProvider storage;
    storage.addFile("/src/dir/f", "f");
    storage.addDir("/dst");

    // Collision below the top-level target is a real failure
    storage.beforeCopy = [&](const QString&) { storage.addFile("/dst/dir/f", "x"); };

    TransferOperationTracker tracker;
    TransferExecutor executor(storage, tracker);
    const QString id = tracker.begin(TransferKind::Copy, 1);

    EXPECT_FALSE(executor.run(id, makeRequest(TransferKind::Copy, "/src", {"dir"}, "/dst")));
    EXPECT_FALSE(storage.has("/dst/dir (1)"));
    EXPECT_TRUE(tracker.operation(id)->error.contains("already exists"));
}
