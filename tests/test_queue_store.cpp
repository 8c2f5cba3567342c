/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <sqlite3.h>

#include "jitstream/queue_store.hpp"
#include "test_support.hpp"

using namespace jitstream;

class QueueStoreTest : public ::testing::Test {
protected:
    jitstream::testing::ScratchDir dir_;
    int sleeps_ = 0;
    std::vector<std::chrono::milliseconds> waits_;

    QueueStoreOptions options() {
        QueueStoreOptions opts;
        opts.database = dir_.file("queue.db");
        opts.sleep = [this](std::chrono::milliseconds d) {
            ++sleeps_;
            waits_.push_back(d);
        };
        return opts;
    }

    void SetUp() override {
        QueueStore store(options());
        std::string error;
        ASSERT_TRUE(store.ensureSchema(error)) << error;
    }

    static EntryMetadata at(const std::string& address) {
        EntryMetadata metadata;
        metadata.address = address;
        return metadata;
    }
};

// Holds an exclusive lock on the database until released.
class Blocker {
public:
    explicit Blocker(const std::filesystem::path& path) {
        EXPECT_EQ(sqlite3_open(path.c_str(), &db_), SQLITE_OK);
        EXPECT_EQ(sqlite3_exec(db_, "BEGIN EXCLUSIVE", nullptr, nullptr, nullptr), SQLITE_OK);
    }
    ~Blocker() {
        release();
        sqlite3_close(db_);
    }

    void release() {
        if (held_) {
            sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
            held_ = false;
        }
    }

private:
    sqlite3* db_ = nullptr;
    bool held_ = true;
};

TEST_F(QueueStoreTest, OrdinalsIncreaseAndPositionCountsPendingAhead) {
    QueueStore store(options());

    auto a = store.enqueue(QueueKind::Launch, "A", at("10.0.0.1"));
    auto b = store.enqueue(QueueKind::Launch, "B", at("10.0.0.2"));
    auto c = store.enqueue(QueueKind::Launch, "C", at("10.0.0.3"));
    ASSERT_TRUE(a && b && c);
    EXPECT_LT(a.ordinal, b.ordinal);
    EXPECT_LT(b.ordinal, c.ordinal);

    EXPECT_EQ(store.queryStatus(QueueKind::Launch, "A").position, 0u);
    auto status = store.queryStatus(QueueKind::Launch, "C");
    EXPECT_EQ(status.state, QueueState::Queued);
    EXPECT_EQ(status.position, 2u);

    // Claiming A moves it out of the pending count.
    auto claim = store.claimNext(QueueKind::Launch);
    ASSERT_TRUE(claim);
    ASSERT_TRUE(claim.entry.has_value());
    EXPECT_EQ(claim.entry->deviceId, "A");
    EXPECT_EQ(store.queryStatus(QueueKind::Launch, "A").state, QueueState::InProgress);
    EXPECT_EQ(store.queryStatus(QueueKind::Launch, "C").position, 1u);
}

TEST_F(QueueStoreTest, OrdinalsAreNotReusedAfterDeletion) {
    QueueStore store(options());
    auto first = store.enqueue(QueueKind::Mount, "A", at("10.0.0.1"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(store.complete(QueueKind::Mount, first.ordinal));

    auto second = store.enqueue(QueueKind::Mount, "A", at("10.0.0.1"));
    ASSERT_TRUE(second);
    EXPECT_GT(second.ordinal, first.ordinal);
}

TEST_F(QueueStoreTest, KindsAreIndependent) {
    QueueStore store(options());
    ASSERT_TRUE(store.enqueue(QueueKind::Mount, "A", at("10.0.0.1")));
    EXPECT_EQ(store.queryStatus(QueueKind::Launch, "A").state, QueueState::NotQueued);
    EXPECT_EQ(store.queryStatus(QueueKind::Mount, "A").state, QueueState::Queued);
}

TEST_F(QueueStoreTest, SecondEnqueueForLiveDeviceReturnsExistingEntry) {
    QueueStore store(options());
    auto first = store.enqueue(QueueKind::Launch, "A", at("10.0.0.1"));
    auto again = store.enqueue(QueueKind::Launch, "A", at("10.0.0.1"));
    ASSERT_TRUE(first && again);
    EXPECT_FALSE(first.duplicate);
    EXPECT_TRUE(again.duplicate);
    EXPECT_EQ(again.ordinal, first.ordinal);
}

TEST_F(QueueStoreTest, ErrorIsReportedOnceThenForgotten) {
    QueueStore store(options());
    ASSERT_TRUE(store.enqueue(QueueKind::Mount, "A", at("10.0.0.1")));
    auto claim = store.claimNext(QueueKind::Mount);
    ASSERT_TRUE(claim && claim.entry);
    ASSERT_TRUE(store.fail(QueueKind::Mount, claim.entry->ordinal, "image rejected"));

    auto first = store.queryStatus(QueueKind::Mount, "A");
    EXPECT_EQ(first.state, QueueState::Failed);
    EXPECT_EQ(first.message, "image rejected");

    EXPECT_EQ(store.queryStatus(QueueKind::Mount, "A").state, QueueState::NotQueued);
}

TEST_F(QueueStoreTest, UnreadErrorIsSupersededByNewEnqueue) {
    QueueStore store(options());
    ASSERT_TRUE(store.enqueue(QueueKind::Launch, "A", at("10.0.0.1")));
    auto claim = store.claimNext(QueueKind::Launch);
    ASSERT_TRUE(claim && claim.entry);
    ASSERT_TRUE(store.fail(QueueKind::Launch, claim.entry->ordinal, "old failure"));

    auto fresh = store.enqueue(QueueKind::Launch, "A", at("10.0.0.1"));
    ASSERT_TRUE(fresh);
    EXPECT_FALSE(fresh.duplicate);
    EXPECT_EQ(store.queryStatus(QueueKind::Launch, "A").state, QueueState::Queued);
}

TEST_F(QueueStoreTest, ClaimCarriesMetadataAndClearEmptiesKind) {
    QueueStore store(options());
    EntryMetadata metadata;
    metadata.address = "::ffff:10.0.0.9";
    metadata.bundleId = "com.example.emu";
    ASSERT_TRUE(store.enqueue(QueueKind::Launch, "A", metadata));

    auto claim = store.claimNext(QueueKind::Launch);
    ASSERT_TRUE(claim && claim.entry);
    EXPECT_EQ(claim.entry->address.value_or(""), "::ffff:10.0.0.9");
    EXPECT_EQ(claim.entry->bundleId.value_or(""), "com.example.emu");
    EXPECT_EQ(claim.entry->status, EntryStatus::InProgress);

    auto empty = store.claimNext(QueueKind::Launch);
    ASSERT_TRUE(empty);
    EXPECT_FALSE(empty.entry.has_value());

    std::string error;
    ASSERT_TRUE(store.clear(QueueKind::Launch, error)) << error;
    EXPECT_EQ(store.queryStatus(QueueKind::Launch, "A").state, QueueState::NotQueued);
}

TEST_F(QueueStoreTest, BusyStorageIsRetriedUntilReleased) {
    auto opts = options();
    Blocker blocker(opts.database);
    opts.sleep = [&](std::chrono::milliseconds d) {
        ++sleeps_;
        waits_.push_back(d);
        if (sleeps_ == 2) {
            blocker.release();
        }
    };
    QueueStore store(opts);

    auto result = store.enqueue(QueueKind::Launch, "A", at("10.0.0.1"));
    ASSERT_TRUE(result) << result.failure.describe();
    EXPECT_EQ(sleeps_, 2);
    for (auto wait : waits_) {
        EXPECT_EQ(wait, std::chrono::milliseconds(100));
    }
}

TEST_F(QueueStoreTest, BusyOnFinalAttemptStillSucceedsWhenReleased) {
    auto opts = options();
    Blocker blocker(opts.database);
    opts.sleep = [&](std::chrono::milliseconds) {
        if (++sleeps_ == 4) {
            blocker.release();
        }
    };
    QueueStore store(opts);

    auto result = store.enqueue(QueueKind::Mount, "A", at("10.0.0.1"));
    ASSERT_TRUE(result) << result.failure.describe();
    EXPECT_EQ(sleeps_, 4);
}

TEST_F(QueueStoreTest, BusyOnEveryAttemptIsBackendError) {
    auto opts = options();
    Blocker blocker(opts.database);
    QueueStore store(opts);

    auto result = store.enqueue(QueueKind::Launch, "A", at("10.0.0.1"));
    EXPECT_FALSE(result);
    EXPECT_EQ(result.failure.kind, FailureKind::Backend);
    EXPECT_EQ(sleeps_, 4);   // five attempts, four waits

    blocker.release();
    EXPECT_EQ(store.queryStatus(QueueKind::Launch, "A").state, QueueState::NotQueued);
}

TEST_F(QueueStoreTest, UnopenableDatabaseIsBackendError) {
    QueueStoreOptions opts = options();
    opts.database = dir_.file("missing-dir") / "queue.db";
    QueueStore store(opts);

    EXPECT_EQ(store.queryStatus(QueueKind::Mount, "A").state, QueueState::BackendError);
    auto result = store.enqueue(QueueKind::Mount, "A", at("10.0.0.1"));
    EXPECT_FALSE(result);
    EXPECT_EQ(result.failure.kind, FailureKind::Backend);
    EXPECT_EQ(sleeps_, 0);
}

TEST_F(QueueStoreTest, CompleteWaitsOutConcurrentWriter) {
    auto opts = options();
    Ordinal ordinal = 0;
    {
        QueueStore setup(opts);
        ASSERT_TRUE(setup.enqueue(QueueKind::Launch, "ABCD", at("10.0.0.1")));
        auto claim = setup.claimNext(QueueKind::Launch);
        ASSERT_TRUE(claim && claim.entry);
        ordinal = claim.entry->ordinal;
    }

    Blocker blocker(opts.database);
    opts.sleep = [&](std::chrono::milliseconds) {
        if (++sleeps_ == 2) {
            blocker.release();
        }
    };
    QueueStore store(opts);

    EXPECT_TRUE(store.complete(QueueKind::Launch, ordinal));
    EXPECT_EQ(sleeps_, 2);
    EXPECT_EQ(store.queryStatus(QueueKind::Launch, "ABCD").state, QueueState::NotQueued);
}

TEST_F(QueueStoreTest, FailWaitsOutConcurrentWriter) {
    auto opts = options();
    Ordinal ordinal = 0;
    {
        QueueStore setup(opts);
        ASSERT_TRUE(setup.enqueue(QueueKind::Launch, "ABCD", at("10.0.0.1")));
        auto claim = setup.claimNext(QueueKind::Launch);
        ASSERT_TRUE(claim && claim.entry);
        ordinal = claim.entry->ordinal;
    }

    Blocker blocker(opts.database);
    opts.sleep = [&](std::chrono::milliseconds) {
        if (++sleeps_ == 1) {
            blocker.release();
        }
    };
    QueueStore store(opts);

    EXPECT_TRUE(store.fail(QueueKind::Launch, ordinal, "attach refused"));
    auto status = store.queryStatus(QueueKind::Launch, "ABCD");
    EXPECT_EQ(status.state, QueueState::Failed);
    EXPECT_EQ(status.message, "attach refused");
}

TEST_F(QueueStoreTest, StatusQueryWaitsOutConcurrentWriter) {
    auto opts = options();
    {
        QueueStore setup(opts);
        ASSERT_TRUE(setup.enqueue(QueueKind::Mount, "ABCD", at("10.0.0.1")));
    }

    Blocker blocker(opts.database);
    opts.sleep = [&](std::chrono::milliseconds) {
        if (++sleeps_ == 3) {
            blocker.release();
        }
    };
    QueueStore store(opts);

    auto status = store.queryStatus(QueueKind::Mount, "ABCD");
    EXPECT_EQ(status.state, QueueState::Queued);
    EXPECT_EQ(sleeps_, 3);
}

TEST_F(QueueStoreTest, CompleteGivesUpWhenWriterNeverLetsGo) {
    auto opts = options();
    Ordinal ordinal = 0;
    {
        QueueStore setup(opts);
        auto queued = setup.enqueue(QueueKind::Mount, "ABCD", at("10.0.0.1"));
        ASSERT_TRUE(queued);
        ordinal = queued.ordinal;
    }

    Blocker blocker(opts.database);
    QueueStore store(opts);
    EXPECT_FALSE(store.complete(QueueKind::Mount, ordinal));
    EXPECT_EQ(sleeps_, 4);
    EXPECT_EQ(store.queryStatus(QueueKind::Mount, "ABCD").state, QueueState::BackendError);

    blocker.release();
    EXPECT_EQ(store.queryStatus(QueueKind::Mount, "ABCD").state, QueueState::Queued);
}
