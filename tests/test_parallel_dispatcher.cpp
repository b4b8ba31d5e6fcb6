#include <gtest/gtest.h>

#include "ParallelDispatcher.hpp"
#include "TilePlanner.hpp"
#include "FakeImageryClient.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

using namespace rasterdl;
using rasterdl::test::FakeImageryClient;
using rasterdl::test::synthetic_window;

namespace {

constexpr std::chrono::milliseconds kNoBackoff{0};

} // namespace

class ParallelDispatcherTest : public ::testing::Test {
protected:
    // 20 strips of 2 rows each
    FakeImageryClient client{40, 25};
    TileFetcher fetcher{client, "image", client.spec().data_type};
    ParallelDispatcher dispatcher{fetcher, kNoBackoff};
    TileGrid grid = TilePlanner().plan(client.spec(), 2 * 25 * 4);
};

// ============================================================================
// Ordering and completeness
// ============================================================================

TEST_F(ParallelDispatcherTest, ResultsComeBackInIndexOrder) {
    ASSERT_EQ(grid.size(), 20u);
    client.set_delay(std::chrono::milliseconds(5));

    std::vector<TileResult> results = dispatcher.run(grid, "B1", 4, 0);

    ASSERT_EQ(results.size(), grid.size());
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].tile, grid.tiles[i]);
        ASSERT_TRUE(results[i].ok());
        EXPECT_TRUE((results[i].data() == synthetic_window(grid.tiles[i].window(), 25)).all());
    }
}

TEST_F(ParallelDispatcherTest, EachTileFetchedOnceWithoutFaults) {
    dispatcher.run(grid, "B1", 5, 3);

    EXPECT_EQ(client.total_calls(), static_cast<int>(grid.size()));
    for (const auto& tile : grid.tiles) {
        EXPECT_EQ(client.calls_for(tile), 1);
    }
}

TEST_F(ParallelDispatcherTest, EmptyGridYieldsNoResults) {
    TileGrid empty;
    EXPECT_TRUE(dispatcher.run(empty, "B1", 3, 1).empty());
}

// ============================================================================
// Retry policy
// ============================================================================

TEST_F(ParallelDispatcherTest, TransientFailureIsRetriedUpToBound) {
    const TileDescriptor& flaky = grid.tiles[7];
    client.inject(flaky, FakeImageryClient::Fault::TRANSIENT);

    std::vector<TileResult> results = dispatcher.run(grid, "B1", 3, 2);

    ASSERT_FALSE(results[7].ok());
    EXPECT_EQ(results[7].error().kind, FailureKind::TRANSIENT);
    EXPECT_EQ(results[7].attempts, 3);
    EXPECT_EQ(client.calls_for(flaky), 3);
}

TEST_F(ParallelDispatcherTest, ZeroRetriesMeansSingleAttempt) {
    client.inject(grid.tiles[0], FakeImageryClient::Fault::TRANSIENT);

    std::vector<TileResult> results = dispatcher.run(grid, "B1", 2, 0);

    EXPECT_FALSE(results[0].ok());
    EXPECT_EQ(client.calls_for(grid.tiles[0]), 1);
}

TEST_F(ParallelDispatcherTest, TransientFailureRecoversWithinBound) {
    client.inject(grid.tiles[3], FakeImageryClient::Fault::TRANSIENT, 2);

    std::vector<TileResult> results = dispatcher.run(grid, "B1", 3, 5);

    ASSERT_TRUE(results[3].ok());
    EXPECT_EQ(results[3].attempts, 3);
    EXPECT_TRUE((results[3].data() == synthetic_window(grid.tiles[3].window(), 25)).all());
}

TEST_F(ParallelDispatcherTest, PermanentAndDecodeFailuresAreNotRetried) {
    client.inject(grid.tiles[1], FakeImageryClient::Fault::PERMANENT);
    client.inject(grid.tiles[2], FakeImageryClient::Fault::CORRUPT);

    std::vector<TileResult> results = dispatcher.run(grid, "B1", 3, 5);

    EXPECT_EQ(results[1].error().kind, FailureKind::PERMANENT);
    EXPECT_EQ(results[2].error().kind, FailureKind::DECODE);
    EXPECT_EQ(client.calls_for(grid.tiles[1]), 1);
    EXPECT_EQ(client.calls_for(grid.tiles[2]), 1);
    EXPECT_TRUE(results[0].ok());
    EXPECT_TRUE(results[3].ok());
}

TEST_F(ParallelDispatcherTest, BackoffDelaysRetries) {
    ParallelDispatcher slow(fetcher, std::chrono::milliseconds(20));
    client.inject(grid.tiles[0], FakeImageryClient::Fault::TRANSIENT, 2);

    auto start = std::chrono::steady_clock::now();
    std::vector<TileResult> results = slow.run(grid, "B1", 2, 2);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(results[0].ok());
    // 20 ms then 40 ms
    EXPECT_GE(elapsed, std::chrono::milliseconds(60));
}

TEST_F(ParallelDispatcherTest, ForeignExceptionBecomesPermanentFailure) {
    client.inject(grid.tiles[4], FakeImageryClient::Fault::THROW_OTHER);

    std::vector<TileResult> results = dispatcher.run(grid, "B1", 3, 2);

    ASSERT_FALSE(results[4].ok());
    EXPECT_EQ(results[4].error().kind, FailureKind::PERMANENT);
    EXPECT_NE(results[4].error().detail.find("unexpected"), std::string::npos);
    EXPECT_EQ(client.calls_for(grid.tiles[4]), 1);
    for (size_t i = 0; i < results.size(); ++i) {
        if (i != 4) EXPECT_TRUE(results[i].ok()) << i;
    }
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(ParallelDispatcherTest, ConcurrencyNeverExceedsLimit) {
    client.set_delay(std::chrono::milliseconds(10));

    dispatcher.run(grid, "B1", 3, 0);

    EXPECT_GE(client.max_concurrent(), 1);
    EXPECT_LE(client.max_concurrent(), 3);
}

TEST_F(ParallelDispatcherTest, SingleWorkerRunsSerially) {
    client.set_delay(std::chrono::milliseconds(2));

    std::vector<TileResult> results = dispatcher.run(grid, "B1", 1, 0);

    EXPECT_EQ(client.max_concurrent(), 1);
    EXPECT_EQ(results.size(), grid.size());
}

TEST_F(ParallelDispatcherTest, InvalidLimitsAreRejected) {
    EXPECT_THROW(dispatcher.run(grid, "B1", 0, 1), ConfigurationError);
    EXPECT_THROW(dispatcher.run(grid, "B1", 2, -1), ConfigurationError);
    EXPECT_EQ(client.total_calls(), 0);
}

// ============================================================================
// Observer and cancellation
// ============================================================================

TEST_F(ParallelDispatcherTest, ObserverSeesEveryTileOnce) {
    std::mutex mutex;
    std::vector<int> seen;
    std::vector<size_t> done_values;

    CancellationToken token;
    dispatcher.run(grid, "B1", 4, 0, token, [&](TileResult& result, size_t done, size_t total) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(result.tile.index);
        done_values.push_back(done);
        EXPECT_EQ(total, grid.size());
    });

    ASSERT_EQ(seen.size(), grid.size());
    std::sort(seen.begin(), seen.end());
    std::sort(done_values.begin(), done_values.end());
    for (size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i], static_cast<int>(i));
        EXPECT_EQ(done_values[i], i + 1);
    }
}

TEST_F(ParallelDispatcherTest, CancellationAtHalfwayLeavesRestCancelled) {
    client.set_delay(std::chrono::milliseconds(20));
    const size_t total = grid.size();
    std::atomic<size_t> observed{0};

    CancellationToken token;
    std::vector<TileResult> results = dispatcher.run(
        grid, "B1", 2, 3, token, [&](TileResult&, size_t done, size_t) {
            observed++;
            if (done == total / 2) token.cancel();
        });

    ASSERT_EQ(results.size(), total);
    size_t succeeded = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].tile.index, static_cast<int>(i));
        if (results[i].ok()) {
            succeeded++;
            EXPECT_TRUE((results[i].data() == synthetic_window(results[i].tile.window(), 25)).all());
        } else {
            EXPECT_EQ(results[i].error().kind, FailureKind::CANCELLED);
        }
    }
    // The other worker may finish one more tile before it notices
    EXPECT_GE(succeeded, total / 2);
    EXPECT_LE(succeeded, total / 2 + 1);
    EXPECT_EQ(observed.load(), succeeded);
}

TEST_F(ParallelDispatcherTest, CancellationInterruptsBlockedRequests) {
    client.set_block_until_cancelled(true);
    CancellationToken token;

    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });
    std::vector<TileResult> results = dispatcher.run(grid, "B1", 3, 5, token);
    canceller.join();

    ASSERT_EQ(results.size(), grid.size());
    for (const auto& result : results) {
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error().kind, FailureKind::CANCELLED);
    }
    EXPECT_LE(client.total_calls(), 3);
}

TEST_F(ParallelDispatcherTest, CancellationInterruptsBackoff) {
    ParallelDispatcher patient(fetcher, std::chrono::seconds(30));
    for (const auto& tile : grid.tiles) {
        client.inject(tile, FakeImageryClient::Fault::TRANSIENT);
    }
    CancellationToken token;

    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    std::vector<TileResult> results = patient.run(grid, "B1", 2, 5, token);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, std::chrono::seconds(10));
    for (const auto& result : results) {
        EXPECT_EQ(result.error().kind, FailureKind::CANCELLED);
    }
}
