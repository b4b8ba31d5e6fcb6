/**
 * @file ParallelDispatcher.cpp
 * @brief Implementation of the bounded worker pool
 */

#include "ParallelDispatcher.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace rasterdl {

namespace {

// Idle workers re-check cancellation at this interval
constexpr std::chrono::milliseconds kIdlePoll{20};

struct Job {
    size_t slot = 0;
    int attempt = 1;
};

// Shared state of one run(); lives on the caller's stack until all workers are joined
struct RunState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Job> queue;
    std::vector<std::optional<TileResult>> results;
    std::vector<int> attempts;
    size_t remaining = 0;
    bool aborted = false;  // worker startup failed
};

} // namespace

ParallelDispatcher::ParallelDispatcher(const TileFetcher& fetcher,
                                       std::chrono::milliseconds retry_backoff)
    : fetcher_(fetcher), retry_backoff_(retry_backoff), logger_("ParallelDispatcher") {
}

std::vector<TileResult> ParallelDispatcher::run(const TileGrid& grid, const std::string& band,
                                                int concurrency, int max_retries) const {
    CancellationToken never_cancelled;
    return run(grid, band, concurrency, max_retries, never_cancelled);
}

TileResult ParallelDispatcher::fetch_guarded(const TileDescriptor& tile, const std::string& band,
                                             const CancellationToken& token, int attempt) const {
    // A worker must never die with a tile in hand: anything escaping the
    // fetch becomes a failure of that tile
    try {
        return fetcher_.fetch(tile, band, token, attempt);
    } catch (const std::exception& e) {
        logger_.error("Unexpected error fetching " + tile.to_string() + ": " + e.what());
        return TileResult::failure(tile, FailureKind::PERMANENT,
                                   std::string("unexpected error: ") + e.what(), attempt);
    } catch (...) {
        logger_.error("Unexpected non-standard exception fetching " + tile.to_string());
        return TileResult::failure(tile, FailureKind::PERMANENT,
                                   "unexpected non-standard exception", attempt);
    }
}

std::vector<TileResult> ParallelDispatcher::run(const TileGrid& grid, const std::string& band,
                                                int concurrency, int max_retries,
                                                const CancellationToken& token,
                                                const TerminalObserver& on_terminal) const {
    if (concurrency < 1) {
        throw ConfigurationError("concurrency must be at least 1, got " + std::to_string(concurrency));
    }
    if (max_retries < 0) {
        throw ConfigurationError("max_retries must not be negative, got " + std::to_string(max_retries));
    }

    const size_t total = grid.tiles.size();
    if (total == 0) {
        return {};
    }

    RunState state;
    state.results.resize(total);
    state.attempts.assign(total, 0);
    state.remaining = total;
    for (size_t slot = 0; slot < total; ++slot) {
        state.queue.push_back({slot, 1});
    }

    const size_t worker_count = std::min(static_cast<size_t>(concurrency), total);
    logger_.info("Dispatching " + std::to_string(total) + " tiles on " +
                 std::to_string(worker_count) + " workers (max " +
                 std::to_string(max_retries) + " retries per tile)");

    auto finalize = [&](size_t slot, TileResult&& result) {
        size_t done = 0;
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (token.is_cancelled() || state.results[slot].has_value()) {
                logger_.debug("Discarding late result for " + result.tile.to_string());
                return;
            }
            state.results[slot] = std::move(result);
            state.remaining--;
            done = total - state.remaining;
        }
        state.cv.notify_all();

        // Slot is written once and never touched by other workers again
        TileResult& stored = *state.results[slot];
        if (stored.ok()) {
            logger_.detailed(stored.tile.to_string() + " done after " +
                             std::to_string(stored.attempts) + " attempt(s)");
        } else {
            logger_.warning(stored.tile.to_string() + " failed (" +
                            failure_kind_name(stored.error().kind) + ") after " +
                            std::to_string(stored.attempts) + " attempt(s): " + stored.error().detail);
        }

        if (on_terminal) {
            try {
                on_terminal(stored, done, total);
            } catch (const std::exception& e) {
                logger_.error("Tile observer failed for " + stored.tile.to_string() + ": " + e.what());
            }
        }
    };

    auto worker = [&]() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(state.mutex);
                while (state.queue.empty() && state.remaining > 0 &&
                       !state.aborted && !token.is_cancelled()) {
                    state.cv.wait_for(lock, kIdlePoll);
                }
                if (state.remaining == 0 || state.aborted || token.is_cancelled()) {
                    return;
                }
                job = state.queue.front();
                state.queue.pop_front();
                state.attempts[job.slot] = job.attempt;
            }

            const TileDescriptor& tile = grid.tiles[job.slot];
            TileResult result = fetch_guarded(tile, band, token, job.attempt);

            const bool retryable = !result.ok() && result.error().kind == FailureKind::TRANSIENT;
            if (retryable && job.attempt <= max_retries && !token.is_cancelled()) {
                logger_.warning(tile.to_string() + " attempt " + std::to_string(job.attempt) + "/" +
                                std::to_string(max_retries + 1) + " failed: " + result.error().detail);

                const std::chrono::milliseconds delay = retry_backoff_ * (1 << std::min(job.attempt - 1, 16));
                if (delay.count() > 0 && token.wait_for(delay)) {
                    continue;  // cancelled while backing off; swept below
                }

                {
                    std::lock_guard<std::mutex> lock(state.mutex);
                    state.queue.push_back({job.slot, job.attempt + 1});
                }
                state.cv.notify_one();
                continue;
            }

            finalize(job.slot, std::move(result));
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    try {
        for (size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error&) {
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.aborted = true;
        }
        state.cv.notify_all();
        for (auto& t : workers) {
            t.join();
        }
        throw;
    }

    // Completion barrier
    for (auto& t : workers) {
        t.join();
    }

    std::vector<TileResult> results;
    results.reserve(total);
    size_t cancelled = 0;
    for (size_t slot = 0; slot < total; ++slot) {
        if (state.results[slot].has_value()) {
            results.push_back(std::move(*state.results[slot]));
        } else {
            results.push_back(TileResult::failure(grid.tiles[slot], FailureKind::CANCELLED,
                                                  "download cancelled", state.attempts[slot]));
            cancelled++;
        }
    }

    if (cancelled > 0) {
        logger_.warning("Cancelled with " + std::to_string(cancelled) + " of " +
                        std::to_string(total) + " tiles unfinished");
    }

    return results;
}

} // namespace rasterdl
