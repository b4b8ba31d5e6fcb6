/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation shared by the downloader stages
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace rasterdl {

/**
 * @brief One-way flag a caller raises to abort a download
 *
 * Workers poll is_cancelled() between steps and sleep through wait_for(),
 * which wakes as soon as cancel() is called. Once cancelled a token stays
 * cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /**
     * @brief Sleep for up to the given duration
     * @return true if the token was (or became) cancelled
     */
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace rasterdl
