/**
 * @file CancellationToken.cpp
 * @brief Implementation of cooperative cancellation
 */

#include "CancellationToken.hpp"

namespace rasterdl {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return is_cancelled(); });
}

} // namespace rasterdl
