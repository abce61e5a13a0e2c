// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/retry.hpp>
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace reel::core {

std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t failed_attempts) const noexcept {
    if (failed_attempts == 0 || base_delay.count() <= 0) {
        return std::chrono::milliseconds{0};
    }

    // Shift is capped so the multiplication cannot overflow
    const std::uint32_t shift = std::min<std::uint32_t>(failed_attempts - 1, 20);
    const auto scaled = base_delay.count() * (std::int64_t{1} << shift);
    return std::chrono::milliseconds{std::min<std::int64_t>(scaled, max_delay.count())};
}

bool wait_for(std::chrono::milliseconds delay, std::stop_token stop) noexcept {
    if (stop.stop_requested()) return false;
    if (delay.count() <= 0) return true;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    // Nothing notifies cv; only the timeout or the stop token wakes it
    const bool satisfied = cv.wait_for(lock, stop, delay, [] { return false; });
    return !satisfied && !stop.stop_requested();
}

} // namespace reel::core
