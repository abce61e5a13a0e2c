// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <stop_token>

namespace reel::core {

// Bounded exponential backoff
struct RetryPolicy {
    std::uint32_t max_attempts{DEFAULT_ATTEMPT_BUDGET};
    std::chrono::milliseconds base_delay{DEFAULT_BASE_DELAY};
    std::chrono::milliseconds max_delay{DEFAULT_MAX_DELAY};

    // Delay before the next attempt, after `failed_attempts` failures.
    // base * 2^(failed_attempts - 1), capped at max_delay. Zero for 0.
    [[nodiscard]] std::chrono::milliseconds delay_for(std::uint32_t failed_attempts) const noexcept;

    // Whether another attempt is allowed after `attempts_made`
    [[nodiscard]] bool can_retry(std::uint32_t attempts_made) const noexcept {
        return attempts_made < max_attempts;
    }
};

// Sleep for `delay` unless a stop is requested first.
// Returns false when woken by the stop request.
[[nodiscard]] bool wait_for(std::chrono::milliseconds delay, std::stop_token stop) noexcept;

} // namespace reel::core
