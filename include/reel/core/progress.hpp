// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace reel::core {

// Point-in-time view of a run, handed to observers
struct ProgressSnapshot {
    std::uint32_t completed{0};          // Segments finished successfully
    std::uint32_t total{0};
    std::uint32_t failed{0};
    std::uint64_t bytes_so_far{0};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] std::uint32_t finished() const noexcept { return completed + failed; }

    [[nodiscard]] double percent() const noexcept {
        return total > 0 ? static_cast<double>(finished()) * 100.0 / static_cast<double>(total) : 0.0;
    }

    // Average throughput since the run started
    [[nodiscard]] std::uint64_t speed_bps() const noexcept {
        const auto ms = elapsed.count();
        return ms > 0 ? bytes_so_far * 1000 / static_cast<std::uint64_t>(ms) : 0;
    }
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

// Run-scoped progress counters. One instance per acquisition run; every
// mutation and the matching callback happen under the same lock, so
// observers see snapshots in mutation order.
class ProgressState {
public:
    ProgressState(std::uint32_t total, ProgressCallback callback);

    // Non-copyable, non-movable (owns a mutex)
    ProgressState(const ProgressState&) = delete;
    ProgressState& operator=(const ProgressState&) = delete;

    void record_success(std::uint64_t bytes);
    void record_failure();

    [[nodiscard]] ProgressSnapshot snapshot() const;

private:
    [[nodiscard]] ProgressSnapshot snapshot_locked() const;
    void publish_locked();

    std::uint32_t total_;
    std::uint32_t completed_{0};
    std::uint32_t failed_{0};
    std::uint64_t total_bytes_{0};
    std::chrono::steady_clock::time_point started_at_;
    ProgressCallback callback_;
    mutable std::mutex mutex_;
};

} // namespace reel::core
