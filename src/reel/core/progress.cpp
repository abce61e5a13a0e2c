// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/progress.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace reel::core {

ProgressState::ProgressState(std::uint32_t total, ProgressCallback callback)
    : total_(total)
    , started_at_(std::chrono::steady_clock::now())
    , callback_(std::move(callback)) {}

void ProgressState::record_success(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    ++completed_;
    total_bytes_ += bytes;
    publish_locked();
}

void ProgressState::record_failure() {
    std::lock_guard lock(mutex_);
    ++failed_;
    publish_locked();
}

ProgressSnapshot ProgressState::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_locked();
}

ProgressSnapshot ProgressState::snapshot_locked() const {
    ProgressSnapshot snap;
    snap.completed = completed_;
    snap.total = total_;
    snap.failed = failed_;
    snap.bytes_so_far = total_bytes_;
    snap.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    return snap;
}

void ProgressState::publish_locked() {
    if (!callback_) return;

    // An observer must not take down a worker thread
    try {
        callback_(snapshot_locked());
    } catch (const std::exception& e) {
        spdlog::warn("Progress observer threw: {}", e.what());
    } catch (...) {
        spdlog::warn("Progress observer threw a non-standard exception");
    }
}

} // namespace reel::core
