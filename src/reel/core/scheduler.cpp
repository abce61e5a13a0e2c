// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/scheduler.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace reel::core {

ResultMap ConcurrencyScheduler::run(const media::SegmentList& segments,
                                    std::uint32_t concurrency_limit,
                                    const ProgressCallback& on_progress,
                                    std::stop_token stop) const {
    ResultMap results;
    if (segments.empty()) {
        return results;
    }

    if (concurrency_limit == 0) {
        spdlog::error("Concurrency limit of 0; no segment dispatched");
        for (const auto& seg : segments) {
            SegmentResult r;
            r.sequence_index = seg.sequence_index;
            r.status = SegmentStatus::failed;
            r.error = FetchError{make_error_code(FetchErrc::invalid_argument)};
            results.emplace(seg.sequence_index, std::move(r));
        }
        return results;
    }

    const auto total = static_cast<std::uint32_t>(segments.size());
    ProgressState progress(total, on_progress);
    std::mutex results_mutex;
    std::atomic<std::size_t> cursor{0};

    auto worker = [&] {
        while (!stop.stop_requested()) {
            const std::size_t i = cursor.fetch_add(1, std::memory_order_relaxed);
            if (i >= segments.size()) break;

            const auto& seg = segments[i];
            SegmentResult r;
            r.sequence_index = seg.sequence_index;
            r.spool_path = spool_.part_path(seg.sequence_index);

            auto fetched = fetcher_.fetch_to_file(seg.url, attempt_budget_, r.spool_path,
                                                  seg.byte_range, stop);
            if (fetched) {
                r.status = SegmentStatus::success;
                r.bytes = fetched->bytes;
                r.attempts = fetched->attempts;
            } else {
                r.status = SegmentStatus::failed;
                r.attempts = fetched.error().attempts;
                r.error = fetched.error();
                disk::remove_quietly(r.spool_path);
                spdlog::warn("Segment {} failed: {}", seg.sequence_index, fetched.error().message());
            }

            const bool ok = r.ok();
            const std::uint64_t bytes = r.bytes;
            {
                std::lock_guard lock(results_mutex);
                results.emplace(seg.sequence_index, std::move(r));
            }

            if (ok) {
                progress.record_success(bytes);
            } else {
                progress.record_failure();
            }
        }
    };

    const std::uint32_t worker_count = std::min(concurrency_limit, total);
    spdlog::debug("Fetching {} segments with {} workers", total, worker_count);

    {
        std::vector<std::jthread> pool;
        pool.reserve(worker_count);
        for (std::uint32_t w = 0; w < worker_count; ++w) {
            try {
                pool.emplace_back(worker);
            } catch (const std::system_error& e) {
                spdlog::warn("Could only start {} of {} workers: {}", pool.size(), worker_count, e.what());
                break;
            }
        }

        if (pool.empty()) {
            worker();
        }
        // jthread joins on destruction
    }

    if (stop.stop_requested()) {
        spdlog::info("Run stopped after {} of {} segments", results.size(), total);
    }
    return results;
}

std::vector<std::uint32_t> missing_indices(const ResultMap& results, std::uint32_t expected_count) {
    std::vector<std::uint32_t> missing;
    for (std::uint32_t i = 0; i < expected_count; ++i) {
        auto it = results.find(i);
        if (it == results.end() || !it->second.ok()) {
            missing.push_back(i);
        }
    }
    return missing;
}

} // namespace reel::core
