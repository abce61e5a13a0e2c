// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/direct_fetch.hpp>
#include <reel/core/assembler.hpp>
#include <reel/core/scheduler.hpp>
#include <reel/disk/file_writer.hpp>
#include <reel/disk/spool.hpp>
#include <spdlog/spdlog.h>

namespace reel::core {

namespace {

FetchError permanent(std::error_code ec, std::uint32_t attempts = 0) {
    FetchError err;
    err.code = ec;
    err.kind = FetchErrorKind::permanent;
    err.attempts = attempts;
    return err;
}

bool is_range_refusal(const FetchError& err) noexcept {
    return err.code == FetchErrc::range_ignored || err.code == FetchErrc::range_not_satisfiable;
}

} // namespace

std::vector<ByteRange> split_ranges(std::uint64_t size, std::uint32_t parts) {
    std::vector<ByteRange> ranges;
    if (size == 0 || parts == 0) return ranges;
    if (parts > size) parts = static_cast<std::uint32_t>(size);

    const std::uint64_t base = size / parts;
    const std::uint64_t extra = size % parts;
    std::uint64_t offset = 0;
    for (std::uint32_t i = 0; i < parts; ++i) {
        const std::uint64_t length = base + (i < extra ? 1 : 0);
        ranges.push_back({offset, length});
        offset += length;
    }
    return ranges;
}

std::error_code DirectFetcher::verify_size(std::uint64_t bytes) const noexcept {
    if (options_.expected_size && *options_.expected_size != bytes) {
        spdlog::error("Downloaded {} bytes, expected {}", bytes, *options_.expected_size);
        return make_error_code(AcquireErrc::size_mismatch);
    }
    return {};
}

std::expected<DirectResult, FetchError>
DirectFetcher::fetch_direct(const std::string& url,
                            const std::filesystem::path& output_path,
                            const ProgressCallback& on_progress,
                            std::stop_token stop) const {
    if (options_.connections > 1) {
        auto probe = fetcher_.transport().head(url);
        if (!probe) {
            spdlog::info("HEAD {} failed ({}); using a single request", url, probe.error().message());
        } else if (status_to_error(probe->status_code)) {
            spdlog::info("HEAD {} returned {}; using a single request", url, probe->status_code);
        } else if (!probe->accepts_ranges || !probe->content_length) {
            spdlog::info("Server does not support ranges for {}; using a single request", url);
        } else if (*probe->content_length < options_.min_ranged_size) {
            spdlog::debug("{} is {} bytes; too small to split", url, *probe->content_length);
        } else {
            bool fall_back = false;
            auto ranged = fetch_ranged(url, *probe->content_length, output_path, on_progress, stop, fall_back);
            if (ranged || !fall_back) {
                return ranged;
            }
            spdlog::warn("Server refused byte ranges for {}; retrying as a single request", url);
        }
    }

    return fetch_single(url, output_path, on_progress, stop);
}

std::expected<DirectResult, FetchError>
DirectFetcher::fetch_single(const std::string& url,
                            const std::filesystem::path& output_path,
                            const ProgressCallback& on_progress,
                            std::stop_token stop) const {
    ProgressState progress(1, on_progress);
    const auto partial = partial_path(output_path);

    auto fetched = fetcher_.fetch_to_file(url, options_.attempt_budget, partial, std::nullopt, stop);
    if (!fetched) {
        disk::remove_quietly(partial);
        progress.record_failure();
        return std::unexpected(fetched.error());
    }

    if (auto ec = verify_size(fetched->bytes)) {
        disk::remove_quietly(partial);
        progress.record_failure();
        return std::unexpected(permanent(ec, fetched->attempts));
    }

    if (auto ec = disk::rename_file(partial, output_path)) {
        disk::remove_quietly(partial);
        progress.record_failure();
        return std::unexpected(permanent(ec, fetched->attempts));
    }

    progress.record_success(fetched->bytes);

    DirectResult result;
    result.path = output_path;
    result.bytes = fetched->bytes;
    result.attempts = fetched->attempts;
    return result;
}

std::expected<DirectResult, FetchError>
DirectFetcher::fetch_ranged(const std::string& url,
                            std::uint64_t size,
                            const std::filesystem::path& output_path,
                            const ProgressCallback& on_progress,
                            std::stop_token stop,
                            bool& fall_back) const {
    auto spool = disk::SpoolDirectory::create(output_path);
    if (!spool) {
        return std::unexpected(permanent(spool.error()));
    }

    media::SegmentList segments;
    for (const auto& range : split_ranges(size, options_.connections)) {
        media::SegmentDescriptor seg;
        seg.sequence_index = static_cast<std::uint32_t>(segments.size());
        seg.url = url;
        seg.byte_range = range;
        seg.estimated_bytes = range.length;
        segments.push_back(std::move(seg));
    }

    spdlog::info("Fetching {} bytes in {} ranges", size, segments.size());

    ConcurrencyScheduler scheduler(fetcher_, options_.attempt_budget, *spool);
    auto results = scheduler.run(segments, options_.connections, on_progress, stop);

    std::uint32_t attempts = 0;
    const FetchError* first_failure = nullptr;
    for (const auto& [index, r] : results) {
        attempts += r.attempts;
        if (!r.ok() && r.error && !first_failure) {
            first_failure = &*r.error;
        }
    }

    if (stop.stop_requested()) {
        return std::unexpected(permanent(make_error_code(FetchErrc::cancelled), attempts));
    }

    if (first_failure) {
        fall_back = is_range_refusal(*first_failure);
        FetchError err = *first_failure;
        err.attempts = attempts;
        return std::unexpected(err);
    }

    auto assembled = assemble(results, static_cast<std::uint32_t>(segments.size()), output_path);
    if (!assembled) {
        return std::unexpected(permanent(assembled.error().code, attempts));
    }

    if (auto ec = verify_size(size)) {
        disk::remove_quietly(output_path);
        return std::unexpected(permanent(ec, attempts));
    }

    DirectResult result;
    result.path = *assembled;
    result.bytes = size;
    result.attempts = attempts;
    result.ranges = static_cast<std::uint32_t>(segments.size());
    return result;
}

} // namespace reel::core
