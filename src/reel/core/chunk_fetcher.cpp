// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/chunk_fetcher.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>

namespace reel::core {

namespace {

FetchError make_fetch_error(std::error_code ec, std::int32_t status) noexcept {
    FetchError err;
    err.code = ec;
    err.kind = classify(ec);
    err.http_status = status;
    return err;
}

// Run `attempt` until it succeeds, fails permanently, the budget is spent
// or a stop is requested. `attempt` returns expected<T, FetchError>.
template<typename T, typename Attempt>
std::expected<T, FetchError> with_retry(const RetryPolicy& policy,
                                        std::uint32_t attempt_budget,
                                        const std::string& url,
                                        std::stop_token stop,
                                        Attempt&& attempt) {
    if (attempt_budget == 0) {
        return std::unexpected(make_fetch_error(make_error_code(FetchErrc::invalid_argument), 0));
    }

    FetchError last;
    for (std::uint32_t n = 1; n <= attempt_budget; ++n) {
        if (stop.stop_requested()) {
            FetchError err = make_fetch_error(make_error_code(FetchErrc::cancelled), last.http_status);
            err.attempts = n - 1;
            return std::unexpected(err);
        }

        auto result = attempt(n);
        if (result) {
            return result;
        }

        last = std::move(result.error());
        last.attempts = n;

        if (!last.transient()) {
            spdlog::debug("{}: {} (not retried)", url, last.message());
            return std::unexpected(last);
        }

        if (n == attempt_budget) break;

        const auto delay = policy.delay_for(n);
        spdlog::debug("{}: attempt {}/{} failed: {}; retrying in {} ms",
                      url, n, attempt_budget, last.message(), delay.count());

        if (!wait_for(delay, stop)) {
            FetchError err = make_fetch_error(make_error_code(FetchErrc::cancelled), last.http_status);
            err.attempts = n;
            return std::unexpected(err);
        }
    }

    // Budget spent; the last transient cause becomes permanent
    last.kind = FetchErrorKind::permanent;
    spdlog::warn("{}: giving up: {}", url, last.message());
    return std::unexpected(last);
}

} // namespace

std::error_code check_response(const HttpResponse& response,
                               const std::optional<ByteRange>& range) noexcept {
    if (auto ec = status_to_error(response.status_code)) {
        return ec;
    }

    if (range) {
        if (response.status_code != 206) {
            // A full body is acceptable only when it is exactly the range asked for
            if (range->offset == 0 && response.bytes_received == range->length) {
                return {};
            }
            return make_error_code(FetchErrc::range_ignored);
        }
        if (response.bytes_received != range->length) {
            return make_error_code(FetchErrc::short_read);
        }
        return {};
    }

    if (response.content_length && *response.content_length != response.bytes_received) {
        return make_error_code(FetchErrc::short_read);
    }
    return {};
}

std::expected<FetchedBody, FetchError>
ChunkFetcher::fetch(const std::string& url,
                    std::uint32_t attempt_budget,
                    const std::optional<ByteRange>& range,
                    std::stop_token stop) const {
    auto attempt = [&](std::uint32_t n) -> std::expected<FetchedBody, FetchError> {
        FetchedBody body;
        BodySink sink = [&body](const char* data, std::size_t size) {
            body.data.append(data, size);
            return true;
        };

        auto response = transport_.get(url, range, sink);
        if (!response) {
            return std::unexpected(make_fetch_error(response.error(), 0));
        }
        if (auto ec = check_response(*response, range)) {
            return std::unexpected(make_fetch_error(ec, response->status_code));
        }

        body.effective_url = response->effective_url.empty() ? url : response->effective_url;
        body.attempts = n;
        return body;
    };

    return with_retry<FetchedBody>(policy_, attempt_budget, url, stop, attempt);
}

std::expected<FetchedFile, FetchError>
ChunkFetcher::fetch_to_file(const std::string& url,
                            std::uint32_t attempt_budget,
                            const std::filesystem::path& path,
                            const std::optional<ByteRange>& range,
                            std::stop_token stop) const {
    auto attempt = [&](std::uint32_t n) -> std::expected<FetchedFile, FetchError> {
        disk::FileWriter writer;
        if (auto ec = writer.open(path)) {
            return std::unexpected(make_fetch_error(ec, 0));
        }

        std::error_code disk_error;
        BodySink sink = [&writer, &disk_error](const char* data, std::size_t size) {
            disk_error = writer.write(data, size);
            return !disk_error;
        };

        auto response = transport_.get(url, range, sink);
        const auto close_error = writer.close();

        if (!response) {
            // A sink failure is reported with the disk error that caused it
            const auto ec = disk_error ? disk_error : response.error();
            return std::unexpected(make_fetch_error(ec, 0));
        }
        if (auto ec = check_response(*response, range)) {
            return std::unexpected(make_fetch_error(ec, response->status_code));
        }
        if (close_error) {
            return std::unexpected(make_fetch_error(close_error, response->status_code));
        }

        FetchedFile file;
        file.bytes = writer.bytes_written();
        file.attempts = n;
        return file;
    };

    return with_retry<FetchedFile>(policy_, attempt_budget, url, stop, attempt);
}

} // namespace reel::core
