// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/retry.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace reel::core {

// Body fetched into memory (manifests, small documents)
struct FetchedBody {
    std::string data;
    std::string effective_url;   // After redirects; base for relative references
    std::uint32_t attempts{0};
};

// Body fetched into a spool file
struct FetchedFile {
    std::uint64_t bytes{0};
    std::uint32_t attempts{0};
};

// Fetches one resource with bounded retry. Holds no per-call state, so one
// instance may be shared by every worker of a run.
class ChunkFetcher {
public:
    ChunkFetcher(HttpTransport& transport, RetryPolicy policy) noexcept
        : transport_(transport), policy_(policy) {}

    // Fetch into memory. `attempt_budget` is the total number of attempts.
    [[nodiscard]] std::expected<FetchedBody, FetchError>
    fetch(const std::string& url,
          std::uint32_t attempt_budget,
          const std::optional<ByteRange>& range = std::nullopt,
          std::stop_token stop = {}) const;

    // Fetch into `path`, truncating it before every attempt
    [[nodiscard]] std::expected<FetchedFile, FetchError>
    fetch_to_file(const std::string& url,
                  std::uint32_t attempt_budget,
                  const std::filesystem::path& path,
                  const std::optional<ByteRange>& range = std::nullopt,
                  std::stop_token stop = {}) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] HttpTransport& transport() const noexcept { return transport_; }

private:
    HttpTransport& transport_;
    RetryPolicy policy_;
};

// Check a completed response against the request. Returns an empty code
// when the body is complete and the status is a success.
[[nodiscard]] std::error_code check_response(const HttpResponse& response,
                                             const std::optional<ByteRange>& range) noexcept;

} // namespace reel::core
