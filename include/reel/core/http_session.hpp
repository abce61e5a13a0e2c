// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <reel/core/config.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace reel::core {

// Inclusive byte range, as sent in a Range header
struct ByteRange {
    std::uint64_t offset{0};
    std::uint64_t length{0};

    [[nodiscard]] std::uint64_t last() const noexcept { return offset + length - 1; }
    [[nodiscard]] std::string header_value() const;  // "offset-last"

    bool operator==(const ByteRange&) const = default;
};

// HTTP response metadata. The body is delivered to the caller's sink.
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lowercased names
    std::optional<std::uint64_t> content_length;   // As declared by the server
    std::uint64_t bytes_received{0};
    bool accepts_ranges{false};
    std::string content_type;
    std::string effective_url;                     // After redirects
};

// Receives body bytes as they arrive. Returning false aborts the transfer.
using BodySink = std::function<bool(const char* data, std::size_t size)>;

// Blocking HTTP client seam. Implementations must be safe to call from
// several threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // HEAD request. Transport failures are errors; HTTP statuses are not.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;

    // GET request, optionally for a byte range
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        const std::optional<ByteRange>& range,
        const BodySink& sink) noexcept = 0;
};

struct HttpOptions {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
    std::string user_agent;
    std::vector<std::pair<std::string, std::string>> headers;
    bool verify_tls{true};
};

// libcurl transport. One easy handle per request.
class HttpSession final : public HttpTransport {
public:
    HttpSession();
    explicit HttpSession(HttpOptions options);
    ~HttpSession() override;

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept;
    HttpSession& operator=(HttpSession&&) noexcept;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        const std::optional<ByteRange>& range,
        const BodySink& sink) noexcept override;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

// Parse a Content-Length style header value
[[nodiscard]] std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept;

// Whether a ranged GET is being answered with something other than the
// range: a 200 for a range past offset 0, or a 200 that declares or has
// delivered more than the range length
[[nodiscard]] bool range_ignored_by(std::int32_t status,
                                    const ByteRange& range,
                                    std::optional<std::uint64_t> content_length,
                                    std::uint64_t received) noexcept;

} // namespace reel::core
