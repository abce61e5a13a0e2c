// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace reel::core {

// Network and HTTP level failures
enum class FetchErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    connection_lost,
    short_read,
    ssl_error,
    too_many_redirects,
    invalid_url,
    unauthorized,
    forbidden,
    not_found,
    gone,
    client_error,
    rate_limited,
    server_error,
    range_not_satisfiable,
    range_ignored,
    sink_failed,
    cancelled,
    invalid_argument,
};

// Pipeline level failures, decided by the orchestrator
enum class AcquireErrc {
    success = 0,
    manifest_parse_error,
    empty_manifest,
    variant_playlist,
    encrypted_stream,
    live_stream,
    no_rendition,
    missing_segments,
    integrity_error,
    size_mismatch,
    cancelled,
    invalid_descriptor,
};

namespace detail {

struct FetchErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::fetch";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<FetchErrc>(ev)) {
            case FetchErrc::success:               return "Success";
            case FetchErrc::network_error:         return "Network error";
            case FetchErrc::timeout:               return "Operation timed out";
            case FetchErrc::refused:               return "Connection refused";
            case FetchErrc::dns_error:             return "DNS resolution failed";
            case FetchErrc::connection_lost:       return "Connection lost";
            case FetchErrc::short_read:            return "Response shorter than declared length";
            case FetchErrc::ssl_error:             return "SSL/TLS error";
            case FetchErrc::too_many_redirects:    return "Too many redirects";
            case FetchErrc::invalid_url:           return "Invalid URL";
            case FetchErrc::unauthorized:          return "Unauthorized (401)";
            case FetchErrc::forbidden:             return "Forbidden (403)";
            case FetchErrc::not_found:             return "Resource not found (404)";
            case FetchErrc::gone:                  return "Resource gone (410)";
            case FetchErrc::client_error:          return "Client error (4xx)";
            case FetchErrc::rate_limited:          return "Rate limited";
            case FetchErrc::server_error:          return "Server error (5xx)";
            case FetchErrc::range_not_satisfiable: return "Range not satisfiable (416)";
            case FetchErrc::range_ignored:         return "Server ignored byte range";
            case FetchErrc::sink_failed:           return "Failed to store response body";
            case FetchErrc::cancelled:             return "Fetch cancelled";
            case FetchErrc::invalid_argument:      return "Invalid argument";
            default:                               return "Unknown error";
        }
    }
};

struct AcquireErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::acquire";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<AcquireErrc>(ev)) {
            case AcquireErrc::success:              return "Success";
            case AcquireErrc::manifest_parse_error: return "Not a recognisable segmented-stream manifest";
            case AcquireErrc::empty_manifest:       return "Manifest declares no segments";
            case AcquireErrc::variant_playlist:     return "Manifest lists renditions, not segments";
            case AcquireErrc::encrypted_stream:     return "Encrypted streams are not supported";
            case AcquireErrc::live_stream:          return "Live streams are not supported";
            case AcquireErrc::no_rendition:         return "No rendition available";
            case AcquireErrc::missing_segments:     return "Segments missing after retries";
            case AcquireErrc::integrity_error:      return "Segment data does not match recorded size";
            case AcquireErrc::size_mismatch:        return "Output size does not match expected size";
            case AcquireErrc::cancelled:            return "Acquisition cancelled";
            case AcquireErrc::invalid_descriptor:   return "Invalid stream descriptor";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::FetchErrcCategory& fetch_errc_category() noexcept {
    static detail::FetchErrcCategory category;
    return category;
}

inline const detail::AcquireErrcCategory& acquire_errc_category() noexcept {
    static detail::AcquireErrcCategory category;
    return category;
}

inline std::error_code make_error_code(FetchErrc e) noexcept {
    return {static_cast<int>(e), fetch_errc_category()};
}

inline std::error_code make_error_code(AcquireErrc e) noexcept {
    return {static_cast<int>(e), acquire_errc_category()};
}

// Whether a failure may succeed on another attempt
enum class FetchErrorKind : std::uint8_t {
    transient,
    permanent
};

struct FetchError {
    std::error_code code;
    FetchErrorKind kind{FetchErrorKind::permanent};
    std::int32_t http_status{0};
    std::uint32_t attempts{0};

    [[nodiscard]] bool transient() const noexcept { return kind == FetchErrorKind::transient; }
    [[nodiscard]] std::string message() const;
};

// Classify a transport level error code
[[nodiscard]] FetchErrorKind classify(std::error_code ec) noexcept;

// Map an HTTP status to an error; success (2xx) maps to an empty code
[[nodiscard]] std::error_code status_to_error(std::int32_t http_status) noexcept;

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::FetchErrc> : true_type {};

template<>
struct is_error_code_enum<reel::core::AcquireErrc> : true_type {};

} // namespace std
