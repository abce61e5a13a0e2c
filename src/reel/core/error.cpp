// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/error.hpp>

namespace reel::core {

std::string FetchError::message() const {
    std::string text = code.message();
    if (http_status > 0) {
        text += " [HTTP " + std::to_string(http_status) + "]";
    }
    if (attempts > 1) {
        text += " after " + std::to_string(attempts) + " attempts";
    }
    return text;
}

FetchErrorKind classify(std::error_code ec) noexcept {
    if (ec.category() != fetch_errc_category()) {
        return FetchErrorKind::permanent;
    }

    switch (static_cast<FetchErrc>(ec.value())) {
        case FetchErrc::network_error:
        case FetchErrc::timeout:
        case FetchErrc::refused:
        case FetchErrc::dns_error:
        case FetchErrc::connection_lost:
        case FetchErrc::short_read:
        case FetchErrc::rate_limited:
        case FetchErrc::server_error:
            return FetchErrorKind::transient;
        default:
            return FetchErrorKind::permanent;
    }
}

std::error_code status_to_error(std::int32_t http_status) noexcept {
    if (http_status >= 200 && http_status < 300) return {};

    switch (http_status) {
        case 401: return make_error_code(FetchErrc::unauthorized);
        case 403: return make_error_code(FetchErrc::forbidden);
        case 404: return make_error_code(FetchErrc::not_found);
        case 410: return make_error_code(FetchErrc::gone);
        case 416: return make_error_code(FetchErrc::range_not_satisfiable);
        case 408: return make_error_code(FetchErrc::timeout);
        case 425:                                   // Too early
        case 429: return make_error_code(FetchErrc::rate_limited);
        default: break;
    }

    if (http_status >= 500) return make_error_code(FetchErrc::server_error);
    if (http_status >= 400) return make_error_code(FetchErrc::client_error);

    // 1xx/3xx reaching us means redirects were not followed
    return make_error_code(FetchErrc::too_many_redirects);
}

} // namespace reel::core
