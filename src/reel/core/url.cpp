// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace reel::core {

namespace {

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
bool has_scheme(std::string_view ref) noexcept {
    if (ref.empty() || !std::isalpha(static_cast<unsigned char>(ref.front()))) {
        return false;
    }
    for (std::size_t i = 1; i < ref.size(); ++i) {
        const auto c = static_cast<unsigned char>(ref[i]);
        if (c == ':') return true;
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return false;
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Split "path?query#fragment" into the path and everything after it
std::pair<std::string_view, std::string_view> split_path(std::string_view ref) noexcept {
    auto cut = ref.find_first_of("?#");
    if (cut == std::string_view::npos) {
        return {ref, {}};
    }
    return {ref.substr(0, cut), ref.substr(cut)};
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0 ||
            !has_scheme(url_str.substr(0, scheme_end + 1))) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }
        url.scheme_ = to_lower(url_str.substr(0, scheme_end));

        auto rest_start = scheme_end + 3;
        auto authority_end = url_str.find_first_of("/?#", rest_start);
        if (authority_end == std::string_view::npos) {
            authority_end = url_str.size();
        }

        auto authority = url_str.substr(rest_start, authority_end - rest_start);

        // user:pass@host:port
        auto at_pos = authority.rfind('@');
        if (at_pos != std::string_view::npos) {
            url.userinfo_ = std::string(authority.substr(0, at_pos));
            authority.remove_prefix(at_pos + 1);
        }

        // IPv6 literal [2001:db8::1]:port
        if (!authority.empty() && authority.front() == '[') {
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(FetchErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            auto after = authority.substr(bracket_end + 1);
            if (after.starts_with(":")) {
                url.port_ = std::string(after.substr(1));
            }
        } else {
            auto colon_pos = authority.rfind(':');
            if (colon_pos != std::string_view::npos) {
                url.host_ = to_lower(authority.substr(0, colon_pos));
                url.port_ = std::string(authority.substr(colon_pos + 1));
            } else {
                url.host_ = to_lower(authority);
            }
        }

        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        // file:// URLs carry an empty authority
        if (url.host_.empty() && url.scheme_ != "file") {
            return std::unexpected(make_error_code(FetchErrc::invalid_url));
        }

        auto remainder = url_str.substr(authority_end);
        auto fragment_start = remainder.find('#');
        if (fragment_start != std::string_view::npos) {
            url.fragment_ = std::string(remainder.substr(fragment_start + 1));
            remainder = remainder.substr(0, fragment_start);
        }
        auto query_start = remainder.find('?');
        if (query_start != std::string_view::npos) {
            url.query_ = std::string(remainder.substr(query_start + 1));
            remainder = remainder.substr(0, query_start);
        }
        url.path_ = remainder.empty() ? "/" : std::string(remainder);

        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    if (!userinfo_.empty()) {
        result += userinfo_;
        result += "@";
    }
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    if (scheme_ == "ftp") return 21;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_;
    }
    return path_.substr(last_slash + 1);
}

std::string Url::extension() const {
    auto name = filename();
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return {};
    }
    return to_lower(std::string_view(name).substr(dot));
}

//=============================================================================
// Reference resolution
//=============================================================================

std::string remove_dot_segments(std::string_view path) {
    std::vector<std::string_view> out;
    const bool absolute = !path.empty() && path.front() == '/';
    bool trailing_slash = false;

    std::size_t pos = absolute ? 1 : 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        auto segment = path.substr(pos, next - pos);
        const bool last = next == path.size();

        if (segment == ".") {
            trailing_slash = last;
        } else if (segment == "..") {
            if (!out.empty()) out.pop_back();
            trailing_slash = last;
        } else {
            out.push_back(segment);
            trailing_slash = false;
        }
        pos = next + 1;
    }

    std::string result = absolute ? "/" : "";
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (i > 0) result += '/';
        result += out[i];
    }
    if (trailing_slash && (result.empty() || result.back() != '/')) {
        result += '/';
    }
    return result;
}

std::string resolve_url(std::string_view base, std::string_view reference) {
    if (has_scheme(reference)) {
        return std::string(reference);
    }

    auto parsed = Url::parse(base);
    if (!parsed) {
        // Not an absolute base: plain directory join
        std::string joined(base.substr(0, base.rfind('/') + 1));
        return joined + std::string(reference);
    }
    const Url& b = *parsed;

    if (reference.empty()) {
        std::string result = b.base() + b.path();
        if (!b.query().empty()) result += "?" + b.query();
        return result;
    }

    if (reference.starts_with("//")) {
        return b.scheme() + ":" + std::string(reference);
    }

    if (reference.front() == '#') {
        std::string result = b.base() + b.path();
        if (!b.query().empty()) result += "?" + b.query();
        return result + std::string(reference);
    }

    if (reference.front() == '?') {
        return b.base() + b.path() + std::string(reference);
    }

    auto [ref_path, ref_suffix] = split_path(reference);

    std::string merged;
    if (ref_path.front() == '/') {
        merged = std::string(ref_path);
    } else {
        const auto& base_path = b.path();
        merged = base_path.substr(0, base_path.rfind('/') + 1);
        merged += ref_path;
    }

    return b.base() + remove_dot_segments(merged) + std::string(ref_suffix);
}

} // namespace reel::core
