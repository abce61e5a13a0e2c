// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reel::media::detail {

inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::optional<std::uint64_t> parse_uint(std::string_view s) noexcept {
    s = trim(s);
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}

inline std::optional<std::int64_t> parse_int(std::string_view s) noexcept {
    s = trim(s);
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}

inline std::optional<double> parse_double(std::string_view s) noexcept {
    s = trim(s);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}

// "30000/1001" or "29.97"
inline std::optional<double> parse_frame_rate(std::string_view s) noexcept {
    auto slash = s.find('/');
    if (slash == std::string_view::npos) {
        return parse_double(s);
    }
    auto num = parse_double(s.substr(0, slash));
    auto den = parse_double(s.substr(slash + 1));
    if (!num || !den || *den == 0.0) {
        return std::nullopt;
    }
    return *num / *den;
}

} // namespace reel::media::detail
