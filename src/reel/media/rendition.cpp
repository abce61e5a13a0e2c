// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/rendition.hpp>
#include "parse_util.hpp"

namespace reel::media {

namespace {

std::uint32_t height_distance(std::uint32_t a, std::uint32_t b) noexcept {
    return a > b ? a - b : b - a;
}

// Whether `a` is a better preferred_height match than `b`
bool closer(const Rendition& a, const Rendition& b, std::uint32_t target) noexcept {
    const auto da = height_distance(a.height, target);
    const auto db = height_distance(b.height, target);
    if (da != db) return da < db;
    if (a.height != b.height) return a.height > b.height;   // Prefer taller on a tie
    return a.bandwidth > b.bandwidth;
}

} // namespace

std::string Rendition::describe() const {
    std::string out;
    if (height > 0) {
        out = std::to_string(width) + "x" + std::to_string(height) + " ";
    }
    out += std::to_string(bandwidth / 1000) + " kbps";
    if (!codecs.empty()) {
        out += " (" + codecs + ")";
    }
    return out;
}

std::string RenditionPolicy::describe() const {
    switch (kind) {
        case Kind::highest_bandwidth: return "highest bandwidth";
        case Kind::lowest_bandwidth:  return "lowest bandwidth";
        case Kind::preferred_height:  return "closest to " + std::to_string(height) + "p";
    }
    return "unknown";
}

std::expected<Rendition, std::error_code>
select_rendition(const std::vector<Rendition>& renditions, const RenditionPolicy& policy) noexcept {
    if (renditions.empty()) {
        return std::unexpected(make_error_code(core::AcquireErrc::no_rendition));
    }

    auto by_bandwidth = [](const Rendition& a, const Rendition& b) {
        return a.bandwidth < b.bandwidth;
    };

    switch (policy.kind) {
        case RenditionPolicy::Kind::lowest_bandwidth:
            return *std::min_element(renditions.begin(), renditions.end(), by_bandwidth);

        case RenditionPolicy::Kind::preferred_height: {
            const Rendition* best = nullptr;
            for (const auto& r : renditions) {
                if (r.height == 0) continue;
                if (!best || closer(r, *best, policy.height)) best = &r;
            }
            if (best) return *best;
            // No resolutions declared
            break;
        }

        case RenditionPolicy::Kind::highest_bandwidth:
            break;
    }

    return *std::max_element(renditions.begin(), renditions.end(), by_bandwidth);
}

std::vector<Rendition> renditions_from(const HLSPlaylist& playlist) {
    std::vector<Rendition> out;
    out.reserve(playlist.variants.size());
    for (const auto& v : playlist.variants) {
        Rendition r;
        r.bandwidth = v.bandwidth;
        r.width = v.width;
        r.height = v.height;
        r.frame_rate = v.frame_rate;
        r.codecs = v.codecs;
        r.url = v.url;
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<Rendition> renditions_from(const DASHManifest& manifest) {
    bool any_video = false;
    for (const auto& set : manifest.adaptation_sets) {
        if (set.is_video()) {
            any_video = true;
            break;
        }
    }

    std::vector<Rendition> out;
    for (const auto& set : manifest.adaptation_sets) {
        if (any_video && !set.is_video()) continue;
        for (const auto& rep : set.representations) {
            Rendition r;
            r.bandwidth = rep.bandwidth;
            r.width = rep.width;
            r.height = rep.height;
            r.frame_rate = rep.frame_rate;
            r.codecs = rep.codecs;
            r.url = rep.base_url;
            r.id = rep.id;
            out.push_back(std::move(r));
        }
    }
    return out;
}

std::expected<RenditionPolicy, std::error_code> parse_policy(std::string_view text) noexcept {
    auto value = detail::trim(text);
    if (value.empty() || value == "best" || value == "highest") {
        return RenditionPolicy::highest();
    }
    if (value == "worst" || value == "lowest") {
        return RenditionPolicy::lowest();
    }
    if (value.ends_with('p') || value.ends_with('P')) {
        value.remove_suffix(1);
    }
    auto height = detail::parse_uint(value);
    if (!height || *height == 0 || *height > 100000) {
        return std::unexpected(make_error_code(core::FetchErrc::invalid_argument));
    }
    return RenditionPolicy::prefer_height(static_cast<std::uint32_t>(*height));
}

} // namespace reel::media
