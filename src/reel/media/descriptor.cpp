// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/descriptor.hpp>
#include <reel/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace reel::media {

namespace {

using json = nlohmann::json;

std::unexpected<std::error_code> invalid(std::string_view what) {
    spdlog::error("Descriptor: {}", what);
    return std::unexpected(make_error_code(core::AcquireErrc::invalid_descriptor));
}

std::optional<std::vector<TrackSource>> read_tracks(const json& doc, const char* key) {
    std::vector<TrackSource> tracks;
    auto it = doc.find(key);
    if (it == doc.end()) return tracks;
    if (!it->is_array()) return std::nullopt;

    for (const auto& entry : *it) {
        if (!entry.is_object()) return std::nullopt;
        TrackSource track;
        track.url = entry.value("url", std::string());
        track.language = entry.value("language", std::string("und"));
        if (track.url.empty()) return std::nullopt;
        tracks.push_back(std::move(track));
    }
    return tracks;
}

} // namespace

std::string sanitize_filename(std::string_view name) {
    constexpr std::string_view REMOVED = "\\/*?:\"<>|,!'";

    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (REMOVED.find(c) != std::string_view::npos) continue;
        if (static_cast<unsigned char>(c) < 0x20) continue;
        if (c == ' ') c = '.';
        if (c == '.' && !out.empty() && out.back() == '.') continue;
        out += c;
    }

    while (!out.empty() && out.front() == '.') out.erase(out.begin());
    while (!out.empty() && out.back() == '.') out.pop_back();
    return out;
}

std::string ResolvedMedia::base_name() const {
    std::string name = sanitize_filename(title);
    if (name.empty()) name = "video";

    if (season || episode) {
        char tag[32];
        std::snprintf(tag, sizeof(tag), ".S%02uE%02u",
                      static_cast<unsigned>(season.value_or(1)),
                      static_cast<unsigned>(episode.value_or(1)));
        name += tag;
    }
    return name;
}

std::expected<ResolvedMedia, std::error_code> JsonMetadataResolver::parse(std::string_view text) noexcept {
    try {
        const json doc = json::parse(text);
        if (!doc.is_object()) return invalid("document is not an object");

        ResolvedMedia media;
        media.title = doc.value("title", std::string());

        if (auto it = doc.find("season"); it != doc.end()) {
            if (!it->is_number_unsigned()) return invalid("'season' must be a positive number");
            media.season = it->get<std::uint32_t>();
        }
        if (auto it = doc.find("episode"); it != doc.end()) {
            if (!it->is_number_unsigned()) return invalid("'episode' must be a positive number");
            media.episode = it->get<std::uint32_t>();
        }

        auto stream = doc.find("stream");
        if (stream == doc.end() || !stream->is_object()) return invalid("missing 'stream' object");

        auto& sd = media.stream;
        sd.manifest_url = stream->value("manifest_url", std::string());
        sd.direct_url = stream->value("direct_url", std::string());
        sd.kind = sd.manifest_url.empty() ? core::StreamKind::direct : core::StreamKind::segmented;

        if (auto it = stream->find("expected_size"); it != stream->end()) {
            if (!it->is_number_unsigned()) return invalid("'expected_size' must be a byte count");
            sd.expected_size_hint = it->get<std::uint64_t>();
        }
        if (auto it = stream->find("concurrency"); it != stream->end()) {
            if (!it->is_number_unsigned()) return invalid("'concurrency' must be a positive number");
            sd.concurrency = it->get<std::uint32_t>();
        }
        if (auto it = stream->find("rendition"); it != stream->end()) {
            if (!it->is_string()) return invalid("'rendition' must be a string");
            auto policy = parse_policy(it->get<std::string>());
            if (!policy) return invalid("unrecognised 'rendition'");
            sd.rendition = *policy;
        }

        if (sd.validate()) {
            return invalid("stream needs a manifest_url or a direct_url, and a non-zero concurrency");
        }

        auto subtitles = read_tracks(doc, "subtitles");
        if (!subtitles) return invalid("malformed 'subtitles'");
        media.subtitles = std::move(*subtitles);

        auto audio = read_tracks(doc, "audio");
        if (!audio) return invalid("malformed 'audio'");
        media.audio = std::move(*audio);

        return media;
    } catch (const json::exception& e) {
        return invalid(e.what());
    } catch (const std::exception& e) {
        return invalid(e.what());
    }
}

std::expected<ResolvedMedia, std::error_code> JsonMetadataResolver::resolve(std::string_view source) {
    std::ifstream file{std::string(source), std::ios::binary};
    if (!file) {
        spdlog::error("Cannot open descriptor {}", source);
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

} // namespace reel::media
