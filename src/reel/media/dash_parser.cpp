// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/dash_parser.hpp>
#include <reel/core/url.hpp>
#include <spdlog/spdlog.h>
#include <QByteArray>
#include <QXmlStreamReader>
#include <cmath>
#include <cstdint>
#include <functional>
#include <map>
#include <new>
#include "parse_util.hpp"

namespace reel::media {

namespace {

// Guards against a timeline or duration that expands without bound
constexpr std::uint64_t MAX_SEGMENTS_PER_REPRESENTATION = 1'000'000;

std::unexpected<std::error_code> parse_error() noexcept {
    return std::unexpected(make_error_code(core::AcquireErrc::manifest_parse_error));
}

// Element tree of an MPD. Names are local names without the namespace
// prefix; attribute names are kept as written.
struct MpdElement {
    std::string name;
    std::map<std::string, std::string, std::less<>> attributes;
    std::vector<MpdElement> children;
    std::string text;

    [[nodiscard]] const MpdElement* child(std::string_view child_name) const noexcept {
        for (const auto& c : children) {
            if (c.name == child_name) return &c;
        }
        return nullptr;
    }

    [[nodiscard]] std::vector<const MpdElement*> children_named(std::string_view child_name) const {
        std::vector<const MpdElement*> out;
        for (const auto& c : children) {
            if (c.name == child_name) out.push_back(&c);
        }
        return out;
    }

    [[nodiscard]] std::string attribute(std::string_view key, std::string_view fallback = {}) const {
        auto it = attributes.find(key);
        return it != attributes.end() ? it->second : std::string(fallback);
    }

    [[nodiscard]] bool has_attribute(std::string_view key) const noexcept {
        return attributes.find(key) != attributes.end();
    }
};

// Build the element tree with QXmlStreamReader
std::expected<MpdElement, std::error_code> read_mpd(std::string_view document) {
    const QByteArray bytes = QByteArray::fromRawData(document.data(), static_cast<qsizetype>(document.size()));
    QXmlStreamReader xml(bytes);

    std::vector<MpdElement> open;
    std::optional<MpdElement> root;

    while (!xml.atEnd()) {
        const QXmlStreamReader::TokenType token = xml.readNext();
        if (token == QXmlStreamReader::StartElement) {
            MpdElement element;
            element.name = xml.name().toString().toStdString();
            const QXmlStreamAttributes attrs = xml.attributes();
            for (const auto& attr : attrs) {
                element.attributes.emplace(attr.qualifiedName().toString().toStdString(),
                                           attr.value().toString().toStdString());
            }
            open.push_back(std::move(element));
        } else if (token == QXmlStreamReader::Characters) {
            if (!open.empty()) {
                open.back().text += xml.text().toString().toStdString();
            }
        } else if (token == QXmlStreamReader::EndElement && !open.empty()) {
            MpdElement done = std::move(open.back());
            open.pop_back();
            if (open.empty()) {
                root = std::move(done);
            } else {
                open.back().children.push_back(std::move(done));
            }
        }
    }

    if (xml.hasError() || !root) {
        spdlog::error("MPD is not well-formed XML (line {}): {}",
                      xml.lineNumber(), xml.errorString().toStdString());
        return parse_error();
    }
    return std::move(*root);
}

// "first-last", inclusive
std::optional<core::ByteRange> parse_range(std::string_view value) noexcept {
    auto dash = value.find('-');
    if (dash == std::string_view::npos) return std::nullopt;
    auto first = detail::parse_uint(value.substr(0, dash));
    auto last = detail::parse_uint(value.substr(dash + 1));
    if (!first || !last || *last < *first) return std::nullopt;
    return core::ByteRange{*first, *last - *first + 1};
}

std::optional<std::uint64_t> uint_attribute(const MpdElement& node, std::string_view key) noexcept {
    auto it = node.attributes.find(key);
    if (it == node.attributes.end()) return std::nullopt;
    return detail::parse_uint(it->second);
}

// BaseURL child resolved against the parent level's base
std::string apply_base(const std::string& parent, const MpdElement& node, bool& has_base) {
    const MpdElement* base = node.child("BaseURL");
    if (!base) return parent;
    auto text = detail::trim(base->text);
    if (text.empty()) return parent;
    has_base = true;
    return core::resolve_url(parent, text);
}

// SegmentTemplate attributes inherit from Period to AdaptationSet to Representation
struct TemplateInfo {
    bool present{false};
    std::string media;
    std::string initialization;
    std::optional<std::uint64_t> timescale;
    std::optional<std::uint64_t> start_number;
    std::optional<std::uint64_t> duration;
    std::optional<std::uint64_t> presentation_time_offset;
    const MpdElement* timeline{nullptr};

    bool merge(const MpdElement* node) {
        if (!node) return true;
        present = true;
        if (node->has_attribute("media")) media = node->attribute("media");
        if (node->has_attribute("initialization")) initialization = node->attribute("initialization");

        auto take = [node](std::string_view key, std::optional<std::uint64_t>& out) {
            if (!node->has_attribute(key)) return true;
            out = uint_attribute(*node, key);
            return out.has_value();
        };
        if (!take("timescale", timescale)) return false;
        if (!take("startNumber", start_number)) return false;
        if (!take("duration", duration)) return false;
        if (!take("presentationTimeOffset", presentation_time_offset)) return false;

        if (const MpdElement* tl = node->child("SegmentTimeline")) timeline = tl;
        return true;
    }
};

// SegmentList/SegmentBase: the most specific element wins, timing inherits
struct ListInfo {
    const MpdElement* list{nullptr};
    const MpdElement* base{nullptr};
    std::optional<std::uint64_t> timescale;
    std::optional<std::uint64_t> duration;

    bool merge(const MpdElement& level) {
        if (const MpdElement* sl = level.child("SegmentList")) {
            list = sl;
            if (sl->has_attribute("timescale")) {
                timescale = uint_attribute(*sl, "timescale");
                if (!timescale) return false;
            }
            if (sl->has_attribute("duration")) {
                duration = uint_attribute(*sl, "duration");
                if (!duration) return false;
            }
        }
        if (const MpdElement* sb = level.child("SegmentBase")) base = sb;
        return true;
    }
};

struct Context {
    std::string base_url;
    bool has_base{false};
    double period_duration{0.0};
    TemplateInfo tmpl;
    ListInfo list;
};

// Period length in timescale units, or nullopt when it does not fit
std::optional<std::uint64_t> period_ticks(double seconds, std::uint64_t timescale) noexcept {
    constexpr double MAX_TICKS = 9.0e18;   // Below 2^63
    const double ticks = std::round(seconds * static_cast<double>(timescale));
    if (!(ticks >= 0.0 && ticks <= MAX_TICKS)) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(ticks);
}

std::error_code expand_template_segments(const Context& ctx, DASHRepresentation& rep) {
    const auto& tmpl = ctx.tmpl;
    if (tmpl.media.empty()) return make_error_code(core::AcquireErrc::manifest_parse_error);

    const std::uint64_t timescale = tmpl.timescale.value_or(1);
    if (timescale == 0) return make_error_code(core::AcquireErrc::manifest_parse_error);
    const std::uint64_t pto = tmpl.presentation_time_offset.value_or(0);
    std::uint64_t number = tmpl.start_number.value_or(1);

    if (!tmpl.initialization.empty()) {
        DASHSegment init;
        init.url = core::resolve_url(ctx.base_url,
            expand_template(tmpl.initialization, rep.id, rep.bandwidth, number, 0));
        init.is_init = true;
        rep.segments.push_back(std::move(init));
    }

    auto push = [&](std::uint64_t time, std::uint64_t d) {
        DASHSegment seg;
        seg.url = core::resolve_url(ctx.base_url,
            expand_template(tmpl.media, rep.id, rep.bandwidth, number, time));
        seg.duration = static_cast<double>(d) / static_cast<double>(timescale);
        rep.segments.push_back(std::move(seg));
        ++number;
    };

    if (tmpl.timeline) {
        auto entries = tmpl.timeline->children_named("S");
        std::uint64_t t = pto;
        for (std::size_t i = 0; i < entries.size(); ++i) {
            const MpdElement& s = *entries[i];
            if (s.has_attribute("t")) {
                auto st = uint_attribute(s, "t");
                if (!st) return make_error_code(core::AcquireErrc::manifest_parse_error);
                t = *st;
            }
            auto d = uint_attribute(s, "d");
            if (!d || *d == 0) return make_error_code(core::AcquireErrc::manifest_parse_error);

            std::int64_t r = 0;
            if (s.has_attribute("r")) {
                auto sr = detail::parse_int(s.attribute("r"));
                if (!sr) return make_error_code(core::AcquireErrc::manifest_parse_error);
                r = *sr;
            }

            std::uint64_t count = 0;
            if (r >= 0) {
                count = static_cast<std::uint64_t>(r) + 1;
            } else {
                // Repeat until the next S@t, or the end of the period
                std::uint64_t end = 0;
                if (i + 1 < entries.size() && entries[i + 1]->has_attribute("t")) {
                    end = uint_attribute(*entries[i + 1], "t").value_or(0);
                } else if (ctx.period_duration > 0.0) {
                    auto ticks = period_ticks(ctx.period_duration, timescale);
                    if (!ticks || *ticks > UINT64_MAX - pto) {
                        return make_error_code(core::AcquireErrc::manifest_parse_error);
                    }
                    end = pto + *ticks;
                } else {
                    return make_error_code(core::AcquireErrc::manifest_parse_error);
                }
                if (end > t) {
                    const std::uint64_t span = end - t;
                    count = span / *d + (span % *d != 0 ? 1 : 0);
                }
            }

            if (rep.segments.size() + count > MAX_SEGMENTS_PER_REPRESENTATION) {
                return make_error_code(core::AcquireErrc::manifest_parse_error);
            }
            for (std::uint64_t k = 0; k < count; ++k) {
                push(t, *d);
                t += *d;
            }
        }
        return {};
    }

    if (tmpl.duration && *tmpl.duration > 0) {
        if (ctx.period_duration <= 0.0) {
            return make_error_code(core::AcquireErrc::manifest_parse_error);
        }
        const double seg_seconds = static_cast<double>(*tmpl.duration) / static_cast<double>(timescale);
        const double segments = std::ceil(ctx.period_duration / seg_seconds - 1e-9);
        // Also rejects NaN and infinity
        if (!(segments <= static_cast<double>(MAX_SEGMENTS_PER_REPRESENTATION))) {
            return make_error_code(core::AcquireErrc::manifest_parse_error);
        }
        const auto count = static_cast<std::uint64_t>(segments);

        std::uint64_t t = pto;
        for (std::uint64_t k = 0; k < count; ++k) {
            push(t, *tmpl.duration);
            t += *tmpl.duration;
        }
        // The last segment covers only what is left of the period
        if (count > 0) {
            const double remainder = ctx.period_duration - seg_seconds * static_cast<double>(count - 1);
            rep.segments.back().duration = std::min(seg_seconds, remainder);
        }
        return {};
    }

    return make_error_code(core::AcquireErrc::manifest_parse_error);
}

std::error_code expand_list_segments(const Context& ctx, DASHRepresentation& rep) {
    const MpdElement& list = *ctx.list.list;
    const std::uint64_t timescale = ctx.list.timescale.value_or(1);
    if (timescale == 0) return make_error_code(core::AcquireErrc::manifest_parse_error);
    const double seg_seconds = ctx.list.duration
        ? static_cast<double>(*ctx.list.duration) / static_cast<double>(timescale)
        : 0.0;

    if (const MpdElement* init = list.child("Initialization")) {
        DASHSegment seg;
        auto source = init->attribute("sourceURL");
        seg.url = source.empty() ? ctx.base_url : core::resolve_url(ctx.base_url, source);
        if (init->has_attribute("range")) {
            seg.byte_range = parse_range(init->attribute("range"));
            if (!seg.byte_range) return make_error_code(core::AcquireErrc::manifest_parse_error);
        }
        seg.is_init = true;
        rep.segments.push_back(std::move(seg));
    }

    for (const MpdElement* entry : list.children_named("SegmentURL")) {
        DASHSegment seg;
        auto media = entry->attribute("media");
        seg.url = media.empty() ? ctx.base_url : core::resolve_url(ctx.base_url, media);
        if (entry->has_attribute("mediaRange")) {
            seg.byte_range = parse_range(entry->attribute("mediaRange"));
            if (!seg.byte_range) return make_error_code(core::AcquireErrc::manifest_parse_error);
        } else if (media.empty()) {
            return make_error_code(core::AcquireErrc::manifest_parse_error);
        }
        seg.duration = seg_seconds;
        rep.segments.push_back(std::move(seg));
    }
    return {};
}

std::error_code expand_segments(const Context& ctx, DASHRepresentation& rep) {
    if (ctx.tmpl.present) {
        return expand_template_segments(ctx, rep);
    }
    if (ctx.list.list) {
        return expand_list_segments(ctx, rep);
    }

    // SegmentBase or a bare BaseURL: the whole resource is one segment
    if (!ctx.has_base) {
        return make_error_code(core::AcquireErrc::manifest_parse_error);
    }
    DASHSegment seg;
    seg.url = ctx.base_url;
    seg.duration = ctx.period_duration;
    rep.segments.push_back(std::move(seg));
    return {};
}

void copy_common(const MpdElement& node, std::string& mime, std::string& codecs,
                 std::uint32_t& width, std::uint32_t& height, double& frame_rate) {
    if (node.has_attribute("mimeType")) mime = node.attribute("mimeType");
    if (node.has_attribute("codecs")) codecs = node.attribute("codecs");
    if (auto w = uint_attribute(node, "width")) width = static_cast<std::uint32_t>(*w);
    if (auto h = uint_attribute(node, "height")) height = static_cast<std::uint32_t>(*h);
    if (node.has_attribute("frameRate")) {
        frame_rate = detail::parse_frame_rate(node.attribute("frameRate")).value_or(frame_rate);
    }
}

std::expected<DASHManifest, std::error_code>
build_manifest(const MpdElement& mpd, std::string_view manifest_url) {
    DASHManifest manifest;

    if (mpd.name != "MPD") {
        return parse_error();
    }

    manifest.is_live = mpd.attribute("type", "static") == "dynamic";
    if (manifest.is_live) {
        spdlog::error("MPD is dynamic (live); only static presentations are supported");
        return std::unexpected(make_error_code(core::AcquireErrc::live_stream));
    }

    if (mpd.has_attribute("mediaPresentationDuration")) {
        auto d = parse_iso8601_duration(mpd.attribute("mediaPresentationDuration"));
        if (!d) return parse_error();
        manifest.duration = *d;
    }
    if (mpd.has_attribute("minBufferTime")) {
        manifest.min_buffer_time = parse_iso8601_duration(mpd.attribute("minBufferTime")).value_or(0.0);
    }

    const MpdElement* period = mpd.child("Period");
    if (!period) {
        return parse_error();
    }

    Context period_ctx;
    period_ctx.base_url = apply_base(std::string(manifest_url), mpd, period_ctx.has_base);
    period_ctx.base_url = apply_base(period_ctx.base_url, *period, period_ctx.has_base);
    period_ctx.period_duration = manifest.duration;
    if (period->has_attribute("duration")) {
        auto d = parse_iso8601_duration(period->attribute("duration"));
        if (!d) return parse_error();
        period_ctx.period_duration = *d;
        if (manifest.duration <= 0.0) manifest.duration = *d;
    }
    if (!period_ctx.tmpl.merge(period->child("SegmentTemplate")) || !period_ctx.list.merge(*period)) {
        return parse_error();
    }

    for (const MpdElement* as_node : period->children_named("AdaptationSet")) {
        DASHAdaptationSet set;
        set.id = as_node->attribute("id");
        set.mime_type = as_node->attribute("mimeType");
        set.content_type = as_node->attribute("contentType");
        set.lang = as_node->attribute("lang");

        Context set_ctx = period_ctx;
        set_ctx.base_url = apply_base(set_ctx.base_url, *as_node, set_ctx.has_base);
        if (!set_ctx.tmpl.merge(as_node->child("SegmentTemplate")) || !set_ctx.list.merge(*as_node)) {
            return parse_error();
        }

        std::string set_codecs;
        std::uint32_t set_width = 0;
        std::uint32_t set_height = 0;
        double set_frame_rate = 0.0;
        std::string set_mime = set.mime_type;
        copy_common(*as_node, set_mime, set_codecs, set_width, set_height, set_frame_rate);

        std::size_t index = 0;
        for (const MpdElement* rep_node : as_node->children_named("Representation")) {
            DASHRepresentation rep;
            rep.id = rep_node->attribute("id");
            if (rep.id.empty()) {
                rep.id = std::to_string(index);
            }
            ++index;

            if (rep_node->has_attribute("bandwidth")) {
                auto bw = uint_attribute(*rep_node, "bandwidth");
                if (!bw) return parse_error();
                rep.bandwidth = static_cast<std::uint32_t>(*bw);
            }

            rep.mime_type = set_mime;
            rep.codecs = set_codecs;
            rep.width = set_width;
            rep.height = set_height;
            rep.frame_rate = set_frame_rate;
            copy_common(*rep_node, rep.mime_type, rep.codecs, rep.width, rep.height, rep.frame_rate);

            Context rep_ctx = set_ctx;
            rep_ctx.base_url = apply_base(rep_ctx.base_url, *rep_node, rep_ctx.has_base);
            if (!rep_ctx.tmpl.merge(rep_node->child("SegmentTemplate")) || !rep_ctx.list.merge(*rep_node)) {
                return parse_error();
            }
            rep.base_url = rep_ctx.base_url;

            if (auto ec = expand_segments(rep_ctx, rep)) {
                spdlog::error("Representation '{}': cannot build a segment list", rep.id);
                return std::unexpected(ec);
            }
            set.representations.push_back(std::move(rep));
        }

        if (set.mime_type.empty()) set.mime_type = set_mime;
        manifest.adaptation_sets.push_back(std::move(set));
    }

    return manifest;
}

} // namespace

bool DASHAdaptationSet::is_video() const noexcept {
    if (content_type == "video" || mime_type.starts_with("video/")) {
        return true;
    }
    for (const auto& rep : representations) {
        if (rep.mime_type.starts_with("video/")) return true;
    }
    return false;
}

const DASHRepresentation* DASHManifest::find(std::string_view representation_id) const noexcept {
    for (const auto& set : adaptation_sets) {
        for (const auto& rep : set.representations) {
            if (rep.id == representation_id) return &rep;
        }
    }
    return nullptr;
}

bool DASHParser::is_dash_url(std::string_view url) noexcept {
    auto query = url.find_first_of("?#");
    return detail::to_lower(url.substr(0, query)).ends_with(".mpd");
}

bool DASHParser::is_mpd(std::string_view content) noexcept {
    return content.find("<MPD") != std::string_view::npos
        || content.find(":MPD") != std::string_view::npos;
}

std::expected<DASHManifest, std::error_code>
DASHParser::parse(std::string_view content, std::string_view base_url) noexcept {
    if (!is_mpd(content)) {
        return parse_error();
    }

    try {
        auto root = read_mpd(content);
        if (!root) {
            return std::unexpected(root.error());
        }
        return build_manifest(*root, base_url);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::optional<double> parse_iso8601_duration(std::string_view value) noexcept {
    value = detail::trim(value);
    if (!value.starts_with('P')) return std::nullopt;
    value.remove_prefix(1);

    double seconds = 0.0;
    bool in_time = false;
    bool any = false;

    while (!value.empty()) {
        if (value.front() == 'T') {
            in_time = true;
            value.remove_prefix(1);
            continue;
        }

        std::size_t n = 0;
        while (n < value.size() && (std::isdigit(static_cast<unsigned char>(value[n])) || value[n] == '.')) ++n;
        if (n == 0 || n == value.size()) return std::nullopt;

        auto number = detail::parse_double(value.substr(0, n));
        if (!number) return std::nullopt;

        switch (value[n]) {
            case 'Y': if (in_time) return std::nullopt; seconds += *number * 365.0 * 86400.0; break;
            case 'W': if (in_time) return std::nullopt; seconds += *number * 7.0 * 86400.0; break;
            case 'D': if (in_time) return std::nullopt; seconds += *number * 86400.0; break;
            case 'H': if (!in_time) return std::nullopt; seconds += *number * 3600.0; break;
            case 'M': seconds += *number * (in_time ? 60.0 : 30.0 * 86400.0); break;
            case 'S': if (!in_time) return std::nullopt; seconds += *number; break;
            default: return std::nullopt;
        }
        any = true;
        value.remove_prefix(n + 1);
    }

    if (!any) return std::nullopt;
    return seconds;
}

std::string expand_template(std::string_view pattern,
                            std::string_view representation_id,
                            std::uint32_t bandwidth,
                            std::uint64_t number,
                            std::uint64_t time) {
    std::string out;
    out.reserve(pattern.size() + 16);

    std::size_t pos = 0;
    while (pos < pattern.size()) {
        auto open = pattern.find('$', pos);
        if (open == std::string_view::npos) {
            out.append(pattern.substr(pos));
            break;
        }
        out.append(pattern.substr(pos, open - pos));

        auto close = pattern.find('$', open + 1);
        if (close == std::string_view::npos) {
            out.append(pattern.substr(open));
            break;
        }

        auto token = pattern.substr(open + 1, close - open - 1);
        pos = close + 1;

        if (token.empty()) {
            out += '$';   // "$$"
            continue;
        }

        std::string_view name = token;
        std::size_t width = 0;
        if (auto pct = token.find('%'); pct != std::string_view::npos) {
            name = token.substr(0, pct);
            auto fmt = token.substr(pct + 1);   // "05d"
            if (fmt.size() >= 2 && fmt.back() == 'd') {
                width = detail::parse_uint(fmt.substr(0, fmt.size() - 1)).value_or(0);
            }
        }

        std::string value;
        if (name == "RepresentationID") {
            out.append(representation_id);
            continue;
        } else if (name == "Number") {
            value = std::to_string(number);
        } else if (name == "Time") {
            value = std::to_string(time);
        } else if (name == "Bandwidth") {
            value = std::to_string(bandwidth);
        } else {
            // Unknown identifier is left in place
            out.append(pattern.substr(open, close - open + 1));
            continue;
        }

        if (value.size() < width) {
            out.append(width - value.size(), '0');
        }
        out += value;
    }
    return out;
}

} // namespace reel::media
