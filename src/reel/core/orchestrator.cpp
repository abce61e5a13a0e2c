// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/orchestrator.hpp>
#include <reel/core/assembler.hpp>
#include <reel/core/direct_fetch.hpp>
#include <reel/core/scheduler.hpp>
#include <reel/disk/spool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace reel::core {

//=============================================================================
// StreamDescriptor
//=============================================================================

StreamDescriptor StreamDescriptor::segmented(std::string manifest_url, std::string fallback_url) {
    StreamDescriptor d;
    d.kind = StreamKind::segmented;
    d.manifest_url = std::move(manifest_url);
    d.direct_url = std::move(fallback_url);
    return d;
}

StreamDescriptor StreamDescriptor::direct(std::string url) {
    StreamDescriptor d;
    d.kind = StreamKind::direct;
    d.direct_url = std::move(url);
    return d;
}

std::error_code StreamDescriptor::validate() const noexcept {
    if (kind == StreamKind::segmented && manifest_url.empty()) {
        return make_error_code(AcquireErrc::invalid_descriptor);
    }
    if (kind == StreamKind::direct && direct_url.empty()) {
        return make_error_code(AcquireErrc::invalid_descriptor);
    }
    if (concurrency && *concurrency == 0) {
        return make_error_code(AcquireErrc::invalid_descriptor);
    }
    return {};
}

const char* to_string(AcquisitionState state) noexcept {
    switch (state) {
        case AcquisitionState::idle:            return "idle";
        case AcquisitionState::resolving:       return "resolving";
        case AcquisitionState::segmented_fetch: return "segmented_fetch";
        case AcquisitionState::direct_fetch:    return "direct_fetch";
        case AcquisitionState::assembling:      return "assembling";
        case AcquisitionState::done:            return "done";
        case AcquisitionState::failed:          return "failed";
        case AcquisitionState::cancelled:       return "cancelled";
    }
    return "unknown";
}

std::string AcquisitionResult::message() const {
    if (success) {
        return "Saved " + output_path.string();
    }
    std::string msg = error ? error.message() : std::string("Unknown error");
    if (fetch_error && fetch_error->code != error) {
        msg += " (" + fetch_error->message() + ")";
    }
    if (!failed_segments.empty()) {
        msg += "; failed segments:";
        std::size_t listed = 0;
        for (auto index : failed_segments) {
            if (++listed > 20) {
                msg += " ...";
                break;
            }
            msg += " " + std::to_string(index);
        }
    }
    return msg;
}

//=============================================================================
// AcquisitionOrchestrator::Run
//=============================================================================

// State of one acquire() call
class AcquisitionOrchestrator::Run {
public:
    Run(const StateObserver& observer, const std::filesystem::path& output) : observer_(observer) {
        result_.output_path = output;
    }

    void transition(AcquisitionState to) {
        const auto from = result_.state;
        spdlog::debug("Acquisition state: {} -> {}", to_string(from), to_string(to));
        result_.state = to;
        if (observer_) {
            try {
                observer_(from, to);
            } catch (const std::exception& e) {
                spdlog::warn("State observer threw: {}", e.what());
            }
        }
    }

    AcquisitionResult finish(std::error_code ec) {
        result_.error = ec;
        result_.success = !ec;
        if (!ec) {
            transition(AcquisitionState::done);
        } else if (ec == AcquireErrc::cancelled) {
            transition(AcquisitionState::cancelled);
        } else {
            transition(AcquisitionState::failed);
        }
        return std::move(result_);
    }

    AcquisitionResult& result() noexcept { return result_; }

private:
    const StateObserver& observer_;
    AcquisitionResult result_;
};

//=============================================================================
// AcquisitionOrchestrator
//=============================================================================

AcquisitionOrchestrator::AcquisitionOrchestrator(HttpTransport& transport,
                                                 RetryPolicy policy,
                                                 AcquireOptions options)
    : fetcher_(transport, policy)
    , options_(options) {}

std::expected<FetchedBody, FetchError>
AcquisitionOrchestrator::fetch_manifest(const std::string& url, std::stop_token stop) const {
    spdlog::info("Fetching manifest {}", url);
    return fetcher_.fetch(url, options_.attempt_budget, std::nullopt, stop);
}

std::expected<media::SegmentList, std::error_code>
AcquisitionOrchestrator::resolve_segments(const StreamDescriptor& descriptor,
                                          std::stop_token stop,
                                          std::optional<FetchError>& fetch_error) const {
    auto body = fetch_manifest(descriptor.manifest_url, stop);
    if (!body) {
        fetch_error = body.error();
        return std::unexpected(body.error().code);
    }

    auto manifest = media::parse_manifest(body->data, body->effective_url);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }

    std::string representation_id;
    auto renditions = media::list_renditions(*manifest);
    if (!renditions.empty()) {
        auto chosen = media::select_rendition(renditions, descriptor.rendition);
        if (!chosen) {
            return std::unexpected(chosen.error());
        }
        spdlog::info("Selected rendition {} ({} of {}, policy: {})",
                     chosen->describe(), chosen->id.empty() ? chosen->url : chosen->id,
                     renditions.size(), descriptor.rendition.describe());

        if (std::holds_alternative<media::HLSPlaylist>(*manifest)) {
            // Master playlist: the segments live in the variant's media playlist
            auto variant = fetch_manifest(chosen->url, stop);
            if (!variant) {
                fetch_error = variant.error();
                return std::unexpected(variant.error().code);
            }
            manifest = media::parse_manifest(variant->data, variant->effective_url);
            if (!manifest) {
                return std::unexpected(manifest.error());
            }
        } else {
            representation_id = chosen->id;
        }
    } else if (std::holds_alternative<media::DASHManifest>(*manifest)) {
        return std::unexpected(make_error_code(AcquireErrc::no_rendition));
    }

    auto segments = media::segments_from(*manifest, representation_id);
    if (!segments) {
        return std::unexpected(segments.error());
    }
    if (auto ec = media::validate_sequence(*segments)) {
        return std::unexpected(ec);
    }

    spdlog::info("Manifest lists {} segments ({:.1f} s)",
                 segments->size(), media::total_duration(*segments));
    return segments;
}

AcquisitionResult AcquisitionOrchestrator::acquire(const StreamDescriptor& descriptor,
                                                   const std::filesystem::path& output_path,
                                                   const ProgressCallback& on_progress,
                                                   std::stop_token stop) const {
    Run run(observer_, output_path);
    run.transition(AcquisitionState::resolving);

    if (output_path.empty()) {
        return run.finish(make_error_code(AcquireErrc::invalid_descriptor));
    }
    if (auto ec = descriptor.validate()) {
        spdlog::error("Invalid stream descriptor");
        return run.finish(ec);
    }

    auto run_direct = [&]() {
        run.transition(AcquisitionState::direct_fetch);
        run.result().path = AcquisitionPath::direct;

        DirectOptions direct_options;
        direct_options.attempt_budget = options_.attempt_budget;
        direct_options.connections = std::max<std::uint32_t>(options_.direct_connections, 1);
        direct_options.min_ranged_size = options_.min_ranged_size;
        direct_options.expected_size = descriptor.expected_size_hint;

        DirectFetcher direct(fetcher_, direct_options);
        spdlog::info("Fetching {}", descriptor.direct_url);
        auto fetched = direct.fetch_direct(descriptor.direct_url, output_path, on_progress, stop);
        if (!fetched) {
            run.result().attempts = fetched.error().attempts;
            run.result().fetch_error = fetched.error();
            if (stop.stop_requested() || fetched.error().code == FetchErrc::cancelled) {
                return run.finish(make_error_code(AcquireErrc::cancelled));
            }
            spdlog::error("Direct fetch failed: {}", fetched.error().message());
            return run.finish(fetched.error().code);
        }

        run.result().attempts = fetched->attempts;
        run.result().bytes = fetched->bytes;
        run.result().segment_count = fetched->ranges;
        return run.finish({});
    };

    if (descriptor.kind == StreamKind::direct) {
        return run_direct();
    }

    std::optional<FetchError> fetch_error;
    auto segments = resolve_segments(descriptor, stop, fetch_error);
    if (!segments) {
        if (stop.stop_requested()) {
            return run.finish(make_error_code(AcquireErrc::cancelled));
        }
        if (!descriptor.direct_url.empty()) {
            spdlog::warn("Segmented path unavailable ({}); falling back to {}",
                         segments.error().message(), descriptor.direct_url);
            run.result().used_fallback = true;
            return run_direct();
        }
        spdlog::error("Cannot resolve manifest: {}", segments.error().message());
        run.result().fetch_error = fetch_error;
        return run.finish(segments.error());
    }

    run.transition(AcquisitionState::segmented_fetch);
    run.result().path = AcquisitionPath::segmented;
    run.result().segment_count = static_cast<std::uint32_t>(segments->size());

    auto spool = disk::SpoolDirectory::create(output_path);
    if (!spool) {
        return run.finish(spool.error());
    }

    const std::uint32_t limit = std::clamp<std::uint32_t>(
        descriptor.concurrency.value_or(options_.concurrency), 1, MAX_CONCURRENCY);

    ConcurrencyScheduler scheduler(fetcher_, options_.attempt_budget, *spool);
    const auto results = scheduler.run(*segments, limit, on_progress, stop);

    for (const auto& [index, r] : results) {
        run.result().attempts += r.attempts;
        run.result().bytes += r.bytes;
        if (!r.ok()) {
            run.result().failed_segments.insert(index);
            if (!run.result().fetch_error && r.error) {
                run.result().fetch_error = r.error;
            }
        }
    }

    if (stop.stop_requested()) {
        spdlog::warn("Cancelled after {} of {} segments", results.size(), segments->size());
        return run.finish(make_error_code(AcquireErrc::cancelled));
    }

    run.transition(AcquisitionState::assembling);
    auto assembled = assemble(results, static_cast<std::uint32_t>(segments->size()), output_path);
    if (!assembled) {
        for (auto index : assembled.error().missing) {
            run.result().failed_segments.insert(index);
        }
        spdlog::error("Assembly failed: {}", assembled.error().message());
        return run.finish(assembled.error().code);
    }

    return run.finish({});
}

std::expected<ManifestInfo, std::error_code>
AcquisitionOrchestrator::inspect(const std::string& manifest_url, std::stop_token stop) const {
    auto body = fetch_manifest(manifest_url, stop);
    if (!body) {
        return std::unexpected(body.error().code);
    }

    ManifestInfo info;
    info.format = media::detect_format(body->data);
    info.effective_url = body->effective_url;

    auto manifest = media::parse_manifest(body->data, body->effective_url);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }

    info.renditions = media::list_renditions(*manifest);
    if (const auto* playlist = std::get_if<media::HLSPlaylist>(&*manifest)) {
        if (!playlist->is_master()) {
            info.segment_count = playlist->segments.size();
            for (const auto& seg : playlist->segments) info.duration += seg.duration;
        }
    } else if (const auto* mpd = std::get_if<media::DASHManifest>(&*manifest)) {
        info.duration = mpd->duration;
    }
    return info;
}

} // namespace reel::core
