// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/chunk_fetcher.hpp>
#include <reel/core/config.hpp>
#include <reel/core/progress.hpp>
#include <reel/media/manifest.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace reel::core {

enum class StreamKind : std::uint8_t {
    segmented,
    direct
};

// What to acquire. A segmented descriptor may carry a direct_url as fallback.
struct StreamDescriptor {
    StreamKind kind{StreamKind::segmented};
    std::string manifest_url;
    std::string direct_url;
    std::optional<std::uint64_t> expected_size_hint;
    media::RenditionPolicy rendition;
    std::optional<std::uint32_t> concurrency;

    [[nodiscard]] static StreamDescriptor segmented(std::string manifest_url, std::string fallback_url = {});
    [[nodiscard]] static StreamDescriptor direct(std::string url);

    // Empty when the descriptor names what its kind needs
    [[nodiscard]] std::error_code validate() const noexcept;
};

enum class AcquisitionState : std::uint8_t {
    idle,
    resolving,
    segmented_fetch,
    direct_fetch,
    assembling,
    done,
    failed,
    cancelled
};

[[nodiscard]] const char* to_string(AcquisitionState state) noexcept;

[[nodiscard]] constexpr bool is_terminal(AcquisitionState state) noexcept {
    return state == AcquisitionState::done
        || state == AcquisitionState::failed
        || state == AcquisitionState::cancelled;
}

enum class AcquisitionPath : std::uint8_t {
    none,
    segmented,
    direct
};

struct AcquisitionResult {
    std::filesystem::path output_path;
    bool success{false};
    AcquisitionState state{AcquisitionState::idle};
    std::error_code error;
    std::optional<FetchError> fetch_error;       // Underlying fetch failure, when there is one
    AcquisitionPath path{AcquisitionPath::none};
    std::set<std::uint32_t> failed_segments;
    bool used_fallback{false};
    std::uint32_t segment_count{0};
    std::uint32_t attempts{0};                   // Summed over every fetch of the run
    std::uint64_t bytes{0};

    [[nodiscard]] std::string message() const;
};

struct AcquireOptions {
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    std::uint32_t attempt_budget{DEFAULT_ATTEMPT_BUDGET};
    std::uint32_t direct_connections{DEFAULT_DIRECT_CONNECTIONS};
    std::uint64_t min_ranged_size{MIN_RANGED_FILE_SIZE};
};

// Manifest summary for listing renditions without downloading
struct ManifestInfo {
    media::ManifestFormat format{media::ManifestFormat::unknown};
    std::string effective_url;
    std::vector<media::Rendition> renditions;
    std::size_t segment_count{0};                // HLS media playlists only
    double duration{0.0};
};

using StateObserver = std::function<void(AcquisitionState from, AcquisitionState to)>;

// Top-level state machine. Holds configuration only; every acquire() call
// builds its own segment list, spool directory and progress state.
class AcquisitionOrchestrator {
public:
    AcquisitionOrchestrator(HttpTransport& transport, RetryPolicy policy, AcquireOptions options = {});

    void observer(StateObserver obs) { observer_ = std::move(obs); }

    [[nodiscard]] AcquisitionResult acquire(const StreamDescriptor& descriptor,
                                            const std::filesystem::path& output_path,
                                            const ProgressCallback& on_progress = {},
                                            std::stop_token stop = {}) const;

    [[nodiscard]] std::expected<ManifestInfo, std::error_code>
    inspect(const std::string& manifest_url, std::stop_token stop = {}) const;

    [[nodiscard]] const AcquireOptions& options() const noexcept { return options_; }

private:
    class Run;

    [[nodiscard]] std::expected<media::SegmentList, std::error_code>
    resolve_segments(const StreamDescriptor& descriptor, std::stop_token stop,
                     std::optional<FetchError>& fetch_error) const;

    [[nodiscard]] std::expected<FetchedBody, FetchError>
    fetch_manifest(const std::string& url, std::stop_token stop) const;

    ChunkFetcher fetcher_;
    AcquireOptions options_;
    StateObserver observer_;
};

} // namespace reel::core
