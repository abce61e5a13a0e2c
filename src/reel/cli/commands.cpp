// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/chunk_fetcher.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/log.hpp>
#include <reel/core/url.hpp>
#include <reel/disk/file_writer.hpp>
#include <reel/mux/muxer.hpp>
#include <reel/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <iomanip>
#include <iostream>

namespace reel::cli {

namespace {

constexpr std::array<std::string_view, 5> DIRECT_EXTENSIONS = {".mp4", ".mkv", ".webm", ".ts", ".mov"};
constexpr const char* DEFAULT_EXTENSION = ".mp4";

// curl_global_init/cleanup around one command
struct CurlGlobal {
    CurlGlobal() { core::HttpSession::global_init(); }
    ~CurlGlobal() { core::HttpSession::global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

std::optional<std::uint32_t> parse_count(std::string_view text) noexcept {
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

// Download subtitle/audio sources next to the video. Tracks that fail are
// skipped with a warning.
std::vector<mux::TrackFile> fetch_tracks(const core::ChunkFetcher& fetcher,
                                         std::uint32_t attempt_budget,
                                         const std::vector<media::TrackSource>& sources,
                                         const std::filesystem::path& dir,
                                         const std::string& base,
                                         std::string_view kind,
                                         std::string_view fallback_ext,
                                         std::stop_token stop) {
    std::vector<mux::TrackFile> files;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        const auto& src = sources[i];

        std::string ext(fallback_ext);
        if (auto parsed = core::Url::parse(src.url); parsed && !parsed->extension().empty()) {
            ext = parsed->extension();
        }

        auto path = dir / (base + "." + std::string(kind) + std::to_string(i) + "." + src.language + ext);
        auto fetched = fetcher.fetch_to_file(src.url, attempt_budget, path, std::nullopt, stop);
        if (!fetched) {
            spdlog::warn("Skipping {} track {} ({}): {}", kind, i, src.language, fetched.error().message());
            disk::remove_quietly(path);
            continue;
        }
        files.push_back({std::move(path), src.language});
    }
    return files;
}

int mux_outputs(const CliArgs& args,
                const core::Settings& settings,
                core::HttpTransport& transport,
                const media::ResolvedMedia& media,
                const std::filesystem::path& video,
                std::stop_token stop) {
    core::ChunkFetcher fetcher(transport, settings.retry_policy());
    const auto dir = video.has_parent_path() ? video.parent_path() : std::filesystem::path(".");
    const auto base = video.stem().string();

    mux::MuxRequest request;
    request.video = video;
    request.subtitles = fetch_tracks(fetcher, settings.attempt_budget, media.subtitles, dir, base,
                                     "sub", ".srt", stop);
    request.audio = fetch_tracks(fetcher, settings.attempt_budget, media.audio, dir, base,
                                 "audio", ".m4a", stop);

    std::filesystem::path out(args.mux_output);
    if (!out.has_parent_path()) {
        out = dir / out;
    }
    request.output = out;

    auto remove_tracks = [&request] {
        for (const auto* tracks : {&request.subtitles, &request.audio}) {
            for (const auto& t : *tracks) disk::remove_quietly(t.path);
        }
    };

    if (stop.stop_requested()) {
        remove_tracks();
        return EXIT_CANCELLED;
    }

    mux::MkvmergeMuxer muxer;
    if (auto ec = muxer.mux(request)) {
        std::cerr << "Error: Muxing failed: " << ec.message() << std::endl;
        remove_tracks();
        return EXIT_FAILED;
    }

    remove_tracks();
    disk::remove_quietly(video);
    std::cout << "Muxed: " << request.output.string() << std::endl;
    return EXIT_DONE;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                args.error = "Missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto count = [&](std::optional<std::uint32_t>& out) {
            std::string text;
            if (!value(text)) return false;
            out = parse_count(text);
            if (!out) {
                args.error = "Invalid number for " + arg + ": " + text;
                return false;
            }
            return true;
        };

        bool ok = true;
        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        } else if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        } else if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-o" || arg == "--output") {
            ok = value(args.output_file);
        } else if (arg == "-d" || arg == "--directory") {
            ok = value(args.output_dir);
        } else if (arg == "-n" || arg == "--concurrency") {
            ok = count(args.concurrency);
        } else if (arg == "-r" || arg == "--retries") {
            ok = count(args.retries);
        } else if (arg == "--connections") {
            ok = count(args.connections);
        } else if (arg == "--resolution") {
            std::string text;
            ok = value(text);
            if (ok) {
                auto policy = media::parse_policy(text);
                if (!policy || policy->kind != media::RenditionPolicy::Kind::preferred_height) {
                    args.error = "Invalid resolution: " + text;
                    ok = false;
                } else {
                    args.resolution = policy->height;
                }
            }
        } else if (arg == "--lowest") {
            args.lowest = true;
        } else if (arg == "--direct") {
            args.direct = true;
        } else if (arg == "--fallback") {
            ok = value(args.fallback_url);
        } else if (arg == "-c" || arg == "--config") {
            ok = value(args.config_path);
        } else if (arg == "--descriptor") {
            ok = value(args.descriptor);
        } else if (arg == "-i" || arg == "--info") {
            args.list_only = true;
        } else if (arg == "--mux") {
            ok = value(args.mux_output);
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.error = "Unknown option: " + arg;
            ok = false;
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.error = "Only one URL may be given";
            ok = false;
        }

        if (!ok) return args;
    }

    if (args.url.empty() && args.descriptor.empty()) {
        args.error = "No URL specified";
    } else if (!args.url.empty() && !args.descriptor.empty()) {
        args.error = "Give either a URL or --descriptor, not both";
    } else if (args.resolution && args.lowest) {
        args.error = "--resolution and --lowest are exclusive";
    }

    return args;
}

std::expected<core::Settings, std::error_code> build_settings(const CliArgs& args) {
    core::Settings settings;
    if (!args.config_path.empty()) {
        auto loaded = core::Settings::load(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        settings = std::move(*loaded);
    }

    if (args.concurrency) settings.concurrency = *args.concurrency;
    if (args.retries) settings.attempt_budget = *args.retries;
    if (args.connections) settings.direct_connections = *args.connections;
    if (args.resolution) settings.rendition = media::RenditionPolicy::prefer_height(*args.resolution);
    if (args.lowest) settings.rendition = media::RenditionPolicy::lowest();
    if (!args.output_dir.empty()) settings.output_dir = args.output_dir;
    if (args.verbose) settings.log_level = "debug";
    if (args.quiet) settings.log_level = "warn";

    if (auto ec = settings.validate()) {
        return std::unexpected(ec);
    }
    return settings;
}

bool is_direct_url(std::string_view url) noexcept {
    auto parsed = core::Url::parse(url);
    if (!parsed) return false;
    const auto ext = parsed->extension();
    return std::find(DIRECT_EXTENSIONS.begin(), DIRECT_EXTENSIONS.end(), ext) != DIRECT_EXTENSIONS.end();
}

media::ResolvedMedia media_from_url(const CliArgs& args, const core::Settings& settings) {
    media::ResolvedMedia media;
    if (args.direct || is_direct_url(args.url)) {
        media.stream = core::StreamDescriptor::direct(args.url);
    } else {
        media.stream = core::StreamDescriptor::segmented(args.url, args.fallback_url);
    }
    media.stream.rendition = settings.rendition;
    return media;
}

std::filesystem::path output_path_for(const CliArgs& args,
                                      const core::Settings& settings,
                                      const media::ResolvedMedia& media) {
    const std::filesystem::path dir = settings.output_dir;

    if (!args.output_file.empty()) {
        std::filesystem::path p(args.output_file);
        if (!p.has_parent_path() && !dir.empty()) {
            p = dir / p;
        }
        return p;
    }

    std::string name;
    std::string ext = DEFAULT_EXTENSION;
    if (!media.title.empty()) {
        name = media.base_name();
    } else {
        const auto& source = media.stream.kind == core::StreamKind::direct
            ? media.stream.direct_url
            : media.stream.manifest_url;
        if (auto parsed = core::Url::parse(source)) {
            const std::filesystem::path file(parsed->filename());
            name = media::sanitize_filename(file.stem().string());
            if (media.stream.kind == core::StreamKind::direct && is_direct_url(source)) {
                ext = parsed->extension();
            }
        }
    }
    if (name.empty()) {
        name = "video";
    }

    return dir / (name + ext);
}

//=============================================================================
// Commands
//=============================================================================

int info(const core::AcquisitionOrchestrator& orchestrator, const std::string& url) {
    auto manifest = orchestrator.inspect(url);
    if (!manifest) {
        std::cerr << "Error: " << manifest.error().message() << std::endl;
        return EXIT_FAILED;
    }

    std::cout << "URL: " << url << std::endl;
    if (manifest->effective_url != url) {
        std::cout << "Redirected to: " << manifest->effective_url << std::endl;
    }
    std::cout << "Format: " << media::to_string(manifest->format) << std::endl;
    if (manifest->duration > 0.0) {
        std::cout << "Duration: "
                  << ProgressBar::format_time(static_cast<std::uint64_t>(manifest->duration)) << std::endl;
    }
    if (manifest->segment_count > 0) {
        std::cout << "Segments: " << manifest->segment_count << std::endl;
    }

    if (!manifest->renditions.empty()) {
        std::cout << "Renditions:" << std::endl;
        for (std::size_t i = 0; i < manifest->renditions.size(); ++i) {
            const auto& r = manifest->renditions[i];
            std::cout << "  " << std::setw(2) << (i + 1) << ". ";
            std::cout << std::setw(11) << std::left
                      << (r.height > 0 ? std::to_string(r.width) + "x" + std::to_string(r.height) : "-")
                      << std::right;
            std::cout << std::setw(8) << (r.bandwidth / 1000) << " kbps";
            if (r.frame_rate > 0.0) {
                std::cout << "  " << std::fixed << std::setprecision(2) << r.frame_rate << " fps";
            }
            if (!r.codecs.empty()) std::cout << "  " << r.codecs;
            if (!r.id.empty()) std::cout << "  [" << r.id << "]";
            std::cout << std::endl;
        }
    }
    return EXIT_DONE;
}

int run(const CliArgs& args, std::stop_token stop) {
    auto settings = build_settings(args);
    if (!settings) {
        std::cerr << "Error: " << settings.error().message() << std::endl;
        return EXIT_USAGE;
    }

    log::init(log::parse_level(settings->log_level).value_or(spdlog::level::info));

    media::ResolvedMedia media;
    if (!args.descriptor.empty()) {
        media::JsonMetadataResolver resolver;
        auto resolved = resolver.resolve(args.descriptor);
        if (!resolved) {
            std::cerr << "Error: " << args.descriptor << ": " << resolved.error().message() << std::endl;
            return EXIT_USAGE;
        }
        media = std::move(*resolved);
        if (args.resolution || args.lowest) media.stream.rendition = settings->rendition;
        if (args.concurrency) media.stream.concurrency = args.concurrency;
        if (!args.fallback_url.empty()) media.stream.direct_url = args.fallback_url;
    } else {
        media = media_from_url(args, *settings);
    }

    CurlGlobal curl;
    core::HttpSession session(settings->http_options());
    core::AcquisitionOrchestrator orchestrator(session, settings->retry_policy(), settings->acquire_options());

    if (args.list_only) {
        if (media.stream.kind == core::StreamKind::direct) {
            std::cout << "Direct file: " << media.stream.direct_url << std::endl;
            return EXIT_DONE;
        }
        return info(orchestrator, media.stream.manifest_url);
    }

    const auto output = output_path_for(args, *settings, media);
    if (!media.title.empty() && !args.quiet) {
        std::cout << "Title: " << media.title << std::endl;
    }

    ProgressBar bar(media.stream.kind == core::StreamKind::direct ? "Downloading" : "Segments");
    core::ProgressCallback on_progress;
    if (!args.quiet) {
        on_progress = [&bar](const core::ProgressSnapshot& snapshot) { bar.update(snapshot); };
    }

    const auto result = orchestrator.acquire(media.stream, output, on_progress, stop);

    if (!args.quiet) {
        if (result.success) bar.finish();
        else bar.clear();
    }

    switch (result.state) {
        case core::AcquisitionState::cancelled:
            std::cerr << "Cancelled" << std::endl;
            return EXIT_CANCELLED;
        case core::AcquisitionState::done:
            break;
        default:
            std::cerr << "Error: " << result.message() << std::endl;
            return EXIT_FAILED;
    }

    if (!args.quiet) {
        std::cout << "Saved: " << result.output_path.string()
                  << " (" << ProgressBar::format_bytes(result.bytes) << ")";
        if (result.used_fallback) std::cout << " via fallback";
        std::cout << std::endl;
    }

    if (!args.mux_output.empty()) {
        return mux_outputs(args, *settings, session, media, result.output_path, stop);
    }
    return EXIT_DONE;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "reel " << program_name << " - Segmented media downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "  " << program_name << " [OPTIONS] --descriptor <FILE>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>     Save to specified file\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory\n";
    std::cout << "  -n, --concurrency <N>   Parallel segment fetches (default: " << core::DEFAULT_CONCURRENCY << ")\n";
    std::cout << "  -r, --retries <N>       Attempts per segment (default: " << core::DEFAULT_ATTEMPT_BUDGET << ")\n";
    std::cout << "      --resolution <H>    Prefer the rendition closest to height H\n";
    std::cout << "      --lowest            Pick the lowest bandwidth rendition\n";
    std::cout << "      --direct            Treat the URL as a single file\n";
    std::cout << "      --fallback <URL>    Direct file to use if the manifest fails\n";
    std::cout << "      --connections <N>   Byte-range connections for direct files\n";
    std::cout << "  -c, --config <FILE>     Load settings from a JSON file\n";
    std::cout << "      --descriptor <FILE> Read title, stream and tracks from a JSON descriptor\n";
    std::cout << "      --mux <FILE>        Mux video with descriptor tracks using mkvmerge\n";
    std::cout << "  -i, --info              List renditions without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/stream/master.m3u8\n";
    std::cout << "  " << program_name << " --resolution 720 -o episode.mp4 https://example.com/manifest.mpd\n";
    std::cout << "  " << program_name << " --connections 8 https://example.com/movie.mp4\n";
    std::cout << "\n";
    std::cout << "Created by changcheng967\n";
    std::cout << "Copyright changcheng967 2026\n";
}

void print_version() noexcept {
    std::cout << "reel " << reel::version.to_string() << std::endl;
    std::cout << "Created by changcheng967\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann::json, Qt6 Core\n";
}

} // namespace reel::cli
