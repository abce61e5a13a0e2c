// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/mux/muxer.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace reel::mux {

std::vector<std::string> MkvmergeMuxer::build_arguments(const MuxRequest& request) const {
    std::vector<std::string> args{executable_, "-o", request.output.string()};

    // Track 1 of a typical MP4 is its audio
    if (!request.video_audio_language.empty()) {
        args.emplace_back("--language");
        args.emplace_back("1:" + request.video_audio_language);
    }
    args.push_back(request.video.string());

    for (const auto& track : request.audio) {
        if (!track.language.empty()) {
            args.emplace_back("--language");
            args.emplace_back("0:" + track.language);
        }
        args.push_back(track.path.string());
    }

    for (const auto& track : request.subtitles) {
        if (!track.language.empty()) {
            args.emplace_back("--language");
            args.emplace_back("0:" + track.language);
        }
        args.push_back(track.path.string());
    }
    return args;
}

std::error_code MkvmergeMuxer::mux(const MuxRequest& request) {
    std::error_code ec;
    if (!std::filesystem::exists(request.video, ec)) {
        spdlog::error("Mux input missing: {}", request.video.string());
        return make_error_code(MuxErrc::missing_input);
    }
    for (const auto* tracks : {&request.audio, &request.subtitles}) {
        for (const auto& track : *tracks) {
            if (!std::filesystem::exists(track.path, ec)) {
                spdlog::error("Mux input missing: {}", track.path.string());
                return make_error_code(MuxErrc::missing_input);
            }
        }
    }

    auto args = build_arguments(request);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    spdlog::info("Muxing into {}", request.output.string());

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        spdlog::error("Cannot start {}: {}", executable_, std::strerror(rc));
        return make_error_code(MuxErrc::spawn_failed);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid failed: {}", std::strerror(errno));
            return make_error_code(MuxErrc::tool_failed);
        }
    }

    // mkvmerge exits 1 when it only emitted warnings
    if (WIFEXITED(status) && WEXITSTATUS(status) <= 1) {
        if (WEXITSTATUS(status) == 1) {
            spdlog::warn("{} finished with warnings", executable_);
        }
        return {};
    }

    spdlog::error("{} failed (status {})", executable_,
                  WIFEXITED(status) ? WEXITSTATUS(status) : -1);
    return make_error_code(MuxErrc::tool_failed);
}

} // namespace reel::mux
