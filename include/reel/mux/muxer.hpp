// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace reel::mux {

enum class MuxErrc {
    success = 0,
    missing_input,
    spawn_failed,
    tool_failed,
};

namespace detail {

struct MuxErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::mux";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<MuxErrc>(ev)) {
            case MuxErrc::success:       return "Success";
            case MuxErrc::missing_input: return "Input file missing";
            case MuxErrc::spawn_failed:  return "Could not start muxer";
            case MuxErrc::tool_failed:   return "Muxer reported an error";
            default:                     return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::MuxErrcCategory& mux_errc_category() noexcept {
    static detail::MuxErrcCategory category;
    return category;
}

inline std::error_code make_error_code(MuxErrc e) noexcept {
    return {static_cast<int>(e), mux_errc_category()};
}

struct TrackFile {
    std::filesystem::path path;
    std::string language;
};

// Inputs are local files; the muxer never touches the network
struct MuxRequest {
    std::filesystem::path video;
    std::string video_audio_language;     // Language of the audio inside `video`, if known
    std::vector<TrackFile> audio;
    std::vector<TrackFile> subtitles;
    std::filesystem::path output;
};

class Muxer {
public:
    virtual ~Muxer() = default;

    [[nodiscard]] virtual std::error_code mux(const MuxRequest& request) = 0;
};

// Runs mkvmerge as a child process
class MkvmergeMuxer final : public Muxer {
public:
    explicit MkvmergeMuxer(std::string executable = "mkvmerge") : executable_(std::move(executable)) {}

    // argv for the request, executable first
    [[nodiscard]] std::vector<std::string> build_arguments(const MuxRequest& request) const;

    [[nodiscard]] std::error_code mux(const MuxRequest& request) override;

private:
    std::string executable_;
};

} // namespace reel::mux

namespace std {

template<>
struct is_error_code_enum<reel::mux::MuxErrc> : true_type {};

} // namespace std
