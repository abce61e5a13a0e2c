// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/orchestrator.hpp>
#include <reel/core/retry.hpp>
#include <reel/media/rendition.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace reel::core {

enum class SettingsErrc {
    success = 0,
    file_not_found,
    parse_error,
    invalid_value,
};

namespace detail {

struct SettingsErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::settings";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<SettingsErrc>(ev)) {
            case SettingsErrc::success:        return "Success";
            case SettingsErrc::file_not_found: return "Settings file not found";
            case SettingsErrc::parse_error:    return "Settings file is not valid JSON";
            case SettingsErrc::invalid_value:  return "Invalid settings value";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::SettingsErrcCategory& settings_errc_category() noexcept {
    static detail::SettingsErrcCategory category;
    return category;
}

inline std::error_code make_error_code(SettingsErrc e) noexcept {
    return {static_cast<int>(e), settings_errc_category()};
}

// Runtime configuration. Defaults come from config.hpp; a JSON file
// overrides them and command-line flags override the file.
struct Settings {
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    std::uint32_t attempt_budget{DEFAULT_ATTEMPT_BUDGET};
    std::chrono::milliseconds base_delay{DEFAULT_BASE_DELAY};
    std::chrono::milliseconds max_delay{DEFAULT_MAX_DELAY};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::string user_agent;
    std::vector<std::pair<std::string, std::string>> headers;
    std::uint32_t direct_connections{DEFAULT_DIRECT_CONNECTIONS};
    media::RenditionPolicy rendition;
    std::filesystem::path output_dir;
    std::string log_level{"info"};

    // Parse a JSON document. Unknown keys are ignored.
    [[nodiscard]] static std::expected<Settings, std::error_code>
    from_json(std::string_view text) noexcept;

    [[nodiscard]] static std::expected<Settings, std::error_code>
    load(const std::filesystem::path& path) noexcept;

    // Range checks shared by the file loader and the command line
    [[nodiscard]] std::error_code validate() const noexcept;

    [[nodiscard]] RetryPolicy retry_policy() const noexcept;
    [[nodiscard]] HttpOptions http_options() const;
    [[nodiscard]] AcquireOptions acquire_options() const noexcept;
};

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::SettingsErrc> : true_type {};

} // namespace std
