// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/settings.hpp>
#include <reel/core/log.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>
#include <sstream>

namespace reel::core {

namespace {

using json = nlohmann::json;

constexpr std::uint32_t MAX_DIRECT_CONNECTIONS = 64;
constexpr std::uint32_t MAX_ATTEMPT_BUDGET = 100;

std::error_code invalid(std::string_view key) {
    spdlog::error("Settings: invalid value for '{}'", key);
    return make_error_code(SettingsErrc::invalid_value);
}

// Read an unsigned field when present. Missing keys keep `out`.
std::error_code read_uint(const json& doc, std::string_view key, std::uint32_t& out) {
    auto it = doc.find(std::string(key));
    if (it == doc.end()) return {};
    if (!it->is_number_unsigned() || it->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        return invalid(key);
    }
    out = it->get<std::uint32_t>();
    return {};
}

std::error_code read_millis(const json& doc, std::string_view key, std::chrono::milliseconds& out) {
    auto it = doc.find(std::string(key));
    if (it == doc.end()) return {};
    if (!it->is_number_unsigned()) return invalid(key);
    out = std::chrono::milliseconds{it->get<std::int64_t>()};
    return {};
}

std::error_code read_string(const json& doc, std::string_view key, std::string& out) {
    auto it = doc.find(std::string(key));
    if (it == doc.end()) return {};
    if (!it->is_string()) return invalid(key);
    out = it->get<std::string>();
    return {};
}

} // namespace

std::expected<Settings, std::error_code> Settings::from_json(std::string_view text) noexcept {
    try {
        const json doc = json::parse(text);
        if (!doc.is_object()) {
            return std::unexpected(make_error_code(SettingsErrc::parse_error));
        }

        Settings s;
        std::string output_dir;
        std::string rendition;

        for (auto ec : {
                 read_uint(doc, "concurrency", s.concurrency),
                 read_uint(doc, "attempt_budget", s.attempt_budget),
                 read_millis(doc, "base_delay_ms", s.base_delay),
                 read_millis(doc, "max_delay_ms", s.max_delay),
                 read_uint(doc, "connect_timeout_sec", s.connect_timeout_sec),
                 read_uint(doc, "stall_timeout_sec", s.stall_timeout_sec),
                 read_string(doc, "user_agent", s.user_agent),
                 read_uint(doc, "direct_connections", s.direct_connections),
                 read_string(doc, "output_dir", output_dir),
                 read_string(doc, "log_level", s.log_level),
                 read_string(doc, "rendition", rendition),
             }) {
            if (ec) return std::unexpected(ec);
        }

        if (!output_dir.empty()) {
            s.output_dir = output_dir;
        }

        if (!rendition.empty()) {
            auto policy = media::parse_policy(rendition);
            if (!policy) return std::unexpected(invalid("rendition"));
            s.rendition = *policy;
        }

        if (auto it = doc.find("preferred_height"); it != doc.end()) {
            if (!it->is_number_unsigned() || it->get<std::uint64_t>() == 0) {
                return std::unexpected(invalid("preferred_height"));
            }
            s.rendition = media::RenditionPolicy::prefer_height(it->get<std::uint32_t>());
        }

        if (auto it = doc.find("headers"); it != doc.end()) {
            if (!it->is_object()) return std::unexpected(invalid("headers"));
            for (const auto& [name, value] : it->items()) {
                if (!value.is_string()) return std::unexpected(invalid("headers"));
                s.headers.emplace_back(name, value.get<std::string>());
            }
        }

        if (auto ec = s.validate()) {
            return std::unexpected(ec);
        }
        return s;
    } catch (const json::exception& e) {
        spdlog::error("Settings: {}", e.what());
        return std::unexpected(make_error_code(SettingsErrc::parse_error));
    } catch (const std::exception& e) {
        spdlog::error("Settings: {}", e.what());
        return std::unexpected(make_error_code(SettingsErrc::parse_error));
    }
}

std::expected<Settings, std::error_code> Settings::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(SettingsErrc::file_not_found));
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        auto settings = from_json(buffer.str());
        if (settings) {
            spdlog::debug("Loaded settings from {}", path.string());
        }
        return settings;
    } catch (const std::exception& e) {
        spdlog::error("Cannot read {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(SettingsErrc::file_not_found));
    }
}

std::error_code Settings::validate() const noexcept {
    if (concurrency == 0 || concurrency > MAX_CONCURRENCY) {
        return make_error_code(SettingsErrc::invalid_value);
    }
    if (attempt_budget == 0 || attempt_budget > MAX_ATTEMPT_BUDGET) {
        return make_error_code(SettingsErrc::invalid_value);
    }
    if (direct_connections == 0 || direct_connections > MAX_DIRECT_CONNECTIONS) {
        return make_error_code(SettingsErrc::invalid_value);
    }
    if (max_delay < base_delay) {
        return make_error_code(SettingsErrc::invalid_value);
    }
    if (!log::parse_level(log_level)) {
        return make_error_code(SettingsErrc::invalid_value);
    }
    return {};
}

RetryPolicy Settings::retry_policy() const noexcept {
    RetryPolicy policy;
    policy.max_attempts = attempt_budget;
    policy.base_delay = base_delay;
    policy.max_delay = max_delay;
    return policy;
}

HttpOptions Settings::http_options() const {
    HttpOptions options;
    options.connect_timeout_sec = connect_timeout_sec;
    options.stall_timeout_sec = stall_timeout_sec;
    options.user_agent = user_agent;
    options.headers = headers;
    return options;
}

AcquireOptions Settings::acquire_options() const noexcept {
    AcquireOptions options;
    options.concurrency = concurrency;
    options.attempt_budget = attempt_budget;
    options.direct_connections = direct_connections;
    return options;
}

} // namespace reel::core
