// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <optional>
#include <string_view>

namespace reel::log {

// Install the stderr colour logger as the spdlog default
void init(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error" or "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_level(std::string_view name) noexcept;

} // namespace reel::log
