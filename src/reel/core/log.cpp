// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>

namespace reel::log {

void init(spdlog::level::level_enum level) {
    // stderr only; stdout carries the progress bar and --info output
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("reel", std::move(sink));
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(level);
    spdlog::set_default_logger(std::move(logger));
}

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace reel::log
