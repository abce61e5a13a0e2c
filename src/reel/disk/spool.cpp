// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/spool.hpp>
#include <reel/core/config.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>

namespace reel::disk {

std::expected<SpoolDirectory, std::error_code>
SpoolDirectory::create(const std::filesystem::path& output_path) noexcept {
    if (output_path.empty()) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    std::filesystem::path dir = output_path;
    dir += core::SPOOL_SUFFIX;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Cannot create spool directory {}: {}", dir.string(), ec.message());
        return std::unexpected(errno_to_error_code(ec.value(), DiskErrc::invalid_path));
    }

    spdlog::debug("Spooling segments under {}", dir.string());
    return SpoolDirectory(std::move(dir));
}

SpoolDirectory::~SpoolDirectory() {
    remove_all();
}

SpoolDirectory::SpoolDirectory(SpoolDirectory&& other) noexcept
    : dir_(std::move(other.dir_)) {
    other.dir_.clear();
}

SpoolDirectory& SpoolDirectory::operator=(SpoolDirectory&& other) noexcept {
    if (this != &other) {
        remove_all();
        dir_ = std::move(other.dir_);
        other.dir_.clear();
    }
    return *this;
}

std::filesystem::path SpoolDirectory::part_path(std::uint32_t index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "seg_%06u.part", static_cast<unsigned>(index));
    return dir_ / name;
}

void SpoolDirectory::remove_all() noexcept {
    if (dir_.empty()) return;

    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
    if (ec) {
        spdlog::warn("Could not remove spool directory {}: {}", dir_.string(), ec.message());
    }
    dir_.clear();
}

} // namespace reel::disk
