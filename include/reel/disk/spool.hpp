// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace reel::disk {

// Run-scoped directory holding one part file per fetched segment.
// The directory and everything in it is removed on destruction.
class SpoolDirectory {
public:
    // Create `<output><SPOOL_SUFFIX>` next to the output file
    [[nodiscard]] static std::expected<SpoolDirectory, std::error_code>
    create(const std::filesystem::path& output_path) noexcept;

    ~SpoolDirectory();

    // Non-copyable, movable
    SpoolDirectory(const SpoolDirectory&) = delete;
    SpoolDirectory& operator=(const SpoolDirectory&) = delete;
    SpoolDirectory(SpoolDirectory&& other) noexcept;
    SpoolDirectory& operator=(SpoolDirectory&& other) noexcept;

    // seg_000042.part
    [[nodiscard]] std::filesystem::path part_path(std::uint32_t index) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return dir_; }

private:
    explicit SpoolDirectory(std::filesystem::path dir) noexcept : dir_(std::move(dir)) {}

    void remove_all() noexcept;

    std::filesystem::path dir_;
};

} // namespace reel::disk
