// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/scheduler.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace reel::core {

struct AssemblyError {
    std::error_code code;
    std::vector<std::uint32_t> missing;   // Ascending; set for missing_segments

    [[nodiscard]] std::string message() const;
};

// Concatenate spooled segments 0..expected_count-1 into `output_path`.
// Presence of every index is checked before anything is written. Output
// goes to `<output>.partial` and is renamed into place only on success;
// a failed assembly leaves nothing behind.
[[nodiscard]] std::expected<std::filesystem::path, AssemblyError>
assemble(const ResultMap& results,
         std::uint32_t expected_count,
         const std::filesystem::path& output_path);

// "<output>.partial"
[[nodiscard]] std::filesystem::path partial_path(const std::filesystem::path& output_path);

} // namespace reel::core
