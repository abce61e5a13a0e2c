// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <cstdint>
#include <cstdio>
#include <expected>
#include <filesystem>
#include <string_view>

namespace reel::disk {

// Sequential, append-only file writer. Not thread-safe; each fetch task
// and the assembler own their own instance.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate the file, creating parent directories
    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    // Append data
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Append the full contents of another file, returning the bytes copied
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    append_file(const std::filesystem::path& source, std::size_t chunk_size) noexcept;

    // Rewind to an empty file (used between fetch attempts)
    [[nodiscard]] std::error_code truncate() noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    // Flush and close. Returns the first error seen while closing.
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    std::FILE* file_{nullptr};
    std::filesystem::path path_;
    std::uint64_t bytes_written_{0};
};

// Remove a file, ignoring a missing one. Returns true when nothing remains.
bool remove_quietly(const std::filesystem::path& path) noexcept;

// Atomically replace `to` with `from`
[[nodiscard]] std::error_code rename_file(const std::filesystem::path& from,
                                          const std::filesystem::path& to) noexcept;

} // namespace reel::disk
