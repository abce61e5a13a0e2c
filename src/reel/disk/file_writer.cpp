// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <vector>

namespace reel::disk {

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
                            return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (file_) {
        std::fclose(file_);
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : file_(other.file_)
    , path_(std::move(other.path_))
    , bytes_written_(other.bytes_written_) {
    other.file_ = nullptr;
    other.bytes_written_ = 0;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (file_) std::fclose(file_);
        file_ = other.file_;
        path_ = std::move(other.path_);
        bytes_written_ = other.bytes_written_;
        other.file_ = nullptr;
        other.bytes_written_ = 0;
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path) noexcept {
    if (file_) {
        return make_error_code(DiskErrc::file_exists);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return errno_to_error_code(ec.value(), DiskErrc::invalid_path);
        }
    }

    file_ = std::fopen(path.c_str(), "wb");
    if (!file_) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }

    path_ = path;
    bytes_written_ = 0;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (size == 0) {
        return {};
    }

    if (std::fwrite(data, 1, size, file_) != size) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    bytes_written_ += size;
    return {};
}

std::expected<std::uint64_t, std::error_code>
FileWriter::append_file(const std::filesystem::path& source, std::size_t chunk_size) noexcept {
    if (!file_) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    std::FILE* in = std::fopen(source.c_str(), "rb");
    if (!in) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }

    std::uint64_t copied = 0;
    std::error_code ec;
    try {
        std::vector<char> buffer(chunk_size > 0 ? chunk_size : 64 * 1024);
        while (true) {
            const std::size_t n = std::fread(buffer.data(), 1, buffer.size(), in);
            if (n > 0) {
                ec = write(buffer.data(), n);
                if (ec) break;
                copied += n;
            }
            if (n < buffer.size()) {
                if (std::ferror(in)) {
                    ec = make_error_code(DiskErrc::read_error);
                }
                break;
            }
        }
    } catch (const std::bad_alloc&) {
        ec = std::make_error_code(std::errc::not_enough_memory);
    }

    std::fclose(in);
    if (ec) {
        return std::unexpected(ec);
    }
    return copied;
}

std::error_code FileWriter::truncate() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    file_ = std::freopen(path_.c_str(), "wb", file_);
    if (!file_) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    bytes_written_ = 0;
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (std::fflush(file_) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (!file_) {
        return {};
    }

    std::error_code ec;
    if (std::fflush(file_) != 0) {
        ec = errno_to_error_code(errno, DiskErrc::write_error);
    }
    if (std::fclose(file_) != 0 && !ec) {
        ec = errno_to_error_code(errno, DiskErrc::write_error);
    }
    file_ = nullptr;
    return ec;
}

//=============================================================================
// Helpers
//=============================================================================

bool remove_quietly(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Could not remove {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

std::error_code rename_file(const std::filesystem::path& from,
                            const std::filesystem::path& to) noexcept {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        spdlog::error("Rename {} -> {} failed: {}", from.string(), to.string(), ec.message());
        return make_error_code(DiskErrc::rename_failed);
    }
    return {};
}

} // namespace reel::disk
