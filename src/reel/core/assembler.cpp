// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/assembler.hpp>
#include <reel/core/config.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>

namespace reel::core {

namespace {

std::string join_indices(const std::vector<std::uint32_t>& indices) {
    constexpr std::size_t MAX_LISTED = 20;
    std::string out;
    for (std::size_t i = 0; i < indices.size() && i < MAX_LISTED; ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(indices[i]);
    }
    if (indices.size() > MAX_LISTED) {
        out += ", ... (" + std::to_string(indices.size()) + " total)";
    }
    return out;
}

std::unexpected<AssemblyError> fail(std::error_code ec, std::vector<std::uint32_t> missing = {}) {
    return std::unexpected(AssemblyError{ec, std::move(missing)});
}

} // namespace

std::string AssemblyError::message() const {
    std::string msg = code.message();
    if (!missing.empty()) {
        msg += ": " + join_indices(missing);
    }
    return msg;
}

std::filesystem::path partial_path(const std::filesystem::path& output_path) {
    auto p = output_path;
    p += PARTIAL_SUFFIX;
    return p;
}

std::expected<std::filesystem::path, AssemblyError>
assemble(const ResultMap& results,
         std::uint32_t expected_count,
         const std::filesystem::path& output_path) {
    if (expected_count == 0) {
        return fail(make_error_code(AcquireErrc::empty_manifest));
    }

    auto missing = missing_indices(results, expected_count);
    if (!missing.empty()) {
        spdlog::error("Cannot assemble {}: {} of {} segments missing ({})",
                      output_path.string(), missing.size(), expected_count, join_indices(missing));
        return fail(make_error_code(AcquireErrc::missing_segments), std::move(missing));
    }

    const auto partial = partial_path(output_path);
    disk::FileWriter writer;
    if (auto ec = writer.open(partial)) {
        spdlog::error("Cannot open {}: {}", partial.string(), ec.message());
        return fail(ec);
    }

    auto abandon = [&](std::error_code ec) {
        (void)writer.close();
        disk::remove_quietly(partial);
        return fail(ec);
    };

    for (std::uint32_t i = 0; i < expected_count; ++i) {
        const SegmentResult& r = results.at(i);

        std::error_code size_ec;
        const auto on_disk = std::filesystem::file_size(r.spool_path, size_ec);
        if (size_ec || on_disk != r.bytes) {
            spdlog::error("Segment {}: spool holds {} bytes, expected {}",
                          i, size_ec ? 0 : on_disk, r.bytes);
            return abandon(make_error_code(AcquireErrc::integrity_error));
        }

        auto copied = writer.append_file(r.spool_path, ASSEMBLY_CHUNK_SIZE);
        if (!copied) {
            spdlog::error("Segment {}: {}", i, copied.error().message());
            return abandon(copied.error());
        }
        if (*copied != r.bytes) {
            return abandon(make_error_code(AcquireErrc::integrity_error));
        }
    }

    if (auto ec = writer.close()) {
        disk::remove_quietly(partial);
        return fail(ec);
    }

    if (auto ec = disk::rename_file(partial, output_path)) {
        disk::remove_quietly(partial);
        return fail(ec);
    }

    spdlog::info("Assembled {} segments into {}", expected_count, output_path.string());
    return output_path;
}

} // namespace reel::core
