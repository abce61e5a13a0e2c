// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>

namespace reel::core {

constexpr std::uint32_t DEFAULT_CONCURRENCY = 16;                   // Parallel segment fetches
constexpr std::uint32_t MAX_CONCURRENCY = 256;
constexpr std::uint32_t DEFAULT_ATTEMPT_BUDGET = 3;                 // Total attempts per segment
constexpr std::uint32_t DEFAULT_DIRECT_CONNECTIONS = 1;             // 1 = single request

constexpr std::chrono::milliseconds DEFAULT_BASE_DELAY{250};
constexpr std::chrono::milliseconds DEFAULT_MAX_DELAY{8000};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 20;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;                     // Abort below 1 B/s for this long
constexpr std::uint32_t MAX_REDIRECTS = 10;

// Below this size a direct file is never split into ranges
constexpr std::uint64_t MIN_RANGED_FILE_SIZE = 4 * 1024 * 1024;     // 4 MB

constexpr std::size_t ASSEMBLY_CHUNK_SIZE = 1024 * 1024;            // 1 MB copy buffer
constexpr std::size_t RECEIVE_BUFFER_SIZE = 256 * 1024;             // 256 KB

constexpr const char* PARTIAL_SUFFIX = ".partial";
constexpr const char* SPOOL_SUFFIX = ".reel-parts";

} // namespace reel::core
