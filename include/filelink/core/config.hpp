// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>

namespace filelink::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;      // 4 MiB, fixed by the store
constexpr std::uint32_t MAX_PARALLEL_CHUNKS = 10;                   // Outstanding fetches per session
constexpr std::size_t PREFETCH_BUFFER_CAPACITY = 50;                // Chunks buffered per session
constexpr std::uint32_t MAX_CONCURRENT_SESSIONS = 100;

constexpr std::chrono::milliseconds METADATA_TIMEOUT{10'000};
constexpr std::chrono::milliseconds PULL_TIMEOUT{15'000};
constexpr std::uint32_t MAX_PULL_RETRIES = 8;                       // Consecutive pull timeouts before giving up

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::chrono::milliseconds RETRY_DELAY{200};

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;                // 256 KB

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

// Per-deployment tunables for the streaming engine
struct StreamLimits {
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_parallel_chunks{MAX_PARALLEL_CHUNKS};
    std::size_t buffer_capacity{PREFETCH_BUFFER_CAPACITY};
    std::chrono::milliseconds pull_timeout{PULL_TIMEOUT};
    std::uint32_t max_pull_retries{MAX_PULL_RETRIES};
    std::chrono::milliseconds metadata_timeout{METADATA_TIMEOUT};
    std::uint32_t max_sessions{MAX_CONCURRENT_SESSIONS};
};

} // namespace filelink::core
