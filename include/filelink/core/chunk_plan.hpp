// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/range.hpp>
#include <cstdint>

namespace filelink::core {

// How a byte range is covered by whole, chunk-aligned fetches
struct ChunkPlan {
    std::uint64_t offset{0};       // Chunk-aligned start of the first fetch
    std::uint64_t first_trim{0};   // Bytes dropped from the front of the first chunk
    std::uint64_t last_trim{0};    // Bytes kept from the last chunk
    std::uint32_t part_count{0};   // Chunks to fetch
    std::uint64_t total_bytes{0};  // Bytes delivered to the client
    std::uint64_t chunk_size{0};

    // Offset of the n-th chunk (0-based) of the plan
    [[nodiscard]] constexpr std::uint64_t chunk_offset(std::uint32_t index) const noexcept {
        return offset + static_cast<std::uint64_t>(index) * chunk_size;
    }

    constexpr bool operator==(const ChunkPlan&) const = default;
};

// Plan the fetches for a resolved range. The range end is clamped to the
// last byte of the file first.
[[nodiscard]] ChunkPlan plan_chunks(const ByteRange& range,
                                    std::uint64_t file_size,
                                    std::uint64_t chunk_size) noexcept;

} // namespace filelink::core
