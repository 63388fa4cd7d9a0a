// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/core/chunk_plan.hpp>

namespace filelink::core {

ChunkPlan plan_chunks(const ByteRange& range,
                      std::uint64_t file_size,
                      std::uint64_t chunk_size) noexcept {
    const ByteRange r = range.clamped(file_size);

    ChunkPlan plan;
    plan.chunk_size = chunk_size;
    plan.offset = r.start - (r.start % chunk_size);
    plan.first_trim = r.start - plan.offset;
    plan.last_trim = (r.end % chunk_size) + 1;
    plan.total_bytes = r.length();

    // Index of the chunk holding the last byte, minus the first, inclusive.
    // An end landing on a chunk boundary still needs that chunk.
    plan.part_count = static_cast<std::uint32_t>(r.end / chunk_size - plan.offset / chunk_size + 1);

    return plan;
}

} // namespace filelink::core
