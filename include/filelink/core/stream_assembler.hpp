// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/chunk_plan.hpp>
#include <filelink/core/prefetch_buffer.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>

namespace filelink::core {

// Turns the buffered chunks of a plan into the exact response body.
// The first and last chunks are trimmed, middle chunks pass through whole.
class StreamAssembler {
public:
    using Slice = std::span<std::byte>;  // Into the current chunk, valid until the next call

    StreamAssembler(ChunkPlan plan,
                    PrefetchBuffer& buffer,
                    std::chrono::milliseconds pull_timeout,
                    std::uint32_t max_pull_retries) noexcept;

    StreamAssembler(const StreamAssembler&) = delete;
    StreamAssembler& operator=(const StreamAssembler&) = delete;

    // Next piece of the body, valid until the following call.
    // std::nullopt once all plan.total_bytes bytes have been produced.
    // Errors are sticky: every later call returns the same error.
    [[nodiscard]] std::expected<std::optional<Slice>, std::error_code> next();

    [[nodiscard]] bool done() const noexcept { return current_part_ > plan_.part_count; }
    [[nodiscard]] std::uint32_t parts_emitted() const noexcept { return current_part_ - 1; }
    [[nodiscard]] std::uint64_t bytes_emitted() const noexcept { return emitted_; }

private:
    [[nodiscard]] std::unexpected<std::error_code> fail(std::error_code ec) noexcept;

    ChunkPlan plan_;
    PrefetchBuffer& buffer_;
    std::chrono::milliseconds pull_timeout_;
    std::uint32_t max_pull_retries_;

    std::uint32_t current_part_{1};
    std::uint64_t emitted_{0};
    Chunk current_;
    std::error_code error_;
};

} // namespace filelink::core
