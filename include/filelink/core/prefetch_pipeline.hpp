// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/chunk_plan.hpp>
#include <filelink/core/chunk_source.hpp>
#include <filelink/core/config.hpp>
#include <filelink/core/prefetch_buffer.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <thread>

namespace filelink::core {

// Fetches the chunks of a plan ahead of the consumer.
//
// A single producer thread keeps at most max_parallel_chunks fetches in
// flight. Results are handed to the buffer strictly in submission order: the
// producer always waits for the oldest fetch before issuing a new one, so the
// buffer sees ascending offsets no matter which fetch finishes first.
class PrefetchPipeline {
public:
    PrefetchPipeline(std::shared_ptr<ChunkSource> source,
                     FileHandle file,
                     ChunkPlan plan,
                     const StreamLimits& limits);
    ~PrefetchPipeline();

    // Non-copyable, non-movable (owns a running thread)
    PrefetchPipeline(const PrefetchPipeline&) = delete;
    PrefetchPipeline& operator=(const PrefetchPipeline&) = delete;
    PrefetchPipeline(PrefetchPipeline&&) = delete;
    PrefetchPipeline& operator=(PrefetchPipeline&&) = delete;

    // Launch the producer thread
    void start();

    // Stop the producer and every outstanding fetch, then wait for them
    void cancel() noexcept;

    [[nodiscard]] PrefetchBuffer& buffer() noexcept { return buffer_; }
    [[nodiscard]] const PrefetchBuffer& buffer() const noexcept { return buffer_; }

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint32_t in_flight() const noexcept { return in_flight_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint32_t peak_in_flight() const noexcept { return peak_in_flight_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint32_t chunks_fetched() const noexcept { return fetched_.load(std::memory_order_relaxed); }

private:
    void produce(std::stop_token stop) noexcept;

    [[nodiscard]] std::expected<Chunk, std::error_code>
    fetch_one(std::uint64_t offset, std::stop_token stop) noexcept;

    std::shared_ptr<ChunkSource> source_;
    FileHandle file_;
    ChunkPlan plan_;
    std::uint32_t max_parallel_;

    PrefetchBuffer buffer_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint32_t> in_flight_{0};
    std::atomic<std::uint32_t> peak_in_flight_{0};
    std::atomic<std::uint32_t> fetched_{0};

    std::jthread producer_;
};

} // namespace filelink::core
