// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/chunk_source.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <stop_token>

namespace filelink::core {

// Bounded FIFO between the prefetch producer and the stream consumer.
// The producer ends the stream with finish() (the sentinel) or fail().
class PrefetchBuffer {
public:
    explicit PrefetchBuffer(std::size_t capacity);

    PrefetchBuffer(const PrefetchBuffer&) = delete;
    PrefetchBuffer& operator=(const PrefetchBuffer&) = delete;

    // Blocks while the buffer is full. Returns false if stop was requested
    // or the stream has already been ended.
    [[nodiscard]] bool push(Chunk chunk, std::stop_token stop);

    // Enqueue the end-of-stream sentinel
    void finish() noexcept;

    // End the stream with an error, delivered after the chunks already queued
    void fail(std::error_code ec) noexcept;

    // Next chunk, std::nullopt for the sentinel, StreamErrc::pull_timeout if
    // nothing arrived within timeout, or the producer's error.
    [[nodiscard]] std::expected<std::optional<Chunk>, std::error_code>
    pop(std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    // Largest number of chunks ever held at once
    [[nodiscard]] std::size_t high_water_mark() const noexcept;

private:
    [[nodiscard]] bool ended() const noexcept { return finished_ || error_; }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_full_;
    std::condition_variable not_empty_;
    std::deque<Chunk> chunks_;
    std::size_t high_water_{0};
    bool finished_{false};
    std::error_code error_;
};

} // namespace filelink::core
