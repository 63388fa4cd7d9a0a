// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/core/prefetch_pipeline.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>
#include <future>

namespace filelink::core {

//=============================================================================
// PrefetchPipeline
//=============================================================================

PrefetchPipeline::PrefetchPipeline(std::shared_ptr<ChunkSource> source,
                                   FileHandle file,
                                   ChunkPlan plan,
                                   const StreamLimits& limits)
    : source_(std::move(source))
    , file_(std::move(file))
    , plan_(plan)
    , max_parallel_(std::max<std::uint32_t>(limits.max_parallel_chunks, 1))
    , buffer_(limits.buffer_capacity) {}

PrefetchPipeline::~PrefetchPipeline() {
    cancel();
}

void PrefetchPipeline::start() {
    if (producer_.joinable()) return;

    running_.store(true, std::memory_order_release);
    producer_ = std::jthread([this](std::stop_token stop) {
        produce(stop);
    });
}

void PrefetchPipeline::cancel() noexcept {
    if (producer_.joinable()) {
        producer_.request_stop();
        producer_.join();
    }
}

void PrefetchPipeline::produce(std::stop_token stop) noexcept {
    using FetchResult = std::expected<Chunk, std::error_code>;

    // Fetches get their own stop source so a failed fetch can stop its
    // siblings without the producer itself being cancelled.
    std::stop_source fetch_stop;
    std::stop_callback forward(stop, [&fetch_stop] { fetch_stop.request_stop(); });

    std::deque<std::future<FetchResult>> window;
    std::uint32_t next_part = 0;
    std::error_code failure;

    try {
        while (!stop.stop_requested()) {
            while (window.size() < max_parallel_ && next_part < plan_.part_count) {
                const std::uint64_t offset = plan_.chunk_offset(next_part++);
                if (offset >= file_.size) {
                    next_part = plan_.part_count;
                    break;
                }
                auto token = fetch_stop.get_token();
                window.push_back(std::async(std::launch::async, [this, offset, token] {
                    return fetch_one(offset, token);
                }));
            }

            if (window.empty()) {
                break;
            }

            FetchResult result = window.front().get();
            window.pop_front();

            if (!result) {
                failure = result.error();
                break;
            }

            if (!buffer_.push(std::move(*result), stop)) {
                break;
            }
        }
    } catch (const std::exception& e) {
        // std::async could not start a thread, or allocation failed
        spdlog::error("Prefetch producer error - File: {}, Error: {}", file_.id, e.what());
        failure = make_error_code(StreamErrc::upstream_failure);
    }

    // Outstanding fetches are abandoned but still joined before returning
    fetch_stop.request_stop();
    window.clear();

    if (stop.stop_requested()) {
        buffer_.fail(make_error_code(StreamErrc::cancelled));
    } else if (failure) {
        if (failure != make_error_code(StreamErrc::cancelled)) {
            spdlog::error("Chunk fetch failed - File: {}, Error: {}", file_.id, failure.message());
        }
        buffer_.fail(make_error_code(StreamErrc::upstream_failure));
    } else {
        buffer_.finish();
    }

    running_.store(false, std::memory_order_release);
}

std::expected<Chunk, std::error_code>
PrefetchPipeline::fetch_one(std::uint64_t offset, std::stop_token stop) noexcept {
    auto now = in_flight_.fetch_add(1, std::memory_order_relaxed) + 1;
    auto peak = peak_in_flight_.load(std::memory_order_relaxed);
    while (now > peak && !peak_in_flight_.compare_exchange_weak(peak, now, std::memory_order_relaxed)) {
    }

    std::expected<Chunk, std::error_code> result;
    try {
        result = source_->fetch(file_, offset, plan_.chunk_size, stop);
    } catch (const std::exception& e) {
        spdlog::error("Chunk source threw - File: {}, Offset: {}, Error: {}", file_.id, offset, e.what());
        result = std::unexpected(make_error_code(StreamErrc::upstream_failure));
    }

    if (result) {
        fetched_.fetch_add(1, std::memory_order_relaxed);
    }
    in_flight_.fetch_sub(1, std::memory_order_relaxed);
    return result;
}

} // namespace filelink::core
