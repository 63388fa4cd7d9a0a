// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/core/prefetch_buffer.hpp>
#include <algorithm>

namespace filelink::core {

PrefetchBuffer::PrefetchBuffer(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool PrefetchBuffer::push(Chunk chunk, std::stop_token stop) {
    std::unique_lock lock(mutex_);

    bool ready = not_full_.wait(lock, stop, [this] {
        return chunks_.size() < capacity_ || ended();
    });
    if (!ready || ended()) {
        return false;
    }

    chunks_.push_back(std::move(chunk));
    high_water_ = std::max(high_water_, chunks_.size());
    lock.unlock();

    not_empty_.notify_one();
    return true;
}

void PrefetchBuffer::finish() noexcept {
    {
        std::lock_guard lock(mutex_);
        finished_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void PrefetchBuffer::fail(std::error_code ec) noexcept {
    {
        std::lock_guard lock(mutex_);
        if (!finished_ && !error_) {
            error_ = ec;
        }
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

std::expected<std::optional<Chunk>, std::error_code>
PrefetchBuffer::pop(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);

    bool ready = not_empty_.wait_for(lock, timeout, [this] {
        return !chunks_.empty() || ended();
    });
    if (!ready) {
        return std::unexpected(make_error_code(StreamErrc::pull_timeout));
    }

    if (!chunks_.empty()) {
        Chunk chunk = std::move(chunks_.front());
        chunks_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return std::optional<Chunk>{std::move(chunk)};
    }

    if (error_) {
        return std::unexpected(error_);
    }

    // Sentinel stays in place so repeated pops keep reporting end-of-stream
    return std::optional<Chunk>{};
}

std::size_t PrefetchBuffer::size() const noexcept {
    std::lock_guard lock(mutex_);
    return chunks_.size();
}

std::size_t PrefetchBuffer::high_water_mark() const noexcept {
    std::lock_guard lock(mutex_);
    return high_water_;
}

} // namespace filelink::core
