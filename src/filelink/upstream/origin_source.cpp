// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/upstream/origin_source.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace filelink::upstream {

using core::StreamErrc;
using core::make_error_code;

namespace {

// Sleep that wakes up early when stop is requested
bool wait_for_retry(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    (void)cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

} // namespace

OriginChunkSource::OriginChunkSource(std::shared_ptr<HttpSession> session,
                                     std::uint32_t retry_count,
                                     std::chrono::milliseconds retry_delay)
    : session_(std::move(session))
    , retry_count_(retry_count)
    , retry_delay_(retry_delay) {}

std::expected<core::Chunk, std::error_code>
OriginChunkSource::fetch(const core::FileHandle& file,
                         std::uint64_t offset,
                         std::uint64_t length,
                         std::stop_token stop) {
    if (offset >= file.size) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    const std::uint64_t expected_length = std::min(length, file.size - offset);

    std::uint32_t attempt = 0;
    while (true) {
        auto result = session_->get_range(file.source, offset, expected_length, stop);

        if (result) {
            if (result->size() != expected_length) {
                spdlog::warn("Short chunk - File: {}, Offset: {}, Got: {}, Expected: {}",
                             file.id, offset, result->size(), expected_length);
                return std::unexpected(make_error_code(StreamErrc::stream_truncated));
            }
            return result;
        }

        // Only transport failures are worth another attempt
        if (result.error() != make_error_code(StreamErrc::upstream_failure) || attempt >= retry_count_) {
            return std::unexpected(result.error());
        }

        ++attempt;
        spdlog::warn("Chunk fetch retry {}/{} - File: {}, Offset: {}", attempt, retry_count_, file.id, offset);
        if (!wait_for_retry(retry_delay_, stop)) {
            return std::unexpected(make_error_code(StreamErrc::cancelled));
        }
    }
}

} // namespace filelink::upstream
