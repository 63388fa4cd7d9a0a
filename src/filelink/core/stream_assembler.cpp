// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/core/stream_assembler.hpp>
#include <spdlog/spdlog.h>

namespace filelink::core {

StreamAssembler::StreamAssembler(ChunkPlan plan,
                                 PrefetchBuffer& buffer,
                                 std::chrono::milliseconds pull_timeout,
                                 std::uint32_t max_pull_retries) noexcept
    : plan_(plan)
    , buffer_(buffer)
    , pull_timeout_(pull_timeout)
    , max_pull_retries_(max_pull_retries) {}

std::expected<std::optional<StreamAssembler::Slice>, std::error_code>
StreamAssembler::next() {
    if (error_) {
        return std::unexpected(error_);
    }
    if (done()) {
        return std::optional<Slice>{};
    }

    // Stalls are tolerated up to the retry ceiling, then the stream is failed
    std::uint32_t timeouts = 0;
    while (true) {
        auto popped = buffer_.pop(pull_timeout_);
        if (popped) {
            if (!*popped) {
                // Sentinel before the plan was covered
                return fail(make_error_code(StreamErrc::stream_truncated));
            }
            current_ = std::move(**popped);
            break;
        }

        if (popped.error() != make_error_code(StreamErrc::pull_timeout)) {
            return fail(popped.error());
        }

        ++timeouts;
        if (timeouts > max_pull_retries_) {
            spdlog::error("Prefetch stalled - giving up after {} timeouts", timeouts);
            return fail(make_error_code(StreamErrc::upstream_failure));
        }
        spdlog::warn("Prefetch timeout - retrying ({}/{})", timeouts, max_pull_retries_);
    }

    const bool first = current_part_ == 1;
    const bool last = current_part_ == plan_.part_count;

    // Every chunk but the last must be whole, or the offsets would drift
    if (!last && current_.size() != plan_.chunk_size) {
        return fail(make_error_code(StreamErrc::stream_truncated));
    }

    const std::size_t begin = first ? static_cast<std::size_t>(plan_.first_trim) : 0;
    const std::size_t end = last ? static_cast<std::size_t>(plan_.last_trim) : current_.size();
    if (end > current_.size() || begin >= end) {
        return fail(make_error_code(StreamErrc::stream_truncated));
    }

    ++current_part_;
    emitted_ += end - begin;
    return std::optional<Slice>{Slice(current_.data() + begin, end - begin)};
}

std::unexpected<std::error_code> StreamAssembler::fail(std::error_code ec) noexcept {
    error_ = ec;
    current_.clear();
    return std::unexpected(ec);
}

} // namespace filelink::core
