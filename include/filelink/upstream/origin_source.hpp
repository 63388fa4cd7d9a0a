// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/chunk_source.hpp>
#include <filelink/core/config.hpp>
#include <filelink/upstream/http_session.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

namespace filelink::upstream {

// ChunkSource over an origin that serves the stored files with HTTP range
// requests (or file:// paths, which libcurl also reads by range).
class OriginChunkSource final : public core::ChunkSource {
public:
    explicit OriginChunkSource(std::shared_ptr<HttpSession> session,
                               std::uint32_t retry_count = core::RETRY_COUNT,
                               std::chrono::milliseconds retry_delay = core::RETRY_DELAY);

    [[nodiscard]] std::expected<core::Chunk, std::error_code>
    fetch(const core::FileHandle& file,
          std::uint64_t offset,
          std::uint64_t length,
          std::stop_token stop) override;

private:
    std::shared_ptr<HttpSession> session_;
    std::uint32_t retry_count_;
    std::chrono::milliseconds retry_delay_;
};

} // namespace filelink::upstream
