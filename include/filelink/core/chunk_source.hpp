// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/error.hpp>
#include <filelink/core/media.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

namespace filelink::core {

using Chunk = std::vector<std::byte>;

// Where the bytes of one stored file live
struct FileHandle {
    std::uint64_t id{0};
    std::string source;    // Locator understood by the ChunkSource
    std::uint64_t size{0};
};

// Resolved metadata of a stored file
struct FileInfo {
    FileHandle handle;
    std::string name;
    std::string mime_type;
    std::string access_code;
    MediaKind media{MediaKind::document};
};

// Remote store download primitive: one chunk at a chunk-aligned offset.
// Implementations must be safe to call from several threads at once and
// should return promptly with StreamErrc::cancelled once stop is requested.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    // Returns min(length, size - offset) bytes starting at offset
    [[nodiscard]] virtual std::expected<Chunk, std::error_code>
    fetch(const FileHandle& file,
          std::uint64_t offset,
          std::uint64_t length,
          std::stop_token stop) = 0;
};

// Maps a file identifier to its handle and metadata
class FileResolver {
public:
    virtual ~FileResolver() = default;

    // StreamErrc::file_not_found when the id is unknown
    [[nodiscard]] virtual std::expected<FileInfo, std::error_code>
    resolve(std::uint64_t id, std::stop_token stop) = 0;
};

} // namespace filelink::core
