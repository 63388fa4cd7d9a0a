// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace filelink::core {

// Kind of attachment the store reports for a file
enum class MediaKind : std::uint8_t {
    document,    // Named file, no default name
    video,
    audio,
    voice,
    photo,
    video_note
};

[[nodiscard]] std::optional<MediaKind> parse_media_kind(std::string_view name) noexcept;
[[nodiscard]] std::string_view to_string(MediaKind kind) noexcept;

// Extension used when the store gives no file name ("" for documents)
[[nodiscard]] std::string_view default_extension(MediaKind kind) noexcept;

// "<kind>-<YYYY-mm-dd_HH-MM-SS>.<ext>"; documents have no default name
[[nodiscard]] std::expected<std::string, std::error_code>
default_file_name(MediaKind kind, std::chrono::system_clock::time_point when);

// MIME type from the file extension, application/octet-stream if unknown
[[nodiscard]] std::string guess_mime_type(std::string_view file_name);

} // namespace filelink::core
