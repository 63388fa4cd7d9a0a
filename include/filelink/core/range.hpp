// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace filelink::core {

// Inclusive byte interval of a file
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] constexpr std::uint64_t length() const noexcept { return end - start + 1; }

    // Pull an end past the last byte back onto it
    [[nodiscard]] constexpr ByteRange clamped(std::uint64_t file_size) const noexcept {
        return {start, end < file_size ? end : file_size - 1};
    }

    constexpr bool operator==(const ByteRange&) const = default;
};

// Resolve an optional "Range: bytes=<from>-[<until>]" header against a file size.
// An absent or empty header selects the whole file.
[[nodiscard]] std::expected<ByteRange, std::error_code>
resolve_range(std::optional<std::string_view> header, std::uint64_t file_size) noexcept;

// "bytes <from>-<until>/<size>"
[[nodiscard]] std::string content_range(const ByteRange& range, std::uint64_t file_size);

} // namespace filelink::core
