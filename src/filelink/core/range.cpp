// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/core/range.hpp>
#include <charconv>

namespace filelink::core {

namespace {

constexpr std::string_view BYTES_UNIT = "bytes=";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

// Digits only; signs and blanks are rejected
std::optional<std::uint64_t> parse_offset(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::expected<ByteRange, std::error_code>
resolve_range(std::optional<std::string_view> header, std::uint64_t file_size) noexcept {
    if (file_size == 0) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    if (!header || trim(*header).empty()) {
        return ByteRange{0, file_size - 1};
    }

    auto range_set = trim(*header);
    if (!range_set.starts_with(BYTES_UNIT)) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }
    range_set.remove_prefix(BYTES_UNIT.size());

    // Multipart ranges are not served
    if (range_set.find(',') != std::string_view::npos) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    auto dash = range_set.find('-');
    if (dash == std::string_view::npos) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    // A missing or signed start ("-500") is the from < 0 case
    auto from = parse_offset(trim(range_set.substr(0, dash)));
    if (!from) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    auto until_str = trim(range_set.substr(dash + 1));
    std::uint64_t until = file_size - 1;
    if (!until_str.empty()) {
        auto parsed = parse_offset(until_str);
        if (!parsed) {
            return std::unexpected(make_error_code(StreamErrc::invalid_range));
        }
        until = *parsed;
    }

    if (until > file_size || until < *from || *from >= file_size) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    return ByteRange{*from, until};
}

std::string content_range(const ByteRange& range, std::uint64_t file_size) {
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end)
         + "/" + std::to_string(file_size);
}

} // namespace filelink::core
