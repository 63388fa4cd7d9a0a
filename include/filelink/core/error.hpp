// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace filelink::core {

enum class StreamErrc {
    success = 0,
    missing_code,
    invalid_code,
    file_not_found,
    metadata_timeout,
    invalid_range,
    upstream_failure,
    stream_truncated,
    pull_timeout,
    invalid_request,
    invalid_media,
    service_unavailable,
    cancelled,
    invalid_url,
    invalid_config,
};

namespace detail {

struct StreamErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "filelink::stream";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<StreamErrc>(ev)) {
            case StreamErrc::success:             return "Success";
            case StreamErrc::missing_code:        return "Access code missing";
            case StreamErrc::invalid_code:        return "Access code mismatch";
            case StreamErrc::file_not_found:      return "File not found";
            case StreamErrc::metadata_timeout:    return "Metadata lookup timed out";
            case StreamErrc::invalid_range:       return "Invalid byte range";
            case StreamErrc::upstream_failure:    return "Upstream chunk source failed";
            case StreamErrc::stream_truncated:    return "Stream ended before the requested range";
            case StreamErrc::pull_timeout:        return "Prefetch buffer pull timed out";
            case StreamErrc::invalid_request:     return "Invalid request";
            case StreamErrc::invalid_media:       return "Invalid media type";
            case StreamErrc::service_unavailable: return "Service temporarily unavailable";
            case StreamErrc::cancelled:           return "Stream cancelled";
            case StreamErrc::invalid_url:         return "Invalid URL";
            case StreamErrc::invalid_config:      return "Invalid configuration";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StreamErrcCategory& stream_errc_category() noexcept {
    static detail::StreamErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StreamErrc e) noexcept {
    return {static_cast<int>(e), stream_errc_category()};
}

} // namespace filelink::core

namespace std {

template<>
struct is_error_code_enum<filelink::core::StreamErrc> : true_type {};

} // namespace std
