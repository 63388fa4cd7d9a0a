// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/core/error_mapper.hpp>
#include <array>
#include <utility>

namespace filelink::core {

namespace {

constexpr std::array<std::pair<unsigned, std::string_view>, 7> MESSAGES{{
    {400, "Invalid request."},
    {401, "File code is required to download the file."},
    {403, "Invalid file code."},
    {404, "File not found."},
    {416, "Invalid range."},
    {500, "Internal server error."},
    {503, "Service temporarily unavailable."},
}};

unsigned status_for(std::error_code ec) noexcept {
    if (ec.category() != stream_errc_category()) {
        return 500;
    }

    switch (static_cast<StreamErrc>(ec.value())) {
        case StreamErrc::missing_code:        return 401;
        case StreamErrc::invalid_code:        return 403;
        case StreamErrc::file_not_found:      return 404;
        case StreamErrc::invalid_range:       return 416;
        case StreamErrc::invalid_request:
        case StreamErrc::invalid_media:       return 400;
        case StreamErrc::service_unavailable: return 503;
        case StreamErrc::metadata_timeout:
        case StreamErrc::upstream_failure:
        case StreamErrc::stream_truncated:
        default:                              return 500;
    }
}

} // namespace

std::string_view status_message(unsigned status) noexcept {
    for (const auto& [code, text] : MESSAGES) {
        if (code == status) return text;
    }
    return "Internal server error.";
}

HttpError map_error(std::error_code ec) noexcept {
    const unsigned status = status_for(ec);
    return {status, status_message(status)};
}

} // namespace filelink::core
