// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/error.hpp>
#include <string_view>

namespace filelink::core {

// Status and client-facing text for a failed request
struct HttpError {
    unsigned status{500};
    std::string_view message;
};

// Fixed text for a status code; unknown codes get the 500 text
[[nodiscard]] std::string_view status_message(unsigned status) noexcept;

// Map any failure to the response sent to the client. Internal error
// details never leave this function.
[[nodiscard]] HttpError map_error(std::error_code ec) noexcept;

} // namespace filelink::core
