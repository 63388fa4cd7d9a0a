// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string>
#include <string_view>

namespace filelink::cli {

struct LogOptions {
    std::string file{"filelink.log"};
    bool to_file{true};
    spdlog::level::level_enum level{spdlog::level::info};
};

constexpr std::size_t LOG_FILE_MAX_BYTES = 50 * 1024 * 1024;
constexpr std::size_t LOG_FILE_BACKUPS = 10;

// "trace", "debug", "info", "warn", "error", "critical", "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) noexcept;

// Install the "filelink" logger as the spdlog default: colored stdout plus
// a rotating file unless disabled. A file that cannot be opened only costs
// the file sink.
void setup_logging(const LogOptions& options);

} // namespace filelink::cli
