// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/cli/logging.hpp>
#include <filelink/core/config.hpp>
#include <filelink/server/base_url.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace filelink::cli {

// Everything the server process is configured with
struct ServerConfig {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{5000};
    std::string catalog_path{"catalog.json"};
    LogOptions log;
    core::StreamLimits limits;
    bool version{false};
    bool help{false};
};

// Environment first (PORT, FILELINK_CATALOG, VERCEL), then the command line.
// Unknown options and malformed values fail with StreamErrc::invalid_config.
[[nodiscard]] std::expected<ServerConfig, std::error_code>
parse_args(int argc, const char* const argv[], const server::EnvLookup& env = server::system_env);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace filelink::cli
