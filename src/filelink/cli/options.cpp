// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/cli/options.hpp>
#include <filelink/core/error.hpp>
#include <filelink/version.hpp>
#include <charconv>
#include <iostream>

namespace filelink::cli {

using core::StreamErrc;
using core::make_error_code;

namespace {

template <typename T>
bool parse_number(std::string_view text, T& out, T min_value = 1) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || value < min_value) {
        return false;
    }
    out = value;
    return true;
}

std::unexpected<std::error_code> invalid(std::string_view option, std::string_view value) {
    std::cerr << "Error: Invalid value for " << option << ": '" << value << "'" << std::endl;
    return std::unexpected(make_error_code(StreamErrc::invalid_config));
}

} // namespace

std::expected<ServerConfig, std::error_code>
parse_args(int argc, const char* const argv[], const server::EnvLookup& env) {
    ServerConfig config;

    if (auto port = env("PORT")) {
        if (!parse_number<std::uint16_t>(*port, config.port)) {
            return invalid("PORT", *port);
        }
    }
    if (auto catalog = env("FILELINK_CATALOG")) {
        config.catalog_path = *catalog;
    }
    if (env("VERCEL")) {
        config.log.to_file = false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.help = true;
            return config;
        }
        if (arg == "-v" || arg == "--version") {
            config.version = true;
            return config;
        }
        if (arg == "--no-log-file") {
            config.log.to_file = false;
            continue;
        }

        // Everything else takes a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Unknown option or missing value: " << arg << std::endl;
            return std::unexpected(make_error_code(StreamErrc::invalid_config));
        }
        std::string_view value = argv[++i];

        if (arg == "--bind") {
            config.bind_address = value;
        } else if (arg == "-p" || arg == "--port") {
            if (!parse_number<std::uint16_t>(value, config.port)) {
                return invalid(arg, value);
            }
        } else if (arg == "-c" || arg == "--catalog") {
            config.catalog_path = value;
        } else if (arg == "--log-file") {
            config.log.file = value;
            config.log.to_file = true;
        } else if (arg == "--log-level") {
            auto level = parse_log_level(value);
            if (!level) {
                return invalid(arg, value);
            }
            config.log.level = *level;
        } else if (arg == "--max-sessions") {
            if (!parse_number<std::uint32_t>(value, config.limits.max_sessions)) {
                return invalid(arg, value);
            }
        } else if (arg == "--chunk-size") {
            if (!parse_number<std::uint64_t>(value, config.limits.chunk_size)) {
                return invalid(arg, value);
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            return std::unexpected(make_error_code(StreamErrc::invalid_config));
        }
    }

    if (config.catalog_path.empty()) {
        return invalid("--catalog", config.catalog_path);
    }
    return config;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "FileLink " << program_name << " - Range-capable HTTP links for stored files\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "      --bind <ADDR>       Listen address (default: 0.0.0.0)\n";
    std::cout << "  -p, --port <N>          Listen port (default: $PORT or 5000)\n";
    std::cout << "  -c, --catalog <FILE>    File catalog (default: $FILELINK_CATALOG or catalog.json)\n";
    std::cout << "      --log-file <FILE>   Rotating log file (default: filelink.log)\n";
    std::cout << "      --no-log-file       Log to the console only\n";
    std::cout << "      --log-level <LVL>   trace, debug, info, warn, error, critical, off\n";
    std::cout << "      --max-sessions <N>  Concurrent file sessions (default: 100)\n";
    std::cout << "      --chunk-size <N>    Store chunk size in bytes (default: 4194304)\n";
    std::cout << "\n";
    std::cout << "ROUTES:\n";
    std::cout << "  /                       Status page\n";
    std::cout << "  /stream/<id>?code=<c>   Player page\n";
    std::cout << "  /dl/<id>?code=<c>       File download, Range supported\n";
}

void print_version() noexcept {
    std::cout << "FileLink " << filelink::version.to_string() << std::endl;
    std::cout << "\n";
    std::cout << "Built with C++23, Boost.Beast, libcurl, spdlog\n";
}

} // namespace filelink::cli
