// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/cli/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <memory>
#include <utility>
#include <vector>

namespace filelink::cli {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) noexcept {
    constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> levels{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};
    for (const auto& [key, level] : levels) {
        if (key == name) {
            return level;
        }
    }
    return std::nullopt;
}

void setup_logging(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    if (options.to_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file, LOG_FILE_MAX_BYTES, LOG_FILE_BACKUPS));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("filelink", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S - %l - %v");
    logger->set_level(options.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));

    if (!file_error.empty()) {
        spdlog::warn("Logging to console only, cannot open {}: {}", options.file, file_error);
    }
}

} // namespace filelink::cli
