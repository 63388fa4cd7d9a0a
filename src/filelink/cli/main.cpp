// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/cli/logging.hpp>
#include <filelink/cli/options.hpp>
#include <filelink/core/concurrency_gate.hpp>
#include <filelink/server/base_url.hpp>
#include <filelink/server/http_server.hpp>
#include <filelink/server/router.hpp>
#include <filelink/upstream/catalog.hpp>
#include <filelink/upstream/http_session.hpp>
#include <filelink/upstream/origin_source.hpp>
#include <filelink/version.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

using namespace filelink;
using namespace filelink::cli;

// Terminate handler to catch exceptions in noexcept functions
static void filelink_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    spdlog::shutdown();
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(filelink_terminate_handler);

    auto config = parse_args(argc, argv);
    if (!config) {
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    if (config->help) {
        print_help(argv[0]);
        return 0;
    }
    if (config->version) {
        print_version();
        return 0;
    }

    setup_logging(config->log);
    spdlog::info("FileLink {} starting", filelink::version.to_string());

    auto catalog = upstream::Catalog::load(config->catalog_path);
    if (!catalog) {
        spdlog::critical("Cannot load catalog {}", config->catalog_path);
        spdlog::shutdown();
        return 1;
    }
    spdlog::info("Catalog {} loaded - {} files", config->catalog_path, catalog->size());

    upstream::HttpSession::global_init();

    int exit_code = 0;
    {
        const core::StreamLimits& limits = config->limits;
        auto session = std::make_shared<upstream::HttpSession>();
        auto resolver = std::make_shared<upstream::CatalogResolver>(
            std::move(*catalog), session, limits.metadata_timeout);
        auto source = std::make_shared<upstream::OriginChunkSource>(session);
        auto gate = std::make_shared<core::ConcurrencyGate>(limits.max_sessions);

        std::string base_url = server::detect_base_url(config->port);
        server::Router router(resolver, source, gate, limits, base_url);

        server::ServerOptions options;
        options.bind_address = config->bind_address;
        options.port = config->port;
        server::HttpServer http(router, options);

        if (auto ec = http.open()) {
            spdlog::critical("Server failed to start: {}", ec.message());
            exit_code = 1;
        } else {
            spdlog::info("FileLink running on: {} (max sessions {})", base_url, limits.max_sessions);
            http.run();
            spdlog::info("Shutting down API");
        }
    }

    upstream::HttpSession::global_cleanup();
    spdlog::shutdown();
    return exit_code;
}
