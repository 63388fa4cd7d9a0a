// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/server/router.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace filelink::server {

struct ServerOptions {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{5000};
    std::chrono::seconds drain_timeout{30};  // Grace period for running responses on shutdown
};

// HTTP/1.1 front end.
//
// The io_context only accepts connections and watches for SIGINT/SIGTERM.
// Each connection is served by its own thread with blocking reads and
// writes, so a slow client holds back its own session's producer through
// the bounded prefetch buffer and nothing else.
class HttpServer {
public:
    HttpServer(Router& router, ServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen; port 0 picks a free port
    [[nodiscard]] std::error_code open();

    // Serve until stop() or a termination signal, then drain connections
    void run();

    // Stop accepting; safe from any thread
    void stop();

    [[nodiscard]] std::uint16_t port() const noexcept { return bound_port_; }
    [[nodiscard]] std::size_t active_connections() const;

private:
    struct Connection {
        explicit Connection(boost::asio::ip::tcp::socket s) : socket(std::move(s)) {}
        boost::asio::ip::tcp::socket socket;
        std::thread worker;
        bool busy{false};  // Between reading a request and finishing its response
        bool closed{false};  // Socket released by the worker
        bool done{false};  // Worker has returned and may be joined
    };

    void do_accept();
    void start_connection(boost::asio::ip::tcp::socket socket);
    void serve(const std::shared_ptr<Connection>& conn);
    void close_acceptor();
    void drain();

    // Both expect mutex_ to be held
    void shutdown_connections(bool idle_only);
    void reap_finished();

    // Write one response; false when the connection must be closed
    bool write_response(Connection& conn, const Request& request, Response& response, bool keep_alive);

    Router& router_;
    ServerOptions options_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    std::uint16_t bound_port_{0};

    mutable std::mutex mutex_;
    std::condition_variable drained_;
    bool stopping_{false};
    std::uint64_t next_id_{0};
    std::unordered_map<std::uint64_t, std::shared_ptr<Connection>> connections_;
};

} // namespace filelink::server
