// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/server/http_server.hpp>
#include <filelink/core/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <sys/socket.h>

namespace filelink::server {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr std::uint32_t MAX_HEADER_BYTES = 16 * 1024;
constexpr std::uint64_t MAX_BODY_BYTES = 64 * 1024;

Request to_request(const http::request<http::string_body>& msg) {
    Request request;
    request.method = std::string(msg.method_string());
    request.target = std::string(msg.target());
    request.version = msg.version();
    for (const auto& field : msg) {
        std::string name(field.name_string());
        std::ranges::transform(name, name.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        request.headers[name] = std::string(field.value());
    }
    return request;
}

template <class Body>
void apply_headers(http::response<Body>& res, const Response& response) {
    for (const auto& [name, value] : response.headers) {
        res.set(name, value);
    }
}

} // namespace

HttpServer::HttpServer(Router& router, ServerOptions options)
    : router_(router)
    , options_(std::move(options))
    , acceptor_(io_)
    , signals_(io_, SIGINT, SIGTERM) {}

HttpServer::~HttpServer() {
    std::unique_lock lock(mutex_);
    stopping_ = true;
    shutdown_connections(false);
    auto connections = std::move(connections_);
    connections_.clear();
    lock.unlock();

    for (auto& [id, conn] : connections) {
        if (conn->worker.joinable()) {
            conn->worker.join();
        }
    }
}

std::error_code HttpServer::open() {
    boost::system::error_code ec;
    auto address = net::ip::make_address(options_.bind_address, ec);
    if (ec) {
        spdlog::error("Invalid bind address: {}", options_.bind_address);
        return core::make_error_code(core::StreamErrc::invalid_config);
    }

    tcp::endpoint endpoint{address, options_.port};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        spdlog::error("Cannot listen on {}:{}: {}", options_.bind_address, options_.port, ec.message());
        return ec;
    }

    bound_port_ = acceptor_.local_endpoint(ec).port();
    spdlog::info("Listening on {}:{}", options_.bind_address, bound_port_);
    return {};
}

void HttpServer::run() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signo);
        close_acceptor();
    });

    do_accept();
    io_.run();
    drain();
}

void HttpServer::stop() {
    net::post(io_, [this] { close_acceptor(); });
}

std::size_t HttpServer::active_connections() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::ranges::count_if(connections_, [](const auto& entry) {
        return !entry.second->done;
    }));
}

void HttpServer::close_acceptor() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    signals_.cancel(ec);

    std::lock_guard lock(mutex_);
    stopping_ = true;
    shutdown_connections(true);
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            spdlog::warn("Accept failed: {}", ec.message());
            do_accept();
            return;
        }
        start_connection(std::move(socket));
        do_accept();
    });
}

void HttpServer::start_connection(tcp::socket socket) {
    std::lock_guard lock(mutex_);
    if (stopping_) {
        return;
    }
    reap_finished();

    auto conn = std::make_shared<Connection>(std::move(socket));
    auto id = next_id_++;
    try {
        conn->worker = std::thread([this, conn] {
            try {
                serve(conn);
            } catch (const std::exception& e) {
                spdlog::error("Connection error: {}", e.what());
            }
            {
                std::lock_guard done_lock(mutex_);
                conn->done = true;
            }
            drained_.notify_all();
        });
    } catch (const std::system_error& e) {
        spdlog::error("Cannot start connection thread: {}", e.what());
        return;
    }
    connections_.emplace(id, std::move(conn));
}

void HttpServer::serve(const std::shared_ptr<Connection>& conn) {
    beast::flat_buffer buffer;
    boost::system::error_code ec;

    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.header_limit(MAX_HEADER_BYTES);
        parser.body_limit(MAX_BODY_BYTES);

        http::read(conn->socket, buffer, parser, ec);
        if (ec) {
            if (ec != http::error::end_of_stream) {
                spdlog::debug("Read failed: {}", ec.message());
            }
            break;
        }

        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                break;
            }
            conn->busy = true;
        }

        const auto& msg = parser.get();
        Request request = to_request(msg);
        bool open = false;
        {
            // The session, if any, is torn down before the slot is idle again
            Response response = router_.handle(request);
            open = write_response(*conn, request, response, msg.keep_alive());
        }

        {
            std::lock_guard lock(mutex_);
            conn->busy = false;
            if (stopping_) {
                open = false;
            }
        }
        if (!open) {
            break;
        }
    }

    // Closed under the lock so stop() never touches a released descriptor
    std::lock_guard lock(mutex_);
    conn->closed = true;
    conn->socket.shutdown(tcp::socket::shutdown_send, ec);
    conn->socket.close(ec);
}

bool HttpServer::write_response(Connection& conn, const Request& request, Response& response, bool keep_alive) {
    boost::system::error_code ec;
    const auto status = static_cast<http::status>(response.status);

    if (!response.stream) {
        if (request.method == "HEAD") {
            http::response<http::empty_body> res{status, request.version};
            apply_headers(res, response);
            if (!response.header("Content-Length")) {
                res.content_length(response.body.size());
            }
            res.keep_alive(keep_alive);
            http::write(conn.socket, res, ec);
        } else {
            http::response<http::string_body> res{status, request.version};
            apply_headers(res, response);
            res.body() = std::move(response.body);
            res.keep_alive(keep_alive);
            res.prepare_payload();
            http::write(conn.socket, res, ec);
        }
        if (ec) {
            spdlog::debug("Write failed: {}", ec.message());
            return false;
        }
        return keep_alive;
    }

    core::StreamSession& session = *response.stream;
    const std::string& name = session.file().name;

    http::response<http::buffer_body> res{status, request.version};
    apply_headers(res, response);
    res.keep_alive(keep_alive);
    res.body().data = nullptr;
    res.body().more = true;

    http::response_serializer<http::buffer_body> sr{res};
    http::write_header(conn.socket, sr, ec);
    if (ec) {
        spdlog::info("Client disconnected before download started - File: {}", name);
        return false;
    }

    for (;;) {
        auto slice = session.next();
        if (!slice) {
            // Headers are out; closing is the only honest signal left
            spdlog::error("Error during file download - File: {}, Error: {}", name, slice.error().message());
            return false;
        }
        if (!*slice) {
            break;
        }
        auto bytes = **slice;
        if (bytes.empty()) {
            continue;
        }

        res.body().data = bytes.data();
        res.body().size = bytes.size();
        res.body().more = true;
        http::write(conn.socket, sr, ec);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            spdlog::info("Client disconnected - File: {}, Sent: {}/{} bytes",
                         name, session.assembler().bytes_emitted(), session.plan().total_bytes);
            return false;
        }
    }

    res.body().data = nullptr;
    res.body().more = false;
    http::write(conn.socket, sr, ec);
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    if (ec) {
        spdlog::info("Client disconnected - File: {}", name);
        return false;
    }

    spdlog::info("File download completed successfully - File: {}", name);
    return keep_alive;
}

void HttpServer::shutdown_connections(bool idle_only) {
    for (auto& [id, conn] : connections_) {
        if (conn->closed || (idle_only && conn->busy)) {
            continue;
        }
        // Unblocks the worker's pending read or write
        ::shutdown(conn->socket.native_handle(), SHUT_RDWR);
    }
}

void HttpServer::reap_finished() {
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->second->done) {
            it->second->worker.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::drain() {
    std::unique_lock lock(mutex_);
    auto all_done = [this] {
        return std::ranges::all_of(connections_, [](const auto& entry) { return entry.second->done; });
    };

    if (!drained_.wait_for(lock, options_.drain_timeout, all_done)) {
        spdlog::warn("Aborting connections still running after {}s", options_.drain_timeout.count());
        shutdown_connections(false);
        drained_.wait(lock, all_done);
    }

    reap_finished();
    lock.unlock();
    spdlog::info("All connections closed");
}

} // namespace filelink::server
