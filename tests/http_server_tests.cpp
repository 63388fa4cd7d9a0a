// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <filelink/server/http_server.hpp>
#include "fakes.hpp"
#include <boost/asio/connect.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <memory>
#include <vector>
#include <thread>

using namespace filelink;
using namespace filelink::server;
using filelink::testing::MemoryChunkSource;
using filelink::testing::MemoryResolver;
using filelink::testing::make_file;
using filelink::testing::make_pattern;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

using namespace std::chrono_literals;

namespace {

// Router plus a running server on an ephemeral loopback port
struct LiveServer {
    std::shared_ptr<MemoryChunkSource> source = std::make_shared<MemoryChunkSource>(make_pattern(1000));
    std::shared_ptr<MemoryResolver> resolver = std::make_shared<MemoryResolver>();
    std::shared_ptr<core::ConcurrencyGate> gate = std::make_shared<core::ConcurrencyGate>(4);
    std::unique_ptr<Router> router;
    std::unique_ptr<HttpServer> server;
    std::thread runner;

    LiveServer() {
        core::StreamLimits limits;
        limits.chunk_size = 128;
        limits.max_parallel_chunks = 2;
        limits.buffer_capacity = 2;
        limits.pull_timeout = 2000ms;
        limits.metadata_timeout = 1000ms;
        resolver->add(make_file(1, 1000, "secret", "clip.mp4", "video/mp4"));
        router = std::make_unique<Router>(resolver, source, gate, limits, "http://127.0.0.1");

        ServerOptions options;
        options.bind_address = "127.0.0.1";
        options.port = 0;
        options.drain_timeout = 2s;
        server = std::make_unique<HttpServer>(*router, options);
    }

    ~LiveServer() {
        if (runner.joinable()) {
            server->stop();
            runner.join();
        }
    }

    void start() {
        REQUIRE_FALSE(server->open());
        REQUIRE(server->port() != 0);
        runner = std::thread([this] { server->run(); });
    }

    void stop() {
        server->stop();
        runner.join();
    }

    tcp::endpoint endpoint() const {
        return {net::ip::make_address("127.0.0.1"), server->port()};
    }
};

http::response<http::string_body> send(tcp::socket& socket, beast::flat_buffer& buffer,
                                       std::string target, std::string range = {}) {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "localhost");
    if (!range.empty()) {
        req.set(http::field::range, range);
    }
    http::write(socket, req);

    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    return res;
}

} // namespace

TEST_CASE("HttpServer - serves files over a keep-alive connection", "[server]") {
    LiveServer live;
    live.start();

    net::io_context io;
    tcp::socket socket(io);
    socket.connect(live.endpoint());
    beast::flat_buffer buffer;

    auto ranged = send(socket, buffer, "/dl/1?code=secret", "bytes=100-899");
    CHECK(ranged.result_int() == 206);
    CHECK(std::string(ranged[http::field::content_range]) == "bytes 100-899/1000");
    CHECK(std::string(ranged[http::field::content_length]) == "800");
    REQUIRE(ranged.body().size() == 800);
    bool same = true;
    for (std::size_t i = 0; i < 800; ++i) {
        same = same && ranged.body()[i] == static_cast<char>(live.source->data()[100 + i]);
    }
    CHECK(same);

    auto full = send(socket, buffer, "/dl/1?code=secret");
    CHECK(full.result_int() == 200);
    CHECK(full.body().size() == 1000);

    auto denied = send(socket, buffer, "/dl/1?code=wrong");
    CHECK(denied.result_int() == 403);
    CHECK(denied.body() == "Invalid file code.");

    auto landing = send(socket, buffer, "/");
    CHECK(landing.result_int() == 200);

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);

    live.stop();
    CHECK(live.server->active_connections() == 0);
    CHECK(live.gate->available() == 4);
}

TEST_CASE("HttpServer - stop closes idle connections", "[server]") {
    LiveServer live;
    live.start();

    net::io_context io;
    tcp::socket socket(io);
    socket.connect(live.endpoint());
    beast::flat_buffer buffer;

    auto res = send(socket, buffer, "/");
    CHECK(res.result_int() == 200);

    // The connection stays open and idle; stopping must not wait on it
    live.stop();

    char byte = 0;
    boost::system::error_code ec;
    socket.read_some(net::buffer(&byte, 1), ec);
    CHECK(ec);
    CHECK(live.server->active_connections() == 0);
}

TEST_CASE("HttpServer - client leaving mid-download frees the session", "[server]") {
    LiveServer live;
    live.source->set_delay(20ms);
    live.start();

    {
        net::io_context io;
        tcp::socket socket(io);
        socket.connect(live.endpoint());

        http::request<http::empty_body> req{http::verb::get, "/dl/1?code=secret", 11};
        req.set(http::field::host, "localhost");
        http::write(socket, req);

        // Read only the start of the response, then hang up
        char head[64];
        boost::system::error_code ec;
        socket.read_some(net::buffer(head), ec);
        socket.close(ec);
    }

    for (int i = 0; i < 300 && live.gate->available() != 4; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    CHECK(live.gate->available() == 4);

    live.stop();
    CHECK(live.source->active() == 0);
}

TEST_CASE("HttpServer - stop while connections are closing", "[server]") {
    LiveServer live;
    live.start();

    // Workers close their sockets as stop() sweeps the open connections
    std::atomic<int> answered{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < 8; ++i) {
        clients.emplace_back([&live, &answered] {
            for (int round = 0; round < 10; ++round) {
                net::io_context io;
                tcp::socket socket(io);
                boost::system::error_code ec;
                socket.connect(live.endpoint(), ec);
                if (ec) {
                    return;
                }
                http::request<http::empty_body> req{http::verb::get, "/", 11};
                req.set(http::field::host, "localhost");
                req.keep_alive(false);
                http::write(socket, req, ec);

                beast::flat_buffer buffer;
                http::response<http::string_body> res;
                http::read(socket, buffer, res, ec);
                if (!ec && res.result_int() == 200) {
                    ++answered;
                }
                socket.close(ec);
            }
        });
    }

    std::this_thread::sleep_for(20ms);
    live.stop();
    for (auto& client : clients) {
        client.join();
    }

    CHECK(live.server->active_connections() == 0);
    CHECK(live.gate->available() == 4);
}

TEST_CASE("HttpServer - bad bind address", "[server]") {
    auto resolver = std::make_shared<MemoryResolver>();
    auto source = std::make_shared<MemoryChunkSource>(make_pattern(10));
    Router router(resolver, source, std::make_shared<core::ConcurrencyGate>(1), {}, "http://x");

    ServerOptions options;
    options.bind_address = "not-an-address";
    HttpServer server(router, options);
    CHECK(server.open());
}
