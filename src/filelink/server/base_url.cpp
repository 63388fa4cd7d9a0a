// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/server/base_url.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <format>

namespace filelink::server {

namespace {

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

std::optional<std::string> system_env(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string detect_base_url(std::uint16_t port, const EnvLookup& env) {
    if (auto domain = env("CUSTOM_DOMAIN")) {
        std::string url = domain->starts_with("http") ? *domain : "https://" + *domain;
        spdlog::info("Using CUSTOM_DOMAIN: {}", url);
        return url;
    }
    if (auto app = env("HEROKU_APP_NAME")) {
        std::string url = std::format("https://{}.herokuapp.com", *app);
        spdlog::info("Detected Heroku deployment: {}", url);
        return url;
    }
    if (auto external = env("RENDER_EXTERNAL_URL")) {
        std::string url = strip_trailing_slash(*external);
        spdlog::info("Detected Render deployment: {}", url);
        return url;
    }
    if (auto domain = env("RAILWAY_PUBLIC_DOMAIN")) {
        std::string url = "https://" + *domain;
        spdlog::info("Detected Railway deployment (public domain): {}", url);
        return url;
    }
    if (auto static_url = env("RAILWAY_STATIC_URL")) {
        std::string url = strip_trailing_slash(*static_url);
        spdlog::info("Detected Railway deployment (static URL): {}", url);
        return url;
    }
    if (auto app = env("FLY_APP_NAME")) {
        std::string url = std::format("https://{}.fly.dev", *app);
        spdlog::info("Detected Fly.io deployment: {}", url);
        return url;
    }
    if (auto vercel = env("VERCEL_URL")) {
        std::string url = "https://" + *vercel;
        spdlog::info("Detected Vercel deployment: {}", url);
        return url;
    }

    std::string url = std::format("http://{}:{}", local_ip_address(), port);
    spdlog::info("No platform detected, using local IP: {}", url);
    return url;
}

std::string local_ip_address() {
    namespace net = boost::asio;
    using udp = net::ip::udp;

    // Connecting a datagram socket sends nothing; it only selects a route
    net::io_context io;
    udp::socket socket(io);
    boost::system::error_code ec;

    socket.open(udp::v4(), ec);
    if (ec) {
        return "127.0.0.1";
    }
    socket.connect(udp::endpoint(net::ip::make_address_v4("8.8.8.8"), 80), ec);
    if (ec) {
        return "127.0.0.1";
    }
    auto local = socket.local_endpoint(ec);
    if (ec) {
        return "127.0.0.1";
    }
    return local.address().to_string();
}

std::string request_base_url(const Request& request, std::string_view fallback) {
    auto proto = request.header("x-forwarded-proto");
    if (auto forwarded = request.header("x-forwarded-host"); forwarded && !forwarded->empty()) {
        std::string_view scheme = (proto && !proto->empty()) ? *proto : std::string_view("https");
        return std::format("{}://{}", scheme, *forwarded);
    }
    if (auto host = request.header("host"); host && !host->empty()) {
        std::string_view scheme = (proto && *proto == "https") ? "https" : "http";
        return std::format("{}://{}", scheme, *host);
    }
    return std::string(fallback);
}

} // namespace filelink::server
