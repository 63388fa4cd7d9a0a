// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/stream_session.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace filelink::server {

// Transport-neutral view of an incoming request
struct Request {
    std::string method{"GET"};
    std::string target{"/"};                    // Path plus optional query
    unsigned version{11};                       // 10 or 11
    std::map<std::string, std::string> headers; // Lower-case names

    // Header value by lower-case name
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

    [[nodiscard]] std::string_view path() const noexcept;
    [[nodiscard]] std::string_view query() const noexcept;
};

// What the router wants written back. When stream is set the body is
// produced slice by slice from the session and body is unused. Answers to
// HEAD carry the Content-Length of the body they leave out.
struct Response {
    unsigned status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::unique_ptr<core::StreamSession> stream;

    void set(std::string name, std::string value);
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

} // namespace filelink::server
