// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/chunk_source.hpp>
#include <filelink/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

namespace filelink::upstream {

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // Lower-case names
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
    std::string content_type;
    std::string filename; // From Content-Disposition
};

// Blocking libcurl transfers against the origin store.
// One instance is shared by all sessions; every call uses its own easy
// handle, DNS results are shared between them.
class HttpSession {
public:
    HttpSession();
    ~HttpSession();

    // Non-copyable, non-movable (curl share handle points back at us)
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) = delete;
    HttpSession& operator=(HttpSession&&) = delete;

    // HEAD request for size, type and name. A transfer longer than
    // timeout fails with StreamErrc::metadata_timeout.
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url,
         std::chrono::milliseconds timeout,
         std::stop_token stop = {}) noexcept;

    // GET bytes [offset, offset + length) of a resource
    [[nodiscard]] std::expected<core::Chunk, std::error_code>
    get_range(const std::string& url,
              std::uint64_t offset,
              std::uint64_t length,
              std::stop_token stop = {}) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Parse Content-Disposition header value
    [[nodiscard]] static std::string parse_content_disposition(std::string_view content_disposition);

private:
    // Options shared by every transfer
    void configure(void* curl) const noexcept;

    void* share_{nullptr};  // CURLSH*
    std::mutex dns_mutex_;  // Guards the shared DNS cache
};

} // namespace filelink::upstream
