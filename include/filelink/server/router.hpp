// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/chunk_source.hpp>
#include <filelink/core/concurrency_gate.hpp>
#include <filelink/core/config.hpp>
#include <filelink/server/message.hpp>
#include <cstdint>
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <stop_token>

namespace filelink::server {

// Maps requests to responses:
//   GET /                      landing page
//   GET /stream/{id}?code=<c>  player page
//   GET /dl/{id}?code=<c>      file bytes, honoring Range
//   GET /dl/{id}?code=<c>=stream  player page (legacy link form)
//
// Every file lookup holds a ConcurrencyGate slot. A lookup that outlives its
// deadline keeps the slot until the resolver returns. For a download the
// slot travels into the returned StreamSession and is given back when the
// session is destroyed.
class Router {
public:
    Router(std::shared_ptr<core::FileResolver> resolver,
           std::shared_ptr<core::ChunkSource> source,
           std::shared_ptr<core::ConcurrencyGate> gate,
           core::StreamLimits limits,
           std::string base_url);

    // Stops and waits for lookups still running past their deadline
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Never throws; failures become error responses
    [[nodiscard]] Response handle(const Request& request) noexcept;

    // Resolve a file, giving up after limits.metadata_timeout. The worker
    // shares ownership of slot and drops it only when resolve() returns.
    [[nodiscard]] std::expected<core::FileInfo, std::error_code>
    lookup(std::uint64_t id, std::shared_ptr<core::AdmissionToken> slot);

    // Lookup workers that have not finished yet
    [[nodiscard]] std::size_t pending_lookups() const noexcept;

    [[nodiscard]] const core::ConcurrencyGate& gate() const noexcept { return *gate_; }
    [[nodiscard]] const core::StreamLimits& limits() const noexcept { return limits_; }
    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

    // Plain-text response with the fixed message for the mapped status
    [[nodiscard]] static Response error_response(std::error_code ec);

    // "/dl/42" with prefix "/dl/" -> 42; anything but a bare decimal fails
    [[nodiscard]] static std::optional<std::uint64_t> parse_file_id(std::string_view path, std::string_view prefix) noexcept;

private:
    Response dispatch(const Request& request);
    Response download(const Request& request, std::uint64_t id, const std::string& code);
    Response player(const Request& request, std::uint64_t id, const std::string& code);

    // Lookup plus access check, shared by both file routes
    std::expected<core::FileInfo, std::error_code>
    authorize(std::uint64_t id, const std::string& code, std::shared_ptr<core::AdmissionToken> slot);

    std::shared_ptr<core::FileResolver> resolver_;
    std::shared_ptr<core::ChunkSource> source_;
    std::shared_ptr<core::ConcurrencyGate> gate_;
    core::StreamLimits limits_;
    std::string base_url_;

    std::stop_source shutdown_;
    mutable std::mutex lookups_mutex_;
    std::condition_variable lookups_done_;
    std::size_t pending_lookups_{0};
};

} // namespace filelink::server
