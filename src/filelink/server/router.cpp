// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/server/router.hpp>
#include <filelink/core/error_mapper.hpp>
#include <filelink/core/range.hpp>
#include <filelink/core/stream_session.hpp>
#include <filelink/core/url.hpp>
#include <filelink/server/base_url.hpp>
#include <filelink/server/pages.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <format>
#include <future>
#include <system_error>
#include <thread>

namespace filelink::server {

using core::StreamErrc;
using core::make_error_code;

namespace {

constexpr std::string_view STREAM_SUFFIX = "=stream";

using LookupResult = std::expected<core::FileInfo, std::error_code>;

Response html_response(std::string html) {
    Response res;
    res.status = 200;
    res.set("Content-Type", "text/html; charset=utf-8");
    res.body = std::move(html);
    return res;
}

void set_file_headers(Response& res, const core::FileInfo& info) {
    res.set("Content-Type", info.mime_type);
    res.set("Content-Disposition",
            std::format("attachment; filename*=UTF-8''{}", core::percent_encode(info.name)));
    res.set("Accept-Ranges", "bytes");
    res.set("Cache-Control", "public, max-age=3600");
}

} // namespace

Router::Router(std::shared_ptr<core::FileResolver> resolver,
               std::shared_ptr<core::ChunkSource> source,
               std::shared_ptr<core::ConcurrencyGate> gate,
               core::StreamLimits limits,
               std::string base_url)
    : resolver_(std::move(resolver))
    , source_(std::move(source))
    , gate_(std::move(gate))
    , limits_(limits)
    , base_url_(std::move(base_url)) {}

Router::~Router() {
    shutdown_.request_stop();
    std::unique_lock lock(lookups_mutex_);
    if (pending_lookups_ > 0) {
        spdlog::info("Waiting for {} metadata lookups to finish", pending_lookups_);
    }
    lookups_done_.wait(lock, [this] { return pending_lookups_ == 0; });
}

std::size_t Router::pending_lookups() const noexcept {
    std::lock_guard lock(lookups_mutex_);
    return pending_lookups_;
}

Response Router::error_response(std::error_code ec) {
    auto mapped = core::map_error(ec);
    Response res;
    res.status = mapped.status;
    res.set("Content-Type", "text/plain; charset=utf-8");
    res.body = std::string(mapped.message);
    return res;
}

std::optional<std::uint64_t> Router::parse_file_id(std::string_view path, std::string_view prefix) noexcept {
    if (!path.starts_with(prefix)) {
        return std::nullopt;
    }
    std::string_view digits = path.substr(prefix.size());
    if (digits.empty()) {
        return std::nullopt;
    }
    std::uint64_t id = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return id;
}

Response Router::handle(const Request& request) noexcept {
    try {
        return dispatch(request);
    } catch (const std::exception& e) {
        spdlog::error("Unhandled error for {} {}: {}", request.method, request.target, e.what());
        return error_response(make_error_code(StreamErrc::upstream_failure));
    }
}

Response Router::dispatch(const Request& request) {
    const std::string_view path = request.path();

    if (request.method != "GET" && request.method != "HEAD") {
        return error_response(make_error_code(StreamErrc::invalid_request));
    }

    if (path == "/") {
        return html_response(render_landing_page());
    }

    const bool is_stream = path.starts_with("/stream/");
    const bool is_download = path.starts_with("/dl/");
    if (!is_stream && !is_download) {
        return error_response(make_error_code(StreamErrc::file_not_found));
    }

    auto id = parse_file_id(path, is_stream ? "/stream/" : "/dl/");
    if (!id) {
        return error_response(make_error_code(StreamErrc::invalid_request));
    }

    auto code = core::query_param(request.query(), "code");
    if (!code || code->empty()) {
        return error_response(make_error_code(StreamErrc::missing_code));
    }

    if (is_stream) {
        return player(request, *id, *code);
    }
    if (code->ends_with(STREAM_SUFFIX)) {
        code->resize(code->size() - STREAM_SUFFIX.size());
        spdlog::info("Stream request redirected from dl - File ID: {}", *id);
        return player(request, *id, *code);
    }
    return download(request, *id, *code);
}

LookupResult Router::lookup(std::uint64_t id, std::shared_ptr<core::AdmissionToken> slot) {
    // The worker owns everything it touches except the pending count, which
    // the destructor waits on, so it can outlive a timed-out caller.
    auto promise = std::make_shared<std::promise<LookupResult>>();
    auto future = promise->get_future();
    std::stop_source stop;

    {
        std::lock_guard lock(lookups_mutex_);
        ++pending_lookups_;
    }

    std::thread worker;
    try {
        worker = std::thread([this, resolver = resolver_, promise, slot, id, stop]() mutable {
            {
                std::stop_callback on_shutdown(shutdown_.get_token(), [stop]() mutable { stop.request_stop(); });
                try {
                    promise->set_value(resolver->resolve(id, stop.get_token()));
                } catch (const std::exception& e) {
                    spdlog::error("Failed to retrieve file {}: {}", id, e.what());
                    promise->set_value(std::unexpected(make_error_code(StreamErrc::upstream_failure)));
                }
            }
            slot.reset();
            resolver.reset();

            std::lock_guard lock(lookups_mutex_);
            --pending_lookups_;
            lookups_done_.notify_all();
        });
    } catch (const std::system_error&) {
        std::lock_guard lock(lookups_mutex_);
        --pending_lookups_;
        throw;
    }

    if (future.wait_for(limits_.metadata_timeout) != std::future_status::ready) {
        stop.request_stop();
        worker.detach();
        spdlog::error("Timeout retrieving file {}", id);
        return std::unexpected(make_error_code(StreamErrc::metadata_timeout));
    }

    worker.join();
    return future.get();
}

LookupResult Router::authorize(std::uint64_t id, const std::string& code,
                               std::shared_ptr<core::AdmissionToken> slot) {
    auto info = lookup(id, std::move(slot));
    if (!info) {
        if (info.error() == make_error_code(StreamErrc::file_not_found)) {
            spdlog::warn("File {} not found", id);
        } else if (info.error() != make_error_code(StreamErrc::metadata_timeout)) {
            spdlog::error("Failed to retrieve file {}: {}", id, info.error().message());
        }
        return info;
    }

    if (code != info->access_code) {
        spdlog::warn("Access denied - Invalid code for file {}", id);
        return std::unexpected(make_error_code(StreamErrc::invalid_code));
    }

    spdlog::info("File properties - Name: {}, Size: {}, Type: {}",
                 info->name, info->handle.size, info->mime_type);
    return info;
}

Response Router::player(const Request& request, std::uint64_t id, const std::string& code) {
    auto slot = std::make_shared<core::AdmissionToken>(gate_->acquire());
    spdlog::info("Stream request - File ID: {}", id);

    auto info = authorize(id, code, slot);
    if (!info) {
        return error_response(info.error());
    }

    PlayerView view;
    view.file_name = info->name;
    view.file_size = info->handle.size;
    view.mime_type = info->mime_type;
    view.file_url = std::format("{}/dl/{}?code={}",
                                request_base_url(request, base_url_), id, core::percent_encode(code));
    return html_response(render_player_page(view));
}

Response Router::download(const Request& request, std::uint64_t id, const std::string& code) {
    auto slot = std::make_shared<core::AdmissionToken>(gate_->acquire());
    spdlog::info("File download request - File ID: {}", id);

    auto info = authorize(id, code, slot);
    if (!info) {
        return error_response(info.error());
    }

    auto range_header = request.header("range");
    const bool ranged = range_header && !range_header->empty();
    const std::uint64_t file_size = info->handle.size;

    Response res;
    set_file_headers(res, *info);

    if (file_size == 0) {
        if (ranged) {
            spdlog::error("Invalid range request - Bytes: {} of empty file {}", *range_header, id);
            return error_response(make_error_code(StreamErrc::invalid_range));
        }
        spdlog::info("Full file request - Size: 0 bytes");
        res.status = 200;
        res.set("Content-Length", "0");
        return res;
    }

    auto range = core::resolve_range(range_header, file_size);
    if (!range) {
        spdlog::error("Invalid range request - Bytes: {}/{}", range_header.value_or(""), file_size);
        return error_response(range.error());
    }
    const core::ByteRange clamped = range->clamped(file_size);

    if (ranged) {
        spdlog::info("Range request - Bytes: {}-{}/{}", clamped.start, clamped.end, file_size);
    } else {
        spdlog::info("Full file request - Size: {} bytes", file_size);
    }

    res.status = ranged ? 206 : 200;
    res.set("Content-Range", core::content_range(clamped, file_size));
    res.set("Content-Length", std::to_string(clamped.length()));

    if (request.method == "HEAD") {
        return res;
    }

    res.stream = std::make_unique<core::StreamSession>(
        std::move(*slot), std::move(*info), clamped, source_, limits_);
    spdlog::info("Starting file download - Chunks: {}, Chunk size: {}",
                 res.stream->plan().part_count, limits_.chunk_size);
    return res;
}

} // namespace filelink::server
