// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/upstream/http_session.hpp>
#include <filelink/core/config.hpp>
#include <filelink/core/url.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace filelink::upstream {

using core::StreamErrc;
using core::make_error_code;

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new header block (redirects)
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// Collects one ranged body, refusing more than the requested length
struct RangeSink {
    core::Chunk data;
    std::uint64_t limit{0};
    bool overflow{false};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* sink = static_cast<RangeSink*>(userdata);
    std::size_t bytes = size * nmemb;

    if (sink->data.size() + bytes > sink->limit) {
        // Origin ignored the Range header
        sink->overflow = true;
        return 0;
    }

    const std::size_t offset = sink->data.size();
    sink->data.resize(offset + bytes);
    std::memcpy(sink->data.data() + offset, ptr, bytes);
    return bytes;
}

// Aborts the transfer once stop is requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

void share_lock(CURL*, curl_lock_data, curl_lock_access, void* userptr) {
    static_cast<std::mutex*>(userptr)->lock();
}

void share_unlock(CURL*, curl_lock_data, void* userptr) {
    static_cast<std::mutex*>(userptr)->unlock();
}

std::error_code classify(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OK:                  return {};
        case CURLE_ABORTED_BY_CALLBACK: return make_error_code(StreamErrc::cancelled);
        case CURLE_OPERATION_TIMEDOUT:  return make_error_code(StreamErrc::metadata_timeout);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL: return make_error_code(StreamErrc::invalid_url);
        case CURLE_FILE_COULDNT_READ_FILE:
        case CURLE_REMOTE_FILE_NOT_FOUND: return make_error_code(StreamErrc::file_not_found);
        default:                        return make_error_code(StreamErrc::upstream_failure);
    }
}

// file:// transfers report status 0
std::error_code classify_status(long http_code) noexcept {
    if (http_code == 404 || http_code == 410) {
        return make_error_code(StreamErrc::file_not_found);
    }
    if (http_code >= 400) {
        return make_error_code(StreamErrc::upstream_failure);
    }
    return {};
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession() {
    CURLSH* share = curl_share_init();
    if (share) {
        curl_share_setopt(share, CURLSHOPT_LOCKFUNC, share_lock);
        curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, share_unlock);
        curl_share_setopt(share, CURLSHOPT_USERDATA, &dns_mutex_);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    }
    share_ = share;
}

HttpSession::~HttpSession() {
    if (share_) {
        curl_share_cleanup(static_cast<CURLSH*>(share_));
    }
}

void HttpSession::configure(void* handle) const noexcept {
    auto* curl = static_cast<CURL*>(handle);

    if constexpr (core::FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(core::MAX_REDIRECTS));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(core::CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    if (share_) {
        curl_easy_setopt(curl, CURLOPT_SHARE, static_cast<CURLSH*>(share_));
    }
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url,
                  std::chrono::milliseconds timeout,
                  std::stop_token stop) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(StreamErrc::upstream_failure));
    }

    HttpResponse response{};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    configure(curl.ptr);
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (auto ec = classify(result)) {
        return std::unexpected(ec);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);
    if (auto ec = classify_status(http_code)) {
        return std::unexpected(ec);
    }

    curl_off_t cl = -1;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
        response.content_length = static_cast<std::uint64_t>(cl);
    } else if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
        char* end = nullptr;
        unsigned long long val = std::strtoull(it->second.c_str(), &end, 10);
        if (end == it->second.c_str() + it->second.size()) {
            response.content_length = static_cast<std::uint64_t>(val);
        }
    }

    if (auto it = response.headers.find("content-type"); it != response.headers.end()) {
        response.content_type = it->second;
    }

    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = ar_it != response.headers.end()
                           && ar_it->second.find("bytes") != std::string::npos;

    if (auto it = response.headers.find("content-disposition"); it != response.headers.end()) {
        response.filename = parse_content_disposition(it->second);
    }

    return response;
}

std::expected<core::Chunk, std::error_code>
HttpSession::get_range(const std::string& url,
                       std::uint64_t offset,
                       std::uint64_t length,
                       std::stop_token stop) noexcept {
    if (length == 0) {
        return core::Chunk{};
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(StreamErrc::upstream_failure));
    }

    RangeSink sink;
    sink.limit = length;
    try {
        sink.data.reserve(static_cast<std::size_t>(length));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(StreamErrc::upstream_failure));
    }

    std::string range = std::to_string(offset) + "-" + std::to_string(offset + length - 1);

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    configure(curl.ptr);

    // Stall detection instead of a total timeout
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(core::STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(core::READ_BUFFER_SIZE));

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &sink);

    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (sink.overflow) {
        return std::unexpected(make_error_code(StreamErrc::upstream_failure));
    }
    if (result == CURLE_OPERATION_TIMEDOUT) {
        // A stalled chunk is an upstream failure, not a metadata timeout
        return std::unexpected(make_error_code(StreamErrc::upstream_failure));
    }
    if (auto ec = classify(result)) {
        return std::unexpected(ec);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code == 416) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }
    if (auto ec = classify_status(http_code)) {
        return std::unexpected(ec);
    }

    return std::move(sink.data);
}

std::string HttpSession::parse_content_disposition(std::string_view content_disposition) {
    // RFC 5987 form wins: filename*=UTF-8''name%20here
    auto ext_pos = content_disposition.find("filename*=");
    if (ext_pos != std::string_view::npos) {
        auto value = content_disposition.substr(ext_pos + 10);
        value = value.substr(0, value.find(';'));
        auto quote = value.find("''");
        if (quote != std::string_view::npos) {
            value.remove_prefix(quote + 2);
        }
        return core::percent_decode(value);
    }

    // Plain form: attachment; filename="file.zip"
    auto filename_pos = content_disposition.find("filename=");
    if (filename_pos != std::string_view::npos) {
        auto filename = content_disposition.substr(filename_pos + 9);
        filename = filename.substr(0, filename.find(';'));
        while (!filename.empty() && filename.back() == ' ') {
            filename.remove_suffix(1);
        }
        if (filename.size() >= 2 && (filename.front() == '"' || filename.front() == '\'')) {
            filename.remove_prefix(1);
            filename.remove_suffix(1);
        }
        return std::string(filename);
    }
    return {};
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace filelink::upstream
