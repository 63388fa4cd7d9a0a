// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/core/media.hpp>
#include <array>
#include <cctype>
#include <ctime>
#include <utility>

namespace filelink::core {

namespace {

struct MediaEntry {
    MediaKind kind;
    std::string_view name;
    std::string_view extension;
};

constexpr std::array<MediaEntry, 6> MEDIA_TABLE{{
    {MediaKind::document,   "document",   ""},
    {MediaKind::video,      "video",      "mp4"},
    {MediaKind::audio,      "audio",      "mp3"},
    {MediaKind::voice,      "voice",      "ogg"},
    {MediaKind::photo,      "photo",      "jpg"},
    {MediaKind::video_note, "video_note", "mp4"},
}};

constexpr std::array<std::pair<std::string_view, std::string_view>, 32> MIME_TABLE{{
    {"mp4",  "video/mp4"},
    {"m4v",  "video/x-m4v"},
    {"mkv",  "video/x-matroska"},
    {"webm", "video/webm"},
    {"mov",  "video/quicktime"},
    {"avi",  "video/x-msvideo"},
    {"ts",   "video/mp2t"},
    {"mp3",  "audio/mpeg"},
    {"m4a",  "audio/mp4"},
    {"ogg",  "audio/ogg"},
    {"oga",  "audio/ogg"},
    {"opus", "audio/opus"},
    {"flac", "audio/flac"},
    {"wav",  "audio/x-wav"},
    {"aac",  "audio/aac"},
    {"jpg",  "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png",  "image/png"},
    {"gif",  "image/gif"},
    {"webp", "image/webp"},
    {"svg",  "image/svg+xml"},
    {"pdf",  "application/pdf"},
    {"zip",  "application/zip"},
    {"rar",  "application/vnd.rar"},
    {"7z",   "application/x-7z-compressed"},
    {"gz",   "application/gzip"},
    {"tar",  "application/x-tar"},
    {"apk",  "application/vnd.android.package-archive"},
    {"json", "application/json"},
    {"txt",  "text/plain"},
    {"html", "text/html"},
    {"srt",  "application/x-subrip"},
}};

constexpr std::string_view DEFAULT_MIME = "application/octet-stream";

} // namespace

std::optional<MediaKind> parse_media_kind(std::string_view name) noexcept {
    for (const auto& entry : MEDIA_TABLE) {
        if (entry.name == name) return entry.kind;
    }
    return std::nullopt;
}

std::string_view to_string(MediaKind kind) noexcept {
    for (const auto& entry : MEDIA_TABLE) {
        if (entry.kind == kind) return entry.name;
    }
    return "document";
}

std::string_view default_extension(MediaKind kind) noexcept {
    for (const auto& entry : MEDIA_TABLE) {
        if (entry.kind == kind) return entry.extension;
    }
    return {};
}

std::expected<std::string, std::error_code>
default_file_name(MediaKind kind, std::chrono::system_clock::time_point when) {
    auto ext = default_extension(kind);
    if (ext.empty()) {
        return std::unexpected(make_error_code(StreamErrc::invalid_media));
    }

    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    char stamp[32];
    auto len = std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &local);

    std::string name(to_string(kind));
    name += '-';
    name.append(stamp, len);
    name += '.';
    name += ext;
    return name;
}

std::string guess_mime_type(std::string_view file_name) {
    auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == file_name.size()) {
        return std::string(DEFAULT_MIME);
    }

    std::string ext;
    ext.reserve(file_name.size() - dot - 1);
    for (char c : file_name.substr(dot + 1)) {
        ext += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (const auto& [known, mime] : MIME_TABLE) {
        if (known == ext) return std::string(mime);
    }
    return std::string(DEFAULT_MIME);
}

} // namespace filelink::core
