// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/server/pages.hpp>
#include <filelink/version.hpp>
#include <format>

namespace filelink::server {

namespace {

constexpr std::string_view PAGE_STYLE = R"(<style>
body{font-family:system-ui,sans-serif;background:#111;color:#eee;margin:0;padding:2rem;text-align:center}
main{max-width:960px;margin:0 auto}
video,audio{width:100%;max-height:70vh;background:#000;border-radius:8px}
a.button{display:inline-block;margin-top:1.5rem;padding:.75rem 1.5rem;background:#2d7ff9;color:#fff;border-radius:6px;text-decoration:none}
.meta{color:#aaa}
</style>)";

} // namespace

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string format_size_mb(std::uint64_t bytes) {
    return std::format("{:.2f} MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
}

std::string render_landing_page() {
    return std::format(
        "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>FileLink</title>{}</head>\n"
        "<body><main><h1>FileLink</h1><p>Status: Running</p>"
        "<p class=\"meta\">Version {}</p></main></body></html>\n",
        PAGE_STYLE, version.to_string());
}

std::string render_player_page(const PlayerView& view) {
    const std::string name = html_escape(view.file_name);
    const std::string url = html_escape(view.file_url);
    const std::string mime = html_escape(view.mime_type);

    std::string player;
    if (view.mime_type.starts_with("video/")) {
        player = std::format("<video controls preload=\"metadata\"><source src=\"{}\" type=\"{}\"></video>", url, mime);
    } else if (view.mime_type.starts_with("audio/")) {
        player = std::format("<audio controls preload=\"metadata\"><source src=\"{}\" type=\"{}\"></audio>", url, mime);
    }

    return std::format(
        "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">"
        "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">"
        "<title>{0}</title>{1}</head>\n"
        "<body><main><h1>{0}</h1><p class=\"meta\">Size: {2}</p>{3}\n"
        "<a class=\"button\" href=\"{4}\">Download</a></main></body></html>\n",
        name, PAGE_STYLE, format_size_mb(view.file_size), player, url);
}

} // namespace filelink::server
