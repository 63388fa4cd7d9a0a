// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <filelink/server/pages.hpp>

using namespace filelink::server;

TEST_CASE("html_escape", "[pages]") {
    CHECK(html_escape("<b>\"Tom\" & 'Jerry'</b>") == "&lt;b&gt;&quot;Tom&quot; &amp; &#39;Jerry&#39;&lt;/b&gt;");
    CHECK(html_escape("plain") == "plain");
}

TEST_CASE("format_size_mb", "[pages]") {
    CHECK(format_size_mb(0) == "0.00 MB");
    CHECK(format_size_mb(1024 * 1024) == "1.00 MB");
    CHECK(format_size_mb(10'000'000) == "9.54 MB");
}

TEST_CASE("render_player_page", "[pages]") {
    PlayerView view;
    view.file_name = "<clip>.mp4";
    view.file_size = 5 * 1024 * 1024;
    view.file_url = "https://host/dl/1?code=a&b";

    SECTION("Video element for video types") {
        view.mime_type = "video/mp4";
        auto html = render_player_page(view);
        CHECK(html.find("<video") != std::string::npos);
        CHECK(html.find("<audio") == std::string::npos);
        CHECK(html.find("&lt;clip&gt;.mp4") != std::string::npos);
        CHECK(html.find("<clip>") == std::string::npos);
        CHECK(html.find("5.00 MB") != std::string::npos);
        CHECK(html.find("https://host/dl/1?code=a&amp;b") != std::string::npos);
    }

    SECTION("Audio element for audio types") {
        view.mime_type = "audio/mpeg";
        auto html = render_player_page(view);
        CHECK(html.find("<audio") != std::string::npos);
    }

    SECTION("Download link only for other types") {
        view.mime_type = "application/zip";
        auto html = render_player_page(view);
        CHECK(html.find("<video") == std::string::npos);
        CHECK(html.find("<audio") == std::string::npos);
        CHECK(html.find("Download") != std::string::npos);
    }
}

TEST_CASE("render_landing_page", "[pages]") {
    auto html = render_landing_page();
    CHECK(html.find("Status: Running") != std::string::npos);
}
