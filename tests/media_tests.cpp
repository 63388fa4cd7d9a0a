// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <filelink/core/media.hpp>

using namespace filelink::core;

TEST_CASE("MediaKind names", "[media]") {
    CHECK(parse_media_kind("video") == MediaKind::video);
    CHECK(parse_media_kind("video_note") == MediaKind::video_note);
    CHECK(parse_media_kind("document") == MediaKind::document);
    CHECK(!parse_media_kind("sticker").has_value());
    CHECK(to_string(MediaKind::voice) == "voice");
}

TEST_CASE("Default extensions", "[media]") {
    CHECK(default_extension(MediaKind::video) == "mp4");
    CHECK(default_extension(MediaKind::audio) == "mp3");
    CHECK(default_extension(MediaKind::voice) == "ogg");
    CHECK(default_extension(MediaKind::photo) == "jpg");
    CHECK(default_extension(MediaKind::video_note) == "mp4");
    CHECK(default_extension(MediaKind::document).empty());
}

TEST_CASE("default_file_name", "[media]") {
    const auto now = std::chrono::system_clock::now();

    SECTION("Kind, timestamp and extension") {
        auto name = default_file_name(MediaKind::voice, now);
        REQUIRE(name.has_value());
        CHECK(name->starts_with("voice-"));
        CHECK(name->ends_with(".ogg"));
        // voice-YYYY-mm-dd_HH-MM-SS.ogg
        CHECK(name->size() == std::string_view("voice-").size() + 19 + 4);
        CHECK(name->at(6 + 10) == '_');
    }

    SECTION("Documents have no default name") {
        auto name = default_file_name(MediaKind::document, now);
        REQUIRE(!name.has_value());
        CHECK(name.error() == make_error_code(StreamErrc::invalid_media));
    }
}

TEST_CASE("guess_mime_type", "[media]") {
    CHECK(guess_mime_type("movie.mp4") == "video/mp4");
    CHECK(guess_mime_type("MOVIE.MKV") == "video/x-matroska");
    CHECK(guess_mime_type("song.mp3") == "audio/mpeg");
    CHECK(guess_mime_type("photo.jpeg") == "image/jpeg");
    CHECK(guess_mime_type("archive.tar.gz") == "application/gzip");
    CHECK(guess_mime_type("noext") == "application/octet-stream");
    CHECK(guess_mime_type("weird.") == "application/octet-stream");
    CHECK(guess_mime_type("data.unknownext") == "application/octet-stream");
}
