// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <filelink/upstream/catalog.hpp>
#include <filelink/upstream/http_session.hpp>
#include <filelink/upstream/origin_source.hpp>
#include "fakes.hpp"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace filelink;
using namespace filelink::upstream;
using filelink::testing::make_pattern;

namespace fs = std::filesystem;

namespace {

// A local file served through curl's file:// handler
class OriginFile {
public:
    explicit OriginFile(std::size_t size)
        : path_(fs::temp_directory_path() / ("filelink_origin_" + std::to_string(size) + ".bin"))
        , data_(make_pattern(size)) {
        std::ofstream out(path_, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data_.data()), static_cast<std::streamsize>(data_.size()));
    }
    ~OriginFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    [[nodiscard]] std::string url() const { return "file://" + path_.string(); }
    [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return data_; }

    [[nodiscard]] core::FileHandle handle() const {
        return core::FileHandle{1, url(), data_.size()};
    }

    [[nodiscard]] core::Chunk slice(std::size_t offset, std::size_t length) const {
        auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
        return core::Chunk(first, first + static_cast<std::ptrdiff_t>(length));
    }

private:
    fs::path path_;
    std::vector<std::byte> data_;
};

} // namespace

TEST_CASE("OriginChunkSource - ranged reads", "[upstream]") {
    HttpSession::global_init();
    OriginFile file(10'000);
    OriginChunkSource source(std::make_shared<HttpSession>(), 0);

    SECTION("Whole chunk") {
        auto chunk = source.fetch(file.handle(), 4096, 4096, {});
        REQUIRE(chunk.has_value());
        CHECK(*chunk == file.slice(4096, 4096));
    }

    SECTION("Last chunk is cut at the end of the file") {
        auto chunk = source.fetch(file.handle(), 8192, 4096, {});
        REQUIRE(chunk.has_value());
        CHECK(chunk->size() == 10'000 - 8192);
        CHECK(*chunk == file.slice(8192, 10'000 - 8192));
    }

    SECTION("Offset past the end") {
        auto chunk = source.fetch(file.handle(), 10'000, 4096, {});
        REQUIRE(!chunk.has_value());
        CHECK(chunk.error() == core::make_error_code(core::StreamErrc::invalid_range));
    }

    SECTION("Origin shorter than advertised") {
        auto handle = file.handle();
        handle.size = 20'000;
        auto chunk = source.fetch(handle, 9'000, 4096, {});
        REQUIRE(!chunk.has_value());
        CHECK(chunk.error() == core::make_error_code(core::StreamErrc::stream_truncated));
    }
}

TEST_CASE("OriginChunkSource - missing origin file", "[upstream]") {
    HttpSession::global_init();
    OriginChunkSource source(std::make_shared<HttpSession>());
    core::FileHandle handle{1, "file://" + (fs::temp_directory_path() / "filelink_absent.bin").string(), 100};

    auto chunk = source.fetch(handle, 0, 100, {});
    REQUIRE(!chunk.has_value());
    CHECK(chunk.error() == core::make_error_code(core::StreamErrc::file_not_found));
}

TEST_CASE("OriginChunkSource - default retry schedule", "[upstream]") {
    HttpSession::global_init();
    OriginChunkSource source(std::make_shared<HttpSession>());
    // Nothing listens on port 1, so every attempt is a transport failure
    core::FileHandle handle{1, "http://127.0.0.1:1/file.bin", 100};

    auto started = std::chrono::steady_clock::now();
    auto chunk = source.fetch(handle, 0, 100, {});
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(!chunk.has_value());
    CHECK(chunk.error() == core::make_error_code(core::StreamErrc::upstream_failure));
    CHECK(elapsed >= core::RETRY_DELAY * core::RETRY_COUNT);
}

TEST_CASE("OriginChunkSource - stop cuts the retry wait short", "[upstream]") {
    HttpSession::global_init();
    OriginChunkSource source(std::make_shared<HttpSession>(), 5, std::chrono::seconds(10));
    core::FileHandle handle{1, "http://127.0.0.1:1/file.bin", 100};

    std::stop_source stop;
    std::thread canceller([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop.request_stop();
    });

    auto started = std::chrono::steady_clock::now();
    auto chunk = source.fetch(handle, 0, 100, stop.get_token());
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    REQUIRE(!chunk.has_value());
    CHECK(chunk.error() == core::make_error_code(core::StreamErrc::cancelled));
    CHECK(elapsed < std::chrono::seconds(5));
}

TEST_CASE("CatalogResolver - probes the origin for a missing size", "[upstream]") {
    HttpSession::global_init();
    OriginFile file(3'000);

    Catalog catalog;
    CatalogEntry entry;
    entry.id = 5;
    entry.code = "pw";
    entry.url = file.url();
    entry.name = "data.bin";
    catalog.add(entry);

    CatalogResolver resolver(std::move(catalog), std::make_shared<HttpSession>(), std::chrono::seconds(5));
    auto info = resolver.resolve(5, {});
    REQUIRE(info.has_value());
    CHECK(info->handle.size == 3'000);
    CHECK(info->name == "data.bin");
}

TEST_CASE("HttpSession::parse_content_disposition", "[upstream]") {
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"file.zip\"") == "file.zip");
    CHECK(HttpSession::parse_content_disposition("attachment; filename=plain.txt; size=3") == "plain.txt");
    CHECK(HttpSession::parse_content_disposition("attachment; filename*=UTF-8''na%C3%AFve%20clip.mp4") == "naïve clip.mp4");
    CHECK(HttpSession::parse_content_disposition("inline").empty());
}
