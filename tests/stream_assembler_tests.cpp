// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <filelink/core/concurrency_gate.hpp>
#include <filelink/core/stream_assembler.hpp>
#include <filelink/core/stream_session.hpp>
#include "fakes.hpp"
#include <algorithm>
#include <memory>
#include <thread>
#include <type_traits>

using namespace filelink::core;
using filelink::testing::MemoryChunkSource;
using filelink::testing::make_file;
using filelink::testing::make_pattern;

using namespace std::chrono_literals;

namespace {

// Run a session to completion and collect its body
std::expected<std::vector<std::byte>, std::error_code> collect(StreamSession& session) {
    std::vector<std::byte> body;
    while (true) {
        auto slice = session.next();
        if (!slice) {
            return std::unexpected(slice.error());
        }
        if (!*slice) {
            return body;
        }
        body.insert(body.end(), (*slice)->begin(), (*slice)->end());
    }
}

StreamLimits test_limits(std::uint64_t chunk_size) {
    StreamLimits limits;
    limits.chunk_size = chunk_size;
    limits.max_parallel_chunks = 3;
    limits.buffer_capacity = 4;
    limits.pull_timeout = 2000ms;
    return limits;
}

} // namespace

TEST_CASE("StreamSession - body reproduces the requested bytes", "[assembler]") {
    const std::size_t size = 10'000;
    auto source = std::make_shared<MemoryChunkSource>(make_pattern(size));
    ConcurrencyGate gate(4);

    const std::uint64_t chunk_size = GENERATE(64, 100, 1024, 4096, 20'000);
    const auto [start, end] = GENERATE(table<std::uint64_t, std::uint64_t>({
        {0, 9'999},
        {0, 0},
        {9'999, 9'999},
        {1, 9'998},
        {100, 199},
        {4'095, 4'096},
        {5'000, 12'000},
    }));

    StreamSession session(gate.acquire(), make_file(1, size), {start, end}, source, test_limits(chunk_size));
    auto body = collect(session);
    REQUIRE(body.has_value());

    const std::uint64_t last = std::min<std::uint64_t>(end, size - 1);
    const auto& data = source->data();
    std::vector<std::byte> expected(data.begin() + static_cast<std::ptrdiff_t>(start),
                                    data.begin() + static_cast<std::ptrdiff_t>(last + 1));
    CHECK(body->size() == last - start + 1);
    CHECK(*body == expected);
    CHECK(session.assembler().bytes_emitted() == body->size());

    SECTION("Finished stream keeps reporting the end") {
        auto again = session.next();
        REQUIRE(again.has_value());
        CHECK(!again->has_value());
    }
}

TEST_CASE("StreamAssembler - slices are writable views", "[assembler]") {
    STATIC_REQUIRE(std::is_same_v<StreamAssembler::Slice::element_type, std::byte>);
    STATIC_REQUIRE(std::is_convertible_v<StreamAssembler::Slice::pointer, void*>);
}

TEST_CASE("StreamSession - same range twice gives the same bytes", "[assembler]") {
    auto source = std::make_shared<MemoryChunkSource>(make_pattern(3000));
    ConcurrencyGate gate(2);

    StreamSession first(gate.acquire(), make_file(1, 3000), {123, 2345}, source, test_limits(256));
    StreamSession second(gate.acquire(), make_file(1, 3000), {123, 2345}, source, test_limits(256));
    auto a = collect(first);
    auto b = collect(second);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(*a == *b);
}

TEST_CASE("StreamSession - releases its admission slot", "[assembler]") {
    auto source = std::make_shared<MemoryChunkSource>(make_pattern(10'000));
    source->set_delay(5ms);
    ConcurrencyGate gate(2);

    {
        StreamSession session(gate.acquire(), make_file(1, 10'000), {0, 9'999}, source, test_limits(100));
        CHECK(gate.available() == 1);
        auto slice = session.next();
        REQUIRE(slice.has_value());
        // Abandoned mid-stream
    }
    CHECK(gate.available() == 2);
    CHECK(source->active() == 0);
}

TEST_CASE("StreamAssembler - trims a single chunk on both sides", "[assembler]") {
    auto plan = plan_chunks({3, 6}, 10, 10);
    PrefetchBuffer buffer(2);
    Chunk chunk(10);
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        chunk[i] = static_cast<std::byte>(i);
    }
    REQUIRE(buffer.push(chunk, {}));
    buffer.finish();

    StreamAssembler assembler(plan, buffer, 50ms, 2);
    auto slice = assembler.next();
    REQUIRE(slice.has_value());
    REQUIRE(slice->has_value());
    REQUIRE((*slice)->size() == 4);
    CHECK((**slice)[0] == std::byte{3});
    CHECK((**slice)[3] == std::byte{6});

    auto end = assembler.next();
    REQUIRE(end.has_value());
    CHECK(!end->has_value());
    CHECK(assembler.done());
}

TEST_CASE("StreamAssembler - early sentinel is a truncated stream", "[assembler]") {
    auto plan = plan_chunks({0, 29}, 30, 10);
    PrefetchBuffer buffer(4);
    REQUIRE(buffer.push(Chunk(10), {}));
    buffer.finish();

    StreamAssembler assembler(plan, buffer, 50ms, 2);
    REQUIRE(assembler.next().has_value());

    auto result = assembler.next();
    REQUIRE(!result.has_value());
    CHECK(result.error() == make_error_code(StreamErrc::stream_truncated));

    // Sticky
    auto again = assembler.next();
    REQUIRE(!again.has_value());
    CHECK(again.error() == make_error_code(StreamErrc::stream_truncated));
}

TEST_CASE("StreamAssembler - short chunks are a truncated stream", "[assembler]") {
    SECTION("Short middle chunk") {
        auto plan = plan_chunks({0, 29}, 30, 10);
        PrefetchBuffer buffer(4);
        REQUIRE(buffer.push(Chunk(10), {}));
        REQUIRE(buffer.push(Chunk(5), {}));

        StreamAssembler assembler(plan, buffer, 50ms, 2);
        REQUIRE(assembler.next().has_value());
        auto result = assembler.next();
        REQUIRE(!result.has_value());
        CHECK(result.error() == make_error_code(StreamErrc::stream_truncated));
    }

    SECTION("Last chunk shorter than its trim") {
        auto plan = plan_chunks({0, 8}, 10, 10);
        PrefetchBuffer buffer(4);
        REQUIRE(buffer.push(Chunk(4), {}));

        StreamAssembler assembler(plan, buffer, 50ms, 2);
        auto result = assembler.next();
        REQUIRE(!result.has_value());
        CHECK(result.error() == make_error_code(StreamErrc::stream_truncated));
    }

    SECTION("Short chunk from the source") {
        auto source = std::make_shared<MemoryChunkSource>(make_pattern(1000));
        source->truncate_at(200);
        ConcurrencyGate gate(1);
        StreamSession session(gate.acquire(), make_file(1, 1000), {0, 999}, source, test_limits(100));
        auto body = collect(session);
        REQUIRE(!body.has_value());
        CHECK(body.error() == make_error_code(StreamErrc::stream_truncated));
    }
}

TEST_CASE("StreamAssembler - stalled producer hits the retry ceiling", "[assembler]") {
    auto plan = plan_chunks({0, 9}, 10, 10);
    PrefetchBuffer buffer(1);

    StreamAssembler assembler(plan, buffer, 10ms, 3);
    auto started = std::chrono::steady_clock::now();
    auto result = assembler.next();
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(!result.has_value());
    CHECK(result.error() == make_error_code(StreamErrc::upstream_failure));
    // Initial attempt plus three retries
    CHECK(elapsed >= 40ms);
}

TEST_CASE("StreamAssembler - a late chunk within the ceiling is accepted", "[assembler]") {
    auto plan = plan_chunks({0, 9}, 10, 10);
    PrefetchBuffer buffer(1);

    std::jthread late([&buffer](std::stop_token stop) {
        std::this_thread::sleep_for(35ms);
        (void)buffer.push(Chunk(10), stop);
    });

    StreamAssembler assembler(plan, buffer, 10ms, 20);
    auto result = assembler.next();
    REQUIRE(result.has_value());
    REQUIRE(result->has_value());
    CHECK((*result)->size() == 10);
}

TEST_CASE("StreamSession - upstream failure surfaces to the consumer", "[assembler]") {
    auto source = std::make_shared<MemoryChunkSource>(make_pattern(1000));
    source->fail_at(300);
    ConcurrencyGate gate(1);

    StreamSession session(gate.acquire(), make_file(1, 1000), {0, 999}, source, test_limits(100));
    auto body = collect(session);
    REQUIRE(!body.has_value());
    CHECK(body.error() == make_error_code(StreamErrc::upstream_failure));
}
