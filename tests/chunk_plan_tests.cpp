// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <filelink/core/chunk_plan.hpp>
#include <filelink/core/config.hpp>

using namespace filelink::core;

TEST_CASE("plan_chunks - whole 10 MB file over 4 MiB chunks", "[chunk_plan]") {
    const std::uint64_t size = 10'000'000;
    const std::uint64_t cs = DEFAULT_CHUNK_SIZE;
    REQUIRE(cs == 4'194'304);

    auto plan = plan_chunks({0, 9'999'999}, size, cs);
    CHECK(plan.offset == 0);
    CHECK(plan.first_trim == 0);
    CHECK(plan.last_trim == 9'999'999 % cs + 1);
    CHECK(plan.part_count == 3);
    CHECK(plan.total_bytes == size);
    CHECK(plan.chunk_offset(2) == 2 * cs);
}

TEST_CASE("plan_chunks - ranges inside and across chunks", "[chunk_plan]") {
    const std::uint64_t cs = 100;

    SECTION("Inside a single chunk") {
        auto plan = plan_chunks({130, 170}, 1000, cs);
        CHECK(plan.offset == 100);
        CHECK(plan.first_trim == 30);
        CHECK(plan.last_trim == 71);
        CHECK(plan.part_count == 1);
        CHECK(plan.total_bytes == 41);
    }

    SECTION("Spanning four chunks") {
        auto plan = plan_chunks({150, 420}, 1000, cs);
        CHECK(plan.offset == 100);
        CHECK(plan.first_trim == 50);
        CHECK(plan.last_trim == 21);
        CHECK(plan.part_count == 4);
        CHECK(plan.total_bytes == 271);
    }

    SECTION("Start on a chunk boundary") {
        auto plan = plan_chunks({200, 299}, 1000, cs);
        CHECK(plan.offset == 200);
        CHECK(plan.first_trim == 0);
        CHECK(plan.last_trim == 100);
        CHECK(plan.part_count == 1);
    }

    SECTION("End on the first byte of a chunk still fetches it") {
        auto plan = plan_chunks({0, 200}, 1000, cs);
        CHECK(plan.last_trim == 1);
        CHECK(plan.part_count == 3);
    }

    SECTION("End beyond the file is clamped") {
        auto plan = plan_chunks({900, 5000}, 950, cs);
        CHECK(plan.total_bytes == 50);
        CHECK(plan.last_trim == 50);
        CHECK(plan.part_count == 1);
    }
}

TEST_CASE("plan_chunks - trims always describe the requested bytes", "[chunk_plan]") {
    const std::uint64_t cs = 64;
    const std::uint64_t size = 1000;
    for (std::uint64_t start = 0; start < size; start += 37) {
        for (std::uint64_t end = start; end < size; end += 53) {
            auto plan = plan_chunks({start, end}, size, cs);
            // Bytes covered by the fetched chunks minus the trims
            std::uint64_t covered = 0;
            if (plan.part_count == 1) {
                covered = plan.last_trim - plan.first_trim;
            } else {
                covered = (cs - plan.first_trim) + (plan.part_count - 2) * cs + plan.last_trim;
            }
            REQUIRE(covered == plan.total_bytes);
            REQUIRE(plan.chunk_offset(plan.part_count - 1) <= end);
        }
    }
}
