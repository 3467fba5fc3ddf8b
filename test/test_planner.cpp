#include <doctest/doctest.h>

#include <cloudget/chunk.hpp>

using namespace cloudget;

TEST_SUITE("planner")
{
    TEST_CASE("five_mib_in_two_mib_chunks")
    {
        const std::int64_t mib = 1024 * 1024;
        auto ranges = plan_chunks(5 * mib, 2 * mib);
        REQUIRE_EQ(ranges.size(), 3);

        CHECK((ranges[0] == ChunkRange{ 0, 0, 2097151 }));
        CHECK((ranges[1] == ChunkRange{ 1, 2097152, 4194303 }));
        CHECK((ranges[2] == ChunkRange{ 2, 4194304, 5242879 }));

        CHECK_EQ(ranges[0].to_string(), "0-2097151");
        CHECK_EQ(ranges[2].size(), 1048576);
    }

    TEST_CASE("partition")
    {
        for (std::uint64_t size : { 1ull, 7ull, 100ull, 1000ull, 1024ull, 1025ull })
        {
            for (std::int64_t chunk : { 1, 3, 64, 1024, 4096 })
            {
                auto ranges = plan_chunks(size, chunk);
                const std::uint64_t expected
                    = (size + static_cast<std::uint64_t>(chunk) - 1) / static_cast<std::uint64_t>(chunk);
                REQUIRE_EQ(ranges.size(), expected);

                std::uint64_t next = 0;
                for (std::size_t i = 0; i < ranges.size(); ++i)
                {
                    CHECK_EQ(ranges[i].index, i);
                    CHECK_EQ(ranges[i].start, next);
                    CHECK_LE(ranges[i].size(), static_cast<std::uint64_t>(chunk));
                    next = ranges[i].end + 1;
                }
                CHECK_EQ(next, size);
            }
        }
    }

    TEST_CASE("single_chunk")
    {
        auto ranges = plan_chunks(10, 100);
        REQUIRE_EQ(ranges.size(), 1);
        CHECK((ranges[0] == ChunkRange{ 0, 0, 9 }));
    }

    TEST_CASE("empty_file")
    {
        CHECK(plan_chunks(0, 1024).empty());
    }

    TEST_CASE("bad_chunk_size")
    {
        CHECK_THROWS_AS(plan_chunks(100, 0), std::invalid_argument);
        CHECK_THROWS_AS(plan_chunks(100, -5), std::invalid_argument);
    }

    TEST_CASE("use_ranged_transfer")
    {
        CHECK(use_ranged_transfer(5000, true, 1000));
        CHECK_FALSE(use_ranged_transfer(5000, false, 1000));
        CHECK_FALSE(use_ranged_transfer(0, true, 1000));
        CHECK_FALSE(use_ranged_transfer(1000, true, 1000));
        CHECK_FALSE(use_ranged_transfer(500, true, 1000));
    }
}
