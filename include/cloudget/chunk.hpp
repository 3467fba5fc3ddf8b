#ifndef CLOUDGET_CHUNK_HPP
#define CLOUDGET_CHUNK_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <cloudget/export.hpp>

namespace cloudget
{
    // Inclusive byte range `[start, end]` of a file.
    struct ChunkRange
    {
        std::size_t index = 0;
        std::uint64_t start = 0;
        std::uint64_t end = 0;

        std::uint64_t size() const noexcept
        {
            return end - start + 1;
        }

        // Value of the `Range` header / CURLOPT_RANGE, e.g. "0-2097151".
        std::string to_string() const;

        bool operator==(const ChunkRange& other) const noexcept
        {
            return index == other.index && start == other.start && end == other.end;
        }
    };

    struct ChunkResult
    {
        std::size_t index = 0;
        std::uint64_t offset = 0;
        std::vector<char> payload;
    };

    /** Splits `[0, size - 1]` in `ceil(size / chunk_size)` contiguous ranges.
     * The last range is clamped to `size - 1`. An empty file gives no ranges.
     * Throws `std::invalid_argument` if `chunk_size` is not positive.
     */
    CLOUDGET_API std::vector<ChunkRange> plan_chunks(std::uint64_t size, std::int64_t chunk_size);

    // Ranged transfers are only worth it when the server honours ranges and the
    // file does not fit in a single chunk.
    CLOUDGET_API bool use_ranged_transfer(std::uint64_t size,
                                          bool accept_ranges,
                                          std::int64_t chunk_size);
}

#endif
