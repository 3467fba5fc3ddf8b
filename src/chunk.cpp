#include <algorithm>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include <cloudget/chunk.hpp>

namespace cloudget
{
    std::string ChunkRange::to_string() const
    {
        return fmt::format("{}-{}", start, end);
    }

    std::vector<ChunkRange> plan_chunks(std::uint64_t size, std::int64_t chunk_size)
    {
        if (chunk_size <= 0)
        {
            throw std::invalid_argument(
                fmt::format("chunk size must be positive (got {})", chunk_size));
        }

        const auto csize = static_cast<std::uint64_t>(chunk_size);
        std::vector<ChunkRange> ranges;
        ranges.reserve(static_cast<std::size_t>((size + csize - 1) / csize));

        for (std::uint64_t start = 0; start < size; start += csize)
        {
            const std::uint64_t end = std::min(start + csize - 1, size - 1);
            ranges.push_back(ChunkRange{ ranges.size(), start, end });
        }
        return ranges;
    }

    bool use_ranged_transfer(std::uint64_t size, bool accept_ranges, std::int64_t chunk_size)
    {
        return accept_ranges && size > 0 && chunk_size > 0
               && size > static_cast<std::uint64_t>(chunk_size);
    }
}
