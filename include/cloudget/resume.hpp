#ifndef CLOUDGET_RESUME_HPP
#define CLOUDGET_RESUME_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cloudget/export.hpp>
#include <cloudget/errors.hpp>

namespace cloudget
{
    namespace fs = std::filesystem;

    // Progress record kept next to the artifact as `<artifact>.resume` while
    // a download runs. It is informational: completed chunks are still
    // fetched again by a later run.
    struct CLOUDGET_API ResumeState
    {
        std::string url;
        std::string file_path;
        std::uint64_t total_size = 0;
        std::int64_t chunk_size = 0;
        std::uint64_t downloaded = 0;
        std::set<std::size_t> completed_chunks;
        std::string last_modified;

        void mark_completed(std::size_t index, std::uint64_t bytes);

        tl::expected<void, DownloaderError> save(const fs::path& path) const;
        static tl::expected<std::optional<ResumeState>, DownloaderError> load(const fs::path& path);
        static void clear(const fs::path& path);
    };

    CLOUDGET_API void to_json(nlohmann::json& j, const ResumeState& state);
    CLOUDGET_API void from_json(const nlohmann::json& j, ResumeState& state);

    CLOUDGET_API fs::path resume_path_for(const fs::path& artifact);
}

#endif
