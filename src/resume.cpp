#include <fstream>

#include <spdlog/spdlog.h>

#include <cloudget/enums.hpp>
#include <cloudget/resume.hpp>

namespace cloudget
{
    fs::path resume_path_for(const fs::path& artifact)
    {
        fs::path res = artifact;
        res += RESUMEEXT;
        return res;
    }

    void to_json(nlohmann::json& j, const ResumeState& state)
    {
        j = nlohmann::json{ { "url", state.url },
                            { "file_path", state.file_path },
                            { "total_size", state.total_size },
                            { "chunk_size", state.chunk_size },
                            { "downloaded", state.downloaded },
                            { "completed_chunks", state.completed_chunks },
                            { "last_modified", state.last_modified } };
    }

    void from_json(const nlohmann::json& j, ResumeState& state)
    {
        j.at("url").get_to(state.url);
        j.at("file_path").get_to(state.file_path);
        j.at("total_size").get_to(state.total_size);
        state.chunk_size = j.value("chunk_size", std::int64_t(0));
        state.downloaded = j.value("downloaded", std::uint64_t(0));
        state.completed_chunks
            = j.value("completed_chunks", std::set<std::size_t>());
        state.last_modified = j.value("last_modified", std::string());
    }

    void ResumeState::mark_completed(std::size_t index, std::uint64_t bytes)
    {
        if (completed_chunks.insert(index).second)
        {
            downloaded += bytes;
        }
    }

    tl::expected<void, DownloaderError> ResumeState::save(const fs::path& path) const
    {
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out)
        {
            return tl::unexpected(
                DownloaderError{ ErrorLevel::SERIOUS,
                                 ErrorCode::CG_FILE,
                                 fmt::format("Could not write resume file {}", path.string()) });
        }
        out << nlohmann::json(*this).dump(2);
        if (!out)
        {
            return tl::unexpected(
                DownloaderError{ ErrorLevel::SERIOUS,
                                 ErrorCode::CG_FILE,
                                 fmt::format("Could not write resume file {}", path.string()) });
        }
        return {};
    }

    tl::expected<std::optional<ResumeState>, DownloaderError> ResumeState::load(
        const fs::path& path)
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            return std::optional<ResumeState>();
        }

        std::ifstream in(path);
        if (!in)
        {
            return tl::unexpected(
                DownloaderError{ ErrorLevel::SERIOUS,
                                 ErrorCode::CG_FILE,
                                 fmt::format("Could not read resume file {}", path.string()) });
        }

        try
        {
            return std::optional<ResumeState>(nlohmann::json::parse(in).get<ResumeState>());
        }
        catch (const nlohmann::json::exception& e)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::SERIOUS,
                ErrorCode::CG_FILE,
                fmt::format("Corrupt resume file {}: {}", path.string(), e.what()) });
        }
    }

    void ResumeState::clear(const fs::path& path)
    {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec)
        {
            spdlog::warn("Could not remove resume file {}: {}", path.string(), ec.message());
        }
    }
}
