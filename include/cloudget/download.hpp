#ifndef CLOUDGET_DOWNLOAD_HPP
#define CLOUDGET_DOWNLOAD_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <cloudget/export.hpp>
#include <cloudget/enums.hpp>
#include <cloudget/errors.hpp>
#include <cloudget/progress.hpp>

namespace cloudget
{
    namespace fs = std::filesystem;

    class Context;

    struct DownloadRequest
    {
        std::string url;

        fs::path output_dir = ".";
        // Takes precedence over `output_dir` and any filename.
        std::optional<fs::path> output_path = std::nullopt;
        // Replaces the filename found by the probe.
        std::optional<std::string> filename = std::nullopt;

        std::optional<Checksum> expected_checksum = std::nullopt;
        // Digest to report in the outcome when no expected checksum is given.
        std::optional<ChecksumType> report_checksum = std::nullopt;

        bool resume = true;
        std::size_t connections = 8;
        std::int64_t chunk_size = 2 * 1024 * 1024;
        std::chrono::seconds timeout = std::chrono::seconds(300);
        // Total chunk retries for this download, 0 means unlimited.
        std::size_t retry_budget = 0;

        // Use this service instead of looking one up by URL.
        std::optional<std::string> service = std::nullopt;

        ProgressTracker::callback_type progress = {};
    };

    struct DownloadOutcome
    {
        fs::path path;
        std::uint64_t size = 0;
        std::optional<std::string> checksum = std::nullopt;
        std::chrono::duration<double> elapsed{ 0 };
        // Bytes per second, 0 when nothing was transferred.
        double throughput = 0;
        std::size_t chunks = 0;
        // True when an existing file was returned without transfer.
        bool reused = false;
        std::string service;
        std::string url;
    };

    // Lowest and highest accepted `DownloadRequest::connections`.
    inline constexpr std::size_t min_connections = 1;
    inline constexpr std::size_t max_connections = 16;

    /** Downloads one share link.
     *
     * Resolves the URL with its service, probes the file, then fetches it in
     * parallel byte ranges (or as one stream when ranges are not available)
     * into `<artifact>.cgpart`. The partial file is only moved onto the
     * artifact path once its size and checksum are verified; on any error it
     * is removed, so the artifact path never holds an incomplete file.
     */
    CLOUDGET_API tl::expected<DownloadOutcome, DownloaderError> download(
        const Context& ctx, const DownloadRequest& request);
}

#endif
