#include <algorithm>
#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cloudget/chunk.hpp>
#include <cloudget/chunk_target.hpp>
#include <cloudget/context.hpp>
#include <cloudget/download.hpp>
#include <cloudget/downloader.hpp>
#include <cloudget/metadata.hpp>
#include <cloudget/reassembler.hpp>
#include <cloudget/resume.hpp>
#include <cloudget/service.hpp>
#include <cloudget/utils.hpp>
#include <cloudget/verifier.hpp>

namespace cloudget
{
    namespace
    {
        using clock = std::chrono::steady_clock;

        DownloaderError bad_argument(const std::string& reason)
        {
            return DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_BADFUNCARG, reason };
        }

        tl::expected<void, DownloaderError> validate(const DownloadRequest& request)
        {
            if (request.url.empty())
                return tl::unexpected(bad_argument("No URL given"));
            if (request.connections < min_connections || request.connections > max_connections)
            {
                return tl::unexpected(
                    bad_argument(fmt::format("Connections must be between {} and {}, got {}",
                                             min_connections,
                                             max_connections,
                                             request.connections)));
            }
            if (request.chunk_size <= 0)
            {
                return tl::unexpected(bad_argument(
                    fmt::format("Chunk size must be positive, got {}", request.chunk_size)));
            }
            return {};
        }

        tl::expected<std::shared_ptr<Service>, DownloaderError> select_service(
            const Context& ctx, const DownloadRequest& request)
        {
            std::shared_ptr<Service> service;
            if (request.service)
            {
                service = ctx.services.get(*request.service);
                if (!service)
                {
                    return tl::unexpected(DownloaderError{
                        ErrorLevel::FATAL,
                        ErrorCode::CG_UNSUPPORTED_URL,
                        fmt::format("Unknown service '{}'", *request.service) });
                }
            }
            else
            {
                service = ctx.services.find_for_url(request.url);
                if (!service)
                {
                    return tl::unexpected(
                        DownloaderError{ ErrorLevel::FATAL,
                                         ErrorCode::CG_UNSUPPORTED_URL,
                                         fmt::format("No service supports {}", request.url) });
                }
            }
            return service;
        }

        // Output path known before probing, if any.
        std::optional<fs::path> early_output_path(const DownloadRequest& request)
        {
            if (request.output_path)
                return *request.output_path;
            if (request.filename && !sanitize_filename(*request.filename).empty())
                return request.output_dir / sanitize_filename(*request.filename);
            return std::nullopt;
        }

        fs::path output_path(const DownloadRequest& request, const FileMetadata& metadata)
        {
            if (auto path = early_output_path(request))
                return *path;
            return request.output_dir / metadata.filename;
        }

        tl::expected<void, DownloaderError> create_parent_directories(const fs::path& path)
        {
            const fs::path parent = path.parent_path();
            if (parent.empty())
                return {};

            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec)
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::FATAL,
                    ErrorCode::CG_FILE,
                    fmt::format("Could not create directory {}: {}", parent.string(), ec.message()) });
            }
            return {};
        }

        tl::expected<std::optional<std::string>, DownloaderError> report_digest(
            const fs::path& path, const DownloadRequest& request)
        {
            if (request.expected_checksum || !request.report_checksum)
                return std::nullopt;
            try
            {
                return checksum(path, *request.report_checksum);
            }
            catch (const std::runtime_error& e)
            {
                return tl::unexpected(
                    DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_FILE, e.what() });
            }
        }

        DownloadOutcome reused_outcome(const fs::path& path,
                                       const DownloadRequest& request,
                                       const Service& service,
                                       clock::time_point start)
        {
            DownloadOutcome outcome;
            outcome.path = path;
            std::error_code ec;
            outcome.size = fs::file_size(path, ec);
            if (request.expected_checksum)
                outcome.checksum = to_lower(strip(request.expected_checksum->checksum));
            outcome.elapsed = clock::now() - start;
            outcome.reused = true;
            outcome.service = std::string(service.name());
            outcome.url = request.url;
            spdlog::info("{} already downloaded", path.string());
            return outcome;
        }

        struct Transfer
        {
            const Context& ctx;
            const DownloadRequest& request;
            const FileMetadata& metadata;
            std::vector<std::string> headers;
            Reassembler& reassembler;
            ProgressTracker& progress;
            std::optional<ResumeState> sidecar;
            fs::path sidecar_path;
            clock::time_point deadline;
        };

        tl::expected<std::size_t, DownloaderError> run_ranged(Transfer& transfer)
        {
            const auto ranges = plan_chunks(transfer.metadata.size, transfer.request.chunk_size);
            spdlog::info("Downloading {} in {} chunks over {} connections",
                         transfer.metadata.filename,
                         ranges.size(),
                         std::min(transfer.request.connections, ranges.size()));

            transfer.progress.reset(transfer.metadata.size, ranges.size());

            Downloader downloader(transfer.request.connections);
            downloader.set_deadline(transfer.deadline);
            downloader.set_retry_budget(transfer.request.retry_budget);

            for (const auto& range : ranges)
            {
                const bool final_of_plan = ranges.size() > 1 && range.index == ranges.size() - 1;
                auto target = std::make_unique<ChunkTarget>(
                    transfer.ctx, transfer.metadata.url, range, final_of_plan, transfer.headers);
                target->set_progress(&transfer.progress);
                downloader.add(std::move(target));
            }

            downloader.set_chunk_done_callback(
                [&transfer](ChunkTarget& target) -> tl::expected<void, DownloaderError>
                {
                    const ChunkResult result = target.take_result();
                    auto placed = transfer.reassembler.place(result);
                    if (!placed)
                        return placed;

                    if (transfer.sidecar)
                    {
                        transfer.sidecar->mark_completed(result.index, result.payload.size());
                        auto saved = transfer.sidecar->save(transfer.sidecar_path);
                        if (!saved)
                            saved.error().log();
                    }
                    return {};
                });

            auto res = downloader.download();
            if (!res)
                return tl::unexpected(res.error());
            return ranges.size();
        }

        tl::expected<std::size_t, DownloaderError> run_streaming(Transfer& transfer)
        {
            spdlog::info("Downloading {} as a single stream", transfer.metadata.filename);

            transfer.progress.reset(transfer.metadata.size, 1);

            Downloader downloader(1);
            downloader.set_deadline(transfer.deadline);
            downloader.set_retry_budget(transfer.request.retry_budget);

            auto target = std::make_unique<ChunkTarget>(
                transfer.ctx, transfer.metadata.url, transfer.reassembler, transfer.headers);
            target->set_progress(&transfer.progress);
            downloader.add(std::move(target));

            auto res = downloader.download();
            if (!res)
                return tl::unexpected(res.error());
            return 1;
        }
    }

    tl::expected<DownloadOutcome, DownloaderError> download(const Context& ctx,
                                                            const DownloadRequest& request)
    {
        const auto start = clock::now();
        const auto deadline = start + request.timeout;

        if (auto valid = validate(request); !valid)
            return tl::unexpected(valid.error());

        auto selected = select_service(ctx, request);
        if (!selected)
            return tl::unexpected(selected.error());
        const Service& service = *selected.value();
        spdlog::info("Using {} for {}", service.display_name(), request.url);

        auto resolved = service.resolve(request.url);
        if (!resolved)
            return tl::unexpected(resolved.error());

        // With a checksum and a known destination an existing file can be
        // accepted without any request.
        if (auto early_path = early_output_path(request); early_path && request.expected_checksum)
        {
            if (check_existing_artifact(*early_path, 0, request.expected_checksum)
                == ExistingArtifact::kREUSABLE)
            {
                return reused_outcome(*early_path, request, service, start);
            }
        }

        auto prepared = service.prepare(ctx, resolved.value());
        if (!prepared)
            return tl::unexpected(prepared.error());

        auto probed = probe(ctx, service, prepared.value());
        if (!probed)
            return tl::unexpected(probed.error());
        const FileMetadata& metadata = probed.value();

        const fs::path artifact = output_path(request, metadata);
        if (auto created = create_parent_directories(artifact); !created)
            return tl::unexpected(created.error());

        switch (check_existing_artifact(artifact, metadata.size, request.expected_checksum))
        {
            case ExistingArtifact::kREUSABLE:
                return reused_outcome(artifact, request, service, start);
            case ExistingArtifact::kSTALE:
                spdlog::info("Replacing existing file {}", artifact.string());
                break;
            default:
                break;
        }

        Reassembler reassembler(artifact, metadata.size);
        ProgressTracker progress(metadata.size, 1, request.progress);

        Transfer transfer{ ctx,
                           request,
                           metadata,
                           request_headers(ctx, service),
                           reassembler,
                           progress,
                           std::nullopt,
                           resume_path_for(artifact),
                           deadline };

        auto fail = [&reassembler](const DownloaderError& error)
            -> tl::expected<DownloadOutcome, DownloaderError>
        {
            reassembler.discard();
            error.log();
            return tl::unexpected(error);
        };

        if (request.resume)
        {
            auto previous = ResumeState::load(transfer.sidecar_path);
            if (!previous)
            {
                previous.error().log();
            }
            else if (previous.value())
            {
                const ResumeState& state = *previous.value();
                if (state.url == metadata.url && state.total_size == metadata.size)
                {
                    spdlog::info("Previous attempt completed {} chunks ({}), fetching again",
                                 state.completed_chunks.size(),
                                 format_bytes(state.downloaded));
                }
                else
                {
                    spdlog::info("Ignoring resume state of a different download in {}",
                                 transfer.sidecar_path.string());
                }
            }

            ResumeState state;
            state.url = metadata.url;
            state.file_path = artifact.string();
            state.total_size = metadata.size;
            state.chunk_size = request.chunk_size;
            state.last_modified = metadata.last_modified.value_or("");
            if (auto saved = state.save(transfer.sidecar_path); !saved)
                saved.error().log();
            transfer.sidecar = std::move(state);
        }

        if (auto opened = reassembler.open(); !opened)
            return fail(opened.error());

        const bool ranged
            = use_ranged_transfer(metadata.size, metadata.accept_ranges, request.chunk_size);
        auto chunks = ranged ? run_ranged(transfer) : run_streaming(transfer);
        if (!chunks)
            return fail(chunks.error());

        if (auto closed = reassembler.close(); !closed)
            return fail(closed.error());

        const std::uint64_t written = reassembler.bytes_written();
        if (metadata.size > 0 && written != metadata.size)
        {
            return fail(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::CG_SIZE_MISMATCH,
                fmt::format("Received {} bytes, expected {}", written, metadata.size) });
        }

        auto verified = verify_artifact(reassembler.part_path(), written, request.expected_checksum);
        if (!verified)
            return fail(verified.error());

        auto digest = report_digest(reassembler.part_path(), request);
        if (!digest)
            return fail(digest.error());

        if (auto committed = reassembler.commit(); !committed)
            return fail(committed.error());

        if (transfer.sidecar)
            ResumeState::clear(transfer.sidecar_path);

        DownloadOutcome outcome;
        outcome.path = artifact;
        outcome.size = written;
        outcome.checksum = verified.value() ? verified.value() : digest.value();
        outcome.elapsed = clock::now() - start;
        outcome.throughput = outcome.elapsed.count() > 0
                                 ? static_cast<double>(written) / outcome.elapsed.count()
                                 : 0.0;
        outcome.chunks = chunks.value();
        outcome.service = std::string(service.name());
        outcome.url = metadata.url;

        spdlog::info("Downloaded {} ({}) in {:.2f} s, {}/s",
                     artifact.string(),
                     format_bytes(written),
                     outcome.elapsed.count(),
                     format_bytes(static_cast<std::uint64_t>(outcome.throughput)));
        return outcome;
    }
}
