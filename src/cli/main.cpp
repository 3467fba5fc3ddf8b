#include <algorithm>
#include <fstream>
#include <iostream>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cloudget/config.hpp>
#include <cloudget/context.hpp>
#include <cloudget/download.hpp>
#include <cloudget/utils.hpp>

using namespace cloudget;

struct
{
    std::uint64_t last_done = 0;
    std::chrono::steady_clock::time_point last_draw;
} global_progress;

static bool show_progress_bars = true;

void
progress_callback(std::uint64_t done, std::uint64_t total)
{
    if (!show_progress_bars || done == 0)
        return;

    // Redraw at most 10 times per second, and always on completion.
    auto now = std::chrono::steady_clock::now();
    if (done != total && now - global_progress.last_draw < std::chrono::milliseconds(100))
        return;
    global_progress.last_draw = now;
    global_progress.last_done = done;

    // Drawn on stderr, stdout only carries the results.
    std::cerr << "\r" << progress_bar(done, total) << "   ";
    std::cerr.flush();
}

void
end_progress()
{
    if (show_progress_bars && global_progress.last_done > 0)
        std::cerr << std::endl;
    global_progress.last_done = 0;
}

std::vector<std::string>
read_url_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw std::runtime_error(fmt::format("Could not open URL file {}", path));
    }

    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line))
    {
        line = strip(line);
        if (line.empty() || starts_with(line, "#"))
            continue;
        urls.push_back(line);
    }
    return urls;
}

struct Summary
{
    std::size_t ok = 0;
    std::size_t failed = 0;
    std::uint64_t bytes = 0;
    std::chrono::duration<double> elapsed{ 0 };
};

int
handle_download(const Context& ctx,
                const std::vector<std::string>& urls,
                const DownloadRequest& base_request,
                bool quiet)
{
    Summary summary;
    const auto start = std::chrono::steady_clock::now();

    for (std::size_t i = 0; i < urls.size(); ++i)
    {
        DownloadRequest request = base_request;
        request.url = urls[i];
        // An explicit output path or filename only makes sense for one URL.
        if (urls.size() > 1 && (request.output_path || request.filename))
        {
            if (i == 0)
                spdlog::warn("Ignoring output file name for multiple URLs");
            request.output_path = std::nullopt;
            request.filename = std::nullopt;
        }

        if (!quiet)
            std::cout << fmt::format("[{}/{}] {}", i + 1, urls.size(), request.url) << std::endl;

        auto result = download(ctx, request);
        end_progress();

        if (!result)
        {
            summary.failed++;
            std::cerr << fmt::format("  FAILED {}", result.error().message()) << std::endl;
            if (result.error().code == ErrorCode::CG_INTERRUPTED)
                break;
            continue;
        }

        const DownloadOutcome& outcome = result.value();
        summary.ok++;
        summary.bytes += outcome.reused ? 0 : outcome.size;
        if (!quiet)
        {
            if (outcome.reused)
            {
                std::cout << fmt::format("  OK {} (already present, {})",
                                         outcome.path.string(),
                                         format_bytes(outcome.size))
                          << std::endl;
            }
            else
            {
                std::cout << fmt::format("  OK {} ({}, {} chunk{}, {:.1f} s, {}/s)",
                                         outcome.path.string(),
                                         format_bytes(outcome.size),
                                         outcome.chunks,
                                         outcome.chunks == 1 ? "" : "s",
                                         outcome.elapsed.count(),
                                         format_bytes(static_cast<std::uint64_t>(outcome.throughput)))
                          << std::endl;
            }
            if (outcome.checksum)
            {
                std::cout << fmt::format("  {}", *outcome.checksum) << std::endl;
            }
        }
    }

    summary.elapsed = std::chrono::steady_clock::now() - start;
    if (!quiet && urls.size() > 1)
    {
        const double speed = summary.elapsed.count() > 0
                                 ? static_cast<double>(summary.bytes) / summary.elapsed.count()
                                 : 0.0;
        std::cout << fmt::format("{} downloaded, {} failed, {} in {:.1f} s ({}/s)",
                                 summary.ok,
                                 summary.failed,
                                 format_bytes(summary.bytes),
                                 summary.elapsed.count(),
                                 format_bytes(static_cast<std::uint64_t>(speed)))
                  << std::endl;
    }

    return summary.failed == 0 ? 0 : 1;
}

int
main(int argc, char** argv)
{
    CLI::App app{ "cloudget: parallel downloads from cloud share links" };

    std::vector<std::string> urls, url_list;
    std::string url_file, config_file, outdir, outfile, filename, chunk_size, verify_hash,
        hash_algorithm, service;
    std::optional<std::size_t> connections, retries, retry_budget;
    std::optional<long> timeout;
    bool resume = false, no_resume = false;
    bool disable_ssl = false, verbose = false, quiet = false, no_progress = false;
    bool list_services = false;

    app.add_option("urls", urls, "Share links to download");
    app.add_option("--urls", url_list, "Comma separated share links")->delimiter(',');
    app.add_option("--url-file", url_file, "File with one share link per line");
    app.add_option("-d,--output-dir", outdir, "Output directory");
    app.add_option("-o,--output", outfile, "Output file");
    app.add_option("--filename", filename, "Override the file name");
    app.add_option("-c,--connections", connections, "Parallel connections")
        ->check(CLI::Range(min_connections, max_connections));
    app.add_option("--chunk-size", chunk_size, "Chunk size, e.g. 2MB");
    app.add_option("--timeout", timeout, "Overall timeout in seconds")->check(CLI::PositiveNumber);
    app.add_option("--retries", retries, "Attempts per chunk")->check(CLI::PositiveNumber);
    app.add_option("--retry-budget", retry_budget, "Total chunk retries, 0 for unlimited");
    auto* resume_flag = app.add_flag("-r,--resume", resume, "Keep a resume file while downloading");
    app.add_flag("--no-resume", no_resume, "Do not keep a resume file")->excludes(resume_flag);
    app.add_option("--verify-hash", verify_hash, "Expected checksum (hex)");
    app.add_option("--hash-algorithm", hash_algorithm, "sha256, sha1, sha512 or md5")
        ->check(CLI::IsMember({ "sha256", "sha1", "sha512", "md5" }, CLI::ignore_case));
    app.add_option("-f,--config", config_file, "YAML configuration file");
    app.add_option("--service", service, "Use this service instead of detecting it");
    app.add_flag("-k", disable_ssl, "Disable SSL verification");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Only print errors");
    app.add_flag("--no-progress", no_progress, "Do not show progress bars");
    app.add_flag("--list-services", list_services, "List supported services and exit");

    CLI11_PARSE(app, argc, argv);

    cloudget::Context ctx;
    DownloadDefaults defaults;

    std::optional<fs::path> config_path;
    if (!config_file.empty())
        config_path = config_file;
    else
        config_path = default_config_path();

    if (config_path)
    {
        auto loaded = load_config(*config_path, ctx, defaults);
        if (!loaded)
        {
            std::cerr << loaded.error().message() << std::endl;
            return 1;
        }
    }

    ctx.set_verbosity(verbose ? std::max(defaults.verbosity, 1) : defaults.verbosity);
    if (quiet)
        ctx.set_log_level(spdlog::level::err);
    show_progress_bars = !(no_progress || quiet || verbose);
    if (disable_ssl)
        ctx.disable_ssl = true;
    if (retries)
        ctx.max_chunk_attempts = *retries;

    if (list_services)
    {
        std::cout << ctx.services.to_string();
        return 0;
    }

    urls.insert(urls.end(), url_list.begin(), url_list.end());
    if (!url_file.empty())
    {
        try
        {
            auto from_file = read_url_file(url_file);
            urls.insert(urls.end(), from_file.begin(), from_file.end());
        }
        catch (const std::runtime_error& e)
        {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }

    if (urls.empty())
    {
        std::cerr << "No URL given" << std::endl << app.help();
        return 1;
    }

    DownloadRequest request;
    request.output_dir = outdir.empty() ? defaults.output_dir : fs::path(outdir);
    if (!outfile.empty())
        request.output_path = fs::path(outfile);
    if (!filename.empty())
        request.filename = filename;
    request.connections = connections.value_or(defaults.connections);
    request.chunk_size = defaults.chunk_size;
    if (!chunk_size.empty())
    {
        auto size = parse_size(chunk_size);
        if (!size || *size == 0)
        {
            std::cerr << fmt::format("Invalid chunk size '{}'", chunk_size) << std::endl;
            return 1;
        }
        request.chunk_size = static_cast<std::int64_t>(*size);
    }
    request.timeout = timeout ? std::chrono::seconds(*timeout) : defaults.timeout;
    request.retry_budget = retry_budget.value_or(defaults.retry_budget);
    request.resume = no_resume ? false : (resume || defaults.resume);

    ChecksumType hash_type = defaults.hash_type;
    if (!hash_algorithm.empty())
        hash_type = parse_checksum_type(hash_algorithm).value_or(hash_type);
    if (!verify_hash.empty())
        request.expected_checksum = Checksum{ hash_type, verify_hash };
    else if (!hash_algorithm.empty())
        request.report_checksum = hash_type;

    if (!service.empty())
    {
        if (!ctx.services.has_service(service))
        {
            std::cerr << fmt::format("Unknown service '{}', known services:\n{}",
                                     service,
                                     ctx.services.to_string());
            return 1;
        }
        request.service = service;
    }
    request.progress = progress_callback;

    install_interrupt_handler();
    return handle_download(ctx, urls, request, quiet);
}
