#include <doctest/doctest.h>
#include <fstream>
#include <sstream>

#include <cloudget/context.hpp>
#include <cloudget/download.hpp>
#include <cloudget/url.hpp>
#include <cloudget/utils.hpp>

using namespace cloudget;

namespace
{
    std::string read_all(const fs::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    // Deterministic, non repeating content so misplaced chunks are detected.
    fs::path make_source(const fs::path& path, std::size_t size)
    {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        std::uint32_t state = 2463534242u;
        for (std::size_t i = 0; i < size; ++i)
        {
            state ^= state << 13;
            state ^= state >> 17;
            state ^= state << 5;
            out.put(static_cast<char>(state & 0xff));
        }
        return path;
    }

    struct Fixture
    {
        fs::path root = fs::absolute("download_test");
        fs::path source;
        fs::path outdir;

        explicit Fixture(std::size_t size)
        {
            fs::remove_all(root);
            source = make_source(root / "remote" / "payload.bin", size);
            outdir = root / "out";
        }

        ~Fixture()
        {
            std::error_code ec;
            fs::remove_all(root, ec);
        }

        DownloadRequest request() const
        {
            DownloadRequest req;
            req.url = path_to_url(source);
            req.output_dir = outdir;
            req.connections = 4;
            req.chunk_size = 16 * 1024;
            return req;
        }
    };
}

TEST_SUITE("download")
{
    TEST_CASE("multi_chunk")
    {
        Context ctx;
        Fixture fixture(100 * 1000);

        std::uint64_t last_done = 0, last_total = 0;
        DownloadRequest request = fixture.request();
        request.expected_checksum = Checksum{ ChecksumType::kSHA256, sha256sum(fixture.source) };
        request.progress = [&](std::uint64_t done, std::uint64_t total)
        {
            last_done = done;
            last_total = total;
        };

        auto res = download(ctx, request);
        REQUIRE(res);
        const DownloadOutcome& outcome = res.value();

        const fs::path artifact = fixture.outdir / "payload.bin";
        CHECK_EQ(outcome.path, artifact);
        CHECK_EQ(outcome.size, 100 * 1000);
        CHECK_EQ(outcome.chunks, 7);
        CHECK_FALSE(outcome.reused);
        CHECK_EQ(outcome.service, "direct");
        REQUIRE(outcome.checksum);
        CHECK_EQ(*outcome.checksum, request.expected_checksum->checksum);

        CHECK_EQ(read_all(artifact), read_all(fixture.source));
        CHECK_FALSE(fs::exists(fixture.outdir / "payload.bin.cgpart"));
        CHECK_FALSE(fs::exists(fixture.outdir / "payload.bin.resume"));

        CHECK_EQ(last_done, 100 * 1000);
        CHECK_EQ(last_total, 100 * 1000);
    }

    TEST_CASE("single_stream")
    {
        Context ctx;
        Fixture fixture(5000);

        DownloadRequest request = fixture.request();
        request.chunk_size = 1024 * 1024;
        request.report_checksum = ChecksumType::kSHA256;

        auto res = download(ctx, request);
        REQUIRE(res);
        CHECK_EQ(res->chunks, 1);
        CHECK_EQ(res->size, 5000);
        REQUIRE(res->checksum);
        CHECK_EQ(*res->checksum, sha256sum(fixture.source));
        CHECK_EQ(read_all(res->path), read_all(fixture.source));
    }

    TEST_CASE("existing_file_is_reused")
    {
        Context ctx;
        Fixture fixture(40 * 1000);

        DownloadRequest request = fixture.request();
        request.expected_checksum = Checksum{ ChecksumType::kSHA256, sha256sum(fixture.source) };

        auto first = download(ctx, request);
        REQUIRE(first);
        CHECK_FALSE(first->reused);

        auto second = download(ctx, request);
        REQUIRE(second);
        CHECK(second->reused);
        CHECK_EQ(second->path, first->path);
        CHECK_EQ(second->size, first->size);

        // Known destination and checksum: no probe needed, even with the source gone.
        request.output_path = first->path;
        fs::remove(fixture.source);
        auto third = download(ctx, request);
        REQUIRE(third);
        CHECK(third->reused);
    }

    TEST_CASE("output_path_and_filename")
    {
        Context ctx;
        Fixture fixture(20 * 1000);

        DownloadRequest request = fixture.request();
        request.filename = "renamed.bin";
        auto renamed = download(ctx, request);
        REQUIRE(renamed);
        CHECK_EQ(renamed->path, fixture.outdir / "renamed.bin");

        request.output_path = fixture.root / "nested" / "dir" / "explicit.bin";
        auto explicit_path = download(ctx, request);
        REQUIRE(explicit_path);
        CHECK_EQ(explicit_path->path, fixture.root / "nested" / "dir" / "explicit.bin");
        CHECK(fs::exists(explicit_path->path));
    }

    TEST_CASE("hash_mismatch")
    {
        Context ctx;
        Fixture fixture(50 * 1000);

        DownloadRequest request = fixture.request();
        request.expected_checksum = Checksum{ ChecksumType::kSHA256, std::string(64, 'a') };

        auto res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_HASH_MISMATCH);
        CHECK_FALSE(fs::exists(fixture.outdir / "payload.bin"));
        CHECK_FALSE(fs::exists(fixture.outdir / "payload.bin.cgpart"));
    }

    TEST_CASE("failed_chunk_removes_partial_file")
    {
        Context ctx;
        ctx.retry_backoff_min = std::chrono::milliseconds(10);
        ctx.retry_backoff_max = std::chrono::milliseconds(10);
        Fixture fixture(100 * 1000);

        DownloadRequest request = fixture.request();
        request.connections = 1;

        // The source goes away once the first chunk has landed.
        const fs::path moved = fixture.root / "remote" / "moved.bin";
        request.progress = [&](std::uint64_t, std::uint64_t)
        {
            if (fs::exists(fixture.source))
                fs::rename(fixture.source, moved);
        };

        auto res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_CHUNK_FETCH_FAILED);
        REQUIRE(res.error().chunk_index);
        CHECK_GE(*res.error().chunk_index, 1);
        CHECK_FALSE(fs::exists(fixture.outdir / "payload.bin"));
        CHECK_FALSE(fs::exists(fixture.outdir / "payload.bin.cgpart"));
    }

    TEST_CASE("missing_source")
    {
        Context ctx;
        Fixture fixture(10);

        DownloadRequest request = fixture.request();
        request.url = path_to_url(fixture.root / "remote" / "nothing_here.bin");

        auto res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_PROBE_FAILED);
        CHECK_FALSE(fs::exists(fixture.outdir / "nothing_here.bin"));
    }

    TEST_CASE("invalid_requests")
    {
        Context ctx;
        Fixture fixture(10);

        DownloadRequest request = fixture.request();
        request.connections = 0;
        auto res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_BADFUNCARG);

        request.connections = max_connections + 1;
        res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_BADFUNCARG);

        request = fixture.request();
        request.chunk_size = 0;
        res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_BADFUNCARG);

        request = fixture.request();
        request.url.clear();
        res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_BADFUNCARG);
    }

    TEST_CASE("unsupported")
    {
        Context ctx;
        Fixture fixture(10);

        DownloadRequest request = fixture.request();
        request.service = "s3";
        auto res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_UNSUPPORTED_URL);

        request = fixture.request();
        request.url = "ftp://example.com/file.bin";
        res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_UNSUPPORTED_URL);

        request.url = "https://www.dropbox.com/home/not-a-share";
        res = download(ctx, request);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_UNSUPPORTED_URL);
    }
}
