#include <doctest/doctest.h>

#include <cloudget/chunk_target.hpp>
#include <cloudget/context.hpp>
#include <cloudget/reassembler.hpp>

using namespace cloudget;

namespace
{
    const std::string url = "https://example.com/file.bin";

    void feed(ChunkTarget& target, std::string data)
    {
        ChunkTarget::write_callback(data.data(), 1, data.size(), &target);
    }
}

TEST_SUITE("chunk_target")
{
    TEST_CASE("complete_range")
    {
        Context ctx;
        ChunkTarget target(ctx, url, ChunkRange{ 0, 0, 9 }, false);
        feed(target, "01234");
        feed(target, "56789");
        CHECK_EQ(target.bytes_received(), 10);
        CHECK(target.check_finished_transfer_status(CURLE_OK, 206));

        auto result = target.take_result();
        CHECK_EQ(result.index, 0);
        CHECK_EQ(result.offset, 0);
        CHECK_EQ(std::string(result.payload.begin(), result.payload.end()), "0123456789");
    }

    TEST_CASE("short_read_is_transient")
    {
        Context ctx;
        ChunkTarget target(ctx, url, ChunkRange{ 0, 0, 9 }, false);
        feed(target, "0123");
        auto res = target.check_finished_transfer_status(CURLE_OK, 206);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().level, ErrorLevel::INFO);
        CHECK_EQ(res.error().code, ErrorCode::CG_BADSTATUS);
        CHECK_EQ(res.error().chunk_index, 0);
    }

    TEST_CASE("first_range_keeps_prefix_of_full_answer")
    {
        Context ctx;
        ChunkTarget target(ctx, url, ChunkRange{ 0, 0, 3 }, false);
        std::string body = "abcdefgh";
        // The prefix is kept, then the transfer is stopped.
        CHECK_EQ(ChunkTarget::write_callback(body.data(), 1, body.size(), &target), 0);
        CHECK(target.check_finished_transfer_status(CURLE_WRITE_ERROR, 200));

        auto result = target.take_result();
        CHECK_EQ(std::string(result.payload.begin(), result.payload.end()), "abcd");
    }

    TEST_CASE("overflow_of_later_range_is_fatal")
    {
        Context ctx;
        ChunkTarget target(ctx, url, ChunkRange{ 1, 4, 7 }, false);
        std::string body = "efghijkl";
        CHECK_EQ(ChunkTarget::write_callback(body.data(), 1, body.size(), &target), 0);
        auto res = target.check_finished_transfer_status(CURLE_WRITE_ERROR, 206);
        REQUIRE_FALSE(res);
        CHECK(res.error().is_fatal());
        CHECK_EQ(res.error().code, ErrorCode::CG_BADSTATUS);
    }

    TEST_CASE("error_page_longer_than_range_is_transient")
    {
        Context ctx;
        ctx.max_chunk_attempts = 3;

        // A two byte tail range answered with an error page.
        ChunkTarget tail(ctx, url, ChunkRange{ 3, 30, 31 }, true);
        std::string body = "<html>503 Service Unavailable</html>";
        CHECK_EQ(ChunkTarget::write_callback(body.data(), 1, body.size(), &tail), 0);

        auto res = tail.check_finished_transfer_status(CURLE_WRITE_ERROR, 503);
        REQUIRE_FALSE(res);
        CHECK_FALSE(res.error().is_fatal());
        CHECK_EQ(res.error().level, ErrorLevel::INFO);
        CHECK_EQ(res.error().code, ErrorCode::CG_BADSTATUS);
        CHECK_EQ(res.error().chunk_index, 3);
        CHECK(tail.set_retrying(res.error()));
        CHECK_EQ(tail.bytes_received(), 0);

        // The same page for the first range is transient as well.
        ChunkTarget head(ctx, url, ChunkRange{ 0, 0, 1 }, false);
        CHECK_EQ(ChunkTarget::write_callback(body.data(), 1, body.size(), &head), 0);
        auto head_res = head.check_finished_transfer_status(CURLE_WRITE_ERROR, 503);
        REQUIRE_FALSE(head_res);
        CHECK_FALSE(head_res.error().is_fatal());
    }

    TEST_CASE("server_errors_are_transient")
    {
        Context ctx;
        ChunkTarget target(ctx, url, ChunkRange{ 0, 0, 9 }, false);
        for (long status : { 500L, 502L, 503L, 429L, 404L })
        {
            auto res = target.check_finished_transfer_status(CURLE_OK, status);
            REQUIRE_FALSE(res);
            CHECK_EQ(res.error().level, ErrorLevel::INFO);
            CHECK_EQ(res.error().code, ErrorCode::CG_BADSTATUS);
        }
    }

    TEST_CASE("curl_errors")
    {
        Context ctx;
        ChunkTarget target(ctx, url, ChunkRange{ 0, 0, 9 }, false);

        auto timeout = target.check_finished_transfer_status(CURLE_OPERATION_TIMEDOUT, 0);
        REQUIRE_FALSE(timeout);
        CHECK_EQ(timeout.error().level, ErrorLevel::SERIOUS);
        CHECK_EQ(timeout.error().code, ErrorCode::CG_TIMEOUT);

        auto reset = target.check_finished_transfer_status(CURLE_RECV_ERROR, 0);
        REQUIRE_FALSE(reset);
        CHECK_EQ(reset.error().level, ErrorLevel::INFO);
        CHECK_EQ(reset.error().code, ErrorCode::CG_CURL);

        auto aborted = target.check_finished_transfer_status(CURLE_ABORTED_BY_CALLBACK, 0);
        REQUIRE_FALSE(aborted);
        CHECK(aborted.error().is_fatal());
    }

    TEST_CASE("range_not_satisfiable")
    {
        Context ctx;

        ChunkTarget final_chunk(ctx, url, ChunkRange{ 2, 20, 29 }, true);
        CHECK(final_chunk.check_finished_transfer_status(CURLE_OK, 416));
        CHECK(final_chunk.unsatisfiable());
        CHECK(final_chunk.take_result().payload.empty());

        ChunkTarget middle_chunk(ctx, url, ChunkRange{ 1, 10, 19 }, false);
        auto res = middle_chunk.check_finished_transfer_status(CURLE_OK, 416);
        REQUIRE_FALSE(res);
        CHECK(res.error().is_fatal());
        CHECK_EQ(res.error().chunk_index, 1);
    }

    TEST_CASE("range_not_satisfiable_for_whole_file")
    {
        Context ctx;
        Reassembler stream("unsatisfiable_stream.bin", 0);
        REQUIRE(stream.open());

        ChunkTarget target(ctx, url, stream);
        auto res = target.check_finished_transfer_status(CURLE_OK, 416);
        REQUIRE_FALSE(res);
        CHECK(res.error().is_fatal());
        CHECK_FALSE(target.unsatisfiable());
        CHECK_FALSE(target.set_retrying(res.error()));
        CHECK_EQ(target.terminal_error(res.error()).code, ErrorCode::CG_CHUNK_FETCH_FAILED);
        stream.discard();
    }

    TEST_CASE("file_url_has_no_status")
    {
        Context ctx;
        ChunkTarget target(ctx, "file:///tmp/x.bin", ChunkRange{ 0, 0, 1 }, false);
        feed(target, "ab");
        CHECK(target.check_finished_transfer_status(CURLE_OK, 0));

        ChunkTarget http(ctx, url, ChunkRange{ 0, 0, 1 }, false);
        feed(http, "ab");
        CHECK_FALSE(http.check_finished_transfer_status(CURLE_OK, 0));
    }

    TEST_CASE("retry_delay")
    {
        Context ctx;
        ctx.retry_backoff_min = std::chrono::seconds(1);
        ctx.retry_backoff_max = std::chrono::seconds(10);
        ctx.retry_backoff_factor = 2;

        ChunkTarget target(ctx, url, ChunkRange{ 0, 0, 9 }, false);
        CHECK_EQ(target.retry_delay(1).count(), 1000);
        CHECK_EQ(target.retry_delay(2).count(), 2000);
        CHECK_EQ(target.retry_delay(3).count(), 4000);
        CHECK_EQ(target.retry_delay(4).count(), 8000);
        CHECK_EQ(target.retry_delay(5).count(), 10000);
        CHECK_EQ(target.retry_delay(40).count(), 10000);
    }

    TEST_CASE("attempts_exhausted")
    {
        Context ctx;
        ctx.max_chunk_attempts = 3;
        ctx.retry_backoff_min = std::chrono::milliseconds(1);
        ctx.retry_backoff_max = std::chrono::milliseconds(1);

        CURLM* multi = curl_multi_init();
        REQUIRE(multi != nullptr);

        ChunkTarget target(ctx, url, ChunkRange{ 3, 30, 39 }, false);
        const DownloaderError transient{ ErrorLevel::INFO, ErrorCode::CG_BADSTATUS, "503" };

        for (std::size_t attempt = 1; attempt <= 3; ++attempt)
        {
            REQUIRE(target.prepare_for_transfer(multi));
            CHECK_EQ(target.attempts(), attempt);
            CHECK_EQ(target.state(), DownloadState::kRUNNING);
            target.reset(multi);
            CHECK_EQ(target.set_retrying(transient), attempt < 3);
        }

        auto error = target.terminal_error(transient);
        CHECK_EQ(error.code, ErrorCode::CG_CHUNK_FETCH_FAILED);
        CHECK_EQ(error.chunk_index, 3);
        CHECK(error.is_fatal());

        curl_multi_cleanup(multi);
    }

    TEST_CASE("fatal_is_not_retried")
    {
        Context ctx;
        ChunkTarget target(ctx, url, ChunkRange{ 0, 0, 9 }, false);
        CHECK_FALSE(target.set_retrying(
            DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_BADSTATUS, "416" }));
        CHECK(target.set_retrying(
            DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::CG_TIMEOUT, "timeout" }));
        CHECK_EQ(target.state(), DownloadState::kWAITING);
    }

    TEST_CASE("terminal_error_keeps_file_errors")
    {
        Context ctx;
        ChunkTarget target(ctx, url, ChunkRange{ 5, 50, 59 }, false);
        auto error = target.terminal_error(
            DownloaderError{ ErrorLevel::FATAL, ErrorCode::CG_FILE, "disk full" });
        CHECK_EQ(error.code, ErrorCode::CG_FILE);
        CHECK_EQ(error.chunk_index, 5);
    }

    TEST_CASE("stream_target")
    {
        Context ctx;
        Reassembler stream("stream_target.bin", 0);
        REQUIRE(stream.open());

        ChunkTarget target(ctx, url, stream);
        CHECK_FALSE(target.is_ranged());
        feed(target, "streamed");
        CHECK_EQ(stream.bytes_written(), 8);
        CHECK(target.check_finished_transfer_status(CURLE_OK, 200));

        // a retried stream starts from scratch
        CHECK(target.set_retrying(DownloaderError{ ErrorLevel::INFO, ErrorCode::CG_CURL, "reset" }));
        CHECK_EQ(stream.bytes_written(), 0);
        stream.discard();
    }
}
