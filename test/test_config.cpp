#include <doctest/doctest.h>
#include <fstream>

#include <cloudget/config.hpp>
#include <cloudget/context.hpp>

using namespace cloudget;

TEST_SUITE("config")
{
    TEST_CASE("load_config_string")
    {
        Context ctx;
        DownloadDefaults defaults;

        auto res = load_config_string(R"(
connections: 12
chunk_size: 4MB
timeout: 60
retries: 5
retry_budget: 20
output_dir: downloads
resume: false
hash_algorithm: SHA1
verbose: true
ssl_verify: false
user_agent: my-agent/1.0
headers:
  - "X-Token: abc"
proxies:
  https: http://proxy:3128
connect_timeout: 10
)",
                                      ctx,
                                      defaults);
        REQUIRE(res);

        CHECK_EQ(defaults.connections, 12);
        CHECK_EQ(defaults.chunk_size, 4 * 1024 * 1024);
        CHECK_EQ(defaults.timeout.count(), 60);
        CHECK_EQ(defaults.retry_budget, 20);
        CHECK_EQ(defaults.output_dir, fs::path("downloads"));
        CHECK_FALSE(defaults.resume);
        CHECK_EQ(defaults.hash_type, ChecksumType::kSHA1);
        CHECK_EQ(defaults.verbosity, 1);

        CHECK_EQ(ctx.max_chunk_attempts, 5);
        CHECK(ctx.disable_ssl);
        CHECK_EQ(ctx.user_agent, "my-agent/1.0");
        REQUIRE_EQ(ctx.additional_httpheaders.size(), 1);
        CHECK_EQ(ctx.additional_httpheaders[0], "X-Token: abc");
        CHECK_EQ(ctx.proxy_map["https"], "http://proxy:3128");
        CHECK_EQ(ctx.connect_timeout, 10);
    }

    TEST_CASE("empty_and_unknown_keys")
    {
        Context ctx;
        DownloadDefaults defaults;
        CHECK(load_config_string("", ctx, defaults));
        CHECK(load_config_string("colour: blue\nverbose: 2\n", ctx, defaults));
        CHECK_EQ(defaults.verbosity, 2);
        CHECK_EQ(defaults.connections, 8);
    }

    TEST_CASE("invalid_values_leave_state_untouched")
    {
        Context ctx;
        DownloadDefaults defaults;

        for (const char* yaml : { "connections: 64\nretries: 9\n",
                                  "retries: 9\nconnections: 0\n",
                                  "retries: 9\nchunk_size: lots\n",
                                  "retries: 9\ntimeout: -5\n",
                                  "retries: 9\nretry_budget: -1\n",
                                  "retries: 9\nhash_algorithm: crc32\n",
                                  "retries: 9\nheaders: X-Token\n",
                                  "retries: 9\nresume: maybe\n",
                                  "- a\n- b\n",
                                  "retries: [9\n" })
        {
            auto res = load_config_string(yaml, ctx, defaults);
            REQUIRE_FALSE(res);
            CHECK_EQ(res.error().code, ErrorCode::CG_CONFIG);
        }

        CHECK_EQ(ctx.max_chunk_attempts, 3);
        CHECK_EQ(defaults.connections, 8);
        CHECK_EQ(defaults.chunk_size, 2 * 1024 * 1024);
    }

    TEST_CASE("load_config_file")
    {
        Context ctx;
        DownloadDefaults defaults;

        auto missing = load_config("no_such_config.yaml", ctx, defaults);
        REQUIRE_FALSE(missing);
        CHECK_EQ(missing.error().code, ErrorCode::CG_CONFIG);

        {
            std::ofstream out("cloudget_test.yaml");
            out << "connections: 4\n";
        }
        REQUIRE(load_config("cloudget_test.yaml", ctx, defaults));
        CHECK_EQ(defaults.connections, 4);
        fs::remove("cloudget_test.yaml");
    }
}
