#include <doctest/doctest.h>

#include <cloudget/context.hpp>
#include <cloudget/service_registry.hpp>
#include <cloudget/services/direct.hpp>
#include <cloudget/services/dropbox.hpp>
#include <cloudget/services/gdrive.hpp>
#include <cloudget/services/wetransfer.hpp>
#include <cloudget/url.hpp>

using namespace cloudget;

TEST_SUITE("dropbox")
{
    TEST_CASE("resolve")
    {
        DropboxService dropbox;
        CHECK_EQ(dropbox.resolve("https://www.dropbox.com/s/abc123/report.pdf?dl=0").value(),
                 "https://www.dropbox.com/s/abc123/report.pdf?dl=1");
        CHECK_EQ(dropbox.resolve("https://www.dropbox.com/s/abc123/report.pdf").value(),
                 "https://www.dropbox.com/s/abc123/report.pdf?dl=1");
        CHECK_EQ(
            dropbox.resolve("https://www.dropbox.com/scl/fi/xyz/data.zip?rlkey=k1&dl=0").value(),
            "https://www.dropbox.com/scl/fi/xyz/data.zip?rlkey=k1&dl=1");
        CHECK_EQ(dropbox.resolve("https://www.dropbox.com/scl/fi/xyz/data.zip?rlkey=k1").value(),
                 "https://www.dropbox.com/scl/fi/xyz/data.zip?rlkey=k1&dl=1");
    }

    TEST_CASE("resolve_unsupported")
    {
        DropboxService dropbox;
        auto res = dropbox.resolve("https://www.dropbox.com/home/folder");
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_UNSUPPORTED_URL);

        CHECK_FALSE(dropbox.resolve("https://example.com/s/abc/file.txt"));
    }

    TEST_CASE("set_dropbox_download_flag")
    {
        CHECK_EQ(set_dropbox_download_flag("https://x.com/s/a/b?dl=0#frag"),
                 "https://x.com/s/a/b?dl=1#frag");
        CHECK_EQ(set_dropbox_download_flag("https://x.com/s/a/b?raw=1"),
                 "https://x.com/s/a/b?raw=1&dl=1");
        CHECK_EQ(set_dropbox_download_flag("https://x.com/s/a/b#frag"),
                 "https://x.com/s/a/b?dl=1#frag");
        CHECK_THROWS_AS(set_dropbox_download_flag("not a url"), std::invalid_argument);
    }

    TEST_CASE("filename")
    {
        DropboxService dropbox;
        CHECK_EQ(dropbox.extract_filename("https://www.dropbox.com/s/abc123/report.pdf?dl=1"),
                 "report.pdf");
        CHECK_EQ(dropbox.extract_filename("https://www.dropbox.com/s/abc123/my%20notes.txt"),
                 "my notes.txt");
        CHECK_EQ(
            dropbox.extract_filename("https://www.dropbox.com/scl/fi/xyz/data.zip?rlkey=k&dl=1"),
            "data.zip");
        CHECK_EQ(dropbox.extract_filename("https://www.dropbox.com/scl/fi/xyz/"),
                 "downloaded_file");
    }
}

TEST_SUITE("gdrive")
{
    TEST_CASE("extract_file_id")
    {
        CHECK_EQ(GoogleDriveService::extract_file_id(
                     "https://drive.google.com/file/d/1AbC_d-E/view?usp=sharing"),
                 "1AbC_d-E");
        CHECK_EQ(GoogleDriveService::extract_file_id("https://drive.google.com/uc?id=XYZ123"),
                 "XYZ123");
        CHECK_EQ(GoogleDriveService::extract_file_id("https://drive.google.com/open?id=Q_w-e"),
                 "Q_w-e");
        CHECK_EQ(GoogleDriveService::extract_file_id(
                     "https://docs.google.com/document/d/DOC42/edit"),
                 "DOC42");
        CHECK_FALSE(GoogleDriveService::extract_file_id("https://drive.google.com/drive/my-drive"));
    }

    TEST_CASE("resolve")
    {
        GoogleDriveService gdrive;
        CHECK_EQ(gdrive.resolve("https://drive.google.com/file/d/FILEID/view").value(),
                 "https://drive.google.com/uc?export=download&id=FILEID&confirm=t");

        auto res = gdrive.resolve("https://drive.google.com/drive/my-drive");
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_UNSUPPORTED_URL);
    }

    TEST_CASE("find_confirmation_url_form")
    {
        const std::string html = R"(<html><body>
<form id="download-form" action="https://drive.usercontent.google.com/download" method="get">
<input type="submit" value="Download anyway"/>
<input type="hidden" name="id" value="FILEID">
<input type="hidden" name="export" value="download">
<input type="hidden" name="confirm" value="t">
<input type="hidden" name="uuid" value="u-1">
</form></body></html>)";

        auto url = GoogleDriveService::find_confirmation_url(html, "FILEID");
        REQUIRE(url);
        CHECK_EQ(*url,
                 "https://drive.usercontent.google.com/download?id=FILEID&export=download"
                 "&confirm=t&uuid=u-1");
    }

    TEST_CASE("find_confirmation_url_token")
    {
        const std::string html
            = R"(<a href="/uc?export=download&amp;confirm=AbC1&amp;id=FILEID">Download</a>)";
        auto url = GoogleDriveService::find_confirmation_url(html, "FILEID");
        REQUIRE(url);
        CHECK_EQ(*url, "https://drive.google.com/uc?export=download&confirm=AbC1&id=FILEID");
    }

    TEST_CASE("find_confirmation_url_none")
    {
        CHECK_FALSE(GoogleDriveService::find_confirmation_url(
            "<html><body>Sorry, you can't view or download this file</body></html>", "FILEID"));
    }

    TEST_CASE("is_interstitial")
    {
        Response file;
        file.headers["content-type"] = "application/octet-stream";
        file.effective_url = "https://drive.usercontent.google.com/download?id=x";
        CHECK_FALSE(GoogleDriveService::is_interstitial(file));

        Response warning;
        warning.headers["content-type"] = "text/html; charset=utf-8";
        CHECK(GoogleDriveService::is_interstitial(warning));

        Response signin;
        signin.effective_url = "https://accounts.google.com/ServiceLogin";
        CHECK(GoogleDriveService::is_interstitial(signin));
    }
}

TEST_SUITE("wetransfer")
{
    TEST_CASE("extract_transfer_id")
    {
        CHECK_EQ(WeTransferService::extract_transfer_id("https://we.tl/AbCd1234"), "AbCd1234");
        CHECK_EQ(WeTransferService::extract_transfer_id(
                     "https://wetransfer.com/downloads/4f9e2a1b/8c7d"),
                 "4f9e2a1b");
        CHECK_FALSE(WeTransferService::extract_transfer_id("https://wetransfer.com/"));
    }

    TEST_CASE("resolve")
    {
        WeTransferService wetransfer;
        CHECK(wetransfer.resolve("https://wetransfer.com/downloads/4f9e2a1b/8c7d"));
        auto res = wetransfer.resolve("https://wetransfer.com/about");
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_UNSUPPORTED_URL);
    }

    TEST_CASE("prepare_reports_transport_errors")
    {
        Context ctx;
        const std::string share = "https://wetransfer.com/downloads/4f9e2a1b/8c7d";

        // Nothing answers at this API base.
        WeTransferService unreachable(path_to_url(fs::absolute("no_such_api_dir")));
        tl::expected<PreparedUrl, DownloaderError> res;
        CHECK_NOTHROW(res = unreachable.prepare(ctx, share));
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_PROBE_FAILED);

        // An API URL libcurl refuses to take.
        WeTransferService oversized("https://api.example.com/" + std::string(9 * 1024 * 1024, 'a'));
        CHECK_NOTHROW(res = oversized.prepare(ctx, share));
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::CG_PROBE_FAILED);
    }

    TEST_CASE("parse_transfer_info")
    {
        auto j = nlohmann::json::parse(R"({
            "id": "4f9e2a1b",
            "security_hash": "8c7d",
            "files": [ { "name": "photos.zip", "size": 123456 } ]
        })");
        auto info = WeTransferService::parse_transfer_info(j);
        REQUIRE(info);
        CHECK_EQ(info->security_hash, "8c7d");
        CHECK_EQ(info->filename, "photos.zip");
        CHECK_EQ(info->size, 123456);

        auto empty = WeTransferService::parse_transfer_info(nlohmann::json::parse(R"({"files": []})"));
        REQUIRE_FALSE(empty);
        CHECK_EQ(empty.error().code, ErrorCode::CG_PROBE_FAILED);
    }

    TEST_CASE("parse_direct_link")
    {
        auto link = WeTransferService::parse_direct_link(
            nlohmann::json::parse(R"({"direct_link": "https://download.wetransfer.com/x"})"));
        REQUIRE(link);
        CHECK_EQ(*link, "https://download.wetransfer.com/x");

        CHECK_FALSE(WeTransferService::parse_direct_link(nlohmann::json::parse(R"({})")));
        CHECK_FALSE(WeTransferService::parse_direct_link(nlohmann::json::parse("[]")));
    }
}

TEST_SUITE("service")
{
    TEST_CASE("content_disposition")
    {
        CHECK_EQ(filename_from_content_disposition(R"(attachment; filename="report.pdf")"),
                 "report.pdf");
        CHECK_EQ(filename_from_content_disposition("attachment; filename=plain.txt"), "plain.txt");
        CHECK_EQ(filename_from_content_disposition(
                     R"(attachment; filename="fallback.txt"; filename*=UTF-8''r%C3%A9sum%C3%A9.txt)"),
                 "r\xC3\xA9sum\xC3\xA9.txt");
        CHECK_FALSE(filename_from_content_disposition("inline"));
    }

    TEST_CASE("sanitize_filename")
    {
        CHECK_EQ(sanitize_filename("report.pdf"), "report.pdf");
        CHECK_EQ(sanitize_filename("../../etc/passwd"), "passwd");
        CHECK_EQ(sanitize_filename("C:\\temp\\x.bin"), "x.bin");
        CHECK_EQ(sanitize_filename("a<b>c?.txt"), "abc.txt");
        CHECK_EQ(sanitize_filename(".."), "");
        CHECK_EQ(sanitize_filename("   "), "");
    }

    TEST_CASE("extract_filename_prefers_headers")
    {
        DirectService direct;
        header_map_type headers;
        headers["content-disposition"] = R"(attachment; filename="../secret.bin")";
        CHECK_EQ(direct.extract_filename("https://example.com/files/other.bin", &headers),
                 "secret.bin");
        CHECK_EQ(direct.extract_filename("https://example.com/files/other.bin"), "other.bin");
        CHECK_EQ(direct.extract_filename("https://example.com/"), "download");
    }

    TEST_CASE("registry")
    {
        ServiceRegistry registry;
        register_default_services(registry);
        REQUIRE_EQ(registry.size(), 4);
        CHECK_EQ(registry.services()[0]->name(), "dropbox");
        CHECK_EQ(registry.services()[3]->name(), "direct");

        CHECK_EQ(registry.find_for_url("https://www.dropbox.com/s/a/b.txt")->name(), "dropbox");
        CHECK_EQ(registry.find_for_url("https://drive.google.com/file/d/x/view")->name(), "gdrive");
        CHECK_EQ(registry.find_for_url("https://we.tl/abc")->name(), "wetransfer");
        CHECK_EQ(registry.find_for_url("https://example.com/file.iso")->name(), "direct");
        CHECK_EQ(registry.find_for_url("file:///tmp/x")->name(), "direct");
        CHECK_FALSE(registry.find_for_url("ftp://example.com/x"));

        CHECK_FALSE(registry.create_unique_service<DirectService>());
        CHECK(registry.has_service("gdrive"));
        CHECK_FALSE(registry.has_service("s3"));
    }
}
