#include <doctest/doctest.h>
#include <fstream>
#include <sstream>
#include <cloudget/fileio.hpp>

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
}

TEST_SUITE("fileio")
{
    TEST_CASE("open")
    {
        std::error_code ec;
        FileIO f("test.txt", FileIO::write_update_binary, ec);

        CHECK_FALSE(ec);
        CHECK(f.open());
        f.write("test", 1, 4);
        f.close(ec);
        CHECK_FALSE(ec);
        CHECK_FALSE(f.open());
        CHECK_EQ(read_all("test.txt"), "test");
        fs::remove("test.txt");
    }

    TEST_CASE("open_missing_directory")
    {
        std::error_code ec;
        FileIO f("no/such/dir/file.txt", FileIO::write_update_binary, ec);
        CHECK(ec);
        CHECK_FALSE(f.open());
    }

    TEST_CASE("truncate_empty")
    {
        std::error_code ec;
        FileIO f("empty.txt", FileIO::append_update_binary, ec);
        CHECK_FALSE(ec);
        CHECK(fs::exists("empty.txt"));
        f.truncate(0, ec);
        CHECK_FALSE(ec);
        f.close(ec);
        fs::remove("empty.txt");
    }

    TEST_CASE("truncate_presizes")
    {
        std::error_code ec;
        {
            FileIO f("sized.bin", FileIO::write_update_binary, ec);
            REQUIRE_FALSE(ec);
            f.truncate(1000, ec);
            CHECK_FALSE(ec);
        }
        CHECK_EQ(fs::file_size("sized.bin"), 1000);
        fs::remove("sized.bin");
    }

    TEST_CASE("write_at")
    {
        std::error_code ec;
        {
            FileIO f("blocks.bin", FileIO::write_update_binary, ec);
            REQUIRE_FALSE(ec);
            f.truncate(9, ec);
            REQUIRE_FALSE(ec);

            // Out of order, as chunks complete
            f.write_at(6, "ghi", 3, ec);
            CHECK_FALSE(ec);
            f.write_at(0, "abc", 3, ec);
            CHECK_FALSE(ec);
            f.write_at(3, "def", 3, ec);
            CHECK_FALSE(ec);

            f.seek(0, SEEK_END);
            CHECK_EQ(f.tell(), 9);
        }
        CHECK_EQ(read_all("blocks.bin"), "abcdefghi");
        fs::remove("blocks.bin");
    }
}
