//
// test_file_content.cpp
//
#include "plasma-backup/file-content.hpp"

#include "test-util.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

using namespace plasma_backup;

TEST_CASE("copyFileContent copies bytes exactly", "[file-content]")
{
    test::TempDir temp;

    // bigger than one read buffer, with embedded zeros
    std::string content;
    for (std::size_t i(0); i < (200 * 1024); ++i)
    {
        content.push_back(static_cast<char>(i % 251));
    }

    test::writeFile(temp / "from.bin", content);

    ErrorCode_t errorCode;
    std::size_t bytesCopied{ 0 };
    copyFileContent(temp / "from.bin", temp / "to.bin", errorCode, bytesCopied);

    REQUIRE(!errorCode);
    REQUIRE(bytesCopied == content.size());
    REQUIRE(test::readFile(temp / "to.bin") == content);
}

TEST_CASE("copyFileContent copies empty files", "[file-content]")
{
    test::TempDir temp;
    test::writeFile(temp / "empty", "");

    ErrorCode_t errorCode;
    std::size_t bytesCopied{ 99 };
    copyFileContent(temp / "empty", temp / "copy", errorCode, bytesCopied);

    REQUIRE(!errorCode);
    REQUIRE(bytesCopied == 0);
    REQUIRE(fs::is_regular_file(temp / "copy"));
}

TEST_CASE("copyFileContent truncates a longer existing destination", "[file-content]")
{
    test::TempDir temp;
    test::writeFile(temp / "from", "short");
    test::writeFile(temp / "to", "this was much longer before");

    ErrorCode_t errorCode;
    std::size_t bytesCopied{ 0 };
    copyFileContent(temp / "from", temp / "to", errorCode, bytesCopied);

    REQUIRE(!errorCode);
    REQUIRE(test::readFile(temp / "to") == "short");
}

TEST_CASE("copyFileContent does not copy permission bits", "[file-content]")
{
    test::TempDir temp;
    test::writeFile(temp / "script.sh", "#!/bin/sh\n");
    fs::permissions(temp / "script.sh", fs::perms::owner_all);

    ErrorCode_t errorCode;
    std::size_t bytesCopied{ 0 };
    copyFileContent(temp / "script.sh", temp / "copy.sh", errorCode, bytesCopied);

    REQUIRE(!errorCode);

    const fs::perms perms{ fs::status(temp / "copy.sh").permissions() };
    REQUIRE((perms & fs::perms::owner_exec) == fs::perms::none);
}

TEST_CASE("copyFileContent reports errors", "[file-content][error]")
{
    test::TempDir temp;

    ErrorCode_t errorCode;
    std::size_t bytesCopied{ 0 };

    SECTION("for a missing source")
    {
        copyFileContent(temp / "missing", temp / "to", errorCode, bytesCopied);

        REQUIRE(errorCode == std::errc::no_such_file_or_directory);
        REQUIRE(bytesCopied == 0);
        REQUIRE(!fs::exists(temp / "to"));
    }

    SECTION("for a destination in a missing directory")
    {
        test::writeFile(temp / "from", "data");
        copyFileContent(temp / "from", temp / "no-dir" / "to", errorCode, bytesCopied);

        REQUIRE(errorCode == std::errc::no_such_file_or_directory);
    }

    SECTION("for a destination that is a directory")
    {
        test::writeFile(temp / "from", "data");
        fs::create_directories(temp / "dir");
        copyFileContent(temp / "from", temp / "dir", errorCode, bytesCopied);

        REQUIRE(errorCode == std::errc::is_a_directory);
    }
}

TEST_CASE("copyFileContent refuses to copy a file onto itself", "[file-content][error]")
{
    test::TempDir temp;
    test::writeFile(temp / "self.txt", "hi");

    ErrorCode_t errorCode;
    std::size_t bytesCopied{ 0 };

    SECTION("by the same path")
    {
        copyFileContent(temp / "self.txt", temp / "self.txt", errorCode, bytesCopied);
    }

    SECTION("by a hard link")
    {
        fs::create_hard_link(temp / "self.txt", temp / "hard.txt");
        copyFileContent(temp / "self.txt", temp / "hard.txt", errorCode, bytesCopied);
    }

    SECTION("by a symlink")
    {
        fs::create_symlink(temp / "self.txt", temp / "soft.txt");
        copyFileContent(temp / "soft.txt", temp / "self.txt", errorCode, bytesCopied);
    }

    REQUIRE(errorCode == std::errc::invalid_argument);
    REQUIRE(bytesCopied == 0);
    REQUIRE(test::readFile(temp / "self.txt") == "hi");
}

TEST_CASE("FileDescriptor closes what it owns", "[file-content]")
{
    test::TempDir temp;
    test::writeFile(temp / "file", "x");

    FileDescriptor fd(::open((temp / "file").c_str(), O_RDONLY));
    REQUIRE(fd.isOpen());

    FileDescriptor moved(std::move(fd));
    REQUIRE(moved.isOpen());
    REQUIRE(!fd.isOpen());

    REQUIRE(moved.close() == 0);
    REQUIRE(!moved.isOpen());

    FileDescriptor none;
    REQUIRE(!none.isOpen());
}
