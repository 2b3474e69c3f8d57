//
// test_entry_classify.cpp
//
#include "plasma-backup/entry.hpp"

#include "test-util.hpp"

#include <catch2/catch.hpp>

#include <sys/stat.h>
#include <sys/types.h>

using namespace plasma_backup;

TEST_CASE("classifyEntry recognizes plain files and directories", "[entry]")
{
    test::TempDir temp;
    test::writeFile(temp / "file.txt", "text");
    fs::create_directories(temp / "dir");

    const Entry fileEntry{ classifyEntry(temp / "file.txt") };
    REQUIRE(fileEntry.kind == EntryKind::RegularFile);
    REQUIRE(fileEntry.isFileLike());
    REQUIRE(fileEntry.target == (temp / "file.txt"));
    REQUIRE(!fileEntry.error_code);

    const Entry dirEntry{ classifyEntry(temp / "dir") };
    REQUIRE(dirEntry.kind == EntryKind::Directory);
    REQUIRE(!dirEntry.isFileLike());
}

TEST_CASE("classifyEntry resolves symlinks without following directories", "[entry][symlink]")
{
    test::TempDir temp;
    test::writeFile(temp / "target.txt", "text");
    fs::create_directories(temp / "target-dir");

    fs::create_symlink(temp / "target.txt", temp / "file-link");
    fs::create_directory_symlink(temp / "target-dir", temp / "dir-link");
    fs::create_symlink(temp / "nothing", temp / "broken-link");

    // a link to a link to a file
    fs::create_symlink(temp / "file-link", temp / "chained-link");

    const Entry fileLink{ classifyEntry(temp / "file-link") };
    REQUIRE(fileLink.kind == EntryKind::SymlinkToFile);
    REQUIRE(fileLink.isFileLike());
    REQUIRE(fileLink.path == (temp / "file-link"));
    REQUIRE(fileLink.target == fs::canonical(temp / "target.txt"));

    const Entry chainedLink{ classifyEntry(temp / "chained-link") };
    REQUIRE(chainedLink.kind == EntryKind::SymlinkToFile);
    REQUIRE(chainedLink.target == fs::canonical(temp / "target.txt"));

    REQUIRE(classifyEntry(temp / "dir-link").kind == EntryKind::SymlinkToDirectory);

    const Entry brokenLink{ classifyEntry(temp / "broken-link") };
    REQUIRE(brokenLink.kind == EntryKind::BrokenSymlink);
    REQUIRE(brokenLink.error_code);
}

TEST_CASE("classifyEntry reports cycles as broken symlinks", "[entry][symlink]")
{
    test::TempDir temp;
    fs::create_symlink(temp / "self", temp / "self");

    const Entry entry{ classifyEntry(temp / "self") };
    REQUIRE(entry.kind == EntryKind::BrokenSymlink);
    REQUIRE(entry.error_code);
}

TEST_CASE("classifyEntry reports missing paths as unreadable", "[entry]")
{
    test::TempDir temp;

    const Entry entry{ classifyEntry(temp / "vanished") };
    REQUIRE(entry.kind == EntryKind::Unreadable);
    REQUIRE(entry.error_code);
}

TEST_CASE("classifyEntry puts special files in other", "[entry]")
{
    test::TempDir temp;
    REQUIRE(::mkfifo((temp / "pipe").c_str(), 0600) == 0);
    fs::create_symlink(temp / "pipe", temp / "pipe-link");

    REQUIRE(classifyEntry(temp / "pipe").kind == EntryKind::Other);
    REQUIRE(classifyEntry(temp / "pipe-link").kind == EntryKind::Other);
}

TEST_CASE("classifyRoot follows symlinks", "[entry][root]")
{
    test::TempDir temp;
    test::writeFile(temp / "target.txt", "text");
    fs::create_directories(temp / "target-dir");
    fs::create_symlink(temp / "target.txt", temp / "file-link");
    fs::create_directory_symlink(temp / "target-dir", temp / "dir-link");
    fs::create_symlink(temp / "nothing", temp / "broken-link");

    REQUIRE(classifyRoot(temp / "file-link").kind == EntryKind::RegularFile);
    REQUIRE(classifyRoot(temp / "dir-link").kind == EntryKind::Directory);
    REQUIRE(classifyRoot(temp / "broken-link").kind == EntryKind::BrokenSymlink);
    REQUIRE(classifyRoot(temp / "target-dir").kind == EntryKind::Directory);
}
