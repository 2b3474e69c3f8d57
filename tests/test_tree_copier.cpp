//
// test_tree_copier.cpp
//
#include "plasma-backup/copy-error.hpp"
#include "plasma-backup/tree-copier.hpp"

#include "test-util.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>

using namespace plasma_backup;

namespace
{
    std::size_t countOutcomes(const std::vector<CopyOutcome> & outcomes, const Outcome outcome)
    {
        return static_cast<std::size_t>(std::count_if(
            std::begin(outcomes), std::end(outcomes), [outcome](const CopyOutcome & co) {
                return (co.outcome == outcome);
            }));
    }

    const CopyOutcome * findBySource(
        const std::vector<CopyOutcome> & outcomes, const fs::path & source)
    {
        const auto iter{ std::find_if(
            std::begin(outcomes), std::end(outcomes), [&source](const CopyOutcome & co) {
                return (co.source == source);
            }) };

        return ((iter == std::end(outcomes)) ? nullptr : &*iter);
    }
} // namespace

TEST_CASE("TreeCopier copies every regular file in a nested tree", "[tree-copier]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    test::writeFile(src / "a.txt", "alpha");
    test::writeFile(src / "sub" / "b.txt", "bravo!");
    test::writeFile(src / "sub" / "deep" / "c.txt", "");
    fs::create_directories(src / "empty");

    const std::vector<CopyOutcome> outcomes{ copyTree(src, dst, true) };

    REQUIRE(outcomes.size() == 3);
    REQUIRE(countOutcomes(outcomes, Outcome::Copied) == 3);

    REQUIRE(test::readFile(dst / "a.txt") == "alpha");
    REQUIRE(test::readFile(dst / "sub" / "b.txt") == "bravo!");
    REQUIRE(fs::is_regular_file(dst / "sub" / "deep" / "c.txt"));
    REQUIRE(fs::file_size(dst / "sub" / "deep" / "c.txt") == 0);
    REQUIRE(fs::is_directory(dst / "empty"));

    const CopyOutcome * const outcomePtr{ findBySource(outcomes, src / "sub" / "b.txt") };
    REQUIRE(outcomePtr != nullptr);
    REQUIRE(outcomePtr->destination == (dst / "sub" / "b.txt"));
    REQUIRE(outcomePtr->bytes == 6);
    REQUIRE(outcomePtr->error_kind == ErrorKind::None);
    REQUIRE(!outcomePtr->error_code);
}

TEST_CASE("TreeCopier produces outcomes one at a time", "[tree-copier]")
{
    test::TempDir temp;
    test::writeFile(temp / "src" / "one.txt", "1");
    test::writeFile(temp / "src" / "two.txt", "2");

    TreeCopier copier(temp / "src", temp / "dst", true);
    REQUIRE(!copier.isFinished());

    CopyOutcome outcome;
    REQUIRE(copier.next(outcome));
    REQUIRE(outcome.outcome == Outcome::Copied);
    REQUIRE(!copier.isFinished());

    REQUIRE(copier.next(outcome));
    REQUIRE(!copier.next(outcome));
    REQUIRE(copier.isFinished());
    REQUIRE(!copier.didRootFail());
    REQUIRE(!copier.wasCancelled());

    // stays finished
    REQUIRE(!copier.next(outcome));
}

TEST_CASE("TreeCopier skips broken symlinks", "[tree-copier][symlink]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    fs::create_directories(src);
    fs::create_symlink(src / "does-not-exist", src / "dangling");

    SECTION("with errors ignored")
    {
        const std::vector<CopyOutcome> outcomes{ copyTree(src, dst, true) };

        REQUIRE(outcomes.size() == 1);
        REQUIRE(outcomes.front().outcome == Outcome::SkippedBrokenSymlink);
        REQUIRE(outcomes.front().error_kind == ErrorKind::SymlinkResolutionFailure);
        REQUIRE(outcomes.front().source == (src / "dangling"));
        REQUIRE(!fs::exists(fs::symlink_status(dst / "dangling")));
    }

    SECTION("and still only skips them when stopping on errors")
    {
        std::vector<CopyOutcome> outcomes;
        REQUIRE_NOTHROW(outcomes = copyTree(src, dst, false));
        REQUIRE(countOutcomes(outcomes, Outcome::SkippedBrokenSymlink) == 1);
    }
}

TEST_CASE("TreeCopier treats a symlink cycle as a broken symlink", "[tree-copier][symlink]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };

    fs::create_directories(src);
    fs::create_symlink(src / "ping", src / "pong");
    fs::create_symlink(src / "pong", src / "ping");

    const std::vector<CopyOutcome> outcomes{ copyTree(src, temp / "dst", true) };

    REQUIRE(outcomes.size() == 2);
    REQUIRE(countOutcomes(outcomes, Outcome::SkippedBrokenSymlink) == 2);
}

TEST_CASE("TreeCopier never follows directory symlinks", "[tree-copier][symlink]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    test::writeFile(temp / "elsewhere" / "secret.txt", "not copied");
    fs::create_directories(src);
    fs::create_directory_symlink(temp / "elsewhere", src / "linked-dir");

    // a link back up the tree would recurse forever if it were followed
    fs::create_directory_symlink(src, src / "loop");

    const std::vector<CopyOutcome> outcomes{ copyTree(src, dst, true) };

    REQUIRE(outcomes.size() == 2);
    REQUIRE(countOutcomes(outcomes, Outcome::SkippedDirectorySymlink) == 2);
    REQUIRE(!fs::exists(fs::symlink_status(dst / "linked-dir")));
    REQUIRE(!fs::exists(fs::symlink_status(dst / "loop")));

    const CopyOutcome * const outcomePtr{ findBySource(outcomes, src / "linked-dir") };
    REQUIRE(outcomePtr != nullptr);
    REQUIRE(outcomePtr->error_kind == ErrorKind::None);
}

TEST_CASE("TreeCopier copies what a file symlink points at", "[tree-copier][symlink]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    test::writeFile(temp / "real.conf", "key=value\n");
    fs::create_directories(src);
    fs::create_symlink(temp / "real.conf", src / "linked.conf");

    const std::vector<CopyOutcome> outcomes{ copyTree(src, dst, true) };

    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes.front().outcome == Outcome::Copied);
    REQUIRE(outcomes.front().source == (src / "linked.conf"));
    REQUIRE(outcomes.front().bytes == 10);

    REQUIRE(!fs::is_symlink(dst / "linked.conf"));
    REQUIRE(fs::is_regular_file(dst / "linked.conf"));
    REQUIRE(test::readFile(dst / "linked.conf") == "key=value\n");
}

TEST_CASE("TreeCopier ignores fifos without an outcome", "[tree-copier]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    test::writeFile(src / "plain.txt", "x");
    REQUIRE(::mkfifo((src / "pipe").c_str(), 0600) == 0);

    const std::vector<CopyOutcome> outcomes{ copyTree(src, dst, true) };

    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes.front().source == (src / "plain.txt"));
    REQUIRE(!fs::exists(fs::symlink_status(dst / "pipe")));
}

TEST_CASE("TreeCopier merges into an existing destination", "[tree-copier]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    test::writeFile(src / "shared.txt", "new");
    test::writeFile(dst / "shared.txt", "old and longer");
    test::writeFile(dst / "extra.txt", "keep me");
    test::writeFile(dst / "sub" / "extra.txt", "keep me too");

    const std::vector<CopyOutcome> outcomes{ copyTree(src, dst, true) };

    REQUIRE(outcomes.size() == 1);
    REQUIRE(test::readFile(dst / "shared.txt") == "new");
    REQUIRE(test::readFile(dst / "extra.txt") == "keep me");
    REQUIRE(test::readFile(dst / "sub" / "extra.txt") == "keep me too");
}

TEST_CASE("TreeCopier copying twice keeps files only the destination has", "[tree-copier]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    test::writeFile(src / "a.txt", "first");
    test::writeFile(src / "sub" / "b.txt", "bravo");

    const std::vector<CopyOutcome> firstOutcomes{ copyTree(src, dst, true) };
    REQUIRE(countOutcomes(firstOutcomes, Outcome::Copied) == 2);

    // removed from the source, added to the destination, and changed in between runs
    fs::remove(src / "sub" / "b.txt");
    test::writeFile(dst / "only-here.txt", "local");
    test::writeFile(src / "a.txt", "second");

    const std::vector<CopyOutcome> secondOutcomes{ copyTree(src, dst, true) };
    REQUIRE(secondOutcomes.size() == 1);
    REQUIRE(countOutcomes(secondOutcomes, Outcome::Copied) == 1);

    REQUIRE(test::readFile(dst / "a.txt") == "second");
    REQUIRE(test::readFile(dst / "sub" / "b.txt") == "bravo");
    REQUIRE(test::readFile(dst / "only-here.txt") == "local");

    const std::vector<CopyOutcome> thirdOutcomes{ copyTree(src, dst, true) };
    REQUIRE(thirdOutcomes.size() == 1);
    REQUIRE(test::readFile(dst / "a.txt") == "second");
    REQUIRE(test::readFile(dst / "only-here.txt") == "local");
}

TEST_CASE("TreeCopier copies a tree with every kind of link", "[tree-copier][symlink]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    test::writeFile(src / "a.txt", "hi");
    test::writeFile(src / "sub" / "b.txt", "yo");
    fs::create_symlink("a.txt", src / "link_to_a");
    fs::create_directory_symlink("sub", src / "link_to_sub");
    fs::create_symlink("missing", src / "broken");

    const std::vector<CopyOutcome> outcomes{ copyTree(src, dst, true) };

    REQUIRE(outcomes.size() == 5);
    REQUIRE(countOutcomes(outcomes, Outcome::Copied) == 3);
    REQUIRE(countOutcomes(outcomes, Outcome::SkippedDirectorySymlink) == 1);
    REQUIRE(countOutcomes(outcomes, Outcome::SkippedBrokenSymlink) == 1);

    REQUIRE(test::readFile(dst / "a.txt") == "hi");
    REQUIRE(test::readFile(dst / "sub" / "b.txt") == "yo");
    REQUIRE(test::readFile(dst / "link_to_a") == "hi");
    REQUIRE(!fs::is_symlink(dst / "link_to_a"));
    REQUIRE(!fs::exists(fs::symlink_status(dst / "link_to_sub")));
    REQUIRE(!fs::exists(fs::symlink_status(dst / "broken")));
}

TEST_CASE("TreeCopier never empties a file by copying it onto itself", "[tree-copier][error]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };

    test::writeFile(src / "a.txt", "hi");
    test::writeFile(src / "sub" / "b.txt", "yo");

    SECTION("with errors ignored every file is skipped")
    {
        const std::vector<CopyOutcome> outcomes{ copyTree(src, src, true) };

        REQUIRE(outcomes.size() == 2);
        REQUIRE(countOutcomes(outcomes, Outcome::SkippedOtherError) == 2);

        const CopyOutcome * const outcomePtr{ findBySource(outcomes, src / "a.txt") };
        REQUIRE(outcomePtr != nullptr);
        REQUIRE(outcomePtr->error_kind == ErrorKind::FileCopyFailure);
        REQUIRE(outcomePtr->error_code == std::errc::invalid_argument);
    }

    SECTION("when stopping on errors")
    {
        REQUIRE_THROWS_AS(copyTree(src, src, false), copy_error);
    }

    REQUIRE(test::readFile(src / "a.txt") == "hi");
    REQUIRE(test::readFile(src / "sub" / "b.txt") == "yo");
}

TEST_CASE("TreeCopier copies a single file root", "[tree-copier][root]")
{
    test::TempDir temp;
    test::writeFile(temp / "kdeglobals", "[General]\n");

    const fs::path dst{ temp / "backup" / "kde" / "kdeglobals" };

    TreeCopier copier(temp / "kdeglobals", dst, true);

    CopyOutcome outcome;
    REQUIRE(copier.next(outcome));
    REQUIRE(outcome.outcome == Outcome::Copied);
    REQUIRE(outcome.destination == dst);
    REQUIRE(!copier.next(outcome));
    REQUIRE(!copier.didRootFail());

    REQUIRE(test::readFile(dst) == "[General]\n");
}

TEST_CASE("TreeCopier follows a symlinked directory root", "[tree-copier][root]")
{
    test::TempDir temp;
    test::writeFile(temp / "real" / "file.txt", "content");
    fs::create_directory_symlink(temp / "real", temp / "linked-root");

    const std::vector<CopyOutcome> outcomes{ copyTree(temp / "linked-root", temp / "dst", true) };

    REQUIRE(outcomes.size() == 1);
    REQUIRE(test::readFile(temp / "dst" / "file.txt") == "content");
}

TEST_CASE("TreeCopier reports a broken symlink root", "[tree-copier][root]")
{
    test::TempDir temp;
    fs::create_symlink(temp / "gone", temp / "dangling-root");

    const std::vector<CopyOutcome> outcomes{ copyTree(temp / "dangling-root", temp / "dst", true) };

    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes.front().outcome == Outcome::SkippedBrokenSymlink);
}

TEST_CASE("TreeCopier handles a missing root", "[tree-copier][root][error]")
{
    test::TempDir temp;
    const fs::path missing{ temp / "not-here" };

    SECTION("with errors ignored the subtree is aborted")
    {
        TreeCopier copier(missing, temp / "dst", true);

        CopyOutcome outcome;
        REQUIRE(!copier.next(outcome));
        REQUIRE(copier.isFinished());
        REQUIRE(copier.didRootFail());
        REQUIRE(copier.abortedSubtreeCount() == 1);
        REQUIRE(!fs::exists(temp / "dst"));
    }

    SECTION("when stopping on errors it throws")
    {
        TreeCopier copier(missing, temp / "dst", false);

        CopyOutcome outcome;
        try
        {
            static_cast<void>(copier.next(outcome));
            FAIL("copy_error was not thrown");
        }
        catch (const copy_error & ex)
        {
            REQUIRE(ex.kind() == ErrorKind::SourceEnumerationFailure);
            REQUIRE(ex.path() == missing);
        }

        REQUIRE(copier.isFinished());
    }
}

TEST_CASE("TreeCopier handles a destination that cannot be created", "[tree-copier][error]")
{
    test::TempDir temp;
    test::writeFile(temp / "src" / "file.txt", "data");
    test::writeFile(temp / "blocker", "a file where a directory should be");

    const fs::path dst{ temp / "blocker" / "dst" };

    SECTION("with errors ignored")
    {
        TreeCopier copier(temp / "src", dst, true);

        CopyOutcome outcome;
        REQUIRE(!copier.next(outcome));
        REQUIRE(copier.didRootFail());
        REQUIRE(copier.abortedSubtreeCount() == 1);
    }

    SECTION("when stopping on errors")
    {
        try
        {
            static_cast<void>(copyTree(temp / "src", dst, false));
            FAIL("copy_error was not thrown");
        }
        catch (const copy_error & ex)
        {
            REQUIRE(ex.kind() == ErrorKind::DestinationCreateFailure);
            REQUIRE(ex.code());
        }
    }
}

TEST_CASE("TreeCopier handles a file that cannot be written", "[tree-copier][error]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    test::writeFile(src / "a.txt", "aaa");
    test::writeFile(src / "b.txt", "bbb");

    // a directory in the way of the copy can never be opened for writing
    fs::create_directories(dst / "a.txt");

    SECTION("with errors ignored the other files are still copied")
    {
        const std::vector<CopyOutcome> outcomes{ copyTree(src, dst, true) };

        REQUIRE(outcomes.size() == 2);
        REQUIRE(countOutcomes(outcomes, Outcome::Copied) == 1);
        REQUIRE(countOutcomes(outcomes, Outcome::SkippedOtherError) == 1);

        const CopyOutcome * const outcomePtr{ findBySource(outcomes, src / "a.txt") };
        REQUIRE(outcomePtr != nullptr);
        REQUIRE(outcomePtr->error_kind == ErrorKind::FileCopyFailure);
        REQUIRE(outcomePtr->error_code);

        REQUIRE(test::readFile(dst / "b.txt") == "bbb");
    }

    SECTION("when stopping on errors")
    {
        REQUIRE_THROWS_AS(copyTree(src, dst, false), copy_error);
    }
}

TEST_CASE("TreeCopier skips what it has no permission to read", "[tree-copier][permission]")
{
    if (test::isRoot())
    {
        WARN("Skipped because root can read everything.");
        return;
    }

    test::TempDir temp;
    const fs::path src{ temp / "src" };
    const fs::path dst{ temp / "dst" };

    test::writeFile(src / "readable.txt", "ok");
    test::writeFile(src / "locked.txt", "no");
    test::writeFile(src / "locked-dir" / "hidden.txt", "no");

    fs::permissions(src / "locked.txt", fs::perms::none);
    fs::permissions(src / "locked-dir", fs::perms::none);

    TreeCopier copier(src, dst, true);

    std::vector<CopyOutcome> outcomes;
    CopyOutcome outcome;
    while (copier.next(outcome))
    {
        outcomes.push_back(outcome);
    }

    fs::permissions(src / "locked.txt", fs::perms::owner_all);
    fs::permissions(src / "locked-dir", fs::perms::owner_all);

    REQUIRE(countOutcomes(outcomes, Outcome::Copied) == 1);
    REQUIRE(countOutcomes(outcomes, Outcome::SkippedPermissionError) == 1);
    REQUIRE(copier.abortedSubtreeCount() == 1);
    REQUIRE(!copier.didRootFail());
    REQUIRE(test::readFile(dst / "readable.txt") == "ok");
    REQUIRE(!fs::exists(dst / "locked-dir" / "hidden.txt"));
}

TEST_CASE("TreeCopier stops when cancelled", "[tree-copier][cancel]")
{
    test::TempDir temp;
    const fs::path src{ temp / "src" };

    for (int i(0); i < 10; ++i)
    {
        test::writeFile(src / ("file-" + std::to_string(i) + ".txt"), "x");
    }

    std::atomic_bool cancelFlag{ false };

    SECTION("before starting")
    {
        cancelFlag = true;
        TreeCopier copier(src, temp / "dst", true, &cancelFlag);

        CopyOutcome outcome;
        REQUIRE(!copier.next(outcome));
        REQUIRE(copier.wasCancelled());
        REQUIRE(copier.isFinished());
    }

    SECTION("part way through")
    {
        TreeCopier copier(src, temp / "dst", true, &cancelFlag);

        CopyOutcome outcome;
        REQUIRE(copier.next(outcome));
        REQUIRE(copier.next(outcome));

        cancelFlag = true;
        REQUIRE(!copier.next(outcome));
        REQUIRE(copier.wasCancelled());

        std::size_t copiedCount{ 0 };
        for (const auto & dirEntry : fs::directory_iterator(temp / "dst"))
        {
            if (dirEntry.is_regular_file())
            {
                ++copiedCount;
            }
        }

        REQUIRE(copiedCount == 2);
    }
}
