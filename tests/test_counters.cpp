//
// test_counters.cpp
//
#include "plasma-backup/counters.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace plasma_backup;

namespace
{
    CopyOutcome makeOutcome(const Outcome outcomeEnum, const std::size_t bytes = 0)
    {
        CopyOutcome outcome;
        outcome.outcome = outcomeEnum;
        outcome.bytes   = bytes;
        return outcome;
    }

    bool containsLineStartingWith(
        const std::vector<std::wstring> & lines, const std::wstring & prefix)
    {
        for (const std::wstring & line : lines)
        {
            if (line.find(prefix) == 0)
            {
                return true;
            }
        }

        return false;
    }
} // namespace

TEST_CASE("Counter totals by name", "[counters]")
{
    counting::Counter counter;
    REQUIRE(counter.isEmpty());

    counter.incrementByName(L"kde", 100);
    counter.incrementByName(L"kde", 50);
    counter.incrementByName(L"firefox", 1000);

    REQUIRE(!counter.isEmpty());
    REQUIRE(counter.totalCount() == 3);
    REQUIRE(counter.totalByteCount() == 1150);
    REQUIRE(counter.totalUniqueNames() == 2);

    const std::vector<std::wstring> lines{ counter.makeSummaryStrings(0) };
    REQUIRE(lines.size() == 2);

    // most counted first
    REQUIRE(lines.at(0).find(L"kde") != std::wstring::npos);
    REQUIRE(lines.at(1).find(L"firefox") != std::wstring::npos);
}

TEST_CASE("Counter lumps what is past the line limit together", "[counters]")
{
    counting::Counter counter;
    counter.incrementByName(L"a", 1);
    counter.incrementByName(L"a", 1);
    counter.incrementByName(L"a", 1);
    counter.incrementByName(L"b", 1);
    counter.incrementByName(L"b", 1);
    counter.incrementByName(L"c", 1);

    const std::vector<std::wstring> lines{ counter.makeSummaryStrings(1) };
    REQUIRE(lines.size() == 2);
    REQUIRE(lines.at(0).find(L"a") != std::wstring::npos);
    REQUIRE(lines.at(1).find(L"(unlisted)") != std::wstring::npos);
}

TEST_CASE("OutcomeCounter counts copies and skips", "[counters]")
{
    OutcomeCounter counter;
    REQUIRE(counter.isEmpty());

    counter.add(makeOutcome(Outcome::Copied, 10), L"kde");
    counter.add(makeOutcome(Outcome::Copied, 5), L"firefox");
    counter.add(makeOutcome(Outcome::SkippedBrokenSymlink), L"kde");
    counter.add(makeOutcome(Outcome::SkippedPermissionError), L"kde");
    counter.add(makeOutcome(Outcome::SkippedPermissionError), L"kde");

    REQUIRE(!counter.isEmpty());
    REQUIRE(counter.copiedCount() == 2);
    REQUIRE(counter.copiedByteCount() == 15);
    REQUIRE(counter.skippedCount() == 3);
    REQUIRE(counter.count(Outcome::SkippedPermissionError) == 2);
    REQUIRE(counter.count(Outcome::SkippedDirectorySymlink) == 0);

    const std::vector<std::wstring> lines{ counter.makeSummaryStrings() };
    REQUIRE(!lines.empty());
    REQUIRE(lines.front() == L"Outcomes x5  (15 bytes copied)");
    REQUIRE(containsLineStartingWith(lines, L"Copied By Category x2"));

    // making strings does not change the counts
    REQUIRE(counter.makeSummaryStrings() == lines);

    counter.reset();
    REQUIRE(counter.isEmpty());
    REQUIRE(counter.copiedCount() == 0);
    REQUIRE(counter.copiedByteCount() == 0);
}

TEST_CASE("OutcomeCounter reports aborted subtrees", "[counters]")
{
    OutcomeCounter counter;
    counter.countAbortedSubtrees(0);
    REQUIRE(counter.isEmpty());

    counter.countAbortedSubtrees(2);
    REQUIRE(!counter.isEmpty());
    REQUIRE(counter.abortedSubtreeCount() == 2);

    const std::vector<std::wstring> lines{ counter.makeSummaryStrings() };
    REQUIRE(containsLineStartingWith(
        lines, L"   (Directories that could not be created or listed x2)"));
}

TEST_CASE("OutcomeCounter can be shared between threads", "[counters][thread]")
{
    OutcomeCounter counter;

    std::vector<std::thread> threads;
    for (int t(0); t < 4; ++t)
    {
        threads.emplace_back([&counter]() {
            for (int i(0); i < 1000; ++i)
            {
                counter.add(makeOutcome(Outcome::Copied, 1), L"configs");
            }
        });
    }

    for (std::thread & thread : threads)
    {
        thread.join();
    }

    REQUIRE(counter.copiedCount() == 4000);
    REQUIRE(counter.copiedByteCount() == 4000);
}
