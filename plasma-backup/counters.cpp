// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// counters.cpp
//
#include "counters.hpp"

#include "str-util.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace plasma_backup
{
    namespace counting
    {

        CountStrings::CountStrings(
            const Counted & ct, const std::size_t totalCount, const std::size_t totalBytes)
            : name(ct.name)
            , count(std::to_wstring(ct.count))
            , count_percent(calcPercentString(ct.count, totalCount))
            , size((ct.bytes == 0) ? L"" : fileSizeToString(ct.bytes))
            , size_percent((ct.bytes == totalBytes) ? L"" : calcPercentString(ct.bytes, totalBytes))
        {}

        Counter::Counter()
            : m_counteds()
        {}

        std::size_t Counter::totalCount() const
        {
            return std::accumulate(
                std::begin(m_counteds),
                std::end(m_counteds),
                0_st,
                [](const std::size_t sumSoFar, const Counted & ct) {
                    return (sumSoFar + ct.count);
                });
        }

        std::size_t Counter::totalByteCount() const
        {
            return std::accumulate(
                std::begin(m_counteds),
                std::end(m_counteds),
                0_st,
                [](const std::size_t sumSoFar, const Counted & ct) {
                    return (sumSoFar + ct.bytes);
                });
        }

        std::size_t Counter::totalUniqueNames() const
        {
            std::set<std::wstring> uniqueNames;

            for (const Counted & ct : m_counteds)
            {
                if (ct.count > 0)
                {
                    uniqueNames.insert(ct.name);
                }
            }

            return uniqueNames.size();
        }

        void Counter::incrementByName(const std::wstring & name, const std::size_t size)
        {
            const auto iter{ std::find_if(
                std::begin(m_counteds), std::end(m_counteds), [&name](const Counted & ct) {
                    return (ct.name == name);
                }) };

            if (iter == std::end(m_counteds))
            {
                m_counteds.push_back(Counted{ name, 0_st, 1_st, size });
            }
            else
            {
                iter->count++;
                iter->bytes += size;
            }
        }

        void Counter::incrementByNumber(
            const std::size_t number, const std::wstring & name, const std::size_t size)
        {
            if (number >= m_counteds.size())
            {
                m_counteds.resize(number + 1);
            }

            Counted & ct{ m_counteds[number] };

            if (ct.name.empty())
            {
                ct.name = name;
            }

            ct.number = number;
            ++ct.count;
            ct.bytes += size;
        }

        std::vector<std::wstring> Counter::makeSummaryStrings(const std::size_t lineCountLimit)
        {
            std::vector<std::wstring> allStrings;

            m_counteds.erase(
                std::remove_if(
                    std::begin(m_counteds),
                    std::end(m_counteds),
                    [](const auto & ct) { return (ct.count == 0); }),
                std::end(m_counteds));

            if (m_counteds.empty())
            {
                return allStrings;
            }

            std::sort(
                std::begin(m_counteds), std::end(m_counteds), [](const auto & A, const auto & B) {
                    if (A.count != B.count)
                    {
                        return (A.count > B.count);
                    }
                    else if (A.bytes != B.bytes)
                    {
                        return (A.bytes > B.bytes);
                    }
                    else if (A.name != B.name)
                    {
                        return (A.name < B.name);
                    }
                    else
                    {
                        return (A.number < B.number);
                    }
                });

            CountStrVec_t lines{ makeLineStringVecs(lineCountLimit) };
            justifyLineStrings(lines);

            for (const auto & strings : lines)
            {
                std::wstring str;

                str += L"   ";
                str += strings.name;
                str += L" -  ";
                str += strings.count;
                str += L"x ";
                str += strings.count_percent;

                if (!strings.size.empty())
                {
                    str += L"  - ";
                    str += strings.size;

                    if (!strings.size_percent.empty())
                    {
                        str += L" ";
                        str += strings.size_percent;
                    }
                }

                allStrings.push_back(str);
            }

            return allStrings;
        }

        CountStrVec_t Counter::makeLineStringVecs(const std::size_t lineCountLimit) const
        {
            CountStrVec_t lines;

            const std::size_t allCount{ totalCount() };
            const std::size_t allBytes{ totalByteCount() };
            const std::size_t containerSize{ m_counteds.size() };

            const std::size_t linesToDisplayCount{ (lineCountLimit == 0)
                                                       ? containerSize
                                                       : std::min(lineCountLimit, containerSize) };

            std::size_t i(0);
            for (; i < linesToDisplayCount; ++i)
            {
                lines.emplace_back(m_counteds.at(i), allCount, allBytes);
            }

            if (i < containerSize)
            {
                std::size_t notListedTotalCount{ 0 };
                std::size_t notListedTotalSize{ 0 };

                for (; i < containerSize; ++i)
                {
                    const auto & counted{ m_counteds.at(i) };
                    notListedTotalCount += counted.count;
                    notListedTotalSize += counted.bytes;
                }

                const Counted notListedCounted{
                    L"(unlisted)", 0, notListedTotalCount, notListedTotalSize
                };

                lines.emplace_back(notListedCounted, allCount, allBytes);
            }

            return lines;
        }

        void Counter::justifyLineStrings(CountStrVec_t & lines) const
        {
            std::size_t nameLengthMax{ 0 };
            std::size_t countLengthMax{ 0 };
            std::size_t sizeLengthMax{ 0 };

            for (const auto & strings : lines)
            {
                nameLengthMax  = std::max(nameLengthMax, strings.name.length());
                countLengthMax = std::max(countLengthMax, strings.count.length());
                sizeLengthMax  = std::max(sizeLengthMax, strings.size.length());
            }

            enum class Justify
            {
                Left,
                Right
            };

            auto stretchAndjustify =
                [](std::wstring & str, const Justify justify, const std::size_t lengthMin) {
                    if (str.empty() || (lengthMin == 0) || (str.length() >= lengthMin))
                    {
                        return;
                    }

                    const std::size_t charsToAddCount{ lengthMin - str.length() };

                    if (justify == Justify::Left)
                    {
                        str.append(charsToAddCount, L' ');
                    }
                    else
                    {
                        str.insert(0, charsToAddCount, L' ');
                    }
                };

            for (auto & strings : lines)
            {
                stretchAndjustify(strings.name, Justify::Left, nameLengthMax);
                stretchAndjustify(strings.count, Justify::Right, countLengthMax);
                stretchAndjustify(strings.count_percent, Justify::Right, 4); //-V112
                stretchAndjustify(strings.size, Justify::Right, sizeLengthMax);
                stretchAndjustify(strings.size_percent, Justify::Right, 4); //-V112
            }
        }

    } // namespace counting

    OutcomeCounter::OutcomeCounter()
        : m_outcomeCounts()
        , m_copiedByteCount(0)
        , m_abortedSubtreeCount(0)
        , m_outcomeCounter()
        , m_rootCounter()
        , m_mutex()
    {
        m_outcomeCounts.fill(0);
    }

    void OutcomeCounter::add(const CopyOutcome & outcome, const std::wstring & rootLabel)
    {
        std::scoped_lock scopedLock(m_mutex);

        ++m_outcomeCounts.at(static_cast<std::size_t>(outcome.outcome));
        m_outcomeCounter.incrementByEnum(outcome.outcome, outcome.bytes);

        if (Outcome::Copied == outcome.outcome)
        {
            m_copiedByteCount += outcome.bytes;
            m_rootCounter.incrementByName(rootLabel, outcome.bytes);
        }
    }

    void OutcomeCounter::countAbortedSubtrees(const std::size_t count)
    {
        std::scoped_lock scopedLock(m_mutex);
        m_abortedSubtreeCount += count;
    }

    void OutcomeCounter::reset()
    {
        std::scoped_lock scopedLock(m_mutex);
        m_outcomeCounts.fill(0);
        m_copiedByteCount     = 0;
        m_abortedSubtreeCount = 0;
        m_outcomeCounter      = counting::Counter();
        m_rootCounter         = counting::Counter();
    }

    std::size_t OutcomeCounter::count(const Outcome outcome) const
    {
        std::scoped_lock scopedLock(m_mutex);
        return m_outcomeCounts.at(static_cast<std::size_t>(outcome));
    }

    std::size_t OutcomeCounter::skippedCount() const
    {
        std::scoped_lock scopedLock(m_mutex);

        return (
            std::accumulate(std::begin(m_outcomeCounts), std::end(m_outcomeCounts), 0_st) -
            m_outcomeCounts.at(static_cast<std::size_t>(Outcome::Copied)));
    }

    std::size_t OutcomeCounter::copiedByteCount() const
    {
        std::scoped_lock scopedLock(m_mutex);
        return m_copiedByteCount;
    }

    std::size_t OutcomeCounter::abortedSubtreeCount() const
    {
        std::scoped_lock scopedLock(m_mutex);
        return m_abortedSubtreeCount;
    }

    bool OutcomeCounter::isEmpty() const
    {
        std::scoped_lock scopedLock(m_mutex);
        return (m_outcomeCounter.isEmpty() && (0 == m_abortedSubtreeCount));
    }

    std::vector<std::wstring> OutcomeCounter::makeSummaryStrings() const
    {
        // the counters sort themselves while making strings, so work on copies
        counting::Counter outcomeCounter;
        counting::Counter rootCounter;
        std::size_t abortedSubtreeCount{ 0 };
        std::size_t copiedByteCount{ 0 };
        {
            std::scoped_lock scopedLock(m_mutex);
            outcomeCounter      = m_outcomeCounter;
            rootCounter         = m_rootCounter;
            abortedSubtreeCount = m_abortedSubtreeCount;
            copiedByteCount     = m_copiedByteCount;
        }

        std::vector<std::wstring> strings;

        std::wostringstream ss;
        ss.imbue(std::locale::classic());

        auto appendNewLine = [&]() {
            strings.push_back(ss.str());
            ss.str(L"");
        };

        ss << L"Outcomes x" << outcomeCounter.totalCount() << L"  (" << copiedByteCount
           << L" bytes copied)";

        appendNewLine();

        for (const std::wstring & str : outcomeCounter.makeSummaryStrings(0))
        {
            strings.push_back(str);
        }

        if (abortedSubtreeCount > 0)
        {
            ss << L"   (Directories that could not be created or listed x" << abortedSubtreeCount
               << L")";

            appendNewLine();
        }

        if (!rootCounter.isEmpty())
        {
            ss << L"Copied By Category x" << rootCounter.totalUniqueNames();
            appendNewLine();

            for (const std::wstring & str : rootCounter.makeSummaryStrings(0))
            {
                strings.push_back(str);
            }
        }

        return strings;
    }

} // namespace plasma_backup
