#ifndef PLASMA_BACKUP_COUNTERS_HPP_INCLUDED
#define PLASMA_BACKUP_COUNTERS_HPP_INCLUDED
//
// counters.hpp
//
#include "copy-outcome.hpp"
#include "enums.hpp"
#include "filesystem-common.hpp"
#include "util.hpp"

#include <array>
#include <mutex>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

namespace plasma_backup
{

    namespace counting
    {

        struct Counted
        {
            std::wstring name;
            std::size_t number = 0;
            std::size_t count  = 0;
            std::size_t bytes  = 0;
        };

        using CountedVec_t = std::vector<Counted>;

        //

        struct CountStrings
        {
            CountStrings() = default;

            CountStrings(
                const Counted & ct, const std::size_t totalCount, const std::size_t totalBytes);

            std::wstring name;
            std::wstring count;
            std::wstring count_percent;
            std::wstring size;
            std::wstring size_percent;
        };

        using CountStrVec_t = std::vector<CountStrings>;

        //

        class Counter
        {
          public:
            Counter();

            std::size_t totalCount() const;
            std::size_t totalByteCount() const;
            std::size_t totalUniqueNames() const;

            bool isEmpty() const { return (totalCount() == 0); }

            void incrementByName(const std::wstring & name, const std::size_t size);

            void incrementByNumber(
                const std::size_t number, const std::wstring & name, const std::size_t size);

            template <typename T>
            void incrementByEnum(const T & enumeration, const std::size_t size)
            {
                incrementByNumber(
                    static_cast<std::size_t>(enumeration), toString(enumeration), size);
            }

            // zero means no limit, anything past the limit is lumped into one "(unlisted)" line
            std::vector<std::wstring> makeSummaryStrings(const std::size_t lineCountLimit);

          private:
            CountStrVec_t makeLineStringVecs(const std::size_t lineCountLimit) const;
            void justifyLineStrings(CountStrVec_t & lines) const;

          private:
            CountedVec_t m_counteds;
        };

    } // namespace counting

    //

    // Counts every outcome of a whole run, across all of its roots.  The worker thread adds while
    // the gui thread reads, so everything locks.
    class OutcomeCounter
    {
      public:
        OutcomeCounter();

        void add(const CopyOutcome & outcome, const std::wstring & rootLabel);
        void countAbortedSubtrees(const std::size_t count);
        void reset();

        std::size_t count(const Outcome outcome) const;
        std::size_t copiedCount() const { return count(Outcome::Copied); }
        std::size_t skippedCount() const;
        std::size_t copiedByteCount() const;
        std::size_t abortedSubtreeCount() const;

        bool isEmpty() const;

        std::vector<std::wstring> makeSummaryStrings() const;

      private:
        std::array<std::size_t, 5> m_outcomeCounts;
        std::size_t m_copiedByteCount;
        std::size_t m_abortedSubtreeCount;
        counting::Counter m_outcomeCounter;
        counting::Counter m_rootCounter;
        mutable std::mutex m_mutex;
    };

} // namespace plasma_backup

#endif // PLASMA_BACKUP_COUNTERS_HPP_INCLUDED
