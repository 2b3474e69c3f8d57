#ifndef PLASMA_BACKUP_TREE_COPIER_HPP_INCLUDED
#define PLASMA_BACKUP_TREE_COPIER_HPP_INCLUDED
//
// tree-copier.hpp
//
#include "copy-outcome.hpp"
#include "entry.hpp"
#include "enums.hpp"
#include "filesystem-common.hpp"

#include <atomic>
#include <cstddef>
#include <vector>

namespace plasma_backup
{

    //
    // Copies a whole tree, depth first and pre-order, one decision at a time.
    //
    // Nothing happens in the constructor.  Each call to next() does only as much of the walk as
    // it takes to produce the next CopyOutcome, so the caller decides how fast the copy goes
    // and can print or queue every outcome as it happens.  Once next() returns false the walk
    // is over and it will keep returning false.
    //
    // ignoreErrors=true
    //  - A destination directory that can't be created, or a source directory that can't be
    //    listed, silently ends that subtree and nothing else.
    //  - Any other error becomes a Skipped... outcome and the walk moves on.
    //
    // ignoreErrors=false
    //  - The first error throws a copy_error out of next() and the walk is over.
    //
    // Either way, broken links are always just skipped.  The destination is only ever added to
    // or overwritten, never deleted from.
    //
    class TreeCopier
    {
      public:
        TreeCopier(
            const fs::path & source,
            const fs::path & destination,
            const bool ignoreErrors,
            const std::atomic_bool * const cancelFlagPtr = nullptr);

        TreeCopier(const TreeCopier &) = delete;
        TreeCopier & operator=(const TreeCopier &) = delete;

        TreeCopier(TreeCopier &&) = default;
        TreeCopier & operator=(TreeCopier &&) = default;

        [[nodiscard]] bool next(CopyOutcome & outcome);

        inline const fs::path & source() const noexcept { return m_source; }
        inline const fs::path & destination() const noexcept { return m_destination; }
        inline bool isFinished() const noexcept { return m_isFinished; }
        inline bool didRootFail() const noexcept { return m_didRootFail; }
        inline bool wasCancelled() const noexcept { return m_wasCancelled; }
        inline std::size_t abortedSubtreeCount() const noexcept { return m_abortedSubtreeCount; }

      private:
        struct Frame
        {
            fs::path destination;
            std::vector<fs::path> children;
            std::size_t index = 0;
        };

        bool startRoot(CopyOutcome & outcome);
        bool visitChild(
            const fs::path & child, const fs::path & destination, CopyOutcome & outcome);
        bool enterDirectory(const fs::path & source, const fs::path & destination);

        void copyFile(const Entry & entry, const fs::path & destination, CopyOutcome & outcome);

        void skip(
            const Outcome outcomeEnum,
            const Entry & entry,
            const fs::path & destination,
            const ErrorKind errorKind,
            CopyOutcome & outcome) const;

        void skipOrThrow(
            const ErrorKind errorKind,
            const Entry & entry,
            const fs::path & destination,
            CopyOutcome & outcome);

        bool abortSubtree(
            const ErrorKind errorKind, const fs::path & path, const ErrorCode_t & errorCode);

        [[noreturn]] void finishAndThrow(
            const ErrorKind errorKind, const fs::path & path, const ErrorCode_t & errorCode);

        bool isCancelRequested() const noexcept;

        static bool listChildren(
            const fs::path & dirPath, std::vector<fs::path> & children, ErrorCode_t & errorCode);

      private:
        fs::path m_source;
        fs::path m_destination;
        bool m_ignoreErrors;
        const std::atomic_bool * m_cancelFlagPtr;
        bool m_isStarted;
        bool m_isFinished;
        bool m_didRootFail;
        bool m_wasCancelled;
        std::size_t m_abortedSubtreeCount;
        std::vector<Frame> m_stack;
    };

    // Runs a whole TreeCopier and collects everything it produced.
    [[nodiscard]] std::vector<CopyOutcome> copyTree(
        const fs::path & source,
        const fs::path & destination,
        const bool ignoreErrors,
        const std::atomic_bool * const cancelFlagPtr = nullptr);

} // namespace plasma_backup

#endif // PLASMA_BACKUP_TREE_COPIER_HPP_INCLUDED
