// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// tree-copier.cpp
//
#include "tree-copier.hpp"

#include "copy-error.hpp"
#include "file-content.hpp"

#include <utility>

namespace plasma_backup
{

    TreeCopier::TreeCopier(
        const fs::path & source,
        const fs::path & destination,
        const bool ignoreErrors,
        const std::atomic_bool * const cancelFlagPtr)
        : m_source(source)
        , m_destination(destination)
        , m_ignoreErrors(ignoreErrors)
        , m_cancelFlagPtr(cancelFlagPtr)
        , m_isStarted(false)
        , m_isFinished(false)
        , m_didRootFail(false)
        , m_wasCancelled(false)
        , m_abortedSubtreeCount(0)
        , m_stack()
    {}

    bool TreeCopier::next(CopyOutcome & outcome)
    {
        if (m_isFinished)
        {
            return false;
        }

        if (!m_isStarted)
        {
            m_isStarted = true;

            if (startRoot(outcome))
            {
                // only a root that is not a directory produces an outcome, and it is the only one
                m_isFinished = true;
                return true;
            }
        }

        while (!m_stack.empty())
        {
            if (isCancelRequested())
            {
                m_wasCancelled = true;
                m_stack.clear();
                break;
            }

            Frame & frame{ m_stack.back() };

            if (frame.index >= frame.children.size())
            {
                m_stack.pop_back();
                continue;
            }

            // copies, because visitChild() might push and invalidate frame
            const fs::path child{ frame.children[frame.index++] };
            const fs::path childDestination{ frame.destination / child.filename() };

            if (visitChild(child, childDestination, outcome))
            {
                return true;
            }
        }

        m_isFinished = true;
        return false;
    }

    bool TreeCopier::startRoot(CopyOutcome & outcome)
    {
        const Entry root{ classifyRoot(m_source) };

        switch (root.kind)
        {
            case EntryKind::Directory:
            {
                m_didRootFail = !enterDirectory(m_source, m_destination);
                return false;
            }

            case EntryKind::RegularFile:
            {
                const fs::path parentPath{ m_destination.parent_path() };
                if (!parentPath.empty())
                {
                    ErrorCode_t errorCode;
                    fs::create_directories(parentPath, errorCode);
                    if (errorCode)
                    {
                        m_didRootFail = true;
                        abortSubtree(ErrorKind::DestinationCreateFailure, parentPath, errorCode);
                        return false;
                    }
                }

                copyFile(root, m_destination, outcome);
                return true;
            }

            case EntryKind::BrokenSymlink:
            {
                skip(
                    Outcome::SkippedBrokenSymlink,
                    root,
                    m_destination,
                    ErrorKind::SymlinkResolutionFailure,
                    outcome);

                return true;
            }

            case EntryKind::Unreadable:
            {
                m_didRootFail = true;
                abortSubtree(ErrorKind::SourceEnumerationFailure, m_source, root.error_code);
                return false;
            }

            case EntryKind::SymlinkToFile:
            case EntryKind::SymlinkToDirectory:
            case EntryKind::Other:
            default:
            {
                return false;
            }
        }
    }

    bool TreeCopier::visitChild(
        const fs::path & child, const fs::path & destination, CopyOutcome & outcome)
    {
        // never cached, whatever is there right now is what counts
        const Entry entry{ classifyEntry(child) };

        switch (entry.kind)
        {
            case EntryKind::RegularFile:
            case EntryKind::SymlinkToFile:
            {
                copyFile(entry, destination, outcome);
                return true;
            }

            case EntryKind::Directory:
            {
                enterDirectory(child, destination);
                return false;
            }

            case EntryKind::SymlinkToDirectory:
            {
                skip(
                    Outcome::SkippedDirectorySymlink,
                    entry,
                    destination,
                    ErrorKind::None,
                    outcome);

                return true;
            }

            case EntryKind::BrokenSymlink:
            {
                skip(
                    Outcome::SkippedBrokenSymlink,
                    entry,
                    destination,
                    ErrorKind::SymlinkResolutionFailure,
                    outcome);

                return true;
            }

            case EntryKind::Unreadable:
            {
                skipOrThrow(ErrorKind::SourceEnumerationFailure, entry, destination, outcome);
                return true;
            }

            // devices, sockets, fifos, and links to any of those
            case EntryKind::Other:
            default:
            {
                return false;
            }
        }
    }

    bool TreeCopier::enterDirectory(const fs::path & source, const fs::path & destination)
    {
        ErrorCode_t errorCode;

        fs::create_directories(destination, errorCode);
        if (errorCode)
        {
            return abortSubtree(ErrorKind::DestinationCreateFailure, destination, errorCode);
        }

        Frame frame;
        frame.destination = destination;

        if (!listChildren(source, frame.children, errorCode))
        {
            return abortSubtree(ErrorKind::SourceEnumerationFailure, source, errorCode);
        }

        m_stack.push_back(std::move(frame));
        return true;
    }

    void TreeCopier::copyFile(
        const Entry & entry, const fs::path & destination, CopyOutcome & outcome)
    {
        ErrorCode_t errorCode;
        std::size_t bytesCopied{ 0 };
        copyFileContent(entry.target, destination, errorCode, bytesCopied);

        if (errorCode)
        {
            Entry failedEntry{ entry };
            failedEntry.error_code = errorCode;
            skipOrThrow(ErrorKind::FileCopyFailure, failedEntry, destination, outcome);
            return;
        }

        outcome             = CopyOutcome();
        outcome.outcome     = Outcome::Copied;
        outcome.source      = entry.path;
        outcome.destination = destination;
        outcome.bytes       = bytesCopied;
    }

    void TreeCopier::skip(
        const Outcome outcomeEnum,
        const Entry & entry,
        const fs::path & destination,
        const ErrorKind errorKind,
        CopyOutcome & outcome) const
    {
        outcome             = CopyOutcome();
        outcome.outcome     = outcomeEnum;
        outcome.source      = entry.path;
        outcome.destination = destination;
        outcome.error_kind  = errorKind;
        outcome.error_code  = entry.error_code;
    }

    void TreeCopier::skipOrThrow(
        const ErrorKind errorKind,
        const Entry & entry,
        const fs::path & destination,
        CopyOutcome & outcome)
    {
        if (!m_ignoreErrors)
        {
            finishAndThrow(errorKind, entry.path, entry.error_code);
        }

        const Outcome outcomeEnum{ isAccessError(entry.error_code)
                                       ? Outcome::SkippedPermissionError
                                       : Outcome::SkippedOtherError };

        skip(outcomeEnum, entry, destination, errorKind, outcome);
    }

    bool TreeCopier::abortSubtree(
        const ErrorKind errorKind, const fs::path & path, const ErrorCode_t & errorCode)
    {
        if (!m_ignoreErrors)
        {
            finishAndThrow(errorKind, path, errorCode);
        }

        ++m_abortedSubtreeCount;
        return false;
    }

    void TreeCopier::finishAndThrow(
        const ErrorKind errorKind, const fs::path & path, const ErrorCode_t & errorCode)
    {
        m_isFinished = true;
        m_stack.clear();
        throw copy_error(errorKind, path, errorCode);
    }

    bool TreeCopier::isCancelRequested() const noexcept
    {
        return ((m_cancelFlagPtr != nullptr) && m_cancelFlagPtr->load());
    }

    bool TreeCopier::listChildren(
        const fs::path & dirPath, std::vector<fs::path> & children, ErrorCode_t & errorCode)
    {
        children.clear();

        fs::directory_iterator dirIter(dirPath, errorCode);
        if (errorCode)
        {
            return false;
        }

        const fs::directory_iterator dirIterEnd;
        while (dirIter != dirIterEnd)
        {
            children.push_back(dirIter->path());

            dirIter.increment(errorCode);
            if (errorCode)
            {
                children.clear();
                return false;
            }
        }

        return true;
    }

    std::vector<CopyOutcome> copyTree(
        const fs::path & source,
        const fs::path & destination,
        const bool ignoreErrors,
        const std::atomic_bool * const cancelFlagPtr)
    {
        std::vector<CopyOutcome> outcomes;

        TreeCopier copier(source, destination, ignoreErrors, cancelFlagPtr);

        CopyOutcome outcome;
        while (copier.next(outcome))
        {
            outcomes.push_back(outcome);
        }

        return outcomes;
    }

} // namespace plasma_backup
