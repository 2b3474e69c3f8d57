// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// entry.cpp
//
#include "entry.hpp"

namespace plasma_backup
{

    namespace
    {
        EntryKind kindOfResolved(const fs::file_status & status) noexcept
        {
            if (fs::is_regular_file(status))
            {
                return EntryKind::SymlinkToFile;
            }
            else if (fs::is_directory(status))
            {
                return EntryKind::SymlinkToDirectory;
            }
            else
            {
                return EntryKind::Other;
            }
        }

        void resolveSymlink(Entry & entry)
        {
            // canonical() walks the whole chain of links, and reports ELOOP for cycles
            ErrorCode_t errorCodeResolve;
            fs::path resolvedPath{ fs::canonical(entry.path, errorCodeResolve) };
            if (errorCodeResolve)
            {
                entry.kind       = EntryKind::BrokenSymlink;
                entry.error_code = errorCodeResolve;
                return;
            }

            ErrorCode_t errorCodeStatus;
            const fs::file_status resolvedStatus{ fs::status(resolvedPath, errorCodeStatus) };
            if (errorCodeStatus)
            {
                entry.kind       = EntryKind::BrokenSymlink;
                entry.error_code = errorCodeStatus;
                return;
            }

            entry.kind   = kindOfResolved(resolvedStatus);
            entry.target = std::move(resolvedPath);
        }
    } // namespace

    Entry classifyEntry(const fs::path & path)
    {
        Entry entry(EntryKind::Other, path);
        entry.target = path;

        ErrorCode_t errorCodeSymlinkStatus;
        const fs::file_status symlinkStatus{ fs::symlink_status(path, errorCodeSymlinkStatus) };
        if (errorCodeSymlinkStatus)
        {
            entry.kind       = EntryKind::Unreadable;
            entry.error_code = errorCodeSymlinkStatus;
            return entry;
        }

        if (fs::is_symlink(symlinkStatus))
        {
            resolveSymlink(entry);
        }
        else if (fs::is_regular_file(symlinkStatus))
        {
            entry.kind = EntryKind::RegularFile;
        }
        else if (fs::is_directory(symlinkStatus))
        {
            entry.kind = EntryKind::Directory;
        }
        else if (!fs::exists(symlinkStatus))
        {
            // removed between the directory listing and this visit
            entry.kind       = EntryKind::Unreadable;
            entry.error_code = std::make_error_code(std::errc::no_such_file_or_directory);
        }

        return entry;
    }

    Entry classifyRoot(const fs::path & path)
    {
        Entry entry{ classifyEntry(path) };

        if (EntryKind::SymlinkToDirectory == entry.kind)
        {
            entry.kind = EntryKind::Directory;
        }
        else if (EntryKind::SymlinkToFile == entry.kind)
        {
            entry.kind = EntryKind::RegularFile;
        }

        return entry;
    }

} // namespace plasma_backup
