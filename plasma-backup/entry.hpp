#ifndef PLASMA_BACKUP_ENTRY_HPP_INCLUDED
#define PLASMA_BACKUP_ENTRY_HPP_INCLUDED
//
// entry.hpp
//
#include "enums.hpp"
#include "filesystem-common.hpp"

namespace plasma_backup
{

    struct Entry
    {
        Entry() = default;

        Entry(const EntryKind kindParam, const fs::path & pathParam)
            : kind(kindParam)
            , path(pathParam)
        {}

        Entry(const Entry &) = default;
        Entry & operator=(const Entry &) = default;

        Entry(Entry &&) noexcept = default;
        Entry & operator=(Entry &&) noexcept = default;

        inline bool isFileLike() const noexcept
        {
            return ((EntryKind::RegularFile == kind) || (EntryKind::SymlinkToFile == kind));
        }

        EntryKind kind = EntryKind::Other;
        fs::path path;

        // where the content actually comes from, which is path itself unless this is a link
        fs::path target;

        // only set for BrokenSymlink and Unreadable
        ErrorCode_t error_code;
    };

    // Classifies whatever is at path right now.  Never throws, never caches, and never follows
    // more than what is needed to tell a link to a file from a link to a directory.
    [[nodiscard]] Entry classifyEntry(const fs::path & path);

    // Same as above, but a root is allowed to be a link to a directory, so it is followed.
    [[nodiscard]] Entry classifyRoot(const fs::path & path);

} // namespace plasma_backup

#endif // PLASMA_BACKUP_ENTRY_HPP_INCLUDED
