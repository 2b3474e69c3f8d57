#ifndef PLASMA_BACKUP_ENUMS_HPP_INCLUDED
#define PLASMA_BACKUP_ENUMS_HPP_INCLUDED
//
// enums.hpp
//
#include <cstddef>
#include <string>

namespace plasma_backup
{

    enum class Command
    {
        Backup,
        Restore,
        List,
        Info,
        Help
    };

    [[nodiscard]] constexpr auto toString(const Command command) noexcept
    {
        // clang-format off
        switch (command)
        {
            case Command::Backup:  return L"Backup";
            case Command::Restore: return L"Restore";
            case Command::List:    return L"List";
            case Command::Info:    return L"Info";
            case Command::Help:    return L"Help";
            default:               return L"UNKNOWN_COMMAND_ENUM_ERROR";
        }
        // clang-format on
    }

    // What a directory entry turned out to be at the moment it was visited.
    enum class EntryKind
    {
        RegularFile,
        Directory,
        SymlinkToFile,
        SymlinkToDirectory,
        BrokenSymlink,
        Other,
        Unreadable
    };

    [[nodiscard]] constexpr auto toString(const EntryKind kind) noexcept
    {
        // clang-format off
        switch (kind)
        {
            case EntryKind::RegularFile:        return L"file";
            case EntryKind::Directory:          return L"dir";
            case EntryKind::SymlinkToFile:      return L"link->file";
            case EntryKind::SymlinkToDirectory: return L"link->dir";
            case EntryKind::BrokenSymlink:      return L"link->?";
            case EntryKind::Other:              return L"other";
            case EntryKind::Unreadable:         return L"unreadable";
            default:                            return L"UNKNOWN_ENTRY_KIND_ENUM_ERROR";
        }
        // clang-format on
    }

    enum class Outcome
    {
        Copied,
        SkippedBrokenSymlink,
        SkippedDirectorySymlink,
        SkippedPermissionError,
        SkippedOtherError
    };

    [[nodiscard]] constexpr auto toString(const Outcome outcome) noexcept
    {
        // clang-format off
        switch (outcome)
        {
            case Outcome::Copied:                  return L"Copied";
            case Outcome::SkippedBrokenSymlink:    return L"BrokenLink";
            case Outcome::SkippedDirectorySymlink: return L"DirLink";
            case Outcome::SkippedPermissionError:  return L"Access";
            case Outcome::SkippedOtherError:       return L"Error";
            default:                               return L"UNKNOWN_OUTCOME_ENUM_ERROR";
        }
        // clang-format on
    }

    [[nodiscard]] constexpr bool isSkip(const Outcome outcome) noexcept
    {
        return (Outcome::Copied != outcome);
    }

    enum class ErrorKind
    {
        None,
        DestinationCreateFailure,
        SourceEnumerationFailure,
        SymlinkResolutionFailure,
        FileCopyFailure
    };

    [[nodiscard]] constexpr auto toString(const ErrorKind kind) noexcept
    {
        // clang-format off
        switch (kind)
        {
            case ErrorKind::None:                     return L"None";
            case ErrorKind::DestinationCreateFailure: return L"CreateDir";
            case ErrorKind::SourceEnumerationFailure: return L"DirIter";
            case ErrorKind::SymlinkResolutionFailure: return L"Resolve";
            case ErrorKind::FileCopyFailure:          return L"Copy";
            default:                                  return L"UNKNOWN_ERROR_KIND_ENUM_ERROR";
        }
        // clang-format on
    }

    enum class Category
    {
        KdeSettings,
        AppConfigs,
        Firefox,
        Thunderbird,
        UserDirs
    };

    [[nodiscard]] constexpr auto toString(const Category category) noexcept
    {
        // clang-format off
        switch (category)
        {
            case Category::KdeSettings: return L"KDE Plasma settings";
            case Category::AppConfigs:  return L"application configurations";
            case Category::Firefox:     return L"Firefox profiles";
            case Category::Thunderbird: return L"Thunderbird profiles";
            case Category::UserDirs:    return L"user directories";
            default:                    return L"UNKNOWN_CATEGORY_ENUM_ERROR";
        }
        // clang-format on
    }

    // the keys used in backup_metadata.json, and the folder names inside a backup
    [[nodiscard]] constexpr auto toMetadataKey(const Category category) noexcept
    {
        // clang-format off
        switch (category)
        {
            case Category::KdeSettings: return "kde_settings";
            case Category::AppConfigs:  return "app_configs";
            case Category::Firefox:     return "firefox";
            case Category::Thunderbird: return "thunderbird";
            case Category::UserDirs:    return "user_dirs";
            default:                    return "unknown";
        }
        // clang-format on
    }

    [[nodiscard]] constexpr auto toFolderName(const Category category) noexcept
    {
        // clang-format off
        switch (category)
        {
            case Category::KdeSettings: return "kde";
            case Category::AppConfigs:  return "configs";
            case Category::Firefox:     return "firefox";
            case Category::Thunderbird: return "thunderbird";
            case Category::UserDirs:    return "user_data";
            default:                    return "unknown";
        }
        // clang-format on
    }

    constexpr std::size_t category_count{ 5 };

    enum class RestoreMode
    {
        Merge,
        Replace
    };

    enum class RunStatus
    {
        Success,
        NothingCopied,
        Cancelled,
        Failed
    };

    [[nodiscard]] constexpr auto toString(const RunStatus status) noexcept
    {
        // clang-format off
        switch (status)
        {
            case RunStatus::Success:       return L"Success";
            case RunStatus::NothingCopied: return L"Nothing copied!";
            case RunStatus::Cancelled:     return L"Cancelled";
            case RunStatus::Failed:        return L"FAIL";
            default:                       return L"UNKNOWN_RUN_STATUS_ENUM_ERROR";
        }
        // clang-format on
    }

    enum class Color
    {
        Default,
        Gray,
        Green,
        Yellow,
        Red,
        Disabled
    };

    [[nodiscard]] constexpr auto toConsoleCode(const Color color) noexcept
    {
        // clang-format off
        switch (color)
        {
            case Color::Default:    return L"\033[0;0m";
            case Color::Gray:       return L"\033[37;40m";
            case Color::Green:      return L"\033[32;40m";
            case Color::Yellow:     return L"\033[33;40m";
            case Color::Red:        return L"\033[91;40m";
            case Color::Disabled:
            default:                return L"";
        }
        // clang-format on
    }

} // namespace plasma_backup

#endif // PLASMA_BACKUP_ENUMS_HPP_INCLUDED
