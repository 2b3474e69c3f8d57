#ifndef PLASMA_BACKUP_FILESYSTEM_COMMON_HPP_INCLUDED
#define PLASMA_BACKUP_FILESYSTEM_COMMON_HPP_INCLUDED
//
// filesystem-common.hpp
//
#include "str-util.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>
#include <system_error>

//
// Links
//  - Symlinks to files are always followed, and the target's content is what gets copied.
//  - Symlinks to directories are never followed.  Not even the ones that would be safe to
//    follow.  This is what keeps the tree walk finite without any cycle detection, and it
//    also avoids the permission errors that NAS shares love to throw at directory links.
//  - Broken links, link loops, and links that can't be resolved for any other reason are
//    all treated the same way:  skipped and reported.
//
// Network shares
//  - Nothing but file content is ever written.  No chmod, chown, utimes, or xattrs.  Those
//    are the calls that fail on NFS/SMB mounts with squashed or mapped permissions, and a
//    backup of config files doesn't need any of them.
//

namespace plasma_backup
{

    namespace fs = std::filesystem;

    using ErrorCode_t        = std::error_code;
    using OutputFileStream_t = std::wofstream;

    [[nodiscard]] inline std::wstring toString(const ErrorCode_t & errorCode)
    {
        std::string str;
        str += "error_code=";
        str += std::to_string(errorCode.value());
        str += '=';
        str += errorCode.category().name();
        str += "=\"";
        str += errorCode.message();
        str += '\"';
        return strutil::toWideString(str);
    }

    // permission problems are the most common failure on network shares, so they get counted
    // separately from everything else
    [[nodiscard]] inline bool isAccessError(const ErrorCode_t & errorCode)
    {
        return (
            (errorCode == std::errc::permission_denied) ||
            (errorCode == std::errc::operation_not_permitted) ||
            (errorCode == std::errc::read_only_file_system));
    }

    [[nodiscard]] inline ErrorCode_t makeErrnoErrorCode(const int errnoValue)
    {
        return ErrorCode_t(errnoValue, std::generic_category());
    }

    template <typename T>
    [[nodiscard]] std::wstring getStreamStateString(const T state)
    {
        std::wstring str;

        // clang-format off
        if (state == std::ios::goodbit)    { str += L"good/"; }
        if (state &  std::ios::eofbit)     { str += L"end_of_file/"; }
        if (state &  std::ios::failbit)    { str += L"format_or_extract_error/"; }
        if (state &  std::ios::badbit)     { str += L"irrecoverable_stream_error/"; }
        // clang-format on

        if (str.empty())
        {
            str += L"unknown_error";
        }

        if (str.back() == L'/')
        {
            str.pop_back();
        }

        return (L"fstream_" + str);
    }

    [[nodiscard]] inline std::wstring fileSizeToString(const std::size_t size)
    {
        std::wostringstream ss;
        ss.imbue(std::locale::classic());

        auto appendSize =
            [&](const std::size_t step, const wchar_t letter, const bool willForce = false) {
                if ((size < step) || willForce)
                {
                    ss << std::setprecision(3)
                       << (static_cast<long double>(size) / static_cast<long double>(step / 1000))
                       << letter;

                    return true;
                }
                else
                {
                    return false;
                }
            };

        if (!appendSize(1000, L'B'))
        {
            if (!appendSize(1000'000, L'K'))
            {
                if (!appendSize(1'000'000'000, L'M'))
                {
                    appendSize(1'000'000'000'000, L'G', true);
                }
            }
        }

        return ss.str();
    }

    [[nodiscard]] inline bool existsIgnoringErrors(const fs::path & path, const bool returnOnError)
    {
        ErrorCode_t errorCodeIgnored;
        const bool result{ fs::exists(path, errorCodeIgnored) };

        if (errorCodeIgnored)
        {
            return returnOnError;
        }
        else
        {
            return result;
        }
    }

    [[nodiscard]] inline bool isDirectoryIgnoringErrors(const fs::path & path)
    {
        ErrorCode_t errorCodeIgnored;
        return fs::is_directory(path, errorCodeIgnored);
    }

} // namespace plasma_backup

#endif // PLASMA_BACKUP_FILESYSTEM_COMMON_HPP_INCLUDED
