#ifndef PLASMA_BACKUP_COPY_ERROR_HPP_INCLUDED
#define PLASMA_BACKUP_COPY_ERROR_HPP_INCLUDED
//
// copy-error.hpp
//
#include "enums.hpp"
#include "filesystem-common.hpp"

#include <string>
#include <system_error>

namespace plasma_backup
{

    // Thrown by the TreeCopier only when it was NOT told to ignore errors.
    class copy_error : public std::system_error
    {
      public:
        copy_error(const ErrorKind kind, const fs::path & path, const ErrorCode_t & errorCode)
            : std::system_error(errorCode, makeWhat(kind, path))
            , m_kind(kind)
            , m_path(path)
        {}

        inline ErrorKind kind() const noexcept { return m_kind; }
        inline const fs::path & path() const noexcept { return m_path; }

      private:
        static std::string makeWhat(const ErrorKind kind, const fs::path & path)
        {
            std::string str;
            str += strutil::toNarrowString(toString(kind));
            str += " failed for \"";
            str += path.string();
            str += '\"';
            return str;
        }

      private:
        ErrorKind m_kind;
        fs::path m_path;
    };

} // namespace plasma_backup

#endif // PLASMA_BACKUP_COPY_ERROR_HPP_INCLUDED
