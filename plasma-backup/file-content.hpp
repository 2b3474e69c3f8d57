#ifndef PLASMA_BACKUP_FILE_CONTENT_HPP_INCLUDED
#define PLASMA_BACKUP_FILE_CONTENT_HPP_INCLUDED
//
// file-content.hpp
//
#include "filesystem-common.hpp"

#include <cstddef>

namespace plasma_backup
{

    // owns a POSIX file descriptor, closed when this goes out of scope
    class FileDescriptor
    {
      public:
        FileDescriptor() = default;
        explicit FileDescriptor(const int fd) noexcept
            : m_fd(fd)
        {}

        ~FileDescriptor() noexcept;

        FileDescriptor(const FileDescriptor &) = delete;
        FileDescriptor & operator=(const FileDescriptor &) = delete;

        FileDescriptor(FileDescriptor && other) noexcept;
        FileDescriptor & operator=(FileDescriptor && other) noexcept;

        inline int get() const noexcept { return m_fd; }
        inline bool isOpen() const noexcept { return (m_fd >= 0); }

        // returns zero on success, otherwise the errno from close()
        int close() noexcept;

      private:
        int m_fd = -1;
    };

    // Copies the bytes of the file at from into to, creating or truncating to.  Nothing but
    // content is copied:  ownership, permission bits, timestamps, and xattrs are all left to
    // whatever the destination filesystem gives a brand new file.  On failure errorCode is set
    // and the destination might be left partially written.  If to is the same file as from
    // (the same path, or a link to it) nothing is written and errorCode is invalid_argument.
    void copyFileContent(
        const fs::path & from,
        const fs::path & to,
        ErrorCode_t & errorCode,
        std::size_t & bytesCopied);

} // namespace plasma_backup

#endif // PLASMA_BACKUP_FILE_CONTENT_HPP_INCLUDED
