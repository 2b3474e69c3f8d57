// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// file-content.cpp
//
#include "file-content.hpp"

#include <array>
#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace plasma_backup
{

    FileDescriptor::~FileDescriptor() noexcept { close(); }

    FileDescriptor::FileDescriptor(FileDescriptor && other) noexcept
        : m_fd(std::exchange(other.m_fd, -1))
    {}

    FileDescriptor & FileDescriptor::operator=(FileDescriptor && other) noexcept
    {
        if (this != &other)
        {
            close();
            m_fd = std::exchange(other.m_fd, -1);
        }

        return *this;
    }

    int FileDescriptor::close() noexcept
    {
        if (m_fd < 0)
        {
            return 0;
        }

        // never retry close() on EINTR, on linux the fd is gone either way
        const int result{ ::close(m_fd) };
        m_fd = -1;
        return ((result == 0) ? 0 : errno);
    }

    namespace
    {
        constexpr std::size_t copy_buffer_size{ 64 * 1024 };

        int openRetryingIfInterrupted(const char * const path, const int flags, const mode_t mode)
        {
            int fd{ -1 };

            do
            {
                fd = ::open(path, flags, mode);
            } while ((fd < 0) && (errno == EINTR));

            return fd;
        }

        // returns zero on success, otherwise the errno
        int writeAll(const int fd, const char * data, std::size_t size)
        {
            while (size > 0)
            {
                const ssize_t writtenCount{ ::write(fd, data, size) };

                if (writtenCount < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }

                    return errno;
                }

                // a short write is not an error, just write the rest
                data += writtenCount;
                size -= static_cast<std::size_t>(writtenCount);
            }

            return 0;
        }

        // true if to already exists and is the very same file that fd has open
        bool isSameFile(const int fd, const fs::path & to)
        {
            struct stat fromStat;
            struct stat toStat;

            if ((::fstat(fd, &fromStat) != 0) || (::stat(to.c_str(), &toStat) != 0))
            {
                return false;
            }

            return ((fromStat.st_dev == toStat.st_dev) && (fromStat.st_ino == toStat.st_ino));
        }
    } // namespace

    void copyFileContent(
        const fs::path & from,
        const fs::path & to,
        ErrorCode_t & errorCode,
        std::size_t & bytesCopied)
    {
        errorCode.clear();
        bytesCopied = 0;

        FileDescriptor source(
            openRetryingIfInterrupted(from.c_str(), (O_RDONLY | O_CLOEXEC), 0));

        if (!source.isOpen())
        {
            errorCode = makeErrnoErrorCode(errno);
            return;
        }

        // opening with O_TRUNC would empty the source before a single byte was read
        if (isSameFile(source.get(), to))
        {
            errorCode = std::make_error_code(std::errc::invalid_argument);
            return;
        }

        // 0666 because the umask is what should decide, never the source's permission bits
        FileDescriptor destination(openRetryingIfInterrupted(
            to.c_str(), (O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC), 0666));

        if (!destination.isOpen())
        {
            errorCode = makeErrnoErrorCode(errno);
            return;
        }

        std::array<char, copy_buffer_size> buffer;

        while (true)
        {
            const ssize_t readCount{ ::read(source.get(), buffer.data(), buffer.size()) };

            if (readCount < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }

                errorCode = makeErrnoErrorCode(errno);
                return;
            }

            if (readCount == 0)
            {
                break;
            }

            const int writeErrno{ writeAll(
                destination.get(), buffer.data(), static_cast<std::size_t>(readCount)) };

            if (writeErrno != 0)
            {
                errorCode = makeErrnoErrorCode(writeErrno);
                return;
            }

            bytesCopied += static_cast<std::size_t>(readCount);
        }

        // NFS reports some write errors (like running out of quota) only on close
        if (const int closeErrno{ destination.close() }; closeErrno != 0)
        {
            errorCode = makeErrnoErrorCode(closeErrno);
        }
    }

} // namespace plasma_backup
