#ifndef PLASMA_BACKUP_VERIFIED_OUTPUT_HPP_INCLUDED
#define PLASMA_BACKUP_VERIFIED_OUTPUT_HPP_INCLUDED
//
// verified-output.hpp
//
#include "enums.hpp"
#include "filesystem-common.hpp"
#include "util.hpp"

#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace plasma_backup
{

    // This is basically a wrapper for wcout that checks wcout.rdstate() after each use and resets
    // if needed.  Config directories are full of filenames with strange unicode characters that
    // cause errors -even in the "wide" wcout.  These errors don't throw exceptions, but they do
    // prevent all further uses of wcout from doing anything.
    //
    // Everything printed also goes to the logfile (if there is one) with the time in front.
    class VerifiedOutput
    {
      public:
        // an empty logDirPath means no logfile
        explicit VerifiedOutput(
            const fs::path & logDirPath          = {},
            const std::wstring & logFilenameBase = L"plasma-backup");

        void color(const bool willEnable);
        bool color() const;

        // when quiet, only Yellow and Red lines make it to the console, the logfile gets them all
        void quiet(const bool willBeQuiet);
        bool quiet() const;

        void print(std::wstring_view sv, const Color color = Color::Default);
        void printToLogfileOnly(std::wstring_view sv);

        bool isLogging() const;
        fs::path logfilePath() const;

      private:
        inline bool canWriteToLogfile() const
        {
            return (m_logFileStream.is_open() && m_logFileStream.good());
        }

        bool setupLogfile(const fs::path & logDirPath, const std::wstring & logFilenameBase);

        void print_internal(std::wstring_view sv, const Color color = Color::Default);
        void printToLogfile_internal(std::wstring_view sv);

        void printTo_internal(
            std::wostream & os, std::wstring_view sv, const Color color = Color::Default);

        void colorStart(std::wostream & os, const Color color) const;
        void colorStop(std::wostream & os) const;
        void alertColorSwitch(std::wostream & os, const Color color) const;
        void alertColorRestore(std::wostream & os, const Color color) const;

      private:
        bool m_isColorAllowed;
        bool m_isQuiet;
        fs::path m_logFilePath;
        OutputFileStream_t m_logFileStream;

        // this is only locked by the public functions, so as long as they all only call private
        // functions this will work fine without being a recursive_mutex
        mutable std::mutex m_publicFunctionMutex;
    };

} // namespace plasma_backup

#endif // PLASMA_BACKUP_VERIFIED_OUTPUT_HPP_INCLUDED
