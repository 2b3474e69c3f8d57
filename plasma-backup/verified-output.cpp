// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// verified-output.cpp
//
#include "verified-output.hpp"

#include <iostream>

namespace plasma_backup
{

    VerifiedOutput::VerifiedOutput(
        const fs::path & logDirPath, const std::wstring & logFilenameBase)
        : m_isColorAllowed(false)
        , m_isQuiet(false)
        , m_logFilePath()
        , m_logFileStream()
        , m_publicFunctionMutex()
    {
        setupLogfile(logDirPath, logFilenameBase);
    }

    void VerifiedOutput::color(const bool willEnable)
    {
        std::scoped_lock scopedLock(m_publicFunctionMutex);
        m_isColorAllowed = willEnable;
    }

    bool VerifiedOutput::color() const
    {
        std::scoped_lock scopedLock(m_publicFunctionMutex);
        return m_isColorAllowed;
    }

    void VerifiedOutput::quiet(const bool willBeQuiet)
    {
        std::scoped_lock scopedLock(m_publicFunctionMutex);
        m_isQuiet = willBeQuiet;
    }

    bool VerifiedOutput::quiet() const
    {
        std::scoped_lock scopedLock(m_publicFunctionMutex);
        return m_isQuiet;
    }

    void VerifiedOutput::print(std::wstring_view sv, const Color color)
    {
        if (sv.empty())
        {
            return;
        }

        std::scoped_lock scopedLock(m_publicFunctionMutex);
        print_internal(sv, color);
    }

    void VerifiedOutput::printToLogfileOnly(std::wstring_view sv)
    {
        std::scoped_lock scopedLock(m_publicFunctionMutex);
        printToLogfile_internal(sv);
    }

    bool VerifiedOutput::isLogging() const
    {
        std::scoped_lock scopedLock(m_publicFunctionMutex);
        return canWriteToLogfile();
    }

    fs::path VerifiedOutput::logfilePath() const
    {
        std::scoped_lock scopedLock(m_publicFunctionMutex);
        return m_logFilePath;
    }

    bool VerifiedOutput::setupLogfile(
        const fs::path & logDirPath, const std::wstring & logFilenameBase)
    {
        if (logDirPath.empty() || logFilenameBase.empty())
        {
            return false;
        }

        ErrorCode_t errorCode;
        fs::create_directories(logDirPath, errorCode);
        if (errorCode)
        {
            print_internal(
                L"Log Error: Unable to create the log directory \"" + logDirPath.wstring() +
                    L"\", so there will be no logfile.  {" + toString(errorCode) + L"}",
                Color::Red);

            return false;
        }

        fs::path path{ logDirPath };

        {
            const std::wstring timeStr{ strutil::toWideString(
                makeLocalTimeString("--%F--%H-%M-%S--")) };

            const std::size_t maxDigitCount{ 3 };
            std::size_t fileNumber{ 0 };
            std::wstring finalFilenameStr;
            do
            {
                std::wstring fileNumberStr = std::to_wstring(fileNumber++);
                if (fileNumberStr.size() < maxDigitCount)
                {
                    fileNumberStr = std::wstring((maxDigitCount - fileNumberStr.size()), L'0')
                                        .append(fileNumberStr);
                }

                finalFilenameStr = (logFilenameBase + timeStr + fileNumberStr + L".log");

            } while (existsIgnoringErrors((path / finalFilenameStr), false));

            path /= finalFilenameStr;
        }

        if (m_logFileStream.is_open())
        {
            m_logFileStream.close();
            m_logFileStream.clear();
        }

        m_logFileStream.open(path, (std::ios::trunc | std::ios::out));

        if (!canWriteToLogfile())
        {
            print_internal(
                std::wstring(L"Log Error: ") + getStreamStateString(m_logFileStream.rdstate()) +
                    L": While trying to create/truncate the logfile: \"" + path.wstring() + L"\"",
                Color::Red);

            return false;
        }

        m_logFilePath = path;
        return true;
    }

    void VerifiedOutput::print_internal(std::wstring_view sv, const Color color)
    {
        if (!m_isQuiet || (Color::Yellow == color) || (Color::Red == color))
        {
            printTo_internal(std::wcout, sv, color);
        }

        printToLogfile_internal(sv);
    }

    void VerifiedOutput::printToLogfile_internal(std::wstring_view sv)
    {
        if (!canWriteToLogfile())
        {
            return;
        }

        std::wstring line{ L"[" };
        line += strutil::toWideString(makeLocalTimeString("%H:%M:%S"));
        line += L"] ";
        line += sv;

        printTo_internal(m_logFileStream, line, Color::Disabled);
    }

    void VerifiedOutput::printTo_internal(
        std::wostream & os, std::wstring_view sv, const Color color)
    {
        std::size_t badCharacterCount{ 0 };

        if (m_isColorAllowed && (color != Color::Disabled))
        {
            colorStart(os, color);
        }

        for (std::size_t i(0); i < sv.size(); ++i)
        {
            bool wasException{ false };

            try
            {
                os << sv[i];
            }
            catch (const std::exception &)
            {
                wasException = true;
            }

            if (wasException || !os.good())
            {
                os.clear();
                os.flush();

                alertColorSwitch(os, color);
                os << L"?";
                alertColorRestore(os, color);

                ++badCharacterCount;
            }
        }

        if (badCharacterCount > 0)
        {
            alertColorSwitch(os, color);
            os << L"   {output_error_" << badCharacterCount << L"_bad_chars}";
            alertColorRestore(os, color);
        }

        if (m_isColorAllowed && (color != Color::Disabled))
        {
            colorStop(os);
        }

        os << std::endl;
    }

    void VerifiedOutput::colorStart(std::wostream & os, const Color color) const
    {
        if (!m_isColorAllowed || (color == Color::Disabled))
        {
            return;
        }

        os << toConsoleCode(color);
    }

    void VerifiedOutput::colorStop(std::wostream & os) const { colorStart(os, Color::Default); }

    void VerifiedOutput::alertColorSwitch(std::wostream & os, const Color color) const
    {
        if (!m_isColorAllowed || (color == Color::Disabled))
        {
            return;
        }

        if (Color::Yellow == color)
        {
            colorStart(os, Color::Red);
        }
        else
        {
            colorStart(os, Color::Yellow);
        }
    }

    void VerifiedOutput::alertColorRestore(std::wostream & os, const Color color) const
    {
        if (!m_isColorAllowed || (color == Color::Disabled))
        {
            return;
        }

        colorStart(os, color);
    }

} // namespace plasma_backup
