// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// system-info.cpp
//
#include "system-info.hpp"

#include "str-util.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <memory>
#include <stdexcept>
#include <vector>

#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace plasma_backup
{

    namespace
    {
        struct PipeCloser
        {
            void operator()(FILE * pipePtr) const noexcept
            {
                if (pipePtr != nullptr)
                {
                    pclose(pipePtr);
                }
            }
        };

        std::string getEnvVar(const char * const name)
        {
            const char * const valuePtr{ std::getenv(name) };
            return ((valuePtr == nullptr) ? std::string() : std::string(valuePtr));
        }

        // returns false if there is no passwd entry for this process's user
        bool findPasswdEntry(std::string & home, std::string & user)
        {
            long bufferSize{ sysconf(_SC_GETPW_R_SIZE_MAX) };
            if (bufferSize <= 0)
            {
                bufferSize = 16384;
            }

            std::vector<char> buffer(static_cast<std::size_t>(bufferSize));
            passwd passwdEntry{};
            passwd * resultPtr{ nullptr };

            const int result{ getpwuid_r(
                getuid(), &passwdEntry, buffer.data(), buffer.size(), &resultPtr) };

            if ((result != 0) || (resultPtr == nullptr))
            {
                return false;
            }

            home = ((passwdEntry.pw_dir == nullptr) ? "" : passwdEntry.pw_dir);
            user = ((passwdEntry.pw_name == nullptr) ? "" : passwdEntry.pw_name);
            return true;
        }
    } // namespace

    Environment detectEnvironment()
    {
        Environment environment;

        std::string home{ getEnvVar("HOME") };
        std::string user{ getEnvVar("USER") };

        if (home.empty() || user.empty())
        {
            std::string passwdHome;
            std::string passwdUser;
            if (findPasswdEntry(passwdHome, passwdUser))
            {
                if (home.empty())
                {
                    home = passwdHome;
                }

                if (user.empty())
                {
                    user = passwdUser;
                }
            }
        }

        if (home.empty())
        {
            throw std::runtime_error(
                "Unable to find the home directory.  $HOME is not set and there is no passwd "
                "entry for this user.");
        }

        environment.home = fs::path(home);
        environment.user = (user.empty() ? unknown_str : user);

        utsname unameInfo{};
        if ((uname(&unameInfo) == 0) && (unameInfo.nodename[0] != '\0'))
        {
            environment.hostname = unameInfo.nodename;
        }
        else
        {
            environment.hostname = "localhost";
        }

        return environment;
    }

    std::string runCommandForOutput(const std::string & command)
    {
        std::unique_ptr<FILE, PipeCloser> pipe(popen(command.c_str(), "r"));
        if (!pipe)
        {
            throw std::runtime_error("popen() failed for: " + command);
        }

        std::string result;
        std::array<char, 256> buffer;
        while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr)
        {
            result += buffer.data();
        }

        return result;
    }

    std::string queryPlasmaVersion()
    {
        try
        {
            const std::string output{ strutil::trimWhitespaceCopy(
                runCommandForOutput("plasmashell --version 2>/dev/null")) };

            return (output.empty() ? unknown_str : output);
        }
        catch (const std::runtime_error &)
        {
            return unknown_str;
        }
    }

    bool restartPlasmaShell(const std::string & quitProgram, const std::string & shellProgram)
    {
        try
        {
            const std::string quitProgramPath{ strutil::trimWhitespaceCopy(
                runCommandForOutput("command -v " + quitProgram + " 2>/dev/null")) };

            if (quitProgramPath.empty())
            {
                return false;
            }

            // nothing the relaunched shell writes can reach the pipe, so this returns right away
            [[maybe_unused]] const std::string output{ runCommandForOutput(
                quitProgram + " " + shellProgram + " >/dev/null 2>&1; (sleep 2; nohup " +
                shellProgram + " >/dev/null 2>&1 &) >/dev/null 2>&1") };

            return true;
        }
        catch (const std::runtime_error &)
        {
            return false;
        }
    }

    std::string parseOsReleasePrettyName(std::istream & is)
    {
        const std::string prefix{ "PRETTY_NAME=" };

        std::string line;
        while (std::getline(is, line))
        {
            strutil::trimWhitespace(line);

            if (!strutil::startsWith(line, prefix))
            {
                continue;
            }

            std::string value{ line.substr(prefix.size()) };
            strutil::trimIf(value, [](const char ch) { return ((ch == '\"') || (ch == '\'')); });
            return value;
        }

        return {};
    }

    std::string readOsVersion(const fs::path & fedoraReleasePath, const fs::path & osReleasePath)
    {
        {
            std::ifstream fileStream(fedoraReleasePath);
            std::string line;
            if (fileStream.is_open() && std::getline(fileStream, line))
            {
                strutil::trimWhitespace(line);
                if (!line.empty())
                {
                    return line;
                }
            }
        }

        {
            std::ifstream fileStream(osReleasePath);
            if (fileStream.is_open())
            {
                const std::string prettyName{ parseOsReleasePrettyName(fileStream) };
                if (!prettyName.empty())
                {
                    return prettyName;
                }
            }
        }

        return unknown_str;
    }

} // namespace plasma_backup
