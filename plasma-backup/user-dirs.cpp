// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// user-dirs.cpp
//
#include "user-dirs.hpp"

#include "str-util.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <map>

namespace plasma_backup
{

    namespace
    {
        // XDG_DOWNLOAD_DIR is singular, the folder is not
        std::string nameFromKey(const std::string & key)
        {
            // clang-format off
            if      (key.find("DOCUMENTS") != std::string::npos) { return "Documents"; }
            else if (key.find("PICTURES")  != std::string::npos) { return "Pictures";  }
            else if (key.find("VIDEOS")    != std::string::npos) { return "Videos";    }
            else if (key.find("MUSIC")     != std::string::npos) { return "Music";     }
            else if (key.find("DOWNLOAD")  != std::string::npos) { return "Downloads"; }
            else                                                 { return "";          }
            // clang-format on
        }
    } // namespace

    UserDirVec_t parseUserDirs(std::istream & is, const fs::path & home)
    {
        std::map<std::string, std::string> pathsByName;

        std::string line;
        while (std::getline(is, line))
        {
            strutil::trimWhitespace(line);

            if (!strutil::startsWith(line, "XDG_"))
            {
                continue;
            }

            const std::size_t equalsPos{ line.find('=') };
            if (equalsPos == std::string::npos)
            {
                continue;
            }

            const std::string name{ nameFromKey(line.substr(0, equalsPos)) };
            if (name.empty())
            {
                continue;
            }

            std::string value{ line.substr(equalsPos + 1) };
            strutil::trimIf(value, [](const char ch) { return (ch == '\"'); });

            if (value.empty())
            {
                continue;
            }

            strutil::replaceAll(value, "${HOME}", home.string());
            strutil::replaceAll(value, "$HOME", home.string());

            // later lines win, same as the shell sourcing this file would do
            pathsByName[name] = value;
        }

        UserDirVec_t userDirs;
        for (const std::string & name : user_dir_names)
        {
            const auto iter{ pathsByName.find(name) };
            if (iter != std::end(pathsByName))
            {
                userDirs.push_back(UserDir{ name, fs::path(iter->second) });
            }
        }

        return userDirs;
    }

    UserDirVec_t defaultUserDirs(const fs::path & home)
    {
        UserDirVec_t userDirs;

        for (const std::string & name : user_dir_names)
        {
            userDirs.push_back(UserDir{ name, (home / name) });
        }

        return userDirs;
    }

    UserDirVec_t findUserDirs(const Environment & environment)
    {
        const fs::path userDirsFilePath{ environment.home / ".config" / "user-dirs.dirs" };

        if (!existsIgnoringErrors(userDirsFilePath, false))
        {
            return defaultUserDirs(environment.home);
        }

        std::ifstream fileStream(userDirsFilePath);
        if (!fileStream.is_open())
        {
            return defaultUserDirs(environment.home);
        }

        return parseUserDirs(fileStream, environment.home);
    }

    fs::path findUserDirPath(const UserDirVec_t & userDirs, const std::string & name)
    {
        const auto iter{ std::find_if(
            std::begin(userDirs), std::end(userDirs), [&name](const UserDir & userDir) {
                return (userDir.name == name);
            }) };

        if (iter == std::end(userDirs))
        {
            return {};
        }

        return iter->path;
    }

} // namespace plasma_backup
