// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// config-file.cpp
//
#include "config-file.hpp"

#include "str-util.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace plasma_backup
{

    fs::path configFilePath(const Environment & environment)
    {
        return (environment.home / ".config" / "plasma-backup-manager" / "config.json");
    }

    fs::path defaultBackupBase(const Environment & environment)
    {
        return (environment.home / "NAS" / "Backups" / "Fedora" / "KDE");
    }

    fs::path defaultLogDir(const Environment & environment)
    {
        return (environment.home / ".local" / "share" / "plasma-backup-manager");
    }

    fs::path loadBackupBasePath(
        const fs::path & configPath, const fs::path & defaultBase, std::wstring & errorMessage)
    {
        errorMessage.clear();

        if (!existsIgnoringErrors(configPath, false))
        {
            return defaultBase;
        }

        try
        {
            boost::property_tree::ptree tree;
            boost::property_tree::read_json(configPath.string(), tree);

            const auto basePathOpt{ tree.get_optional<std::string>("backup_base_path") };
            if (!basePathOpt)
            {
                return defaultBase;
            }

            const std::string basePathStr{ strutil::trimWhitespaceCopy(*basePathOpt) };
            if (basePathStr.empty())
            {
                errorMessage = L"The backup_base_path in \"" + configPath.wstring() +
                    L"\" is empty, so the default is used instead.";

                return defaultBase;
            }

            return fs::path(basePathStr);
        }
        catch (const boost::property_tree::ptree_error & ex)
        {
            errorMessage = L"Unable to read the config file \"" + configPath.wstring() +
                L"\", so the default backup location is used instead.  (" +
                strutil::toWideString(ex.what()) + L")";

            return defaultBase;
        }
    }

    fs::path resolveBackupPath(
        const Options & options, const Environment & environment, std::wstring & errorMessage)
    {
        errorMessage.clear();

        if (!options.backup_path.empty())
        {
            ErrorCode_t errorCodeIgnored;
            const fs::path absolutePath{ fs::absolute(options.backup_path, errorCodeIgnored) };
            return ((errorCodeIgnored) ? options.backup_path : absolutePath);
        }

        const fs::path basePath{ loadBackupBasePath(
            configFilePath(environment), defaultBackupBase(environment), errorMessage) };

        return (basePath / environment.hostname);
    }

} // namespace plasma_backup
