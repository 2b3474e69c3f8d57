// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// options.cpp
//
#include "options.hpp"

#include "str-util.hpp"

namespace plasma_backup
{

    bool CategorySelection::isSelected(const Category category) const noexcept
    {
        // clang-format off
        switch (category)
        {
            case Category::KdeSettings: { return kde_settings; }
            case Category::AppConfigs:  { return app_configs;  }
            case Category::Firefox:     { return firefox;      }
            case Category::Thunderbird: { return thunderbird;  }
            case Category::UserDirs:    { return user_dirs;    }
            default:                    { return false;        }
        }
        // clang-format on
    }

    void CategorySelection::select(const Category category, const bool willSelect) noexcept
    {
        // clang-format off
        switch (category)
        {
            case Category::KdeSettings: { kde_settings = willSelect; break; }
            case Category::AppConfigs:  { app_configs  = willSelect; break; }
            case Category::Firefox:     { firefox      = willSelect; break; }
            case Category::Thunderbird: { thunderbird  = willSelect; break; }
            case Category::UserDirs:    { user_dirs    = willSelect; break; }
            default:                    { break; }
        }
        // clang-format on
    }

    bool CategorySelection::isAnySelected() const noexcept
    {
        return (kde_settings || app_configs || firefox || thunderbird || user_dirs);
    }

    namespace
    {
        std::string cleanPathArg(const std::string & arg)
        {
            std::string pathStr{ arg };

            // remove wrapping quotes
            strutil::trimIf(
                pathStr, [](const auto ch) { return (strutil::isWhitespace(ch) || (ch == '\"')); });

            return pathStr;
        }

        bool setCommandIf(Options & options, const std::string & arg)
        {
            // clang-format off
            if      (arg == "backup")  { options.command = Command::Backup;  }
            else if (arg == "restore") { options.command = Command::Restore; }
            else if (arg == "list")    { options.command = Command::List;    }
            else if (arg == "info")    { options.command = Command::Info;    }
            else if (arg == "help")    { options.command = Command::Help;    }
            else                       { return false; }
            // clang-format on

            return true;
        }

        // returns false if arg is not an option string
        bool setOptionIf(Options & options, const std::string & arg)
        {
            if (arg == "--kde-only")
            {
                options.categories              = CategorySelection::none();
                options.categories.kde_settings = true;
            }
            else if (arg == "--no-app-configs")
            {
                options.categories.app_configs = false;
            }
            else if (arg == "--no-firefox")
            {
                options.categories.firefox = false;
            }
            else if (arg == "--no-thunderbird")
            {
                options.categories.thunderbird = false;
            }
            else if (arg == "--no-user-dirs")
            {
                options.categories.user_dirs = false;
            }
            else if (arg == "--strict")
            {
                options.strict = true;
            }
            else if (arg == "--verbose")
            {
                options.verbose = true;
            }
            else if (arg == "--quiet")
            {
                options.quiet = true;
            }
            else if (arg == "--no-log")
            {
                options.no_log = true;
            }
            else if (arg == "--restart-plasma")
            {
                options.restart_plasma = true;
            }
            else if (
                (arg == "--color") || (arg == "--colors") || (arg == "--color-on") ||
                (arg == "--colors-on"))
            {
                options.color = true;
            }
            else if (
                (arg == "--no-color") || (arg == "--no-colors") || (arg == "--color-off") ||
                (arg == "--colors-off"))
            {
                options.color = false;
            }
            else
            {
                return false;
            }

            return true;
        }
    } // namespace

    Options parseCommandLine(const std::vector<std::string> & args)
    {
        Options options;

        bool isCommandSet{ false };
        bool isHelpRequested{ false };

        for (std::size_t i(0); i < args.size(); ++i)
        {
            const std::string & arg{ args.at(i) };

            if ((arg == "--path") || (arg == "--log-dir"))
            {
                if ((i + 1) >= args.size())
                {
                    throw command_line_error("The " + arg + " option needs a directory after it.");
                }

                const std::string pathStr{ cleanPathArg(args.at(++i)) };
                if (pathStr.empty())
                {
                    throw command_line_error("The " + arg + " option was given an empty path.");
                }

                if (arg == "--path")
                {
                    options.backup_path = fs::path(pathStr);
                }
                else
                {
                    options.log_dir = fs::path(pathStr);
                }
            }
            else if ((arg == "--help") || (arg == "-h"))
            {
                isHelpRequested = true;
            }
            else if (setOptionIf(options, arg))
            {
                continue;
            }
            else if (strutil::startsWith(arg, "-"))
            {
                throw command_line_error("Unknown option: \"" + arg + "\"");
            }
            else if (!isCommandSet)
            {
                if (!setCommandIf(options, arg))
                {
                    throw command_line_error("Unknown command: \"" + arg + "\"");
                }

                isCommandSet = true;
            }
            else if ((Command::Restore == options.command) && options.restore_path.empty())
            {
                const std::string pathStr{ cleanPathArg(arg) };
                if (pathStr.empty())
                {
                    throw command_line_error("The restore command was given an empty path.");
                }

                options.restore_path = fs::path(pathStr);
            }
            else
            {
                throw command_line_error("Extra/Incorrect argument: \"" + arg + "\"");
            }
        }

        if (isHelpRequested || !isCommandSet)
        {
            options.command = Command::Help;
            return options;
        }

        if ((Command::Restore == options.command) && options.restore_path.empty())
        {
            throw command_line_error("The restore command needs the backup directory to restore.");
        }

        return options;
    }

    std::vector<std::wstring> fixConflictingOptions(Options & options)
    {
        std::vector<std::wstring> warnings;

        if (options.quiet && options.verbose)
        {
            options.quiet = false;
            warnings.emplace_back(L"The --quiet option disabled by the --verbose option.");
        }

        if ((Command::Backup == options.command) && !options.categories.isAnySelected())
        {
            warnings.emplace_back(
                L"Every category was excluded, so the backup will only hold the metadata file.");
        }

        if ((Command::Backup != options.command) && (options.categories != CategorySelection()))
        {
            options.categories = CategorySelection();
            warnings.emplace_back(L"The category options only apply to the backup command.");
        }

        if ((Command::Restore == options.command || Command::Info == options.command) &&
            !options.backup_path.empty())
        {
            options.backup_path.clear();
            warnings.emplace_back(
                L"The --path option only applies to the backup and list commands.");
        }

        if ((Command::Restore != options.command) && options.restart_plasma)
        {
            options.restart_plasma = false;
            warnings.emplace_back(
                L"The --restart-plasma option only applies to the restore command.");
        }

        if (options.no_log && !options.log_dir.empty())
        {
            options.log_dir.clear();
            warnings.emplace_back(L"The --log-dir option disabled by the --no-log option.");
        }

        return warnings;
    }

} // namespace plasma_backup
