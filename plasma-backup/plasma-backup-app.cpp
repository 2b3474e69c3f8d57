// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// plasma-backup-app.cpp
//
#include "plasma-backup-app.hpp"

#include "config-file.hpp"
#include "copy-error.hpp"
#include "str-util.hpp"
#include "system-info.hpp"
#include "util.hpp"

#include <sstream>

namespace plasma_backup
{

    PlasmaBackupApp::PlasmaBackupApp(
        const std::vector<std::string> & args, const Environment & environment)
        : m_args(args)
        , m_environment(environment)
        , m_options()
        , m_optionWarnings()
        , m_counter()
        , m_outputUPtr(std::make_unique<VerifiedOutput>())
    {
        m_outputUPtr->color(Options::isColorEnabledByDefault());
    }

    int PlasmaBackupApp::run()
    {
        try
        {
            setupOptions();
            setupOutput();
            return runCommand();
        }
        catch (const silent_runtime_error &)
        {
            // whatever threw this already printed why
        }
        catch (const copy_error & ex)
        {
            printLine(
                (L"Copy Error: \"" + strutil::toWideString(ex.what()) + L"\"  {" +
                 toString(ex.code()) + L"}"),
                Color::Red);
        }
        catch (const std::exception & ex)
        {
            printLine(
                (L"Fatal Exception: \"" + strutil::toWideString(ex.what()) + L"\""), Color::Red);
        }

        return 1;
    }

    void PlasmaBackupApp::report(const ProgressMessage & message)
    {
        printLine(message.text, message.color);
    }

    void PlasmaBackupApp::setupOptions()
    {
        try
        {
            m_options = parseCommandLine(m_args);
        }
        catch (const command_line_error & ex)
        {
            printAndThrow(strutil::toWideString(ex.what()));
        }

        m_optionWarnings = fixConflictingOptions(m_options);

        if (!m_options.restore_path.empty())
        {
            ErrorCode_t errorCode;
            const fs::path absolutePath{ fs::absolute(m_options.restore_path, errorCode) };
            if (errorCode)
            {
                printAndThrow(
                    L"The restore path could not be made absolute: \"" +
                    m_options.restore_path.wstring() + L"\"  {" + toString(errorCode) + L"}");
            }

            m_options.restore_path = absolutePath;
        }
    }

    void PlasmaBackupApp::setupOutput()
    {
        // help, list, and info have nothing worth keeping in a logfile
        const bool isLogWorthy{ (Command::Backup == m_options.command) ||
                                (Command::Restore == m_options.command) };

        fs::path logDirPath;
        if (isLogWorthy && !m_options.no_log)
        {
            logDirPath =
                (m_options.log_dir.empty() ? defaultLogDir(m_environment) : m_options.log_dir);
        }

        m_outputUPtr = std::make_unique<VerifiedOutput>(logDirPath);
        m_outputUPtr->color(m_options.color);
        m_outputUPtr->quiet(m_options.quiet);
    }

    int PlasmaBackupApp::runCommand()
    {
        if (Command::Help == m_options.command)
        {
            printUsage();
            return 0;
        }

        printJobSummary();

        for (const std::wstring & warning : m_optionWarnings)
        {
            printLine(L"Warning:  " + warning, Color::Yellow);
        }

        printOptionsSummary();

        // clang-format off
        switch (m_options.command)
        {
            case Command::Backup:  { return runBackup();  }
            case Command::Restore: { return runRestore(); }
            case Command::List:    { return runList();    }
            case Command::Info:    { return runInfo();    }
            case Command::Help:
            default:               { printUsage(); return 0; }
        }
        // clang-format on
    }

    int PlasmaBackupApp::runBackup()
    {
        std::wstring configErrorMessage;
        const fs::path backupPath{ resolveBackupPath(
            m_options, m_environment, configErrorMessage) };

        if (!configErrorMessage.empty())
        {
            printLine(L"Warning:  " + configErrorMessage, Color::Yellow);
        }

        printLine(L"Backup location: " + backupPath.wstring());

        BackupRunner runner(m_environment, *this, m_counter, makeRunSettings());
        return finishRun(runner.runBackup(m_options.categories, backupPath));
    }

    int PlasmaBackupApp::runRestore()
    {
        BackupRunner runner(m_environment, *this, m_counter, makeRunSettings());
        return finishRun(runner.runRestore(m_options.restore_path));
    }

    int PlasmaBackupApp::runList()
    {
        std::wstring configErrorMessage;
        const fs::path backupPath{ resolveBackupPath(
            m_options, m_environment, configErrorMessage) };

        if (!configErrorMessage.empty())
        {
            printLine(L"Warning:  " + configErrorMessage, Color::Yellow);
        }

        std::wstring listErrorMessage;
        const BackupListingVec_t listings{ listBackups(backupPath, listErrorMessage) };

        if (!listErrorMessage.empty())
        {
            printLine(listErrorMessage, Color::Yellow);
        }

        if (listings.empty())
        {
            printLine(L"No backups found in " + backupPath.wstring());
            return 0;
        }

        printLine(L"Backups in " + backupPath.wstring() + L":");

        for (const BackupListing & listing : listings)
        {
            printListing(listing);
        }

        printLine(L"Found " + std::to_wstring(listings.size()) + L" backups.");
        return 0;
    }

    int PlasmaBackupApp::runInfo()
    {
        std::wstring configErrorMessage;
        const fs::path backupPath{ resolveBackupPath(
            m_options, m_environment, configErrorMessage) };

        if (!configErrorMessage.empty())
        {
            printLine(L"Warning:  " + configErrorMessage, Color::Yellow);
        }

        std::wostringstream ss;
        ss << L"Hostname:       " << strutil::toWideString(m_environment.hostname) << L"\n";
        ss << L"User:           " << strutil::toWideString(m_environment.user) << L"\n";
        ss << L"Home:           " << m_environment.home.wstring() << L"\n";
        ss << L"KDE Version:    " << strutil::toWideString(queryPlasmaVersion()) << L"\n";
        ss << L"OS:             " << strutil::toWideString(readOsVersion()) << L"\n";
        ss << L"Default Backup: " << backupPath.wstring() << L"\n";
        ss << L"Config File:    " << configFilePath(m_environment).wstring() << L"\n";
        ss << L"Log Directory:  " << defaultLogDir(m_environment).wstring();

        printLine(ss.str());
        return 0;
    }

    int PlasmaBackupApp::finishRun(const RunResult & result)
    {
        // the final result is always shown, even when quiet
        m_outputUPtr->quiet(false);

        if (m_outputUPtr->isLogging())
        {
            printLine(L"Logfile: " + m_outputUPtr->logfilePath().wstring(), Color::Gray);
        }

        printLine((L"Result: " + std::wstring(toString(result.status))), toColor(result.status));

        const bool isFailure{ (RunStatus::Failed == result.status) ||
                              (RunStatus::Cancelled == result.status) };

        return ((isFailure) ? 1 : 0);
    }

    void PlasmaBackupApp::printUsage()
    {
        std::wostringstream ss;

        // clang-format off
        ss << L"\nUsage:\n";
        ss << L"   plasma-backup backup  [--path <dir>] [--kde-only] [--no-app-configs]\n";
        ss << L"                         [--no-firefox] [--no-thunderbird] [--no-user-dirs]\n";
        ss << L"   plasma-backup restore <backup_dir> [--restart-plasma]\n";
        ss << L"   plasma-backup list    [--path <dir>]\n";
        ss << L"   plasma-backup info\n";
        ss << L"    -\n";
        ss << L"    backup            Copies KDE Plasma settings, app configs, and user data into a new\n";
        ss << L"                      timestamped folder under <backup_base>/<hostname>.\n";
        ss << L"    restore           Copies everything in a backup folder back where it came from.\n";
        ss << L"    list              Shows every backup, newest first.\n";
        ss << L"    info              Shows this system's info and the default backup location.\n";
        ss << L"    -\n";
        ss << L"    --path <dir>      Use this folder instead of <backup_base>/<hostname>.\n";
        ss << L"    --kde-only        Only back up the KDE Plasma settings.\n";
        ss << L"    --no-app-configs  Skip the application configs.\n";
        ss << L"    --no-firefox      Skip the Firefox profiles.\n";
        ss << L"    --no-thunderbird  Skip the Thunderbird profiles.\n";
        ss << L"    --no-user-dirs    Skip Documents, Pictures, Videos, Music, and Downloads.\n";
        ss << L"    --restart-plasma  Restarts plasmashell after restoring the KDE settings.\n";
        ss << L"    -\n";
        ss << L"    --help            Shows this, but does nothing else.\n";
        ss << L"    --strict          Stops at the first error instead of skipping what can't be copied.\n";
        ss << L"    --verbose         Shows every file copied, not just the ones skipped.\n";
        ss << L"    --quiet           Shows only warnings, errors, and the final result.\n";
        ss << L"    --log-dir <dir>   Writes the logfile here instead of " << defaultLogDir(m_environment).wstring() << L"\n";
        ss << L"    --no-log          Writes no logfile at all.\n";
        // clang-format on

        ss << L"    --color-on        Enables colored console output.";
        if (Options::isColorEnabledByDefault())
        {
            ss << L"  (default)";
        }
        ss << L"\n";

        ss << L"    --color-off       Disables colored console output.";
        if (!Options::isColorEnabledByDefault())
        {
            ss << L" (default)";
        }

        printLine(ss.str());
    }

    void PlasmaBackupApp::printJobSummary()
    {
        std::wostringstream ss;

        // put the whole call with all the command line arguments in the logfile
        ss << L"plasma-backup";
        for (const std::string & arg : m_args)
        {
            ss << L" " << strutil::toWideString(arg);
        }

        m_outputUPtr->printToLogfileOnly(ss.str());

        ss.str(L"");
        ss << toString(m_options.command) << L" on "
           << strutil::toWideString(m_environment.hostname) << L" for "
           << strutil::toWideString(m_environment.user) << L" started "
           << strutil::toWideString(makeLocalTimeString("%F %T"));

        printLine(ss.str());
    }

    void PlasmaBackupApp::printOptionsSummary()
    {
        std::wstring str;

        auto appendFlagIf = [&](const bool is, const std::wstring & name) {
            if (is)
            {
                if (!str.empty())
                {
                    str += L", ";
                }

                str += name;
            }
        };

        if (Command::Backup == m_options.command)
        {
            for (const Category category : { Category::KdeSettings,
                                             Category::AppConfigs,
                                             Category::Firefox,
                                             Category::Thunderbird,
                                             Category::UserDirs })
            {
                appendFlagIf(
                    m_options.categories.isSelected(category),
                    strutil::toWideString(toFolderName(category)));
            }
        }

        appendFlagIf(m_options.strict, L"strict");
        appendFlagIf(m_options.verbose, L"verbose");
        appendFlagIf(m_options.no_log, L"no_log");
        appendFlagIf(m_options.restart_plasma, L"restart_plasma");

        // only show the color option if it is not set to the default value
        if (Options::isColorEnabledByDefault() != m_options.color)
        {
            appendFlagIf(m_options.color, L"color_on");
            appendFlagIf(!m_options.color, L"color_off");
        }

        if (!str.empty())
        {
            printLine(L"   (" + str + L")");
        }
    }

    void PlasmaBackupApp::printListing(const BackupListing & listing)
    {
        const BackupMetadata & md{ listing.metadata };

        std::wostringstream ss;
        ss << L"\n  Timestamp: " << strutil::toWideString(md.timestamp);
        ss << L"\n  Hostname:  " << strutil::toWideString(md.hostname);
        ss << L"\n  KDE:       " << strutil::toWideString(md.kde_version);
        ss << L"\n  OS:        " << strutil::toWideString(md.os_version);
        ss << L"\n  Path:      " << listing.path.wstring();

        printLine(ss.str(), ((listing.is_metadata_valid) ? Color::Default : Color::Yellow));
    }

    void PlasmaBackupApp::printLine(std::wstring_view str, const Color color)
    {
        m_outputUPtr->print(str, color);
    }

    void PlasmaBackupApp::printAndThrow(const std::wstring & errorMessage)
    {
        printLine(L"Error: " + errorMessage + L" (consider trying --help)", Color::Red);
        throw silent_runtime_error();
    }

    RunSettings PlasmaBackupApp::makeRunSettings() const
    {
        RunSettings settings;
        settings.ignore_errors  = !m_options.strict;
        settings.verbose        = m_options.verbose;
        settings.restart_plasma = m_options.restart_plasma;
        return settings;
    }

} // namespace plasma_backup
