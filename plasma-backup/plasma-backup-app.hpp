#ifndef PLASMA_BACKUP_PLASMA_BACKUP_APP_HPP_INCLUDED
#define PLASMA_BACKUP_PLASMA_BACKUP_APP_HPP_INCLUDED
//
// plasma-backup-app.hpp
//
#include "backup-metadata.hpp"
#include "backup-runner.hpp"
#include "counters.hpp"
#include "options.hpp"
#include "verified-output.hpp"

#include <memory>
#include <string>
#include <vector>

namespace plasma_backup
{

    // The command line application.  Converts the command line arguments into options, runs the
    // command on this thread, and wraps all print/output operations.
    class PlasmaBackupApp : public IProgressSink
    {
      public:
        PlasmaBackupApp(const std::vector<std::string> & args, const Environment & environment);
        virtual ~PlasmaBackupApp() = default;

        // returns the process exit code
        int run();

        inline const Options & options() const noexcept { return m_options; }

        // IProgressSink
        void report(const ProgressMessage & message) override;

      private:
        void setupOptions();
        void setupOutput();

        int runCommand();
        int runBackup();
        int runRestore();
        int runList();
        int runInfo();

        int finishRun(const RunResult & result);

        void printUsage();
        void printJobSummary();
        void printOptionsSummary();
        void printListing(const BackupListing & listing);

        void printLine(std::wstring_view str, const Color color = Color::Default);

        [[noreturn]] void printAndThrow(const std::wstring & errorMessage);

        RunSettings makeRunSettings() const;

      private:
        std::vector<std::string> m_args;
        Environment m_environment;
        Options m_options;
        std::vector<std::wstring> m_optionWarnings;
        OutcomeCounter m_counter;

        // replaced once the options say where the logfile goes
        std::unique_ptr<VerifiedOutput> m_outputUPtr;
    };

} // namespace plasma_backup

#endif // PLASMA_BACKUP_PLASMA_BACKUP_APP_HPP_INCLUDED
