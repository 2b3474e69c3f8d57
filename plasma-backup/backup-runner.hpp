#ifndef PLASMA_BACKUP_BACKUP_RUNNER_HPP_INCLUDED
#define PLASMA_BACKUP_BACKUP_RUNNER_HPP_INCLUDED
//
// backup-runner.hpp
//
#include "backup-plan.hpp"
#include "copy-outcome.hpp"
#include "counters.hpp"
#include "enums.hpp"
#include "filesystem-common.hpp"
#include "options.hpp"

#include <atomic>
#include <string>

namespace plasma_backup
{

    struct ProgressMessage
    {
        std::wstring text;
        Color color = Color::Default;
    };

    // Whatever shows the user what is happening.  Called from whatever thread runs the
    // BackupRunner, and one call per line, in order.
    struct IProgressSink
    {
        virtual ~IProgressSink() = default;
        virtual void report(const ProgressMessage & message) = 0;
    };

    struct RunSettings
    {
        // false means the first error ends the whole run as a failure
        bool ignore_errors = true;

        // every copied file gets a line, otherwise only the skips do
        bool verbose = false;

        const std::atomic_bool * cancel_flag_ptr = nullptr;

        // after a restore that brought back the KDE settings, quit and relaunch plasmashell
        bool restart_plasma              = false;
        std::string plasma_quit_program  = "kquitapp6";
        std::string plasma_shell_program = "plasmashell";
    };

    struct RunResult
    {
        RunStatus status = RunStatus::Failed;

        // the new timestamped folder of a backup, or the folder restored from
        fs::path backup_dir;

        // one line fit for a status bar or a message box
        std::wstring message;
    };

    [[nodiscard]] inline Color toColor(const RunStatus status) noexcept
    {
        // clang-format off
        switch (status)
        {
            case RunStatus::Success:       { return Color::Green;  }
            case RunStatus::NothingCopied: { return Color::Yellow; }
            case RunStatus::Cancelled:     { return Color::Yellow; }
            case RunStatus::Failed:
            default:                       { return Color::Red;    }
        }
        // clang-format on
    }

    // Runs one whole backup or restore, one TreeCopier per root in the plan.  Never creates any
    // threads of its own.
    class BackupRunner
    {
      public:
        BackupRunner(
            const Environment & environment,
            IProgressSink & sink,
            OutcomeCounter & counter,
            const RunSettings & settings);

        // backupPath is where this machine's backups go, the new backup will be a timestamped
        // folder inside it.
        RunResult runBackup(const CategorySelection & categories, const fs::path & backupPath);

        // backupDir is one backup folder, i.e. the one holding backup_metadata.json
        RunResult runRestore(const fs::path & backupDir);

        [[nodiscard]] static std::wstring makeOutcomeLine(const CopyOutcome & outcome);

      private:
        // returns false if cancelled
        bool runTasks(const CopyTaskVec_t & tasks, const Command command);
        void runTask(const CopyTask & task);

        void replaceDestination(const CopyTask & task);
        void reportOutcome(const CopyOutcome & outcome);
        void reportNotes(const BackupPlan & plan);
        void reportSummary();
        void restartPlasmaIfNeeded(const BackupPlan & plan);

        void report(const std::wstring & text, const Color color = Color::Default);

        bool isCancelRequested() const noexcept;

        RunResult finish(
            const RunStatus status, const fs::path & backupDir, const std::wstring & message);

      private:
        Environment m_environment;
        IProgressSink & m_sink;
        OutcomeCounter & m_counter;
        RunSettings m_settings;
    };

} // namespace plasma_backup

#endif // PLASMA_BACKUP_BACKUP_RUNNER_HPP_INCLUDED
