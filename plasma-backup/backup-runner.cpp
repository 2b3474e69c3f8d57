// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// backup-runner.cpp
//
#include "backup-runner.hpp"

#include "backup-metadata.hpp"
#include "copy-error.hpp"
#include "str-util.hpp"
#include "system-info.hpp"
#include "tree-copier.hpp"
#include "user-dirs.hpp"
#include "util.hpp"

#include <algorithm>
#include <sstream>

namespace plasma_backup
{

    BackupRunner::BackupRunner(
        const Environment & environment,
        IProgressSink & sink,
        OutcomeCounter & counter,
        const RunSettings & settings)
        : m_environment(environment)
        , m_sink(sink)
        , m_counter(counter)
        , m_settings(settings)
    {}

    RunResult BackupRunner::runBackup(
        const CategorySelection & categories, const fs::path & backupPath)
    {
        const Clock_t::time_point startTime{ Clock_t::now() };

        const std::string timestamp{ makeTimestampString() };
        const fs::path backupDir{ backupPath / timestamp };

        // if this fails then nothing can be written at all, so it is the one fatal error
        ErrorCode_t errorCode;
        fs::create_directories(backupDir, errorCode);
        if (errorCode)
        {
            return finish(
                RunStatus::Failed,
                backupDir,
                (L"Unable to create the backup folder \"" + backupDir.wstring() + L"\"  {" +
                 toString(errorCode) + L"}"));
        }

        report(L"Creating backup in: " + backupDir.wstring());

        const UserDirVec_t userDirs{ categories.user_dirs ? findUserDirs(m_environment)
                                                          : UserDirVec_t() };

        const BackupPlan plan{ makeBackupPlan(m_environment, categories, backupDir, userDirs) };
        reportNotes(plan);

        try
        {
            if (!runTasks(plan.tasks, Command::Backup))
            {
                reportSummary();
                return finish(RunStatus::Cancelled, backupDir, L"Backup cancelled.");
            }
        }
        catch (const copy_error & ex)
        {
            reportSummary();
            return finish(
                RunStatus::Failed,
                backupDir,
                (L"Backup failed:  " + strutil::toWideString(ex.what()) + L"  {" +
                 toString(ex.code()) + L"}"));
        }

        BackupMetadata metadata;
        metadata.timestamp   = timestamp;
        metadata.hostname    = m_environment.hostname;
        metadata.user        = m_environment.user;
        metadata.categories  = categories;
        metadata.kde_version = queryPlasmaVersion();
        metadata.os_version  = readOsVersion();

        std::wstring metadataErrorMessage;
        if (!writeMetadata(backupDir, metadata, metadataErrorMessage))
        {
            reportSummary();
            return finish(RunStatus::Failed, backupDir, metadataErrorMessage);
        }

        reportSummary();
        report(L"Time: " + prettyTimeDurationString(startTime));

        if (m_counter.copiedCount() == 0)
        {
            return finish(
                RunStatus::NothingCopied,
                backupDir,
                (L"Backup finished but nothing was copied: " + backupDir.wstring()));
        }

        return finish(
            RunStatus::Success,
            backupDir,
            (L"Backup completed successfully: " + backupDir.wstring()));
    }

    RunResult BackupRunner::runRestore(const fs::path & backupDir)
    {
        const Clock_t::time_point startTime{ Clock_t::now() };

        if (!isDirectoryIgnoringErrors(backupDir))
        {
            return finish(
                RunStatus::Failed,
                backupDir,
                (L"The backup folder does not exist: " + backupDir.wstring()));
        }

        report(L"Restoring from: " + backupDir.wstring());

        BackupMetadata metadata;
        std::wstring metadataErrorMessage;
        if (readMetadata(backupDir, metadata, metadataErrorMessage))
        {
            report(L"Backup from: " + strutil::toWideString(metadata.timestamp));
            report(L"Hostname: " + strutil::toWideString(metadata.hostname));
        }
        else
        {
            report(metadataErrorMessage, Color::Yellow);
        }

        const BackupPlan plan{ makeRestorePlan(
            m_environment, backupDir, findUserDirs(m_environment)) };

        reportNotes(plan);

        if (plan.tasks.empty())
        {
            return finish(
                RunStatus::NothingCopied,
                backupDir,
                (L"There was nothing to restore in: " + backupDir.wstring()));
        }

        try
        {
            if (!runTasks(plan.tasks, Command::Restore))
            {
                reportSummary();
                return finish(RunStatus::Cancelled, backupDir, L"Restore cancelled.");
            }
        }
        catch (const copy_error & ex)
        {
            reportSummary();
            return finish(
                RunStatus::Failed,
                backupDir,
                (L"Restore failed:  " + strutil::toWideString(ex.what()) + L"  {" +
                 toString(ex.code()) + L"}"));
        }

        reportSummary();
        report(L"Time: " + prettyTimeDurationString(startTime));

        if (m_counter.copiedCount() == 0)
        {
            return finish(
                RunStatus::NothingCopied,
                backupDir,
                (L"Restore finished but nothing was copied from: " + backupDir.wstring()));
        }

        restartPlasmaIfNeeded(plan);
        report(L"Please log out and log back in for all changes to take effect.", Color::Yellow);

        return finish(RunStatus::Success, backupDir, L"Restore completed successfully!");
    }

    std::wstring BackupRunner::makeOutcomeLine(const CopyOutcome & outcome)
    {
        std::wostringstream ss;

        ss.width(10);
        ss << std::left << (isSkip(outcome.outcome) ? L"Skipped" : L"Copied");

        ss.width(12);
        ss << std::left << toString(outcome.outcome);

        ss << outcome.source.wstring();

        if (Outcome::Copied == outcome.outcome)
        {
            ss << L"   (" << fileSizeToString(outcome.bytes) << L")";
        }

        if (outcome.error_code)
        {
            ss << L"   {" << toString(outcome.error_kind) << L" " << toString(outcome.error_code)
               << L"}";
        }

        std::wstring line{ ss.str() };

        // error messages sometimes have newlines in them
        line.erase(
            std::remove_if(
                std::begin(line),
                std::end(line),
                [](const wchar_t ch) { return ((ch < 32) || (ch == 127)); }),
            std::end(line));

        return line;
    }

    bool BackupRunner::runTasks(const CopyTaskVec_t & tasks, const Command command)
    {
        const std::wstring verb{ (Command::Backup == command) ? L"Backing up " : L"Restoring " };

        bool isFirstTask{ true };
        Category prevCategory{ Category::KdeSettings };

        for (const CopyTask & task : tasks)
        {
            if (isCancelRequested())
            {
                return false;
            }

            if (isFirstTask || (task.category != prevCategory))
            {
                report(verb + toString(task.category) + L"...");
            }

            if (Category::UserDirs == task.category)
            {
                report(L"  " + verb + task.label + L"  (" + task.source.wstring() + L")");
            }

            isFirstTask  = false;
            prevCategory = task.category;

            if (RestoreMode::Replace == task.mode)
            {
                replaceDestination(task);
            }

            runTask(task);
        }

        return !isCancelRequested();
    }

    void BackupRunner::runTask(const CopyTask & task)
    {
        TreeCopier copier(
            task.source, task.destination, m_settings.ignore_errors, m_settings.cancel_flag_ptr);

        CopyOutcome outcome;
        while (copier.next(outcome))
        {
            m_counter.add(outcome, task.label);
            reportOutcome(outcome);
        }

        m_counter.countAbortedSubtrees(copier.abortedSubtreeCount());

        if (copier.didRootFail())
        {
            report(
                L"Unable to copy " + task.source.wstring() + L" to " +
                    task.destination.wstring() + L" at all.",
                Color::Yellow);
        }
    }

    void BackupRunner::replaceDestination(const CopyTask & task)
    {
        if (!existsIgnoringErrors(task.destination, false))
        {
            return;
        }

        // the home directory itself is never a self-contained leaf
        if (isPathInside(m_environment.home, task.destination))
        {
            report(
                L"Refusing to remove " + task.destination.wstring() + L", merging into it instead.",
                Color::Red);

            return;
        }

        ErrorCode_t errorCode;
        fs::remove_all(task.destination, errorCode);
        if (errorCode)
        {
            report(
                L"Unable to remove " + task.destination.wstring() +
                    L" before restoring it, merging into it instead.  {" + toString(errorCode) +
                    L"}",
                Color::Yellow);

            return;
        }

        if (m_settings.verbose)
        {
            report(L"Removed " + task.destination.wstring() + L" before restoring it.");
        }
    }

    void BackupRunner::reportOutcome(const CopyOutcome & outcome)
    {
        // clang-format off
        switch (outcome.outcome)
        {
            case Outcome::Copied:
            {
                if (m_settings.verbose)
                {
                    report(makeOutcomeLine(outcome));
                }
                break;
            }
            case Outcome::SkippedDirectorySymlink:
            case Outcome::SkippedBrokenSymlink:   { report(makeOutcomeLine(outcome), Color::Gray);   break; }
            case Outcome::SkippedPermissionError:
            case Outcome::SkippedOtherError:
            default:                              { report(makeOutcomeLine(outcome), Color::Yellow); break; }
        }
        // clang-format on
    }

    void BackupRunner::reportNotes(const BackupPlan & plan)
    {
        for (const std::wstring & note : plan.notes)
        {
            report(L"  " + note, Color::Gray);
        }
    }

    void BackupRunner::reportSummary()
    {
        for (const std::wstring & line : m_counter.makeSummaryStrings())
        {
            report(line);
        }
    }

    void BackupRunner::restartPlasmaIfNeeded(const BackupPlan & plan)
    {
        if (!m_settings.restart_plasma)
        {
            return;
        }

        const bool didRestoreKdeSettings{ std::any_of(
            std::begin(plan.tasks), std::end(plan.tasks), [](const CopyTask & task) {
                return (Category::KdeSettings == task.category);
            }) };

        if (!didRestoreKdeSettings)
        {
            return;
        }

        report(L"Restarting the Plasma shell...");

        if (!restartPlasmaShell(m_settings.plasma_quit_program, m_settings.plasma_shell_program))
        {
            report(
                (L"Could not restart the Plasma shell, " +
                 strutil::toWideString(m_settings.plasma_quit_program) + L" was not found."),
                Color::Yellow);
        }
    }

    void BackupRunner::report(const std::wstring & text, const Color color)
    {
        m_sink.report(ProgressMessage{ text, color });
    }

    bool BackupRunner::isCancelRequested() const noexcept
    {
        return ((m_settings.cancel_flag_ptr != nullptr) && m_settings.cancel_flag_ptr->load());
    }

    RunResult BackupRunner::finish(
        const RunStatus status, const fs::path & backupDir, const std::wstring & message)
    {
        report(message, toColor(status));

        RunResult result;
        result.status     = status;
        result.backup_dir = backupDir;
        result.message    = message;
        return result;
    }

} // namespace plasma_backup
