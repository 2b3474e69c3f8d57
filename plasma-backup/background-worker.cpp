// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// background-worker.cpp
//
#include "background-worker.hpp"

namespace plasma_backup
{

    BackgroundWorker::BackgroundWorker(const std::size_t queueCapacity)
        : m_queue(queueCapacity)
        , m_sink(m_queue)
        , m_counter()
        , m_cancelFlag(false)
        , m_future()
        , m_logDirPath()
    {}

    BackgroundWorker::~BackgroundWorker()
    {
        if (!m_future.valid())
        {
            return;
        }

        cancel();

        // wait() instead of get() so nothing thrown on the worker thread escapes a destructor
        m_future.wait();
    }

    bool BackgroundWorker::startBackup(
        const Environment & environment,
        const CategorySelection & categories,
        const fs::path & backupPath,
        const RunSettings & settings)
    {
        RunSettings settingsToUse;
        if (!prepareToStart(settings, settingsToUse))
        {
            return false;
        }

        m_future = std::async(
            std::launch::async,
            [this,
             environment,
             categories,
             backupPath,
             settingsToUse,
             logDirPath = m_logDirPath]() {
                LogfileSink sink(m_sink, logDirPath);
                sink.report(ProgressMessage{ (L"Backup to " + backupPath.wstring()) });

                BackupRunner runner(environment, sink, m_counter, settingsToUse);
                const RunResult result{ runner.runBackup(categories, backupPath) };

                sink.reportLogfilePath();
                return result;
            });

        return true;
    }

    bool BackgroundWorker::startRestore(
        const Environment & environment, const fs::path & backupDir, const RunSettings & settings)
    {
        RunSettings settingsToUse;
        if (!prepareToStart(settings, settingsToUse))
        {
            return false;
        }

        m_future = std::async(
            std::launch::async,
            [this, environment, backupDir, settingsToUse, logDirPath = m_logDirPath]() {
                LogfileSink sink(m_sink, logDirPath);
                sink.report(ProgressMessage{ (L"Restore from " + backupDir.wstring()) });

                BackupRunner runner(environment, sink, m_counter, settingsToUse);
                const RunResult result{ runner.runRestore(backupDir) };

                sink.reportLogfilePath();
                return result;
            });

        return true;
    }

    void BackgroundWorker::cancel()
    {
        m_cancelFlag = true;
        m_queue.close();
    }

    bool BackgroundWorker::isRunning() const
    {
        return (
            m_future.valid() &&
            (m_future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready));
    }

    bool BackgroundWorker::isFinished() const
    {
        return (
            m_future.valid() &&
            (m_future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready));
    }

    std::optional<RunResult> BackgroundWorker::takeResult()
    {
        if (!isFinished())
        {
            return std::nullopt;
        }

        // get() leaves the future invalid, so this also makes room for the next run
        return m_future.get();
    }

    bool BackgroundWorker::prepareToStart(const RunSettings & settings, RunSettings & settingsToUse)
    {
        if (m_future.valid())
        {
            return false;
        }

        m_cancelFlag = false;
        m_queue.reopen();
        m_counter.reset();

        settingsToUse                 = settings;
        settingsToUse.cancel_flag_ptr = &m_cancelFlag;

        return true;
    }

} // namespace plasma_backup
