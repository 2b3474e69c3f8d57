#ifndef PLASMA_BACKUP_BACKGROUND_WORKER_HPP_INCLUDED
#define PLASMA_BACKUP_BACKGROUND_WORKER_HPP_INCLUDED
//
// background-worker.hpp
//
#include "backup-runner.hpp"
#include "counters.hpp"
#include "message-queue.hpp"
#include "options.hpp"
#include "util.hpp"
#include "verified-output.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <thread>
#include <vector>

namespace plasma_backup
{

    // Runs one backup or restore at a time on a separate thread, so that whatever draws the
    // screen never waits on the filesystem.
    //
    // Progress lines go through a BoundedMessageQueue.  If nobody drains it then the worker will
    // block once it fills up, so the owner must call drain() regularly (every frame) or use
    // waitUntilFinished().
    //
    // When there is a log directory each run gets its own logfile, opened and written by the
    // worker thread.  Lines lost to a cancel still make it into the logfile.
    class BackgroundWorker
    {
      public:
        explicit BackgroundWorker(const std::size_t queueCapacity = default_queue_capacity);

        // cancels and waits for the worker thread, any result or exception is discarded
        ~BackgroundWorker();

        BackgroundWorker(const BackgroundWorker &) = delete;
        BackgroundWorker & operator=(const BackgroundWorker &) = delete;

        // these return false and do nothing if a run has been started but not yet collected
        bool startBackup(
            const Environment & environment,
            const CategorySelection & categories,
            const fs::path & backupPath,
            const RunSettings & settings);

        bool startRestore(
            const Environment & environment,
            const fs::path & backupDir,
            const RunSettings & settings);

        // Asks the run to stop as soon as the copier reaches its next directory entry.  Also closes
        // the queue so a worker blocked on a full queue wakes up.  Lines reported after this are
        // lost.
        void cancel();

        bool isCancelRequested() const { return m_cancelFlag.load(); }

        // true from start until the worker thread returns
        bool isRunning() const;

        // true once the worker thread returned and takeResult() has not collected it yet
        bool isFinished() const;

        bool hasStarted() const { return m_future.valid(); }

        // an empty path means no logfile, only used by runs started after this is set
        void logDir(const fs::path & logDirPath) { m_logDirPath = logDirPath; }
        const fs::path & logDir() const { return m_logDirPath; }

        std::vector<ProgressMessage> drain() { return m_queue.drain(); }

        // Only once isFinished().  Returns nothing while still running.  If the worker thread
        // threw then this rethrows it here.
        std::optional<RunResult> takeResult();

        // counts are updated live by the worker and are safe to read from any thread
        const OutcomeCounter & counter() const { return m_counter; }

        // blocks, draining the queue into handler until the worker thread returns
        template <typename Handler_t>
        void waitUntilFinished(Handler_t handler)
        {
            std::size_t sleepCurrentMs{ 0 };
            const std::size_t sleepMaxMs{ 100 };
            const std::size_t sleepIncrementMs{ 5 };

            while (isRunning())
            {
                for (const ProgressMessage & message : drain())
                {
                    handler(message);
                }

                std::this_thread::sleep_for(std::chrono::milliseconds(sleepCurrentMs));
                sleepCurrentMs = std::clamp((sleepCurrentMs + sleepIncrementMs), 0_st, sleepMaxMs);
            }

            for (const ProgressMessage & message : drain())
            {
                handler(message);
            }
        }

        static constexpr std::size_t default_queue_capacity{ 4096 };

      private:
        // pushes each line onto the queue, blocking while it is full
        class QueueSink : public IProgressSink
        {
          public:
            explicit QueueSink(BoundedMessageQueue<ProgressMessage> & queue)
                : m_queue(queue)
            {}

            virtual ~QueueSink() = default;

            // a closed queue means the run was cancelled and nobody wants the line
            void report(const ProgressMessage & message) override
            {
                [[maybe_unused]] const bool wasQueued{ m_queue.push(message) };
            }

          private:
            BoundedMessageQueue<ProgressMessage> & m_queue;
        };

        // writes each line to the run's logfile before passing it on
        class LogfileSink : public IProgressSink
        {
          public:
            LogfileSink(IProgressSink & next, const fs::path & logDirPath)
                : m_next(next)
                , m_output(logDirPath)
            {}

            virtual ~LogfileSink() = default;

            void report(const ProgressMessage & message) override
            {
                m_output.printToLogfileOnly(message.text);
                m_next.report(message);
            }

            void reportLogfilePath()
            {
                if (m_output.isLogging())
                {
                    report(ProgressMessage{ (L"Logfile: " + m_output.logfilePath().wstring()),
                                            Color::Gray });
                }
            }

          private:
            IProgressSink & m_next;
            VerifiedOutput m_output;
        };

        // resets everything for a new run, returns false if one has not been collected yet
        bool prepareToStart(const RunSettings & settings, RunSettings & settingsToUse);

      private:
        BoundedMessageQueue<ProgressMessage> m_queue;
        QueueSink m_sink;
        OutcomeCounter m_counter;
        std::atomic_bool m_cancelFlag;
        std::future<RunResult> m_future;
        fs::path m_logDirPath;
    };

} // namespace plasma_backup

#endif // PLASMA_BACKUP_BACKGROUND_WORKER_HPP_INCLUDED
