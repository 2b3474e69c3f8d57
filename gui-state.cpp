// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// gui-state.cpp
//
#include "gui-state.hpp"

#include "plasma-backup/str-util.hpp"
#include "plasma-backup/system-info.hpp"

#include <chrono>
#include <exception>
#include <optional>

namespace plasma_backup_gui
{

    namespace
    {
        template <typename T>
        bool isReady(const std::future<T> & future)
        {
            return (
                future.valid() &&
                (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready));
        }
    } // namespace

    GuiState::GuiState(
        const pb::Environment & environment,
        const std::filesystem::path & backupPath,
        const std::filesystem::path & logDirPath)
        : categories()
        , backup_path(backupPath.string())
        , restore_path()
        , m_environment(environment)
        , m_defaultBackupPath(backupPath.string())
        , m_worker()
        , m_outputLines()
        , m_statusMessage()
        , m_statusColor(pb::Color::Default)
        , m_listingFuture()
        , m_listings()
        , m_selectedListing(-1)
        , m_systemInfoFuture()
        , m_systemInfo()
        , m_hasSystemInfo(false)
    {
        m_worker.logDir(logDirPath);

        // plasmashell can take a second to answer, so never on the UI thread
        m_systemInfoFuture = std::async(std::launch::async, [environment]() {
            SystemInfo info;
            info.hostname    = environment.hostname;
            info.user        = environment.user;
            info.home        = environment.home.string();
            info.kde_version = pb::queryPlasmaVersion();
            info.os_version  = pb::readOsVersion();
            return info;
        });
    }

    void GuiState::update()
    {
        for (const pb::ProgressMessage & message : m_worker.drain())
        {
            addLine(message.text, message.color);
        }

        if (m_worker.isFinished())
        {
            collectRunResult();
        }

        if (isReady(m_listingFuture))
        {
            collectListing();
        }

        if (isReady(m_systemInfoFuture))
        {
            collectSystemInfo();
        }
    }

    Status GuiState::status() const
    {
        if (!m_worker.hasStarted())
        {
            return Status::Waiting;
        }

        return ((m_worker.isCancelRequested()) ? Status::Cancelling : Status::Working);
    }

    bool GuiState::startBackup()
    {
        if (isBusy())
        {
            return false;
        }

        if (strutil::trimWhitespaceCopy(backup_path).empty())
        {
            setStatusMessage(L"Please specify a backup location.", pb::Color::Yellow);
            return false;
        }

        if (!categories.isAnySelected())
        {
            setStatusMessage(L"Please select at least one thing to back up.", pb::Color::Yellow);
            return false;
        }

        const std::filesystem::path backupPath{ strutil::trimWhitespaceCopy(backup_path) };

        if (!m_worker.startBackup(m_environment, categories, backupPath, makeRunSettings()))
        {
            setStatusMessage(L"The last run has not finished yet.", pb::Color::Yellow);
            return false;
        }

        setStatusMessage(L"Backing up...", pb::Color::Default);
        return true;
    }

    bool GuiState::startRestore()
    {
        if (isBusy())
        {
            return false;
        }

        if (strutil::trimWhitespaceCopy(restore_path).empty())
        {
            setStatusMessage(L"Please select a backup to restore.", pb::Color::Yellow);
            return false;
        }

        const std::filesystem::path backupDir{ strutil::trimWhitespaceCopy(restore_path) };

        if (!m_worker.startRestore(m_environment, backupDir, makeRunSettings()))
        {
            setStatusMessage(L"The last run has not finished yet.", pb::Color::Yellow);
            return false;
        }

        setStatusMessage(L"Restoring...", pb::Color::Default);
        return true;
    }

    void GuiState::cancel()
    {
        if (Status::Working != status())
        {
            return;
        }

        m_worker.cancel();
        addLine(L"Cancelling...", pb::Color::Yellow);
        setStatusMessage(L"Cancelling...", pb::Color::Yellow);
    }

    void GuiState::requestBackupList()
    {
        if (isListing())
        {
            return;
        }

        const std::filesystem::path backupPath{ strutil::trimWhitespaceCopy(backup_path) };

        m_listingFuture = std::async(std::launch::async, [backupPath]() {
            ListingResult result;
            result.listings = pb::listBackups(backupPath, result.error_message);
            return result;
        });
    }

    void GuiState::selectListing(const std::size_t index)
    {
        if (index >= m_listings.size())
        {
            return;
        }

        m_selectedListing = static_cast<int>(index);
        restore_path      = m_listings.at(index).path.string();
    }

    pb::RunSettings GuiState::makeRunSettings() const
    {
        pb::RunSettings settings;
        settings.ignore_errors  = !opt_strict;
        settings.verbose        = opt_verbose;
        settings.restart_plasma = opt_restart_plasma;
        return settings;
    }

    void GuiState::addLine(const std::wstring & text, const pb::Color color)
    {
        if (m_outputLines.size() >= output_line_limit)
        {
            m_outputLines.erase(
                std::begin(m_outputLines),
                (std::begin(m_outputLines) + (output_line_limit / 10)));
        }

        m_outputLines.push_back(OutputLine{ strutil::toNarrowString(text), color });
    }

    void GuiState::setStatusMessage(const std::wstring & message, const pb::Color color)
    {
        m_statusMessage = strutil::toNarrowString(message);
        m_statusColor   = color;
    }

    void GuiState::collectRunResult()
    {
        try
        {
            const std::optional<pb::RunResult> resultOpt{ m_worker.takeResult() };

            // whatever the worker reported just before returning
            for (const pb::ProgressMessage & message : m_worker.drain())
            {
                addLine(message.text, message.color);
            }

            if (resultOpt)
            {
                setStatusMessage(resultOpt->message, pb::toColor(resultOpt->status));
            }
        }
        catch (const std::exception & ex)
        {
            const std::wstring message{ L"Fatal Exception: \"" + strutil::toWideString(ex.what()) +
                                        L"\"" };

            addLine(message, pb::Color::Red);
            setStatusMessage(message, pb::Color::Red);
        }

        // a new backup probably showed up
        requestBackupList();
    }

    void GuiState::collectListing()
    {
        const ListingResult result{ m_listingFuture.get() };

        m_listings        = result.listings;
        m_selectedListing = -1;

        if (!result.error_message.empty())
        {
            addLine(result.error_message, pb::Color::Yellow);
        }
    }

    void GuiState::collectSystemInfo()
    {
        m_systemInfo    = m_systemInfoFuture.get();
        m_hasSystemInfo = true;
    }

} // namespace plasma_backup_gui
