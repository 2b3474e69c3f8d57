#ifndef PLASMA_BACKUP_GUI_STATE_HPP_INCLUDED
#define PLASMA_BACKUP_GUI_STATE_HPP_INCLUDED
//
// gui-state.hpp
//
#include "plasma-backup/background-worker.hpp"
#include "plasma-backup/backup-metadata.hpp"
#include "plasma-backup/options.hpp"

#include <cstddef>
#include <future>
#include <string>
#include <vector>

namespace plasma_backup_gui
{
    namespace pb = plasma_backup;

    enum class Status
    {
        Waiting,
        Working,
        Cancelling
    };

    [[nodiscard]] constexpr auto toString(const Status status) noexcept
    {
        // clang-format off
        switch (status)
        {
            case Status::Waiting:    return "Waiting";
            case Status::Working:    return "Working";
            case Status::Cancelling: return "Cancelling";
            default:                 return "UNKNOWN_STATUS_ENUM_ERROR";
        }
        // clang-format on
    }

    // ImGui only draws utf8
    struct OutputLine
    {
        std::string text;
        pb::Color color = pb::Color::Default;
    };

    struct SystemInfo
    {
        std::string hostname;
        std::string user;
        std::string home;
        std::string kde_version;
        std::string os_version;
    };

    struct ListingResult
    {
        pb::BackupListingVec_t listings;
        std::wstring error_message;
    };

    // Everything the windows show or edit, without any ImGui.  Only the UI thread touches this,
    // and nothing here waits on the filesystem.  Runs, listings, and the version queries all
    // happen on other threads and are collected by update().
    class GuiState
    {
      public:
        GuiState(
            const pb::Environment & environment,
            const std::filesystem::path & backupPath,
            const std::filesystem::path & logDirPath);

        GuiState(const GuiState &) = delete;
        GuiState & operator=(const GuiState &) = delete;

        // call once per frame
        void update();

        Status status() const;
        bool isBusy() const { return (status() != Status::Waiting); }

        // false means nothing was started, and statusMessage() says why
        bool startBackup();
        bool startRestore();
        void cancel();

        void requestBackupList();
        bool isListing() const { return m_listingFuture.valid(); }
        const pb::BackupListingVec_t & listings() const { return m_listings; }

        // sets restore_path to the listing's folder
        void selectListing(const std::size_t index);
        int selectedListing() const { return m_selectedListing; }

        const std::vector<OutputLine> & outputLines() const { return m_outputLines; }
        void clearOutput() { m_outputLines.clear(); }

        const std::string & statusMessage() const { return m_statusMessage; }
        pb::Color statusColor() const { return m_statusColor; }

        // empty until the version queries come back
        bool hasSystemInfo() const { return m_hasSystemInfo; }
        const SystemInfo & systemInfo() const { return m_systemInfo; }

        const pb::OutcomeCounter & counter() const { return m_worker.counter(); }

        const std::string & defaultBackupPath() const { return m_defaultBackupPath; }

        static constexpr std::size_t output_line_limit{ 20000 };

        // bound directly to the widgets
        pb::CategorySelection categories;
        std::string backup_path;
        std::string restore_path;
        bool opt_verbose        = false;
        bool opt_strict         = false;
        bool opt_restart_plasma = false;

      private:
        pb::RunSettings makeRunSettings() const;
        void addLine(const std::wstring & text, const pb::Color color);
        void setStatusMessage(const std::wstring & message, const pb::Color color);
        void collectRunResult();
        void collectListing();
        void collectSystemInfo();

      private:
        pb::Environment m_environment;
        std::string m_defaultBackupPath;
        pb::BackgroundWorker m_worker;
        std::vector<OutputLine> m_outputLines;
        std::string m_statusMessage;
        pb::Color m_statusColor;
        std::future<ListingResult> m_listingFuture;
        pb::BackupListingVec_t m_listings;
        int m_selectedListing;
        std::future<SystemInfo> m_systemInfoFuture;
        SystemInfo m_systemInfo;
        bool m_hasSystemInfo;
    };

} // namespace plasma_backup_gui

#endif // PLASMA_BACKUP_GUI_STATE_HPP_INCLUDED
