#ifndef PLASMA_BACKUP_BACKUP_METADATA_HPP_INCLUDED
#define PLASMA_BACKUP_BACKUP_METADATA_HPP_INCLUDED
//
// backup-metadata.hpp
//
#include "filesystem-common.hpp"
#include "options.hpp"

#include <string>
#include <vector>

namespace plasma_backup
{

    inline const std::string metadata_filename{ "backup_metadata.json" };

    // the timestamp is both the backup folder name and the id inside its metadata
    inline const char * const timestamp_format{ "%Y%m%d_%H%M%S" };

    struct BackupMetadata
    {
        std::string timestamp;
        std::string hostname;
        std::string user;
        CategorySelection categories;
        std::string kde_version;
        std::string os_version;
    };

    struct BackupListing
    {
        fs::path path;
        BackupMetadata metadata;

        // false means the metadata file could not be parsed and everything but the timestamp
        // (taken from the folder name) is "Unknown"
        bool is_metadata_valid = false;
    };

    using BackupListingVec_t = std::vector<BackupListing>;

    [[nodiscard]] std::string makeTimestampString();

    // Writes backupDir/backup_metadata.json, returns false and sets errorMessage on failure.
    bool writeMetadata(
        const fs::path & backupDir, const BackupMetadata & metadata, std::wstring & errorMessage);

    // Reads backupDir/backup_metadata.json, returns false and sets errorMessage on failure.
    // Missing keys are "Unknown", and the os_version is also found under the old key
    // "fedora_version".
    bool readMetadata(
        const fs::path & backupDir, BackupMetadata & metadata, std::wstring & errorMessage);

    // Every folder directly in backupPath that holds a metadata file, newest first.
    [[nodiscard]] BackupListingVec_t
        listBackups(const fs::path & backupPath, std::wstring & errorMessage);

} // namespace plasma_backup

#endif // PLASMA_BACKUP_BACKUP_METADATA_HPP_INCLUDED
