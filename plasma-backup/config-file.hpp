#ifndef PLASMA_BACKUP_CONFIG_FILE_HPP_INCLUDED
#define PLASMA_BACKUP_CONFIG_FILE_HPP_INCLUDED
//
// config-file.hpp
//
#include "filesystem-common.hpp"
#include "options.hpp"

#include <string>

namespace plasma_backup
{

    // ~/.config/plasma-backup-manager/config.json
    [[nodiscard]] fs::path configFilePath(const Environment & environment);

    // ~/NAS/Backups/Fedora/KDE
    [[nodiscard]] fs::path defaultBackupBase(const Environment & environment);

    // ~/.local/share/plasma-backup-manager
    [[nodiscard]] fs::path defaultLogDir(const Environment & environment);

    // Returns the "backup_base_path" from the json config file, or defaultBase if there is no
    // config file or it has no such key.  If the file exists but can't be parsed then
    // defaultBase is still returned, and errorMessage says why.
    [[nodiscard]] fs::path loadBackupBasePath(
        const fs::path & configPath, const fs::path & defaultBase, std::wstring & errorMessage);

    // Where backups of this machine go:  --path if given, otherwise "<backup_base>/<hostname>".
    [[nodiscard]] fs::path resolveBackupPath(
        const Options & options, const Environment & environment, std::wstring & errorMessage);

} // namespace plasma_backup

#endif // PLASMA_BACKUP_CONFIG_FILE_HPP_INCLUDED
