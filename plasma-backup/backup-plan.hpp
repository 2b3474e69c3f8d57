#ifndef PLASMA_BACKUP_BACKUP_PLAN_HPP_INCLUDED
#define PLASMA_BACKUP_BACKUP_PLAN_HPP_INCLUDED
//
// backup-plan.hpp
//
#include "enums.hpp"
#include "filesystem-common.hpp"
#include "options.hpp"
#include "user-dirs.hpp"

#include <string>
#include <vector>

namespace plasma_backup
{

    // One root to hand to a TreeCopier.
    struct CopyTask
    {
        Category category = Category::KdeSettings;
        fs::path source;
        fs::path destination;

        // where this lands inside a backup folder, i.e. "kde" or "user_data/Music"
        std::wstring label;

        // Replace means the runner removes the destination before copying into it
        RestoreMode mode = RestoreMode::Merge;
    };

    using CopyTaskVec_t = std::vector<CopyTask>;

    struct BackupPlan
    {
        CopyTaskVec_t tasks;

        // one line for everything that was looked for but not found
        std::vector<std::wstring> notes;
    };

    // relative to home, and the ones with a '*' are glob patterns
    [[nodiscard]] const std::vector<std::string> & kdeSettingsPatterns();
    [[nodiscard]] const std::vector<std::string> & appConfigPaths();

    // Every existing path matching base/relativePattern, in glob(3) order.  A relativePattern
    // without any wildcards simply returns base/relativePattern if it exists.
    [[nodiscard]] std::vector<fs::path>
        expandPattern(const fs::path & base, const std::string & relativePattern);

    // true if path is parentPath or anywhere below it
    [[nodiscard]] bool isPathInside(const fs::path & path, const fs::path & parentPath);

    // backupDir is the new timestamped folder that everything is copied into
    [[nodiscard]] BackupPlan makeBackupPlan(
        const Environment & environment,
        const CategorySelection & categories,
        const fs::path & backupDir,
        const UserDirVec_t & userDirs);

    // backupDir is an existing backup folder, i.e. the one that holds backup_metadata.json
    [[nodiscard]] BackupPlan makeRestorePlan(
        const Environment & environment, const fs::path & backupDir, const UserDirVec_t & userDirs);

} // namespace plasma_backup

#endif // PLASMA_BACKUP_BACKUP_PLAN_HPP_INCLUDED
