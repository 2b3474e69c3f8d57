// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// backup-plan.cpp
//
#include "backup-plan.hpp"

#include "str-util.hpp"

#include <algorithm>

#include <glob.h>

namespace plasma_backup
{

    namespace
    {
        // frees whatever glob() allocated, even when it failed
        struct ScopedGlob
        {
            ScopedGlob() = default;
            ~ScopedGlob() { globfree(&result); }

            ScopedGlob(const ScopedGlob &) = delete;
            ScopedGlob & operator=(const ScopedGlob &) = delete;

            glob_t result{};
        };

        bool hasWildcard(const std::string & pattern)
        {
            return (pattern.find_first_of("*?[") != std::string::npos);
        }

        // so a home directory with strange characters is never taken as part of the pattern
        std::string escapeForGlob(const std::string & str)
        {
            std::string escaped;
            escaped.reserve(str.size() * 2);

            for (const char ch : str)
            {
                if ((ch == '*') || (ch == '?') || (ch == '[') || (ch == ']') || (ch == '\\'))
                {
                    escaped += '\\';
                }

                escaped += ch;
            }

            return escaped;
        }

        std::wstring toLabel(const Category category)
        {
            return strutil::toWideString(toFolderName(category));
        }

        bool isSourcePlanned(const BackupPlan & plan, const fs::path & source)
        {
            return std::any_of(
                std::begin(plan.tasks), std::end(plan.tasks), [&source](const CopyTask & task) {
                    return (task.source == source);
                });
        }

        void addTasksFromPatterns(
            BackupPlan & plan,
            const Environment & environment,
            const Category category,
            const std::vector<std::string> & patterns,
            const fs::path & backupDir)
        {
            const fs::path categoryDir{ backupDir / toFolderName(category) };
            const std::size_t taskCountBefore{ plan.tasks.size() };

            for (const std::string & pattern : patterns)
            {
                for (const fs::path & sourcePath : expandPattern(environment.home, pattern))
                {
                    // i.e. "kde*" and "kdeglobals" both match kdeglobals
                    if (isSourcePlanned(plan, sourcePath))
                    {
                        continue;
                    }

                    CopyTask task;
                    task.category    = category;
                    task.source      = sourcePath;
                    task.destination =
                        (categoryDir / sourcePath.lexically_relative(environment.home));
                    task.label       = toLabel(category);
                    plan.tasks.push_back(task);
                }
            }

            if (plan.tasks.size() == taskCountBefore)
            {
                plan.notes.push_back(L"No " + std::wstring(toString(category)) + L" found.");
            }
        }

        void addTaskIfExists(
            BackupPlan & plan,
            const Category category,
            const fs::path & source,
            const fs::path & destination,
            const std::wstring & label,
            const RestoreMode mode = RestoreMode::Merge)
        {
            if (!existsIgnoringErrors(source, false))
            {
                plan.notes.push_back(label + L" not found, skipping:  " + source.wstring());
                return;
            }

            CopyTask task;
            task.category    = category;
            task.source      = source;
            task.destination = destination;
            task.label       = label;
            task.mode        = mode;
            plan.tasks.push_back(task);
        }

        // a copy that writes into its own source never ends well
        void removeTasksContaining(BackupPlan & plan, const fs::path & backupDir)
        {
            plan.tasks.erase(
                std::remove_if(
                    std::begin(plan.tasks),
                    std::end(plan.tasks),
                    [&](const CopyTask & task) {
                        if (!isPathInside(backupDir, task.source))
                        {
                            return false;
                        }

                        plan.notes.push_back(
                            L"Skipping " + task.source.wstring() +
                            L" because the backup location is inside it.");

                        return true;
                    }),
                std::end(plan.tasks));
        }
    } // namespace

    const std::vector<std::string> & kdeSettingsPatterns()
    {
        static const std::vector<std::string> patterns{
            ".config/plasma*",          ".config/kde*",
            ".config/kwin*",            ".config/kglobalshortcutsrc",
            ".config/khotkeysrc",       ".config/kdeglobals",
            ".config/kscreenlockerrc",  ".config/systemsettingsrc",
            ".local/share/plasma",      ".local/share/kwin",
            ".local/share/konsole",     ".local/share/color-schemes",
            ".local/share/kxmlgui5",    ".local/share/applications"
        };

        return patterns;
    }

    const std::vector<std::string> & appConfigPaths()
    {
        static const std::vector<std::string> paths{ ".config/Code", ".config/discord",
                                                     ".config/Slack", ".vscode",
                                                     ".bashrc",       ".bash_profile",
                                                     ".profile",      ".zshrc",
                                                     ".gitconfig",    ".ssh/config" };

        return paths;
    }

    std::vector<fs::path> expandPattern(const fs::path & base, const std::string & relativePattern)
    {
        std::vector<fs::path> paths;

        if (!hasWildcard(relativePattern))
        {
            const fs::path path{ base / relativePattern };
            if (existsIgnoringErrors(path, false))
            {
                paths.push_back(path);
            }

            return paths;
        }

        const std::string pattern{ escapeForGlob(base.string()) + '/' + relativePattern };

        ScopedGlob scopedGlob;
        const int result{ glob(pattern.c_str(), 0, nullptr, &scopedGlob.result) };

        // GLOB_NOMATCH is the common case, and the others mean there is nothing usable either
        if (result != 0)
        {
            return paths;
        }

        for (std::size_t i(0); i < scopedGlob.result.gl_pathc; ++i)
        {
            const fs::path path{ scopedGlob.result.gl_pathv[i] };

            // glob() also matches broken links
            if (existsIgnoringErrors(path, false))
            {
                paths.push_back(path);
            }
        }

        return paths;
    }

    bool isPathInside(const fs::path & path, const fs::path & parentPath)
    {
        ErrorCode_t errorCodeIgnored;

        // weakly_canonical() works even for paths that don't exist yet
        fs::path pathNormal{ fs::weakly_canonical(path, errorCodeIgnored) };
        if (errorCodeIgnored)
        {
            pathNormal = path.lexically_normal();
        }

        errorCodeIgnored.clear();
        fs::path parentNormal{ fs::weakly_canonical(parentPath, errorCodeIgnored) };
        if (errorCodeIgnored)
        {
            parentNormal = parentPath.lexically_normal();
        }

        auto pathIter{ std::begin(pathNormal) };
        for (const fs::path & parentPart : parentNormal)
        {
            // a trailing slash leaves an empty last part
            if (parentPart.empty())
            {
                continue;
            }

            if ((pathIter == std::end(pathNormal)) || (*pathIter != parentPart))
            {
                return false;
            }

            ++pathIter;
        }

        return true;
    }

    BackupPlan makeBackupPlan(
        const Environment & environment,
        const CategorySelection & categories,
        const fs::path & backupDir,
        const UserDirVec_t & userDirs)
    {
        BackupPlan plan;

        if (categories.kde_settings)
        {
            addTasksFromPatterns(
                plan, environment, Category::KdeSettings, kdeSettingsPatterns(), backupDir);
        }

        if (categories.app_configs)
        {
            addTasksFromPatterns(
                plan, environment, Category::AppConfigs, appConfigPaths(), backupDir);
        }

        if (categories.firefox)
        {
            addTaskIfExists(
                plan,
                Category::Firefox,
                (environment.home / ".mozilla" / "firefox"),
                (backupDir / toFolderName(Category::Firefox)),
                toLabel(Category::Firefox));
        }

        if (categories.thunderbird)
        {
            addTaskIfExists(
                plan,
                Category::Thunderbird,
                (environment.home / ".thunderbird"),
                (backupDir / toFolderName(Category::Thunderbird)),
                toLabel(Category::Thunderbird));
        }

        if (categories.user_dirs)
        {
            const fs::path userDataDir{ backupDir / toFolderName(Category::UserDirs) };

            for (const UserDir & userDir : userDirs)
            {
                addTaskIfExists(
                    plan,
                    Category::UserDirs,
                    userDir.path,
                    (userDataDir / userDir.name),
                    (toLabel(Category::UserDirs) + L"/" + strutil::toWideString(userDir.name)));
            }
        }

        removeTasksContaining(plan, backupDir);
        return plan;
    }

    BackupPlan makeRestorePlan(
        const Environment & environment, const fs::path & backupDir, const UserDirVec_t & userDirs)
    {
        BackupPlan plan;

        // kde and configs were saved relative to home, so they merge right back into it
        for (const Category category : { Category::KdeSettings, Category::AppConfigs })
        {
            const fs::path sourceDir{ backupDir / toFolderName(category) };
            if (isDirectoryIgnoringErrors(sourceDir))
            {
                addTaskIfExists(plan, category, sourceDir, environment.home, toLabel(category));
            }
        }

        // browser profiles are self-contained, so whatever is there now is replaced entirely
        const fs::path firefoxDir{ backupDir / toFolderName(Category::Firefox) };
        if (isDirectoryIgnoringErrors(firefoxDir))
        {
            addTaskIfExists(
                plan,
                Category::Firefox,
                firefoxDir,
                (environment.home / ".mozilla" / "firefox"),
                toLabel(Category::Firefox),
                RestoreMode::Replace);
        }

        const fs::path thunderbirdDir{ backupDir / toFolderName(Category::Thunderbird) };
        if (isDirectoryIgnoringErrors(thunderbirdDir))
        {
            addTaskIfExists(
                plan,
                Category::Thunderbird,
                thunderbirdDir,
                (environment.home / ".thunderbird"),
                toLabel(Category::Thunderbird),
                RestoreMode::Replace);
        }

        const fs::path userDataDir{ backupDir / toFolderName(Category::UserDirs) };
        if (isDirectoryIgnoringErrors(userDataDir))
        {
            std::vector<fs::path> userDataPaths;

            ErrorCode_t errorCode;
            fs::directory_iterator dirIter(userDataDir, errorCode);
            const fs::directory_iterator dirIterEnd;
            while (!errorCode && (dirIter != dirIterEnd))
            {
                if (isDirectoryIgnoringErrors(dirIter->path()))
                {
                    userDataPaths.push_back(dirIter->path());
                }

                dirIter.increment(errorCode);
            }

            if (errorCode)
            {
                plan.notes.push_back(
                    L"Unable to list everything in " + userDataDir.wstring() + L"  {" +
                    toString(errorCode) + L"}");
            }

            std::sort(std::begin(userDataPaths), std::end(userDataPaths));

            for (const fs::path & sourceDir : userDataPaths)
            {
                const std::string name{ sourceDir.filename().string() };

                fs::path destination{ findUserDirPath(userDirs, name) };
                if (destination.empty())
                {
                    destination = (environment.home / name);
                }

                addTaskIfExists(
                    plan,
                    Category::UserDirs,
                    sourceDir,
                    destination,
                    (toLabel(Category::UserDirs) + L"/" + strutil::toWideString(name)));
            }
        }

        return plan;
    }

} // namespace plasma_backup
