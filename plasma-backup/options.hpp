#ifndef PLASMA_BACKUP_OPTIONS_HPP_INCLUDED
#define PLASMA_BACKUP_OPTIONS_HPP_INCLUDED
//
// options.hpp
//
#include "enums.hpp"
#include "filesystem-common.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace plasma_backup
{

    struct CategorySelection
    {
        bool kde_settings = true;
        bool app_configs  = true;
        bool firefox      = true;
        bool thunderbird  = true;
        bool user_dirs    = true;

        bool isSelected(const Category category) const noexcept;
        void select(const Category category, const bool willSelect) noexcept;
        bool isAnySelected() const noexcept;

        static CategorySelection none() noexcept
        {
            return CategorySelection{ false, false, false, false, false };
        }
    };

    inline bool operator==(const CategorySelection & left, const CategorySelection & right)
    {
        return (
            (left.kde_settings == right.kde_settings) && (left.app_configs == right.app_configs) &&
            (left.firefox == right.firefox) && (left.thunderbird == right.thunderbird) &&
            (left.user_dirs == right.user_dirs));
    }

    inline bool operator!=(const CategorySelection & left, const CategorySelection & right)
    {
        return !(left == right);
    }

    // Everything about the machine and user that would otherwise be global.  Found once at
    // startup and then passed to whatever needs it.
    struct Environment
    {
        fs::path home;
        std::string hostname;
        std::string user;
    };

    struct Options
    {
        Command command = Command::Help;

        CategorySelection categories;

        // --path, replaces "<backup_base>/<hostname>" for both backup and list
        fs::path backup_path;

        // the single positional argument of the restore command
        fs::path restore_path;

        fs::path log_dir;
        bool no_log = false;

        // restore only
        bool restart_plasma = false;

        bool strict  = false;
        bool verbose = false;
        bool quiet   = false;
        bool color   = isColorEnabledByDefault();

        static bool isColorEnabledByDefault() noexcept { return true; }
    };

    // what parseCommandLine() throws, the message is ready to show the user
    struct command_line_error : public std::runtime_error
    {
        explicit command_line_error(const std::string & message)
            : std::runtime_error(message)
        {}
    };

    // args does not include the program name
    [[nodiscard]] Options parseCommandLine(const std::vector<std::string> & args);

    // Fixes options that contradict each other, and returns a warning for each fix.
    [[nodiscard]] std::vector<std::wstring> fixConflictingOptions(Options & options);

} // namespace plasma_backup

#endif // PLASMA_BACKUP_OPTIONS_HPP_INCLUDED
