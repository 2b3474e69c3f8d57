#ifndef PLASMA_BACKUP_USER_DIRS_HPP_INCLUDED
#define PLASMA_BACKUP_USER_DIRS_HPP_INCLUDED
//
// user-dirs.hpp
//
#include "filesystem-common.hpp"
#include "options.hpp"

#include <array>
#include <iosfwd>
#include <string>
#include <vector>

namespace plasma_backup
{

    // one of the XDG user directories, named the way the backup folder names it
    struct UserDir
    {
        std::string name;
        fs::path path;
    };

    using UserDirVec_t = std::vector<UserDir>;

    // also the order they are backed up in
    inline const std::array<std::string, 5> user_dir_names{
        "Documents", "Pictures", "Videos", "Music", "Downloads"
    };

    // Reads the lines of a user-dirs.dirs file, i.e. XDG_DOCUMENTS_DIR="$HOME/Documents".  Only
    // the directories named above are kept, in the order above, and $HOME is replaced by home.
    [[nodiscard]] UserDirVec_t parseUserDirs(std::istream & is, const fs::path & home);

    // every name above directly under home
    [[nodiscard]] UserDirVec_t defaultUserDirs(const fs::path & home);

    // Uses ~/.config/user-dirs.dirs if there is one, otherwise the defaults.
    [[nodiscard]] UserDirVec_t findUserDirs(const Environment & environment);

    // returns an empty path if name is not there
    [[nodiscard]] fs::path findUserDirPath(const UserDirVec_t & userDirs, const std::string & name);

} // namespace plasma_backup

#endif // PLASMA_BACKUP_USER_DIRS_HPP_INCLUDED
