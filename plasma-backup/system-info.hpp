#ifndef PLASMA_BACKUP_SYSTEM_INFO_HPP_INCLUDED
#define PLASMA_BACKUP_SYSTEM_INFO_HPP_INCLUDED
//
// system-info.hpp
//
#include "filesystem-common.hpp"
#include "options.hpp"

#include <iosfwd>
#include <string>

namespace plasma_backup
{

    inline const std::string unknown_str{ "Unknown" };

    // Home from $HOME (or the passwd entry), hostname from uname(), and user from $USER (or the
    // passwd entry).  Throws std::runtime_error if there is no way to find the home directory.
    [[nodiscard]] Environment detectEnvironment();

    // runs a shell command and returns everything it wrote to stdout
    [[nodiscard]] std::string runCommandForOutput(const std::string & command);

    // The output of "plasmashell --version", i.e. "plasmashell 6.2.4", or "Unknown".
    [[nodiscard]] std::string queryPlasmaVersion();

    // Quits the running Plasma shell with "<quitProgram> <shellProgram>" and then starts
    // shellProgram again two seconds later, detached from this process.  Returns false if
    // quitProgram is not installed, in which case nothing was run.
    [[nodiscard]] bool restartPlasmaShell(
        const std::string & quitProgram  = "kquitapp6",
        const std::string & shellProgram = "plasmashell");

    // The PRETTY_NAME value of an os-release file, or empty if there is none.
    [[nodiscard]] std::string parseOsReleasePrettyName(std::istream & is);

    // The whole first line of /etc/fedora-release if there is one, otherwise the PRETTY_NAME from
    // /etc/os-release, otherwise "Unknown".
    [[nodiscard]] std::string readOsVersion(
        const fs::path & fedoraReleasePath = "/etc/fedora-release",
        const fs::path & osReleasePath     = "/etc/os-release");

} // namespace plasma_backup

#endif // PLASMA_BACKUP_SYSTEM_INFO_HPP_INCLUDED
