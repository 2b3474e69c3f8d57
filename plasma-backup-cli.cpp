// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// plasma-backup-cli.cpp
//
#include "plasma-backup/plasma-backup-app.hpp"
#include "plasma-backup/str-util.hpp"
#include "plasma-backup/system-info.hpp"

#include <clocale>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char * argv[])
{
    // without this wcout can't show anything but plain ascii
    std::setlocale(LC_ALL, "");

    plasma_backup::Environment environment;

    try
    {
        environment = plasma_backup::detectEnvironment();
    }
    catch (const std::exception & ex)
    {
        std::wcerr << L"Fatal Exception: \"" << strutil::toWideString(ex.what())
                   << L"\"" << std::endl;

        return 1;
    }

    const std::vector<std::string> args(argv + 1, argv + argc);

    plasma_backup::PlasmaBackupApp app(args, environment);
    return app.run();
}
