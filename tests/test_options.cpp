//
// test_options.cpp
//
#include "plasma-backup/options.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace plasma_backup;

TEST_CASE("parseCommandLine defaults to help", "[options]")
{
    REQUIRE(parseCommandLine({}).command == Command::Help);
    REQUIRE(parseCommandLine({ "--help" }).command == Command::Help);
    REQUIRE(parseCommandLine({ "backup", "-h" }).command == Command::Help);
    REQUIRE(parseCommandLine({ "help" }).command == Command::Help);

    // only options and no command
    REQUIRE(parseCommandLine({ "--verbose" }).command == Command::Help);
}

TEST_CASE("parseCommandLine reads the backup command", "[options]")
{
    const Options options{ parseCommandLine(
        { "backup", "--no-firefox", "--no-user-dirs", "--path", "\"/mnt/nas/kde\"", "--strict" }) };

    REQUIRE(options.command == Command::Backup);
    REQUIRE(options.backup_path == fs::path("/mnt/nas/kde"));
    REQUIRE(options.strict);
    REQUIRE(!options.verbose);

    REQUIRE(options.categories.kde_settings);
    REQUIRE(options.categories.app_configs);
    REQUIRE(!options.categories.firefox);
    REQUIRE(options.categories.thunderbird);
    REQUIRE(!options.categories.user_dirs);
}

TEST_CASE("parseCommandLine --kde-only selects only the kde settings", "[options]")
{
    const Options options{ parseCommandLine({ "--kde-only", "backup" }) };

    REQUIRE(options.command == Command::Backup);
    REQUIRE(options.categories.isSelected(Category::KdeSettings));
    REQUIRE(!options.categories.isSelected(Category::AppConfigs));
    REQUIRE(!options.categories.isSelected(Category::Firefox));
    REQUIRE(!options.categories.isSelected(Category::Thunderbird));
    REQUIRE(!options.categories.isSelected(Category::UserDirs));
}

TEST_CASE("parseCommandLine reads the restore command", "[options]")
{
    const Options options{ parseCommandLine(
        { "restore", "/backups/host/20240101_120000", "--verbose", "--log-dir", "/tmp/logs" }) };

    REQUIRE(options.command == Command::Restore);
    REQUIRE(options.restore_path == fs::path("/backups/host/20240101_120000"));
    REQUIRE(options.log_dir == fs::path("/tmp/logs"));
    REQUIRE(options.verbose);
}

TEST_CASE("parseCommandLine reads the list and info commands", "[options]")
{
    REQUIRE(parseCommandLine({ "list" }).command == Command::List);
    REQUIRE(parseCommandLine({ "info", "--no-color" }).command == Command::Info);
    REQUIRE(!parseCommandLine({ "info", "--no-color" }).color);
    REQUIRE(parseCommandLine({ "list", "--quiet", "--no-log" }).quiet);
}

TEST_CASE("parseCommandLine rejects bad arguments", "[options][error]")
{
    REQUIRE_THROWS_AS(parseCommandLine({ "frobnicate" }), command_line_error);
    REQUIRE_THROWS_AS(parseCommandLine({ "backup", "--bogus" }), command_line_error);
    REQUIRE_THROWS_AS(parseCommandLine({ "backup", "extra" }), command_line_error);
    REQUIRE_THROWS_AS(parseCommandLine({ "backup", "--path" }), command_line_error);
    REQUIRE_THROWS_AS(parseCommandLine({ "backup", "--path", "\"\"" }), command_line_error);
    REQUIRE_THROWS_AS(parseCommandLine({ "restore" }), command_line_error);
    REQUIRE_THROWS_AS(parseCommandLine({ "restore", "/a", "/b" }), command_line_error);

    REQUIRE_THROWS_WITH(parseCommandLine({ "--nope" }), "Unknown option: \"--nope\"");
}

TEST_CASE("fixConflictingOptions warns about each fix", "[options]")
{
    SECTION("verbose wins over quiet")
    {
        Options options{ parseCommandLine({ "backup", "--quiet", "--verbose" }) };
        const std::vector<std::wstring> warnings{ fixConflictingOptions(options) };

        REQUIRE(warnings.size() == 1);
        REQUIRE(!options.quiet);
        REQUIRE(options.verbose);
    }

    SECTION("category options are ignored outside of backup")
    {
        Options options{ parseCommandLine({ "list", "--no-firefox" }) };
        const std::vector<std::wstring> warnings{ fixConflictingOptions(options) };

        REQUIRE(warnings.size() == 1);
        REQUIRE(options.categories == CategorySelection());
    }

    SECTION("--path is ignored by restore")
    {
        Options options{ parseCommandLine({ "restore", "/b", "--path", "/a" }) };
        const std::vector<std::wstring> warnings{ fixConflictingOptions(options) };

        REQUIRE(warnings.size() == 1);
        REQUIRE(options.backup_path.empty());
        REQUIRE(options.restore_path == fs::path("/b"));
    }

    SECTION("--restart-plasma is ignored outside of restore")
    {
        Options options{ parseCommandLine({ "backup", "--restart-plasma" }) };
        REQUIRE(options.restart_plasma);

        const std::vector<std::wstring> warnings{ fixConflictingOptions(options) };

        REQUIRE(warnings.size() == 1);
        REQUIRE(!options.restart_plasma);
    }

    SECTION("--restart-plasma is kept by restore")
    {
        Options options{ parseCommandLine({ "restore", "/b", "--restart-plasma" }) };
        const std::vector<std::wstring> warnings{ fixConflictingOptions(options) };

        REQUIRE(warnings.empty());
        REQUIRE(options.restart_plasma);
    }

    SECTION("--no-log wins over --log-dir")
    {
        Options options{ parseCommandLine({ "backup", "--no-log", "--log-dir", "/logs" }) };
        const std::vector<std::wstring> warnings{ fixConflictingOptions(options) };

        REQUIRE(warnings.size() == 1);
        REQUIRE(options.log_dir.empty());
    }

    SECTION("excluding everything is allowed but warned about")
    {
        Options options{ parseCommandLine({ "backup" }) };
        options.categories = CategorySelection::none();

        const std::vector<std::wstring> warnings{ fixConflictingOptions(options) };

        REQUIRE(warnings.size() == 1);
        REQUIRE(options.command == Command::Backup);
    }

    SECTION("nothing to fix")
    {
        Options options{ parseCommandLine({ "backup", "--verbose" }) };
        REQUIRE(fixConflictingOptions(options).empty());
    }
}

TEST_CASE("CategorySelection selects by category", "[options]")
{
    CategorySelection selection{ CategorySelection::none() };
    REQUIRE(!selection.isAnySelected());

    selection.select(Category::Thunderbird, true);
    REQUIRE(selection.isAnySelected());
    REQUIRE(selection.isSelected(Category::Thunderbird));
    REQUIRE(selection.thunderbird);

    selection.select(Category::Thunderbird, false);
    REQUIRE(selection == CategorySelection::none());
    REQUIRE(selection != CategorySelection());
}
