#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>

#include "errors.hpp"
#include "habitr.hpp"

int main(int argc, char **argv) {
    CLI::App app{"Habit Tracker (SQLite)", "habitr"};
    app.require_subcommand(1);

    std::string db_path;
    std::string log_level = "off";
    app.add_option("--db", db_path, "SQLite database file (default: $XDG_DATA_HOME/habitr)");
    app.add_option("--log-level", log_level, "Logging: debug|info|off")
        ->check(CLI::IsMember({"debug", "info", "off"}))
        ->capture_default_str();

    const auto periodicities = CLI::IsMember({"daily", "weekly"});
    const auto formats = CLI::IsMember({"json", "csv"});

    // add
    std::string add_name, add_periodicity;
    auto *add = app.add_subcommand("add", "add a habit");
    add->add_option("name", add_name, "Habit name")->required();
    add->add_option("--periodicity", add_periodicity, "daily|weekly")
        ->required()
        ->check(periodicities);

    // list
    auto *list = app.add_subcommand("list", "list all habits");

    // list-by
    std::string listby_periodicity;
    auto *list_by = app.add_subcommand("list-by", "list habits by periodicity");
    list_by->add_option("--periodicity", listby_periodicity, "daily|weekly")
        ->required()
        ->check(periodicities);

    // check
    std::string check_name;
    std::optional<std::string> check_ts;
    auto *check = app.add_subcommand("check", "check off a habit for now or a given timestamp");
    check->add_option("name", check_name, "Habit name")->required();
    check->add_option("--ts", check_ts, "UTC time, e.g. 2025-09-15T09:00:00");

    // due
    std::optional<std::string> due_periodicity, due_ts;
    auto *due = app.add_subcommand("due", "show due habits (optionally filtered)");
    due->add_option("--periodicity", due_periodicity, "daily|weekly")->check(periodicities);
    due->add_option("--ts", due_ts, "Reference UTC time (default: now)");

    // streak
    std::string streak_name;
    auto *streak = app.add_subcommand("streak", "longest and current streak for a habit");
    streak->add_option("name", streak_name, "Habit name")->required();

    // streak-all
    auto *streak_all = app.add_subcommand("streak-all", "best longest streak overall");

    // export
    std::string exph_format, exph_path;
    auto *export_habits = app.add_subcommand("export-habits", "export habits to JSON/CSV");
    export_habits->add_option("--format", exph_format, "json|csv")->required()->check(formats);
    export_habits->add_option("--path", exph_path, "Output file")->required();

    std::string expc_format, expc_path;
    std::optional<std::string> expc_name;
    auto *export_checks = app.add_subcommand("export-checks", "export checks to JSON/CSV");
    export_checks->add_option("--format", expc_format, "json|csv")->required()->check(formats);
    export_checks->add_option("--path", expc_path, "Output file")->required();
    export_checks->add_option("--name", expc_name, "Optional habit name filter");

    CLI11_PARSE(app, argc, argv);

    LogLevel level = LOG_OFF;
    if (log_level == "debug") {
        level = LOG_DEBUG;
    } else if (log_level == "info") {
        level = LOG_INFO;
    }
    Habitr::SetLogLevel(level);

    try {
        const std::filesystem::path path =
            db_path.empty() ? Habitr::GetDBPath() : std::filesystem::path(db_path);
        Habitr habitr(path);

        if (*add) {
            habitr.Add(add_name, add_periodicity);
        } else if (*list) {
            habitr.List();
        } else if (*list_by) {
            habitr.ListBy(listby_periodicity);
        } else if (*check) {
            habitr.Check(check_name, check_ts);
        } else if (*due) {
            habitr.Due(due_periodicity, due_ts);
        } else if (*streak) {
            habitr.Streak(streak_name);
        } else if (*streak_all) {
            habitr.StreakAll();
        } else if (*export_habits) {
            habitr.ExportHabits(exph_format, exph_path);
        } else if (*export_checks) {
            habitr.ExportChecks(expc_format, expc_path, expc_name);
        }
    } catch (const NotFoundError &e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const DuplicateNameError &e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const InvalidPeriodicityError &e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument &e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        spdlog::error("habitr failed: {}", e.what());
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    return 0;
}
