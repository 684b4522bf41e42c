#include "habitr.hpp"

#include "export.hpp"
#include "period.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdlib>
#include <stdexcept>

// ─────────────────────────────────────
Habitr::Habitr(const std::filesystem::path &db_path, std::ostream &out,
               std::unique_ptr<Clock> clock)
    : m_Out(out), m_Clock(std::move(clock)) {

    spdlog::info("DataBase path: {}", db_path.string());
    m_SQLite = std::make_unique<SQLite>(db_path.string());
    spdlog::debug("SQLite database initialized");

    m_Ledger = std::make_unique<HabitLedger>(*m_SQLite, *m_Clock);
}

// ─────────────────────────────────────
void Habitr::SetLogLevel(LogLevel log_level) {
    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

// ─────────────────────────────────────
void Habitr::Add(const std::string &name, const std::string &periodicity) {
    const Habit h = m_Ledger->AddHabit(name, parse_periodicity(periodicity));
    m_Out << fmt::format("Added: {} ({}) @ {}\n", h.name, periodicity_name(h.periodicity),
                         format_timestamp(h.created_at));
}

// ─────────────────────────────────────
void Habitr::List() {
    const auto habits = m_Ledger->ListHabits();
    if (habits.empty()) {
        m_Out << "No habits yet.\n";
        return;
    }
    for (const Habit &h : habits) {
        m_Out << fmt::format("- {:<6} | {} | created {}\n", periodicity_name(h.periodicity),
                             h.name, format_timestamp(h.created_at));
    }
}

// ─────────────────────────────────────
void Habitr::ListBy(const std::string &periodicity) {
    const Periodicity p = parse_periodicity(periodicity);
    const auto habits = m_Ledger->ListHabits(p);
    if (habits.empty()) {
        m_Out << fmt::format("No {} habits.\n", periodicity_name(p));
        return;
    }
    for (const Habit &h : habits) {
        m_Out << fmt::format("- {:<6} | {}\n", periodicity_name(h.periodicity), h.name);
    }
}

// ─────────────────────────────────────
void Habitr::Check(const std::string &name, const std::optional<std::string> &ts) {
    std::optional<Instant> at;
    if (ts) {
        at = parse_timestamp(*ts);
    }
    const Habit habit = m_Ledger->GetHabit(name);
    const CheckEvent event = m_Ledger->RecordCheck(habit, at);
    const PeriodBounds bounds = period_bounds(habit.periodicity, event.period_start);
    m_Out << fmt::format("Checked '{}' for period [{} .. {})\n", habit.name,
                         format_timestamp(bounds.start), format_timestamp(bounds.end));
}

// ─────────────────────────────────────
void Habitr::Due(const std::optional<std::string> &periodicity,
                 const std::optional<std::string> &ts) {
    std::optional<Periodicity> filter;
    if (periodicity) {
        filter = parse_periodicity(*periodicity);
    }
    std::optional<Instant> at;
    if (ts) {
        at = parse_timestamp(*ts);
    }

    const auto habits = m_Ledger->ListDue(filter, at);
    if (habits.empty()) {
        m_Out << "Nothing due. Great job!\n";
        return;
    }
    for (const Habit &h : habits) {
        m_Out << fmt::format("- {:<6} | {}\n", periodicity_name(h.periodicity), h.name);
    }
}

// ─────────────────────────────────────
void Habitr::Streak(const std::string &name) {
    const StreakSummary s = m_Ledger->Streak(name);
    m_Out << fmt::format("Longest streak for '{}': {}\n", name, s.longest);
    m_Out << fmt::format("Current streak for '{}': {}\n", name, s.current);
}

// ─────────────────────────────────────
void Habitr::StreakAll() {
    const auto best = m_Ledger->StreakAll();
    if (!best) {
        m_Out << "No streaks yet.\n";
        return;
    }
    m_Out << fmt::format("Best longest streak: {} ({})\n", best->second.longest,
                         best->first.name);
}

// ─────────────────────────────────────
void Habitr::ExportHabits(const std::string &format, const std::filesystem::path &path) {
    std::filesystem::path written;
    if (format == "json") {
        written = ExportHabitsJson(*m_Ledger, path);
    } else if (format == "csv") {
        written = ExportHabitsCsv(*m_Ledger, path);
    } else {
        throw std::invalid_argument("format must be 'json' or 'csv'");
    }
    m_Out << fmt::format("Exported habits -> {}\n", written.string());
}

// ─────────────────────────────────────
void Habitr::ExportChecks(const std::string &format, const std::filesystem::path &path,
                          const std::optional<std::string> &name) {
    std::filesystem::path written;
    if (format == "json") {
        written = ExportChecksJson(*m_Ledger, path, name);
    } else if (format == "csv") {
        written = ExportChecksCsv(*m_Ledger, path, name);
    } else {
        throw std::invalid_argument("format must be 'json' or 'csv'");
    }
    m_Out << fmt::format("Exported checks -> {}\n", written.string());
}

// ─────────────────────────────────────
std::filesystem::path Habitr::GetDBPath() {
    const char *xdgDataHome = std::getenv("XDG_DATA_HOME");
    std::filesystem::path baseDir;
    if (xdgDataHome && *xdgDataHome) {
        baseDir = xdgDataHome;
    } else {
        const char *home = std::getenv("HOME");
        if (!home || !*home) {
            spdlog::error("HOME environment variable not set");
            throw std::runtime_error("HOME environment variable not set; pass --db");
        }
        baseDir = std::filesystem::path(home) / ".local" / "share";
    }

    std::filesystem::path dbPath = baseDir / "habitr" / "habits.sqlite";
    std::error_code ec;
    std::filesystem::create_directories(dbPath.parent_path(), ec);
    if (ec) {
        spdlog::error("Error creating directories: {}", ec.message());
        throw std::runtime_error("unable to create " + dbPath.parent_path().string() + ": " +
                                 ec.message());
    }

    return dbPath;
}
