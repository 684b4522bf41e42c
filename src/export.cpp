#include "export.hpp"
#include "period.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace {

// ─────────────────────────────────────
std::ofstream open_output(const std::filesystem::path &path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("Error creating directories for {}: {}", path.string(), ec.message());
            throw std::runtime_error("unable to create " + path.parent_path().string() + ": " +
                                     ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        spdlog::error("Unable to open {} for writing", path.string());
        throw std::runtime_error("unable to open " + path.string() + " for writing");
    }
    return out;
}

void finish(std::ofstream &out, const std::filesystem::path &path) {
    out.flush();
    if (!out) {
        spdlog::error("Write to {} failed", path.string());
        throw std::runtime_error("write to " + path.string() + " failed");
    }
}

// ─────────────────────────────────────
std::string csv_field(const std::string &value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void write_csv_row(std::ofstream &out, const std::vector<std::string> &fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << csv_field(fields[i]);
    }
    out << "\r\n";
}

// ─────────────────────────────────────
struct CheckRow {
    CheckEvent check;
    Instant period_end;
};

std::vector<CheckRow> check_rows(HabitLedger &ledger, const std::optional<std::string> &name) {
    std::unordered_map<int64_t, Periodicity> periodicityById;
    for (const Habit &h : ledger.ListHabits()) {
        periodicityById[h.id] = h.periodicity;
    }

    std::vector<CheckRow> rows;
    for (const CheckEvent &c : ledger.ListChecks(name)) {
        auto it = periodicityById.find(c.habit_id);
        if (it == periodicityById.end()) {
            spdlog::warn("Check {} references unknown habit {}, skipping", c.id, c.habit_id);
            continue;
        }
        rows.push_back({c, period_bounds(it->second, c.period_start).end});
    }
    return rows;
}

} // namespace

// ─────────────────────────────────────
nlohmann::json HabitsToJson(HabitLedger &ledger) {
    nlohmann::json rows = nlohmann::json::array();
    for (const Habit &h : ledger.ListHabits()) {
        rows.push_back({{"id", h.id},
                        {"name", h.name},
                        {"periodicity", periodicity_name(h.periodicity)},
                        {"created_at", format_timestamp(h.created_at)}});
    }
    return rows;
}

// ─────────────────────────────────────
nlohmann::json ChecksToJson(HabitLedger &ledger, const std::optional<std::string> &name) {
    nlohmann::json rows = nlohmann::json::array();
    for (const CheckRow &r : check_rows(ledger, name)) {
        rows.push_back({{"id", r.check.id},
                        {"habit_id", r.check.habit_id},
                        {"ts", format_timestamp(r.check.occurred_at)},
                        {"period_start", format_timestamp(r.check.period_start)},
                        {"period_end", format_timestamp(r.period_end)}});
    }
    return rows;
}

// ─────────────────────────────────────
std::filesystem::path ExportHabitsJson(HabitLedger &ledger, const std::filesystem::path &path) {
    const nlohmann::json rows = HabitsToJson(ledger);
    std::ofstream out = open_output(path);
    out << rows.dump(2, ' ', false) << '\n';
    finish(out, path);
    spdlog::debug("Exported {} habits to {}", rows.size(), path.string());
    return path;
}

// ─────────────────────────────────────
std::filesystem::path ExportHabitsCsv(HabitLedger &ledger, const std::filesystem::path &path) {
    const std::vector<Habit> habits = ledger.ListHabits();
    std::ofstream out = open_output(path);
    write_csv_row(out, {"id", "name", "periodicity", "created_at"});
    for (const Habit &h : habits) {
        write_csv_row(out, {std::to_string(h.id), h.name, periodicity_name(h.periodicity),
                            format_timestamp(h.created_at)});
    }
    finish(out, path);
    spdlog::debug("Exported {} habits to {}", habits.size(), path.string());
    return path;
}

// ─────────────────────────────────────
std::filesystem::path ExportChecksJson(HabitLedger &ledger, const std::filesystem::path &path,
                                       const std::optional<std::string> &name) {
    const nlohmann::json rows = ChecksToJson(ledger, name);
    std::ofstream out = open_output(path);
    out << rows.dump(2, ' ', false) << '\n';
    finish(out, path);
    spdlog::debug("Exported {} checks to {}", rows.size(), path.string());
    return path;
}

// ─────────────────────────────────────
std::filesystem::path ExportChecksCsv(HabitLedger &ledger, const std::filesystem::path &path,
                                      const std::optional<std::string> &name) {
    const std::vector<CheckRow> rows = check_rows(ledger, name);
    std::ofstream out = open_output(path);
    write_csv_row(out, {"id", "habit_id", "ts", "period_start", "period_end"});
    for (const CheckRow &r : rows) {
        write_csv_row(out, {std::to_string(r.check.id), std::to_string(r.check.habit_id),
                            format_timestamp(r.check.occurred_at),
                            format_timestamp(r.check.period_start),
                            format_timestamp(r.period_end)});
    }
    finish(out, path);
    spdlog::debug("Exported {} checks to {}", rows.size(), path.string());
    return path;
}
