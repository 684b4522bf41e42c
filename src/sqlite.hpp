#pragma once

#include <sqlite3.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"
#include "habit_store.hpp"

class SQLite : public HabitStore {
  public:
    // Pass ":memory:" for a throwaway database.
    SQLite(const std::string &db_path);
    ~SQLite() override;

    SQLite(const SQLite &) = delete;
    SQLite &operator=(const SQLite &) = delete;

    // Habits
    std::optional<Habit> FindHabitByName(const std::string &name) override;
    Habit CreateHabit(const std::string &name, Periodicity periodicity,
                      Instant created_at) override;
    std::vector<Habit> ListHabits(std::optional<Periodicity> filter) override;

    // Check-offs
    std::optional<CheckEvent> FindCheck(int64_t habitId, Instant periodStart) override;
    CheckEvent InsertCheck(int64_t habitId, Instant periodStart, Instant occurredAt) override;
    std::vector<CheckEvent> ListChecks(std::optional<int64_t> habitId) override;

  private:
    void Init();
    void Close();
    void PrepareStatements();
    sqlite3_stmt *Prepare(const char *sql, const char *what);
    void Exec(const std::string &sql);
    void ExecIgnoringErrors(const std::string &sql);
    [[noreturn]] void Fail(const char *what);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;

    sqlite3_stmt *m_FindHabitStmt = nullptr;
    sqlite3_stmt *m_InsertHabitStmt = nullptr;
    sqlite3_stmt *m_FindCheckStmt = nullptr;
    sqlite3_stmt *m_InsertCheckStmt = nullptr;

    // Small deterministic lookaside buffer to reduce heap churn.
    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 128; // 16 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
