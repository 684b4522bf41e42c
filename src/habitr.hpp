#pragma once

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "clock.hpp"
#include "common.hpp"
#include "ledger.hpp"
#include "sqlite.hpp"

// Command front end: owns the store, clock and ledger for one invocation and
// renders results as console lines.
class Habitr {
  public:
    explicit Habitr(const std::filesystem::path &db_path, std::ostream &out = std::cout,
                    std::unique_ptr<Clock> clock = std::make_unique<SystemClock>());

    void Add(const std::string &name, const std::string &periodicity);
    void List();
    void ListBy(const std::string &periodicity);
    void Check(const std::string &name, const std::optional<std::string> &ts);
    void Due(const std::optional<std::string> &periodicity, const std::optional<std::string> &ts);
    void Streak(const std::string &name);
    void StreakAll();
    void ExportHabits(const std::string &format, const std::filesystem::path &path);
    void ExportChecks(const std::string &format, const std::filesystem::path &path,
                      const std::optional<std::string> &name);

    // $XDG_DATA_HOME/habitr/habits.sqlite, else ~/.local/share/habitr/habits.sqlite
    static std::filesystem::path GetDBPath();
    static void SetLogLevel(LogLevel log_level);

  private:
    std::ostream &m_Out;
    std::unique_ptr<Clock> m_Clock;
    std::unique_ptr<SQLite> m_SQLite;
    std::unique_ptr<HabitLedger> m_Ledger;
};
