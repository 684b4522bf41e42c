#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "clock.hpp"
#include "common.hpp"
#include "habit_store.hpp"

// Composes period math, the check registry, the streak analyzer and the due
// calculator on top of an injected store and clock. Holds no state of its own.
class HabitLedger {
  public:
    HabitLedger(HabitStore &store, const Clock &clock);

    // Habits
    Habit AddHabit(const std::string &name, Periodicity periodicity);
    Habit GetHabit(const std::string &name);
    std::vector<Habit> ListHabits(std::optional<Periodicity> filter = std::nullopt);

    // Check-offs
    CheckEvent RecordCheck(const std::string &name, std::optional<Instant> at = std::nullopt);
    CheckEvent RecordCheck(const Habit &habit, std::optional<Instant> at = std::nullopt);
    bool HasChecked(const std::string &name, std::optional<Instant> at = std::nullopt);
    std::vector<CheckEvent> ListChecks(const std::optional<std::string> &name = std::nullopt);

    // Due
    bool IsDue(const std::string &name, std::optional<Instant> at = std::nullopt);
    std::vector<Habit> ListDue(std::optional<Periodicity> filter = std::nullopt,
                               std::optional<Instant> at = std::nullopt);

    // Analytics
    StreakSummary Streak(const std::string &name);
    std::optional<std::pair<Habit, StreakSummary>> StreakAll();


  private:
    std::optional<Instant> CheckedPeriodAt(const Habit &habit, Instant at);
    StreakSummary StreakFor(const Habit &habit);

  private:
    HabitStore &m_Store;
    const Clock &m_Clock;
};
