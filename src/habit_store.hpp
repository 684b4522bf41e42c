#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common.hpp"

// Persistence port consumed by the ledger. Implementations must make
// InsertCheck atomic with respect to the (habit_id, period_start) key.
class HabitStore {
  public:
    virtual ~HabitStore() = default;

    virtual std::optional<Habit> FindHabitByName(const std::string &name) = 0;
    // Throws DuplicateNameError when the name is taken.
    virtual Habit CreateHabit(const std::string &name, Periodicity periodicity,
                              Instant created_at) = 0;
    virtual std::vector<Habit> ListHabits(std::optional<Periodicity> filter) = 0;

    virtual std::optional<CheckEvent> FindCheck(int64_t habitId, Instant periodStart) = 0;
    // Returns the surviving row if another caller won the race for the period.
    virtual CheckEvent InsertCheck(int64_t habitId, Instant periodStart, Instant occurredAt) = 0;
    // Ordered by period_start ascending.
    virtual std::vector<CheckEvent> ListChecks(std::optional<int64_t> habitId) = 0;
};
