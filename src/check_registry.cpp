#include "check_registry.hpp"
#include "period.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
CheckEvent record_check(HabitStore &store, const Habit &habit, Instant at) {
    const PeriodBounds bounds = period_bounds(habit.periodicity, at);

    if (auto existing = store.FindCheck(habit.id, bounds.start)) {
        spdlog::debug("'{}' already checked for period starting {}", habit.name,
                      format_timestamp(bounds.start));
        return *existing;
    }

    CheckEvent event = store.InsertCheck(habit.id, bounds.start, at);
    spdlog::debug("Checked '{}' at {} (period {} .. {})", habit.name, format_timestamp(at),
                  format_timestamp(bounds.start), format_timestamp(bounds.end));
    return event;
}
