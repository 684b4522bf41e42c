#include "due.hpp"
#include "period.hpp"

// ─────────────────────────────────────
bool is_due(const Habit &habit, std::optional<Instant> last_check_period_start, Instant now) {
    if (!last_check_period_start) {
        return true;
    }
    return period_bounds(habit.periodicity, now).start != *last_check_period_start;
}
