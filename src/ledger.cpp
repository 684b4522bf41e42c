#include "ledger.hpp"

#include "check_registry.hpp"
#include "due.hpp"
#include "errors.hpp"
#include "period.hpp"
#include "streak.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

// ─────────────────────────────────────
HabitLedger::HabitLedger(HabitStore &store, const Clock &clock)
    : m_Store(store), m_Clock(clock) {}

// ─────────────────────────────────────
Habit HabitLedger::AddHabit(const std::string &name, Periodicity periodicity) {
    const std::string trimmed = trim_copy(name);
    if (trimmed.empty()) {
        throw std::invalid_argument("habit name must not be empty");
    }

    Habit h = m_Store.CreateHabit(trimmed, periodicity, m_Clock.Now());
    spdlog::info("Habit added: {} ({})", h.name, periodicity_name(h.periodicity));
    return h;
}

// ─────────────────────────────────────
Habit HabitLedger::GetHabit(const std::string &name) {
    const std::string trimmed = trim_copy(name);
    std::optional<Habit> h = m_Store.FindHabitByName(trimmed);
    if (!h) {
        throw NotFoundError(trimmed);
    }
    return *h;
}

// ─────────────────────────────────────
std::vector<Habit> HabitLedger::ListHabits(std::optional<Periodicity> filter) {
    return m_Store.ListHabits(filter);
}

// ─────────────────────────────────────
CheckEvent HabitLedger::RecordCheck(const std::string &name, std::optional<Instant> at) {
    return RecordCheck(GetHabit(name), at);
}

// ─────────────────────────────────────
CheckEvent HabitLedger::RecordCheck(const Habit &habit, std::optional<Instant> at) {
    return record_check(m_Store, habit, at.value_or(m_Clock.Now()));
}

// ─────────────────────────────────────
std::optional<Instant> HabitLedger::CheckedPeriodAt(const Habit &habit, Instant at) {
    const Instant start = period_bounds(habit.periodicity, at).start;
    if (m_Store.FindCheck(habit.id, start)) {
        return start;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
bool HabitLedger::HasChecked(const std::string &name, std::optional<Instant> at) {
    const Habit habit = GetHabit(name);
    return CheckedPeriodAt(habit, at.value_or(m_Clock.Now())).has_value();
}

// ─────────────────────────────────────
bool HabitLedger::IsDue(const std::string &name, std::optional<Instant> at) {
    const Habit habit = GetHabit(name);
    const Instant ref = at.value_or(m_Clock.Now());
    return is_due(habit, CheckedPeriodAt(habit, ref), ref);
}

// ─────────────────────────────────────
std::vector<Habit> HabitLedger::ListDue(std::optional<Periodicity> filter,
                                        std::optional<Instant> at) {
    const Instant ref = at.value_or(m_Clock.Now());
    std::vector<Habit> due;
    for (const Habit &habit : m_Store.ListHabits(filter)) {
        if (is_due(habit, CheckedPeriodAt(habit, ref), ref)) {
            due.push_back(habit);
        }
    }
    spdlog::debug("{} habits due at {}", due.size(), format_timestamp(ref));
    return due;
}

// ─────────────────────────────────────
std::vector<CheckEvent> HabitLedger::ListChecks(const std::optional<std::string> &name) {
    if (!name) {
        return m_Store.ListChecks(std::nullopt);
    }
    return m_Store.ListChecks(GetHabit(*name).id);
}

// ─────────────────────────────────────
StreakSummary HabitLedger::StreakFor(const Habit &habit) {
    std::vector<Instant> starts;
    for (const CheckEvent &c : m_Store.ListChecks(habit.id)) {
        starts.push_back(c.period_start);
    }

    StreakSummary summary;
    summary.longest = longest_streak(habit.periodicity, starts);
    summary.current = current_streak(habit.periodicity, std::move(starts), m_Clock.Now());
    return summary;
}

// ─────────────────────────────────────
StreakSummary HabitLedger::Streak(const std::string &name) {
    return StreakFor(GetHabit(name));
}

// ─────────────────────────────────────
std::optional<std::pair<Habit, StreakSummary>> HabitLedger::StreakAll() {
    std::optional<std::pair<Habit, StreakSummary>> best;
    for (const Habit &habit : m_Store.ListHabits(std::nullopt)) {
        StreakSummary s = StreakFor(habit);
        if (s.longest > 0 && (!best || s.longest > best->second.longest)) {
            best.emplace(habit, s);
        }
    }
    return best;
}
