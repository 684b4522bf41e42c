#pragma once

#include "common.hpp"
#include "habit_store.hpp"

// Records at most one check per (habit, period). A second check inside the
// same period returns the stored event and writes nothing.
CheckEvent record_check(HabitStore &store, const Habit &habit, Instant at);
