#pragma once

#include <optional>

#include "common.hpp"

// A habit is due when the period containing `now` has no check yet.
bool is_due(const Habit &habit, std::optional<Instant> last_check_period_start, Instant now);
