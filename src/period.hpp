#pragma once

#include <chrono>
#include <string>

#include "common.hpp"

// All instants are UTC. No timezone conversion happens anywhere in here.

Instant start_of_day(Instant t);

// Monday 00:00:00 of the week containing t.
Instant start_of_iso_week(Instant t);

std::chrono::seconds period_length(Periodicity periodicity);
PeriodBounds period_bounds(Periodicity periodicity, Instant t);

Periodicity parse_periodicity(const std::string &text);
std::string periodicity_name(Periodicity periodicity);

// Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM[:SS[.fff]] and the same with a space
// instead of 'T'; a trailing 'Z' is allowed. Fractions are truncated.
Instant parse_timestamp(const std::string &text);
std::string format_timestamp(Instant t);
