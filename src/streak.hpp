#pragma once

#include <vector>

#include "common.hpp"

// Longest run of consecutive periods. Input may be unsorted and contain
// duplicates; both are normalised before the scan.
int longest_streak(Periodicity periodicity, std::vector<Instant> period_starts);

// Trailing run ending at the period containing `now` or the one right before
// it. Returns 0 once the habit has lapsed. Starts after the period containing
// `now` are ignored.
int current_streak(Periodicity periodicity, std::vector<Instant> period_starts, Instant now);
