#pragma once

#include <chrono>
#include <cstdint>
#include <string>

using Instant = std::chrono::sys_seconds;

enum class Periodicity { Daily = 1, Weekly = 2 };

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

struct Habit {
    int64_t id = -1;
    std::string name;
    Periodicity periodicity = Periodicity::Daily;
    Instant created_at{};
};

struct CheckEvent {
    int64_t id = -1;
    int64_t habit_id = -1;
    Instant occurred_at{};
    Instant period_start{};
};

// [start, end)
struct PeriodBounds {
    Instant start{};
    Instant end{};
};

struct StreakSummary {
    int longest = 0;
    int current = 0;
};

// Copy of s without leading and trailing whitespace.
std::string trim_copy(const std::string &s);
