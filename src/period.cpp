#include "period.hpp"
#include "errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace {

[[noreturn]] void bad_timestamp(const std::string &text) {
    throw std::invalid_argument("invalid timestamp '" + text +
                                "', expected YYYY-MM-DD[THH:MM[:SS]]");
}

// '9' matches a digit; any other layout character must match literally.
bool matches_layout(const std::string &s, std::size_t pos, const char *layout) {
    for (; *layout; ++layout, ++pos) {
        if (pos >= s.size()) {
            return false;
        }
        const auto c = static_cast<unsigned char>(s[pos]);
        if (*layout == '9' ? !std::isdigit(c) : c != static_cast<unsigned char>(*layout)) {
            return false;
        }
    }
    return true;
}

} // namespace

// ─────────────────────────────────────
Instant start_of_day(Instant t) {
    return std::chrono::floor<std::chrono::days>(t);
}

// ─────────────────────────────────────
Instant start_of_iso_week(Instant t) {
    const auto day = std::chrono::floor<std::chrono::days>(t);
    const std::chrono::weekday wd{day};
    // iso_encoding(): Monday = 1 .. Sunday = 7
    return day - std::chrono::days{wd.iso_encoding() - 1};
}

// ─────────────────────────────────────
std::chrono::seconds period_length(Periodicity periodicity) {
    switch (periodicity) {
    case Periodicity::Daily:
        return std::chrono::days{1};
    case Periodicity::Weekly:
        return std::chrono::weeks{1};
    }
    throw InvalidPeriodicityError(std::to_string(static_cast<int>(periodicity)));
}

// ─────────────────────────────────────
PeriodBounds period_bounds(Periodicity periodicity, Instant t) {
    PeriodBounds bounds;
    switch (periodicity) {
    case Periodicity::Daily:
        bounds.start = start_of_day(t);
        break;
    case Periodicity::Weekly:
        bounds.start = start_of_iso_week(t);
        break;
    default:
        throw InvalidPeriodicityError(std::to_string(static_cast<int>(periodicity)));
    }
    bounds.end = bounds.start + period_length(periodicity);
    return bounds;
}

// ─────────────────────────────────────
Periodicity parse_periodicity(const std::string &text) {
    std::string value = trim_copy(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "daily") {
        return Periodicity::Daily;
    }
    if (value == "weekly") {
        return Periodicity::Weekly;
    }
    throw InvalidPeriodicityError(text);
}

// ─────────────────────────────────────
std::string periodicity_name(Periodicity periodicity) {
    switch (periodicity) {
    case Periodicity::Daily:
        return "daily";
    case Periodicity::Weekly:
        return "weekly";
    }
    throw InvalidPeriodicityError(std::to_string(static_cast<int>(periodicity)));
}

// ─────────────────────────────────────
Instant parse_timestamp(const std::string &text) {
    std::string s = trim_copy(text);
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
    }

    int y = 0;
    unsigned mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (!matches_layout(s, 0, "9999-99-99")) {
        bad_timestamp(text);
    }
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2u-%2u%n", &y, &mo, &d, &consumed) != 3 || consumed != 10) {
        bad_timestamp(text);
    }

    if (s.size() > 10) {
        if (s[10] != 'T' && s[10] != ' ') {
            bad_timestamp(text);
        }
        if (!matches_layout(s, 11, "99:99")) {
            bad_timestamp(text);
        }
        const char *rest = s.c_str() + 11;
        int n = 0;
        if (std::sscanf(rest, "%2u:%2u%n", &h, &mi, &n) != 2) {
            bad_timestamp(text);
        }
        rest += n;
        if (*rest == ':') {
            if (!matches_layout(s, 16, ":99")) {
                bad_timestamp(text);
            }
            n = 0;
            if (std::sscanf(rest, ":%2u%n", &sec, &n) != 1) {
                bad_timestamp(text);
            }
            rest += n;
            if (*rest == '.') {
                ++rest;
                if (!std::isdigit(static_cast<unsigned char>(*rest))) {
                    bad_timestamp(text);
                }
                while (std::isdigit(static_cast<unsigned char>(*rest))) {
                    ++rest;
                }
            }
        }
        if (*rest != '\0') {
            bad_timestamp(text);
        }
    }

    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{mo},
                                          std::chrono::day{d}};
    if (!ymd.ok() || h > 23 || mi > 59 || sec > 59) {
        bad_timestamp(text);
    }

    return std::chrono::sys_days{ymd} + std::chrono::hours{h} + std::chrono::minutes{mi} +
           std::chrono::seconds{sec};
}

// ─────────────────────────────────────
std::string format_timestamp(Instant t) {
    const auto day = std::chrono::floor<std::chrono::days>(t);
    const std::chrono::year_month_day ymd{day};
    const std::chrono::hh_mm_ss hms{t - day};
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}
