#include "streak.hpp"
#include "period.hpp"

#include <algorithm>

namespace {

// ─────────────────────────────────────
void sort_unique(std::vector<Instant> &starts) {
    std::sort(starts.begin(), starts.end());
    starts.erase(std::unique(starts.begin(), starts.end()), starts.end());
}

} // namespace

// ─────────────────────────────────────
int longest_streak(Periodicity periodicity, std::vector<Instant> period_starts) {
    sort_unique(period_starts);

    const auto step = period_length(periodicity);
    int longest = 0;
    int current = 0;
    for (size_t i = 0; i < period_starts.size(); ++i) {
        if (i > 0 && period_starts[i] - period_starts[i - 1] == step) {
            ++current;
        } else {
            current = 1;
        }
        longest = std::max(longest, current);
    }
    return longest;
}

// ─────────────────────────────────────
int current_streak(Periodicity periodicity, std::vector<Instant> period_starts, Instant now) {
    const auto step = period_length(periodicity);
    const Instant this_period = period_bounds(periodicity, now).start;

    period_starts.erase(std::remove_if(period_starts.begin(), period_starts.end(),
                                       [&](Instant s) { return s > this_period; }),
                        period_starts.end());
    sort_unique(period_starts);
    if (period_starts.empty()) {
        return 0;
    }

    const Instant latest = period_starts.back();
    if (latest != this_period && latest != this_period - step) {
        return 0;
    }

    int run = 1;
    for (size_t i = period_starts.size() - 1; i > 0; --i) {
        if (period_starts[i] - period_starts[i - 1] != step) {
            break;
        }
        ++run;
    }
    return run;
}
