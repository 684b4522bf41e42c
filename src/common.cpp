#include "common.hpp"

#include <algorithm>
#include <cctype>

// ─────────────────────────────────────
std::string trim_copy(const std::string &s) {
    const auto first = std::find_if_not(s.begin(), s.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(),
                                       [](unsigned char c) { return std::isspace(c); })
                          .base();
    return first < last ? std::string(first, last) : std::string();
}
