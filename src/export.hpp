#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ledger.hpp"

nlohmann::json HabitsToJson(HabitLedger &ledger);
nlohmann::json ChecksToJson(HabitLedger &ledger, const std::optional<std::string> &name);

// Each returns the written path. Parent directories are created.
std::filesystem::path ExportHabitsJson(HabitLedger &ledger, const std::filesystem::path &path);
std::filesystem::path ExportHabitsCsv(HabitLedger &ledger, const std::filesystem::path &path);
std::filesystem::path ExportChecksJson(HabitLedger &ledger, const std::filesystem::path &path,
                                       const std::optional<std::string> &name = std::nullopt);
std::filesystem::path ExportChecksCsv(HabitLedger &ledger, const std::filesystem::path &path,
                                      const std::optional<std::string> &name = std::nullopt);
