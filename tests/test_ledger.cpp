#include <doctest/doctest.h>

#include "clock.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "period.hpp"
#include "sqlite.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using std::chrono::hours;

namespace {

struct LedgerFixture {
    SQLite store{":memory:"};
    FixedClock clock{utc(2025, 9, 15, 8)};
    HabitLedger ledger{store, clock};
};

} // namespace

TEST_CASE_FIXTURE(LedgerFixture, "repeated checks in one day store a single event") {
    const Instant t0 = clock.Now();
    const Habit h = ledger.AddHabit("Drink water", Periodicity::Daily);
    CHECK(h.created_at == t0);

    const CheckEvent first = ledger.RecordCheck("Drink water");
    clock.Advance(hours{3});
    const CheckEvent second = ledger.RecordCheck("Drink water");

    CHECK(first.id == second.id);
    CHECK(second.occurred_at == t0);
    CHECK(second.period_start == utc(2025, 9, 15));
    CHECK(ledger.ListChecks("Drink water").size() == 1);

    CHECK_FALSE(ledger.IsDue("Drink water"));
    CHECK(ledger.IsDue("Drink water", t0 + hours{25}));
    CHECK(ledger.HasChecked("Drink water", t0 + hours{15}));
    CHECK_FALSE(ledger.HasChecked("Drink water", t0 + hours{16}));
}

TEST_CASE_FIXTURE(LedgerFixture, "weekly streak survives a skipped week only as longest") {
    ledger.AddHabit("Long run", Periodicity::Weekly);
    const Instant monday = utc(2025, 9, 15, 7);

    for (int w = 0; w < 4; ++w) {
        ledger.RecordCheck("Long run", monday + days_n(7 * w));
    }
    clock.Set(monday + days_n(7 * 3) + hours{5});
    StreakSummary s = ledger.Streak("Long run");
    CHECK(s.longest == 4);
    CHECK(s.current == 4);

    // Skip week 4, check week 5.
    ledger.RecordCheck("Long run", monday + days_n(7 * 5));
    clock.Set(monday + days_n(7 * 5) + hours{30});
    s = ledger.Streak("Long run");
    CHECK(s.longest == 4);
    CHECK(s.current == 1);
}

TEST_CASE_FIXTURE(LedgerFixture, "current streak lapses once a full period is missed") {
    ledger.AddHabit("Read", Periodicity::Daily);
    for (int d = 0; d < 3; ++d) {
        ledger.RecordCheck("Read", utc(2025, 9, 10, 21) + days_n(d));
    }
    clock.Set(utc(2025, 9, 13, 9)); // 12th checked, 13th not yet
    CHECK(ledger.Streak("Read").current == 3);
    clock.Set(utc(2025, 9, 14, 9));
    CHECK(ledger.Streak("Read").current == 0);
    CHECK(ledger.Streak("Read").longest == 3);
}

TEST_CASE_FIXTURE(LedgerFixture, "habit names are unique after trimming") {
    ledger.AddHabit("Meditate", Periodicity::Daily);
    CHECK_THROWS_AS(ledger.AddHabit("Meditate", Periodicity::Weekly), DuplicateNameError);
    CHECK_THROWS_AS(ledger.AddHabit("  Meditate ", Periodicity::Daily), DuplicateNameError);
    CHECK_THROWS_AS(ledger.AddHabit("   ", Periodicity::Daily), std::invalid_argument);
    CHECK(ledger.ListHabits().size() == 1);
}

TEST_CASE_FIXTURE(LedgerFixture, "lookups trim the name the same way add does") {
    const Habit h = ledger.AddHabit("  Read ", Periodicity::Daily);
    CHECK(h.name == "Read");
    CHECK(ledger.GetHabit("  Read ").id == h.id);
    CHECK(ledger.RecordCheck(" Read").habit_id == h.id);
    CHECK(ledger.HasChecked("Read  "));
}

TEST_CASE_FIXTURE(LedgerFixture, "recording by habit matches recording by name") {
    const Habit h = ledger.AddHabit("Floss", Periodicity::Daily);
    const CheckEvent byHabit = ledger.RecordCheck(h);
    const CheckEvent byName = ledger.RecordCheck("Floss", clock.Now() + hours{2});
    CHECK(byHabit.id == byName.id);
    CHECK(byHabit.period_start == utc(2025, 9, 15));
    CHECK(ledger.ListChecks(std::string("Floss")).size() == 1);
}

TEST_CASE_FIXTURE(LedgerFixture, "unknown habits raise NotFoundError") {
    CHECK_THROWS_AS(ledger.Streak("ghost"), NotFoundError);
    CHECK_THROWS_AS(ledger.RecordCheck("ghost"), NotFoundError);
    CHECK_THROWS_AS(ledger.IsDue("ghost"), NotFoundError);
    CHECK_THROWS_AS(ledger.ListChecks(std::string("ghost")), NotFoundError);
    CHECK_THROWS_AS(ledger.GetHabit("ghost"), NotFoundError);
}

TEST_CASE_FIXTURE(LedgerFixture, "habits are listed daily first, then by name") {
    ledger.AddHabit("b-stretch", Periodicity::Weekly);
    ledger.AddHabit("z-floss", Periodicity::Daily);
    ledger.AddHabit("a-walk", Periodicity::Daily);

    const auto all = ledger.ListHabits();
    REQUIRE(all.size() == 3);
    CHECK(all[0].name == "a-walk");
    CHECK(all[1].name == "z-floss");
    CHECK(all[2].name == "b-stretch");

    const auto daily = ledger.ListHabits(Periodicity::Daily);
    REQUIRE(daily.size() == 2);
    CHECK(daily[0].name == "a-walk");
    CHECK(daily[1].name == "z-floss");

    const auto weekly = ledger.ListHabits(Periodicity::Weekly);
    REQUIRE(weekly.size() == 1);
    CHECK(weekly[0].periodicity == Periodicity::Weekly);
}

TEST_CASE_FIXTURE(LedgerFixture, "list due filters out habits checked this period") {
    ledger.AddHabit("Floss", Periodicity::Daily);
    ledger.AddHabit("Journal", Periodicity::Daily);
    ledger.AddHabit("Review", Periodicity::Weekly);

    CHECK(ledger.ListDue().size() == 3);

    ledger.RecordCheck("Floss");
    ledger.RecordCheck("Review");

    auto due = ledger.ListDue();
    REQUIRE(due.size() == 1);
    CHECK(due[0].name == "Journal");
    CHECK(ledger.ListDue(Periodicity::Weekly).empty());

    // Next day: both dailies due again, the weekly one is still covered.
    due = ledger.ListDue(std::nullopt, clock.Now() + hours{24});
    CHECK(due.size() == 2);
    CHECK(ledger.ListDue(Periodicity::Weekly, clock.Now() + hours{24}).empty());
}

TEST_CASE_FIXTURE(LedgerFixture, "streak-all picks the best longest streak") {
    CHECK_FALSE(ledger.StreakAll().has_value());

    ledger.AddHabit("Walk", Periodicity::Daily);
    ledger.AddHabit("Swim", Periodicity::Weekly);
    CHECK_FALSE(ledger.StreakAll().has_value());

    for (int d = 0; d < 3; ++d) {
        ledger.RecordCheck("Walk", utc(2025, 9, 1) + days_n(d));
    }
    for (int w = 0; w < 5; ++w) {
        ledger.RecordCheck("Swim", utc(2025, 8, 4) + days_n(7 * w));
    }

    const auto best = ledger.StreakAll();
    REQUIRE(best.has_value());
    CHECK(best->first.name == "Swim");
    CHECK(best->second.longest == 5);
}

TEST_CASE_FIXTURE(LedgerFixture, "checks list by period start across habits") {
    ledger.AddHabit("A", Periodicity::Daily);
    ledger.AddHabit("B", Periodicity::Daily);
    ledger.RecordCheck("A", utc(2025, 9, 3));
    ledger.RecordCheck("B", utc(2025, 9, 1));
    ledger.RecordCheck("A", utc(2025, 9, 2));

    const auto all = ledger.ListChecks();
    REQUIRE(all.size() == 3);
    CHECK(all[0].period_start == utc(2025, 9, 1));
    CHECK(all[1].period_start == utc(2025, 9, 2));
    CHECK(all[2].period_start == utc(2025, 9, 3));

    CHECK(ledger.ListChecks(std::string("A")).size() == 2);
}
