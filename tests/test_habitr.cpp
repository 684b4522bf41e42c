#include <doctest/doctest.h>

#include "errors.hpp"
#include "habitr.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

namespace {

struct AppFixture {
    std::ostringstream out;
    Habitr app{":memory:", out, std::make_unique<FixedClock>(utc(2025, 9, 15, 8))};

    std::string Take() {
        std::string s = out.str();
        out.str("");
        return s;
    }
};

// Sets or clears one environment variable and restores it on scope exit.
class ScopedEnv {
  public:
    ScopedEnv(const char *name, const char *value) : m_Name(name) {
        if (const char *old = std::getenv(name)) {
            m_Old = old;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (m_Old) {
            ::setenv(m_Name.c_str(), m_Old->c_str(), 1);
        } else {
            ::unsetenv(m_Name.c_str());
        }
    }

  private:
    std::string m_Name;
    std::optional<std::string> m_Old;
};

} // namespace

TEST_CASE_FIXTURE(AppFixture, "add, list and check render console lines") {
    CHECK(Take().empty());

    app.List();
    CHECK(Take() == "No habits yet.\n");

    app.Add("Drink water", "daily");
    CHECK(Take() == "Added: Drink water (daily) @ 2025-09-15T08:00:00\n");

    app.Add("Stretch", "weekly");
    Take();

    app.List();
    CHECK(Take() == "- daily  | Drink water | created 2025-09-15T08:00:00\n"
                    "- weekly | Stretch | created 2025-09-15T08:00:00\n");

    app.ListBy("weekly");
    CHECK(Take() == "- weekly | Stretch\n");

    app.Check("Drink water", std::string("2025-09-15T11:00:00"));
    CHECK(Take() == "Checked 'Drink water' for period [2025-09-15T00:00:00 .. 2025-09-16T00:00:00)\n");

    app.Check("Stretch", std::nullopt);
    CHECK(Take() == "Checked 'Stretch' for period [2025-09-15T00:00:00 .. 2025-09-22T00:00:00)\n");
}

TEST_CASE_FIXTURE(AppFixture, "due and streak output") {
    app.Add("Drink water", "daily");
    Take();

    app.Due(std::nullopt, std::nullopt);
    CHECK(Take() == "- daily  | Drink water\n");

    app.Check("Drink water", std::nullopt);
    Take();
    app.Due(std::nullopt, std::nullopt);
    CHECK(Take() == "Nothing due. Great job!\n");

    app.Due(std::string("daily"), std::string("2025-09-16T09:00"));
    CHECK(Take() == "- daily  | Drink water\n");

    app.Streak("Drink water");
    CHECK(Take() == "Longest streak for 'Drink water': 1\nCurrent streak for 'Drink water': 1\n");

    app.StreakAll();
    CHECK(Take() == "Best longest streak: 1 (Drink water)\n");
}

TEST_CASE_FIXTURE(AppFixture, "errors propagate to the caller") {
    CHECK_THROWS_AS(app.Streak("nope"), NotFoundError);
    CHECK_THROWS_AS(app.Add("x", "hourly"), InvalidPeriodicityError);
    app.Add("x", "daily");
    CHECK_THROWS_AS(app.Add("x", "daily"), DuplicateNameError);
    CHECK_THROWS_AS(app.Check("x", std::string("not-a-date")), std::invalid_argument);
    CHECK_THROWS_AS(app.Check("x", std::string("+025-09-15")), std::invalid_argument);
    CHECK_THROWS_AS(app.ExportHabits("xml", "out.xml"), std::invalid_argument);

    app.StreakAll();
    CHECK(Take().find("No streaks yet.") != std::string::npos);
}

TEST_CASE("GetDBPath resolves XDG_DATA_HOME, then HOME") {
    const std::filesystem::path root = std::filesystem::temp_directory_path() /
                                       ("habitr_env_" + std::to_string(::getpid()));
    std::filesystem::remove_all(root);
    const std::filesystem::path xdg = root / "xdg";
    const std::filesystem::path home = root / "home";

    SUBCASE("XDG_DATA_HOME wins over HOME") {
        ScopedEnv x("XDG_DATA_HOME", xdg.c_str());
        ScopedEnv h("HOME", home.c_str());
        const std::filesystem::path p = Habitr::GetDBPath();
        CHECK(p == xdg / "habitr" / "habits.sqlite");
        CHECK(std::filesystem::is_directory(xdg / "habitr"));
        CHECK_FALSE(std::filesystem::exists(home));
    }

    SUBCASE("empty XDG_DATA_HOME falls back to HOME") {
        ScopedEnv x("XDG_DATA_HOME", "");
        ScopedEnv h("HOME", home.c_str());
        const std::filesystem::path p = Habitr::GetDBPath();
        CHECK(p == home / ".local" / "share" / "habitr" / "habits.sqlite");
        CHECK(std::filesystem::is_directory(p.parent_path()));
    }

    SUBCASE("unset XDG_DATA_HOME falls back to HOME") {
        ScopedEnv x("XDG_DATA_HOME", nullptr);
        ScopedEnv h("HOME", home.c_str());
        CHECK(Habitr::GetDBPath() == home / ".local" / "share" / "habitr" / "habits.sqlite");
    }

    SUBCASE("no HOME and no XDG_DATA_HOME throws") {
        ScopedEnv x("XDG_DATA_HOME", nullptr);
        ScopedEnv h("HOME", nullptr);
        CHECK_THROWS_AS(Habitr::GetDBPath(), std::runtime_error);
    }

    std::filesystem::remove_all(root);
}
