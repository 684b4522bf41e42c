#include "sqlite.hpp"
#include "errors.hpp"
#include "period.hpp"

#include <spdlog/spdlog.h>

namespace {

// ─────────────────────────────────────
// Resets a long-lived prepared statement when the calling scope ends so it
// never keeps a read snapshot open between operations.
struct ScopedReset {
    sqlite3_stmt *stmt;
    explicit ScopedReset(sqlite3_stmt *s) : stmt(s) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    ~ScopedReset() { sqlite3_reset(stmt); }
    ScopedReset(const ScopedReset &) = delete;
    ScopedReset &operator=(const ScopedReset &) = delete;
};

// ─────────────────────────────────────
struct SqliteStmt {
    sqlite3_stmt *stmt = nullptr;
    ~SqliteStmt() {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
    sqlite3_stmt **out() { return &stmt; }
    sqlite3_stmt *get() const { return stmt; }
    SqliteStmt(const SqliteStmt &) = delete;
    SqliteStmt &operator=(const SqliteStmt &) = delete;
    SqliteStmt() = default;
};

// ─────────────────────────────────────
// BEGIN IMMEDIATE on construction, ROLLBACK unless Commit() was reached.
class Transaction {
  public:
    explicit Transaction(sqlite3 *db) : m_Db(db) {
        char *errmsg = nullptr;
        if (sqlite3_exec(m_Db, "BEGIN IMMEDIATE", nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : sqlite3_errmsg(m_Db);
            sqlite3_free(errmsg);
            spdlog::error("unable to begin transaction: {}", msg);
            throw StorageError("unable to begin transaction: " + msg);
        }
    }

    ~Transaction() {
        if (!m_Done) {
            sqlite3_exec(m_Db, "ROLLBACK", nullptr, nullptr, nullptr);
            spdlog::debug("Transaction rolled back");
        }
    }

    void Commit() {
        char *errmsg = nullptr;
        if (sqlite3_exec(m_Db, "COMMIT", nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : sqlite3_errmsg(m_Db);
            sqlite3_free(errmsg);
            spdlog::error("unable to commit transaction: {}", msg);
            throw StorageError("unable to commit transaction: " + msg);
        }
        m_Done = true;
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

  private:
    sqlite3 *m_Db;
    bool m_Done = false;
};

// ─────────────────────────────────────
int64_t to_epoch(Instant t) {
    return t.time_since_epoch().count();
}

Instant from_epoch(sqlite3_int64 v) {
    return Instant{std::chrono::seconds{v}};
}

// ─────────────────────────────────────
Habit read_habit(sqlite3_stmt *stmt) {
    Habit h;
    h.id = sqlite3_column_int64(stmt, 0);
    const char *name = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
    h.name = name ? name : "";
    const char *periodicity = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 2));
    h.periodicity = parse_periodicity(periodicity ? periodicity : "");
    h.created_at = from_epoch(sqlite3_column_int64(stmt, 3));
    return h;
}

CheckEvent read_check(sqlite3_stmt *stmt) {
    CheckEvent c;
    c.id = sqlite3_column_int64(stmt, 0);
    c.habit_id = sqlite3_column_int64(stmt, 1);
    c.occurred_at = from_epoch(sqlite3_column_int64(stmt, 2));
    c.period_start = from_epoch(sqlite3_column_int64(stmt, 3));
    return c;
}

} // namespace

// ─────────────────────────────────────
SQLite::SQLite(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        std::string msg = m_Db ? sqlite3_errmsg(m_Db) : "out of memory";
        spdlog::error("unable to open database {}: {}", m_DbPath, msg);
        sqlite3_close(m_Db);
        m_Db = nullptr;
        throw StorageError("unable to open database " + m_DbPath + ": " + msg);
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    sqlite3_busy_timeout(m_Db, 2000);
    sqlite3_extended_result_codes(m_Db, 1);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA foreign_keys=ON");

    try {
        Init();
        PrepareStatements();
    } catch (...) {
        Close();
        throw;
    }
}

// ─────────────────────────────────────
SQLite::~SQLite() {
    Close();
}

// ─────────────────────────────────────
void SQLite::Close() {
    for (sqlite3_stmt **stmt :
         {&m_FindHabitStmt, &m_InsertHabitStmt, &m_FindCheckStmt, &m_InsertCheckStmt}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
void SQLite::Init() {
    spdlog::debug("Initializing SQLite database tables");

    Exec("CREATE TABLE IF NOT EXISTS habits ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "name TEXT NOT NULL UNIQUE,"
         "periodicity TEXT NOT NULL CHECK (periodicity IN ('daily','weekly')),"
         "created_at INTEGER NOT NULL"
         ")");

    // One row per (habit, period): the idempotency boundary of a check-off.
    Exec("CREATE TABLE IF NOT EXISTS checks ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "habit_id INTEGER NOT NULL REFERENCES habits(id) ON DELETE CASCADE,"
         "ts INTEGER NOT NULL,"
         "period_start INTEGER NOT NULL,"
         "UNIQUE (habit_id, period_start)"
         ")");

    Exec("CREATE INDEX IF NOT EXISTS idx_checks_period_start ON checks(period_start)");

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
void SQLite::PrepareStatements() {
    m_FindHabitStmt = Prepare(R"(
        SELECT id, name, periodicity, created_at
        FROM habits
        WHERE name = ?
    )",
                              "FindHabit");

    m_InsertHabitStmt = Prepare(R"(
        INSERT INTO habits (name, periodicity, created_at)
        VALUES (?, ?, ?)
    )",
                                "InsertHabit");

    m_FindCheckStmt = Prepare(R"(
        SELECT id, habit_id, ts, period_start
        FROM checks
        WHERE habit_id = ? AND period_start = ?
    )",
                              "FindCheck");

    // A concurrent writer that already claimed the period wins; we keep its row.
    m_InsertCheckStmt = Prepare(R"(
        INSERT INTO checks (habit_id, ts, period_start)
        VALUES (?, ?, ?)
        ON CONFLICT (habit_id, period_start) DO NOTHING
    )",
                                "InsertCheck");
}

// ─────────────────────────────────────
sqlite3_stmt *SQLite::Prepare(const char *sql, const char *what) {
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed for {} stmt: {}", what, sqlite3_errmsg(m_Db));
        throw StorageError(std::string("db prepare failed for ") + what + ": " +
                           sqlite3_errmsg(m_Db));
    }
    return stmt;
}

// ─────────────────────────────────────
std::optional<Habit> SQLite::FindHabitByName(const std::string &name) {
    ScopedReset reset(m_FindHabitStmt);
    sqlite3_bind_text(m_FindHabitStmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(m_FindHabitStmt);
    if (rc == SQLITE_ROW) {
        return read_habit(m_FindHabitStmt);
    }
    if (rc != SQLITE_DONE) {
        Fail("FindHabitByName");
    }
    return std::nullopt;
}

// ─────────────────────────────────────
Habit SQLite::CreateHabit(const std::string &name, Periodicity periodicity, Instant created_at) {
    const std::string periodicityText = periodicity_name(periodicity);

    ScopedReset reset(m_InsertHabitStmt);
    sqlite3_bind_text(m_InsertHabitStmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_InsertHabitStmt, 2, periodicityText.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(m_InsertHabitStmt, 3, to_epoch(created_at));

    const int rc = sqlite3_step(m_InsertHabitStmt);
    if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        spdlog::debug("CreateHabit rejected duplicate name '{}'", name);
        throw DuplicateNameError(name);
    }
    if (rc != SQLITE_DONE) {
        Fail("CreateHabit");
    }

    Habit h;
    h.id = sqlite3_last_insert_rowid(m_Db);
    h.name = name;
    h.periodicity = periodicity;
    h.created_at = created_at;

    spdlog::debug("Inserted habit: id={}, name={}, periodicity={}", h.id, h.name,
                  periodicityText);
    return h;
}

// ─────────────────────────────────────
std::vector<Habit> SQLite::ListHabits(std::optional<Periodicity> filter) {
    SqliteStmt stmt;
    const char *sql = filter ? "SELECT id, name, periodicity, created_at FROM habits "
                               "WHERE periodicity = ? ORDER BY name ASC"
                             : "SELECT id, name, periodicity, created_at FROM habits "
                               "ORDER BY periodicity ASC, name ASC";
    if (sqlite3_prepare_v2(m_Db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        Fail("ListHabits prepare");
    }

    std::string periodicityText;
    if (filter) {
        periodicityText = periodicity_name(*filter);
        sqlite3_bind_text(stmt.get(), 1, periodicityText.c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<Habit> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        rows.push_back(read_habit(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        Fail("ListHabits");
    }

    spdlog::debug("Fetched {} habits", rows.size());
    return rows;
}

// ─────────────────────────────────────
std::optional<CheckEvent> SQLite::FindCheck(int64_t habitId, Instant periodStart) {
    ScopedReset reset(m_FindCheckStmt);
    sqlite3_bind_int64(m_FindCheckStmt, 1, habitId);
    sqlite3_bind_int64(m_FindCheckStmt, 2, to_epoch(periodStart));

    const int rc = sqlite3_step(m_FindCheckStmt);
    if (rc == SQLITE_ROW) {
        return read_check(m_FindCheckStmt);
    }
    if (rc != SQLITE_DONE) {
        Fail("FindCheck");
    }
    return std::nullopt;
}

// ─────────────────────────────────────
CheckEvent SQLite::InsertCheck(int64_t habitId, Instant periodStart, Instant occurredAt) {
    Transaction tx(m_Db);

    {
        ScopedReset reset(m_InsertCheckStmt);
        sqlite3_bind_int64(m_InsertCheckStmt, 1, habitId);
        sqlite3_bind_int64(m_InsertCheckStmt, 2, to_epoch(occurredAt));
        sqlite3_bind_int64(m_InsertCheckStmt, 3, to_epoch(periodStart));

        if (sqlite3_step(m_InsertCheckStmt) != SQLITE_DONE) {
            Fail("InsertCheck");
        }
        if (sqlite3_changes(m_Db) == 0) {
            spdlog::debug("InsertCheck: period {} of habit {} already claimed",
                          format_timestamp(periodStart), habitId);
        }
    }

    std::optional<CheckEvent> stored = FindCheck(habitId, periodStart);
    if (!stored) {
        spdlog::error("InsertCheck: no row for habit {} after insert", habitId);
        throw StorageError("check row missing after insert");
    }

    tx.Commit();
    return *stored;
}

// ─────────────────────────────────────
std::vector<CheckEvent> SQLite::ListChecks(std::optional<int64_t> habitId) {
    SqliteStmt stmt;
    const char *sql = habitId ? "SELECT id, habit_id, ts, period_start FROM checks "
                                "WHERE habit_id = ? ORDER BY period_start ASC, id ASC"
                              : "SELECT id, habit_id, ts, period_start FROM checks "
                                "ORDER BY period_start ASC, id ASC";
    if (sqlite3_prepare_v2(m_Db, sql, -1, stmt.out(), nullptr) != SQLITE_OK) {
        Fail("ListChecks prepare");
    }
    if (habitId) {
        sqlite3_bind_int64(stmt.get(), 1, *habitId);
    }

    std::vector<CheckEvent> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        rows.push_back(read_check(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        Fail("ListChecks");
    }

    spdlog::debug("Fetched {} checks", rows.size());
    return rows;
}

// ─────────────────────────────────────
void SQLite::Exec(const std::string &sql) {
    char *errmsg = nullptr;
    if (sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string msg = errmsg ? errmsg : sqlite3_errmsg(m_Db);
        sqlite3_free(errmsg);
        spdlog::error("sqlite exec error: {}", msg);
        throw StorageError("sqlite exec error: " + msg);
    }
}

// ─────────────────────────────────────
void SQLite::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::warn("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}

// ─────────────────────────────────────
void SQLite::Fail(const char *what) {
    spdlog::error("{} failed: {}", what, sqlite3_errmsg(m_Db));
    throw StorageError(std::string(what) + " failed: " + sqlite3_errmsg(m_Db));
}
