#include "agenttreasury/sqlite_ledger_store.hpp"
#include "agenttreasury/codec.hpp"
#include "agenttreasury/exceptions.hpp"
#include "agenttreasury/time_util.hpp"

#include <sqlite3.h>

namespace agenttreasury {

namespace {

const char* STORE_NAME = "sqlite";

const char* BUDGET_COLUMNS =
    "agent_id, current_balance, daily_limit, per_action_limit, spent_today, "
    "total_spent, total_earned, last_reset_date, utc_offset_minutes, status, "
    "roi_score, created_at, updated_at, revision";

const char* TRANSACTION_COLUMNS =
    "transaction_id, agent_id, amount, kind, description, timestamp, outcome, "
    "denial_reason, balance_before, balance_after, roi_data, metadata";

const char* ADMIN_EVENT_COLUMNS =
    "event_id, kind, agent_id, actor, reason, detail, timestamp";

// Owns one prepared statement; binds are 1-based like the C API
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreUnavailableException(STORE_NAME,
                std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& v) {
        check(sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bind(int idx, std::int64_t v) { check(sqlite3_bind_int64(stmt_, idx, v)); }
    void bind(int idx, double v) { check(sqlite3_bind_double(stmt_, idx, v)); }
    void bind_null(int idx) { check(sqlite3_bind_null(stmt_, idx)); }

    template<typename T>
    void bind_optional(int idx, const std::optional<T>& v) {
        if (v.has_value()) {
            bind(idx, *v);
        } else {
            bind_null(idx);
        }
    }

    // True while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreUnavailableException(STORE_NAME,
            std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    std::int64_t column_int64(int col) { return sqlite3_column_int64(stmt_, col); }
    double column_double(int col) { return sqlite3_column_double(stmt_, col); }
    bool column_is_null(int col) { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::string column_text(int col) {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        return text ? reinterpret_cast<const char*>(text) : std::string();
    }

    std::optional<std::int64_t> column_optional_int64(int col) {
        if (column_is_null(col)) return std::nullopt;
        return column_int64(col);
    }

    int changes() { return sqlite3_changes(db_); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreUnavailableException(STORE_NAME,
                std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }
};

AgentBudget read_budget(Statement& stmt) {
    AgentBudget b;
    b.agent_id = stmt.column_text(0);
    b.current_balance = stmt.column_int64(1);
    b.daily_limit = stmt.column_int64(2);
    b.per_action_limit = stmt.column_int64(3);
    b.spent_today = stmt.column_int64(4);
    b.total_spent = stmt.column_int64(5);
    b.total_earned = stmt.column_int64(6);
    b.last_reset_date = stmt.column_int64(7);
    b.utc_offset_minutes = static_cast<std::int32_t>(stmt.column_int64(8));
    b.status = parse_budget_status(stmt.column_text(9));
    b.roi_score = stmt.column_double(10);
    b.created_at = from_unix_millis(stmt.column_int64(11));
    b.updated_at = from_unix_millis(stmt.column_int64(12));
    b.revision = static_cast<std::uint64_t>(stmt.column_int64(13));
    return b;
}

Transaction read_transaction(Statement& stmt) {
    Transaction t;
    t.transaction_id = stmt.column_text(0);
    t.agent_id = stmt.column_text(1);
    t.amount = stmt.column_int64(2);
    t.kind = parse_transaction_kind(stmt.column_text(3));
    t.description = stmt.column_text(4);
    t.timestamp = from_unix_millis(stmt.column_int64(5));
    t.outcome = parse_transaction_outcome(stmt.column_text(6));
    if (!stmt.column_is_null(7)) {
        t.denial_reason = parse_denial_reason(stmt.column_text(7));
    }
    t.balance_before = stmt.column_optional_int64(8);
    t.balance_after = stmt.column_optional_int64(9);
    if (!stmt.column_is_null(10)) {
        t.roi_data = decode_roi_data(stmt.column_text(10));
    }
    if (!stmt.column_is_null(11)) {
        t.metadata = decode_metadata(stmt.column_text(11));
    }
    return t;
}

AdminEvent read_admin_event(Statement& stmt) {
    AdminEvent e;
    e.event_id = stmt.column_text(0);
    e.kind = parse_admin_event_kind(stmt.column_text(1));
    if (!stmt.column_is_null(2)) {
        e.agent_id = stmt.column_text(2);
    }
    e.actor = stmt.column_text(3);
    e.reason = stmt.column_text(4);
    e.detail = stmt.column_text(5);
    e.timestamp = from_unix_millis(stmt.column_int64(6));
    return e;
}

std::string limit_clause(std::size_t limit) {
    return limit > 0 ? " LIMIT " + std::to_string(limit) : std::string();
}

} // anonymous namespace

SqliteLedgerStore::SqliteLedgerStore(const std::string& path)
    : path_(path)
{
    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string details = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreUnavailableException(STORE_NAME, "cannot open '" + path_ + "': " + details);
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        execute("PRAGMA journal_mode=WAL;");
        execute("PRAGMA synchronous=NORMAL;");
        create_schema();
    } catch (const StoreUnavailableException&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteLedgerStore::~SqliteLedgerStore() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteLedgerStore::execute(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string details = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreUnavailableException(STORE_NAME, details);
    }
}

void SqliteLedgerStore::create_schema() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY,
            applied_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS budgets (
            agent_id TEXT PRIMARY KEY,
            current_balance INTEGER NOT NULL,
            daily_limit INTEGER NOT NULL,
            per_action_limit INTEGER NOT NULL,
            spent_today INTEGER NOT NULL,
            total_spent INTEGER NOT NULL DEFAULT 0,
            total_earned INTEGER NOT NULL DEFAULT 0,
            last_reset_date INTEGER NOT NULL,
            utc_offset_minutes INTEGER NOT NULL DEFAULT 0,
            status TEXT NOT NULL DEFAULT 'active',
            roi_score REAL NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            revision INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS transactions (
            transaction_id TEXT PRIMARY KEY,
            agent_id TEXT NOT NULL,
            amount INTEGER NOT NULL,
            kind TEXT NOT NULL,
            description TEXT NOT NULL DEFAULT '',
            timestamp INTEGER NOT NULL,
            outcome TEXT NOT NULL,
            denial_reason TEXT,
            balance_before INTEGER,
            balance_after INTEGER,
            roi_data TEXT,
            metadata TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_transactions_agent_time
            ON transactions(agent_id, timestamp);

        CREATE TABLE IF NOT EXISTS admin_events (
            event_id TEXT PRIMARY KEY,
            kind TEXT NOT NULL,
            agent_id TEXT,
            actor TEXT NOT NULL DEFAULT '',
            reason TEXT NOT NULL DEFAULT '',
            detail TEXT NOT NULL DEFAULT '',
            timestamp INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_admin_events_time ON admin_events(timestamp);
    )");

    Statement stmt(db_, "INSERT OR IGNORE INTO schema_version (version, applied_at) "
                        "VALUES (?, ?)");
    stmt.bind(1, static_cast<std::int64_t>(SCHEMA_VERSION));
    stmt.bind(2, to_unix_millis(Clock::now()));
    stmt.step();
}

int SqliteLedgerStore::schema_version() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, "SELECT MAX(version) FROM schema_version");
    if (!stmt.step() || stmt.column_is_null(0)) return 0;
    return static_cast<int>(stmt.column_int64(0));
}

// ========== Budgets ==========

void SqliteLedgerStore::upsert_budget(const AgentBudget& b) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, std::string("INSERT INTO budgets (") + BUDGET_COLUMNS + ") "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(agent_id) DO UPDATE SET "
        "current_balance = excluded.current_balance, "
        "daily_limit = excluded.daily_limit, "
        "per_action_limit = excluded.per_action_limit, "
        "spent_today = excluded.spent_today, "
        "total_spent = excluded.total_spent, "
        "total_earned = excluded.total_earned, "
        "last_reset_date = excluded.last_reset_date, "
        "utc_offset_minutes = excluded.utc_offset_minutes, "
        "status = excluded.status, "
        "roi_score = excluded.roi_score, "
        "updated_at = excluded.updated_at, "
        "revision = excluded.revision "
        "WHERE excluded.revision >= budgets.revision");
    stmt.bind(1, b.agent_id);
    stmt.bind(2, b.current_balance);
    stmt.bind(3, b.daily_limit);
    stmt.bind(4, b.per_action_limit);
    stmt.bind(5, b.spent_today);
    stmt.bind(6, b.total_spent);
    stmt.bind(7, b.total_earned);
    stmt.bind(8, b.last_reset_date);
    stmt.bind(9, static_cast<std::int64_t>(b.utc_offset_minutes));
    stmt.bind(10, std::string(to_string(b.status)));
    stmt.bind(11, b.roi_score);
    stmt.bind(12, to_unix_millis(b.created_at));
    stmt.bind(13, to_unix_millis(b.updated_at));
    stmt.bind(14, static_cast<std::int64_t>(b.revision));
    stmt.step();
}

std::optional<AgentBudget> SqliteLedgerStore::get_budget(const AgentId& agent_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, std::string("SELECT ") + BUDGET_COLUMNS +
                        " FROM budgets WHERE agent_id = ?");
    stmt.bind(1, agent_id);
    if (!stmt.step()) return std::nullopt;
    return read_budget(stmt);
}

std::vector<AgentBudget> SqliteLedgerStore::list_budgets() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, std::string("SELECT ") + BUDGET_COLUMNS +
                        " FROM budgets ORDER BY agent_id");
    std::vector<AgentBudget> result;
    while (stmt.step()) {
        result.push_back(read_budget(stmt));
    }
    return result;
}

// ========== Transactions ==========

bool SqliteLedgerStore::append_transaction(const Transaction& t) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, std::string("INSERT OR IGNORE INTO transactions (") +
                        TRANSACTION_COLUMNS + ") "
                        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, t.transaction_id);
    stmt.bind(2, t.agent_id);
    stmt.bind(3, t.amount);
    stmt.bind(4, std::string(to_string(t.kind)));
    stmt.bind(5, t.description);
    stmt.bind(6, to_unix_millis(t.timestamp));
    stmt.bind(7, std::string(to_string(t.outcome)));
    if (t.denial_reason.has_value()) {
        stmt.bind(8, std::string(to_string(*t.denial_reason)));
    } else {
        stmt.bind_null(8);
    }
    stmt.bind_optional(9, t.balance_before);
    stmt.bind_optional(10, t.balance_after);
    if (t.roi_data.has_value()) {
        stmt.bind(11, encode_roi_data(*t.roi_data));
    } else {
        stmt.bind_null(11);
    }
    if (!t.metadata.empty()) {
        stmt.bind(12, encode_metadata(t.metadata));
    } else {
        stmt.bind_null(12);
    }
    stmt.step();
    return stmt.changes() > 0;
}

std::vector<Transaction> SqliteLedgerStore::query_transactions(const AgentId& agent_id,
                                                               const TimeRange& range,
                                                               std::size_t limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, std::string("SELECT ") + TRANSACTION_COLUMNS +
                        " FROM transactions"
                        " WHERE agent_id = ? AND timestamp >= ? AND timestamp < ?"
                        " ORDER BY timestamp DESC, rowid DESC" + limit_clause(limit));
    stmt.bind(1, agent_id);
    stmt.bind(2, to_unix_millis(range.from));
    stmt.bind(3, to_unix_millis(range.to));

    std::vector<Transaction> result;
    while (stmt.step()) {
        result.push_back(read_transaction(stmt));
    }
    return result;
}

// ========== Admin events ==========

bool SqliteLedgerStore::append_admin_event(const AdminEvent& e) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, std::string("INSERT OR IGNORE INTO admin_events (") +
                        ADMIN_EVENT_COLUMNS + ") VALUES (?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, e.event_id);
    stmt.bind(2, std::string(to_string(e.kind)));
    stmt.bind_optional(3, e.agent_id);
    stmt.bind(4, e.actor);
    stmt.bind(5, e.reason);
    stmt.bind(6, e.detail);
    stmt.bind(7, to_unix_millis(e.timestamp));
    stmt.step();
    return stmt.changes() > 0;
}

std::vector<AdminEvent> SqliteLedgerStore::query_admin_events(const TimeRange& range,
                                                              std::size_t limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, std::string("SELECT ") + ADMIN_EVENT_COLUMNS +
                        " FROM admin_events WHERE timestamp >= ? AND timestamp < ?"
                        " ORDER BY timestamp DESC, rowid DESC" + limit_clause(limit));
    stmt.bind(1, to_unix_millis(range.from));
    stmt.bind(2, to_unix_millis(range.to));

    std::vector<AdminEvent> result;
    while (stmt.step()) {
        result.push_back(read_admin_event(stmt));
    }
    return result;
}

} // namespace agenttreasury
