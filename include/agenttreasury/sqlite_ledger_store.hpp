#pragma once

#include "agenttreasury/ledger_store.hpp"

#include <mutex>
#include <string>

struct sqlite3;

namespace agenttreasury {

// LedgerStore on a single SQLite database file (WAL journal).
//
// Transactions and admin events are append-only: duplicates by id are
// ignored, so a retried write can never produce a second record.
class SqliteLedgerStore : public LedgerStore {
public:
    static constexpr int SCHEMA_VERSION = 1;

    // ":memory:" opens a private in-memory database.
    // Throws StoreUnavailableException if the database cannot be opened.
    explicit SqliteLedgerStore(const std::string& path);
    ~SqliteLedgerStore() override;

    SqliteLedgerStore(const SqliteLedgerStore&) = delete;
    SqliteLedgerStore& operator=(const SqliteLedgerStore&) = delete;

    void upsert_budget(const AgentBudget& budget) override;
    std::optional<AgentBudget> get_budget(const AgentId& agent_id) override;
    std::vector<AgentBudget> list_budgets() override;

    bool append_transaction(const Transaction& txn) override;
    std::vector<Transaction> query_transactions(const AgentId& agent_id,
                                                const TimeRange& range,
                                                std::size_t limit = 0) override;

    bool append_admin_event(const AdminEvent& event) override;
    std::vector<AdminEvent> query_admin_events(const TimeRange& range,
                                               std::size_t limit = 0) override;

    int schema_version();
    const std::string& path() const { return path_; }

private:
    std::string path_;
    sqlite3* db_{nullptr};
    std::mutex db_mutex_;

    void execute(const char* sql);
    void create_schema();
};

} // namespace agenttreasury
