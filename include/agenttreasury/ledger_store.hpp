#pragma once

#include "agenttreasury/types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace agenttreasury {

// Durable record store boundary: typed entity writes and range queries.
// The authority for historical audit completeness, never for balances.
//
// Implementations throw StoreUnavailableException on infrastructure failure.
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    // Insert or replace, unless the stored copy carries a newer revision.
    virtual void upsert_budget(const AgentBudget& budget) = 0;
    virtual std::optional<AgentBudget> get_budget(const AgentId& agent_id) = 0;
    virtual std::vector<AgentBudget> list_budgets() = 0;

    // Append-only. Returns false if a record with the same id already exists
    // (the existing record is left untouched).
    virtual bool append_transaction(const Transaction& txn) = 0;

    // Newest first. `limit` of 0 means unbounded.
    virtual std::vector<Transaction> query_transactions(const AgentId& agent_id,
                                                        const TimeRange& range,
                                                        std::size_t limit = 0) = 0;

    virtual bool append_admin_event(const AdminEvent& event) = 0;
    virtual std::vector<AdminEvent> query_admin_events(const TimeRange& range,
                                                       std::size_t limit = 0) = 0;
};

// Process-local LedgerStore, mainly for tests and single-process use
class InMemoryLedgerStore : public LedgerStore {
public:
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

    std::size_t transaction_count() const;
    std::size_t admin_event_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<AgentId, AgentBudget> budgets_;

    // Insertion order is kept; queries sort by timestamp
    std::vector<Transaction> transactions_;
    std::unordered_set<TransactionId> transaction_ids_;

    std::vector<AdminEvent> admin_events_;
    std::unordered_set<std::string> admin_event_ids_;
};

} // namespace agenttreasury
