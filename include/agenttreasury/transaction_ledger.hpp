#pragma once

#include "agenttreasury/cache_store.hpp"
#include "agenttreasury/config.hpp"
#include "agenttreasury/ledger_store.hpp"
#include "agenttreasury/monitor.hpp"
#include "agenttreasury/write_behind_queue.hpp"

#include <memory>
#include <string>
#include <vector>

namespace agenttreasury {

// Append-only audit trail: one immutable Transaction per spend attempt, and a
// parallel log of administrative events.
class TransactionLedger {
public:
    TransactionLedger(std::shared_ptr<CacheStore> cache,
                      std::shared_ptr<LedgerStore> store,
                      std::shared_ptr<WriteBehindQueue> queue,
                      AuditConfig config,
                      std::string key_prefix,
                      std::shared_ptr<Monitor> monitor = nullptr);

    // Indexes the record in the cache and appends it durably. If the durable
    // append keeps failing, the record is buffered for background retry and
    // AuditWriteDegradedException is thrown. The record is never dropped.
    void record(const Transaction& txn);
    void record_admin_event(const AdminEvent& event);

    // Durable history, newest first. Buffered records appear once they land.
    std::vector<Transaction> get_transactions(const AgentId& agent_id,
                                              const TimeRange& range = TimeRange::all(),
                                              std::size_t limit = 0);
    std::vector<AdminEvent> get_admin_events(const TimeRange& range = TimeRange::all(),
                                             std::size_t limit = 0);

    // Cache-backed recent-activity index, newest first
    std::vector<Transaction> recent_activity(const AgentId& agent_id, std::size_t limit = 50);

    AgentTotals agent_totals(const AgentId& agent_id);

    std::size_t pending_writes() const;
    std::size_t flush();

private:
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<LedgerStore> store_;
    std::shared_ptr<WriteBehindQueue> queue_;
    AuditConfig config_;
    std::string recent_prefix_;
    std::shared_ptr<Monitor> monitor_;

    void index_recent(const Transaction& txn);
    void emit_event(EventType type, const std::string& message,
                    const std::optional<AgentId>& agent_id,
                    const std::string& record_id);
};

} // namespace agenttreasury
