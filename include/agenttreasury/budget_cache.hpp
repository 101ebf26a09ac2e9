#pragma once

#include "agenttreasury/cache_store.hpp"
#include "agenttreasury/config.hpp"
#include "agenttreasury/ledger_store.hpp"
#include "agenttreasury/monitor.hpp"
#include "agenttreasury/write_behind_queue.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agenttreasury {

// Typed AgentBudget access over the cache store, plus the one optimistic
// compare-and-swap loop every budget mutation goes through.
//
// The cache copy is authoritative for balances. Each committed write is
// mirrored to the ledger store through the write-behind queue.
class BudgetCache {
public:
    // Edits the budget in place. Return false to leave it unwritten.
    // May be called several times per update (once per CAS attempt); throwing
    // aborts the update with nothing written.
    using Mutator = std::function<bool(AgentBudget&)>;

    BudgetCache(std::shared_ptr<CacheStore> cache,
                std::shared_ptr<LedgerStore> ledger,
                std::shared_ptr<WriteBehindQueue> mirror_queue,
                RetryConfig cas_retry,
                std::string key_prefix,
                std::shared_ptr<Monitor> monitor = nullptr,
                TimeSource clock = nullptr);

    // Cache first; on a miss, rehydrate from the ledger store.
    std::optional<AgentBudget> load(const AgentId& agent_id);

    // Create-if-absent. Returns the stored budget and whether it was created.
    std::pair<AgentBudget, bool> create(AgentBudget initial);

    // Read-modify-CAS loop with jittered backoff.
    // Throws BudgetNotFoundException, AuthorizationCancelledException,
    // ContentionExceededException, or whatever the mutator throws.
    AgentBudget update(const AgentId& agent_id, const Mutator& mutator,
                       const CancellationToken* cancel = nullptr);

    // Agents known to the cache or the ledger store, sorted
    std::vector<AgentId> list_agent_ids();

    std::string key_for(const AgentId& agent_id) const;

private:
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<LedgerStore> ledger_;
    std::shared_ptr<WriteBehindQueue> mirror_queue_;
    RetryConfig cas_retry_;
    std::string budget_prefix_;
    std::shared_ptr<Monitor> monitor_;
    TimeSource clock_;

    std::optional<AgentBudget> read_cached(const AgentId& agent_id);
    void mirror(const AgentBudget& budget);
    void emit_event(EventType type, const std::string& message,
                    const AgentId& agent_id, int attempts);
};

} // namespace agenttreasury
