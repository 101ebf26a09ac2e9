#pragma once

#include "agenttreasury/budget_cache.hpp"
#include "agenttreasury/circuit_breaker.hpp"
#include "agenttreasury/config.hpp"
#include "agenttreasury/monitor.hpp"
#include "agenttreasury/transaction_ledger.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agenttreasury {

// Owns AgentBudget balances and daily counters; the spend authorization path.
// Must be owned by a shared_ptr: authorize_async keeps the registry alive
// until the returned future has run.
class BudgetRegistry : public std::enable_shared_from_this<BudgetRegistry> {
public:
    BudgetRegistry(std::shared_ptr<BudgetCache> budgets,
                   std::shared_ptr<TransactionLedger> ledger,
                   std::shared_ptr<EmergencyCircuitBreaker> breaker,
                   ProvisioningDefaults defaults,
                   std::shared_ptr<Monitor> monitor = nullptr,
                   TimeSource clock = nullptr);

    // Lower-cases, trims, and replaces spaces with '_'.
    // Throws InvalidAgentIdException for ids shorter than 3 characters.
    static AgentId normalize_agent_id(const std::string& raw);

    // ==================== Provisioning ====================

    // Returns the existing budget unchanged if the agent is already provisioned
    AgentBudget provision(const std::string& agent_id, const BudgetSeed& seed = BudgetSeed{},
                          const std::string& actor = "system");

    // Decommissioned is terminal
    AgentBudget set_status(const std::string& agent_id, BudgetStatus status,
                           const std::string& actor, const std::string& reason);

    // Current view, with a due daily rollover already reflected
    std::optional<AgentBudget> get_budget(const std::string& agent_id);
    std::vector<AgentId> list_agent_ids();

    // ==================== Spending ====================

    // Every call records exactly one Transaction, approved or denied.
    // Denials throw a TreasuryException whose transaction_id() names the
    // denied record. An audit write that had to be buffered does not fail
    // a committed spend; it sets AuthorizationResult::audit_degraded.
    AuthorizationResult authorize(const SpendRequest& request);
    std::future<AuthorizationResult> authorize_async(SpendRequest request);

    // Earnings. Allowed while frozen or suspended, not once decommissioned.
    AuthorizationResult credit(const std::string& agent_id, MinorUnits amount,
                               const std::string& description,
                               std::optional<RoiData> roi_data = std::nullopt,
                               Metadata metadata = {});

    // ==================== Daily rollover ====================

    // Resets spent_today if the agent-local day has advanced. Returns true if it did.
    bool rollover_if_due(const std::string& agent_id);

private:
    std::shared_ptr<BudgetCache> budgets_;
    std::shared_ptr<TransactionLedger> ledger_;
    std::shared_ptr<EmergencyCircuitBreaker> breaker_;
    ProvisioningDefaults defaults_;
    std::shared_ptr<Monitor> monitor_;
    TimeSource clock_;

    // Applies a due rollover in place. Returns true if one was due.
    bool apply_rollover(AgentBudget& budget, Timestamp now) const;

    void record_admin_event(AdminEventKind kind, const AgentId& agent_id,
                            const std::string& actor, const std::string& reason,
                            const std::string& detail);

    void emit_event(EventType type, const std::string& message,
                    const std::optional<AgentId>& agent_id = std::nullopt,
                    const std::optional<TransactionId>& txn_id = std::nullopt,
                    std::optional<MinorUnits> amount = std::nullopt,
                    std::optional<DenialReason> reason = std::nullopt,
                    std::optional<std::string> actor = std::nullopt);
};

} // namespace agenttreasury
