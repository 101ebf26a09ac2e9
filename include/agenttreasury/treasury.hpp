#pragma once

#include "agenttreasury/types.hpp"
#include "agenttreasury/config.hpp"
#include "agenttreasury/cache_store.hpp"
#include "agenttreasury/ledger_store.hpp"
#include "agenttreasury/monitor.hpp"
#include "agenttreasury/write_behind_queue.hpp"
#include "agenttreasury/budget_cache.hpp"
#include "agenttreasury/transaction_ledger.hpp"
#include "agenttreasury/circuit_breaker.hpp"
#include "agenttreasury/budget_registry.hpp"
#include "agenttreasury/performance_scaler.hpp"
#include "agenttreasury/daily_reset_scheduler.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agenttreasury {

// Wires the treasury components over one cache store and one ledger store
// and exposes the caller-facing and administrative surface.
class Treasury {
public:
    // Null stores default to the in-memory implementations
    explicit Treasury(Config config = Config{},
                      std::shared_ptr<CacheStore> cache = nullptr,
                      std::shared_ptr<LedgerStore> store = nullptr,
                      TimeSource clock = nullptr);
    ~Treasury();

    Treasury(const Treasury&) = delete;
    Treasury& operator=(const Treasury&) = delete;

    // ==================== Agent Lifecycle ====================

    AgentBudget provision_agent(const std::string& agent_id,
                                const BudgetSeed& seed = BudgetSeed{},
                                const std::string& actor = "system");
    AgentBudget set_agent_status(const std::string& agent_id, BudgetStatus status,
                                 const std::string& actor, const std::string& reason);

    // Throws BudgetNotFoundException for unknown agents
    AgentBudget get_budget(const std::string& agent_id);
    std::vector<AgentId> list_agents();

    // ==================== Spending ====================

    AuthorizationResult authorize(const std::string& agent_id, MinorUnits amount,
                                  const std::string& description,
                                  const Metadata& metadata = {});
    AuthorizationResult authorize(const SpendRequest& request);
    std::future<AuthorizationResult> authorize_async(SpendRequest request);

    AuthorizationResult credit(const std::string& agent_id, MinorUnits amount,
                               const std::string& description,
                               std::optional<RoiData> roi_data = std::nullopt);

    // ==================== Emergency Stop ====================

    bool freeze(const std::string& reason, const std::string& actor);
    bool unfreeze(const std::string& reason, const std::string& actor);
    bool is_frozen();
    CircuitBreakerState breaker_state();

    // ==================== Audit Trail ====================

    std::vector<Transaction> get_transactions(const std::string& agent_id,
                                              const TimeRange& range = TimeRange::all(),
                                              std::size_t limit = 0);
    std::vector<Transaction> recent_activity(const std::string& agent_id,
                                             std::size_t limit = 50);
    std::vector<AdminEvent> get_admin_events(const TimeRange& range = TimeRange::all(),
                                             std::size_t limit = 0);
    AgentTotals agent_totals(const std::string& agent_id);

    // ==================== Performance ====================

    PerformanceSnapshot performance(const std::string& agent_id);
    RescaleResult rescale(const std::string& agent_id,
                          const std::string& actor = "performance_scaler");
    std::vector<RescaleResult> rescale_all(const std::string& actor = "performance_scaler");

    DailyResetScheduler::RunReport run_daily_reset();

    // ==================== Queries ====================

    EconomicSummary economic_summary();
    TreasuryStatus status();

    // ==================== Configuration ====================

    void add_monitor(std::shared_ptr<Monitor> monitor);
    const Config& config() const { return config_; }

    // Background work: write-behind retries, and the reset scheduler if enabled
    void start();
    void stop();
    bool is_running() const noexcept;

    // Attempt every buffered durable write now. Returns how many landed.
    std::size_t flush();

private:
    Config config_;
    TimeSource clock_;
    std::shared_ptr<CompositeMonitor> monitor_hub_;

    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<LedgerStore> store_;

    // Sub-components
    std::shared_ptr<WriteBehindQueue> write_queue_;
    std::shared_ptr<TransactionLedger> ledger_;
    std::shared_ptr<BudgetCache> budgets_;
    std::shared_ptr<EmergencyCircuitBreaker> breaker_;
    std::shared_ptr<BudgetRegistry> registry_;
    std::unique_ptr<PerformanceScaler> scaler_;
    std::unique_ptr<DailyResetScheduler> scheduler_;

    std::atomic<bool> running_{false};
};

} // namespace agenttreasury
