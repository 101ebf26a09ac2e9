#include "agenttreasury/treasury.hpp"
#include "agenttreasury/config_loader.hpp"
#include "agenttreasury/exceptions.hpp"

namespace agenttreasury {

Treasury::Treasury(Config config,
                   std::shared_ptr<CacheStore> cache,
                   std::shared_ptr<LedgerStore> store,
                   TimeSource clock)
    : config_(std::move(config))
    , clock_(clock ? std::move(clock) : TimeSource([] { return Clock::now(); }))
    , monitor_hub_(std::make_shared<CompositeMonitor>())
    , cache_(cache ? std::move(cache)
                   : std::shared_ptr<CacheStore>(std::make_shared<InMemoryCacheStore>(clock_)))
    , store_(store ? std::move(store)
                   : std::shared_ptr<LedgerStore>(std::make_shared<InMemoryLedgerStore>()))
{
    validate_config(config_);

    write_queue_ = std::make_shared<WriteBehindQueue>(config_.audit, monitor_hub_);
    ledger_ = std::make_shared<TransactionLedger>(cache_, store_, write_queue_, config_.audit,
                                                  config_.key_prefix, monitor_hub_);
    budgets_ = std::make_shared<BudgetCache>(cache_, store_, write_queue_, config_.cas_retry,
                                             config_.key_prefix, monitor_hub_, clock_);
    breaker_ = std::make_shared<EmergencyCircuitBreaker>(cache_, ledger_,
                                                         config_.circuit_breaker,
                                                         config_.key_prefix, monitor_hub_,
                                                         clock_);
    registry_ = std::make_shared<BudgetRegistry>(budgets_, ledger_, breaker_, config_.defaults,
                                                 monitor_hub_, clock_);
    scaler_ = std::make_unique<PerformanceScaler>(budgets_, ledger_, config_.scaler,
                                                  monitor_hub_, clock_);
    scheduler_ = std::make_unique<DailyResetScheduler>(registry_, config_.reset_scheduler);
}

Treasury::~Treasury() {
    stop();
}

// ==================== Agent Lifecycle ====================

AgentBudget Treasury::provision_agent(const std::string& agent_id, const BudgetSeed& seed,
                                      const std::string& actor) {
    return registry_->provision(agent_id, seed, actor);
}

AgentBudget Treasury::set_agent_status(const std::string& agent_id, BudgetStatus status,
                                       const std::string& actor, const std::string& reason) {
    return registry_->set_status(agent_id, status, actor, reason);
}

AgentBudget Treasury::get_budget(const std::string& agent_id) {
    auto budget = registry_->get_budget(agent_id);
    if (!budget.has_value()) {
        throw BudgetNotFoundException(BudgetRegistry::normalize_agent_id(agent_id));
    }
    return *budget;
}

std::vector<AgentId> Treasury::list_agents() {
    return registry_->list_agent_ids();
}

// ==================== Spending ====================

AuthorizationResult Treasury::authorize(const std::string& agent_id, MinorUnits amount,
                                        const std::string& description,
                                        const Metadata& metadata) {
    SpendRequest request;
    request.agent_id = agent_id;
    request.amount = amount;
    request.description = description;
    request.metadata = metadata;
    return registry_->authorize(request);
}

AuthorizationResult Treasury::authorize(const SpendRequest& request) {
    return registry_->authorize(request);
}

std::future<AuthorizationResult> Treasury::authorize_async(SpendRequest request) {
    return registry_->authorize_async(std::move(request));
}

AuthorizationResult Treasury::credit(const std::string& agent_id, MinorUnits amount,
                                     const std::string& description,
                                     std::optional<RoiData> roi_data) {
    return registry_->credit(agent_id, amount, description, std::move(roi_data));
}

// ==================== Emergency Stop ====================

bool Treasury::freeze(const std::string& reason, const std::string& actor) {
    return breaker_->freeze(reason, actor);
}

bool Treasury::unfreeze(const std::string& reason, const std::string& actor) {
    return breaker_->unfreeze(reason, actor);
}

bool Treasury::is_frozen() {
    return breaker_->is_frozen();
}

CircuitBreakerState Treasury::breaker_state() {
    return breaker_->state();
}

// ==================== Audit Trail ====================

std::vector<Transaction> Treasury::get_transactions(const std::string& agent_id,
                                                    const TimeRange& range,
                                                    std::size_t limit) {
    return ledger_->get_transactions(BudgetRegistry::normalize_agent_id(agent_id), range, limit);
}

std::vector<Transaction> Treasury::recent_activity(const std::string& agent_id,
                                                   std::size_t limit) {
    return ledger_->recent_activity(BudgetRegistry::normalize_agent_id(agent_id), limit);
}

std::vector<AdminEvent> Treasury::get_admin_events(const TimeRange& range, std::size_t limit) {
    return ledger_->get_admin_events(range, limit);
}

AgentTotals Treasury::agent_totals(const std::string& agent_id) {
    return ledger_->agent_totals(BudgetRegistry::normalize_agent_id(agent_id));
}

// ==================== Performance ====================

PerformanceSnapshot Treasury::performance(const std::string& agent_id) {
    return scaler_->snapshot(agent_id);
}

RescaleResult Treasury::rescale(const std::string& agent_id, const std::string& actor) {
    return scaler_->rescale(agent_id, actor);
}

std::vector<RescaleResult> Treasury::rescale_all(const std::string& actor) {
    return scaler_->rescale_all(actor);
}

DailyResetScheduler::RunReport Treasury::run_daily_reset() {
    return scheduler_->run_once();
}

// ==================== Queries ====================

EconomicSummary Treasury::economic_summary() {
    EconomicSummary summary;
    std::optional<MinorUnits> best_net;

    for (const auto& id : registry_->list_agent_ids()) {
        auto budget = registry_->get_budget(id);
        if (!budget.has_value()) continue;

        summary.total_agents++;
        if (budget->status == BudgetStatus::Active) summary.active_agents++;
        if (budget->status == BudgetStatus::Suspended) summary.suspended_agents++;

        summary.total_balance += budget->current_balance;
        summary.total_spent += budget->total_spent;
        summary.total_earned += budget->total_earned;

        if (!best_net.has_value() || budget->net_worth() > *best_net) {
            best_net = budget->net_worth();
            summary.top_performer = budget->agent_id;
        }
    }

    if (summary.total_spent > 0) {
        summary.system_roi = static_cast<double>(summary.total_earned) /
                             static_cast<double>(summary.total_spent);
    }
    return summary;
}

TreasuryStatus Treasury::status() {
    TreasuryStatus s;
    s.breaker = breaker_->state();
    s.frozen = s.breaker.frozen;
    s.agent_count = registry_->list_agent_ids().size();
    s.pending_durable_writes = write_queue_->pending();
    s.unwritten_at_stop = write_queue_->unwritten_at_stop();
    s.scheduler_running = scheduler_->is_running();
    return s;
}

// ==================== Configuration ====================

void Treasury::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_hub_->add_monitor(std::move(monitor));
}

void Treasury::start() {
    if (running_.exchange(true)) return;  // Already running

    write_queue_->start();
    if (config_.reset_scheduler.enabled) {
        scheduler_->start();
    }
}

void Treasury::stop() {
    if (!running_.exchange(false)) return;  // Already stopped

    scheduler_->stop();
    write_queue_->stop();
}

bool Treasury::is_running() const noexcept {
    return running_.load();
}

std::size_t Treasury::flush() {
    return write_queue_->flush();
}

} // namespace agenttreasury
