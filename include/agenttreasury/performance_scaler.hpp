#pragma once

#include "agenttreasury/budget_cache.hpp"
#include "agenttreasury/config.hpp"
#include "agenttreasury/monitor.hpp"
#include "agenttreasury/transaction_ledger.hpp"

#include <memory>
#include <string>
#include <vector>

namespace agenttreasury {

// Rescales daily and per-action limits from realized ROI.
//
// ROI = value generated / amount spent over the trailing window
// (ScalerConfig::roi_window, at most max_window_transactions successful
// transactions). Value generated is credited earnings plus the realized
// value reported on successful debits. Tier bounds are inclusive below.
class PerformanceScaler {
public:
    PerformanceScaler(std::shared_ptr<BudgetCache> budgets,
                      std::shared_ptr<TransactionLedger> ledger,
                      ScalerConfig config,
                      std::shared_ptr<Monitor> monitor = nullptr,
                      TimeSource clock = nullptr);

    PerformanceSnapshot snapshot(const std::string& agent_id);

    // Never touches current_balance. With no spend in the window nothing changes.
    RescaleResult rescale(const std::string& agent_id,
                          const std::string& actor = "performance_scaler");

    // Every active agent
    std::vector<RescaleResult> rescale_all(const std::string& actor = "performance_scaler");

    PerformanceTier classify(double roi) const;
    double multiplier_for(PerformanceTier tier) const;

    // Multiplies, rounds, and clamps to the configured floor and ceiling.
    // A limit already past a bound is left where it is.
    BudgetLimits scale_limits(const BudgetLimits& limits, double multiplier) const;

    const ScalerConfig& config() const { return config_; }

private:
    std::shared_ptr<BudgetCache> budgets_;
    std::shared_ptr<TransactionLedger> ledger_;
    ScalerConfig config_;
    std::shared_ptr<Monitor> monitor_;
    TimeSource clock_;

    void log_rescale(const RescaleResult& result, const std::string& actor);
};

} // namespace agenttreasury
