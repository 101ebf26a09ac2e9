#include "agenttreasury/performance_scaler.hpp"
#include "agenttreasury/budget_registry.hpp"
#include "agenttreasury/exceptions.hpp"
#include "agenttreasury/time_util.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace agenttreasury {

namespace {

std::string format_ratio(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    return buf;
}

} // anonymous namespace

PerformanceScaler::PerformanceScaler(std::shared_ptr<BudgetCache> budgets,
                                     std::shared_ptr<TransactionLedger> ledger,
                                     ScalerConfig config,
                                     std::shared_ptr<Monitor> monitor,
                                     TimeSource clock)
    : budgets_(std::move(budgets))
    , ledger_(std::move(ledger))
    , config_(std::move(config))
    , monitor_(std::move(monitor))
    , clock_(clock ? std::move(clock) : TimeSource([] { return Clock::now(); }))
{}

PerformanceTier PerformanceScaler::classify(double roi) const {
    if (roi >= config_.excellent_threshold) return PerformanceTier::Excellent;
    if (roi >= config_.good_threshold)      return PerformanceTier::Good;
    if (roi >= config_.neutral_threshold)   return PerformanceTier::Neutral;
    if (roi >= config_.poor_threshold)      return PerformanceTier::Poor;
    return PerformanceTier::Critical;
}

double PerformanceScaler::multiplier_for(PerformanceTier tier) const {
    switch (tier) {
        case PerformanceTier::Excellent: return config_.excellent_multiplier;
        case PerformanceTier::Good:      return config_.good_multiplier;
        case PerformanceTier::Neutral:   return 1.0;
        case PerformanceTier::Poor:      return config_.poor_multiplier;
        case PerformanceTier::Critical:  return config_.critical_multiplier;
    }
    return 1.0;
}

BudgetLimits PerformanceScaler::scale_limits(const BudgetLimits& limits, double multiplier) const {
    // The bounds only stop the move; a limit already past a bound is never
    // pushed against the multiplier's direction
    auto scale = [multiplier](MinorUnits value, MinorUnits floor, MinorUnits ceiling) {
        auto scaled = static_cast<MinorUnits>(std::llround(static_cast<double>(value) * multiplier));
        if (multiplier >= 1.0) {
            return std::max(value, std::min(scaled, ceiling));
        }
        return std::min(value, std::max(scaled, floor));
    };

    BudgetLimits result;
    result.daily_limit = scale(limits.daily_limit,
                               config_.daily_limit_floor, config_.daily_limit_ceiling);
    result.per_action_limit = scale(limits.per_action_limit,
                                    config_.per_action_limit_floor,
                                    config_.per_action_limit_ceiling);
    return result;
}

PerformanceSnapshot PerformanceScaler::snapshot(const std::string& agent_id) {
    PerformanceSnapshot snap;
    snap.agent_id = BudgetRegistry::normalize_agent_id(agent_id);
    snap.window_end = clock_();
    snap.window_start = snap.window_end - config_.roi_window;

    TimeRange range;
    range.from = snap.window_start;

    for (const auto& txn : ledger_->get_transactions(snap.agent_id, range)) {
        if (!txn.succeeded()) continue;
        if (snap.transaction_count >= config_.max_window_transactions) break;

        snap.transaction_count++;
        if (txn.kind == TransactionKind::Earning) {
            snap.total_value_generated += txn.amount;
        } else {
            snap.total_spent += -txn.amount;
            if (txn.roi_data.has_value() && txn.roi_data->realized_value.has_value()) {
                snap.total_value_generated += *txn.roi_data->realized_value;
            }
        }
    }

    if (snap.total_spent > 0) {
        snap.roi = static_cast<double>(snap.total_value_generated) /
                   static_cast<double>(snap.total_spent);
    }
    snap.tier = classify(snap.roi);
    return snap;
}

RescaleResult PerformanceScaler::rescale(const std::string& agent_id, const std::string& actor) {
    RescaleResult result;
    result.snapshot = snapshot(agent_id);
    result.agent_id = result.snapshot.agent_id;

    if (result.snapshot.total_spent == 0) {
        auto budget = budgets_->load(result.agent_id);
        if (!budget.has_value()) {
            throw BudgetNotFoundException(result.agent_id);
        }
        result.old_limits = {budget->daily_limit, budget->per_action_limit};
        result.new_limits = result.old_limits;
        result.reason = "no spend in window";
        return result;
    }

    result.multiplier = multiplier_for(result.snapshot.tier);
    const double roi = result.snapshot.roi;

    budgets_->update(result.agent_id, [&](AgentBudget& b) {
        result.old_limits = {b.daily_limit, b.per_action_limit};
        result.new_limits = result.old_limits;
        result.applied = false;

        if (b.status == BudgetStatus::Decommissioned) {
            result.reason = "agent decommissioned";
            return false;
        }

        if (result.multiplier != 1.0) {
            result.new_limits = scale_limits(result.old_limits, result.multiplier);
            // Keep spent_today <= daily_limit after a cut
            result.new_limits.daily_limit = std::max(result.new_limits.daily_limit,
                                                     b.spent_today);
        }

        result.applied = result.new_limits.daily_limit != b.daily_limit ||
                         result.new_limits.per_action_limit != b.per_action_limit;
        if (!result.applied) {
            result.reason = result.multiplier == 1.0 ? "neutral tier" : "already at bound";
        } else {
            result.reason = std::string(to_string(result.snapshot.tier)) + " tier";
        }

        if (!result.applied && b.roi_score == roi) {
            return false;
        }
        b.daily_limit = result.new_limits.daily_limit;
        b.per_action_limit = result.new_limits.per_action_limit;
        b.roi_score = roi;
        return true;
    });

    if (result.applied) {
        log_rescale(result, actor);
    }
    return result;
}

std::vector<RescaleResult> PerformanceScaler::rescale_all(const std::string& actor) {
    std::vector<RescaleResult> results;
    for (const auto& id : budgets_->list_agent_ids()) {
        auto budget = budgets_->load(id);
        if (!budget.has_value() || budget->status != BudgetStatus::Active) {
            continue;
        }
        results.push_back(rescale(id, actor));
    }
    return results;
}

void PerformanceScaler::log_rescale(const RescaleResult& result, const std::string& actor) {
    std::string detail =
        "roi=" + format_ratio(result.snapshot.roi) +
        " daily_limit " + std::to_string(result.old_limits.daily_limit) +
        " -> " + std::to_string(result.new_limits.daily_limit) +
        ", per_action_limit " + std::to_string(result.old_limits.per_action_limit) +
        " -> " + std::to_string(result.new_limits.per_action_limit);

    MonitorEvent event;
    event.type = EventType::LimitsRescaled;
    event.timestamp = clock_();
    event.message = result.reason + ": " + detail;
    event.agent_id = result.agent_id;
    event.actor = actor;
    if (monitor_) {
        monitor_->on_event(event);
    }

    AdminEvent audit;
    audit.event_id = generate_uuid();
    audit.kind = AdminEventKind::LimitRescale;
    audit.agent_id = result.agent_id;
    audit.actor = actor;
    audit.reason = result.reason;
    audit.detail = detail;
    audit.timestamp = event.timestamp;

    try {
        ledger_->record_admin_event(audit);
    } catch (const AuditWriteDegradedException&) {
        // Buffered for retry and reported by the ledger
    }
}

} // namespace agenttreasury
