#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agenttreasury {

// Unique identifiers
using AgentId = std::string;
using TransactionId = std::string;

// Money in minor currency units (e.g. cents). Never floating point.
using MinorUnits = std::int64_t;

// Time types
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Calendar date as days since 1970-01-01
using LocalDate = std::int64_t;

// Injectable wall clock
using TimeSource = std::function<Timestamp()>;

// Free-form caller metadata attached to a spend
using Metadata = std::map<std::string, std::string>;

enum class BudgetStatus {
    Active,
    Suspended,
    Decommissioned
};

enum class TransactionKind {
    Spending,
    Earning
};

enum class TransactionOutcome {
    Success,
    Denied
};

enum class DenialReason {
    EmergencyFreeze,
    PerActionLimit,
    DailyLimit,
    InsufficientFunds,
    AgentSuspended,
    BudgetNotFound,
    InvalidAmount,
    Contention,
    StoreUnavailable,
    Cancelled
};

enum class LimitKind {
    PerAction,
    Daily
};

enum class PerformanceTier {
    Excellent,
    Good,
    Neutral,
    Poor,
    Critical
};

enum class AdminEventKind {
    Freeze,
    Unfreeze,
    Provision,
    StatusChange,
    LimitRescale
};

// ROI attribution attached to a transaction
struct RoiData {
    std::string tool;
    MinorUnits expected_value{0};
    std::optional<MinorUnits> realized_value;
};

struct AgentBudget {
    AgentId      agent_id;
    MinorUnits   current_balance{0};
    MinorUnits   daily_limit{0};
    MinorUnits   per_action_limit{0};
    MinorUnits   spent_today{0};
    MinorUnits   total_spent{0};
    MinorUnits   total_earned{0};
    LocalDate    last_reset_date{0};
    std::int32_t utc_offset_minutes{0};
    BudgetStatus status{BudgetStatus::Active};
    double       roi_score{0.0};
    Timestamp    created_at{};
    Timestamp    updated_at{};

    // Bumped on every committed mutation; orders durable mirror writes
    std::uint64_t revision{0};

    // Cache CAS version this snapshot was read at (0 = not from cache)
    std::uint64_t version{0};

    MinorUnits available_daily_budget() const noexcept {
        return daily_limit > spent_today ? daily_limit - spent_today : 0;
    }
    MinorUnits net_worth() const noexcept { return total_earned - total_spent; }
};

struct Transaction {
    TransactionId      transaction_id;
    AgentId            agent_id;
    MinorUnits         amount{0};   // negative = debit, positive = credit
    TransactionKind    kind{TransactionKind::Spending};
    std::string        description;
    Timestamp          timestamp{};
    TransactionOutcome outcome{TransactionOutcome::Success};
    std::optional<DenialReason> denial_reason;
    std::optional<MinorUnits> balance_before;  // unset when the budget was never read
    std::optional<MinorUnits> balance_after;
    std::optional<RoiData> roi_data;
    Metadata           metadata;

    bool is_debit() const noexcept { return amount < 0; }
    bool is_credit() const noexcept { return amount > 0; }
    bool succeeded() const noexcept { return outcome == TransactionOutcome::Success; }
};

struct CircuitBreakerState {
    bool        frozen{false};
    std::string reason;
    std::string actor;
    Timestamp   timestamp{};
};

// Administrative audit record, kept parallel to transactions
struct AdminEvent {
    std::string              event_id;
    AdminEventKind           kind{AdminEventKind::Freeze};
    std::optional<AgentId>   agent_id;
    std::string              actor;
    std::string              reason;
    std::string              detail;
    Timestamp                timestamp{};
};

struct BudgetLimits {
    MinorUnits daily_limit{0};
    MinorUnits per_action_limit{0};
};

// Derived from transaction history, never stored on its own
struct PerformanceSnapshot {
    AgentId         agent_id;
    Timestamp       window_start{};
    Timestamp       window_end{};
    std::size_t     transaction_count{0};
    MinorUnits      total_spent{0};
    MinorUnits      total_value_generated{0};
    double          roi{0.0};
    PerformanceTier tier{PerformanceTier::Neutral};
};

struct RescaleResult {
    AgentId             agent_id;
    BudgetLimits        old_limits;
    BudgetLimits        new_limits;
    double              multiplier{1.0};
    PerformanceSnapshot snapshot;
    bool                applied{false};
    std::string         reason;
};

// Half-open time window [from, to)
struct TimeRange {
    Timestamp from{Timestamp::min()};
    Timestamp to{Timestamp::max()};

    bool contains(Timestamp t) const noexcept { return t >= from && t < to; }
    static TimeRange all() { return TimeRange{}; }
};

// Cooperative cancellation shared between a caller and an in-flight authorize
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }
    bool is_cancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct SpendRequest {
    AgentId     agent_id;
    MinorUnits  amount{0};
    std::string description;
    Metadata    metadata;
    std::optional<RoiData> roi_data;
    std::optional<CancellationToken> cancel_token;
};

struct AuthorizationResult {
    TransactionId transaction_id;
    AgentBudget   budget;          // snapshot after the debit
    bool          audit_degraded{false};
};

// Seed values for a newly provisioned agent
struct BudgetSeed {
    std::optional<MinorUnits> initial_balance;
    std::optional<MinorUnits> daily_limit;
    std::optional<MinorUnits> per_action_limit;
    std::int32_t utc_offset_minutes{0};
};

struct AgentTotals {
    AgentId     agent_id;
    MinorUnits  total_revenue{0};
    MinorUnits  total_expenses{0};
    MinorUnits  net_earnings{0};
    std::size_t transaction_count{0};
    std::size_t denied_count{0};
};

// System-wide economic view
struct EconomicSummary {
    std::size_t total_agents{0};
    std::size_t active_agents{0};
    std::size_t suspended_agents{0};
    MinorUnits  total_balance{0};
    MinorUnits  total_spent{0};
    MinorUnits  total_earned{0};
    double      system_roi{0.0};
    std::optional<AgentId> top_performer;
};

struct TreasuryStatus {
    bool                frozen{false};
    CircuitBreakerState breaker;
    std::size_t         agent_count{0};
    std::size_t         pending_durable_writes{0};
    // Pending writes the last stop() could not land
    std::size_t         unwritten_at_stop{0};
    bool                scheduler_running{false};
};

inline const char* to_string(BudgetStatus s) {
    switch (s) {
        case BudgetStatus::Active:         return "active";
        case BudgetStatus::Suspended:      return "suspended";
        case BudgetStatus::Decommissioned: return "decommissioned";
    }
    return "unknown";
}

inline const char* to_string(TransactionKind k) {
    switch (k) {
        case TransactionKind::Spending: return "spending";
        case TransactionKind::Earning:  return "earning";
    }
    return "unknown";
}

inline const char* to_string(TransactionOutcome o) {
    switch (o) {
        case TransactionOutcome::Success: return "success";
        case TransactionOutcome::Denied:  return "denied";
    }
    return "unknown";
}

inline const char* to_string(DenialReason r) {
    switch (r) {
        case DenialReason::EmergencyFreeze:   return "emergency_freeze";
        case DenialReason::PerActionLimit:    return "per_action";
        case DenialReason::DailyLimit:        return "daily";
        case DenialReason::InsufficientFunds: return "insufficient_funds";
        case DenialReason::AgentSuspended:    return "agent_suspended";
        case DenialReason::BudgetNotFound:    return "budget_not_found";
        case DenialReason::InvalidAmount:     return "invalid_amount";
        case DenialReason::Contention:        return "contention";
        case DenialReason::StoreUnavailable:  return "store_unavailable";
        case DenialReason::Cancelled:         return "cancelled";
    }
    return "unknown";
}

inline const char* to_string(LimitKind k) {
    switch (k) {
        case LimitKind::PerAction: return "per_action";
        case LimitKind::Daily:     return "daily";
    }
    return "unknown";
}

inline const char* to_string(PerformanceTier t) {
    switch (t) {
        case PerformanceTier::Excellent: return "excellent";
        case PerformanceTier::Good:      return "good";
        case PerformanceTier::Neutral:   return "neutral";
        case PerformanceTier::Poor:      return "poor";
        case PerformanceTier::Critical:  return "critical";
    }
    return "unknown";
}

inline const char* to_string(AdminEventKind k) {
    switch (k) {
        case AdminEventKind::Freeze:        return "freeze";
        case AdminEventKind::Unfreeze:      return "unfreeze";
        case AdminEventKind::Provision:     return "provision";
        case AdminEventKind::StatusChange:  return "status_change";
        case AdminEventKind::LimitRescale:  return "limit_rescale";
    }
    return "unknown";
}

} // namespace agenttreasury
