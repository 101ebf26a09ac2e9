#include "agenttreasury/budget_registry.hpp"
#include "agenttreasury/exceptions.hpp"
#include "agenttreasury/time_util.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace agenttreasury {

namespace {

DenialReason classify_denial(const TreasuryException& e) {
    if (auto* policy = dynamic_cast<const PolicyDenialException*>(&e)) {
        return policy->reason();
    }
    if (dynamic_cast<const ContentionExceededException*>(&e)) {
        return DenialReason::Contention;
    }
    if (dynamic_cast<const AuthorizationCancelledException*>(&e)) {
        return DenialReason::Cancelled;
    }
    if (dynamic_cast<const InvalidAmountException*>(&e)) {
        return DenialReason::InvalidAmount;
    }
    if (dynamic_cast<const BudgetNotFoundException*>(&e) ||
        dynamic_cast<const InvalidAgentIdException*>(&e)) {
        return DenialReason::BudgetNotFound;
    }
    return DenialReason::StoreUnavailable;
}

} // anonymous namespace

BudgetRegistry::BudgetRegistry(std::shared_ptr<BudgetCache> budgets,
                               std::shared_ptr<TransactionLedger> ledger,
                               std::shared_ptr<EmergencyCircuitBreaker> breaker,
                               ProvisioningDefaults defaults,
                               std::shared_ptr<Monitor> monitor,
                               TimeSource clock)
    : budgets_(std::move(budgets))
    , ledger_(std::move(ledger))
    , breaker_(std::move(breaker))
    , defaults_(defaults)
    , monitor_(std::move(monitor))
    , clock_(clock ? std::move(clock) : TimeSource([] { return Clock::now(); }))
{}

AgentId BudgetRegistry::normalize_agent_id(const std::string& raw) {
    auto first = std::find_if_not(raw.begin(), raw.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(raw.rbegin(), raw.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();

    AgentId id;
    for (auto it = first; it < last; ++it) {
        unsigned char c = static_cast<unsigned char>(*it);
        id.push_back(c == ' ' ? '_' : static_cast<char>(std::tolower(c)));
    }
    if (id.size() < 3) {
        throw InvalidAgentIdException(raw);
    }
    return id;
}

bool BudgetRegistry::apply_rollover(AgentBudget& budget, Timestamp now) const {
    LocalDate today = local_date(now, budget.utc_offset_minutes);
    // Only forward, so clock skew between processes cannot reset a day twice
    if (today <= budget.last_reset_date) {
        return false;
    }
    budget.spent_today = 0;
    budget.last_reset_date = today;
    return true;
}

// ==================== Provisioning ====================

AgentBudget BudgetRegistry::provision(const std::string& agent_id, const BudgetSeed& seed,
                                      const std::string& actor) {
    AgentId id = normalize_agent_id(agent_id);

    AgentBudget budget;
    budget.agent_id = id;
    budget.current_balance = seed.initial_balance.value_or(defaults_.initial_balance);
    budget.daily_limit = seed.daily_limit.value_or(defaults_.daily_limit);
    budget.per_action_limit = seed.per_action_limit.value_or(defaults_.per_action_limit);
    budget.utc_offset_minutes = seed.utc_offset_minutes;

    if (budget.current_balance < 0) {
        throw InvalidRequestException("Initial balance for '" + id + "' must not be negative");
    }
    if (budget.daily_limit <= 0 || budget.per_action_limit <= 0) {
        throw InvalidRequestException("Limits for '" + id + "' must be positive");
    }

    auto now = clock_();
    budget.last_reset_date = local_date(now, budget.utc_offset_minutes);
    budget.created_at = now;
    budget.updated_at = now;

    auto [stored, created] = budgets_->create(budget);
    if (!created) {
        return stored;
    }

    emit_event(EventType::BudgetProvisioned,
               "Provisioned with balance " + std::to_string(stored.current_balance) +
               ", daily limit " + std::to_string(stored.daily_limit) +
               ", per-action limit " + std::to_string(stored.per_action_limit),
               id, std::nullopt, stored.current_balance, std::nullopt, actor);
    record_admin_event(AdminEventKind::Provision, id, actor, "provisioned",
                       "balance=" + std::to_string(stored.current_balance) +
                       " daily_limit=" + std::to_string(stored.daily_limit) +
                       " per_action_limit=" + std::to_string(stored.per_action_limit));
    return stored;
}

AgentBudget BudgetRegistry::set_status(const std::string& agent_id, BudgetStatus status,
                                       const std::string& actor, const std::string& reason) {
    AgentId id = normalize_agent_id(agent_id);
    BudgetStatus previous = status;

    AgentBudget updated = budgets_->update(id, [&](AgentBudget& b) {
        previous = b.status;
        if (b.status == status) {
            return false;
        }
        if (b.status == BudgetStatus::Decommissioned) {
            throw InvalidRequestException("Agent '" + id + "' is decommissioned");
        }
        b.status = status;
        return true;
    });

    if (previous != status) {
        std::string detail = std::string(to_string(previous)) + " -> " + to_string(status);
        emit_event(EventType::BudgetStatusChanged, detail + ": " + reason,
                   id, std::nullopt, std::nullopt, std::nullopt, actor);
        record_admin_event(AdminEventKind::StatusChange, id, actor, reason, detail);
    }
    return updated;
}

std::optional<AgentBudget> BudgetRegistry::get_budget(const std::string& agent_id) {
    auto budget = budgets_->load(normalize_agent_id(agent_id));
    if (budget.has_value()) {
        apply_rollover(*budget, clock_());
    }
    return budget;
}

std::vector<AgentId> BudgetRegistry::list_agent_ids() {
    return budgets_->list_agent_ids();
}

// ==================== Spending ====================

AuthorizationResult BudgetRegistry::authorize(const SpendRequest& request) {
    Transaction txn;
    txn.transaction_id = generate_uuid();
    txn.agent_id = request.agent_id;
    // Debits are stored negative; an invalid amount is kept as given
    txn.amount = request.amount > 0 ? -request.amount : request.amount;
    txn.kind = TransactionKind::Spending;
    txn.description = request.description;
    txn.roi_data = request.roi_data;
    txn.metadata = request.metadata;

    const CancellationToken* cancel =
        request.cancel_token.has_value() ? &request.cancel_token.value() : nullptr;

    std::optional<MinorUnits> balance_before;
    AgentBudget committed;

    try {
        // Cheapest check, and the first
        CircuitBreakerState breaker = breaker_->state();
        if (breaker.frozen) {
            throw EmergencyFreezeException(breaker.reason);
        }

        txn.agent_id = normalize_agent_id(request.agent_id);
        if (request.amount <= 0) {
            throw InvalidAmountException(request.amount);
        }

        const MinorUnits amount = request.amount;
        committed = budgets_->update(txn.agent_id, [&](AgentBudget& b) {
            balance_before = b.current_balance;

            if (b.status != BudgetStatus::Active) {
                throw AgentSuspendedException(b.agent_id, b.status);
            }
            if (amount > b.per_action_limit) {
                throw UsageLimitExceededException(b.agent_id, LimitKind::PerAction,
                                                  amount, b.per_action_limit);
            }

            apply_rollover(b, clock_());

            if (b.spent_today + amount > b.daily_limit) {
                throw UsageLimitExceededException(b.agent_id, LimitKind::Daily,
                                                  b.spent_today + amount, b.daily_limit);
            }
            if (b.current_balance < amount) {
                throw InsufficientFundsException(b.agent_id, amount, b.current_balance);
            }

            b.current_balance -= amount;
            b.spent_today += amount;
            b.total_spent += amount;
            return true;
        }, cancel);
    } catch (TreasuryException& e) {
        DenialReason reason = classify_denial(e);

        txn.timestamp = clock_();
        txn.outcome = TransactionOutcome::Denied;
        txn.denial_reason = reason;
        txn.balance_before = balance_before;
        txn.balance_after = balance_before;

        try {
            ledger_->record(txn);
        } catch (const AuditWriteDegradedException&) {
            // Buffered for retry and reported by the ledger
        }

        e.set_transaction_id(txn.transaction_id);
        emit_event(EventType::SpendDenied, e.what(), txn.agent_id, txn.transaction_id,
                   request.amount, reason);
        throw;
    }

    // Committed: from here on the debit stands, whatever happens to the caller
    txn.timestamp = clock_();
    txn.outcome = TransactionOutcome::Success;
    txn.balance_before = balance_before;
    txn.balance_after = committed.current_balance;

    AuthorizationResult result;
    result.transaction_id = txn.transaction_id;
    result.budget = committed;

    try {
        ledger_->record(txn);
    } catch (const AuditWriteDegradedException&) {
        result.audit_degraded = true;
    }

    emit_event(EventType::SpendAuthorized,
               request.description + " (balance " + std::to_string(committed.current_balance) +
               ", spent today " + std::to_string(committed.spent_today) + ")",
               txn.agent_id, txn.transaction_id, request.amount);
    return result;
}

std::future<AuthorizationResult> BudgetRegistry::authorize_async(SpendRequest request) {
    auto self = shared_from_this();
    return std::async(std::launch::async, [self, request = std::move(request)] {
        return self->authorize(request);
    });
}

AuthorizationResult BudgetRegistry::credit(const std::string& agent_id, MinorUnits amount,
                                           const std::string& description,
                                           std::optional<RoiData> roi_data,
                                           Metadata metadata) {
    AgentId id = normalize_agent_id(agent_id);
    if (amount <= 0) {
        throw InvalidAmountException(amount);
    }

    MinorUnits balance_before = 0;
    AgentBudget committed = budgets_->update(id, [&](AgentBudget& b) {
        if (b.status == BudgetStatus::Decommissioned) {
            throw AgentSuspendedException(b.agent_id, b.status);
        }
        if (amount > std::numeric_limits<MinorUnits>::max() - b.current_balance ||
            amount > std::numeric_limits<MinorUnits>::max() - b.total_earned) {
            throw InvalidAmountException(amount, "would overflow the balance of " + b.agent_id);
        }
        balance_before = b.current_balance;
        b.current_balance += amount;
        b.total_earned += amount;
        return true;
    });

    Transaction txn;
    txn.transaction_id = generate_uuid();
    txn.agent_id = id;
    txn.amount = amount;
    txn.kind = TransactionKind::Earning;
    txn.description = description;
    txn.timestamp = clock_();
    txn.outcome = TransactionOutcome::Success;
    txn.balance_before = balance_before;
    txn.balance_after = committed.current_balance;
    txn.roi_data = std::move(roi_data);
    txn.metadata = std::move(metadata);

    AuthorizationResult result;
    result.transaction_id = txn.transaction_id;
    result.budget = committed;

    try {
        ledger_->record(txn);
    } catch (const AuditWriteDegradedException&) {
        result.audit_degraded = true;
    }

    emit_event(EventType::FundsCredited, description, id, txn.transaction_id, amount);
    return result;
}

// ==================== Daily rollover ====================

bool BudgetRegistry::rollover_if_due(const std::string& agent_id) {
    AgentId id = normalize_agent_id(agent_id);
    MinorUnits cleared = 0;
    bool rolled = false;

    budgets_->update(id, [&](AgentBudget& b) {
        cleared = b.spent_today;
        rolled = apply_rollover(b, clock_());
        return rolled;
    });

    if (rolled) {
        emit_event(EventType::DailyRollover,
                   "Daily counter reset (spent " + std::to_string(cleared) + " yesterday)",
                   id, std::nullopt, cleared);
    }
    return rolled;
}

// ==================== Helpers ====================

void BudgetRegistry::record_admin_event(AdminEventKind kind, const AgentId& agent_id,
                                        const std::string& actor, const std::string& reason,
                                        const std::string& detail) {
    AdminEvent event;
    event.event_id = generate_uuid();
    event.kind = kind;
    event.agent_id = agent_id;
    event.actor = actor;
    event.reason = reason;
    event.detail = detail;
    event.timestamp = clock_();

    try {
        ledger_->record_admin_event(event);
    } catch (const AuditWriteDegradedException&) {
        // Buffered for retry and reported by the ledger
    }
}

void BudgetRegistry::emit_event(EventType type, const std::string& message,
                                const std::optional<AgentId>& agent_id,
                                const std::optional<TransactionId>& txn_id,
                                std::optional<MinorUnits> amount,
                                std::optional<DenialReason> reason,
                                std::optional<std::string> actor) {
    MonitorEvent event;
    event.type = type;
    event.timestamp = clock_();
    event.message = message;
    event.agent_id = agent_id;
    event.transaction_id = txn_id;
    event.amount = amount;
    event.denial_reason = reason;
    event.actor = std::move(actor);

    if (monitor_) {
        monitor_->on_event(event);
    }
}

} // namespace agenttreasury
