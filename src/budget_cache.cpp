#include "agenttreasury/budget_cache.hpp"
#include "agenttreasury/codec.hpp"
#include "agenttreasury/exceptions.hpp"
#include "agenttreasury/retry.hpp"

#include <algorithm>
#include <set>
#include <thread>

namespace agenttreasury {

BudgetCache::BudgetCache(std::shared_ptr<CacheStore> cache,
                         std::shared_ptr<LedgerStore> ledger,
                         std::shared_ptr<WriteBehindQueue> mirror_queue,
                         RetryConfig cas_retry,
                         std::string key_prefix,
                         std::shared_ptr<Monitor> monitor,
                         TimeSource clock)
    : cache_(std::move(cache))
    , ledger_(std::move(ledger))
    , mirror_queue_(std::move(mirror_queue))
    , cas_retry_(cas_retry)
    , budget_prefix_(std::move(key_prefix) + "budget:")
    , monitor_(std::move(monitor))
    , clock_(clock ? std::move(clock) : TimeSource([] { return Clock::now(); }))
{}

std::string BudgetCache::key_for(const AgentId& agent_id) const {
    return budget_prefix_ + agent_id;
}

std::optional<AgentBudget> BudgetCache::read_cached(const AgentId& agent_id) {
    auto stored = cache_->get(key_for(agent_id));
    if (!stored.has_value()) {
        return std::nullopt;
    }
    AgentBudget budget = decode_budget(stored->value);
    budget.version = stored->version;
    return budget;
}

std::optional<AgentBudget> BudgetCache::load(const AgentId& agent_id) {
    if (auto cached = read_cached(agent_id)) {
        return cached;
    }

    // Cache miss: the durable mirror is the fallback source
    auto durable = ledger_->get_budget(agent_id);
    if (!durable.has_value()) {
        return std::nullopt;
    }

    auto version = cache_->compare_and_swap(key_for(agent_id), 0, encode_budget(*durable));
    if (version.has_value()) {
        durable->version = *version;
        return durable;
    }
    // Someone else rehydrated (or created) it first
    return read_cached(agent_id);
}

std::pair<AgentBudget, bool> BudgetCache::create(AgentBudget initial) {
    if (auto existing = load(initial.agent_id)) {
        return {*existing, false};
    }

    initial.revision = 1;
    auto version = cache_->compare_and_swap(key_for(initial.agent_id), 0,
                                            encode_budget(initial));
    if (!version.has_value()) {
        auto existing = read_cached(initial.agent_id);
        if (!existing.has_value()) {
            throw ContentionExceededException(key_for(initial.agent_id), 1);
        }
        return {*existing, false};
    }

    initial.version = *version;
    mirror(initial);
    return {initial, true};
}

AgentBudget BudgetCache::update(const AgentId& agent_id, const Mutator& mutator,
                                const CancellationToken* cancel) {
    const std::string key = key_for(agent_id);

    for (int attempt = 0; attempt < cas_retry_.max_attempts; ++attempt) {
        if (cancel != nullptr && cancel->is_cancelled()) {
            throw AuthorizationCancelledException(agent_id);
        }

        auto current = load(agent_id);
        if (!current.has_value()) {
            throw BudgetNotFoundException(agent_id);
        }

        AgentBudget next = *current;
        if (!mutator(next)) {
            return *current;
        }
        next.agent_id = current->agent_id;
        next.revision = current->revision + 1;
        next.updated_at = clock_();

        // Last point at which the caller can still back out
        if (cancel != nullptr && cancel->is_cancelled()) {
            throw AuthorizationCancelledException(agent_id);
        }

        auto version = cache_->compare_and_swap(key, current->version, encode_budget(next));
        if (version.has_value()) {
            next.version = *version;
            mirror(next);
            return next;
        }

        emit_event(EventType::CasConflict, "Concurrent update on " + key + ", retrying",
                   agent_id, attempt + 1);

        if (attempt + 1 < cas_retry_.max_attempts) {
            std::this_thread::sleep_for(backoff_delay(cas_retry_, attempt));
        }
    }

    emit_event(EventType::ContentionExceeded,
               "Gave up on " + key + " after " + std::to_string(cas_retry_.max_attempts) +
               " attempts", agent_id, cas_retry_.max_attempts);
    throw ContentionExceededException(key, cas_retry_.max_attempts);
}

std::vector<AgentId> BudgetCache::list_agent_ids() {
    std::set<AgentId> ids;
    for (const auto& key : cache_->keys_with_prefix(budget_prefix_)) {
        ids.insert(key.substr(budget_prefix_.size()));
    }
    for (const auto& budget : ledger_->list_budgets()) {
        ids.insert(budget.agent_id);
    }
    return std::vector<AgentId>(ids.begin(), ids.end());
}

void BudgetCache::mirror(const AgentBudget& budget) {
    auto ledger = ledger_;
    mirror_queue_->submit("budget:" + budget.agent_id,
                          "budget mirror for " + budget.agent_id,
                          [ledger, budget] { ledger->upsert_budget(budget); });
}

void BudgetCache::emit_event(EventType type, const std::string& message,
                             const AgentId& agent_id, int attempts) {
    MonitorEvent event;
    event.type = type;
    event.timestamp = clock_();
    event.message = message;
    event.agent_id = agent_id;
    event.attempts = attempts;

    if (monitor_) {
        monitor_->on_event(event);
    }
}

} // namespace agenttreasury
