#include "agenttreasury/circuit_breaker.hpp"
#include "agenttreasury/codec.hpp"
#include "agenttreasury/exceptions.hpp"
#include "agenttreasury/time_util.hpp"

namespace agenttreasury {

EmergencyCircuitBreaker::EmergencyCircuitBreaker(std::shared_ptr<CacheStore> cache,
                                                 std::shared_ptr<TransactionLedger> ledger,
                                                 CircuitBreakerConfig config,
                                                 std::string key_prefix,
                                                 std::shared_ptr<Monitor> monitor,
                                                 TimeSource clock)
    : cache_(std::move(cache))
    , ledger_(std::move(ledger))
    , config_(config)
    , key_(std::move(key_prefix) + "circuit_breaker")
    , monitor_(std::move(monitor))
    , clock_(clock ? std::move(clock) : TimeSource([] { return Clock::now(); }))
{}

bool EmergencyCircuitBreaker::freeze(const std::string& reason, const std::string& actor) {
    return transition(true, reason, actor);
}

bool EmergencyCircuitBreaker::unfreeze(const std::string& reason, const std::string& actor) {
    return transition(false, reason, actor);
}

bool EmergencyCircuitBreaker::transition(bool frozen, const std::string& reason,
                                         const std::string& actor) {
    CircuitBreakerState next;
    next.frozen = frozen;
    next.reason = reason;
    next.actor = actor;
    next.timestamp = clock_();

    // Takes effect here, for every reader of the store
    cache_->set(key_, encode_breaker_state(next));
    {
        std::lock_guard<std::mutex> lock(local_mutex_);
        local_state_ = next;
        local_read_at_ = next.timestamp;
    }

    MonitorEvent event;
    event.type = frozen ? EventType::CircuitBreakerFrozen : EventType::CircuitBreakerUnfrozen;
    event.timestamp = next.timestamp;
    event.message = reason;
    event.actor = actor;
    if (monitor_) {
        monitor_->on_event(event);
    }

    AdminEvent audit;
    audit.event_id = generate_uuid();
    audit.kind = frozen ? AdminEventKind::Freeze : AdminEventKind::Unfreeze;
    audit.actor = actor;
    audit.reason = reason;
    audit.timestamp = next.timestamp;

    try {
        ledger_->record_admin_event(audit);
    } catch (const AuditWriteDegradedException&) {
        // Buffered and reported by the ledger; the toggle itself stands
        return false;
    }
    return true;
}

CircuitBreakerState EmergencyCircuitBreaker::read_store() {
    auto stored = cache_->get(key_);
    if (!stored.has_value()) {
        return CircuitBreakerState{};
    }
    return decode_breaker_state(stored->value);
}

CircuitBreakerState EmergencyCircuitBreaker::state() {
    if (config_.local_cache_ttl > Duration::zero()) {
        std::lock_guard<std::mutex> lock(local_mutex_);
        if (local_state_.has_value() &&
            clock_() - local_read_at_ < config_.local_cache_ttl) {
            return *local_state_;
        }
    }

    CircuitBreakerState current = read_store();

    std::lock_guard<std::mutex> lock(local_mutex_);
    local_state_ = current;
    local_read_at_ = clock_();
    return current;
}

bool EmergencyCircuitBreaker::is_frozen() {
    return state().frozen;
}

} // namespace agenttreasury
