#pragma once

#include "agenttreasury/cache_store.hpp"
#include "agenttreasury/config.hpp"
#include "agenttreasury/monitor.hpp"
#include "agenttreasury/transaction_ledger.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace agenttreasury {

// System-wide emergency stop. The flag lives in the shared cache store so
// every process sharing that store sees the same state.
class EmergencyCircuitBreaker {
public:
    EmergencyCircuitBreaker(std::shared_ptr<CacheStore> cache,
                            std::shared_ptr<TransactionLedger> ledger,
                            CircuitBreakerConfig config,
                            std::string key_prefix,
                            std::shared_ptr<Monitor> monitor = nullptr,
                            TimeSource clock = nullptr);

    // Both transitions are logged as admin events. Re-freezing while frozen
    // updates reason and actor and is logged again.
    // Returns false if the admin event could not be made durable yet.
    bool freeze(const std::string& reason, const std::string& actor);
    bool unfreeze(const std::string& reason, const std::string& actor);

    // Reads the store unless a local copy younger than local_cache_ttl exists.
    // Store failures propagate.
    bool is_frozen();
    CircuitBreakerState state();

    const std::string& key() const { return key_; }

private:
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<TransactionLedger> ledger_;
    CircuitBreakerConfig config_;
    std::string key_;
    std::shared_ptr<Monitor> monitor_;
    TimeSource clock_;

    std::mutex local_mutex_;
    std::optional<CircuitBreakerState> local_state_;
    Timestamp local_read_at_{};

    bool transition(bool frozen, const std::string& reason, const std::string& actor);
    CircuitBreakerState read_store();
};

} // namespace agenttreasury
