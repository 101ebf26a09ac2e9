#pragma once

#include <agenttreasury/agenttreasury.hpp>

#include <atomic>
#include <mutex>
#include <vector>

namespace agenttreasury {
namespace testing_support {

// 2026-03-10 12:00:00 UTC (day 20522 since the epoch)
inline Timestamp base_time() { return from_unix_millis(1773144000000LL); }
constexpr LocalDate BASE_DAY = 20522;

// ===========================================================================
// Manually advanced wall clock
// ===========================================================================

class FakeClock {
public:
    FakeClock() : state_(std::make_shared<State>()) { state_->now = base_time(); }

    Timestamp now() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->now;
    }

    void advance(Duration d) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->now += d;
    }

    void set(Timestamp t) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->now = t;
    }

    TimeSource source() const {
        auto state = state_;
        return [state] {
            std::lock_guard<std::mutex> lock(state->mutex);
            return state->now;
        };
    }

private:
    struct State {
        std::mutex mutex;
        Timestamp now;
    };
    std::shared_ptr<State> state_;
};

// ===========================================================================
// Test Monitor that records all events for verification
// ===========================================================================

class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<MonitorEvent> get_events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<MonitorEvent> get_events_of_type(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MonitorEvent> filtered;
        for (const auto& e : events_) {
            if (e.type == type) {
                filtered.push_back(e);
            }
        }
        return filtered;
    }

    std::size_t count(EventType type) { return get_events_of_type(type).size(); }

private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events_;
};

// ===========================================================================
// Ledger store whose operations can be made to fail on demand
// ===========================================================================

class FlakyLedgerStore : public InMemoryLedgerStore {
public:
    std::atomic<bool> fail_appends{false};
    std::atomic<bool> fail_upserts{false};
    std::atomic<bool> fail_queries{false};
    std::atomic<int> failed_calls{0};

    void upsert_budget(const AgentBudget& budget) override {
        maybe_fail(fail_upserts);
        InMemoryLedgerStore::upsert_budget(budget);
    }

    std::optional<AgentBudget> get_budget(const AgentId& agent_id) override {
        maybe_fail(fail_queries);
        return InMemoryLedgerStore::get_budget(agent_id);
    }

    std::vector<AgentBudget> list_budgets() override {
        maybe_fail(fail_queries);
        return InMemoryLedgerStore::list_budgets();
    }

    bool append_transaction(const Transaction& txn) override {
        maybe_fail(fail_appends);
        return InMemoryLedgerStore::append_transaction(txn);
    }

    std::vector<Transaction> query_transactions(const AgentId& agent_id,
                                                const TimeRange& range,
                                                std::size_t limit = 0) override {
        maybe_fail(fail_queries);
        return InMemoryLedgerStore::query_transactions(agent_id, range, limit);
    }

    bool append_admin_event(const AdminEvent& event) override {
        maybe_fail(fail_appends);
        return InMemoryLedgerStore::append_admin_event(event);
    }

private:
    void maybe_fail(const std::atomic<bool>& flag) {
        if (flag.load()) {
            failed_calls.fetch_add(1);
            throw StoreUnavailableException("flaky-ledger", "injected failure");
        }
    }
};

// ===========================================================================
// Cache store that can lose CAS races or go down on demand
// ===========================================================================

class FlakyCacheStore : public InMemoryCacheStore {
public:
    explicit FlakyCacheStore(TimeSource clock = nullptr)
        : InMemoryCacheStore(std::move(clock)) {}

    // Number of upcoming CAS writes that report a lost race
    std::atomic<int> conflicts_to_inject{0};
    std::atomic<bool> unavailable{false};
    std::atomic<bool> fail_list_push{false};
    std::atomic<int> cas_calls{0};

    std::optional<VersionedValue> get(const std::string& key) override {
        check();
        return InMemoryCacheStore::get(key);
    }

    std::uint64_t set(const std::string& key, std::string value,
                      std::optional<Duration> ttl = std::nullopt) override {
        check();
        return InMemoryCacheStore::set(key, std::move(value), ttl);
    }

    std::optional<std::uint64_t> compare_and_swap(
        const std::string& key, std::uint64_t expected_version, std::string value,
        std::optional<Duration> ttl = std::nullopt) override {
        check();
        cas_calls.fetch_add(1);
        int remaining = conflicts_to_inject.load();
        while (remaining > 0) {
            if (conflicts_to_inject.compare_exchange_weak(remaining, remaining - 1)) {
                return std::nullopt;
            }
        }
        return InMemoryCacheStore::compare_and_swap(key, expected_version, std::move(value), ttl);
    }

    void list_push_front(const std::string& key, std::string value, std::size_t max_length,
                         std::optional<Duration> ttl = std::nullopt) override {
        check();
        if (fail_list_push.load()) {
            throw StoreUnavailableException("flaky-cache", "list push refused");
        }
        InMemoryCacheStore::list_push_front(key, std::move(value), max_length, ttl);
    }

private:
    void check() {
        if (unavailable.load()) {
            throw StoreUnavailableException("flaky-cache", "injected outage");
        }
    }
};

// Small, fast retry settings for tests
inline Config fast_config() {
    Config config;
    config.cas_retry = RetryConfig{16, std::chrono::milliseconds(0),
                                   std::chrono::milliseconds(2), 20};
    config.audit.durable_retry = RetryConfig{2, std::chrono::milliseconds(0),
                                             std::chrono::milliseconds(1), 0};
    config.audit.flush_interval = std::chrono::milliseconds(10);
    config.audit.flush_max_backoff = std::chrono::milliseconds(20);
    return config;
}

} // namespace testing_support
} // namespace agenttreasury
