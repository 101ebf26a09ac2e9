#include <gtest/gtest.h>
#include <agenttreasury/agenttreasury.hpp>
#include <agenttreasury/sqlite_ledger_store.hpp>

#include "test_support.hpp"

#include <cstdio>
#include <set>
#include <thread>

using namespace agenttreasury;
using namespace agenttreasury::testing_support;
using namespace std::chrono_literals;

namespace {

BudgetSeed seed(MinorUnits balance, MinorUnits daily, MinorUnits per_action) {
    BudgetSeed s;
    s.initial_balance = balance;
    s.daily_limit = daily;
    s.per_action_limit = per_action;
    return s;
}

void remove_database(const std::string& path) {
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::remove((path + suffix).c_str());
    }
}

// Polls until the write-behind queue is empty or the deadline passes
bool wait_for_drain(Treasury& treasury, std::chrono::milliseconds deadline = 2000ms) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        if (treasury.status().pending_durable_writes == 0) return true;
        std::this_thread::sleep_for(5ms);
    }
    return treasury.status().pending_durable_writes == 0;
}

} // anonymous namespace

// ===========================================================================
// Every authorize call leaves exactly one record
// ===========================================================================

TEST(AuditTrailTest, OneRecordPerCallWhateverTheOutcome) {
    FakeClock clock;
    Treasury treasury(fast_config(), nullptr, nullptr, clock.source());
    treasury.provision_agent("agent_a", seed(1000, 800, 300));

    std::set<TransactionId> ids;
    int calls = 0;
    auto attempt = [&](const std::string& id, MinorUnits amount) {
        ++calls;
        clock.advance(1s);
        try {
            ids.insert(treasury.authorize(id, amount, "call").transaction_id);
        } catch (const TreasuryException& e) {
            ids.insert(e.transaction_id());
        }
    };

    attempt("agent_a", 300);   // ok
    attempt("agent_a", 400);   // per-action
    attempt("agent_a", 300);   // ok
    attempt("agent_a", 300);   // daily
    attempt("agent_a", 0);     // invalid amount
    attempt("Agent_A", 100);   // ok, same agent after normalization

    treasury.freeze("incident", "oncall");
    attempt("agent_a", 50);    // frozen
    treasury.unfreeze("resolved", "oncall");

    auto txns = treasury.get_transactions("agent_a");
    EXPECT_EQ(static_cast<int>(txns.size()), calls);
    EXPECT_EQ(static_cast<int>(ids.size()), calls);
    for (const auto& txn : txns) {
        EXPECT_EQ(ids.count(txn.transaction_id), 1u);
    }

    // Newest first
    ASSERT_FALSE(txns.empty());
    EXPECT_EQ(txns[0].denial_reason, std::optional<DenialReason>(DenialReason::EmergencyFreeze));
    EXPECT_EQ(txns.back().amount, -300);

    auto totals = treasury.agent_totals("agent_a");
    EXPECT_EQ(totals.total_expenses, 700);
    EXPECT_EQ(totals.denied_count, 4u);

    auto admin = treasury.get_admin_events();
    ASSERT_GE(admin.size(), 3u);
    EXPECT_EQ(admin[0].kind, AdminEventKind::Unfreeze);
    EXPECT_EQ(admin[1].kind, AdminEventKind::Freeze);
}

TEST(AuditTrailTest, RecentActivityComesFromTheCacheIndex) {
    Config config = fast_config();
    config.audit.recent_index_size = 5;
    FakeClock clock;
    Treasury treasury(config, nullptr, nullptr, clock.source());
    treasury.provision_agent("agent_a", seed(100000, 100000, 1000));

    for (int i = 0; i < 8; ++i) {
        clock.advance(1s);
        treasury.authorize("agent_a", 10 + i, "step " + std::to_string(i));
    }

    auto recent = treasury.recent_activity("agent_a", 50);
    ASSERT_EQ(recent.size(), 5u);
    EXPECT_EQ(recent[0].description, "step 7");
    EXPECT_EQ(recent[4].description, "step 3");
    EXPECT_EQ(treasury.get_transactions("agent_a").size(), 8u);
}

// ===========================================================================
// Durable store outage: spends proceed, records land on recovery
// ===========================================================================

TEST(AuditTrailTest, OutageIsBufferedAndRecovered) {
    auto store = std::make_shared<FlakyLedgerStore>();
    auto monitor = std::make_shared<TestMonitor>();
    Treasury treasury(fast_config(), nullptr, store);
    treasury.add_monitor(monitor);
    treasury.provision_agent("agent_a", seed(10000, 10000, 1000));
    treasury.start();

    store->fail_appends = true;
    constexpr int SPENDS = 20;
    for (int i = 0; i < SPENDS; ++i) {
        auto result = treasury.authorize("agent_a", 100, "during outage");
        EXPECT_TRUE(result.audit_degraded);
    }
    EXPECT_EQ(treasury.get_budget("agent_a").current_balance, 8000);
    EXPECT_GE(treasury.status().pending_durable_writes, static_cast<std::size_t>(SPENDS));
    EXPECT_GE(monitor->count(EventType::AuditWriteDegraded), static_cast<std::size_t>(SPENDS));

    store->fail_appends = false;
    EXPECT_TRUE(wait_for_drain(treasury));
    treasury.stop();

    EXPECT_EQ(treasury.get_transactions("agent_a").size(), static_cast<std::size_t>(SPENDS));
    EXPECT_GE(monitor->count(EventType::AuditWriteRecovered), 1u);
    EXPECT_EQ(store->get_budget("agent_a")->current_balance, 8000);
}

TEST(AuditTrailTest, ManualFlushWithoutWorker) {
    auto store = std::make_shared<FlakyLedgerStore>();
    Treasury treasury(fast_config(), nullptr, store);
    treasury.provision_agent("agent_a", seed(10000, 10000, 1000));

    store->fail_appends = true;
    treasury.authorize("agent_a", 100, "one");
    treasury.authorize("agent_a", 100, "two");
    EXPECT_TRUE(treasury.get_transactions("agent_a").empty());

    // Still down: nothing lands, nothing is lost
    EXPECT_EQ(treasury.flush(), 0u);
    EXPECT_EQ(treasury.status().pending_durable_writes, 2u);

    store->fail_appends = false;
    EXPECT_EQ(treasury.flush(), 2u);
    EXPECT_EQ(treasury.status().pending_durable_writes, 0u);
    EXPECT_EQ(treasury.get_transactions("agent_a").size(), 2u);
}

TEST(AuditTrailTest, StopMakesOneLastAttempt) {
    auto store = std::make_shared<FlakyLedgerStore>();
    Treasury treasury(fast_config(), nullptr, store);
    treasury.provision_agent("agent_a", seed(10000, 10000, 1000));
    treasury.start();

    store->fail_appends = true;
    treasury.authorize("agent_a", 100, "buffered");
    store->fail_appends = false;
    treasury.stop();

    EXPECT_EQ(treasury.status().pending_durable_writes, 0u);
    EXPECT_EQ(treasury.get_transactions("agent_a").size(), 1u);
}

TEST(AuditTrailTest, RecordsLeftUnwrittenAtStopAreReported) {
    auto store = std::make_shared<FlakyLedgerStore>();
    auto monitor = std::make_shared<TestMonitor>();
    Treasury treasury(fast_config(), nullptr, store);
    treasury.add_monitor(monitor);
    treasury.provision_agent("agent_a", seed(10000, 10000, 1000));
    treasury.start();

    store->fail_appends = true;
    auto result = treasury.authorize("agent_a", 100, "never lands");
    EXPECT_TRUE(result.audit_degraded);
    treasury.stop();

    auto status = treasury.status();
    EXPECT_EQ(status.unwritten_at_stop, 1u);
    EXPECT_EQ(status.pending_durable_writes, 1u);
    auto abandoned = monitor->get_events_of_type(EventType::AuditRecordsAbandoned);
    ASSERT_EQ(abandoned.size(), 1u);
    EXPECT_NE(abandoned[0].message.find(result.transaction_id), std::string::npos);
}

// ===========================================================================
// Cache loss: budgets rehydrate from the durable mirror
// ===========================================================================

TEST(AuditTrailTest, BudgetsSurviveCacheLoss) {
    auto store = std::make_shared<InMemoryLedgerStore>();
    {
        Treasury first(fast_config(), std::make_shared<InMemoryCacheStore>(), store);
        first.provision_agent("agent_a", seed(5000, 5000, 1000));
        first.authorize("agent_a", 700, "before crash");
        first.credit("agent_a", 200, "revenue");
    }

    Treasury second(fast_config(), std::make_shared<InMemoryCacheStore>(), store);
    auto budget = second.get_budget("agent_a");
    EXPECT_EQ(budget.current_balance, 4500);
    EXPECT_EQ(budget.spent_today, 700);
    EXPECT_EQ(budget.total_earned, 200);

    second.authorize("agent_a", 500, "after restart");
    EXPECT_EQ(second.get_budget("agent_a").current_balance, 4000);
    EXPECT_EQ(store->get_budget("agent_a")->current_balance, 4000);
    EXPECT_EQ(second.list_agents(), std::vector<AgentId>{"agent_a"});
}

// ===========================================================================
// End to end on SQLite
// ===========================================================================

TEST(AuditTrailTest, SqliteEndToEnd) {
    std::string path = ::testing::TempDir() + "agenttreasury_e2e.db";
    remove_database(path);

    FakeClock clock;
    {
        auto store = std::make_shared<SqliteLedgerStore>(path);
        Treasury treasury(fast_config(), nullptr, store, clock.source());
        treasury.provision_agent("agent_a", seed(10000, 5000, 2000));
        clock.advance(1s);
        treasury.authorize("agent_a", 1500, "search", {{"tool", "web"}});
        clock.advance(1s);
        EXPECT_THROW(treasury.authorize("agent_a", 2500, "too big"),
                     UsageLimitExceededException);
        clock.advance(1s);
        treasury.credit("agent_a", 300, "client paid");
        treasury.freeze("drill", "oncall");
        treasury.unfreeze("drill over", "oncall");
    }

    auto reopened = std::make_shared<SqliteLedgerStore>(path);
    Treasury treasury(fast_config(), nullptr, reopened, clock.source());

    auto budget = treasury.get_budget("agent_a");
    EXPECT_EQ(budget.current_balance, 8800);
    EXPECT_EQ(budget.total_spent, 1500);

    auto txns = treasury.get_transactions("agent_a");
    ASSERT_EQ(txns.size(), 3u);
    EXPECT_EQ(txns[0].kind, TransactionKind::Earning);
    EXPECT_EQ(txns[1].denial_reason, std::optional<DenialReason>(DenialReason::PerActionLimit));
    EXPECT_EQ(txns[2].metadata.at("tool"), "web");
    EXPECT_EQ(txns[2].balance_after, std::optional<MinorUnits>(8500));

    auto admin = treasury.get_admin_events();
    // provisioning + freeze + unfreeze
    EXPECT_EQ(admin.size(), 3u);

    remove_database(path);
}
