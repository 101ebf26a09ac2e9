#include <gtest/gtest.h>
#include <agenttreasury/ledger_store.hpp>
#include <agenttreasury/sqlite_ledger_store.hpp>
#include <agenttreasury/exceptions.hpp>

#include "test_support.hpp"

#include <cstdio>
#include <functional>
#include <string>

using namespace agenttreasury;
using namespace agenttreasury::testing_support;
using namespace std::chrono_literals;

namespace {

AgentBudget make_budget(const std::string& id, MinorUnits balance, std::uint64_t revision) {
    AgentBudget b;
    b.agent_id = id;
    b.current_balance = balance;
    b.daily_limit = 5000;
    b.per_action_limit = 1000;
    b.spent_today = 250;
    b.total_spent = 750;
    b.total_earned = 100;
    b.last_reset_date = BASE_DAY;
    b.utc_offset_minutes = -300;
    b.status = BudgetStatus::Suspended;
    b.roi_score = 1.25;
    b.created_at = base_time();
    b.updated_at = base_time() + 1s;
    b.revision = revision;
    return b;
}

Transaction make_txn(const std::string& id, const std::string& agent, Timestamp ts,
                     MinorUnits amount = -100) {
    Transaction t;
    t.transaction_id = id;
    t.agent_id = agent;
    t.amount = amount;
    t.kind = amount < 0 ? TransactionKind::Spending : TransactionKind::Earning;
    t.description = "txn " + id;
    t.timestamp = ts;
    t.outcome = TransactionOutcome::Success;
    t.balance_before = 1000;
    t.balance_after = 1000 + amount;
    return t;
}

AdminEvent make_event(const std::string& id, Timestamp ts) {
    AdminEvent e;
    e.event_id = id;
    e.kind = AdminEventKind::Freeze;
    e.actor = "ops";
    e.reason = "drill";
    e.timestamp = ts;
    return e;
}

} // anonymous namespace

// ===========================================================================
// Shared contract, run against every LedgerStore implementation
// ===========================================================================

using StoreFactory = std::function<std::shared_ptr<LedgerStore>()>;

class LedgerStoreContractTest : public ::testing::TestWithParam<StoreFactory> {
protected:
    void SetUp() override { store_ = GetParam()(); }

    std::shared_ptr<LedgerStore> store_;
};

TEST_P(LedgerStoreContractTest, BudgetUpsertAndGet) {
    EXPECT_FALSE(store_->get_budget("agent_a").has_value());

    store_->upsert_budget(make_budget("agent_a", 900, 1));
    auto got = store_->get_budget("agent_a");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->current_balance, 900);
    EXPECT_EQ(got->spent_today, 250);
    EXPECT_EQ(got->total_earned, 100);
    EXPECT_EQ(got->utc_offset_minutes, -300);
    EXPECT_EQ(got->status, BudgetStatus::Suspended);
    EXPECT_DOUBLE_EQ(got->roi_score, 1.25);
    EXPECT_EQ(got->updated_at, base_time() + 1s);
    EXPECT_EQ(got->revision, 1u);
}

TEST_P(LedgerStoreContractTest, OlderRevisionNeverOverwritesNewer) {
    store_->upsert_budget(make_budget("agent_a", 500, 5));
    store_->upsert_budget(make_budget("agent_a", 900, 3));
    EXPECT_EQ(store_->get_budget("agent_a")->current_balance, 500);

    store_->upsert_budget(make_budget("agent_a", 400, 6));
    EXPECT_EQ(store_->get_budget("agent_a")->current_balance, 400);
}

TEST_P(LedgerStoreContractTest, ListBudgetsSortedById) {
    store_->upsert_budget(make_budget("zeta", 1, 1));
    store_->upsert_budget(make_budget("alpha", 1, 1));
    auto all = store_->list_budgets();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].agent_id, "alpha");
    EXPECT_EQ(all[1].agent_id, "zeta");
}

TEST_P(LedgerStoreContractTest, DuplicateTransactionIgnored) {
    EXPECT_TRUE(store_->append_transaction(make_txn("t1", "agent_a", base_time())));

    auto dup = make_txn("t1", "agent_a", base_time(), -999);
    EXPECT_FALSE(store_->append_transaction(dup));

    auto txns = store_->query_transactions("agent_a", TimeRange::all());
    ASSERT_EQ(txns.size(), 1u);
    EXPECT_EQ(txns[0].amount, -100);
}

TEST_P(LedgerStoreContractTest, QueryIsNewestFirstFilteredAndLimited) {
    store_->append_transaction(make_txn("t1", "agent_a", base_time()));
    store_->append_transaction(make_txn("t2", "agent_a", base_time() + 1h));
    store_->append_transaction(make_txn("t3", "agent_a", base_time() + 2h));
    store_->append_transaction(make_txn("x1", "agent_b", base_time() + 1h));

    auto all = store_->query_transactions("agent_a", TimeRange::all());
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].transaction_id, "t3");
    EXPECT_EQ(all[2].transaction_id, "t1");

    // Half-open window
    TimeRange range{base_time(), base_time() + 2h};
    auto window = store_->query_transactions("agent_a", range);
    ASSERT_EQ(window.size(), 2u);
    EXPECT_EQ(window[0].transaction_id, "t2");

    auto limited = store_->query_transactions("agent_a", TimeRange::all(), 1);
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].transaction_id, "t3");
}

TEST_P(LedgerStoreContractTest, EqualTimestampsComeBackNewestInsertFirst) {
    store_->append_transaction(make_txn("first", "agent_a", base_time()));
    store_->append_transaction(make_txn("second", "agent_a", base_time()));
    auto txns = store_->query_transactions("agent_a", TimeRange::all());
    ASSERT_EQ(txns.size(), 2u);
    EXPECT_EQ(txns[0].transaction_id, "second");
}

TEST_P(LedgerStoreContractTest, TransactionOptionalFieldsSurvive) {
    auto t = make_txn("t1", "agent_a", base_time());
    t.outcome = TransactionOutcome::Denied;
    t.denial_reason = DenialReason::DailyLimit;
    t.balance_before.reset();
    t.balance_after.reset();
    t.roi_data = RoiData{"search", 300, 450};
    t.metadata = {{"task", "t-9"}, {"model", "small"}};
    store_->append_transaction(t);

    auto got = store_->query_transactions("agent_a", TimeRange::all()).at(0);
    EXPECT_EQ(got.outcome, TransactionOutcome::Denied);
    ASSERT_TRUE(got.denial_reason.has_value());
    EXPECT_EQ(*got.denial_reason, DenialReason::DailyLimit);
    EXPECT_FALSE(got.balance_before.has_value());
    ASSERT_TRUE(got.roi_data.has_value());
    EXPECT_EQ(got.roi_data->tool, "search");
    EXPECT_EQ(got.roi_data->realized_value, std::optional<MinorUnits>(450));
    EXPECT_EQ(got.metadata.at("task"), "t-9");
    EXPECT_EQ(got.metadata.size(), 2u);
}

TEST_P(LedgerStoreContractTest, AdminEventsAppendOnlyAndOrdered) {
    EXPECT_TRUE(store_->append_admin_event(make_event("e1", base_time())));
    auto e2 = make_event("e2", base_time() + 1min);
    e2.kind = AdminEventKind::StatusChange;
    e2.agent_id = "agent_a";
    e2.detail = "active -> suspended";
    EXPECT_TRUE(store_->append_admin_event(e2));
    EXPECT_FALSE(store_->append_admin_event(make_event("e1", base_time())));

    auto events = store_->query_admin_events(TimeRange::all());
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event_id, "e2");
    EXPECT_EQ(events[0].agent_id, std::optional<AgentId>("agent_a"));
    EXPECT_EQ(events[0].detail, "active -> suspended");
    EXPECT_FALSE(events[1].agent_id.has_value());

    EXPECT_EQ(store_->query_admin_events(TimeRange::all(), 1).size(), 1u);
}

INSTANTIATE_TEST_SUITE_P(
    Stores, LedgerStoreContractTest,
    ::testing::Values(
        StoreFactory([] { return std::make_shared<InMemoryLedgerStore>(); }),
        StoreFactory([] { return std::make_shared<SqliteLedgerStore>(":memory:"); })),
    [](const ::testing::TestParamInfo<StoreFactory>& info) {
        return info.index == 0 ? std::string("InMemory") : std::string("Sqlite");
    });

// ===========================================================================
// SQLite specifics
// ===========================================================================

TEST(SqliteLedgerStoreTest, ReportsSchemaVersion) {
    SqliteLedgerStore store(":memory:");
    EXPECT_EQ(store.schema_version(), SqliteLedgerStore::SCHEMA_VERSION);
}

TEST(SqliteLedgerStoreTest, UnopenablePathIsUnavailable) {
    EXPECT_THROW(SqliteLedgerStore("/nonexistent-dir/for/sure/ledger.db"),
                 StoreUnavailableException);
}

namespace {

void remove_database(const std::string& path) {
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::remove((path + suffix).c_str());
    }
}

} // anonymous namespace

TEST(SqliteLedgerStoreTest, RecordsPersistAcrossReopen) {
    std::string path = ::testing::TempDir() + "agenttreasury_reopen.db";
    remove_database(path);
    {
        SqliteLedgerStore store(path);
        store.upsert_budget(make_budget("agent_a", 700, 2));
        store.append_transaction(make_txn("t1", "agent_a", base_time()));
    }
    {
        SqliteLedgerStore store(path);
        EXPECT_EQ(store.get_budget("agent_a")->current_balance, 700);
        EXPECT_EQ(store.query_transactions("agent_a", TimeRange::all()).size(), 1u);
        EXPECT_EQ(store.schema_version(), SqliteLedgerStore::SCHEMA_VERSION);
    }
    remove_database(path);
}
