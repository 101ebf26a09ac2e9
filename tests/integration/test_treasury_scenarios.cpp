#include <gtest/gtest.h>
#include <agenttreasury/agenttreasury.hpp>

#include "test_support.hpp"

using namespace agenttreasury;
using namespace agenttreasury::testing_support;
using namespace std::chrono_literals;

// ===========================================================================
// Fixture: one treasury on a manual clock
// ===========================================================================

class TreasuryScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        monitor_ = std::make_shared<TestMonitor>();
        treasury_ = std::make_unique<Treasury>(fast_config(), nullptr, nullptr, clock_.source());
        treasury_->add_monitor(monitor_);
    }

    AgentBudget provision(const std::string& id, MinorUnits balance, MinorUnits daily,
                          MinorUnits per_action, std::int32_t utc_offset_minutes = 0) {
        BudgetSeed seed;
        seed.initial_balance = balance;
        seed.daily_limit = daily;
        seed.per_action_limit = per_action;
        seed.utc_offset_minutes = utc_offset_minutes;
        return treasury_->provision_agent(id, seed, "admin");
    }

    AuthorizationResult spend_with_value(const std::string& id, MinorUnits amount,
                                         MinorUnits realized) {
        SpendRequest request;
        request.agent_id = id;
        request.amount = amount;
        request.description = "tool call";
        request.roi_data = RoiData{"search", amount, realized};
        clock_.advance(1s);
        return treasury_->authorize(request);
    }

    FakeClock clock_;
    std::shared_ptr<TestMonitor> monitor_;
    std::unique_ptr<Treasury> treasury_;
};

// ===========================================================================
// Worked example: limits applied in order over one day
// ===========================================================================

TEST_F(TreasuryScenarioTest, WorkedExampleOverOneDay) {
    provision("research_agent", 10000, 5000, 2000);

    auto first = treasury_->authorize("research_agent", 1500, "web search");
    EXPECT_EQ(first.budget.current_balance, 8500);
    EXPECT_EQ(first.budget.spent_today, 1500);
    EXPECT_FALSE(first.audit_degraded);

    try {
        treasury_->authorize("research_agent", 2500, "large model call");
        FAIL() << "per-action limit should deny";
    } catch (const UsageLimitExceededException& e) {
        EXPECT_EQ(e.reason(), DenialReason::PerActionLimit);
        EXPECT_FALSE(e.transaction_id().empty());
    }

    EXPECT_NO_THROW(treasury_->authorize("research_agent", 1500, "summarize"));
    EXPECT_NO_THROW(treasury_->authorize("research_agent", 1500, "summarize"));

    try {
        treasury_->authorize("research_agent", 1500, "one more");
        FAIL() << "daily limit should deny";
    } catch (const UsageLimitExceededException& e) {
        EXPECT_EQ(e.reason(), DenialReason::DailyLimit);
    }

    auto budget = treasury_->get_budget("research_agent");
    EXPECT_EQ(budget.current_balance, 5500);
    EXPECT_EQ(budget.spent_today, 4500);
    EXPECT_EQ(budget.available_daily_budget(), 500);

    auto totals = treasury_->agent_totals("research_agent");
    EXPECT_EQ(totals.transaction_count, 5u);
    EXPECT_EQ(totals.denied_count, 2u);
    EXPECT_EQ(totals.total_expenses, 4500);

    EXPECT_EQ(monitor_->count(EventType::SpendAuthorized), 3u);
    EXPECT_EQ(monitor_->count(EventType::SpendDenied), 2u);
}

TEST_F(TreasuryScenarioTest, DailyAllowanceReturnsNextDay) {
    provision("research_agent", 10000, 5000, 2000);
    treasury_->authorize("research_agent", 2000, "a");
    treasury_->authorize("research_agent", 2000, "b");
    EXPECT_THROW(treasury_->authorize("research_agent", 1500, "c"),
                 UsageLimitExceededException);

    // 12:00 -> 00:00 the next day
    clock_.advance(12h);
    auto result = treasury_->authorize("research_agent", 1500, "c again");
    EXPECT_EQ(result.budget.spent_today, 1500);
    EXPECT_EQ(result.budget.last_reset_date, BASE_DAY + 1);
    EXPECT_EQ(result.budget.current_balance, 4500);
    EXPECT_EQ(monitor_->count(EventType::DailyRollover), 0u);  // lazy, inside authorize
}

TEST_F(TreasuryScenarioTest, ScheduledResetReportsEveryAgent) {
    provision("agent_utc", 10000, 5000, 2000);
    provision("agent_tokyo", 10000, 5000, 2000, 9 * 60);
    treasury_->authorize("agent_utc", 1000, "a");
    treasury_->authorize("agent_tokyo", 1000, "b");

    // 21:00 Tokyo: neither has crossed midnight yet
    EXPECT_EQ(treasury_->run_daily_reset().rolled_over, 0u);

    clock_.advance(3h);   // 00:00 Tokyo, 15:00 UTC
    auto report = treasury_->run_daily_reset();
    EXPECT_EQ(report.checked, 2u);
    EXPECT_EQ(report.rolled_over, 1u);
    EXPECT_EQ(treasury_->get_budget("agent_tokyo").spent_today, 0);
    EXPECT_EQ(treasury_->get_budget("agent_utc").spent_today, 1000);
    EXPECT_EQ(monitor_->count(EventType::DailyRollover), 1u);
}

// ===========================================================================
// Agent lifecycle
// ===========================================================================

TEST_F(TreasuryScenarioTest, SuspendResumeDecommission) {
    provision("worker_agent", 10000, 5000, 2000);

    treasury_->set_agent_status("worker_agent", BudgetStatus::Suspended, "admin", "review");
    EXPECT_THROW(treasury_->authorize("worker_agent", 100, "blocked"), AgentSuspendedException);
    // Revenue still lands while suspended
    EXPECT_NO_THROW(treasury_->credit("worker_agent", 100, "late payment"));

    treasury_->set_agent_status("worker_agent", BudgetStatus::Active, "admin", "cleared");
    EXPECT_NO_THROW(treasury_->authorize("worker_agent", 100, "resumed"));

    treasury_->set_agent_status("worker_agent", BudgetStatus::Decommissioned, "admin", "retired");
    EXPECT_THROW(treasury_->credit("worker_agent", 100, "too late"), AgentSuspendedException);
    EXPECT_THROW(treasury_->set_agent_status("worker_agent", BudgetStatus::Active, "admin", "undo"),
                 InvalidRequestException);

    std::size_t status_changes = 0;
    for (const auto& event : treasury_->get_admin_events()) {
        if (event.kind == AdminEventKind::StatusChange) ++status_changes;
    }
    EXPECT_EQ(status_changes, 3u);
}

TEST_F(TreasuryScenarioTest, ProvisioningIsIdempotentAndUsesDefaults) {
    auto created = treasury_->provision_agent("Default Agent");
    EXPECT_EQ(created.agent_id, "default_agent");
    EXPECT_EQ(created.current_balance, treasury_->config().defaults.initial_balance);
    EXPECT_EQ(created.daily_limit, treasury_->config().defaults.daily_limit);
    EXPECT_EQ(created.last_reset_date, BASE_DAY);

    auto again = provision("default_agent", 999999, 1, 1);
    EXPECT_EQ(again.current_balance, created.current_balance);
    EXPECT_EQ(treasury_->list_agents().size(), 1u);
    EXPECT_THROW(treasury_->get_budget("nobody_here"), BudgetNotFoundException);
}

// ===========================================================================
// Performance-driven limits
// ===========================================================================

TEST_F(TreasuryScenarioTest, RescaleRewardsAndPunishes) {
    provision("star_agent", 10000, 5000, 2000);
    provision("idle_agent", 10000, 5000, 2000);

    spend_with_value("star_agent", 1000, 2500);
    spend_with_value("idle_agent", 1000, 100);

    auto perf = treasury_->performance("star_agent");
    EXPECT_DOUBLE_EQ(perf.roi, 2.5);
    EXPECT_EQ(perf.tier, PerformanceTier::Excellent);

    auto results = treasury_->rescale_all();
    ASSERT_EQ(results.size(), 2u);

    auto star = treasury_->get_budget("star_agent");
    EXPECT_EQ(star.daily_limit, 7500);
    EXPECT_EQ(star.per_action_limit, 3000);

    auto idle = treasury_->get_budget("idle_agent");
    EXPECT_EQ(idle.daily_limit, 2500);
    EXPECT_EQ(idle.per_action_limit, 1000);
    EXPECT_EQ(idle.current_balance, 9000);

    // The raised per-action limit is live immediately
    EXPECT_NO_THROW(treasury_->authorize("star_agent", 2800, "bigger call"));
    EXPECT_THROW(treasury_->authorize("idle_agent", 1200, "too big now"),
                 UsageLimitExceededException);

    std::size_t rescales = 0;
    for (const auto& event : treasury_->get_admin_events()) {
        if (event.kind == AdminEventKind::LimitRescale) ++rescales;
    }
    EXPECT_EQ(rescales, 2u);
}

TEST_F(TreasuryScenarioTest, RescaleDuringFreezeStillChangesLimits) {
    provision("star_agent", 10000, 5000, 2000);
    spend_with_value("star_agent", 1000, 3000);
    treasury_->freeze("incident", "oncall");

    auto result = treasury_->rescale("star_agent", "ops");
    EXPECT_TRUE(result.applied);
    EXPECT_THROW(treasury_->authorize("star_agent", 100, "frozen"), EmergencyFreezeException);
}

// ===========================================================================
// System views
// ===========================================================================

TEST_F(TreasuryScenarioTest, EconomicSummaryAcrossAgents) {
    provision("earner_agent", 10000, 5000, 2000);
    provision("spender_agent", 10000, 5000, 2000);
    provision("paused_agent", 10000, 5000, 2000);

    treasury_->authorize("earner_agent", 1000, "work");
    treasury_->credit("earner_agent", 3000, "client paid");
    treasury_->authorize("spender_agent", 2000, "work");
    treasury_->set_agent_status("paused_agent", BudgetStatus::Suspended, "admin", "review");

    auto summary = treasury_->economic_summary();
    EXPECT_EQ(summary.total_agents, 3u);
    EXPECT_EQ(summary.active_agents, 2u);
    EXPECT_EQ(summary.suspended_agents, 1u);
    EXPECT_EQ(summary.total_balance, 12000 + 8000 + 10000);
    EXPECT_EQ(summary.total_spent, 3000);
    EXPECT_EQ(summary.total_earned, 3000);
    EXPECT_DOUBLE_EQ(summary.system_roi, 1.0);
    ASSERT_TRUE(summary.top_performer.has_value());
    EXPECT_EQ(*summary.top_performer, "earner_agent");
}

TEST_F(TreasuryScenarioTest, StatusReflectsBreakerAndQueue) {
    provision("agent_a", 10000, 5000, 2000);

    auto before = treasury_->status();
    EXPECT_FALSE(before.frozen);
    EXPECT_EQ(before.agent_count, 1u);
    EXPECT_EQ(before.pending_durable_writes, 0u);
    EXPECT_FALSE(before.scheduler_running);

    treasury_->freeze("budget anomaly", "oncall");
    auto during = treasury_->status();
    EXPECT_TRUE(during.frozen);
    EXPECT_EQ(during.breaker.reason, "budget anomaly");
    EXPECT_EQ(during.breaker.actor, "oncall");
    EXPECT_EQ(during.breaker.timestamp, clock_.now());
}

TEST(TreasuryConfigTest, SchedulerRunsWhenEnabled) {
    Config config = load_config_from_string(
        "reset_scheduler: { enabled: true, check_interval_ms: 10 }\n"
        "defaults: { initial_balance: 2000, daily_limit: 1500, per_action_limit: 500 }\n");
    Treasury treasury(config);

    auto budget = treasury.provision_agent("configured_agent");
    EXPECT_EQ(budget.current_balance, 2000);
    EXPECT_EQ(budget.per_action_limit, 500);

    treasury.start();
    EXPECT_TRUE(treasury.is_running());
    EXPECT_TRUE(treasury.status().scheduler_running);
    treasury.stop();
    EXPECT_FALSE(treasury.is_running());
    EXPECT_FALSE(treasury.status().scheduler_running);
}

TEST(TreasuryConfigTest, InvalidConfigRejectedAtConstruction) {
    Config config;
    config.scaler.daily_limit_floor = 60000;
    EXPECT_THROW(Treasury treasury(config), ConfigException);
}
