#include <gtest/gtest.h>
#include <agenttreasury/codec.hpp>
#include <agenttreasury/exceptions.hpp>
#include <agenttreasury/time_util.hpp>

#include "test_support.hpp"

using namespace agenttreasury;
using namespace agenttreasury::testing_support;
using namespace std::chrono_literals;

// ===========================================================================
// Budgets
// ===========================================================================

TEST(CodecTest, BudgetKeepsEveryField) {
    AgentBudget b;
    b.agent_id = "research_agent";
    b.current_balance = 8500;
    b.daily_limit = 5000;
    b.per_action_limit = 2000;
    b.spent_today = 1500;
    b.total_spent = 1500;
    b.total_earned = 42;
    b.last_reset_date = BASE_DAY;
    b.utc_offset_minutes = 330;
    b.status = BudgetStatus::Active;
    b.roi_score = 1.0 / 3.0;
    b.created_at = base_time();
    b.updated_at = base_time() + 250ms;
    b.revision = 17;
    b.version = 99;  // not part of the encoding

    AgentBudget d = decode_budget(encode_budget(b));
    EXPECT_EQ(d.agent_id, b.agent_id);
    EXPECT_EQ(d.current_balance, 8500);
    EXPECT_EQ(d.spent_today, 1500);
    EXPECT_EQ(d.total_earned, 42);
    EXPECT_EQ(d.last_reset_date, BASE_DAY);
    EXPECT_EQ(d.utc_offset_minutes, 330);
    EXPECT_DOUBLE_EQ(d.roi_score, 1.0 / 3.0);
    EXPECT_EQ(d.updated_at, base_time() + 250ms);
    EXPECT_EQ(d.revision, 17u);
    EXPECT_EQ(d.version, 0u);
}

TEST(CodecTest, BudgetEncodingIsSingleLine) {
    AgentBudget b;
    b.agent_id = "agent_one";
    EXPECT_EQ(encode_budget(b).find('\n'), std::string::npos);
}

TEST(CodecTest, BudgetWithoutRevisionDecodesAsZero) {
    std::string legacy =
        "{agent_id: old_agent, current_balance: 1, daily_limit: 2, per_action_limit: 1, "
        "spent_today: 0, last_reset_date: 20000, status: active, "
        "created_at: 0, updated_at: 0}";
    AgentBudget b = decode_budget(legacy);
    EXPECT_EQ(b.agent_id, "old_agent");
    EXPECT_EQ(b.revision, 0u);
    EXPECT_EQ(b.total_spent, 0);
}

TEST(CodecTest, MalformedBudgetIsCorrupt) {
    EXPECT_THROW(decode_budget("{agent_id: x"), CorruptRecordException);
    EXPECT_THROW(decode_budget("[1, 2, 3]"), CorruptRecordException);
    EXPECT_THROW(decode_budget("{agent_id: x}"), CorruptRecordException);
}

TEST(CodecTest, UnknownStatusIsCorrupt) {
    std::string text =
        "{agent_id: a_1, current_balance: 1, daily_limit: 2, per_action_limit: 1, "
        "spent_today: 0, last_reset_date: 1, status: retired, created_at: 0, updated_at: 0}";
    EXPECT_THROW(decode_budget(text), CorruptRecordException);
}

TEST(CodecTest, NonIntegerMoneyIsCorrupt) {
    std::string text =
        "{agent_id: a_1, current_balance: 1.5, daily_limit: 2, per_action_limit: 1, "
        "spent_today: 0, last_reset_date: 1, status: active, created_at: 0, updated_at: 0}";
    EXPECT_THROW(decode_budget(text), CorruptRecordException);
}

// ===========================================================================
// Transactions and admin events
// ===========================================================================

TEST(CodecTest, TransactionWithAwkwardStrings) {
    Transaction t;
    t.transaction_id = generate_uuid();
    t.agent_id = "agent_x";
    t.amount = -1500;
    t.description = "quote: \"x\", colon: y, {braces} # hash";
    t.timestamp = base_time();
    t.outcome = TransactionOutcome::Denied;
    t.denial_reason = DenialReason::EmergencyFreeze;
    t.metadata = {{"key with space", "value: with colon"}};

    Transaction d = decode_transaction(encode_transaction(t));
    EXPECT_EQ(d.transaction_id, t.transaction_id);
    EXPECT_EQ(d.description, t.description);
    EXPECT_EQ(d.amount, -1500);
    EXPECT_TRUE(d.is_debit());
    EXPECT_EQ(d.denial_reason, std::optional<DenialReason>(DenialReason::EmergencyFreeze));
    EXPECT_FALSE(d.balance_before.has_value());
    EXPECT_FALSE(d.roi_data.has_value());
    EXPECT_EQ(d.metadata.at("key with space"), "value: with colon");
}

TEST(CodecTest, AdminEventWithoutAgent) {
    AdminEvent e;
    e.event_id = "ev-1";
    e.kind = AdminEventKind::Unfreeze;
    e.actor = "ops";
    e.reason = "all clear";
    e.timestamp = base_time();

    AdminEvent d = decode_admin_event(encode_admin_event(e));
    EXPECT_EQ(d.kind, AdminEventKind::Unfreeze);
    EXPECT_FALSE(d.agent_id.has_value());
    EXPECT_EQ(d.reason, "all clear");
    EXPECT_EQ(d.timestamp, base_time());
}

TEST(CodecTest, BreakerState) {
    CircuitBreakerState s;
    s.frozen = true;
    s.reason = "runaway loop";
    s.actor = "oncall";
    s.timestamp = base_time();

    CircuitBreakerState d = decode_breaker_state(encode_breaker_state(s));
    EXPECT_TRUE(d.frozen);
    EXPECT_EQ(d.reason, "runaway loop");
    EXPECT_EQ(d.actor, "oncall");
}

// ===========================================================================
// Enum names
// ===========================================================================

TEST(CodecTest, EnumNamesParseBack) {
    EXPECT_EQ(parse_denial_reason("per_action"), DenialReason::PerActionLimit);
    EXPECT_EQ(parse_denial_reason("daily"), DenialReason::DailyLimit);
    EXPECT_EQ(parse_admin_event_kind("limit_rescale"), AdminEventKind::LimitRescale);
    EXPECT_EQ(parse_transaction_kind("earning"), TransactionKind::Earning);
    EXPECT_EQ(parse_budget_status("decommissioned"), BudgetStatus::Decommissioned);
    EXPECT_THROW(parse_transaction_outcome("maybe"), CorruptRecordException);
}

TEST(CodecTest, EmptyMetadataText) {
    EXPECT_TRUE(decode_metadata("").empty());
    EXPECT_TRUE(decode_metadata(encode_metadata({})).empty());
}

// ===========================================================================
// Time helpers
// ===========================================================================

TEST(TimeUtilTest, LocalDateHonoursOffset) {
    // 2026-03-10 12:00 UTC
    EXPECT_EQ(local_date(base_time(), 0), BASE_DAY);
    EXPECT_EQ(local_date(base_time(), 12 * 60), BASE_DAY + 1);   // 00:00 next day
    EXPECT_EQ(local_date(base_time(), -(12 * 60) - 1), BASE_DAY - 1);
    EXPECT_EQ(format_date(BASE_DAY), "2026-03-10");
    EXPECT_EQ(format_date(0), "1970-01-01");
    EXPECT_EQ(local_date(from_unix_millis(-1)), -1);
}

TEST(TimeUtilTest, UuidsAreUniqueAndWellFormed) {
    auto a = generate_uuid();
    auto b = generate_uuid();
    EXPECT_NE(a, b);
    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[14], '4');
}
