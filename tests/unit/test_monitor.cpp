#include <gtest/gtest.h>
#include <agenttreasury/monitor.hpp>

#include "test_support.hpp"

#include <string>

using namespace agenttreasury;
using namespace agenttreasury::testing_support;

namespace {

MonitorEvent make_event(EventType type) {
    MonitorEvent e;
    e.type = type;
    e.timestamp = base_time();
    return e;
}

} // anonymous namespace

// ===========================================================================
// MetricsMonitor
// ===========================================================================

TEST(MetricsMonitorTest, CountsAuthorizationsAndDenials) {
    MetricsMonitor metrics;

    auto ok = make_event(EventType::SpendAuthorized);
    ok.amount = 150;
    metrics.on_event(ok);
    metrics.on_event(ok);

    auto denied = make_event(EventType::SpendDenied);
    denied.denial_reason = DenialReason::DailyLimit;
    metrics.on_event(denied);

    auto credit = make_event(EventType::FundsCredited);
    credit.amount = 40;
    metrics.on_event(credit);

    auto m = metrics.get_metrics();
    EXPECT_EQ(m.total_authorizations, 3u);
    EXPECT_EQ(m.successful_authorizations, 2u);
    EXPECT_EQ(m.denied_authorizations, 1u);
    EXPECT_EQ(m.denials_by_reason["daily"], 1u);
    EXPECT_EQ(m.amount_authorized, 300);
    EXPECT_EQ(m.amount_credited, 40);

    metrics.reset_metrics();
    EXPECT_EQ(metrics.get_metrics().total_authorizations, 0u);
}

TEST(MetricsMonitorTest, AuditDegradationRaisesAlert) {
    MetricsMonitor metrics;
    std::string alerted;
    metrics.set_audit_alert([&](const std::string& message) { alerted = message; });

    auto degraded = make_event(EventType::AuditWriteDegraded);
    degraded.message = "ledger down";
    metrics.on_event(degraded);

    EXPECT_EQ(metrics.get_metrics().audit_degradations, 1u);
    EXPECT_NE(alerted.find("ledger down"), std::string::npos);
}

// ===========================================================================
// CompositeMonitor
// ===========================================================================

TEST(CompositeMonitorTest, FansOutToEveryMonitor) {
    auto a = std::make_shared<TestMonitor>();
    auto b = std::make_shared<TestMonitor>();
    CompositeMonitor hub;
    hub.add_monitor(a);
    hub.add_monitor(b);

    hub.on_event(make_event(EventType::CircuitBreakerFrozen));
    EXPECT_EQ(a->count(EventType::CircuitBreakerFrozen), 1u);
    EXPECT_EQ(b->count(EventType::CircuitBreakerFrozen), 1u);
}

// ===========================================================================
// ConsoleMonitor
// ===========================================================================

TEST(ConsoleMonitorTest, WritesImportantEventsOnly) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Normal);

    ::testing::internal::CaptureStdout();
    auto frozen = make_event(EventType::CircuitBreakerFrozen);
    frozen.actor = "oncall";
    frozen.message = "incident";
    console.on_event(frozen);
    console.on_event(make_event(EventType::SpendAuthorized));
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("CircuitBreakerFrozen actor=oncall | incident"), std::string::npos);
    EXPECT_EQ(out.find("SpendAuthorized"), std::string::npos);
}

TEST(ConsoleMonitorTest, QuietWritesNothing) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Quiet);
    ::testing::internal::CaptureStdout();
    console.on_event(make_event(EventType::CircuitBreakerFrozen));
    EXPECT_TRUE(::testing::internal::GetCapturedStdout().empty());
}

TEST(MonitorTest, EventNames) {
    EXPECT_STREQ(to_string(EventType::AuditWriteDegraded), "AuditWriteDegraded");
    EXPECT_STREQ(to_string(EventType::DailyRollover), "DailyRollover");
}
