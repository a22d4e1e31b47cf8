#include <mender/core/diagnostics.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace mender::core;

// ============================================================================
// DiagnosticEmitter
// ============================================================================

// 1. Severity names
TEST(Diagnostics, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

// 2. Events carry every structured field
TEST(Diagnostics, EmitFields) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(42);
    emitter.emit(Severity::Error, "balancer", "depth", "too deep", 3, 7);
    ASSERT_EQ(emitter.size(), 1u);
    const auto& e = emitter.events()[0];
    EXPECT_EQ(e.severity, Severity::Error);
    EXPECT_EQ(e.module, "balancer");
    EXPECT_EQ(e.stage, "depth");
    EXPECT_EQ(e.message, "too deep");
    EXPECT_EQ(e.correlation_id, 42u);
    EXPECT_EQ(e.line, 3);
    EXPECT_EQ(e.column, 7);
}

// 3. Events are grouped by the parse that emitted them
TEST(Diagnostics, EventsForCorrelationId) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(1);
    emitter.emit(Severity::Info, "parser", "start", "first");
    emitter.warn("scanner", "entity", "first");
    emitter.set_correlation_id(2);
    emitter.emit(Severity::Info, "parser", "start", "second");
    EXPECT_EQ(emitter.events_for(1).size(), 2u);
    ASSERT_EQ(emitter.events_for(2).size(), 1u);
    EXPECT_EQ(emitter.events_for(2)[0].message, "second");
    EXPECT_TRUE(emitter.events_for(3).empty());
    EXPECT_EQ(emitter.size(), 3u);
}

// 4. Observers see every kept event
TEST(Diagnostics, Observers) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&](const DiagnosticEvent& e) { seen.push_back(e.message); });
    emitter.warn("scanner", "markup", "one");
    emitter.warn("scanner", "markup", "two");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], "two");
}

// 5. Filters by severity and stage
TEST(Diagnostics, Filters) {
    DiagnosticEmitter emitter;
    emitter.warn("scanner", "entity", "a");
    emitter.warn("balancer", "end-tag", "b");
    emitter.emit(Severity::Error, "balancer", "depth", "c");
    EXPECT_EQ(emitter.events_by_severity(Severity::Warning).size(), 2u);
    EXPECT_EQ(emitter.events_by_severity(Severity::Error).size(), 1u);
    EXPECT_EQ(emitter.events_by_stage("entity").size(), 1u);
    EXPECT_TRUE(emitter.events_by_stage("doctype").empty());
}

// ============================================================================
// Formatting and correlation ids
// ============================================================================

// 6. Full format
TEST(Diagnostics, FormatFull) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "scanner";
    event.stage = "entity";
    event.message = "missing ';'";
    event.correlation_id = 7;
    event.line = 3;
    event.column = 5;
    EXPECT_EQ(format_diagnostic(event), "[warning] scanner/entity 3:5 (cid:7): missing ';'");
}

// 7. Position and correlation id are optional
TEST(Diagnostics, FormatMinimal) {
    DiagnosticEvent event;
    event.severity = Severity::Info;
    event.module = "parser";
    event.message = "done";
    EXPECT_EQ(format_diagnostic(event), "[info] parser: done");
}

// 8. Correlation ids increase
TEST(Diagnostics, CorrelationIdsIncrease) {
    auto first = next_correlation_id();
    auto second = next_correlation_id();
    EXPECT_GT(first, 0u);
    EXPECT_GT(second, first);
}
