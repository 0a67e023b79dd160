#include <stratum/core/diagnostics.h>
#include <stratum/core/errors.h>
#include <stratum/core/invariants.h>

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace stratum::core;

// ---------------------------------------------------------------------------
// 1. DiagnosticEmitter
// ---------------------------------------------------------------------------
TEST(Diagnostics, EmitRecordsEvent) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "layer", "attach", "created graphics surface");
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].module, "layer");
    EXPECT_EQ(emitter.events()[0].stage, "attach");
    EXPECT_EQ(emitter.events()[0].message, "created graphics surface");
}

TEST(Diagnostics, MinSeverityFiltersEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.emit(Severity::Info, "layer", "attach", "dropped");
    emitter.emit(Severity::Error, "layer", "append", "kept");
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "kept");
}

TEST(Diagnostics, ObserversSeeEveryEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.stage); });
    emitter.emit(Severity::Info, "layer", "attach", "a");
    emitter.emit(Severity::Warning, "layer", "render", "b");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "attach");
    EXPECT_EQ(seen[1], "render");
}

TEST(Diagnostics, FilterBySeverityAndStage) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "layer", "attach", "a");
    emitter.emit(Severity::Info, "layer", "detach", "b");
    emitter.emit(Severity::Error, "layer", "append", "c");
    EXPECT_EQ(emitter.events_by_severity(Severity::Info).size(), 2u);
    EXPECT_EQ(emitter.events_by_stage("append").size(), 1u);
    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(Diagnostics, FormatIncludesSubjectAndCorrelationId) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(42);
    emitter.emit(Severity::Error, "layer", "append", "bad z-index", "layer(z=inherit)");
    EXPECT_EQ(format_diagnostic(emitter.events()[0]),
              "[error] layer/append layer(z=inherit) (cid:42): bad z-index");
}

TEST(Diagnostics, FormatWithoutSubject) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Warning, "layer", "render", "layer is not attached");
    EXPECT_EQ(format_diagnostic(emitter.events()[0]),
              "[warning] layer/render: layer is not attached");
}

TEST(Diagnostics, CountAndLast) {
    DiagnosticEmitter emitter;
    EXPECT_EQ(emitter.last(), nullptr);
    emitter.emit(Severity::Info, "layer", "attach", "a");
    emitter.emit(Severity::Info, "layer", "attach", "b");
    emitter.emit(Severity::Error, "layer", "order", "c");
    EXPECT_EQ(emitter.count(Severity::Info), 2u);
    EXPECT_EQ(emitter.count(Severity::Warning), 0u);
    ASSERT_NE(emitter.last(), nullptr);
    EXPECT_EQ(emitter.last()->message, "c");
}

TEST(Diagnostics, ObserverMayEmit) {
    DiagnosticEmitter emitter;
    emitter.add_observer([&emitter](const DiagnosticEvent& e) {
        if (e.severity == Severity::Error) {
            emitter.emit(Severity::Info, "layer", "report", "error seen: " + e.message);
        }
    });
    emitter.emit(Severity::Error, "layer", "append", "bad z-index");
    ASSERT_EQ(emitter.size(), 2u);
    EXPECT_EQ(emitter.events()[1].message, "error seen: bad z-index");
}

TEST(Diagnostics, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

// ---------------------------------------------------------------------------
// 2. InvariantValidator
// ---------------------------------------------------------------------------
TEST(Invariants, EmptyValidatorDoesNotPass) {
    InvariantValidator validator;
    validator.validate_all();
    EXPECT_FALSE(validator.all_passed());
}

TEST(Invariants, CountsPassesAndFailures) {
    InvariantValidator validator;
    validator.add_check("tree", "ok", [](std::string&) { return true; });
    validator.add_check("tree", "broken", [](std::string& detail) {
        detail = "node 3 is out of order";
        return false;
    });
    EXPECT_FALSE(validator.validate_all());
    EXPECT_EQ(validator.check_count(), 2u);
    EXPECT_EQ(validator.pass_count(), 1u);
    EXPECT_EQ(validator.fail_count(), 1u);
    EXPECT_FALSE(validator.all_passed());
    ASSERT_EQ(validator.failures().size(), 1u);
    EXPECT_EQ(validator.failures()[0].detail, "node 3 is out of order");
    ASSERT_NE(validator.first_failure(), nullptr);
    EXPECT_EQ(validator.first_failure()->name, "broken");
}

TEST(Invariants, ReportListsEveryCheck) {
    InvariantValidator validator;
    validator.add_check("tree", "ok", [](std::string&) { return true; });
    validator.add_check("tree", "links", [](std::string& detail) {
        detail = "stale parent";
        return false;
    });
    validator.validate_all();
    EXPECT_EQ(validator.format_report(),
              "1 of 2 invariants hold\n"
              "  ok   tree::ok\n"
              "  FAIL tree::links: stale parent\n");
}

TEST(Invariants, ChecksReadCurrentState) {
    InvariantValidator validator;
    int depth = 0;
    validator.add_check("tree", "balanced", [&depth](std::string&) { return depth == 0; });
    EXPECT_TRUE(validator.validate_all());
    depth = 1;
    EXPECT_FALSE(validator.validate_all());
    EXPECT_EQ(validator.results().size(), 1u);

    validator.clear();
    EXPECT_EQ(validator.check_count(), 0u);
    EXPECT_TRUE(validator.results().empty());
}

// ---------------------------------------------------------------------------
// 3. Errors
// ---------------------------------------------------------------------------
TEST(Errors, InvalidStyleValueCarriesPropertyAndValue) {
    InvalidStyleValue error("z-index", "inherit");
    EXPECT_EQ(error.property(), "z-index");
    EXPECT_EQ(error.value(), "inherit");
    EXPECT_STREQ(error.what(), "invalid value 'inherit' for z-index");
}
