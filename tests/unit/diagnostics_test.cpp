#include <gtest/gtest.h>
#include "styletree/core/diagnostics.h"
#include "styletree/core/parse_error.h"

#include <string>
#include <vector>

using namespace styletree::core;

TEST(DiagnosticsTest, EmitRecordsEventFields) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "html", "parse", "parsed 3 node(s)");

    ASSERT_EQ(emitter.size(), 1u);
    const auto& event = emitter.events()[0];
    EXPECT_EQ(event.severity, Severity::Info);
    EXPECT_EQ(event.module, "html");
    EXPECT_EQ(event.stage, "parse");
    EXPECT_EQ(event.message, "parsed 3 node(s)");
    EXPECT_FALSE(event.source_offset.has_value());
    EXPECT_FALSE(emitter.has_errors());
}

TEST(DiagnosticsTest, MinSeverityFiltersLowerEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.emit(Severity::Info, "css", "parse", "dropped");
    emitter.emit(Severity::Warning, "css", "parse", "kept");

    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "kept");
    EXPECT_EQ(emitter.min_severity(), Severity::Warning);
}

TEST(DiagnosticsTest, ObserversSeeEveryRecordedEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });

    emitter.emit(Severity::Info, "html", "parse", "one");
    emitter.emit(Severity::Error, "css", "parse", "two");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "one");
    EXPECT_EQ(seen[1], "two");
}

TEST(DiagnosticsTest, ReportFailureCarriesKindAndOffset) {
    DiagnosticEmitter emitter;
    emitter.report_failure("css", "parse",
                           ParseError(ParseErrorKind::UnterminatedBlock, 12, "expected '}'"));

    ASSERT_EQ(emitter.size(), 1u);
    const auto& event = emitter.events()[0];
    EXPECT_EQ(event.severity, Severity::Error);
    ASSERT_TRUE(event.source_offset.has_value());
    EXPECT_EQ(*event.source_offset, 12u);
    EXPECT_EQ(event.message, "unterminated-block: expected '}'");
    EXPECT_TRUE(emitter.has_errors());
}

TEST(DiagnosticsTest, FilterBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "html", "parse", "a");
    emitter.emit(Severity::Error, "html", "parse", "b");
    emitter.emit(Severity::Info, "css", "parse", "c");

    EXPECT_EQ(emitter.events_by_severity(Severity::Info).size(), 2u);
    EXPECT_EQ(emitter.events_by_module("html").size(), 2u);
    EXPECT_EQ(emitter.events_by_module("style").size(), 0u);

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(DiagnosticsTest, FormatDiagnostic) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "css";
    event.stage = "parse";
    event.message = "hello";
    EXPECT_EQ(format_diagnostic(event), "[warning] css/parse: hello");

    event.source_offset = 4;
    EXPECT_EQ(format_diagnostic(event), "[warning] css/parse @4: hello");
}
