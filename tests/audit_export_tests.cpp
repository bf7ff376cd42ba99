#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "persist/audit_export.hpp"
#include "harness/lifecycle_harness.hpp"

namespace {

using core::ProjectState;
using core::Role;

// 2024-05-01T12:30:00.125Z
constexpr std::int64_t kTs = 1'714'566'600'125'000'000;

TEST(AuditExportTest, ParseFormat) {
    EXPECT_EQ(persist::parse_export_format("csv"), persist::ExportFormat::Csv);
    EXPECT_EQ(persist::parse_export_format("json"), persist::ExportFormat::JsonLines);
    EXPECT_EQ(persist::parse_export_format("jsonl"), persist::ExportFormat::JsonLines);
    EXPECT_FALSE(persist::parse_export_format("xml").has_value());
}

TEST(AuditExportTest, CsvEscaping) {
    EXPECT_EQ(persist::csv_escape("plain"), "plain");
    EXPECT_EQ(persist::csv_escape("a,b"), "\"a,b\"");
    EXPECT_EQ(persist::csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(persist::csv_escape("two\nlines"), "\"two\nlines\"");
}

TEST(AuditExportTest, JsonEscaping) {
    EXPECT_EQ(persist::json_escape("plain"), "plain");
    EXPECT_EQ(persist::json_escape("q\"b\\"), "q\\\"b\\\\");
    EXPECT_EQ(persist::json_escape("tab\tnl\n"), "tab\\tnl\\n");
    EXPECT_EQ(persist::json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(AuditExportTest, CsvRows) {
    auto ev = test::make_event("P1", ProjectState::QA, ProjectState::Captured, Role::Approver, kTs,
                               std::string("blurry, redo"));
    ev.metadata["a"] = "1";
    ev.metadata["b"] = "2";
    const auto plain = test::make_event("P2", ProjectState::Requested, ProjectState::Assigned, Role::SalesLead, kTs);
    const std::vector<core::AuditEvent> events{ev, plain};

    std::ostringstream os;
    persist::write_csv(os, events);
    EXPECT_EQ(os.str(),
              "timestamp,project_id,user_id,user_role,from_state,to_state,reason,metadata\n"
              "2024-05-01T12:30:00.125Z,P1,U1,approver,QA,Captured,\"blurry, redo\",a=1;b=2\n"
              "2024-05-01T12:30:00.125Z,P2,U1,sales_lead,Requested,Assigned,,\n");
}

TEST(AuditExportTest, JsonLines) {
    auto ev = test::make_event("P1", ProjectState::Delivered, ProjectState::Approved, Role::CustomerOwner, kTs,
                               std::string("looks \"great\""));
    ev.metadata["invoice"] = "INV-9";
    const auto plain = test::make_event("P2", ProjectState::Approved, ProjectState::Archived, Role::Admin, kTs);
    const std::vector<core::AuditEvent> events{ev, plain};

    std::ostringstream os;
    persist::write_export(os, persist::ExportFormat::JsonLines, events);
    EXPECT_EQ(os.str(),
              "{\"project_id\":\"P1\",\"user_id\":\"U1\",\"user_role\":\"customer_owner\","
              "\"from_state\":\"Delivered\",\"to_state\":\"Approved\",\"reason\":\"looks \\\"great\\\"\","
              "\"metadata\":{\"invoice\":\"INV-9\"},\"timestamp\":\"2024-05-01T12:30:00.125Z\"}\n"
              "{\"project_id\":\"P2\",\"user_id\":\"U1\",\"user_role\":\"admin\","
              "\"from_state\":\"Approved\",\"to_state\":\"Archived\","
              "\"metadata\":{},\"timestamp\":\"2024-05-01T12:30:00.125Z\"}\n");
}

TEST(AuditExportTest, EmptyInputWritesHeaderOnly) {
    std::ostringstream csv;
    persist::write_export(csv, persist::ExportFormat::Csv, {});
    EXPECT_EQ(csv.str(), "timestamp,project_id,user_id,user_role,from_state,to_state,reason,metadata\n");

    std::ostringstream json;
    persist::write_export(json, persist::ExportFormat::JsonLines, {});
    EXPECT_TRUE(json.str().empty());
}

} // namespace
