#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/errors/gatehouse_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "session/audit_writer.hpp"

namespace {

using gatehouse::core::errors::ErrorCategory;
using gatehouse::core::errors::GatehouseError;
using gatehouse::core::errors::get_error;
using gatehouse::core::errors::get_value;
using gatehouse::core::errors::is_error;
using gatehouse::session::AuditWriter;
using nlohmann::json;
namespace fs = std::filesystem;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = fs::current_path() /
                (".tmp_audit_" + gatehouse::core::config::generate_id("ws"));
        fs::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

std::vector<json> read_events(const fs::path& path) {
    std::ifstream in(path);
    std::vector<json> events;
    std::string line;
    while (std::getline(in, line)) {
        events.push_back(json::parse(line));
    }
    return events;
}

TEST(AuditWriterTest, WritesCallDecisionAndResultEvents) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root() / "audit", "gh-session");

    gatehouse::protocol::ToolCall call{"c1", "read_file", {{"path", "/tmp/x"}}};
    auto call_written = writer.write_call(call);
    ASSERT_FALSE(is_error(call_written));
    EXPECT_EQ(get_value(call_written), workspace.root() / "audit" / "gh-session.jsonl");

    ASSERT_FALSE(is_error(writer.write_decision("c1", "read_file", true)));
    gatehouse::protocol::ToolResult result{"c1", true, "hello", "", 1.5};
    ASSERT_FALSE(is_error(writer.write_result("c1", result)));

    const auto events = read_events(get_value(call_written));
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].at("event"), "call");
    EXPECT_EQ(events[0].at("session_id"), "gh-session");
    EXPECT_EQ(events[0].at("payload").at("arguments").at("path"), "/tmp/x");
    EXPECT_EQ(events[1].at("event"), "decision");
    EXPECT_EQ(events[1].at("payload").at("approved"), true);
    EXPECT_EQ(events[2].at("event"), "result");
    EXPECT_EQ(events[2].at("payload").at("output_bytes"), 5);
    for (const auto& event : events) {
        EXPECT_EQ(event.at("call_id"), "c1");
        EXPECT_TRUE(event.at("ts_unix_ms").is_number_integer());
    }
}

TEST(AuditWriterTest, RefusalRecordsCodeAndCategory) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root(), "gh-refusal");
    const GatehouseError refusal{ErrorCategory::Policy, "Command 'rm' is not allowed",
                                 "command_not_allowed"};

    auto written = writer.write_decision("c2", "execute_command", false, refusal);
    ASSERT_FALSE(is_error(written));

    const auto events = read_events(get_value(written));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].at("payload").at("approved"), false);
    EXPECT_EQ(events[0].at("payload").at("category"), "policy");
    EXPECT_EQ(events[0].at("payload").at("code"), "command_not_allowed");
}

TEST(AuditWriterTest, InvalidUtf8IsReplacedNotThrown) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root(), "gh-bytes");
    gatehouse::protocol::ToolResult result{"c3", false, "", std::string("bad \xff byte"), 0.0};
    auto written = writer.write_result("c3", result);
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(read_events(get_value(written)).size(), 1u);
}

TEST(AuditWriterTest, EmptySessionIdIsRejected) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root(), "");
    auto path = writer.log_path();
    ASSERT_TRUE(is_error(path));
    EXPECT_EQ(get_error(path).code, "invalid_session_id");
}

TEST(AuditWriterTest, UncreatableDirectoryIsInternalError) {
    TempWorkspace workspace;
    const auto blocker = workspace.root() / "file";
    { std::ofstream(blocker) << "x"; }
    AuditWriter writer(blocker / "audit", "gh-x");
    auto written = writer.write_decision("c4", "read_file", true);
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(get_error(written).code, "audit_dir_create_failed");
}

}  // namespace
