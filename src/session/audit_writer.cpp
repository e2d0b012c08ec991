#include "session/audit_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace gatehouse::session {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

// Command output may carry invalid UTF-8; it is replaced rather than thrown on.
std::string make_event(const std::string& kind, const std::string& session_id,
                       const std::string& call_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = kind;
    event["session_id"] = session_id;
    event["call_id"] = call_id;
    event["payload"] = std::move(payload);
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

AuditWriter::AuditWriter(std::filesystem::path audit_dir, std::string session_id)
    : audit_dir_(std::move(audit_dir)), session_id_(std::move(session_id)) {}

core::errors::Result<std::filesystem::path> AuditWriter::log_path() const {
    if (session_id_.empty()) {
        return GatehouseError{ErrorCategory::Input, "Session ID cannot be empty.",
                              "invalid_session_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(audit_dir_, ec);
    if (ec) {
        return GatehouseError{ErrorCategory::Internal,
                              "Unable to create audit directory: " + audit_dir_.string(),
                              "audit_dir_create_failed"};
    }
    return audit_dir_ / (session_id_ + ".jsonl");
}

core::errors::Result<std::filesystem::path> AuditWriter::append_event(
    const std::string& event_json) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = log_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return GatehouseError{ErrorCategory::Internal,
                              "Unable to open audit file: " + path.string(),
                              "audit_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return GatehouseError{ErrorCategory::Internal,
                              "Unable to write audit event: " + path.string(),
                              "audit_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> AuditWriter::write_call(
    const protocol::ToolCall& call) const {
    json payload;
    payload["tool"] = call.name;
    payload["arguments"] = call.arguments;
    return append_event(make_event("call", session_id_, call.id, std::move(payload)));
}

core::errors::Result<std::filesystem::path> AuditWriter::write_decision(
    const std::string& call_id, const std::string& tool_name, const bool approved,
    const std::optional<GatehouseError>& refusal) const {
    json payload;
    payload["tool"] = tool_name;
    payload["approved"] = approved;
    if (refusal.has_value()) {
        payload["category"] = core::errors::to_string(refusal->category);
        payload["code"] = refusal->code;
        payload["message"] = refusal->message;
    }
    return append_event(make_event("decision", session_id_, call_id, std::move(payload)));
}

core::errors::Result<std::filesystem::path> AuditWriter::write_result(
    const std::string& call_id, const protocol::ToolResult& result) const {
    json payload;
    payload["success"] = result.success;
    payload["output_bytes"] = result.output.size();
    payload["error_message"] = result.error_message;
    payload["duration_ms"] = result.duration_ms;
    return append_event(make_event("result", session_id_, call_id, std::move(payload)));
}

}  // namespace gatehouse::session
