#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/gatehouse_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace gatehouse::session {

// Appends one JSON object per line to <audit_dir>/<session_id>.jsonl.
// Events: "call" (request received), "decision" (approved or refused),
// "result" (tool finished).
class AuditWriter {
public:
    AuditWriter(std::filesystem::path audit_dir, std::string session_id);

    core::errors::Result<std::filesystem::path> write_call(
        const protocol::ToolCall& call) const;

    core::errors::Result<std::filesystem::path> write_decision(
        const std::string& call_id, const std::string& tool_name, bool approved,
        const std::optional<core::errors::GatehouseError>& refusal = std::nullopt) const;

    core::errors::Result<std::filesystem::path> write_result(
        const std::string& call_id, const protocol::ToolResult& result) const;

    core::errors::Result<std::filesystem::path> log_path() const;

    const std::string& session_id() const { return session_id_; }

private:
    core::errors::Result<std::filesystem::path> append_event(const std::string& event_json) const;

    std::filesystem::path audit_dir_;
    std::string session_id_;
    mutable std::mutex mutex_;
};

}  // namespace gatehouse::session
