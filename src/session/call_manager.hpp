#pragma once

#include <cstddef>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/gatehouse_errors.hpp"

namespace gatehouse::session {

enum class CallState {
    Created,
    Running,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(CallState state);

struct CallRecord {
    std::string call_id;
    std::string tool_name;
    CallState state = CallState::Created;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Tracks in-flight tool calls. Terminal states are final.
class CallManager {
public:
    core::errors::Result<std::shared_ptr<std::atomic_bool>> start_call(
        const std::string& call_id, const std::string& tool_name);
    core::errors::Result<CallState> cancel_call(const std::string& call_id);
    core::errors::Result<CallState> get_state(const std::string& call_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& call_id) const;

    core::errors::Result<CallState> mark_completed(const std::string& call_id);
    core::errors::Result<CallState> mark_failed(const std::string& call_id,
                                                const std::string& reason);

    // Drops a terminal record once its response has been delivered.
    core::errors::Result<CallState> release_call(const std::string& call_id);

    std::size_t call_count() const;
    std::size_t active_count() const;

private:
    core::errors::Result<CallState> transition_to_terminal(
        const std::string& call_id, CallState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(CallState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CallRecord> calls_;
};

}  // namespace gatehouse::session
