#include "session/call_manager.hpp"
#include <utility>
#include "core/logging/logger.hpp"

namespace gatehouse::session {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;

std::string to_string(const CallState state) {
    switch (state) {
        case CallState::Created:
            return "created";
        case CallState::Running:
            return "running";
        case CallState::Completed:
            return "completed";
        case CallState::Failed:
            return "failed";
        case CallState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

bool CallManager::is_terminal(const CallState state) {
    return state == CallState::Completed || state == CallState::Failed ||
           state == CallState::Cancelled;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> CallManager::start_call(
    const std::string& call_id, const std::string& tool_name) {
    if (call_id.empty()) {
        return GatehouseError{ErrorCategory::Input, "Call ID cannot be empty.",
                              "invalid_call_id"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(call_id);
    if (it != calls_.end()) {
        if (!is_terminal(it->second.state)) {
            return GatehouseError{ErrorCategory::Input,
                                  "Call ID already in flight: " + call_id,
                                  "duplicate_call_id"};
        }
        calls_.erase(it);
    }

    CallRecord record;
    record.call_id = call_id;
    record.tool_name = tool_name;
    record.state = CallState::Running;
    record.cancel_token = std::make_shared<std::atomic_bool>(false);
    auto token = record.cancel_token;
    calls_.emplace(call_id, std::move(record));
    GATEHOUSE_LOG_DEBUG("CallManager: call " + call_id + " (" + tool_name +
                        ") transition created -> running");
    return token;
}

core::errors::Result<CallState> CallManager::cancel_call(const std::string& call_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(call_id);
        if (it != calls_.end() && !is_terminal(it->second.state) &&
            it->second.cancel_token) {
            it->second.cancel_token->store(true);
        }
    }
    return transition_to_terminal(call_id, CallState::Cancelled, std::nullopt);
}

core::errors::Result<CallState> CallManager::mark_completed(const std::string& call_id) {
    return transition_to_terminal(call_id, CallState::Completed, std::nullopt);
}

core::errors::Result<CallState> CallManager::mark_failed(const std::string& call_id,
                                                         const std::string& reason) {
    return transition_to_terminal(call_id, CallState::Failed, reason);
}

core::errors::Result<CallState> CallManager::transition_to_terminal(
    const std::string& call_id, const CallState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(call_id);
    if (it == calls_.end()) {
        return GatehouseError{ErrorCategory::Input, "Call ID not found: " + call_id,
                              "call_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return GatehouseError{ErrorCategory::Input,
                              "Call is already terminal: " + to_string(it->second.state),
                              "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    GATEHOUSE_LOG_DEBUG("CallManager: call " + call_id + " transition " + prev + " -> " +
                        to_string(next_state));
    return it->second.state;
}

core::errors::Result<CallState> CallManager::release_call(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(call_id);
    if (it == calls_.end()) {
        return GatehouseError{ErrorCategory::Input, "Call ID not found: " + call_id,
                              "call_not_found"};
    }
    if (!is_terminal(it->second.state)) {
        return GatehouseError{ErrorCategory::Input,
                              "Call is still " + to_string(it->second.state) + ": " + call_id,
                              "invalid_state_transition"};
    }
    const CallState final_state = it->second.state;
    calls_.erase(it);
    return final_state;
}

core::errors::Result<CallState> CallManager::get_state(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(call_id);
    if (it == calls_.end()) {
        return GatehouseError{ErrorCategory::Input, "Call ID not found: " + call_id,
                              "call_not_found"};
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> CallManager::get_cancel_token(
    const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(call_id);
    if (it == calls_.end()) {
        return GatehouseError{ErrorCategory::Input, "Call ID not found: " + call_id,
                              "call_not_found"};
    }
    return it->second.cancel_token;
}

std::size_t CallManager::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

std::size_t CallManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t active = 0;
    for (const auto& [id, record] : calls_) {
        if (!is_terminal(record.state)) {
            ++active;
        }
    }
    return active;
}

}  // namespace gatehouse::session
