#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/gatehouse_errors.hpp"
#include "policy/command_guard.hpp"
#include "policy/path_guard.hpp"
#include "protocol/tool_contract.hpp"

namespace gatehouse::tools {

struct CommandRequest {
    std::string command;
    // Validated through the PathGuard when set; otherwise the command runs in
    // the service's working directory.
    std::optional<std::string> working_directory;
    std::optional<std::uint32_t> timeout_ms;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

class CommandTools {
public:
    CommandTools(policy::CommandGuard command_guard, policy::PathGuard path_guard,
                 std::uint32_t default_timeout_ms);

    // Nothing is spawned unless the CommandGuard approves every sub-command.
    core::errors::Result<protocol::ToolResult> execute_command(
        const CommandRequest& request) const;

private:
    policy::CommandGuard command_guard_;
    policy::PathGuard path_guard_;
    std::uint32_t default_timeout_ms_;
};

}  // namespace gatehouse::tools
