#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/gatehouse_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/command_tools.hpp"
#include "tools/filesystem_tools.hpp"

namespace gatehouse::tools {

// Routes a ToolCall to its handler after pulling typed arguments out of the
// untrusted JSON object.
class ToolDispatcher {
public:
    ToolDispatcher(FilesystemTools filesystem, CommandTools commands);

    std::vector<protocol::ToolDescriptor> list_tools() const;

    core::errors::Result<protocol::ToolResult> dispatch(
        const protocol::ToolCall& call,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

    core::errors::Result<protocol::ToolResult> read_resource(const std::string& uri) const;

private:
    core::errors::Result<protocol::ToolResult> dispatch_by_name(
        const protocol::ToolCall& call,
        const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    FilesystemTools filesystem_;
    CommandTools commands_;
};

}  // namespace gatehouse::tools
