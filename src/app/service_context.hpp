#pragma once

#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/service_config.hpp"
#include "core/errors/gatehouse_errors.hpp"
#include "policy/allowlist_store.hpp"
#include "policy/command_guard.hpp"
#include "policy/path_guard.hpp"
#include "tools/prompt_catalog.hpp"
#include "tools/tool_dispatcher.hpp"

namespace gatehouse::app {

// Defaults for the chosen base path, then the config file, then CLI flags.
// Unknown config keys are appended to `ignored_keys`.
core::errors::Result<core::config::ServiceConfig> resolve_config(
    const cli::CliOptions& options, std::vector<std::string>* ignored_keys = nullptr);

// Everything built from the configuration once at startup. The guards hold
// value copies of the allowlists, so the context can be shared read-only by
// every worker.
class ServiceContext {
public:
    static core::errors::Result<ServiceContext> build(const core::config::ServiceConfig& config);

    const core::config::ServiceConfig& config() const { return config_; }
    const policy::AllowlistStore& allowlists() const { return allowlists_; }
    const policy::PathGuard& path_guard() const { return path_guard_; }
    const policy::CommandGuard& command_guard() const { return command_guard_; }
    const tools::ToolDispatcher& dispatcher() const { return dispatcher_; }
    const tools::PromptCatalog& prompts() const { return prompts_; }

private:
    ServiceContext(core::config::ServiceConfig config, policy::AllowlistStore allowlists,
                   tools::PromptCatalog prompts);

    core::config::ServiceConfig config_;
    policy::AllowlistStore allowlists_;
    policy::PathGuard path_guard_;
    policy::CommandGuard command_guard_;
    tools::ToolDispatcher dispatcher_;
    tools::PromptCatalog prompts_;
};

}  // namespace gatehouse::app
