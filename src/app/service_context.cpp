#include "app/service_context.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace gatehouse::app {

using core::config::ServiceConfig;
using core::errors::ErrorCategory;
using core::errors::GatehouseError;

core::errors::Result<ServiceConfig> resolve_config(const cli::CliOptions& options,
                                                   std::vector<std::string>* ignored_keys) {
    const std::filesystem::path base =
        options.base_path.has_value() ? std::filesystem::path(*options.base_path)
                                      : core::config::default_base_path();
    ServiceConfig config = core::config::make_default_config(base);
    if (options.config_file.has_value()) {
        config.config_file = *options.config_file;
    }

    const std::string default_data_dir = config.filesystem.allowed_dir;
    auto loaded = core::config::load_config_file(std::move(config), ignored_keys);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    config = core::errors::get_value(loaded);

    if (options.base_path.has_value()) {
        config.base_path = *options.base_path;
    }
    // A base_path from the file moves the default data directory with it.
    if (config.filesystem.allowed_dir == default_data_dir) {
        config.filesystem.allowed_dir = (config.base_path / "data").string();
    }
    if (options.allowed_dir.has_value()) {
        config.filesystem.allowed_dir = *options.allowed_dir;
    }
    if (options.allowed_command.has_value()) {
        config.command.allowed_command = *options.allowed_command;
    }
    if (options.debug) {
        config.debug = true;
    }
    return config;
}

ServiceContext::ServiceContext(ServiceConfig config, policy::AllowlistStore allowlists,
                               tools::PromptCatalog prompts)
    : config_(std::move(config)),
      allowlists_(std::move(allowlists)),
      path_guard_(allowlists_.roots),
      command_guard_(allowlists_.commands),
      dispatcher_(tools::FilesystemTools(path_guard_),
                  tools::CommandTools(command_guard_, path_guard_, config_.command.timeout_ms)),
      prompts_(std::move(prompts)) {}

core::errors::Result<ServiceContext> ServiceContext::build(const ServiceConfig& config) {
    const auto default_data_dir = config.base_path / "data";
    if (config.filesystem.allowed_dir == default_data_dir.string()) {
        std::error_code ec;
        std::filesystem::create_directories(default_data_dir, ec);
        if (ec) {
            return GatehouseError{ErrorCategory::Config,
                                  "Unable to create data directory: " +
                                      default_data_dir.string() + ": " + ec.message(),
                                  "data_dir_create_failed"};
        }
    }

    auto allowlists = policy::AllowlistStore::build(config.filesystem.allowed_dir,
                                                    config.command.allowed_command);
    if (core::errors::is_error(allowlists)) {
        return core::errors::get_error(allowlists);
    }
    const auto& store = core::errors::get_value(allowlists);
    if (store.roots.empty()) {
        GATEHOUSE_LOG_WARN(
            "No allowed directories configured; every filesystem request will be refused. "
            "Hint: set filesystem.allowed_dir or pass --allowed-dir.");
    }
    for (const auto& root : store.roots.separator_terminated()) {
        GATEHOUSE_LOG_INFO("Allowed directory: " + root);
    }
    GATEHOUSE_LOG_INFO("Allowed command prefixes: " + std::to_string(store.commands.size()));

    auto prompts = tools::PromptCatalog::from_config(config);
    if (core::errors::is_error(prompts)) {
        return core::errors::get_error(prompts);
    }

    return ServiceContext(config, store, core::errors::get_value(prompts));
}

}  // namespace gatehouse::app
