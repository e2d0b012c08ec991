#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>
#include "app/cli_parser.hpp"
#include "app/service_context.hpp"
#include "core/config/service_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/gatehouse_errors.hpp"
#include "core/logging/logger.hpp"
#include "server/stdio_server.hpp"
#include "session/audit_writer.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRejected = 1;
constexpr int kExitInputError = 2;
constexpr int kExitConfigError = 3;

int report(const gatehouse::core::errors::GatehouseError& err, const std::string& what,
           int exit_code) {
    GATEHOUSE_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        GATEHOUSE_LOG_INFO("Hint: " + err.hint);
    }
    return exit_code;
}

int run_config(const gatehouse::core::config::ServiceConfig& config, bool init) {
    const auto document = gatehouse::core::config::config_to_json(config);
    std::cout << document.dump(2) << std::endl;
    if (!init) {
        return kExitOk;
    }

    std::error_code ec;
    if (std::filesystem::exists(config.config_file, ec)) {
        GATEHOUSE_LOG_INFO("Config file already exists, leaving it untouched: " +
                           config.config_file.string());
        return kExitOk;
    }
    std::filesystem::create_directories(config.config_file.parent_path(), ec);
    std::ofstream out(config.config_file);
    if (ec || !out.is_open()) {
        GATEHOUSE_LOG_ERROR("Unable to create config file: " + config.config_file.string());
        return kExitConfigError;
    }
    auto on_disk = document;
    on_disk.erase("config_file");
    out << on_disk.dump(2) << "\n";
    if (!out.good()) {
        GATEHOUSE_LOG_ERROR("Unable to write config file: " + config.config_file.string());
        return kExitConfigError;
    }
    GATEHOUSE_LOG_INFO("Wrote " + config.config_file.string());
    return kExitOk;
}

int run_check_path(const gatehouse::app::ServiceContext& context, const std::string& path) {
    auto decision = context.path_guard().validate(path);
    if (gatehouse::core::errors::is_error(decision)) {
        const auto err =
            gatehouse::policy::to_error(gatehouse::core::errors::get_error(decision));
        GATEHOUSE_LOG_WARN("Refused [" + err.code + "]: " + err.message);
        std::cout << "rejected: " << err.message << std::endl;
        if (!err.hint.empty()) {
            std::cout << "hint: " << err.hint << std::endl;
        }
        return kExitRejected;
    }
    std::cout << "approved: " << gatehouse::core::errors::get_value(decision).string()
              << std::endl;
    return kExitOk;
}

int run_check_command(const gatehouse::app::ServiceContext& context, const std::string& line) {
    auto decision = context.command_guard().validate(line);
    if (gatehouse::core::errors::is_error(decision)) {
        const auto err =
            gatehouse::policy::to_error(gatehouse::core::errors::get_error(decision));
        GATEHOUSE_LOG_WARN("Refused [" + err.code + "]: " + err.message);
        std::cout << "rejected: " << err.message << std::endl;
        if (!err.hint.empty()) {
            std::cout << "hint: " << err.hint << std::endl;
        }
        return kExitRejected;
    }
    std::cout << "approved: " << gatehouse::core::errors::get_value(decision) << std::endl;
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Session ID tags every log line and names the audit file
    const std::string session_id = gatehouse::core::config::generate_session_id();
    auto& logger = gatehouse::core::logging::Logger::get();
    logger.set_session_id(session_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = gatehouse::app::cli::parse_and_validate(argc, argv);
    if (gatehouse::core::errors::is_error(parsed)) {
        return report(gatehouse::core::errors::get_error(parsed), "Input error",
                      kExitInputError);
    }
    const auto& options = gatehouse::core::errors::get_value(parsed);
    using gatehouse::app::cli::Command;

    // 3. Defaults, config file, then flags
    std::vector<std::string> ignored_keys;
    auto resolved = gatehouse::app::resolve_config(options, &ignored_keys);
    if (gatehouse::core::errors::is_error(resolved)) {
        return report(gatehouse::core::errors::get_error(resolved), "Config error",
                      kExitConfigError);
    }
    const auto& config = gatehouse::core::errors::get_value(resolved);

    if (config.debug) {
        logger.set_min_level(gatehouse::core::logging::LogLevel::DEBUG);
    }
    if (options.command == Command::Serve) {
        const auto log_file = config.base_path / "logs" / "gatehouse.log";
        if (!logger.set_log_file(log_file)) {
            GATEHOUSE_LOG_WARN("Unable to open log file: " + log_file.string());
        }
    }
    for (const auto& key : ignored_keys) {
        GATEHOUSE_LOG_WARN("Ignoring unknown config key: " + key);
    }
    GATEHOUSE_LOG_DEBUG("Config file: " + config.config_file.string());

    if (options.command == Command::Config) {
        return run_config(config, options.init);
    }

    // 4. Allowlists, guards and tools
    auto built = gatehouse::app::ServiceContext::build(config);
    if (gatehouse::core::errors::is_error(built)) {
        return report(gatehouse::core::errors::get_error(built), "Config error",
                      kExitConfigError);
    }
    const auto& context = gatehouse::core::errors::get_value(built);

    if (options.command == Command::CheckPath) {
        return run_check_path(context, options.target);
    }
    if (options.command == Command::CheckCommand) {
        return run_check_command(context, options.target);
    }

    // 5. Serve until stdin closes
    gatehouse::session::AuditWriter audit(config.base_path / "audit", session_id);
    auto audit_path = audit.log_path();
    if (gatehouse::core::errors::is_error(audit_path)) {
        const auto& err = gatehouse::core::errors::get_error(audit_path);
        GATEHOUSE_LOG_WARN("Audit log unavailable [" + err.code + "]: " + err.message);
    } else {
        GATEHOUSE_LOG_INFO("Audit log: " +
                           gatehouse::core::errors::get_value(audit_path).string());
    }

    gatehouse::server::StdioServer server(context, audit, std::cin, std::cout);
    const auto requests = server.run();
    GATEHOUSE_LOG_INFO("Session finished after " + std::to_string(requests) + " requests");
    return kExitOk;
}
