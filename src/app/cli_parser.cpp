#include "cli_parser.hpp"
#include <vector>

namespace gatehouse::app::cli {

    using namespace gatehouse::core::errors;

    namespace {

        Result<Command> parse_command(const std::string& name) {
            if (name == "serve") return Command::Serve;
            if (name == "config") return Command::Config;
            if (name == "check-path") return Command::CheckPath;
            if (name == "check-command") return Command::CheckCommand;
            return GatehouseError{ErrorCategory::Input, "Unknown command: " + name, "unknown_command", kUsage};
        }

    } // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GatehouseError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        auto command = parse_command(argv[1]);
        if (is_error(command)) {
            return get_error(command);
        }

        CliOptions options;
        options.command = get_value(command);

        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // skip program name and command
            args.push_back(argv[i]);
        }

        // 1. Parser phase: flags with values, switches, and one positional operand
        std::vector<std::string> operands;
        for (size_t i = 0; i < args.size(); ++i) {
            auto take_value = [&](std::optional<std::string>& slot) -> bool {
                if (i + 1 >= args.size()) return false;
                slot = args[++i];
                return true;
            };

            if (args[i] == "--config") {
                if (!take_value(options.config_file))
                    return GatehouseError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--base-path") {
                if (!take_value(options.base_path))
                    return GatehouseError{ErrorCategory::Input, "Missing value for --base-path", "missing_value"};
            } else if (args[i] == "--allowed-dir") {
                if (!take_value(options.allowed_dir))
                    return GatehouseError{ErrorCategory::Input, "Missing value for --allowed-dir", "missing_value"};
            } else if (args[i] == "--allowed-command") {
                if (!take_value(options.allowed_command))
                    return GatehouseError{ErrorCategory::Input, "Missing value for --allowed-command", "missing_value"};
            } else if (args[i] == "--debug") {
                options.debug = true;
            } else if (args[i] == "--init") {
                options.init = true;
            } else if (args[i] == "--") {
                for (++i; i < args.size(); ++i) operands.push_back(args[i]);
            } else if (args[i].rfind("--", 0) == 0) {
                return GatehouseError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            } else {
                operands.push_back(args[i]);
            }
        }

        // 2. Validator phase
        const bool takes_operand =
            options.command == Command::CheckPath || options.command == Command::CheckCommand;
        if (takes_operand) {
            if (operands.size() != 1) {
                return GatehouseError{ErrorCategory::Input,
                                      std::string(argv[1]) + " expects exactly one argument",
                                      "missing_required_argument",
                                      "Quote command lines: gatehouse check-command \"ls | grep x\""};
            }
            options.target = operands.front();
        } else if (!operands.empty()) {
            return GatehouseError{ErrorCategory::Input, "Unexpected argument: " + operands.front(), "unknown_argument", kUsage};
        }

        if (options.init && options.command != Command::Config) {
            return GatehouseError{ErrorCategory::Input, "--init is only valid with the config command", "conflicting_flags"};
        }

        for (const auto* value : {&options.config_file, &options.base_path}) {
            if (value->has_value() && value->value().empty()) {
                return GatehouseError{ErrorCategory::Input, "Path flags cannot be empty", "invalid_path"};
            }
        }

        return options;
    }

} // namespace gatehouse::app::cli
