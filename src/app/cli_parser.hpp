#pragma once
#include <optional>
#include <string>
#include "core/errors/gatehouse_errors.hpp"

namespace gatehouse::app::cli {

    enum class Command {
        Serve,
        Config,
        CheckPath,
        CheckCommand
    };

    struct CliOptions {
        Command command = Command::Serve;
        std::optional<std::string> config_file;
        std::optional<std::string> base_path;
        std::optional<std::string> allowed_dir;
        std::optional<std::string> allowed_command;
        bool debug = false;
        bool init = false;             // config only
        std::string target;            // check-path / check-command operand
    };

    inline constexpr const char* kUsage =
        "Usage: gatehouse <serve|config|check-path <path>|check-command <line>> "
        "[--config <file>] [--base-path <dir>] [--allowed-dir <list>] "
        "[--allowed-command <list>] [--debug] [--init]";

    gatehouse::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
