#include "core/config/service_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace gatehouse::core::config {

using errors::ErrorCategory;
using errors::GatehouseError;
using nlohmann::json;

const std::vector<std::string> kDefaultAllowedCommands = {
    "ls",        "cat",      "echo",   "pwd",      "head",         "tail",
    "grep",      "find",     "stat",   "df",       "du",           "free",
    "top",       "ps",       "uptime", "who",      "w",            "last",
    "uname",     "hostname", "ifconfig", "netstat", "ping",        "traceroute",
    "route",     "ip",       "ss",     "lsof",     "vmstat",       "iostat",
    "mpstat",    "sar",      "cut",    "sort",     "uniq",         "wc",
    "awk",       "sed",      "diff",   "cmp",      "comm",         "file",
    "basename",  "dirname",  "chmod",  "chown",    "curl",         "nslookup",
    "dig",       "host",     "ssh",    "scp",      "sftp",         "ftp",
    "wget",      "tar",      "gzip",   "scutil",   "networksetup", "git",
    "cd"};

namespace {

GatehouseError type_error(const std::string& key, const std::string& expected) {
    return GatehouseError{ErrorCategory::Config,
                          "Config key '" + key + "' must be " + expected + ".",
                          "invalid_config_type"};
}

std::string join(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined.push_back(',');
        }
        joined += item;
    }
    return joined;
}

// Accepts either "a,b,c" or ["a","b","c"] for list-valued keys.
bool read_list(const json& value, std::string& out) {
    if (value.is_string()) {
        out = value.get<std::string>();
        return true;
    }
    if (!value.is_array()) {
        return false;
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return false;
        }
        items.push_back(item.get<std::string>());
    }
    out = join(items);
    return true;
}

}  // namespace

std::filesystem::path default_base_path() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return std::filesystem::path(home) / ".gatehouse";
    }
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    return (ec ? std::filesystem::path(".") : cwd) / ".gatehouse";
}

ServiceConfig make_default_config(const std::filesystem::path& base_path) {
    ServiceConfig config;
    config.base_path = base_path;
    config.config_file = base_path / "config" / "config.json";
    config.filesystem.allowed_dir = (base_path / "data").string();
    config.command.allowed_command = join(kDefaultAllowedCommands);
    return config;
}

errors::Result<ServiceConfig> merge_config_json(ServiceConfig config,
                                                const json& document,
                                                std::vector<std::string>* ignored_keys) {
    if (!document.is_object()) {
        return GatehouseError{ErrorCategory::Config,
                              "Configuration root must be a JSON object.",
                              "invalid_config"};
    }

    auto ignore = [ignored_keys](const std::string& key) {
        if (ignored_keys != nullptr) {
            ignored_keys->push_back(key);
        }
    };

    for (const auto& [key, value] : document.items()) {
        if (key == "base_path") {
            if (!value.is_string()) {
                return type_error(key, "a string");
            }
            config.base_path = value.get<std::string>();
        } else if (key == "debug") {
            if (!value.is_boolean()) {
                return type_error(key, "a boolean");
            }
            config.debug = value.get<bool>();
        } else if (key == "filesystem") {
            if (!value.is_object()) {
                return type_error(key, "an object");
            }
            for (const auto& [fs_key, fs_value] : value.items()) {
                const std::string qualified = "filesystem." + fs_key;
                if (fs_key == "allowed_dir") {
                    if (!read_list(fs_value, config.filesystem.allowed_dir)) {
                        return type_error(qualified, "a string or string array");
                    }
                } else if (fs_key == "prompt_file") {
                    if (!fs_value.is_string()) {
                        return type_error(qualified, "a string");
                    }
                    config.filesystem.prompt_file = fs_value.get<std::string>();
                } else {
                    ignore(qualified);
                }
            }
        } else if (key == "command") {
            if (!value.is_object()) {
                return type_error(key, "an object");
            }
            for (const auto& [cmd_key, cmd_value] : value.items()) {
                const std::string qualified = "command." + cmd_key;
                if (cmd_key == "allowed_command") {
                    if (!read_list(cmd_value, config.command.allowed_command)) {
                        return type_error(qualified, "a string or string array");
                    }
                } else if (cmd_key == "prompt_file") {
                    if (!cmd_value.is_string()) {
                        return type_error(qualified, "a string");
                    }
                    config.command.prompt_file = cmd_value.get<std::string>();
                } else if (cmd_key == "timeout_ms") {
                    if (!cmd_value.is_number_unsigned() ||
                        cmd_value.get<std::uint64_t>() > 3600000) {
                        return type_error(qualified, "an integer between 0 and 3600000");
                    }
                    config.command.timeout_ms =
                        static_cast<std::uint32_t>(cmd_value.get<std::uint64_t>());
                } else {
                    ignore(qualified);
                }
            }
        } else {
            ignore(key);
        }
    }

    return config;
}

errors::Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return GatehouseError{ErrorCategory::Config,
                              "Failed to open file: " + path.string(),
                              "file_unreadable"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return GatehouseError{ErrorCategory::Config,
                              "I/O error while reading file: " + path.string(),
                              "file_unreadable"};
    }
    return buffer.str();
}

errors::Result<ServiceConfig> load_config_file(ServiceConfig config,
                                               std::vector<std::string>* ignored_keys) {
    std::error_code ec;
    if (!std::filesystem::exists(config.config_file, ec) || ec) {
        return config;
    }

    auto text = read_text_file(config.config_file);
    if (errors::is_error(text)) {
        return errors::get_error(text);
    }

    const json document = json::parse(errors::get_value(text), nullptr, false);
    if (document.is_discarded()) {
        return GatehouseError{ErrorCategory::Config,
                              "Configuration file is not valid JSON: " +
                                  config.config_file.string(),
                              "invalid_config"};
    }

    const auto config_file = config.config_file;
    auto merged = merge_config_json(std::move(config), document, ignored_keys);
    if (errors::is_error(merged)) {
        auto error = errors::get_error(merged);
        error.message += " (" + config_file.string() + ")";
        return error;
    }
    return merged;
}

json config_to_json(const ServiceConfig& config) {
    json document;
    document["base_path"] = config.base_path.string();
    document["config_file"] = config.config_file.string();
    document["debug"] = config.debug;
    document["filesystem"] = {{"allowed_dir", config.filesystem.allowed_dir},
                              {"prompt_file", config.filesystem.prompt_file}};
    document["command"] = {{"allowed_command", config.command.allowed_command},
                           {"prompt_file", config.command.prompt_file},
                           {"timeout_ms", config.command.timeout_ms}};
    return document;
}

}  // namespace gatehouse::core::config
