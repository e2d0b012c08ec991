#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gatehouse_errors.hpp"

namespace gatehouse::core::config {

struct FilesystemConfig {
    std::string allowed_dir;  // comma-separated, e.g. "/tmp,/srv/share"
    std::string prompt_file;
};

struct CommandConfig {
    std::string allowed_command;  // comma-separated, e.g. "ls,cat,echo"
    std::string prompt_file;
    std::uint32_t timeout_ms = 10000;
};

struct ServiceConfig {
    std::filesystem::path base_path;
    std::filesystem::path config_file;
    bool debug = false;
    FilesystemConfig filesystem;
    CommandConfig command;
};

extern const std::vector<std::string> kDefaultAllowedCommands;

// $HOME/.gatehouse, or ./.gatehouse when HOME is unset.
std::filesystem::path default_base_path();

ServiceConfig make_default_config(const std::filesystem::path& base_path);

// Applies the known keys of `document` onto `config`. A known key with the
// wrong type fails; unknown keys are reported through `ignored_keys`.
errors::Result<ServiceConfig> merge_config_json(ServiceConfig config,
                                                const nlohmann::json& document,
                                                std::vector<std::string>* ignored_keys = nullptr);

// Reads and merges `config.config_file`. A missing file leaves `config`
// unchanged; unreadable or malformed files fail.
errors::Result<ServiceConfig> load_config_file(ServiceConfig config,
                                               std::vector<std::string>* ignored_keys = nullptr);

nlohmann::json config_to_json(const ServiceConfig& config);

errors::Result<std::string> read_text_file(const std::filesystem::path& path);

}  // namespace gatehouse::core::config
