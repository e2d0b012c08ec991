#include "tools/prompt_catalog.hpp"

#include <sys/utsname.h>
#include <utility>

namespace gatehouse::tools {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;

namespace {

constexpr const char* kDefaultFilesystemPrompt = R"(
You manage files on the local machine through the filesystem tools. You can:

1. Browse directories (list_directory) and look up metadata (get_file_info).
2. Read and write text files (read_file, write_file).
3. Create directories and move or rename entries (create_directory, move_file).
4. Search recursively for files by name (search_files).

Only the directories reported by list_allowed_directories are reachable.
Requests outside them are refused; do not retry them with other spellings.
Confirm destructive changes before making them and report each result.
)";

constexpr const char* kDefaultCommandPrompt = R"(
You run command-line programs on %s through the execute_command tool.
Only allowlisted programs may start a command or any part of a pipeline;
redirections, subshells and command substitution are refused.

Before each command state what it does, its arguments and the output you
expect. Ask before anything destructive and report success or failure with
the relevant output.
)";

std::string format_system_info(const std::string& templ, const std::string& info) {
    const auto marker = templ.find("%s");
    if (marker == std::string::npos) {
        return templ;
    }
    return templ.substr(0, marker) + info + templ.substr(marker + 2);
}

core::errors::Result<std::string> load_override(const std::string& prompt_file,
                                                const std::string& fallback) {
    if (prompt_file.empty()) {
        return fallback;
    }
    auto text = core::config::read_text_file(prompt_file);
    if (core::errors::is_error(text)) {
        auto error = core::errors::get_error(text);
        error.code = "prompt_file_unreadable";
        error.message = "Failed to read prompt file: " + prompt_file;
        return error;
    }
    return core::errors::get_value(text);
}

}  // namespace

std::string system_info() {
    struct utsname name {};
    if (uname(&name) != 0) {
        return "unknown system";
    }
    return std::string(name.sysname) + " " + name.release + " " + name.machine;
}

core::errors::Result<PromptCatalog> PromptCatalog::from_config(
    const core::config::ServiceConfig& config) {
    PromptCatalog catalog;

    auto filesystem_prompt =
        load_override(config.filesystem.prompt_file, kDefaultFilesystemPrompt);
    if (core::errors::is_error(filesystem_prompt)) {
        return core::errors::get_error(filesystem_prompt);
    }
    catalog.prompts_[kFilesystemPromptName] = core::errors::get_value(filesystem_prompt);

    auto command_prompt = load_override(config.command.prompt_file, kDefaultCommandPrompt);
    if (core::errors::is_error(command_prompt)) {
        return core::errors::get_error(command_prompt);
    }
    catalog.prompts_[kCommandPromptName] =
        format_system_info(core::errors::get_value(command_prompt), system_info());

    return catalog;
}

core::errors::Result<std::string> PromptCatalog::get(const std::string& name) const {
    const auto it = prompts_.find(name);
    if (it == prompts_.end()) {
        return GatehouseError{ErrorCategory::Input, "Unknown prompt: " + name,
                              "unknown_prompt"};
    }
    return it->second;
}

std::vector<std::string> PromptCatalog::names() const {
    std::vector<std::string> names;
    names.reserve(prompts_.size());
    for (const auto& entry : prompts_) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace gatehouse::tools
