#pragma once

#include <map>
#include <string>
#include <vector>
#include "core/config/service_config.hpp"
#include "core/errors/gatehouse_errors.hpp"

namespace gatehouse::tools {

inline constexpr const char* kFilesystemPromptName = "filesystem_prompt";
inline constexpr const char* kCommandPromptName = "command_prompt";

// e.g. "Linux 6.1.0 x86_64"
std::string system_info();

class PromptCatalog {
public:
    // Default texts, replaced by the contents of any configured prompt_file.
    // An unreadable prompt_file is a configuration error.
    static core::errors::Result<PromptCatalog> from_config(
        const core::config::ServiceConfig& config);

    core::errors::Result<std::string> get(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    std::map<std::string, std::string> prompts_;
};

}  // namespace gatehouse::tools
