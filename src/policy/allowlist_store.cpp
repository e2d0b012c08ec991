#include "policy/allowlist_store.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <utility>

namespace gatehouse::policy {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;

namespace {

std::vector<std::string> split_words(const std::string& value) {
    std::istringstream in(value);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

// Path components with any trailing empty element dropped, so "/a/b/" and
// "/a/b" compare equal.
std::vector<std::filesystem::path> components(const std::filesystem::path& path) {
    std::vector<std::filesystem::path> parts;
    for (const auto& part : path) {
        if (part.empty()) {
            continue;
        }
        parts.push_back(part);
    }
    return parts;
}

}  // namespace

std::string trim(const std::string& value) {
    const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

std::vector<std::string> split_list(const std::string& value, const char delimiter) {
    std::vector<std::string> items;
    std::string current;
    std::istringstream in(value);
    while (std::getline(in, current, delimiter)) {
        items.push_back(trim(current));
    }
    return items;
}

AllowedRoots::AllowedRoots(std::vector<std::filesystem::path> roots)
    : roots_(std::move(roots)) {}

core::errors::Result<AllowedRoots> AllowedRoots::from_config(
    const std::string& allowed_dir) {
    std::vector<std::filesystem::path> directories;
    for (const auto& entry : split_list(allowed_dir)) {
        if (entry.empty()) {
            continue;
        }
        directories.emplace_back(entry);
    }
    return from_paths(directories);
}

core::errors::Result<AllowedRoots> AllowedRoots::from_paths(
    const std::vector<std::filesystem::path>& directories) {
    std::vector<std::filesystem::path> normalized;
    normalized.reserve(directories.size());

    for (const auto& directory : directories) {
        std::error_code ec;
        std::filesystem::path absolute = std::filesystem::absolute(directory, ec);
        if (ec) {
            return GatehouseError{ErrorCategory::Config,
                                  "Failed to resolve allowed directory: " +
                                      directory.string(),
                                  "invalid_allowed_dir"};
        }

        if (!std::filesystem::exists(absolute, ec) || ec) {
            return GatehouseError{ErrorCategory::Config,
                                  "Allowed directory does not exist: " +
                                      absolute.string(),
                                  "invalid_allowed_dir",
                                  "Create the directory or remove it from allowed_dir."};
        }
        if (!std::filesystem::is_directory(absolute, ec) || ec) {
            return GatehouseError{ErrorCategory::Config,
                                  "Allowed path is not a directory: " +
                                      absolute.string(),
                                  "invalid_allowed_dir"};
        }

        std::filesystem::path canonical = std::filesystem::canonical(absolute, ec);
        if (ec) {
            return GatehouseError{ErrorCategory::Config,
                                  "Unable to canonicalize allowed directory: " +
                                      absolute.string(),
                                  "invalid_allowed_dir"};
        }

        if (std::find(normalized.begin(), normalized.end(), canonical) ==
            normalized.end()) {
            normalized.push_back(std::move(canonical));
        }
    }

    return AllowedRoots(std::move(normalized));
}

bool AllowedRoots::contains(const std::filesystem::path& candidate) const {
    const auto candidate_parts = components(candidate);
    for (const auto& root : roots_) {
        const auto root_parts = components(root);
        if (root_parts.size() > candidate_parts.size()) {
            continue;
        }
        if (std::equal(root_parts.begin(), root_parts.end(), candidate_parts.begin())) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> AllowedRoots::separator_terminated() const {
    std::vector<std::string> rendered;
    rendered.reserve(roots_.size());
    for (const auto& root : roots_) {
        std::string text = root.string();
        if (text.empty() || text.back() != std::filesystem::path::preferred_separator) {
            text.push_back(std::filesystem::path::preferred_separator);
        }
        rendered.push_back(std::move(text));
    }
    return rendered;
}

core::errors::Result<AllowedCommandPrefixes> AllowedCommandPrefixes::from_config(
    const std::string& allowed_command) {
    return from_list(split_list(allowed_command));
}

core::errors::Result<AllowedCommandPrefixes> AllowedCommandPrefixes::from_list(
    const std::vector<std::string>& prefixes) {
    AllowedCommandPrefixes allowed;
    for (const auto& prefix : prefixes) {
        auto words = split_words(prefix);
        if (words.empty()) {
            continue;
        }
        if (std::find(allowed.prefix_words_.begin(), allowed.prefix_words_.end(), words) !=
            allowed.prefix_words_.end()) {
            continue;
        }

        std::string normalized;
        for (const auto& word : words) {
            if (!normalized.empty()) {
                normalized.push_back(' ');
            }
            normalized += word;
        }
        allowed.prefixes_.push_back(std::move(normalized));
        allowed.prefix_words_.push_back(std::move(words));
    }

    if (allowed.prefixes_.empty()) {
        return GatehouseError{ErrorCategory::Config, "No allowed commands specified.",
                              "empty_command_allowlist",
                              "Set command.allowed_command to a comma-separated list, "
                              "e.g. \"ls,cat,grep\"."};
    }
    return allowed;
}

bool AllowedCommandPrefixes::matches(const std::vector<std::string>& words) const {
    for (const auto& prefix : prefix_words_) {
        if (prefix.size() > words.size()) {
            continue;
        }
        if (std::equal(prefix.begin(), prefix.end(), words.begin())) {
            return true;
        }
    }
    return false;
}

core::errors::Result<AllowlistStore> AllowlistStore::build(
    const std::string& allowed_dir, const std::string& allowed_command) {
    auto roots = AllowedRoots::from_config(allowed_dir);
    if (core::errors::is_error(roots)) {
        return core::errors::get_error(roots);
    }

    auto commands = AllowedCommandPrefixes::from_config(allowed_command);
    if (core::errors::is_error(commands)) {
        return core::errors::get_error(commands);
    }

    return AllowlistStore{core::errors::get_value(roots),
                          core::errors::get_value(commands)};
}

}  // namespace gatehouse::policy
