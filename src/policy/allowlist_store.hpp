#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/gatehouse_errors.hpp"

namespace gatehouse::policy {

// Canonical directories under which filesystem tools may operate.
// Built once at startup; copies are cheap snapshots shared by value.
class AllowedRoots {
public:
    AllowedRoots() = default;

    // Parses a comma-separated directory list. Blank entries are skipped;
    // every other entry must resolve to an existing directory.
    static core::errors::Result<AllowedRoots> from_config(const std::string& allowed_dir);

    static core::errors::Result<AllowedRoots> from_paths(
        const std::vector<std::filesystem::path>& directories);

    // True when `candidate` equals a root or lies beneath one, compared
    // component by component. `candidate` must already be absolute and
    // lexically normal.
    bool contains(const std::filesystem::path& candidate) const;

    const std::vector<std::filesystem::path>& roots() const { return roots_; }
    bool empty() const { return roots_.empty(); }

    // Roots rendered with a trailing separator, as they are compared.
    std::vector<std::string> separator_terminated() const;

private:
    explicit AllowedRoots(std::vector<std::filesystem::path> roots);

    std::vector<std::filesystem::path> roots_;
};

// Command prefixes, each pre-split into words. A prefix may span several
// words ("git status").
class AllowedCommandPrefixes {
public:
    AllowedCommandPrefixes() = default;

    // Parses a comma-separated prefix list. Blank entries are dropped;
    // fails when nothing usable remains.
    static core::errors::Result<AllowedCommandPrefixes> from_config(
        const std::string& allowed_command);

    static core::errors::Result<AllowedCommandPrefixes> from_list(
        const std::vector<std::string>& prefixes);

    // True when some prefix's words equal the first words of `words`.
    bool matches(const std::vector<std::string>& words) const;

    const std::vector<std::string>& prefixes() const { return prefixes_; }
    std::size_t size() const { return prefixes_.size(); }

private:
    std::vector<std::string> prefixes_;
    std::vector<std::vector<std::string>> prefix_words_;
};

// The immutable policy snapshot handed to the guards.
struct AllowlistStore {
    AllowedRoots roots;
    AllowedCommandPrefixes commands;

    static core::errors::Result<AllowlistStore> build(const std::string& allowed_dir,
                                                      const std::string& allowed_command);
};

std::vector<std::string> split_list(const std::string& value, char delimiter = ',');
std::string trim(const std::string& value);

}  // namespace gatehouse::policy
