#pragma once

#include <string>
#include <vector>
#include "core/errors/gatehouse_errors.hpp"
#include "policy/allowlist_store.hpp"

namespace gatehouse::policy {

enum class CommandRejectionKind {
    NotAllowed,
    EmptyCommand,
    UnsupportedSyntax
};

struct CommandRejection {
    CommandRejectionKind kind;
    // The offending sub-command (or the whole line for syntax errors).
    std::string segment;
    std::string detail;
};

// Approved value is the trimmed command line that should be executed.
using CommandDecision = core::errors::Result<std::string, CommandRejection>;

// One sub-command of a compound line, as words after quote removal.
struct SubCommand {
    std::vector<std::string> words;
    // Operator that ended this sub-command; empty for the last one.
    std::string terminator;
};

std::string to_string(CommandRejectionKind kind);
std::string rejection_code(CommandRejectionKind kind);
core::errors::GatehouseError to_error(const CommandRejection& rejection);

std::string join_words(const std::vector<std::string>& words);

class CommandGuard {
public:
    explicit CommandGuard(AllowedCommandPrefixes allowed);

    // Approved only when every sub-command between |, ||, |&, &, &&, ; and
    // newline starts with an allowed prefix.
    CommandDecision validate(const std::string& command_line) const;

    // Splits a line into its sub-commands without consulting the allowlist.
    static core::errors::Result<std::vector<SubCommand>, CommandRejection> split(
        const std::string& command_line);

private:
    AllowedCommandPrefixes allowed_;
};

}  // namespace gatehouse::policy
