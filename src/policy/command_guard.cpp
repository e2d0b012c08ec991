#include "policy/command_guard.hpp"

#include <utility>
#include "policy/shell_lexer.hpp"

namespace gatehouse::policy {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;

namespace {

// A line may end with ";" or a newline; every other operator needs a
// command on both sides.
// Reserved words that open or close a brace group; the group body would run
// without being matched as a sub-command of its own.
bool is_group_word(const ShellToken& token) {
    return !token.quoted && (token.text == "{" || token.text == "}");
}

bool may_terminate_line(const std::string& op) {
    return op == ";" || op == "\n";
}

std::string describe_operator(const std::string& op) {
    return op == "\n" ? "newline" : "'" + op + "'";
}

}  // namespace

std::string to_string(const CommandRejectionKind kind) {
    switch (kind) {
        case CommandRejectionKind::NotAllowed:
            return "NotAllowed";
        case CommandRejectionKind::EmptyCommand:
            return "EmptyCommand";
        case CommandRejectionKind::UnsupportedSyntax:
            return "UnsupportedSyntax";
        default:
            return "Unknown";
    }
}

std::string rejection_code(const CommandRejectionKind kind) {
    switch (kind) {
        case CommandRejectionKind::NotAllowed:
            return "command_not_allowed";
        case CommandRejectionKind::EmptyCommand:
            return "empty_command";
        case CommandRejectionKind::UnsupportedSyntax:
            return "unsupported_command_syntax";
        default:
            return "unknown_command_rejection";
    }
}

GatehouseError to_error(const CommandRejection& rejection) {
    std::string message;
    switch (rejection.kind) {
        case CommandRejectionKind::NotAllowed:
            message = "Command '" + rejection.segment + "' is not allowed";
            break;
        case CommandRejectionKind::EmptyCommand:
            message = "Command is empty";
            break;
        case CommandRejectionKind::UnsupportedSyntax:
            message = "Command uses unsupported shell syntax";
            break;
    }
    if (!rejection.detail.empty()) {
        message += ": " + rejection.detail;
    }

    std::string hint;
    if (rejection.kind == CommandRejectionKind::NotAllowed) {
        hint = "Add the command to command.allowed_command to permit it.";
    }
    return GatehouseError{ErrorCategory::Policy, std::move(message),
                          rejection_code(rejection.kind), std::move(hint)};
}

std::string join_words(const std::vector<std::string>& words) {
    std::string joined;
    for (const auto& word : words) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += word;
    }
    return joined;
}

CommandGuard::CommandGuard(AllowedCommandPrefixes allowed) : allowed_(std::move(allowed)) {}

core::errors::Result<std::vector<SubCommand>, CommandRejection> CommandGuard::split(
    const std::string& command_line) {
    const std::string trimmed = trim(command_line);
    if (trimmed.empty()) {
        return CommandRejection{CommandRejectionKind::EmptyCommand, "", "nothing to run"};
    }

    auto lexed = lex_shell(trimmed);
    if (core::errors::is_error(lexed)) {
        const auto& lex_error = core::errors::get_error(lexed);
        return CommandRejection{CommandRejectionKind::UnsupportedSyntax, trimmed,
                                lex_error.reason + " (at offset " +
                                    std::to_string(lex_error.offset) + ")"};
    }

    std::vector<SubCommand> commands;
    SubCommand current;
    for (const auto& token : core::errors::get_value(lexed)) {
        if (token.kind == ShellToken::Kind::Word) {
            if (current.words.empty() && is_group_word(token)) {
                return CommandRejection{CommandRejectionKind::UnsupportedSyntax, trimmed,
                                        "command groups are not supported"};
            }
            current.words.push_back(token.text);
            continue;
        }
        if (current.words.empty()) {
            return CommandRejection{CommandRejectionKind::EmptyCommand, trimmed,
                                    "missing command before " +
                                        describe_operator(token.text)};
        }
        current.terminator = token.text;
        commands.push_back(std::move(current));
        current = SubCommand{};
    }

    if (!current.words.empty()) {
        commands.push_back(std::move(current));
    } else if (commands.empty()) {
        return CommandRejection{CommandRejectionKind::EmptyCommand, trimmed,
                                "nothing to run"};
    } else if (!may_terminate_line(commands.back().terminator)) {
        return CommandRejection{CommandRejectionKind::EmptyCommand, trimmed,
                                "missing command after " +
                                    describe_operator(commands.back().terminator)};
    }

    return commands;
}

CommandDecision CommandGuard::validate(const std::string& command_line) const {
    auto split_result = split(command_line);
    if (core::errors::is_error(split_result)) {
        return core::errors::get_error(split_result);
    }

    for (const auto& command : core::errors::get_value(split_result)) {
        if (!allowed_.matches(command.words)) {
            return CommandRejection{CommandRejectionKind::NotAllowed,
                                    join_words(command.words), ""};
        }
    }

    return trim(command_line);
}

}  // namespace gatehouse::policy
