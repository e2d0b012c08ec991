#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/errors/gatehouse_errors.hpp"

namespace gatehouse::policy {

struct ShellToken {
    enum class Kind {
        Word,
        Separator
    };

    Kind kind = Kind::Word;
    // Words are stored after quote removal. Separators hold the operator:
    // "|", "||", "|&", "&", "&&", ";" or "\n".
    std::string text;
    // Set when any part of the word was quoted or escaped, so "{" and '{'
    // are plain arguments while a bare { opens a group.
    bool quoted = false;
};

struct LexError {
    std::string reason;
    std::size_t offset = 0;
};

// Splits a command line the way /bin/sh would before picking programs:
// blanks separate words, quotes and backslashes are removed, control
// operators become separators. Anything that could run code the lexer cannot
// see (command or process substitution, subshells, redirections) is an error.
core::errors::Result<std::vector<ShellToken>, LexError> lex_shell(const std::string& line);

}  // namespace gatehouse::policy
