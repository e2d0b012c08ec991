#include "policy/shell_lexer.hpp"

#include <utility>

namespace gatehouse::policy {

namespace {

class Lexer {
public:
    explicit Lexer(const std::string& line) : line_(line) {}

    core::errors::Result<std::vector<ShellToken>, LexError> run() {
        while (pos_ < line_.size()) {
            const char c = line_[pos_];
            switch (c) {
                case ' ':
                case '\t':
                    finish_word();
                    ++pos_;
                    break;
                case '\n':
                    finish_word();
                    push_separator("\n");
                    ++pos_;
                    break;
                case '|': {
                    finish_word();
                    const std::size_t next = skip_continuations(pos_ + 1);
                    if (at(next) == '|' || at(next) == '&') {
                        push_separator(std::string(1, '|') + at(next));
                        pos_ = next + 1;
                    } else {
                        push_separator("|");
                        ++pos_;
                    }
                    break;
                }
                case '&': {
                    finish_word();
                    const std::size_t next = skip_continuations(pos_ + 1);
                    if (at(next) == '&') {
                        push_separator("&&");
                        pos_ = next + 1;
                    } else {
                        push_separator("&");
                        ++pos_;
                    }
                    break;
                }
                case ';':
                    finish_word();
                    push_separator(";");
                    ++pos_;
                    break;
                case '\\':
                    if (pos_ + 1 >= line_.size()) {
                        append('\\');
                        ++pos_;
                    } else if (line_[pos_ + 1] == '\n') {
                        pos_ += 2;
                    } else {
                        append(line_[pos_ + 1]);
                        quoted_ = true;
                        pos_ += 2;
                    }
                    break;
                case '\'':
                    if (!single_quoted()) {
                        return error_;
                    }
                    break;
                case '"':
                    if (!double_quoted()) {
                        return error_;
                    }
                    break;
                case '`':
                    return fail("command substitution is not supported");
                case '$':
                    if (at(skip_continuations(pos_ + 1)) == '(') {
                        return fail("command substitution is not supported");
                    }
                    append(c);
                    ++pos_;
                    break;
                case '<':
                case '>':
                    return fail("redirection is not supported");
                case '(':
                case ')':
                    return fail("subshells are not supported");
                default:
                    append(c);
                    ++pos_;
                    break;
            }
        }
        finish_word();
        return std::move(tokens_);
    }

private:
    char at(const std::size_t index) const {
        return index < line_.size() ? line_[index] : '\0';
    }

    // The shell drops backslash-newline pairs before it tokenizes, so two
    // characters separated only by continuations are adjacent.
    std::size_t skip_continuations(std::size_t index) const {
        while (index + 1 < line_.size() && line_[index] == '\\' && line_[index + 1] == '\n') {
            index += 2;
        }
        return index;
    }

    void append(const char c) {
        word_.push_back(c);
        in_word_ = true;
    }

    void finish_word() {
        if (!in_word_) {
            return;
        }
        tokens_.push_back(ShellToken{ShellToken::Kind::Word, std::move(word_), quoted_});
        word_.clear();
        in_word_ = false;
        quoted_ = false;
    }

    void push_separator(std::string op) {
        tokens_.push_back(ShellToken{ShellToken::Kind::Separator, std::move(op)});
    }

    LexError fail(std::string reason) {
        error_ = LexError{std::move(reason), pos_};
        return error_;
    }

    // '...' : everything literal up to the closing quote.
    bool single_quoted() {
        const std::size_t start = pos_;
        const std::size_t close = line_.find('\'', pos_ + 1);
        if (close == std::string::npos) {
            pos_ = start;
            fail("unterminated single quote");
            return false;
        }
        word_.append(line_, pos_ + 1, close - pos_ - 1);
        in_word_ = true;
        quoted_ = true;
        pos_ = close + 1;
        return true;
    }

    // "..." : backslash escapes only $ ` " \ and newline; substitutions are
    // still live inside double quotes.
    bool double_quoted() {
        const std::size_t start = pos_;
        in_word_ = true;
        quoted_ = true;
        ++pos_;
        while (pos_ < line_.size()) {
            const char c = line_[pos_];
            if (c == '"') {
                ++pos_;
                return true;
            }
            if (c == '\\' && pos_ + 1 < line_.size()) {
                const char next = line_[pos_ + 1];
                if (next == '$' || next == '`' || next == '"' || next == '\\') {
                    word_.push_back(next);
                    pos_ += 2;
                    continue;
                }
                if (next == '\n') {
                    pos_ += 2;
                    continue;
                }
            }
            if (c == '`' || (c == '$' && at(skip_continuations(pos_ + 1)) == '(')) {
                fail("command substitution is not supported");
                return false;
            }
            word_.push_back(c);
            ++pos_;
        }
        pos_ = start;
        fail("unterminated double quote");
        return false;
    }

    const std::string& line_;
    std::size_t pos_ = 0;
    std::string word_;
    bool in_word_ = false;
    bool quoted_ = false;
    std::vector<ShellToken> tokens_;
    LexError error_;
};

}  // namespace

core::errors::Result<std::vector<ShellToken>, LexError> lex_shell(const std::string& line) {
    Lexer lexer(line);
    return lexer.run();
}

}  // namespace gatehouse::policy
