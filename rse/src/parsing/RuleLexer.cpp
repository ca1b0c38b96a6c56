#include "parsing/RuleLexer.h"
#include "common/Logger.h"
#include "common/RuleError.h"
#include <cctype>
#include <unordered_set>

namespace RSE {

namespace {

const std::unordered_set<std::string> &keywords() {
    static const std::unordered_set<std::string> words = {
        "False", "None",   "True",  "and",   "as",     "assert", "async",  "await",    "break",
        "class", "continue", "def", "del",   "elif",   "else",   "except", "finally",  "for",
        "from",  "global", "if",    "import", "in",    "is",     "lambda", "nonlocal", "not",
        "or",    "pass",   "raise", "return", "try",   "while",  "with",   "yield"};
    return words;
}

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

bool isIdentifierChar(char c) {
    return isIdentifierStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

void appendUtf8(std::string &out, unsigned long codePoint) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

}  // namespace

RuleLexer::RuleLexer(const std::string &source) : source_(source) {}

bool RuleLexer::isKeyword(const std::string &word) {
    return keywords().count(word) > 0;
}

char RuleLexer::current() const {
    return pos_ < source_.size() ? source_[pos_] : '\0';
}

char RuleLexer::peek(size_t offset) const {
    return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
}

void RuleLexer::advance() {
    if (isAtEnd()) {
        return;
    }
    if (source_[pos_] == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    pos_++;
}

bool RuleLexer::isAtEnd() const {
    return pos_ >= source_.size();
}

void RuleLexer::emit(TokenType type, const std::string &text, int line, int column) {
    tokens_.push_back(Token{type, text, line, column});
}

std::vector<Token> RuleLexer::tokenize() {
    bool atLineStart = true;

    while (!isAtEnd()) {
        if (atLineStart && nestingDepth_ == 0) {
            atLineStart = false;
            if (!handleLineStart()) {
                atLineStart = true;
                continue;
            }
        }

        char c = current();

        if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
            advance();
            continue;
        }

        if (c == '#') {
            while (!isAtEnd() && current() != '\n') {
                advance();
            }
            continue;
        }

        if (c == '\\') {
            size_t offset = (peek() == '\r') ? 2 : 1;
            if (peek(offset) != '\n') {
                throw RuleSyntaxError("unexpected character after line continuation character", line_, column_);
            }
            for (size_t i = 0; i <= offset; ++i) {
                advance();
            }
            continue;
        }

        if (c == '\n') {
            if (nestingDepth_ == 0) {
                if (!tokens_.empty() && tokens_.back().type != TokenType::Newline) {
                    emit(TokenType::Newline, "", line_, column_);
                }
                atLineStart = true;
            }
            advance();
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(peek())))) {
            readNumber();
            continue;
        }

        if (c == '"' || c == '\'') {
            readString(c, false);
            continue;
        }

        // String prefixes: r'' is raw, u'' is plain; f'' and b'' are not part of the language
        if (isIdentifierStart(c) && (peek() == '"' || peek() == '\'')) {
            char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (prefix == 'r' || prefix == 'u') {
                advance();
                readString(current(), prefix == 'r');
                continue;
            }
            if (prefix == 'f' || prefix == 'b') {
                throw RuleSyntaxError(std::string(prefix == 'f' ? "f-strings" : "bytes literals") +
                                          " are not supported in rules",
                                      line_, column_);
            }
        }

        if (isIdentifierStart(c)) {
            readIdentifierOrKeyword();
            continue;
        }

        readOperator();
    }

    if (nestingDepth_ > 0) {
        throw RuleSyntaxError("unexpected end of input: unclosed bracket", line_, column_);
    }

    if (!tokens_.empty() && tokens_.back().type != TokenType::Newline) {
        emit(TokenType::Newline, "", line_, column_);
    }
    while (indentStack_.size() > 1) {
        indentStack_.pop_back();
        emit(TokenType::Dedent, "", line_, column_);
    }
    emit(TokenType::EndOfFile, "", line_, column_);

    LOG_TRACE("Tokenized {} tokens over {} lines", tokens_.size(), line_);
    return std::move(tokens_);
}

bool RuleLexer::handleLineStart() {
    int width = 0;
    while (!isAtEnd()) {
        char c = current();
        if (c == ' ') {
            width++;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c == '\f') {
            width = 0;
        } else {
            break;
        }
        advance();
    }

    char c = current();
    if (isAtEnd() || c == '\n' || c == '\r' || c == '#') {
        // Blank or comment-only line: no tokens, indentation is irrelevant
        while (!isAtEnd() && current() != '\n') {
            advance();
        }
        advance();
        return false;
    }

    int line = line_;
    if (width > indentStack_.back()) {
        indentStack_.push_back(width);
        emit(TokenType::Indent, "", line, 1);
    } else {
        while (width < indentStack_.back()) {
            indentStack_.pop_back();
            emit(TokenType::Dedent, "", line, 1);
        }
        if (width != indentStack_.back()) {
            throw RuleSyntaxError("unindent does not match any outer indentation level", line, column_);
        }
    }
    return true;
}

void RuleLexer::readNumber() {
    int line = line_;
    int column = column_;
    size_t start = pos_;
    bool isFloat = false;

    while (std::isdigit(static_cast<unsigned char>(current()))) {
        advance();
    }
    if (current() == '.') {
        isFloat = true;
        advance();
        while (std::isdigit(static_cast<unsigned char>(current()))) {
            advance();
        }
    }
    if (current() == 'e' || current() == 'E') {
        size_t offset = (peek() == '+' || peek() == '-') ? 2 : 1;
        if (std::isdigit(static_cast<unsigned char>(peek(offset)))) {
            isFloat = true;
            for (size_t i = 0; i < offset; ++i) {
                advance();
            }
            while (std::isdigit(static_cast<unsigned char>(current()))) {
                advance();
            }
        }
    }

    if (isIdentifierStart(current())) {
        throw RuleSyntaxError("invalid decimal literal", line_, column_);
    }

    emit(isFloat ? TokenType::Float : TokenType::Integer, source_.substr(start, pos_ - start), line, column);
}

void RuleLexer::readString(char quote, bool raw) {
    int line = line_;
    int column = column_;
    bool triple = peek() == quote && peek(2) == quote;

    for (int i = 0; i < (triple ? 3 : 1); ++i) {
        advance();
    }

    std::string value;
    while (true) {
        if (isAtEnd()) {
            throw RuleSyntaxError(triple ? "unterminated triple-quoted string literal" : "unterminated string literal",
                                  line, column);
        }

        char c = current();
        if (c == quote) {
            if (!triple) {
                advance();
                break;
            }
            if (peek() == quote && peek(2) == quote) {
                advance();
                advance();
                advance();
                break;
            }
        }

        if (c == '\n' && !triple) {
            throw RuleSyntaxError("unterminated string literal", line, column);
        }

        if (c == '\\') {
            char next = peek();
            if (raw) {
                value += c;
                advance();
                if (next == quote || next == '\\') {
                    value += next;
                    advance();
                }
                continue;
            }

            advance();
            advance();
            switch (next) {
            case '\n':
                break;
            case '\\':
            case '\'':
            case '"':
                value += next;
                break;
            case 'n':
                value += '\n';
                break;
            case 'r':
                value += '\r';
                break;
            case 't':
                value += '\t';
                break;
            case '0':
                value += '\0';
                break;
            case 'a':
                value += '\a';
                break;
            case 'b':
                value += '\b';
                break;
            case 'f':
                value += '\f';
                break;
            case 'v':
                value += '\v';
                break;
            case 'x':
            case 'u':
            case 'U': {
                size_t digits = next == 'x' ? 2 : (next == 'u' ? 4 : 8);
                std::string hex;
                for (size_t i = 0; i < digits && std::isxdigit(static_cast<unsigned char>(current())); ++i) {
                    hex += current();
                    advance();
                }
                if (hex.size() != digits) {
                    throw RuleSyntaxError("truncated \\" + std::string(1, next) + " escape", line_, column_);
                }
                appendUtf8(value, std::stoul(hex, nullptr, 16));
                break;
            }
            default:
                value += '\\';
                value += next;
                break;
            }
            continue;
        }

        value += c;
        advance();
    }

    emit(TokenType::String, value, line, column);
}

void RuleLexer::readIdentifierOrKeyword() {
    int line = line_;
    int column = column_;
    size_t start = pos_;
    while (isIdentifierChar(current())) {
        advance();
    }

    std::string word = source_.substr(start, pos_ - start);
    emit(isKeyword(word) ? TokenType::Keyword : TokenType::Name, word, line, column);
}

void RuleLexer::readOperator() {
    static const char *const threeChar[] = {"**=", "//="};
    static const char *const twoChar[] = {"**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "->"};
    static const std::string singleChar = "+-*/%<>=()[]{},:.;@";

    int line = line_;
    int column = column_;

    for (const char *op : threeChar) {
        if (source_.compare(pos_, 3, op) == 0) {
            advance();
            advance();
            advance();
            emit(TokenType::Operator, op, line, column);
            return;
        }
    }
    for (const char *op : twoChar) {
        if (source_.compare(pos_, 2, op) == 0) {
            advance();
            advance();
            emit(TokenType::Operator, op, line, column);
            return;
        }
    }

    char c = current();
    if (singleChar.find(c) == std::string::npos) {
        throw RuleSyntaxError("invalid character '" + std::string(1, c) + "'", line, column);
    }

    if (c == '(' || c == '[' || c == '{') {
        nestingDepth_++;
    } else if (c == ')' || c == ']' || c == '}') {
        if (nestingDepth_ == 0) {
            throw RuleSyntaxError("unmatched '" + std::string(1, c) + "'", line, column);
        }
        nestingDepth_--;
    }

    advance();
    emit(TokenType::Operator, std::string(1, c), line, column);
}

}  // namespace RSE
