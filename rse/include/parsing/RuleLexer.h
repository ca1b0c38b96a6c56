#pragma once

#include <string>
#include <vector>

namespace RSE {

enum class TokenType { Name, Integer, Float, String, Keyword, Operator, Newline, Indent, Dedent, EndOfFile };

struct Token {
    TokenType type = TokenType::EndOfFile;
    std::string text;  // decoded value for String tokens
    int line = 0;
    int column = 0;

    bool is(TokenType t, const std::string &value) const {
        return type == t && text == value;
    }
};

/**
 * @brief Tokenizer for the indentation-structured rule language
 *
 * Produces NEWLINE at the end of every logical line and INDENT / DEDENT
 * tokens when the leading whitespace of a logical line changes. Newlines
 * inside (), [] and {} and after a trailing backslash do not end a line.
 * Blank and comment-only lines produce no tokens.
 *
 * @throws RuleSyntaxError on malformed input
 */
class RuleLexer {
public:
    explicit RuleLexer(const std::string &source);

    std::vector<Token> tokenize();

    static bool isKeyword(const std::string &word);

private:
    std::string source_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
    int nestingDepth_ = 0;
    std::vector<int> indentStack_{0};
    std::vector<Token> tokens_;

    char current() const;
    char peek(size_t offset = 1) const;
    void advance();
    bool isAtEnd() const;

    /**
     * @brief Measure indentation at the start of a line and emit INDENT / DEDENT
     * @return false when the line is blank or comment-only (already consumed)
     */
    bool handleLineStart();

    void readNumber();
    void readString(char quote, bool raw);
    void readIdentifierOrKeyword();
    void readOperator();

    void emit(TokenType type, const std::string &text, int line, int column);
};

}  // namespace RSE
