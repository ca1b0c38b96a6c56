#include "parsing/RuleLexer.h"
#include "common/RuleError.h"
#include <gtest/gtest.h>

using namespace RSE;

class RuleLexerTest : public ::testing::Test {
protected:
    static std::vector<Token> lex(const std::string &source) {
        return RuleLexer(source).tokenize();
    }

    static std::vector<TokenType> types(const std::vector<Token> &tokens) {
        std::vector<TokenType> out;
        for (const auto &token : tokens) {
            out.push_back(token.type);
        }
        return out;
    }
};

TEST_F(RuleLexerTest, SimpleAssignment) {
    auto tokens = lex("total = 10");

    ASSERT_EQ(tokens.size(), 5);
    EXPECT_TRUE(tokens[0].is(TokenType::Name, "total"));
    EXPECT_TRUE(tokens[1].is(TokenType::Operator, "="));
    EXPECT_TRUE(tokens[2].is(TokenType::Integer, "10"));
    EXPECT_EQ(tokens[3].type, TokenType::Newline);
    EXPECT_EQ(tokens[4].type, TokenType::EndOfFile);
    EXPECT_EQ(tokens[2].line, 1);
    EXPECT_EQ(tokens[2].column, 9);
}

TEST_F(RuleLexerTest, IndentAndDedent) {
    auto tokens = lex("if x:\n    y = 1\nz = 2\n");

    std::vector<TokenType> expected = {TokenType::Keyword,  TokenType::Name,    TokenType::Operator,
                                       TokenType::Newline,  TokenType::Indent,  TokenType::Name,
                                       TokenType::Operator, TokenType::Integer, TokenType::Newline,
                                       TokenType::Dedent,   TokenType::Name,    TokenType::Operator,
                                       TokenType::Integer,  TokenType::Newline, TokenType::EndOfFile};
    EXPECT_EQ(types(tokens), expected);
}

TEST_F(RuleLexerTest, DedentsClosedAtEndOfInput) {
    auto tokens = lex("while a:\n  if b:\n    c = 1");

    size_t dedents = 0;
    for (const auto &token : tokens) {
        if (token.type == TokenType::Dedent) {
            ++dedents;
        }
    }
    EXPECT_EQ(dedents, 2);
    EXPECT_EQ(tokens.back().type, TokenType::EndOfFile);
}

TEST_F(RuleLexerTest, BlankAndCommentLinesProduceNoTokens) {
    auto tokens = lex("# heading\n\nx = 1  # trailing\n\n   # indented comment\ny = 2\n");

    std::vector<TokenType> expected = {TokenType::Name,    TokenType::Operator, TokenType::Integer,
                                       TokenType::Newline, TokenType::Name,     TokenType::Operator,
                                       TokenType::Integer, TokenType::Newline,  TokenType::EndOfFile};
    EXPECT_EQ(types(tokens), expected);
    EXPECT_EQ(tokens[4].line, 6);
}

TEST_F(RuleLexerTest, NewlinesInsideBracketsAreIgnored) {
    auto tokens = lex("items = [\n    1,\n    2,\n]\n");

    size_t newlines = 0;
    for (const auto &token : tokens) {
        if (token.type == TokenType::Newline) {
            ++newlines;
        }
        EXPECT_NE(token.type, TokenType::Indent);
    }
    EXPECT_EQ(newlines, 1);
}

TEST_F(RuleLexerTest, LineContinuation) {
    auto tokens = lex("total = 1 + \\\n    2\n");
    EXPECT_EQ(tokens[4].text, "2");
    EXPECT_EQ(tokens[4].line, 2);
    EXPECT_EQ(tokens[5].type, TokenType::Newline);
}

TEST_F(RuleLexerTest, NumberLiterals) {
    auto tokens = lex("a = 3.5 + 1e3 + .5 + 42");

    EXPECT_TRUE(tokens[2].is(TokenType::Float, "3.5"));
    EXPECT_TRUE(tokens[4].is(TokenType::Float, "1e3"));
    EXPECT_TRUE(tokens[6].is(TokenType::Float, ".5"));
    EXPECT_TRUE(tokens[8].is(TokenType::Integer, "42"));
}

TEST_F(RuleLexerTest, StringLiteralsAreDecoded) {
    auto tokens = lex(R"(a = 'it\'s' + "tab\there" + r'\d+')");

    EXPECT_TRUE(tokens[2].is(TokenType::String, "it's"));
    EXPECT_TRUE(tokens[4].is(TokenType::String, "tab\there"));
    EXPECT_TRUE(tokens[6].is(TokenType::String, "\\d+"));
}

TEST_F(RuleLexerTest, KeywordsAndOperators) {
    auto tokens = lex("x = a if not b else None\ny //= 2 ** 3");

    EXPECT_TRUE(tokens[3].is(TokenType::Keyword, "if"));
    EXPECT_TRUE(tokens[4].is(TokenType::Keyword, "not"));
    EXPECT_TRUE(tokens[6].is(TokenType::Keyword, "else"));
    EXPECT_TRUE(tokens[7].is(TokenType::Keyword, "None"));
    EXPECT_TRUE(tokens[10].is(TokenType::Operator, "//="));
    EXPECT_TRUE(tokens[12].is(TokenType::Operator, "**"));

    EXPECT_TRUE(RuleLexer::isKeyword("elif"));
    EXPECT_FALSE(RuleLexer::isKeyword("log_message"));
}

TEST_F(RuleLexerTest, MalformedInputRaisesSyntaxError) {
    EXPECT_THROW(lex("s = 'unterminated"), RuleSyntaxError);
    EXPECT_THROW(lex("x = (1 + 2"), RuleSyntaxError);
    EXPECT_THROW(lex("x = 1)"), RuleSyntaxError);
    EXPECT_THROW(lex("x = 12abc"), RuleSyntaxError);
    EXPECT_THROW(lex("x = $"), RuleSyntaxError);
    EXPECT_THROW(lex("x = f'{y}'"), RuleSyntaxError);
    EXPECT_THROW(lex("if a:\n        b = 1\n    c = 2\n"), RuleSyntaxError);
}

TEST_F(RuleLexerTest, SyntaxErrorCarriesPosition) {
    try {
        lex("a = 1\nb = 'open\n");
        FAIL() << "Expected RuleSyntaxError";
    } catch (const RuleSyntaxError &e) {
        EXPECT_EQ(e.kind(), "SyntaxError");
        EXPECT_EQ(e.line(), 2);
        EXPECT_NE(e.message().find("unterminated string literal"), std::string::npos);
    }
}
