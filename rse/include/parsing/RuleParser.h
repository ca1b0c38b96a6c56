#pragma once

#include "actions/IActionNode.h"
#include "parsing/RuleLexer.h"
#include "scripting/Expression.h"
#include <string>
#include <vector>

namespace RSE {

/**
 * @brief Recursive descent parser turning rule source into statement actions
 *
 * The accepted language is a restricted Python subset: assignments
 * (chained and augmented), expression statements, if/elif/else, for and
 * while loops with else branches, break, continue, pass and field-only
 * class declarations. Everything else (def, import, lambda, tuples,
 * slices, ...) is rejected with a RuleSyntaxError naming the construct.
 * Nesting deeper than Constants::MAX_NESTING_DEPTH, or expression trees
 * deeper than Constants::MAX_EXPRESSION_DEPTH, are rejected the same way.
 */
class RuleParser {
public:
    explicit RuleParser(std::vector<Token> tokens);

    /**
     * @brief Tokenize and parse a complete rule
     * @throws RuleSyntaxError
     */
    static ActionList parse(const std::string &source);

    /**
     * @brief Parse a standalone expression (used by tests and tools)
     * @throws RuleSyntaxError
     */
    static ExpressionPtr parseExpression(const std::string &source);

    ActionList parseProgram();

private:
    class NestingGuard;

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int loopDepth_ = 0;
    size_t nestingDepth_ = 0;
    size_t expressionDepth_ = 0;

    // Token navigation
    const Token &current() const;
    const Token &peekToken(size_t offset = 1) const;
    const Token &advance();
    bool check(TokenType type, const std::string &text = "") const;
    bool match(TokenType type, const std::string &text);
    bool checkOperator(const std::string &op) const;
    bool checkKeyword(const std::string &word) const;
    const Token &expect(TokenType type, const std::string &text, const std::string &what);
    [[noreturn]] void fail(const std::string &message) const;
    [[noreturn]] void fail(const std::string &message, const Token &at) const;

    // Statements
    void parseStatement(ActionList &out);
    void parseSimpleLine(ActionList &out);
    std::shared_ptr<IActionNode> parseSmallStatement();
    std::shared_ptr<IActionNode> parseExpressionOrAssignment();
    ActionList parseBlock();
    std::shared_ptr<IActionNode> parseIf();
    std::shared_ptr<IActionNode> parseFor();
    std::shared_ptr<IActionNode> parseWhile();
    std::shared_ptr<IActionNode> parseClass();

    // Expressions, lowest to highest binding strength
    ExpressionPtr parseExpr();
    ExpressionPtr parseOrTest();
    ExpressionPtr parseAndTest();
    ExpressionPtr parseNotTest();
    ExpressionPtr parseComparison();
    ExpressionPtr parseArithmetic();
    ExpressionPtr parseTerm();
    ExpressionPtr parseFactor();
    ExpressionPtr parsePower();
    ExpressionPtr parsePostfix();
    ExpressionPtr parseAtom();
    ExpressionPtr parseCallArguments(ExpressionPtr callee, int line);
};

}  // namespace RSE
