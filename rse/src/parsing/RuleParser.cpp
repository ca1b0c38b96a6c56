#include "parsing/RuleParser.h"
#include "actions/AssignAction.h"
#include "actions/ExpressionAction.h"
#include "actions/ForeachAction.h"
#include "actions/IfAction.h"
#include "actions/LoopControlAction.h"
#include "actions/PassAction.h"
#include "actions/RecordTypeAction.h"
#include "actions/WhileAction.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/RuleError.h"
#include <cerrno>
#include <cstdlib>
#include <unordered_set>

namespace RSE {

namespace {

const std::unordered_set<std::string> &augmentedOperators() {
    static const std::unordered_set<std::string> ops = {"+=", "-=", "*=", "/=", "//=", "%="};
    return ops;
}

std::string describe(const Token &token) {
    switch (token.type) {
    case TokenType::Newline:
        return "end of line";
    case TokenType::Indent:
        return "indent";
    case TokenType::Dedent:
        return "dedent";
    case TokenType::EndOfFile:
        return "end of input";
    case TokenType::String:
        return "string literal";
    default:
        return "'" + token.text + "'";
    }
}

}  // namespace

// Counts one level of recursive descent; deepen() adds levels for
// left-associative chains, which grow the tree without recursing
class RuleParser::NestingGuard {
public:
    // Chain guard: starts empty, grows through deepen()
    explicit NestingGuard(RuleParser &parser) : parser_(parser), nested_(false) {}

    NestingGuard(RuleParser &parser, const char *tooDeep) : parser_(parser), nested_(true) {
        if (parser_.nestingDepth_ >= Constants::MAX_NESTING_DEPTH) {
            parser_.fail(tooDeep);
        }
        deepen();
        parser_.nestingDepth_++;
    }

    ~NestingGuard() {
        if (nested_) {
            parser_.nestingDepth_--;
        }
        parser_.expressionDepth_ -= levels_;
    }

    void deepen() {
        if (parser_.expressionDepth_ >= Constants::MAX_EXPRESSION_DEPTH) {
            parser_.fail("expression is too deeply nested");
        }
        parser_.expressionDepth_++;
        levels_++;
    }

    NestingGuard(const NestingGuard &) = delete;
    NestingGuard &operator=(const NestingGuard &) = delete;

private:
    RuleParser &parser_;
    bool nested_;
    size_t levels_ = 0;
};

RuleParser::RuleParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::EndOfFile) {
        int line = tokens_.empty() ? 1 : tokens_.back().line;
        tokens_.push_back(Token{TokenType::EndOfFile, "", line, 1});
    }
}

ActionList RuleParser::parse(const std::string &source) {
    RuleLexer lexer(source);
    RuleParser parser(lexer.tokenize());
    ActionList program = parser.parseProgram();

    for (const auto &action : program) {
        auto errors = action->validate();
        if (!errors.empty()) {
            throw RuleSyntaxError(errors.front(), action->getLine());
        }
    }

    LOG_DEBUG("Parsed rule: {} top-level statement(s)", program.size());
    return program;
}

ExpressionPtr RuleParser::parseExpression(const std::string &source) {
    RuleLexer lexer(source);
    RuleParser parser(lexer.tokenize());
    auto expr = parser.parseExpr();
    while (parser.check(TokenType::Newline)) {
        parser.advance();
    }
    if (!parser.check(TokenType::EndOfFile)) {
        parser.fail("unexpected " + describe(parser.current()) + " after expression");
    }
    return expr;
}

ActionList RuleParser::parseProgram() {
    ActionList program;
    while (!check(TokenType::EndOfFile)) {
        if (match(TokenType::Newline, "")) {
            continue;
        }
        if (check(TokenType::Indent)) {
            fail("unexpected indent");
        }
        parseStatement(program);
    }
    return program;
}

// Token navigation

const Token &RuleParser::current() const {
    return tokens_[pos_];
}

const Token &RuleParser::peekToken(size_t offset) const {
    size_t index = pos_ + offset;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

const Token &RuleParser::advance() {
    const Token &token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
        pos_++;
    }
    return token;
}

bool RuleParser::check(TokenType type, const std::string &text) const {
    return current().type == type && (text.empty() || current().text == text);
}

bool RuleParser::match(TokenType type, const std::string &text) {
    if (check(type, text)) {
        advance();
        return true;
    }
    return false;
}

bool RuleParser::checkOperator(const std::string &op) const {
    return check(TokenType::Operator, op);
}

bool RuleParser::checkKeyword(const std::string &word) const {
    return check(TokenType::Keyword, word);
}

const Token &RuleParser::expect(TokenType type, const std::string &text, const std::string &what) {
    if (!check(type, text)) {
        fail("expected " + what + ", found " + describe(current()));
    }
    return advance();
}

void RuleParser::fail(const std::string &message) const {
    fail(message, current());
}

void RuleParser::fail(const std::string &message, const Token &at) const {
    throw RuleSyntaxError(message, at.line, at.column);
}

// Statements

void RuleParser::parseStatement(ActionList &out) {
    if (checkKeyword("if")) {
        out.push_back(parseIf());
    } else if (checkKeyword("for")) {
        out.push_back(parseFor());
    } else if (checkKeyword("while")) {
        out.push_back(parseWhile());
    } else if (checkKeyword("class")) {
        out.push_back(parseClass());
    } else {
        parseSimpleLine(out);
    }
}

void RuleParser::parseSimpleLine(ActionList &out) {
    out.push_back(parseSmallStatement());
    while (match(TokenType::Operator, ";")) {
        if (check(TokenType::Newline) || check(TokenType::EndOfFile)) {
            break;
        }
        out.push_back(parseSmallStatement());
    }

    if (!match(TokenType::Newline, "") && !check(TokenType::EndOfFile)) {
        fail("unexpected " + describe(current()));
    }
}

std::shared_ptr<IActionNode> RuleParser::parseSmallStatement() {
    const Token &token = current();

    if (token.type == TokenType::Keyword) {
        if (token.text == "pass") {
            advance();
            return std::make_shared<PassAction>(token.line);
        }
        if (token.text == "break" || token.text == "continue") {
            if (loopDepth_ == 0) {
                fail("'" + token.text + "' outside loop");
            }
            advance();
            auto kind = token.text == "break" ? LoopControlAction::Kind::Break : LoopControlAction::Kind::Continue;
            return std::make_shared<LoopControlAction>(kind, token.line);
        }

        static const std::unordered_set<std::string> unsupported = {
            "def",    "return", "import", "from",  "lambda", "try",    "except", "finally", "raise",
            "with",   "yield",  "global", "nonlocal", "del", "assert", "async",  "await",   "elif",
            "else"};
        if (unsupported.count(token.text)) {
            if (token.text == "elif" || token.text == "else") {
                fail("'" + token.text + "' without matching statement");
            }
            fail("'" + token.text + "' statements are not supported in rules");
        }
    }

    return parseExpressionOrAssignment();
}

std::shared_ptr<IActionNode> RuleParser::parseExpressionOrAssignment() {
    int line = current().line;
    ExpressionPtr first = parseExpr();

    if (check(TokenType::Operator) && augmentedOperators().count(current().text)) {
        std::string op = advance().text;
        if (!first->isAssignable()) {
            fail("'" + first->toSource() + "' is an illegal expression for augmented assignment");
        }
        ExpressionPtr value = parseExpr();
        auto action = std::make_shared<AssignAction>(std::vector<ExpressionPtr>{first}, value, line);
        action->setAugmentedOperator(op.substr(0, op.size() - 1));
        return action;
    }

    if (!checkOperator("=")) {
        if (checkOperator(",")) {
            fail("tuples are not supported in rules");
        }
        return std::make_shared<ExpressionAction>(first, line);
    }

    std::vector<ExpressionPtr> targets{first};
    ExpressionPtr value;
    while (match(TokenType::Operator, "=")) {
        value = parseExpr();
        if (checkOperator("=")) {
            targets.push_back(value);
        }
    }

    for (const auto &target : targets) {
        if (!target->isAssignable()) {
            fail("cannot assign to " + target->toSource());
        }
    }
    if (checkOperator(",")) {
        fail("tuple unpacking is not supported in rules");
    }

    return std::make_shared<AssignAction>(targets, value, line);
}

ActionList RuleParser::parseBlock() {
    expect(TokenType::Operator, ":", "':'");
    NestingGuard guard(*this, "too many statically nested blocks");

    ActionList block;
    if (!match(TokenType::Newline, "")) {
        // Single-line suite: if x: y = 1
        parseSimpleLine(block);
        return block;
    }

    expect(TokenType::Indent, "", "an indented block");
    while (!check(TokenType::Dedent) && !check(TokenType::EndOfFile)) {
        if (match(TokenType::Newline, "")) {
            continue;
        }
        if (check(TokenType::Indent)) {
            fail("unexpected indent");
        }
        parseStatement(block);
    }
    match(TokenType::Dedent, "");
    return block;
}

std::shared_ptr<IActionNode> RuleParser::parseIf() {
    const Token &ifToken = advance();
    auto action = std::make_shared<IfAction>(ifToken.line);

    ExpressionPtr condition = parseExpr();
    auto &first = action->addConditionalBranch(condition, ifToken.line);
    first.actions = parseBlock();

    while (checkKeyword("elif")) {
        const Token &elifToken = advance();
        ExpressionPtr elifCondition = parseExpr();
        size_t index = action->getBranchCount();
        action->addConditionalBranch(elifCondition, elifToken.line);
        action->setBranchActions(index, parseBlock());
    }

    if (checkKeyword("else")) {
        const Token &elseToken = advance();
        size_t index = action->getBranchCount();
        action->addElseBranch(elseToken.line);
        action->setBranchActions(index, parseBlock());
    }

    return action;
}

std::shared_ptr<IActionNode> RuleParser::parseFor() {
    const Token &forToken = advance();

    const Token &item = expect(TokenType::Name, "", "loop variable name");
    if (checkOperator(",")) {
        fail("unpacking loop targets are not supported in rules");
    }
    expect(TokenType::Keyword, "in", "'in'");

    ExpressionPtr iterable = parseExpr();
    auto action = std::make_shared<ForeachAction>(item.text, iterable, forToken.line);

    loopDepth_++;
    action->setIterationActions(parseBlock());
    loopDepth_--;

    if (checkKeyword("else")) {
        const Token &elseToken = advance();
        action->setCompletionLine(elseToken.line);
        action->setCompletionActions(parseBlock());
    }

    return action;
}

std::shared_ptr<IActionNode> RuleParser::parseWhile() {
    const Token &whileToken = advance();
    ExpressionPtr condition = parseExpr();
    auto action = std::make_shared<WhileAction>(condition, whileToken.line);

    loopDepth_++;
    action->setBodyActions(parseBlock());
    loopDepth_--;

    if (checkKeyword("else")) {
        const Token &elseToken = advance();
        action->setCompletionLine(elseToken.line);
        action->setCompletionActions(parseBlock());
    }

    return action;
}

std::shared_ptr<IActionNode> RuleParser::parseClass() {
    const Token &classToken = advance();
    const Token &name = expect(TokenType::Name, "", "class name");
    auto action = std::make_shared<RecordTypeAction>(name.text, classToken.line);

    if (match(TokenType::Operator, "(")) {
        if (!checkOperator(")")) {
            fail("class inheritance is not supported in rules");
        }
        advance();
    }

    // The body is parsed as an ordinary block and then restricted
    int savedLoopDepth = loopDepth_;
    loopDepth_ = 0;
    ActionList body = parseBlock();
    loopDepth_ = savedLoopDepth;

    for (const auto &statement : body) {
        if (statement->getActionType() == "pass") {
            continue;
        }

        auto assign = std::dynamic_pointer_cast<AssignAction>(statement);
        const NameExpression *field = nullptr;
        if (assign && !assign->isAugmented() && assign->getTargets().size() == 1) {
            field = dynamic_cast<const NameExpression *>(assign->getTargets().front().get());
        }
        if (!field) {
            throw RuleSyntaxError("class bodies may only contain field defaults and 'pass'", statement->getLine());
        }
        action->addFieldDefault(field->getName(), assign->getValue());
    }

    return action;
}

// Expressions

ExpressionPtr RuleParser::parseExpr() {
    if (checkKeyword("lambda")) {
        fail("lambda expressions are not supported in rules");
    }

    ExpressionPtr body = parseOrTest();
    if (checkKeyword("if")) {
        NestingGuard guard(*this, "expression is too deeply nested");
        int line = current().line;
        advance();
        ExpressionPtr test = parseOrTest();
        expect(TokenType::Keyword, "else", "'else' in conditional expression");
        ExpressionPtr orElse = parseExpr();
        return std::make_shared<ConditionalExpression>(body, test, orElse, line);
    }
    return body;
}

ExpressionPtr RuleParser::parseOrTest() {
    ExpressionPtr left = parseAndTest();
    NestingGuard chain(*this);
    while (checkKeyword("or")) {
        chain.deepen();
        int line = advance().line;
        left = std::make_shared<BoolOpExpression>("or", left, parseAndTest(), line);
    }
    return left;
}

ExpressionPtr RuleParser::parseAndTest() {
    ExpressionPtr left = parseNotTest();
    NestingGuard chain(*this);
    while (checkKeyword("and")) {
        chain.deepen();
        int line = advance().line;
        left = std::make_shared<BoolOpExpression>("and", left, parseNotTest(), line);
    }
    return left;
}

ExpressionPtr RuleParser::parseNotTest() {
    if (checkKeyword("not")) {
        NestingGuard guard(*this, "expression is too deeply nested");
        int line = advance().line;
        return std::make_shared<UnaryExpression>("not", parseNotTest(), line);
    }
    return parseComparison();
}

ExpressionPtr RuleParser::parseComparison() {
    int line = current().line;
    ExpressionPtr first = parseArithmetic();

    std::vector<CompareExpression::Link> rest;
    while (true) {
        std::string op;
        if (check(TokenType::Operator)) {
            const std::string &text = current().text;
            if (text == "==" || text == "!=" || text == "<" || text == "<=" || text == ">" || text == ">=") {
                op = text;
                advance();
            }
        } else if (checkKeyword("in")) {
            op = "in";
            advance();
        } else if (checkKeyword("not") && peekToken().is(TokenType::Keyword, "in")) {
            op = "not in";
            advance();
            advance();
        } else if (checkKeyword("is")) {
            advance();
            op = match(TokenType::Keyword, "not") ? "is not" : "is";
        }

        if (op.empty()) {
            break;
        }
        rest.emplace_back(op, parseArithmetic());
    }

    if (rest.empty()) {
        return first;
    }
    return std::make_shared<CompareExpression>(first, std::move(rest), line);
}

ExpressionPtr RuleParser::parseArithmetic() {
    ExpressionPtr left = parseTerm();
    NestingGuard chain(*this);
    while (checkOperator("+") || checkOperator("-")) {
        chain.deepen();
        const Token &op = advance();
        left = std::make_shared<BinaryExpression>(op.text, left, parseTerm(), op.line);
    }
    return left;
}

ExpressionPtr RuleParser::parseTerm() {
    ExpressionPtr left = parseFactor();
    NestingGuard chain(*this);
    while (checkOperator("*") || checkOperator("/") || checkOperator("//") || checkOperator("%")) {
        chain.deepen();
        const Token &op = advance();
        left = std::make_shared<BinaryExpression>(op.text, left, parseFactor(), op.line);
    }
    if (checkOperator("@")) {
        fail("matrix multiplication is not supported in rules");
    }
    return left;
}

ExpressionPtr RuleParser::parseFactor() {
    if (checkOperator("-") || checkOperator("+")) {
        NestingGuard guard(*this, "expression is too deeply nested");
        const Token &op = advance();
        return std::make_shared<UnaryExpression>(op.text, parseFactor(), op.line);
    }
    return parsePower();
}

ExpressionPtr RuleParser::parsePower() {
    ExpressionPtr base = parsePostfix();
    if (checkOperator("**")) {
        NestingGuard guard(*this, "expression is too deeply nested");
        const Token &op = advance();
        return std::make_shared<BinaryExpression>("**", base, parseFactor(), op.line);
    }
    return base;
}

ExpressionPtr RuleParser::parsePostfix() {
    ExpressionPtr expr = parseAtom();
    NestingGuard chain(*this);

    while (true) {
        if (checkOperator(".") || checkOperator("[") || checkOperator("(")) {
            chain.deepen();
        }
        if (checkOperator(".")) {
            int line = advance().line;
            const Token &name = expect(TokenType::Name, "", "attribute name");
            expr = std::make_shared<AttributeExpression>(expr, name.text, line);
        } else if (checkOperator("[")) {
            NestingGuard guard(*this, "too many nested parentheses");
            int line = advance().line;
            if (checkOperator(":")) {
                fail("slices are not supported in rules");
            }
            ExpressionPtr index = parseExpr();
            if (checkOperator(":")) {
                fail("slices are not supported in rules");
            }
            if (checkOperator(",")) {
                fail("tuple subscripts are not supported in rules");
            }
            expect(TokenType::Operator, "]", "']'");
            expr = std::make_shared<SubscriptExpression>(expr, index, line);
        } else if (checkOperator("(")) {
            NestingGuard guard(*this, "too many nested parentheses");
            int line = advance().line;
            expr = parseCallArguments(expr, line);
        } else {
            return expr;
        }
    }
}

ExpressionPtr RuleParser::parseCallArguments(ExpressionPtr callee, int line) {
    std::vector<ExpressionPtr> arguments;
    std::vector<CallExpression::Keyword> keywords;

    while (!checkOperator(")")) {
        if (checkOperator("*") || checkOperator("**")) {
            fail("argument unpacking is not supported in rules");
        }

        if (check(TokenType::Name) && peekToken().is(TokenType::Operator, "=")) {
            std::string name = advance().text;
            advance();
            for (const auto &existing : keywords) {
                if (existing.first == name) {
                    fail("keyword argument repeated: " + name);
                }
            }
            keywords.emplace_back(name, parseExpr());
        } else {
            if (!keywords.empty()) {
                fail("positional argument follows keyword argument");
            }
            arguments.push_back(parseExpr());
        }

        if (checkKeyword("for")) {
            fail("comprehensions are not supported in rules");
        }
        if (!match(TokenType::Operator, ",")) {
            break;
        }
    }

    expect(TokenType::Operator, ")", "')'");
    return std::make_shared<CallExpression>(callee, std::move(arguments), std::move(keywords), line);
}

ExpressionPtr RuleParser::parseAtom() {
    const Token &token = current();

    switch (token.type) {
    case TokenType::Name:
        advance();
        return std::make_shared<NameExpression>(token.text, token.line);

    case TokenType::Integer: {
        advance();
        errno = 0;
        long long value = std::strtoll(token.text.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            fail("integer literal too large: " + token.text, token);
        }
        return std::make_shared<LiteralExpression>(static_cast<int64_t>(value), token.line);
    }

    case TokenType::Float:
        advance();
        return std::make_shared<LiteralExpression>(std::strtod(token.text.c_str(), nullptr), token.line);

    case TokenType::String: {
        // Adjacent literals concatenate: 'a' 'b' == 'ab'
        std::string value = advance().text;
        while (check(TokenType::String)) {
            value += advance().text;
        }
        return std::make_shared<LiteralExpression>(value, token.line);
    }

    case TokenType::Keyword:
        if (token.text == "True" || token.text == "False") {
            advance();
            return std::make_shared<LiteralExpression>(token.text == "True", token.line);
        }
        if (token.text == "None") {
            advance();
            return std::make_shared<LiteralExpression>(RuleNone{}, token.line);
        }
        if (token.text == "lambda") {
            fail("lambda expressions are not supported in rules");
        }
        fail("unexpected keyword '" + token.text + "'");

    case TokenType::Operator:
        if (token.text == "(") {
            NestingGuard guard(*this, "too many nested parentheses");
            advance();
            if (checkOperator(")")) {
                fail("tuples are not supported in rules");
            }
            ExpressionPtr inner = parseExpr();
            if (checkOperator(",")) {
                fail("tuples are not supported in rules");
            }
            if (checkKeyword("for")) {
                fail("generator expressions are not supported in rules");
            }
            expect(TokenType::Operator, ")", "')'");
            return inner;
        }
        if (token.text == "[") {
            NestingGuard guard(*this, "too many nested parentheses");
            advance();
            std::vector<ExpressionPtr> elements;
            while (!checkOperator("]")) {
                elements.push_back(parseExpr());
                if (checkKeyword("for")) {
                    fail("comprehensions are not supported in rules");
                }
                if (!match(TokenType::Operator, ",")) {
                    break;
                }
            }
            expect(TokenType::Operator, "]", "']'");
            return std::make_shared<ListExpression>(std::move(elements), token.line);
        }
        if (token.text == "{") {
            NestingGuard guard(*this, "too many nested parentheses");
            advance();
            std::vector<DictExpression::Entry> entries;
            while (!checkOperator("}")) {
                ExpressionPtr key = parseExpr();
                if (!checkOperator(":")) {
                    fail("set literals are not supported in rules");
                }
                advance();
                ExpressionPtr value = parseExpr();
                if (checkKeyword("for")) {
                    fail("comprehensions are not supported in rules");
                }
                entries.emplace_back(key, value);
                if (!match(TokenType::Operator, ",")) {
                    break;
                }
            }
            expect(TokenType::Operator, "}", "'}'");
            return std::make_shared<DictExpression>(std::move(entries), token.line);
        }
        break;

    default:
        break;
    }

    fail("invalid syntax: unexpected " + describe(token));
}

}  // namespace RSE
