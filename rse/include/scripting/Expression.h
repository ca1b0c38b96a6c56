#pragma once

#include "RSETypes.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace RSE {

class IExpressionVisitor;

/**
 * @brief Base of the immutable expression tree
 *
 * Nodes are shared between the parsed program and its instrumented
 * rewrite, so they never change after construction. Evaluation uses the
 * visitor in IExpressionVisitor; toSource() renders canonical rule text that
 * parses back to an equivalent tree.
 */
class Expression {
public:
    // Binding strength used by toSource() to decide on parentheses
    enum class Precedence {
        Conditional = 1,
        Or,
        And,
        Not,
        Comparison,
        Additive,
        Multiplicative,
        Unary,
        Power,
        Postfix,
        Atom
    };

    explicit Expression(int line) : line_(line) {}

    virtual ~Expression() = default;

    int getLine() const {
        return line_;
    }

    virtual RuleValue accept(IExpressionVisitor &visitor) const = 0;
    virtual std::string toSource() const = 0;
    virtual Precedence precedence() const = 0;

    /**
     * @brief True for nodes that may appear on the left of '='
     */
    virtual bool isAssignable() const {
        return false;
    }

protected:
    /**
     * @brief Render a child, parenthesized when it binds weaker than required
     */
    static std::string wrap(const Expression &child, Precedence minimum, bool strict);

private:
    int line_;
};

using ExpressionPtr = std::shared_ptr<const Expression>;

class LiteralExpression : public Expression {
public:
    LiteralExpression(RuleValue value, int line) : Expression(line), value_(std::move(value)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;

    Precedence precedence() const override {
        return Precedence::Atom;
    }

    const RuleValue &getValue() const {
        return value_;
    }

private:
    RuleValue value_;
};

class NameExpression : public Expression {
public:
    NameExpression(std::string name, int line) : Expression(line), name_(std::move(name)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;

    std::string toSource() const override {
        return name_;
    }

    Precedence precedence() const override {
        return Precedence::Atom;
    }

    bool isAssignable() const override {
        return true;
    }

    const std::string &getName() const {
        return name_;
    }

private:
    std::string name_;
};

class ListExpression : public Expression {
public:
    ListExpression(std::vector<ExpressionPtr> elements, int line) : Expression(line), elements_(std::move(elements)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;

    Precedence precedence() const override {
        return Precedence::Atom;
    }

    const std::vector<ExpressionPtr> &getElements() const {
        return elements_;
    }

private:
    std::vector<ExpressionPtr> elements_;
};

class DictExpression : public Expression {
public:
    using Entry = std::pair<ExpressionPtr, ExpressionPtr>;

    DictExpression(std::vector<Entry> entries, int line) : Expression(line), entries_(std::move(entries)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;

    Precedence precedence() const override {
        return Precedence::Atom;
    }

    const std::vector<Entry> &getEntries() const {
        return entries_;
    }

private:
    std::vector<Entry> entries_;
};

/**
 * @brief Unary operator: "-", "+" or "not"
 */
class UnaryExpression : public Expression {
public:
    UnaryExpression(std::string op, ExpressionPtr operand, int line)
        : Expression(line), op_(std::move(op)), operand_(std::move(operand)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;
    Precedence precedence() const override;

    const std::string &getOperator() const {
        return op_;
    }

    const Expression &getOperand() const {
        return *operand_;
    }

private:
    std::string op_;
    ExpressionPtr operand_;
};

/**
 * @brief Arithmetic operator: + - * / // % **
 */
class BinaryExpression : public Expression {
public:
    BinaryExpression(std::string op, ExpressionPtr left, ExpressionPtr right, int line)
        : Expression(line), op_(std::move(op)), left_(std::move(left)), right_(std::move(right)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;
    Precedence precedence() const override;

    const std::string &getOperator() const {
        return op_;
    }

    const Expression &getLeft() const {
        return *left_;
    }

    const Expression &getRight() const {
        return *right_;
    }

private:
    std::string op_;
    ExpressionPtr left_;
    ExpressionPtr right_;
};

/**
 * @brief Short-circuit "and" / "or"; yields the deciding operand
 */
class BoolOpExpression : public Expression {
public:
    BoolOpExpression(std::string op, ExpressionPtr left, ExpressionPtr right, int line)
        : Expression(line), op_(std::move(op)), left_(std::move(left)), right_(std::move(right)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;

    Precedence precedence() const override {
        return op_ == "and" ? Precedence::And : Precedence::Or;
    }

    const std::string &getOperator() const {
        return op_;
    }

    const Expression &getLeft() const {
        return *left_;
    }

    const Expression &getRight() const {
        return *right_;
    }

private:
    std::string op_;
    ExpressionPtr left_;
    ExpressionPtr right_;
};

/**
 * @brief Comparison chain: a < b <= c evaluates b once
 *
 * Operators: == != < <= > >= in "not in" is "is not"
 */
class CompareExpression : public Expression {
public:
    using Link = std::pair<std::string, ExpressionPtr>;

    CompareExpression(ExpressionPtr first, std::vector<Link> rest, int line)
        : Expression(line), first_(std::move(first)), rest_(std::move(rest)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;

    Precedence precedence() const override {
        return Precedence::Comparison;
    }

    const Expression &getFirst() const {
        return *first_;
    }

    const std::vector<Link> &getRest() const {
        return rest_;
    }

private:
    ExpressionPtr first_;
    std::vector<Link> rest_;
};

/**
 * @brief body if test else orElse
 */
class ConditionalExpression : public Expression {
public:
    ConditionalExpression(ExpressionPtr body, ExpressionPtr test, ExpressionPtr orElse, int line)
        : Expression(line), body_(std::move(body)), test_(std::move(test)), orElse_(std::move(orElse)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;

    Precedence precedence() const override {
        return Precedence::Conditional;
    }

    const Expression &getBody() const {
        return *body_;
    }

    const Expression &getTest() const {
        return *test_;
    }

    const Expression &getOrElse() const {
        return *orElse_;
    }

private:
    ExpressionPtr body_;
    ExpressionPtr test_;
    ExpressionPtr orElse_;
};

class AttributeExpression : public Expression {
public:
    AttributeExpression(ExpressionPtr object, std::string attribute, int line)
        : Expression(line), object_(std::move(object)), attribute_(std::move(attribute)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;

    Precedence precedence() const override {
        return Precedence::Postfix;
    }

    bool isAssignable() const override {
        return true;
    }

    const Expression &getObject() const {
        return *object_;
    }

    const std::string &getAttribute() const {
        return attribute_;
    }

private:
    ExpressionPtr object_;
    std::string attribute_;
};

class SubscriptExpression : public Expression {
public:
    SubscriptExpression(ExpressionPtr object, ExpressionPtr index, int line)
        : Expression(line), object_(std::move(object)), index_(std::move(index)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;

    Precedence precedence() const override {
        return Precedence::Postfix;
    }

    bool isAssignable() const override {
        return true;
    }

    const Expression &getObject() const {
        return *object_;
    }

    const Expression &getIndex() const {
        return *index_;
    }

private:
    ExpressionPtr object_;
    ExpressionPtr index_;
};

class CallExpression : public Expression {
public:
    using Keyword = std::pair<std::string, ExpressionPtr>;

    CallExpression(ExpressionPtr callee, std::vector<ExpressionPtr> arguments, std::vector<Keyword> keywords, int line)
        : Expression(line), callee_(std::move(callee)), arguments_(std::move(arguments)),
          keywords_(std::move(keywords)) {}

    RuleValue accept(IExpressionVisitor &visitor) const override;
    std::string toSource() const override;

    Precedence precedence() const override {
        return Precedence::Postfix;
    }

    const Expression &getCallee() const {
        return *callee_;
    }

    const std::vector<ExpressionPtr> &getArguments() const {
        return arguments_;
    }

    const std::vector<Keyword> &getKeywords() const {
        return keywords_;
    }

private:
    ExpressionPtr callee_;
    std::vector<ExpressionPtr> arguments_;
    std::vector<Keyword> keywords_;
};

/**
 * @brief Double dispatch target for expression evaluation
 */
class IExpressionVisitor {
public:
    virtual ~IExpressionVisitor() = default;

    virtual RuleValue visitLiteral(const LiteralExpression &expr) = 0;
    virtual RuleValue visitName(const NameExpression &expr) = 0;
    virtual RuleValue visitList(const ListExpression &expr) = 0;
    virtual RuleValue visitDict(const DictExpression &expr) = 0;
    virtual RuleValue visitUnary(const UnaryExpression &expr) = 0;
    virtual RuleValue visitBinary(const BinaryExpression &expr) = 0;
    virtual RuleValue visitBoolOp(const BoolOpExpression &expr) = 0;
    virtual RuleValue visitCompare(const CompareExpression &expr) = 0;
    virtual RuleValue visitConditional(const ConditionalExpression &expr) = 0;
    virtual RuleValue visitAttribute(const AttributeExpression &expr) = 0;
    virtual RuleValue visitSubscript(const SubscriptExpression &expr) = 0;
    virtual RuleValue visitCall(const CallExpression &expr) = 0;
};

}  // namespace RSE
