#pragma once

#include "RSETypes.h"
#include "scripting/Expression.h"
#include <string>
#include <vector>

namespace RSE {

class Environment;

/**
 * @brief Tree-walking evaluator for rule expressions
 *
 * Evaluates against one Environment. Every failure surfaces as a RuleError
 * carrying the line of the innermost expression that knew it.
 *
 * The static helpers hold the operator semantics so the statement executor
 * can apply augmented assignment without building an expression.
 */
class ExpressionEvaluator : public IExpressionVisitor {
public:
    explicit ExpressionEvaluator(Environment &environment);

    RuleValue evaluate(const Expression &expression);
    bool evaluateCondition(const Expression &expression);

    /**
     * @brief Store a value through an assignable expression
     *
     * Names bind in the environment; obj.attr sets a record field; obj[key]
     * stores into a list or dict.
     * @throws RuleError when the target is not assignable or the store fails
     */
    void assign(const Expression &target, const RuleValue &value);

    RuleValue visitLiteral(const LiteralExpression &expr) override;
    RuleValue visitName(const NameExpression &expr) override;
    RuleValue visitList(const ListExpression &expr) override;
    RuleValue visitDict(const DictExpression &expr) override;
    RuleValue visitUnary(const UnaryExpression &expr) override;
    RuleValue visitBinary(const BinaryExpression &expr) override;
    RuleValue visitBoolOp(const BoolOpExpression &expr) override;
    RuleValue visitCompare(const CompareExpression &expr) override;
    RuleValue visitConditional(const ConditionalExpression &expr) override;
    RuleValue visitAttribute(const AttributeExpression &expr) override;
    RuleValue visitSubscript(const SubscriptExpression &expr) override;
    RuleValue visitCall(const CallExpression &expr) override;

    static RuleValue applyBinary(const std::string &op, const RuleValue &lhs, const RuleValue &rhs, int line = 0);
    static RuleValue applyUnary(const std::string &op, const RuleValue &operand, int line = 0);
    static bool applyComparison(const std::string &op, const RuleValue &lhs, const RuleValue &rhs, int line = 0);
    static bool containsValue(const RuleValue &container, const RuleValue &item, int line = 0);

    /**
     * @brief Snapshot of the items a for loop visits
     *
     * Lists yield elements, dicts their keys, strings their characters.
     */
    static std::vector<RuleValue> iterate(const RuleValue &iterable, int line = 0);

    static RuleValue getItem(const RuleValue &container, const RuleValue &key, int line = 0);
    static void setItem(const RuleValue &container, const RuleValue &key, const RuleValue &value, int line = 0);
    static RuleValue getAttribute(const RuleValue &object, const std::string &name, int line = 0);
    static void setAttribute(const RuleValue &object, const std::string &name, const RuleValue &value, int line = 0);
    static RuleValue callValue(const RuleValue &callee, const CallArguments &arguments, int line = 0);

private:
    Environment &environment_;
};

}  // namespace RSE
