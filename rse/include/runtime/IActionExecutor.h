#pragma once

#include "RSETypes.h"
#include <memory>
#include <string>

namespace RSE {

class AssignAction;
class IfAction;
class ForeachAction;
class WhileAction;
class ExpressionAction;
class LoopControlAction;
class PassAction;
class RecordTypeAction;
class Expression;

/**
 * @brief Interface for executing rule statements
 *
 * Command pattern with one typed method per statement kind. Every method
 * returns false when execution must stop: either a fault was recorded or a
 * cooperative halt was requested.
 */
class IActionExecutor {
public:
    virtual ~IActionExecutor() = default;

    // High-level action execution methods (Command pattern)
    virtual bool executeAssignAction(const AssignAction &action) = 0;
    virtual bool executeIfAction(const IfAction &action) = 0;
    virtual bool executeForeachAction(const ForeachAction &action) = 0;
    virtual bool executeWhileAction(const WhileAction &action) = 0;
    virtual bool executeExpressionAction(const ExpressionAction &action) = 0;
    virtual bool executeLoopControlAction(const LoopControlAction &action) = 0;
    virtual bool executePassAction(const PassAction &action) = 0;
    virtual bool executeRecordTypeAction(const RecordTypeAction &action) = 0;

    // Low-level primitives
    /**
     * @brief Evaluate an expression in the run's environment
     * @throws RuleError on evaluation failure
     */
    virtual RuleValue evaluateExpression(const Expression &expression) = 0;

    /**
     * @brief Evaluate a condition with the language's truthiness
     * @throws RuleError on evaluation failure
     */
    virtual bool evaluateCondition(const Expression &condition) = 0;

    /**
     * @brief Bind a value to a name, attribute path or subscript target
     * @throws RuleError when the target cannot be assigned
     */
    virtual void assignTarget(const Expression &target, const RuleValue &value) = 0;

    virtual bool hasVariable(const std::string &name) const = 0;

    /**
     * @brief Get identifier of the run this executor belongs to
     */
    virtual std::string getRunId() const = 0;
};

}  // namespace RSE
