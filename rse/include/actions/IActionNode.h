#pragma once

#include <memory>
#include <string>
#include <vector>

namespace RSE {

class IExecutionContext;

/**
 * @brief Interface for all rule statements
 *
 * Every statement of a parsed rule (assignment, if, for, while, expression
 * statement, break/continue, pass, class) is an action node. Execution
 * follows the Command pattern: execute() hands the node to the context's
 * action executor, which owns the semantics.
 */
class IActionNode {
public:
    virtual ~IActionNode() = default;

    /**
     * @brief Execute this statement in the given context
     * @param context Execution context providing access to the executor
     * @return false when execution must stop (fault or cooperative halt)
     */
    virtual bool execute(IExecutionContext &context) = 0;

    /**
     * @brief Get the type name of this action
     * @return Action type string (e.g., "assign", "if", "for")
     */
    virtual std::string getActionType() const = 0;

    /**
     * @brief Create a deep copy of this action node
     *
     * Expressions are immutable and shared by the copy; child statements are
     * cloned.
     */
    virtual std::shared_ptr<IActionNode> clone() const = 0;

    /**
     * @brief Validate action configuration
     * @return Vector of validation error messages (empty if valid)
     */
    virtual std::vector<std::string> validate() const = 0;

    virtual std::string getId() const = 0;
    virtual void setId(const std::string &id) = 0;

    /**
     * @brief Original source line of the statement (1-based)
     */
    virtual int getLine() const = 0;
    virtual void setLine(int line) = 0;

    /**
     * @brief Single-line rule text of the statement
     *
     * Compound statements render their header only ("for x in items:").
     */
    virtual std::string getSourceText() const = 0;

    /**
     * @brief Get human-readable description of action
     * @return Description string for debugging/logging
     */
    virtual std::string getDescription() const = 0;
};

using ActionList = std::vector<std::shared_ptr<IActionNode>>;

}  // namespace RSE
