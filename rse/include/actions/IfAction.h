#pragma once

#include "BaseAction.h"
#include "scripting/Expression.h"
#include <memory>
#include <vector>

namespace RSE {

/**
 * @brief if / elif / else statement
 *
 * Branches are tested in order and exactly one runs: the first whose
 * condition is truthy, otherwise the else branch if present.
 *
 * Example rule:
 * if total > 100:
 *     tier = 'gold'
 * elif total > 10:
 *     tier = 'silver'
 * else:
 *     tier = 'bronze'
 */
class IfAction : public BaseAction {
public:
    /**
     * @brief Conditional branch containing condition and statements
     */
    struct ConditionalBranch {
        ExpressionPtr condition;  // null for else
        ActionList actions;
        bool isElseBranch = false;
        int line = 0;  // line of the if / elif / else keyword

        ConditionalBranch() = default;

        ConditionalBranch(ExpressionPtr cond, int ln) : condition(std::move(cond)), line(ln) {}
    };

    explicit IfAction(int line = 0, const std::string &id = "");

    virtual ~IfAction() = default;

    /**
     * @brief Add the leading if branch or an elif branch
     * @return Reference to the created branch for adding statements
     */
    ConditionalBranch &addConditionalBranch(ExpressionPtr condition, int line);

    /**
     * @brief Add the else branch (unconditional fallback)
     * @return Reference to the else branch for adding statements
     */
    ConditionalBranch &addElseBranch(int line);

    /**
     * @brief Add statement to a specific branch
     * @param branchIndex Branch index (0 = if, 1+ = elif branches, last = else if exists)
     */
    void addActionToBranch(size_t branchIndex, std::shared_ptr<IActionNode> action);

    /**
     * @brief Replace the statements of a branch
     */
    void setBranchActions(size_t branchIndex, ActionList actions);

    const ConditionalBranch &getBranch(size_t index) const;
    const std::vector<ConditionalBranch> &getBranches() const;
    bool hasElseBranch() const;
    size_t getBranchCount() const;

    // IActionNode implementation
    bool execute(IExecutionContext &context) override;
    std::string getActionType() const override;
    std::shared_ptr<IActionNode> clone() const override;
    std::string getSourceText() const override;

protected:
    std::vector<std::string> validateSpecific() const override;
    std::string getSpecificDescription() const override;

private:
    std::vector<ConditionalBranch> branches_;
};

}  // namespace RSE
