#pragma once

#include "BaseAction.h"
#include "scripting/Expression.h"
#include <memory>
#include <vector>

namespace RSE {

/**
 * @brief for loop with optional completion branch
 *
 * Binds the item variable to each element of the iterable (sequence
 * elements, mapping keys, string characters) and runs the iteration
 * statements. The completion branch (for ... else) runs once when the
 * iterable is exhausted and never after a break.
 *
 * Example rule:
 * for item in orders:
 *     if item.total > limit:
 *         break
 * else:
 *     log_message('all orders within limit')
 */
class ForeachAction : public BaseAction {
public:
    ForeachAction(const std::string &item, ExpressionPtr array, int line = 0, const std::string &id = "");

    virtual ~ForeachAction() = default;

    /**
     * @brief Set the expression producing the iterable
     */
    void setArray(ExpressionPtr array);
    const ExpressionPtr &getArray() const;

    /**
     * @brief Set the loop variable name
     */
    void setItem(const std::string &item);
    const std::string &getItem() const;

    void addIterationAction(std::shared_ptr<IActionNode> action);
    void setIterationActions(ActionList actions);
    const ActionList &getIterationActions() const;
    size_t getIterationActionCount() const;

    void addCompletionAction(std::shared_ptr<IActionNode> action);
    void setCompletionActions(ActionList actions);
    const ActionList &getCompletionActions() const;

    bool hasCompletionBranch() const {
        return hasCompletionBranch_;
    }

    /**
     * @brief Line of the `else:` keyword, 0 without completion branch
     */
    int getCompletionLine() const {
        return completionLine_;
    }

    void setCompletionLine(int line);

    // IActionNode implementation
    bool execute(IExecutionContext &context) override;
    std::string getActionType() const override;
    std::shared_ptr<IActionNode> clone() const override;
    std::string getSourceText() const override;

protected:
    std::vector<std::string> validateSpecific() const override;
    std::string getSpecificDescription() const override;

private:
    std::string item_;
    ExpressionPtr array_;
    ActionList iterationActions_;
    ActionList completionActions_;
    bool hasCompletionBranch_ = false;
    int completionLine_ = 0;
};

}  // namespace RSE
