#pragma once

#include "BaseAction.h"
#include "scripting/Expression.h"

namespace RSE {

/**
 * @brief while loop with optional completion branch
 *
 * Same completion semantics as ForeachAction: the else branch runs when the
 * condition turns false, never after a break.
 */
class WhileAction : public BaseAction {
public:
    WhileAction(ExpressionPtr condition, int line = 0, const std::string &id = "");

    virtual ~WhileAction() = default;

    const ExpressionPtr &getCondition() const;

    void addBodyAction(std::shared_ptr<IActionNode> action);
    void setBodyActions(ActionList actions);
    const ActionList &getBodyActions() const;

    void addCompletionAction(std::shared_ptr<IActionNode> action);
    void setCompletionActions(ActionList actions);
    const ActionList &getCompletionActions() const;

    bool hasCompletionBranch() const {
        return hasCompletionBranch_;
    }

    int getCompletionLine() const {
        return completionLine_;
    }

    void setCompletionLine(int line);

    bool execute(IExecutionContext &context) override;
    std::string getActionType() const override;
    std::shared_ptr<IActionNode> clone() const override;
    std::string getSourceText() const override;

protected:
    std::vector<std::string> validateSpecific() const override;
    std::string getSpecificDescription() const override;

private:
    ExpressionPtr condition_;
    ActionList bodyActions_;
    ActionList completionActions_;
    bool hasCompletionBranch_ = false;
    int completionLine_ = 0;
};

}  // namespace RSE
