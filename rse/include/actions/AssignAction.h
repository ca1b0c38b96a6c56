#pragma once

#include "BaseAction.h"
#include "scripting/Expression.h"
#include <string>
#include <vector>

namespace RSE {

/**
 * @brief Assignment statement
 *
 * Covers plain assignment with one or more targets (a = b = expr) and
 * augmented assignment (a += expr). Targets are names, attribute paths or
 * subscripts. The value expression is evaluated exactly once.
 */
class AssignAction : public BaseAction {
public:
    AssignAction(std::vector<ExpressionPtr> targets, ExpressionPtr value, int line = 0, const std::string &id = "");

    virtual ~AssignAction() = default;

    // IActionNode implementation
    bool execute(IExecutionContext &context) override;
    std::string getActionType() const override;
    std::shared_ptr<IActionNode> clone() const override;
    std::string getSourceText() const override;

    const std::vector<ExpressionPtr> &getTargets() const;
    const ExpressionPtr &getValue() const;

    /**
     * @brief Turn this into an augmented assignment
     * @param op Arithmetic operator without '=' ("+", "-", "*", "/", "//", "%")
     */
    void setAugmentedOperator(const std::string &op);

    const std::string &getAugmentedOperator() const;

    bool isAugmented() const {
        return !augmentedOperator_.empty();
    }

protected:
    std::vector<std::string> validateSpecific() const override;
    std::string getSpecificDescription() const override;

private:
    std::vector<ExpressionPtr> targets_;
    ExpressionPtr value_;
    std::string augmentedOperator_;
};

}  // namespace RSE
