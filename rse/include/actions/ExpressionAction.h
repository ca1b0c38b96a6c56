#pragma once

#include "BaseAction.h"
#include "scripting/Expression.h"

namespace RSE {

/**
 * @brief Expression statement, typically a call: log_message('done')
 */
class ExpressionAction : public BaseAction {
public:
    ExpressionAction(ExpressionPtr expression, int line = 0, const std::string &id = "");

    virtual ~ExpressionAction() = default;

    void setExpression(ExpressionPtr expression);
    const ExpressionPtr &getExpression() const;

    bool execute(IExecutionContext &context) override;
    std::string getActionType() const override;
    std::shared_ptr<IActionNode> clone() const override;
    std::string getSourceText() const override;

protected:
    std::vector<std::string> validateSpecific() const override;
    std::string getSpecificDescription() const override;

private:
    ExpressionPtr expression_;
};

}  // namespace RSE
