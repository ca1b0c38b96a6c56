#include "actions/ExpressionAction.h"
#include "common/Logger.h"
#include "runtime/IActionExecutor.h"
#include "runtime/IExecutionContext.h"

namespace RSE {

ExpressionAction::ExpressionAction(ExpressionPtr expression, int line, const std::string &id)
    : BaseAction(line, id), expression_(std::move(expression)) {}

void ExpressionAction::setExpression(ExpressionPtr expression) {
    expression_ = std::move(expression);
}

const ExpressionPtr &ExpressionAction::getExpression() const {
    return expression_;
}

bool ExpressionAction::execute(IExecutionContext &context) {
    if (!context.isValid()) {
        return false;
    }

    try {
        return context.getActionExecutor().executeExpressionAction(*this);
    } catch (const std::exception &e) {
        LOG_ERROR("Expression statement at line {} failed: {}", getLine(), e.what());
        return false;
    }
}

std::string ExpressionAction::getActionType() const {
    return "expression";
}

std::shared_ptr<IActionNode> ExpressionAction::clone() const {
    return std::make_shared<ExpressionAction>(expression_, getLine(), getId());
}

std::string ExpressionAction::getSourceText() const {
    return expression_ ? expression_->toSource() : std::string();
}

std::vector<std::string> ExpressionAction::validateSpecific() const {
    std::vector<std::string> errors;
    if (!expression_) {
        errors.push_back("Expression statement cannot be empty");
    }
    return errors;
}

std::string ExpressionAction::getSpecificDescription() const {
    return getSourceText();
}

}  // namespace RSE
