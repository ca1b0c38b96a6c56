#include "actions/WhileAction.h"
#include "common/Logger.h"
#include "runtime/IActionExecutor.h"
#include "runtime/IExecutionContext.h"

namespace RSE {

WhileAction::WhileAction(ExpressionPtr condition, int line, const std::string &id)
    : BaseAction(line, id), condition_(std::move(condition)) {}

const ExpressionPtr &WhileAction::getCondition() const {
    return condition_;
}

void WhileAction::addBodyAction(std::shared_ptr<IActionNode> action) {
    if (action) {
        bodyActions_.push_back(std::move(action));
    }
}

void WhileAction::setBodyActions(ActionList actions) {
    bodyActions_ = std::move(actions);
}

const ActionList &WhileAction::getBodyActions() const {
    return bodyActions_;
}

void WhileAction::addCompletionAction(std::shared_ptr<IActionNode> action) {
    hasCompletionBranch_ = true;
    if (action) {
        completionActions_.push_back(std::move(action));
    }
}

void WhileAction::setCompletionActions(ActionList actions) {
    hasCompletionBranch_ = true;
    completionActions_ = std::move(actions);
}

const ActionList &WhileAction::getCompletionActions() const {
    return completionActions_;
}

void WhileAction::setCompletionLine(int line) {
    hasCompletionBranch_ = true;
    completionLine_ = line;
}

bool WhileAction::execute(IExecutionContext &context) {
    if (!context.isValid()) {
        return false;
    }

    try {
        return context.getActionExecutor().executeWhileAction(*this);
    } catch (const std::exception &e) {
        LOG_ERROR("While loop at line {} failed: {}", getLine(), e.what());
        return false;
    }
}

std::string WhileAction::getActionType() const {
    return "while";
}

std::shared_ptr<IActionNode> WhileAction::clone() const {
    auto cloned = std::make_shared<WhileAction>(condition_, getLine(), getId());
    cloned->bodyActions_ = cloneActions(bodyActions_);
    cloned->completionActions_ = cloneActions(completionActions_);
    cloned->hasCompletionBranch_ = hasCompletionBranch_;
    cloned->completionLine_ = completionLine_;
    return cloned;
}

std::string WhileAction::getSourceText() const {
    return "while " + (condition_ ? condition_->toSource() : std::string()) + ":";
}

std::vector<std::string> WhileAction::validateSpecific() const {
    std::vector<std::string> errors;

    if (!condition_) {
        errors.push_back("While loop requires a condition");
    }
    if (bodyActions_.empty()) {
        errors.push_back("While loop body has no statements");
    }
    if (hasCompletionBranch_ && completionActions_.empty()) {
        errors.push_back("While loop else branch has no statements");
    }

    validateBlock(bodyActions_, "while body", errors);
    validateBlock(completionActions_, "while else", errors);

    return errors;
}

std::string WhileAction::getSpecificDescription() const {
    return getSourceText() + " statements=" + std::to_string(bodyActions_.size());
}

}  // namespace RSE
