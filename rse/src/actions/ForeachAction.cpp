#include "actions/ForeachAction.h"
#include "common/Logger.h"
#include "runtime/IActionExecutor.h"
#include "runtime/IExecutionContext.h"
#include <cctype>

namespace RSE {

ForeachAction::ForeachAction(const std::string &item, ExpressionPtr array, int line, const std::string &id)
    : BaseAction(line, id), item_(item), array_(std::move(array)) {}

void ForeachAction::setArray(ExpressionPtr array) {
    array_ = std::move(array);
}

const ExpressionPtr &ForeachAction::getArray() const {
    return array_;
}

void ForeachAction::setItem(const std::string &item) {
    item_ = item;
}

const std::string &ForeachAction::getItem() const {
    return item_;
}

void ForeachAction::addIterationAction(std::shared_ptr<IActionNode> action) {
    if (action) {
        iterationActions_.push_back(std::move(action));
    }
}

void ForeachAction::setIterationActions(ActionList actions) {
    iterationActions_ = std::move(actions);
}

const ActionList &ForeachAction::getIterationActions() const {
    return iterationActions_;
}

size_t ForeachAction::getIterationActionCount() const {
    return iterationActions_.size();
}

void ForeachAction::addCompletionAction(std::shared_ptr<IActionNode> action) {
    hasCompletionBranch_ = true;
    if (action) {
        completionActions_.push_back(std::move(action));
    }
}

void ForeachAction::setCompletionActions(ActionList actions) {
    hasCompletionBranch_ = true;
    completionActions_ = std::move(actions);
}

const ActionList &ForeachAction::getCompletionActions() const {
    return completionActions_;
}

void ForeachAction::setCompletionLine(int line) {
    hasCompletionBranch_ = true;
    completionLine_ = line;
}

bool ForeachAction::execute(IExecutionContext &context) {
    if (!context.isValid()) {
        return false;
    }

    try {
        return context.getActionExecutor().executeForeachAction(*this);
    } catch (const std::exception &e) {
        LOG_ERROR("For loop at line {} failed: {}", getLine(), e.what());
        return false;
    }
}

std::string ForeachAction::getActionType() const {
    return "for";
}

std::shared_ptr<IActionNode> ForeachAction::clone() const {
    auto cloned = std::make_shared<ForeachAction>(item_, array_, getLine(), getId());
    cloned->iterationActions_ = cloneActions(iterationActions_);
    cloned->completionActions_ = cloneActions(completionActions_);
    cloned->hasCompletionBranch_ = hasCompletionBranch_;
    cloned->completionLine_ = completionLine_;
    return cloned;
}

std::string ForeachAction::getSourceText() const {
    return "for " + item_ + " in " + (array_ ? array_->toSource() : std::string()) + ":";
}

std::vector<std::string> ForeachAction::validateSpecific() const {
    std::vector<std::string> errors;

    if (!array_) {
        errors.push_back("For loop requires an iterable expression");
    }

    if (item_.empty()) {
        errors.push_back("For loop requires a loop variable");
    } else if (std::isdigit(static_cast<unsigned char>(item_.front())) ||
               item_.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_") !=
                   std::string::npos) {
        errors.push_back("Invalid loop variable name: " + item_);
    }

    if (iterationActions_.empty()) {
        errors.push_back("For loop body has no statements");
    }
    if (hasCompletionBranch_ && completionActions_.empty()) {
        errors.push_back("For loop else branch has no statements");
    }

    validateBlock(iterationActions_, "for body", errors);
    validateBlock(completionActions_, "for else", errors);

    return errors;
}

std::string ForeachAction::getSpecificDescription() const {
    std::string desc = getSourceText() + " statements=" + std::to_string(iterationActions_.size());
    if (hasCompletionBranch_) {
        desc += " else=" + std::to_string(completionActions_.size());
    }
    return desc;
}

}  // namespace RSE
