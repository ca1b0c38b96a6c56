#include "actions/AssignAction.h"
#include "common/Logger.h"
#include "runtime/IActionExecutor.h"
#include "runtime/IExecutionContext.h"
#include <algorithm>

namespace RSE {

AssignAction::AssignAction(std::vector<ExpressionPtr> targets, ExpressionPtr value, int line, const std::string &id)
    : BaseAction(line, id), targets_(std::move(targets)), value_(std::move(value)) {}

bool AssignAction::execute(IExecutionContext &context) {
    if (!context.isValid()) {
        return false;
    }

    try {
        return context.getActionExecutor().executeAssignAction(*this);
    } catch (const std::exception &e) {
        LOG_ERROR("Assign action at line {} failed: {}", getLine(), e.what());
        return false;
    }
}

std::string AssignAction::getActionType() const {
    return "assign";
}

std::shared_ptr<IActionNode> AssignAction::clone() const {
    auto cloned = std::make_shared<AssignAction>(targets_, value_, getLine(), getId());
    cloned->setAugmentedOperator(augmentedOperator_);
    return cloned;
}

std::string AssignAction::getSourceText() const {
    std::string text;
    if (isAugmented()) {
        if (!targets_.empty() && targets_.front()) {
            text = targets_.front()->toSource();
        }
        return text + " " + augmentedOperator_ + "= " + (value_ ? value_->toSource() : "");
    }

    for (const auto &target : targets_) {
        if (target) {
            text += target->toSource() + " = ";
        }
    }
    return text + (value_ ? value_->toSource() : "");
}

const std::vector<ExpressionPtr> &AssignAction::getTargets() const {
    return targets_;
}

const ExpressionPtr &AssignAction::getValue() const {
    return value_;
}

void AssignAction::setAugmentedOperator(const std::string &op) {
    augmentedOperator_ = op;
}

const std::string &AssignAction::getAugmentedOperator() const {
    return augmentedOperator_;
}

std::vector<std::string> AssignAction::validateSpecific() const {
    std::vector<std::string> errors;

    if (targets_.empty()) {
        errors.push_back("Assignment needs at least one target");
    }
    for (const auto &target : targets_) {
        if (!target) {
            errors.push_back("Assignment target cannot be null");
        } else if (!target->isAssignable()) {
            errors.push_back("Cannot assign to expression: " + target->toSource());
        }
    }

    if (!value_) {
        errors.push_back("Assignment value cannot be null");
    }

    if (isAugmented()) {
        static const std::vector<std::string> operators = {"+", "-", "*", "/", "//", "%"};
        if (std::find(operators.begin(), operators.end(), augmentedOperator_) == operators.end()) {
            errors.push_back("Invalid augmented operator: " + augmentedOperator_ + "=");
        }
        if (targets_.size() != 1) {
            errors.push_back("Augmented assignment takes exactly one target");
        }
    }

    return errors;
}

std::string AssignAction::getSpecificDescription() const {
    return getSourceText();
}

}  // namespace RSE
