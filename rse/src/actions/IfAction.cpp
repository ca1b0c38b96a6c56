#include "actions/IfAction.h"
#include "common/Logger.h"
#include "runtime/IActionExecutor.h"
#include "runtime/IExecutionContext.h"

namespace RSE {

IfAction::IfAction(int line, const std::string &id) : BaseAction(line, id) {}

bool IfAction::execute(IExecutionContext &context) {
    if (!context.isValid()) {
        return false;
    }

    try {
        return context.getActionExecutor().executeIfAction(*this);
    } catch (const std::exception &e) {
        LOG_ERROR("If action at line {} failed: {}", getLine(), e.what());
        return false;
    }
}

std::string IfAction::getActionType() const {
    return "if";
}

std::shared_ptr<IActionNode> IfAction::clone() const {
    auto cloned = std::make_shared<IfAction>(getLine(), getId());

    for (const auto &branch : branches_) {
        ConditionalBranch copy;
        copy.condition = branch.condition;
        copy.isElseBranch = branch.isElseBranch;
        copy.line = branch.line;
        copy.actions = cloneActions(branch.actions);
        cloned->branches_.push_back(std::move(copy));
    }

    return cloned;
}

std::string IfAction::getSourceText() const {
    if (branches_.empty() || !branches_.front().condition) {
        return "if:";
    }
    return "if " + branches_.front().condition->toSource() + ":";
}

IfAction::ConditionalBranch &IfAction::addConditionalBranch(ExpressionPtr condition, int line) {
    branches_.emplace_back(std::move(condition), line);
    return branches_.back();
}

IfAction::ConditionalBranch &IfAction::addElseBranch(int line) {
    ConditionalBranch branch;
    branch.isElseBranch = true;
    branch.line = line;
    branches_.push_back(std::move(branch));
    return branches_.back();
}

void IfAction::addActionToBranch(size_t branchIndex, std::shared_ptr<IActionNode> action) {
    if (branchIndex < branches_.size() && action) {
        branches_[branchIndex].actions.push_back(std::move(action));
    }
}

void IfAction::setBranchActions(size_t branchIndex, ActionList actions) {
    if (branchIndex < branches_.size()) {
        branches_[branchIndex].actions = std::move(actions);
    }
}

const IfAction::ConditionalBranch &IfAction::getBranch(size_t index) const {
    static const ConditionalBranch emptyBranch;
    if (index >= branches_.size()) {
        return emptyBranch;
    }
    return branches_[index];
}

const std::vector<IfAction::ConditionalBranch> &IfAction::getBranches() const {
    return branches_;
}

bool IfAction::hasElseBranch() const {
    return !branches_.empty() && branches_.back().isElseBranch;
}

size_t IfAction::getBranchCount() const {
    return branches_.size();
}

std::vector<std::string> IfAction::validateSpecific() const {
    std::vector<std::string> errors;

    if (branches_.empty()) {
        errors.push_back("If statement must have at least one branch");
        return errors;
    }

    if (branches_.front().isElseBranch) {
        errors.push_back("If statement cannot start with an else branch");
    }

    for (size_t i = 0; i < branches_.size(); ++i) {
        const auto &branch = branches_[i];

        if (branch.isElseBranch) {
            if (i != branches_.size() - 1) {
                errors.push_back("Else branch must be the last branch");
            }
        } else if (!branch.condition) {
            errors.push_back("Non-else branch must have a condition");
        }

        if (branch.actions.empty()) {
            errors.push_back("Branch " + std::to_string(i) + " has no statements");
        }
        validateBlock(branch.actions, "branch " + std::to_string(i), errors);
    }

    return errors;
}

std::string IfAction::getSpecificDescription() const {
    std::string desc = "if with " + std::to_string(branches_.size()) + " branch(es)";

    for (size_t i = 0; i < branches_.size(); ++i) {
        const auto &branch = branches_[i];
        desc += " [" + std::to_string(i) + ": ";
        if (branch.isElseBranch) {
            desc += "else";
        } else {
            desc += "condition=\"" + (branch.condition ? branch.condition->toSource() : std::string()) + "\"";
        }
        desc += " statements=" + std::to_string(branch.actions.size()) + "]";
    }

    return desc;
}

}  // namespace RSE
