#include "actions/BaseAction.h"

namespace RSE {

BaseAction::BaseAction(int line, const std::string &id) : id_(id), line_(line) {}

std::string BaseAction::getId() const {
    return id_;
}

void BaseAction::setId(const std::string &id) {
    id_ = id;
}

int BaseAction::getLine() const {
    return line_;
}

void BaseAction::setLine(int line) {
    line_ = line;
}

std::string BaseAction::getDescription() const {
    std::string desc = getActionType();
    if (!id_.empty()) {
        desc += " (id: " + id_ + ")";
    }
    if (line_ > 0) {
        desc += " @" + std::to_string(line_);
    }

    std::string specific = getSpecificDescription();
    if (!specific.empty()) {
        desc += " - " + specific;
    }

    return desc;
}

std::vector<std::string> BaseAction::validate() const {
    std::vector<std::string> errors;

    if (line_ < 0) {
        errors.push_back("Action line must not be negative: " + std::to_string(line_));
    }

    auto specificErrors = validateSpecific();
    errors.insert(errors.end(), specificErrors.begin(), specificErrors.end());

    return errors;
}

ActionList BaseAction::cloneActions(const ActionList &source) {
    ActionList cloned;
    cloned.reserve(source.size());
    for (const auto &action : source) {
        if (action) {
            cloned.push_back(action->clone());
        }
    }
    return cloned;
}

void BaseAction::validateBlock(const ActionList &block, const std::string &role, std::vector<std::string> &errors) {
    for (const auto &action : block) {
        if (!action) {
            errors.push_back(role + " contains a null statement");
            continue;
        }
        for (const auto &nested : action->validate()) {
            errors.push_back(role + ": " + nested);
        }
    }
}

}  // namespace RSE
