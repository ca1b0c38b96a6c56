#include "actions/RecordTypeAction.h"
#include "common/Logger.h"
#include "runtime/IActionExecutor.h"
#include "runtime/IExecutionContext.h"

namespace RSE {

RecordTypeAction::RecordTypeAction(const std::string &typeName, int line, const std::string &id)
    : BaseAction(line, id), typeName_(typeName) {}

const std::string &RecordTypeAction::getTypeName() const {
    return typeName_;
}

void RecordTypeAction::addFieldDefault(const std::string &field, ExpressionPtr value) {
    fieldDefaults_.emplace_back(field, std::move(value));
}

const std::vector<RecordTypeAction::FieldDefault> &RecordTypeAction::getFieldDefaults() const {
    return fieldDefaults_;
}

bool RecordTypeAction::execute(IExecutionContext &context) {
    if (!context.isValid()) {
        return false;
    }

    try {
        return context.getActionExecutor().executeRecordTypeAction(*this);
    } catch (const std::exception &e) {
        LOG_ERROR("Class declaration '{}' failed: {}", typeName_, e.what());
        return false;
    }
}

std::string RecordTypeAction::getActionType() const {
    return "class";
}

std::shared_ptr<IActionNode> RecordTypeAction::clone() const {
    auto cloned = std::make_shared<RecordTypeAction>(typeName_, getLine(), getId());
    cloned->fieldDefaults_ = fieldDefaults_;
    return cloned;
}

std::string RecordTypeAction::getSourceText() const {
    return "class " + typeName_ + ":";
}

std::vector<std::string> RecordTypeAction::validateSpecific() const {
    std::vector<std::string> errors;

    if (typeName_.empty()) {
        errors.push_back("Class declaration requires a name");
    }

    for (const auto &[field, value] : fieldDefaults_) {
        if (field.empty()) {
            errors.push_back("Field default without a name");
        }
        if (!value) {
            errors.push_back("Field '" + field + "' has no default expression");
        }
    }

    return errors;
}

std::string RecordTypeAction::getSpecificDescription() const {
    return typeName_ + " with " + std::to_string(fieldDefaults_.size()) + " field default(s)";
}

}  // namespace RSE
