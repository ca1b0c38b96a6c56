#include "actions/PassAction.h"
#include "runtime/IActionExecutor.h"
#include "runtime/IExecutionContext.h"

namespace RSE {

PassAction::PassAction(int line, const std::string &id) : BaseAction(line, id) {}

bool PassAction::execute(IExecutionContext &context) {
    if (!context.isValid()) {
        return false;
    }
    return context.getActionExecutor().executePassAction(*this);
}

std::string PassAction::getActionType() const {
    return "pass";
}

std::shared_ptr<IActionNode> PassAction::clone() const {
    return std::make_shared<PassAction>(getLine(), getId());
}

std::string PassAction::getSourceText() const {
    return "pass";
}

std::vector<std::string> PassAction::validateSpecific() const {
    return {};
}

std::string PassAction::getSpecificDescription() const {
    return "";
}

}  // namespace RSE
