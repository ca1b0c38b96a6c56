#include "actions/LoopControlAction.h"
#include "runtime/IActionExecutor.h"
#include "runtime/IExecutionContext.h"

namespace RSE {

LoopControlAction::LoopControlAction(Kind kind, int line, const std::string &id) : BaseAction(line, id), kind_(kind) {}

bool LoopControlAction::execute(IExecutionContext &context) {
    if (!context.isValid()) {
        return false;
    }
    return context.getActionExecutor().executeLoopControlAction(*this);
}

std::string LoopControlAction::getActionType() const {
    return isBreak() ? "break" : "continue";
}

std::shared_ptr<IActionNode> LoopControlAction::clone() const {
    return std::make_shared<LoopControlAction>(kind_, getLine(), getId());
}

std::string LoopControlAction::getSourceText() const {
    return getActionType();
}

std::vector<std::string> LoopControlAction::validateSpecific() const {
    return {};
}

std::string LoopControlAction::getSpecificDescription() const {
    return "";
}

}  // namespace RSE
