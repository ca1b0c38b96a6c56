#pragma once

#include "BaseAction.h"

namespace RSE {

class PassAction : public BaseAction {
public:
    explicit PassAction(int line = 0, const std::string &id = "");

    bool execute(IExecutionContext &context) override;
    std::string getActionType() const override;
    std::shared_ptr<IActionNode> clone() const override;
    std::string getSourceText() const override;

protected:
    std::vector<std::string> validateSpecific() const override;
    std::string getSpecificDescription() const override;
};

}  // namespace RSE
