#pragma once

#include "BaseAction.h"

namespace RSE {

/**
 * @brief break / continue
 *
 * Terminates (break) or restarts (continue) the innermost enclosing loop.
 * The parser rejects both outside a loop.
 */
class LoopControlAction : public BaseAction {
public:
    enum class Kind { Break, Continue };

    explicit LoopControlAction(Kind kind, int line = 0, const std::string &id = "");

    virtual ~LoopControlAction() = default;

    Kind getKind() const {
        return kind_;
    }

    bool isBreak() const {
        return kind_ == Kind::Break;
    }

    bool execute(IExecutionContext &context) override;
    std::string getActionType() const override;
    std::shared_ptr<IActionNode> clone() const override;
    std::string getSourceText() const override;

protected:
    std::vector<std::string> validateSpecific() const override;
    std::string getSpecificDescription() const override;

private:
    Kind kind_;
};

}  // namespace RSE
