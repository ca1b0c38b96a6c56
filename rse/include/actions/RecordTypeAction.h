#pragma once

#include "BaseAction.h"
#include "scripting/Expression.h"
#include <string>
#include <utility>
#include <vector>

namespace RSE {

/**
 * @brief `class Name:` declaration
 *
 * Binds a record type whose body holds only `pass` and `field = expr`
 * defaults. Defaults are evaluated once, at declaration time.
 */
class RecordTypeAction : public BaseAction {
public:
    using FieldDefault = std::pair<std::string, ExpressionPtr>;

    RecordTypeAction(const std::string &typeName, int line = 0, const std::string &id = "");

    virtual ~RecordTypeAction() = default;

    const std::string &getTypeName() const;

    void addFieldDefault(const std::string &field, ExpressionPtr value);
    const std::vector<FieldDefault> &getFieldDefaults() const;

    bool execute(IExecutionContext &context) override;
    std::string getActionType() const override;
    std::shared_ptr<IActionNode> clone() const override;
    std::string getSourceText() const override;

protected:
    std::vector<std::string> validateSpecific() const override;
    std::string getSpecificDescription() const override;

private:
    std::string typeName_;
    std::vector<FieldDefault> fieldDefaults_;
};

}  // namespace RSE
