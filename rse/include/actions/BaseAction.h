#pragma once

#include "IActionNode.h"
#include <string>

namespace RSE {

/**
 * @brief Base implementation for common action functionality
 *
 * Template Method: subclasses contribute validateSpecific() and
 * getSpecificDescription().
 */
class BaseAction : public IActionNode {
public:
    explicit BaseAction(int line = 0, const std::string &id = "");

    virtual ~BaseAction() = default;

    // IActionNode implementation (common parts)
    std::string getId() const override;
    void setId(const std::string &id) override;
    int getLine() const override;
    void setLine(int line) override;
    std::string getDescription() const override;
    std::vector<std::string> validate() const override;

protected:
    virtual std::vector<std::string> validateSpecific() const = 0;
    virtual std::string getSpecificDescription() const = 0;

    /**
     * @brief Clone every child statement of a block
     */
    static ActionList cloneActions(const ActionList &source);

    /**
     * @brief Validate a nested block, prefixing errors with its role
     */
    static void validateBlock(const ActionList &block, const std::string &role, std::vector<std::string> &errors);

private:
    std::string id_;
    int line_;
};

}  // namespace RSE
