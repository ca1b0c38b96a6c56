#pragma once

#include <memory>
#include <string>

namespace RSE {

class IActionExecutor;

/**
 * @brief Interface for execution context during statement processing
 */
class IExecutionContext {
public:
    virtual ~IExecutionContext() = default;

    /**
     * @brief Get action executor for performing operations
     */
    virtual IActionExecutor &getActionExecutor() = 0;

    virtual std::string getRunId() const = 0;

    /**
     * @brief Check if execution context is in valid state
     * @return true if context is properly initialized
     */
    virtual bool isValid() const = 0;
};

}  // namespace RSE
