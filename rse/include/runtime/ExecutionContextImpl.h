#pragma once

#include "IActionExecutor.h"
#include "IExecutionContext.h"
#include <memory>
#include <string>

namespace RSE {

/**
 * @brief Concrete implementation of IExecutionContext
 *
 * Holds the executor for one run. Nested blocks share the context of the
 * run; no state is copied per block.
 */
class ExecutionContextImpl : public IExecutionContext {
public:
    ExecutionContextImpl(std::shared_ptr<IActionExecutor> executor, const std::string &runId);

    virtual ~ExecutionContextImpl() = default;

    // IExecutionContext implementation
    IActionExecutor &getActionExecutor() override;
    std::string getRunId() const override;
    bool isValid() const override;

private:
    std::shared_ptr<IActionExecutor> executor_;
    std::string runId_;
};

}  // namespace RSE
