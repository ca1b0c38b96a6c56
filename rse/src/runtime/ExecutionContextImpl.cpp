#include "runtime/ExecutionContextImpl.h"
#include "common/Logger.h"
#include <stdexcept>

namespace RSE {

ExecutionContextImpl::ExecutionContextImpl(std::shared_ptr<IActionExecutor> executor, const std::string &runId)
    : executor_(std::move(executor)), runId_(runId) {
    LOG_TRACE("Execution context created for run: {}", runId_);
}

IActionExecutor &ExecutionContextImpl::getActionExecutor() {
    if (!executor_) {
        throw std::runtime_error("Action executor is null");
    }
    return *executor_;
}

std::string ExecutionContextImpl::getRunId() const {
    return runId_;
}

bool ExecutionContextImpl::isValid() const {
    return executor_ != nullptr && !runId_.empty();
}

}  // namespace RSE
