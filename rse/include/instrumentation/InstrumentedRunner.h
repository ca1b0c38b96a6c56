#pragma once

#include "actions/IActionNode.h"
#include "common/Constants.h"
#include "instrumentation/Instrumenter.h"
#include <memory>
#include <string>

namespace RSE {

class Environment;
class StepControl;
class StepRecorder;

/**
 * @brief Outcome of one instrumented execution
 */
struct InstrumentedRunResult {
    bool completed = false;  // the end marker was reached
    bool paused = false;     // a marker asked to stop before the end
    bool faulted = false;
    std::string source;
    LineMap lineMap;
};

/**
 * @brief Executes a program through its instrumented rewrite
 *
 * Rewrites the program, parses the printed source again and runs it with
 * the __rule_step__ marker registered. Only markers record steps. Errors are
 * mapped back to original lines, recorded as the terminal error step and
 * followed by the synthetic completion step.
 */
class InstrumentedRunner {
public:
    InstrumentedRunner(const std::string &runId, std::shared_ptr<Environment> environment, StepRecorder &recorder,
                       StepControl &control);

    void setMaxLoopIterations(size_t limit) {
        maxLoopIterations_ = limit;
    }

    InstrumentedRunResult run(const ActionList &program);

private:
    std::string runId_;
    std::shared_ptr<Environment> environment_;
    StepRecorder &recorder_;
    StepControl &control_;
    size_t maxLoopIterations_ = Constants::DEFAULT_MAX_LOOP_ITERATIONS;
};

}  // namespace RSE
