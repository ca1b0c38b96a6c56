#pragma once

#include "actions/IActionNode.h"
#include "common/Constants.h"
#include "runtime/Environment.h"
#include "runtime/IActionExecutor.h"
#include "scripting/ExpressionEvaluator.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace RSE {

class RuleError;
class StepRecorder;

/**
 * @brief First failure of a run, captured where it happened
 */
struct ExecutionFault {
    std::string kind;
    std::string message;
    int line = 0;
    std::string statement;
    // Enclosing statements, outermost first, failing statement last
    std::vector<std::pair<int, std::string>> frames;

    /**
     * @brief "<Kind>: <message>"
     */
    std::string formatted() const;

    /**
     * @brief Header, one "  line N: <statement>" entry per frame, error line
     */
    std::string formatTraceback() const;
};

/**
 * @brief Tree-walking implementation of IActionExecutor
 *
 * Runs statements of one execution against its Environment. Evaluation
 * errors are caught at the failing statement, stored as the run's fault,
 * logged, and turned into a false return that unwinds every enclosing
 * block. Steps go to the StepRecorder when one is attached.
 *
 * In instrumented runs statement steps are disabled: the step markers in
 * the rewritten source do the recording and may request a halt.
 */
class ActionExecutorImpl : public IActionExecutor {
public:
    /**
     * @brief Construct executor for one run
     * @param runId Identifier used in log lines
     * @param environment Bindings and built-ins of the run
     * @param recorder Step sink; may be null when steps are not wanted
     */
    ActionExecutorImpl(const std::string &runId, std::shared_ptr<Environment> environment,
                       StepRecorder *recorder = nullptr);

    virtual ~ActionExecutorImpl();

    // High-level action execution methods (Command pattern)
    bool executeAssignAction(const AssignAction &action) override;
    bool executeIfAction(const IfAction &action) override;
    bool executeForeachAction(const ForeachAction &action) override;
    bool executeWhileAction(const WhileAction &action) override;
    bool executeExpressionAction(const ExpressionAction &action) override;
    bool executeLoopControlAction(const LoopControlAction &action) override;
    bool executePassAction(const PassAction &action) override;
    bool executeRecordTypeAction(const RecordTypeAction &action) override;

    // Low-level primitives
    RuleValue evaluateExpression(const Expression &expression) override;
    bool evaluateCondition(const Expression &condition) override;
    void assignTarget(const Expression &target, const RuleValue &value) override;
    bool hasVariable(const std::string &name) const override;
    std::string getRunId() const override;

    /**
     * @brief Run a statement list in order
     * @return false when a statement faulted or a halt was requested
     */
    bool executeBlock(const ActionList &actions);

    /**
     * @brief Run a whole program from a clean fault and halt state
     */
    bool executeProgram(const ActionList &program);

    void setRecordStatementSteps(bool enabled) {
        recordStatementSteps_ = enabled;
    }

    void setRecordControlSteps(bool enabled) {
        recordControlSteps_ = enabled;
    }

    void setMaxLoopIterations(size_t limit) {
        maxLoopIterations_ = limit == 0 ? Constants::DEFAULT_MAX_LOOP_ITERATIONS : limit;
    }

    /**
     * @brief Stop cooperatively after the current statement
     */
    void requestHalt() {
        haltRequested_ = true;
    }

    bool isHaltRequested() const {
        return haltRequested_;
    }

    bool hasFault() const {
        return fault_.has_value();
    }

    const std::optional<ExecutionFault> &getFault() const {
        return fault_;
    }

    Environment &getEnvironment() const {
        return *environment_;
    }

private:
    enum class LoopSignal { None, Break, Continue };
    enum class BodyOutcome { Next, Break, Stop };

    class FrameGuard;

    std::string runId_;
    std::shared_ptr<Environment> environment_;
    ExpressionEvaluator evaluator_;
    StepRecorder *recorder_;

    bool recordStatementSteps_ = true;
    bool recordControlSteps_ = false;
    size_t maxLoopIterations_ = Constants::DEFAULT_MAX_LOOP_ITERATIONS;

    LoopSignal signal_ = LoopSignal::None;
    bool haltRequested_ = false;
    std::vector<std::pair<int, std::string>> frames_;
    std::optional<ExecutionFault> fault_;

    template <typename Body> bool guarded(const IActionNode &action, Body &&body);

    void recordFault(const RuleError &error, const IActionNode &action);
    void recordFault(const std::exception &error, const IActionNode &action);

    void recordStep(const IActionNode &action, const std::string &description);
    void recordControlStep(const IActionNode &action, int line, const std::string &description);

    // Runs one loop iteration and consumes a break/continue signal
    BodyOutcome runLoopBody(const ActionList &body);

    void checkLoopIterations(size_t iterations, int line) const;
};

}  // namespace RSE
