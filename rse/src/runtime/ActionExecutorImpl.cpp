#include "runtime/ActionExecutorImpl.h"
#include "actions/AssignAction.h"
#include "actions/ExpressionAction.h"
#include "actions/ForeachAction.h"
#include "actions/IfAction.h"
#include "actions/LoopControlAction.h"
#include "actions/PassAction.h"
#include "actions/RecordTypeAction.h"
#include "actions/WhileAction.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "common/RuleError.h"
#include "common/ValueHelper.h"
#include "runtime/ExecutionContextImpl.h"
#include "runtime/StepRecorder.h"
#include <stdexcept>

namespace RSE {

namespace {

Environment &requireEnvironment(const std::shared_ptr<Environment> &environment) {
    if (!environment) {
        throw std::invalid_argument("ActionExecutorImpl requires an environment");
    }
    return *environment;
}

}  // namespace

std::string ExecutionFault::formatted() const {
    return kind + ": " + message;
}

std::string ExecutionFault::formatTraceback() const {
    std::string text = Constants::TRACEBACK_HEADER;
    text += "\n";
    for (const auto &[frameLine, source] : frames) {
        text += "  line " + std::to_string(frameLine) + ": " + source + "\n";
    }
    text += formatted();
    return text;
}

// Keeps the statement stack used for tracebacks in step with the C++ stack
class ActionExecutorImpl::FrameGuard {
public:
    FrameGuard(std::vector<std::pair<int, std::string>> &frames, const IActionNode &action) : frames_(frames) {
        frames_.emplace_back(action.getLine(), action.getSourceText());
    }

    ~FrameGuard() {
        frames_.pop_back();
    }

    FrameGuard(const FrameGuard &) = delete;
    FrameGuard &operator=(const FrameGuard &) = delete;

private:
    std::vector<std::pair<int, std::string>> &frames_;
};

ActionExecutorImpl::ActionExecutorImpl(const std::string &runId, std::shared_ptr<Environment> environment,
                                       StepRecorder *recorder)
    : runId_(runId), environment_(std::move(environment)), evaluator_(requireEnvironment(environment_)),
      recorder_(recorder) {
    LOG_DEBUG("ActionExecutorImpl created for run: {}", runId_);
}

ActionExecutorImpl::~ActionExecutorImpl() {
    LOG_DEBUG("ActionExecutorImpl destroyed for run: {}", runId_);
}

template <typename Body> bool ActionExecutorImpl::guarded(const IActionNode &action, Body &&body) {
    FrameGuard frame(frames_, action);
    try {
        return body();
    } catch (const RuleError &e) {
        recordFault(e, action);
        return false;
    } catch (const std::exception &e) {
        recordFault(e, action);
        return false;
    }
}

void ActionExecutorImpl::recordFault(const RuleError &error, const IActionNode &action) {
    if (fault_) {
        return;
    }
    ExecutionFault fault;
    fault.kind = error.kind();
    fault.message = error.message();
    fault.line = error.line() > 0 ? error.line() : action.getLine();
    fault.statement = action.getSourceText();
    fault.frames = frames_;
    LOG_ERROR("Run {}: {} at line {} in '{}'", runId_, Log::sanitize(fault.formatted()), fault.line,
              Log::preview(fault.statement));
    fault_ = std::move(fault);
}

void ActionExecutorImpl::recordFault(const std::exception &error, const IActionNode &action) {
    if (fault_) {
        return;
    }
    ExecutionFault fault;
    fault.kind = "InternalError";
    fault.message = error.what();
    fault.line = action.getLine();
    fault.statement = action.getSourceText();
    fault.frames = frames_;
    LOG_ERROR("Run {}: unexpected failure at line {}: {}", runId_, fault.line, error.what());
    fault_ = std::move(fault);
}

void ActionExecutorImpl::recordStep(const IActionNode &action, const std::string &description) {
    if (!recorder_ || !recordStatementSteps_) {
        return;
    }
    recorder_->recordStep(action.getLine(), action.getLine(), environment_->getBindings(), description);
}

void ActionExecutorImpl::recordControlStep(const IActionNode &action, int line, const std::string &description) {
    if (!recorder_ || !recordStatementSteps_ || !recordControlSteps_) {
        return;
    }
    recorder_->recordStep(line > 0 ? line : action.getLine(), line > 0 ? line : action.getLine(),
                          environment_->getBindings(), description);
}

void ActionExecutorImpl::checkLoopIterations(size_t iterations, int line) const {
    if (iterations > maxLoopIterations_) {
        throw LimitExceededError("loop iteration limit of " + std::to_string(maxLoopIterations_) + " exceeded",
                                 line);
    }
}

bool ActionExecutorImpl::executeBlock(const ActionList &actions) {
    auto sharedThis = std::shared_ptr<IActionExecutor>(this, [](IActionExecutor *) {});
    ExecutionContextImpl context(sharedThis, runId_);

    for (const auto &action : actions) {
        if (!action) {
            continue;
        }
        if (!action->execute(context)) {
            return false;
        }
        if (haltRequested_) {
            LOG_DEBUG("Run {}: halted after line {}", runId_, action->getLine());
            return false;
        }
        if (signal_ != LoopSignal::None) {
            return true;
        }
    }
    return true;
}

bool ActionExecutorImpl::executeProgram(const ActionList &program) {
    fault_.reset();
    frames_.clear();
    haltRequested_ = false;
    signal_ = LoopSignal::None;

    LOG_DEBUG("Run {}: executing {} top-level statements", runId_, program.size());
    bool completed = executeBlock(program);
    LOG_DEBUG("Run {}: finished (completed: {}, fault: {}, halted: {})", runId_, completed, fault_.has_value(),
              haltRequested_);
    return completed;
}

ActionExecutorImpl::BodyOutcome ActionExecutorImpl::runLoopBody(const ActionList &body) {
    if (!executeBlock(body)) {
        return BodyOutcome::Stop;
    }
    LoopSignal signal = signal_;
    signal_ = LoopSignal::None;
    return signal == LoopSignal::Break ? BodyOutcome::Break : BodyOutcome::Next;
}

bool ActionExecutorImpl::executeAssignAction(const AssignAction &action) {
    return guarded(action, [&]() {
        if (!action.getValue()) {
            throw RuleSyntaxError("assignment without a value", action.getLine());
        }

        if (action.isAugmented()) {
            const Expression &target = *action.getTargets().front();
            RuleValue current = evaluator_.evaluate(target);
            RuleValue operand = evaluator_.evaluate(*action.getValue());
            RuleValue result =
                ExpressionEvaluator::applyBinary(action.getAugmentedOperator(), current, operand, action.getLine());
            evaluator_.assign(target, result);
            recordStep(action, target.toSource() + " = " + ValueHelper::toRepr(result));
            return true;
        }

        RuleValue value = evaluator_.evaluate(*action.getValue());
        for (const auto &target : action.getTargets()) {
            evaluator_.assign(*target, value);
            recordStep(action, target->toSource() + " = " + ValueHelper::toRepr(value));
        }
        return true;
    });
}

bool ActionExecutorImpl::executeIfAction(const IfAction &action) {
    return guarded(action, [&]() {
        for (const auto &branch : action.getBranches()) {
            if (!branch.isElseBranch) {
                bool taken = evaluator_.evaluateCondition(*branch.condition);
                recordControlStep(action, branch.line,
                                  std::string(&branch == &action.getBranches().front() ? "if " : "elif ") +
                                      branch.condition->toSource() + " -> " + (taken ? "True" : "False"));
                if (!taken) {
                    continue;
                }
            }
            LOG_TRACE("Run {}: taking {} branch at line {}", runId_, branch.isElseBranch ? "else" : "conditional",
                      branch.line);
            return executeBlock(branch.actions);
        }
        return true;
    });
}

bool ActionExecutorImpl::executeForeachAction(const ForeachAction &action) {
    return guarded(action, [&]() {
        RuleValue iterable = evaluator_.evaluate(*action.getArray());
        std::vector<RuleValue> items = ExpressionEvaluator::iterate(iterable, action.getLine());
        LOG_TRACE("Run {}: for loop over {} items at line {}", runId_, items.size(), action.getLine());

        size_t iterations = 0;
        for (const auto &item : items) {
            checkLoopIterations(++iterations, action.getLine());
            environment_->set(action.getItem(), item);
            recordControlStep(action, action.getLine(),
                              "for " + action.getItem() + " in " + action.getArray()->toSource() + " -> " +
                                  action.getItem() + " = " + ValueHelper::toRepr(item));

            BodyOutcome outcome = runLoopBody(action.getIterationActions());
            if (outcome == BodyOutcome::Stop) {
                return false;
            }
            if (outcome == BodyOutcome::Break) {
                return true;
            }
        }

        if (action.hasCompletionBranch()) {
            return executeBlock(action.getCompletionActions());
        }
        return true;
    });
}

bool ActionExecutorImpl::executeWhileAction(const WhileAction &action) {
    return guarded(action, [&]() {
        size_t iterations = 0;
        while (true) {
            bool holds = evaluator_.evaluateCondition(*action.getCondition());
            recordControlStep(action, action.getLine(),
                              "while " + action.getCondition()->toSource() + " -> " + (holds ? "True" : "False"));
            if (!holds) {
                break;
            }
            checkLoopIterations(++iterations, action.getLine());

            BodyOutcome outcome = runLoopBody(action.getBodyActions());
            if (outcome == BodyOutcome::Stop) {
                return false;
            }
            if (outcome == BodyOutcome::Break) {
                return true;
            }
        }

        if (action.hasCompletionBranch()) {
            return executeBlock(action.getCompletionActions());
        }
        return true;
    });
}

bool ActionExecutorImpl::executeExpressionAction(const ExpressionAction &action) {
    return guarded(action, [&]() {
        RuleValue result = evaluator_.evaluate(*action.getExpression());
        if (haltRequested_) {
            return false;
        }
        recordStep(action, action.getExpression()->toSource() + " -> " + ValueHelper::toRepr(result));
        return true;
    });
}

bool ActionExecutorImpl::executeLoopControlAction(const LoopControlAction &action) {
    return guarded(action, [&]() {
        recordStep(action, action.getSourceText());
        signal_ = action.isBreak() ? LoopSignal::Break : LoopSignal::Continue;
        return true;
    });
}

bool ActionExecutorImpl::executePassAction(const PassAction &) {
    return true;
}

bool ActionExecutorImpl::executeRecordTypeAction(const RecordTypeAction &action) {
    return guarded(action, [&]() {
        auto type = std::make_shared<RuleRecordType>();
        type->name = action.getTypeName();
        for (const auto &[field, expression] : action.getFieldDefaults()) {
            type->defaults.set(field, evaluator_.evaluate(*expression));
        }
        environment_->set(action.getTypeName(), RuleRecordTypePtr(type));
        LOG_TRACE("Run {}: declared record type {} with {} fields", runId_, type->name, type->defaults.size());
        return true;
    });
}

RuleValue ActionExecutorImpl::evaluateExpression(const Expression &expression) {
    return evaluator_.evaluate(expression);
}

bool ActionExecutorImpl::evaluateCondition(const Expression &condition) {
    return evaluator_.evaluateCondition(condition);
}

void ActionExecutorImpl::assignTarget(const Expression &target, const RuleValue &value) {
    evaluator_.assign(target, value);
}

bool ActionExecutorImpl::hasVariable(const std::string &name) const {
    return environment_->isBound(name);
}

std::string ActionExecutorImpl::getRunId() const {
    return runId_;
}

}  // namespace RSE
