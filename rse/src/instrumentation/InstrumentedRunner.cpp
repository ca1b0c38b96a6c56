#include "instrumentation/InstrumentedRunner.h"
#include "common/Logger.h"
#include "common/RuleError.h"
#include "common/ValueHelper.h"
#include "parsing/RuleParser.h"
#include "runtime/ActionExecutorImpl.h"
#include "runtime/Environment.h"
#include "runtime/StepControl.h"
#include "runtime/StepRecorder.h"
#include <fmt/format.h>
#include <stdexcept>

namespace RSE {

namespace {

struct MarkerArguments {
    std::string stepId;
    int instrumentedLine = 0;
    int originalLine = 0;
    std::string description;
};

MarkerArguments unpackMarker(const CallArguments &args) {
    if (args.positional.size() != 4 || !args.keywords.empty()) {
        throw RuleTypeError(fmt::format("{}() takes exactly 4 arguments ({} given)", Constants::STEP_MARKER_NAME,
                                        args.positional.size()));
    }
    const auto *stepId = std::get_if<std::string>(&args.positional[0]);
    const auto *description = std::get_if<std::string>(&args.positional[3]);
    if (!stepId || !description) {
        throw RuleTypeError(fmt::format("{}() expects (str, int, int, str)", Constants::STEP_MARKER_NAME));
    }
    MarkerArguments marker;
    marker.stepId = *stepId;
    marker.instrumentedLine = static_cast<int>(ValueHelper::toInteger(args.positional[1]));
    marker.originalLine = static_cast<int>(ValueHelper::toInteger(args.positional[2]));
    marker.description = *description;
    return marker;
}

// The marker callback refers to per-run locals; it must not outlive run()
class MarkerRegistration {
public:
    MarkerRegistration(BuiltinRegistry &registry, BuiltinFunction::Callback callback) : registry_(registry) {
        registry_.registerFunction(Constants::STEP_MARKER_NAME, std::move(callback));
    }

    ~MarkerRegistration() {
        registry_.removeFunction(Constants::STEP_MARKER_NAME);
    }

    MarkerRegistration(const MarkerRegistration &) = delete;
    MarkerRegistration &operator=(const MarkerRegistration &) = delete;

private:
    BuiltinRegistry &registry_;
};

bool isMarkerStatement(const std::string &statement) {
    return statement.rfind(Constants::STEP_MARKER_NAME, 0) == 0;
}

}  // namespace

InstrumentedRunner::InstrumentedRunner(const std::string &runId, std::shared_ptr<Environment> environment,
                                       StepRecorder &recorder, StepControl &control)
    : runId_(runId), environment_(std::move(environment)), recorder_(recorder), control_(control) {
    if (!environment_) {
        throw std::invalid_argument("InstrumentedRunner requires an environment");
    }
}

InstrumentedRunResult InstrumentedRunner::run(const ActionList &program) {
    InstrumentedRunResult result;

    Instrumenter instrumenter;
    InstrumentedProgram instrumented = instrumenter.instrument(program);
    result.source = instrumented.source;
    result.lineMap = instrumented.lineMap;
    LOG_DEBUG("Run {}: instrumented source has {} lines", runId_, instrumented.lineMap.size());

    ActionList rewritten;
    try {
        rewritten = RuleParser::parse(instrumented.source);
    } catch (const RuleError &e) {
        // The printer only emits what the parser accepts; reaching this is an engine defect
        LOG_ERROR("Run {}: instrumented source failed to parse: {}", runId_, e.what());
        recorder_.recordError(0, e.line(), environment_->getBindings(), "", e.formatted(),
                              std::string(Constants::TRACEBACK_HEADER) + "\n" + e.formatted());
        recorder_.recordCompletion(environment_->getBindings());
        result.faulted = true;
        return result;
    }

    control_.reset();
    ActionExecutorImpl executor(runId_, environment_, &recorder_);
    executor.setRecordStatementSteps(false);
    executor.setMaxLoopIterations(maxLoopIterations_);

    bool reachedEnd = false;
    Environment &environment = *environment_;
    MarkerRegistration registration(environment.getBuiltins(), [&](const CallArguments &args) -> RuleValue {
        MarkerArguments marker = unpackMarker(args);
        recorder_.recordStep(marker.originalLine, marker.instrumentedLine, environment.getBindings(),
                             marker.description, marker.stepId);
        if (marker.stepId == Constants::COMPLETION_STEP_ID) {
            reachedEnd = true;
        }
        bool keepRunning =
            control_.report(marker.stepId, marker.instrumentedLine, marker.originalLine, marker.description);
        if (!keepRunning) {
            executor.requestHalt();
        }
        return keepRunning;
    });

    executor.executeProgram(rewritten);

    result.completed = reachedEnd;
    result.paused = executor.isHaltRequested() && !reachedEnd;

    if (const auto &fault = executor.getFault()) {
        result.faulted = true;

        ExecutionFault mapped = *fault;
        mapped.line = result.lineMap.toOriginal(fault->line);
        mapped.frames.clear();
        for (const auto &[frameLine, statement] : fault->frames) {
            if (!isMarkerStatement(statement)) {
                mapped.frames.emplace_back(result.lineMap.toOriginal(frameLine), statement);
            }
        }
        std::string description = isMarkerStatement(fault->statement) ? mapped.formatted() : fault->statement;

        recorder_.recordError(mapped.line, fault->line, environment.getBindings(), description, mapped.formatted(),
                              mapped.formatTraceback());
        recorder_.recordCompletion(environment.getBindings());
        result.paused = false;
    }

    LOG_DEBUG("Run {}: instrumented run finished (completed: {}, paused: {}, steps: {})", runId_, result.completed,
              result.paused, recorder_.size());
    return result;
}

}  // namespace RSE
