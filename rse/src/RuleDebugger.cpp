// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2026 The RSE Authors
//
// This file is part of RSE (Rule Step Engine).

#include "RuleDebugger.h"
#include "common/Logger.h"
#include "common/RuleError.h"
#include "instrumentation/InstrumentedRunner.h"
#include "parsing/RuleParser.h"
#include "runtime/ActionExecutorImpl.h"
#include "runtime/Environment.h"
#include "scripting/BufferedMessageSink.h"
#include "scripting/BuiltinRegistry.h"
#include <atomic>

namespace RSE {

namespace {

std::string nextRunId() {
    static std::atomic<uint64_t> counter{0};
    return "run_" + std::to_string(counter.fetch_add(1) + 1);
}

std::string syntaxTraceback(const RuleError &error) {
    return std::string(Constants::TRACEBACK_HEADER) + "\n" + error.formatted();
}

}  // namespace

const StepRecord *DebugResult::findError() const {
    for (const auto &step : debugSteps) {
        if (step.hasError()) {
            return &step;
        }
    }
    return nullptr;
}

json DebugResult::toJson() const {
    json steps = json::array();
    for (const auto &step : debugSteps) {
        steps.push_back(step.toJson(instrumented));
    }

    json result = {{"success", success}, {"debugSteps", steps}, {"output", output}};
    if (paused) {
        result["paused"] = true;
    }
    if (hitBreakpoint) {
        result["hitBreakpoint"] = true;
    }
    if (droppedMessages > 0) {
        result["droppedMessages"] = droppedMessages;
    }
    if (instrumentedSource) {
        result["instrumentedSource"] = *instrumentedSource;
    }
    return result;
}

std::optional<StepDebugRequest> StepDebugRequest::fromJson(const json &request, std::string *errorOut) {
    auto fail = [errorOut](const std::string &message) -> std::optional<StepDebugRequest> {
        if (errorOut) {
            *errorOut = message;
        }
        return std::nullopt;
    };

    if (!request.is_object()) {
        return fail("request must be a JSON object");
    }

    StepDebugRequest parsed;
    parsed.source = JsonUtils::getString(request, "code");
    if (parsed.source.empty()) {
        return fail("code is required");
    }

    std::string mode = JsonUtils::getString(request, "mode", "initialize");
    if (mode == "initialize") {
        parsed.mode = StepDebugMode::Initialize;
    } else if (mode == "step") {
        parsed.mode = StepDebugMode::Step;
    } else if (mode == "continue") {
        parsed.mode = StepDebugMode::Continue;
    } else {
        return fail("unknown mode '" + mode + "'");
    }

    int currentStep = JsonUtils::getInt(request, "currentStep", 0);
    parsed.currentStep = currentStep > 0 ? static_cast<size_t>(currentStep) : 0;
    for (int line : JsonUtils::getIntArray(request, "breakpoints")) {
        if (line > 0) {
            parsed.breakpoints.insert(line);
        }
    }
    return parsed;
}

json StepDebugResponse::toJson() const {
    json result = {{"success", success},
                   {"currentStep", currentStep},
                   {"currentLine", currentLine},
                   {"businessLine", businessLine},
                   {"variables", variables},
                   {"isCompleted", isCompleted},
                   {"canStepForward", canStepForward},
                   {"canContinue", canContinue},
                   {"output", output},
                   {"hitBreakpoint", hitBreakpoint}};
    if (error) {
        result["error"] = *error;
    }
    return result;
}

RuleDebugger::RuleDebugger(DebugOptions options) : options_(std::move(options)) {}

DebugResult RuleDebugger::debug(const std::string &source) const {
    const std::string runId = nextRunId();
    const bool instrumented = options_.mode == ExecutionMode::Instrumented;
    LOG_INFO("Run {}: debugging rule ({} bytes, {} mode)", runId, source.size(),
             instrumented ? "instrumented" : "tree-walk");

    auto sink = std::make_shared<BufferedMessageSink>(options_.messageCapacity);
    auto environment = std::make_shared<Environment>(std::make_shared<BuiltinRegistry>(sink));
    StepRecorder recorder(options_.maxSteps);

    DebugResult result;
    result.success = true;
    result.instrumented = instrumented;

    ActionList program;
    bool parsed = true;
    try {
        program = RuleParser::parse(source);
    } catch (const RuleSyntaxError &e) {
        LOG_WARN("Run {}: {}", runId, e.formatted());
        recorder.recordError(0, 0, environment->getBindings(), "", e.formatted(), syntaxTraceback(e));
        if (instrumented) {
            recorder.recordCompletion(environment->getBindings());
        }
        parsed = false;
    }

    if (parsed && instrumented) {
        StepControl control(options_.stepMode, options_.targetStep, options_.breakpoints);
        control.setResumeAfter(options_.resumeAfter);

        InstrumentedRunner runner(runId, environment, recorder, control);
        runner.setMaxLoopIterations(options_.maxLoopIterations);
        InstrumentedRunResult outcome = runner.run(program);

        result.paused = outcome.paused;
        result.hitBreakpoint = control.hitBreakpoint();
        if (options_.includeSource) {
            result.instrumentedSource = outcome.source;
        }
    } else if (parsed) {
        ActionExecutorImpl executor(runId, environment, &recorder);
        executor.setRecordControlSteps(options_.recordControlSteps);
        executor.setMaxLoopIterations(options_.maxLoopIterations);
        executor.executeProgram(program);

        if (const auto &fault = executor.getFault()) {
            recorder.recordError(fault->line, fault->line, environment->getBindings(), fault->statement,
                                 fault->formatted(), fault->formatTraceback());
        }
    }

    sink->flushToLogger(runId);
    result.output = sink->messages();
    result.droppedMessages = sink->droppedCount();
    result.debugSteps = recorder.getSteps();

    LOG_INFO("Run {}: {} steps recorded{}", runId, result.debugSteps.size(),
             result.findError() ? " (ended with error)" : "");
    return result;
}

StepDebugResponse RuleDebugger::debugStep(const StepDebugRequest &request) const {
    DebugOptions options = options_;
    options.mode = ExecutionMode::Instrumented;
    options.includeSource = false;
    options.breakpoints = request.breakpoints;
    options.resumeAfter = 0;

    switch (request.mode) {
    case StepDebugMode::Initialize:
        options.stepMode = StepMode::RunToTarget;
        options.targetStep = 1;
        break;
    case StepDebugMode::Step:
        options.stepMode = StepMode::RunToTarget;
        options.targetStep = request.currentStep + 1;
        break;
    case StepDebugMode::Continue:
        options.stepMode = StepMode::Continue;
        options.resumeAfter = request.currentStep;
        break;
    }

    DebugResult result = RuleDebugger(options).debug(request.source);

    StepDebugResponse response;
    response.output = result.output;
    response.hitBreakpoint = result.hitBreakpoint;
    if (result.debugSteps.empty()) {
        response.error = "no steps were recorded";
        response.isCompleted = true;
        return response;
    }

    const StepRecord &current = result.debugSteps.back();
    response.success = result.success;
    response.currentStep = result.debugSteps.size();
    response.currentLine = current.instrumentedLine;
    response.businessLine = current.line;
    response.variables = current.variables;
    response.isCompleted = !result.paused;
    response.canStepForward = !response.isCompleted;
    response.canContinue = !response.isCompleted && !request.breakpoints.empty();
    if (const StepRecord *failed = result.findError()) {
        response.error = failed->error;
    }
    return response;
}

DebugResult debugBusinessRule(const std::string &source, const DebugOptions &options) {
    return RuleDebugger(options).debug(source);
}

}  // namespace RSE
