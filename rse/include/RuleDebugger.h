// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2026 The RSE Authors
//
// This file is part of RSE (Rule Step Engine).

#pragma once

#include "RSETypes.h"
#include "common/Constants.h"
#include "common/JsonUtils.h"
#include "runtime/StepControl.h"
#include "runtime/StepRecorder.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace RSE {

enum class ExecutionMode {
    TreeWalk,     // interpret the statement tree directly
    Instrumented  // rewrite with step markers and run the rewrite
};

/**
 * @brief Per-run configuration
 */
struct DebugOptions {
    ExecutionMode mode = ExecutionMode::TreeWalk;
    bool recordControlSteps = false;  // tree walk only: if/elif tests and loop iterations
    size_t maxSteps = Constants::DEFAULT_MAX_STEPS;
    size_t maxLoopIterations = Constants::DEFAULT_MAX_LOOP_ITERATIONS;
    size_t messageCapacity = Constants::DEFAULT_MESSAGE_CAPACITY;
    bool includeSource = false;  // attach the instrumented source to the result

    // Pause control, instrumented mode only
    StepMode stepMode = StepMode::Step;
    size_t targetStep = 0;
    std::set<int> breakpoints;
    size_t resumeAfter = 0;
};

/**
 * @brief Everything one execution attempt produced
 *
 * success is true whenever the debugger itself ran; rule failures appear as
 * an error on the terminal step.
 */
struct DebugResult {
    bool success = false;
    std::vector<StepRecord> debugSteps;
    std::vector<std::string> output;
    bool paused = false;
    bool hitBreakpoint = false;
    bool instrumented = false;
    std::optional<std::string> instrumentedSource;
    size_t droppedMessages = 0;

    /**
     * @brief First step carrying an error, if any
     */
    const StepRecord *findError() const;

    json toJson() const;
};

enum class StepDebugMode { Initialize, Step, Continue };

/**
 * @brief Interactive stepping request
 *
 * JSON form: {"code": "...", "mode": "initialize"|"step"|"continue",
 * "currentStep": N, "breakpoints": [lines]}
 */
struct StepDebugRequest {
    std::string source;
    StepDebugMode mode = StepDebugMode::Initialize;
    size_t currentStep = 0;
    std::set<int> breakpoints;

    static std::optional<StepDebugRequest> fromJson(const json &request, std::string *errorOut = nullptr);
};

struct StepDebugResponse {
    bool success = false;
    size_t currentStep = 0;
    int currentLine = 0;   // line in the instrumented source
    int businessLine = 0;  // line in the rule as written
    json variables = json::object();
    bool isCompleted = false;
    bool canStepForward = false;
    bool canContinue = false;
    std::vector<std::string> output;
    std::optional<std::string> error;
    bool hitBreakpoint = false;

    json toJson() const;
};

/**
 * @brief Entry point for stepwise rule execution
 *
 * Every call builds a fresh environment, recorder and step control; a
 * RuleDebugger holds only configuration and may be shared between threads.
 */
class RSE_API RuleDebugger {
public:
    explicit RuleDebugger(DebugOptions options = DebugOptions());

    DebugResult debug(const std::string &source) const;

    /**
     * @brief Re-run the rule from scratch up to the next pause point
     *
     * initialize pauses at step 1, step at currentStep + 1, continue at the
     * first breakpoint line reached after currentStep (or runs to the end).
     */
    StepDebugResponse debugStep(const StepDebugRequest &request) const;

    const DebugOptions &getOptions() const {
        return options_;
    }

private:
    DebugOptions options_;
};

/**
 * @brief One-shot convenience wrapper around RuleDebugger::debug
 */
RSE_API DebugResult debugBusinessRule(const std::string &source, const DebugOptions &options = DebugOptions());

}  // namespace RSE
