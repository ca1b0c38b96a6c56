#pragma once

#include <optional>
#include <set>
#include <string>

namespace RSE {

enum class StepMode {
    Step,        // record everything, never pause
    Continue,    // run until a breakpoint line, then behave like Step
    RunToTarget  // pause when the counter reaches the target step
};

/**
 * @brief Per-execution pause decision for instrumented runs
 *
 * Consulted by every step marker. Never shared between executions; create
 * one per run (or reset() it) so counters start at zero.
 */
class StepControl {
public:
    explicit StepControl(StepMode mode = StepMode::Step, size_t targetStep = 0, std::set<int> breakpoints = {});

    /**
     * @brief Count a marker invocation and decide whether to keep running
     * @return false when execution must pause after this step
     */
    bool report(const std::string &stepId, int instrumentedLine, int originalLine, const std::string &description);

    /**
     * @brief Ignore breakpoints on the first `step` markers
     *
     * Used when continuing from a paused position: the breakpoint that caused
     * the previous pause must not trigger again.
     */
    void setResumeAfter(size_t step) {
        resumeAfter_ = step;
    }

    void reset();

    size_t getCounter() const {
        return counter_;
    }

    StepMode getMode() const {
        return mode_;
    }

    size_t getTargetStep() const {
        return targetStep_;
    }

    bool hitBreakpoint() const {
        return breakpointLine_.has_value();
    }

    std::optional<int> getBreakpointLine() const {
        return breakpointLine_;
    }

    const std::set<int> &getBreakpoints() const {
        return breakpoints_;
    }

    static std::string modeToString(StepMode mode);
    static std::optional<StepMode> modeFromString(const std::string &name);

private:
    StepMode initialMode_;
    StepMode mode_;
    size_t targetStep_;
    std::set<int> breakpoints_;
    size_t counter_ = 0;
    size_t resumeAfter_ = 0;
    std::optional<int> breakpointLine_;
};

}  // namespace RSE
