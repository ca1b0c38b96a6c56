#include "runtime/StepControl.h"
#include "common/LogUtils.h"
#include "common/Logger.h"

namespace RSE {

StepControl::StepControl(StepMode mode, size_t targetStep, std::set<int> breakpoints)
    : initialMode_(mode), mode_(mode), targetStep_(targetStep), breakpoints_(std::move(breakpoints)) {}

bool StepControl::report(const std::string &stepId, int instrumentedLine, int originalLine,
                         const std::string &description) {
    ++counter_;
    LOG_TRACE("StepControl: #{} {} (instrumented {}, original {}) {}", counter_, stepId, instrumentedLine,
              originalLine, Log::preview(description));

    switch (mode_) {
    case StepMode::Step:
        return true;

    case StepMode::Continue:
        if (counter_ > resumeAfter_ && originalLine > 0 && breakpoints_.count(originalLine) > 0) {
            LOG_DEBUG("StepControl: breakpoint hit at line {} (step {})", originalLine, counter_);
            breakpointLine_ = originalLine;
            mode_ = StepMode::Step;
            return false;
        }
        return true;

    case StepMode::RunToTarget:
        if (counter_ >= targetStep_) {
            LOG_DEBUG("StepControl: target step {} reached", targetStep_);
            return false;
        }
        return true;
    }
    return true;
}

void StepControl::reset() {
    mode_ = initialMode_;
    counter_ = 0;
    breakpointLine_.reset();
}

std::string StepControl::modeToString(StepMode mode) {
    switch (mode) {
    case StepMode::Step:
        return "step";
    case StepMode::Continue:
        return "continue";
    case StepMode::RunToTarget:
        return "run-to-target";
    }
    return "step";
}

std::optional<StepMode> StepControl::modeFromString(const std::string &name) {
    if (name == "step") {
        return StepMode::Step;
    }
    if (name == "continue") {
        return StepMode::Continue;
    }
    if (name == "run-to-target") {
        return StepMode::RunToTarget;
    }
    return std::nullopt;
}

}  // namespace RSE
