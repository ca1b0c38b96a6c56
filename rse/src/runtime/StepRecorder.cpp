#include "runtime/StepRecorder.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "common/RuleError.h"
#include "common/SnapshotSerializer.h"

namespace RSE {

json StepRecord::toJson(bool includeInstrumentation) const {
    json result = {{"line", line}, {"variables", variables}, {"output", output}};
    if (error) {
        result["error"] = *error;
    }
    if (traceback) {
        result["traceback"] = *traceback;
    }
    if (includeInstrumentation) {
        result["instrumentedLine"] = instrumentedLine;
        if (stepId) {
            result["stepId"] = *stepId;
        }
    }
    return result;
}

StepRecorder::StepRecorder(size_t maxSteps) : maxSteps_(maxSteps == 0 ? Constants::DEFAULT_MAX_STEPS : maxSteps) {}

StepRecord &StepRecorder::append(int line, int instrumentedLine, const FieldTable &bindings,
                                 const std::string &description) {
    StepRecord record;
    record.index = steps_.size();
    record.line = line;
    record.instrumentedLine = instrumentedLine;
    record.variables = SnapshotSerializer::captureVariables(bindings);
    record.output = description;
    steps_.push_back(std::move(record));
    return steps_.back();
}

const StepRecord &StepRecorder::recordStep(int line, int instrumentedLine, const FieldTable &bindings,
                                           const std::string &description, std::optional<std::string> stepId) {
    if (steps_.size() >= maxSteps_) {
        throw LimitExceededError("step limit of " + std::to_string(maxSteps_) + " exceeded", line);
    }
    StepRecord &record = append(line, instrumentedLine, bindings, description);
    record.stepId = std::move(stepId);
    LOG_TRACE("StepRecorder: step {} line {} - {}", record.index, line, Log::preview(description));
    return record;
}

const StepRecord &StepRecorder::recordError(int line, int instrumentedLine, const FieldTable &bindings,
                                            const std::string &description, const std::string &error,
                                            const std::string &traceback) {
    StepRecord &record = append(line, instrumentedLine, bindings, description);
    record.error = error;
    record.traceback = traceback;
    LOG_DEBUG("StepRecorder: error step {} line {} - {}", record.index, line, Log::sanitize(error));
    return record;
}

const StepRecord &StepRecorder::recordCompletion(const FieldTable &bindings) {
    StepRecord &record = append(0, 0, bindings, Constants::COMPLETION_DESCRIPTION);
    record.stepId = Constants::COMPLETION_STEP_ID;
    return record;
}

std::optional<StepRecord> StepRecorder::getStep(size_t index) const {
    if (index >= steps_.size()) {
        return std::nullopt;
    }
    return steps_[index];
}

std::optional<StepRecord> StepRecorder::getLatestStep() const {
    if (steps_.empty()) {
        return std::nullopt;
    }
    return steps_.back();
}

json StepRecorder::toJson(bool includeInstrumentation) const {
    json result = json::array();
    for (const auto &step : steps_) {
        result.push_back(step.toJson(includeInstrumentation));
    }
    return result;
}

}  // namespace RSE
