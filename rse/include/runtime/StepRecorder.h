#pragma once

#include "RSETypes.h"
#include "common/Constants.h"
#include "common/JsonUtils.h"
#include <optional>
#include <string>
#include <vector>

namespace RSE {

/**
 * @brief One recorded step of a rule execution
 */
struct StepRecord {
    size_t index = 0;
    int line = 0;              // original source line, 0 for synthetic steps
    int instrumentedLine = 0;  // equals line when no rewrite happened
    json variables = json::object();
    std::string output;
    std::optional<std::string> error;
    std::optional<std::string> traceback;
    std::optional<std::string> stepId;

    bool hasError() const {
        return error.has_value();
    }

    /**
     * @brief Wire shape {line, variables, output, error?, traceback?}
     * @param includeInstrumentation add instrumentedLine and stepId
     */
    json toJson(bool includeInstrumentation = false) const;
};

/**
 * @brief Ordered, append-only step history of one execution
 *
 * Variables are captured as independent JSON snapshots at record time.
 * The history is bounded by maxSteps; exceeding it raises
 * LimitExceededError so a runaway rule ends through the error boundary.
 */
class StepRecorder {
public:
    explicit StepRecorder(size_t maxSteps = Constants::DEFAULT_MAX_STEPS);

    /**
     * @brief Record a statement step
     * @throws LimitExceededError when the step budget is exhausted
     */
    const StepRecord &recordStep(int line, int instrumentedLine, const FieldTable &bindings,
                                 const std::string &description, std::optional<std::string> stepId = std::nullopt);

    /**
     * @brief Record the terminal error step
     *
     * Never subject to the step budget: the error of a runaway rule must
     * still be reported.
     */
    const StepRecord &recordError(int line, int instrumentedLine, const FieldTable &bindings,
                                  const std::string &description, const std::string &error,
                                  const std::string &traceback);

    /**
     * @brief Record the synthetic completion step (line 0)
     */
    const StepRecord &recordCompletion(const FieldTable &bindings);

    const std::vector<StepRecord> &getSteps() const {
        return steps_;
    }

    std::optional<StepRecord> getStep(size_t index) const;
    std::optional<StepRecord> getLatestStep() const;

    size_t size() const {
        return steps_.size();
    }

    bool empty() const {
        return steps_.empty();
    }

    size_t maxSteps() const {
        return maxSteps_;
    }

    void clear() {
        steps_.clear();
    }

    json toJson(bool includeInstrumentation = false) const;

private:
    size_t maxSteps_;
    std::vector<StepRecord> steps_;

    StepRecord &append(int line, int instrumentedLine, const FieldTable &bindings, const std::string &description);
};

}  // namespace RSE
