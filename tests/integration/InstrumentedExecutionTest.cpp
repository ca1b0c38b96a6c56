#include "RuleDebugger.h"
#include "common/Constants.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace RSE;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class InstrumentedExecutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.mode = ExecutionMode::Instrumented;
    }

    DebugResult debug(const std::string &source) {
        return RuleDebugger(options).debug(source);
    }

    static std::vector<std::string> stepIds(const DebugResult &result) {
        std::vector<std::string> ids;
        for (const auto &step : result.debugSteps) {
            ids.push_back(step.stepId.value_or(""));
        }
        return ids;
    }

    DebugOptions options;
};

TEST_F(InstrumentedExecutionTest, MarkersRecordStepsAndCompletion) {
    auto result = debug("new_bool = True\nnew_bool = False\nif new_bool:\n  log_message(\"m\")\nelse:\n  "
                        "log_message(\"b\")");

    EXPECT_TRUE(result.instrumented);
    ASSERT_EQ(result.debugSteps.size(), 4);
    EXPECT_THAT(stepIds(result), ElementsAre("S1", "S2", "S4", Constants::COMPLETION_STEP_ID));
    EXPECT_EQ(result.debugSteps[2].line, 6);
    EXPECT_EQ(result.debugSteps[2].output, "log_message('b')");
    EXPECT_EQ(result.debugSteps[3].line, 0);
    EXPECT_EQ(result.debugSteps[3].output, Constants::COMPLETION_DESCRIPTION);
    EXPECT_THAT(result.output, ElementsAre("LOG: b"));
    EXPECT_FALSE(result.paused);
}

TEST_F(InstrumentedExecutionTest, MarkerNameIsHiddenFromSnapshots) {
    auto result = debug("x = 1\n");
    for (const auto &step : result.debugSteps) {
        EXPECT_FALSE(step.variables.contains(Constants::STEP_MARKER_NAME));
    }
}

TEST_F(InstrumentedExecutionTest, InstrumentedLinesDifferFromOriginal) {
    options.includeSource = true;
    auto result = debug("a = 1\nb = 2\n");

    ASSERT_EQ(result.debugSteps.size(), 3);
    EXPECT_EQ(result.debugSteps[1].line, 2);
    EXPECT_EQ(result.debugSteps[1].instrumentedLine, 4);
    ASSERT_TRUE(result.instrumentedSource.has_value());
    EXPECT_THAT(*result.instrumentedSource, HasSubstr("__rule_step__('S2', 4, 2, 'b = 2')"));

    json wire = result.toJson();
    EXPECT_EQ(wire["debugSteps"][1]["stepId"], "S2");
    EXPECT_EQ(wire["debugSteps"][1]["instrumentedLine"], 4);
    EXPECT_TRUE(wire.contains("instrumentedSource"));
}

TEST_F(InstrumentedExecutionTest, RuntimeErrorMapsToOriginalLine) {
    auto result = debug("total = 10\nif total > 5:\n    ratio = total / 0\nafter = 1\n");

    ASSERT_EQ(result.debugSteps.size(), 3);
    const auto &error = result.debugSteps[1];
    ASSERT_TRUE(error.hasError());
    EXPECT_EQ(error.line, 3);
    EXPECT_EQ(error.output, "ratio = total / 0");
    EXPECT_EQ(*error.error, "ZeroDivisionError: division by zero");
    EXPECT_THAT(*error.traceback, HasSubstr("line 2: if total > 5:"));
    EXPECT_THAT(*error.traceback, HasSubstr("line 3: ratio = total / 0"));
    EXPECT_THAT(*error.traceback, ::testing::Not(HasSubstr(Constants::STEP_MARKER_NAME)));

    EXPECT_EQ(result.debugSteps[2].stepId, std::optional<std::string>(Constants::COMPLETION_STEP_ID));
    EXPECT_FALSE(result.paused);
}

TEST_F(InstrumentedExecutionTest, SyntaxErrorAddsCompletionStep) {
    auto result = debug("x = = 1\n");
    ASSERT_EQ(result.debugSteps.size(), 2);
    EXPECT_TRUE(result.debugSteps[0].hasError());
    EXPECT_EQ(result.debugSteps[0].line, 0);
    EXPECT_EQ(result.debugSteps[1].output, Constants::COMPLETION_DESCRIPTION);
}

TEST_F(InstrumentedExecutionTest, RunToTargetPausesAfterTargetStatement) {
    options.stepMode = StepMode::RunToTarget;
    options.targetStep = 2;
    auto result = debug("a = 1\nb = 2\nc = 3\n");

    EXPECT_TRUE(result.paused);
    ASSERT_EQ(result.debugSteps.size(), 2);
    EXPECT_EQ(result.debugSteps[1].variables["b"], 2);
    EXPECT_FALSE(result.debugSteps[1].variables.contains("c"));
    EXPECT_EQ(result.toJson()["paused"], true);
}

TEST_F(InstrumentedExecutionTest, PauseInsideLoopStopsLoop) {
    options.stepMode = StepMode::RunToTarget;
    options.targetStep = 3;
    auto result = debug("total = 0\nfor n in [1, 2, 3]:\n    total += n\nlog_message('done')\n");

    EXPECT_TRUE(result.paused);
    ASSERT_EQ(result.debugSteps.size(), 3);
    EXPECT_EQ(result.debugSteps.back().variables["total"], 3);
    EXPECT_TRUE(result.output.empty());
}

TEST_F(InstrumentedExecutionTest, ContinueStopsAtBreakpointThenResumes) {
    options.stepMode = StepMode::Continue;
    options.breakpoints = {3};
    const std::string source = "a = 1\nb = 2\nc = 3\nd = 4\n";

    auto first = debug(source);
    EXPECT_TRUE(first.paused);
    EXPECT_TRUE(first.hitBreakpoint);
    ASSERT_EQ(first.debugSteps.size(), 3);
    EXPECT_EQ(first.debugSteps.back().line, 3);

    options.resumeAfter = first.debugSteps.size();
    auto second = debug(source);
    EXPECT_FALSE(second.paused);
    EXPECT_FALSE(second.hitBreakpoint);
    EXPECT_EQ(second.debugSteps.size(), 5);
}

TEST_F(InstrumentedExecutionTest, BreakAndContinueAreReported) {
    auto result = debug("for n in [1, 2, 3]:\n"
                        "    if n == 1:\n"
                        "        continue\n"
                        "    if n == 2:\n"
                        "        break\n");

    std::vector<std::string> outputs;
    for (const auto &step : result.debugSteps) {
        outputs.push_back(step.output);
    }
    EXPECT_THAT(outputs, ElementsAre("continue", "break", Constants::COMPLETION_DESCRIPTION));
}

TEST_F(InstrumentedExecutionTest, LoopLimitMapsToLoopLine) {
    options.maxLoopIterations = 10;
    auto result = debug("n = 0\nwhile True:\n    n += 1\n");

    const StepRecord *error = result.findError();
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->line, 2);
    EXPECT_THAT(*error->error, HasSubstr("loop iteration limit of 10 exceeded"));
}

TEST_F(InstrumentedExecutionTest, SameStepsAsTreeWalkForStraightLineCode) {
    for (const std::string source : {"price = 10\nqty = 3\ntotal = price * qty\n",
                                     "x = 1\ny = 2\na = b = x + y\nitems = [0]\nitems[0] = last = a * 2\n"}) {
        auto instrumented = debug(source);
        auto walked = debugBusinessRule(source);

        ASSERT_EQ(instrumented.debugSteps.size(), walked.debugSteps.size() + 1) << source;
        for (size_t i = 0; i < walked.debugSteps.size(); ++i) {
            EXPECT_EQ(instrumented.debugSteps[i].line, walked.debugSteps[i].line) << source;
            EXPECT_EQ(instrumented.debugSteps[i].variables, walked.debugSteps[i].variables) << source;
        }
    }
}

TEST_F(InstrumentedExecutionTest, ChainedAssignmentSnapshotsBindOneTargetAtATime) {
    auto result = debug("x = 1\ny = 2\na = b = x + y\n");

    ASSERT_EQ(result.debugSteps.size(), 5);
    const auto &first = result.debugSteps[2];
    EXPECT_EQ(first.line, 3);
    EXPECT_EQ(first.output, "a = x + y");
    EXPECT_EQ(first.variables, json({{"x", 1}, {"y", 2}, {"a", 3}}));

    const auto &second = result.debugSteps[3];
    EXPECT_EQ(second.line, 3);
    EXPECT_EQ(second.output, "b = x + y");
    EXPECT_EQ(second.variables["b"], 3);
}
