#include "runtime/StepRecorder.h"
#include "common/RuleError.h"
#include <gtest/gtest.h>

using namespace RSE;

class StepRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        bindings.set("total", int64_t(10));
        bindings.set("tier", std::string("gold"));
    }

    FieldTable bindings;
};

TEST_F(StepRecorderTest, RecordsStepsInOrder) {
    StepRecorder recorder;
    recorder.recordStep(1, 1, bindings, "total = 10");
    recorder.recordStep(2, 2, bindings, "tier = 'gold'");

    ASSERT_EQ(recorder.size(), 2);
    EXPECT_EQ(recorder.getSteps()[0].index, 0);
    EXPECT_EQ(recorder.getSteps()[1].index, 1);
    EXPECT_EQ(recorder.getSteps()[1].line, 2);
    EXPECT_EQ(recorder.getSteps()[1].output, "tier = 'gold'");
    EXPECT_FALSE(recorder.getSteps()[1].hasError());
}

TEST_F(StepRecorderTest, SnapshotsAreIndependentOfLaterChanges) {
    StepRecorder recorder;
    recorder.recordStep(1, 1, bindings, "total = 10");
    bindings.set("total", int64_t(20));
    recorder.recordStep(2, 2, bindings, "total = 20");

    EXPECT_EQ(recorder.getSteps()[0].variables["total"], 10);
    EXPECT_EQ(recorder.getSteps()[1].variables["total"], 20);
}

TEST_F(StepRecorderTest, StepLimitRaisesLimitExceeded) {
    StepRecorder recorder(2);
    recorder.recordStep(1, 1, bindings, "a");
    recorder.recordStep(2, 2, bindings, "b");

    EXPECT_THROW(recorder.recordStep(3, 3, bindings, "c"), LimitExceededError);
    EXPECT_EQ(recorder.size(), 2);

    // The error step bypasses the budget
    recorder.recordError(3, 3, bindings, "c", "LimitExceededError: step limit of 2 exceeded", "Traceback");
    EXPECT_EQ(recorder.size(), 3);
}

TEST_F(StepRecorderTest, ZeroLimitFallsBackToDefault) {
    StepRecorder recorder(0);
    EXPECT_EQ(recorder.maxSteps(), Constants::DEFAULT_MAX_STEPS);
}

TEST_F(StepRecorderTest, ErrorAndCompletionSteps) {
    StepRecorder recorder;
    recorder.recordError(4, 4, bindings, "x = 1 / 0", "ZeroDivisionError: division by zero", "Traceback ...");
    recorder.recordCompletion(bindings);

    const auto &error = recorder.getSteps()[0];
    ASSERT_TRUE(error.hasError());
    EXPECT_EQ(*error.error, "ZeroDivisionError: division by zero");
    EXPECT_EQ(*error.traceback, "Traceback ...");

    const auto &completion = recorder.getSteps()[1];
    EXPECT_EQ(completion.line, 0);
    EXPECT_EQ(completion.output, Constants::COMPLETION_DESCRIPTION);
    EXPECT_EQ(completion.stepId, std::optional<std::string>(Constants::COMPLETION_STEP_ID));
}

TEST_F(StepRecorderTest, WireShape) {
    StepRecorder recorder;
    recorder.recordStep(3, 7, bindings, "tier = 'gold'", std::string("S2"));
    recorder.recordError(5, 9, bindings, "boom", "ValueError: bad", "tb");

    json plain = recorder.toJson();
    ASSERT_TRUE(plain.is_array());
    EXPECT_EQ(plain[0]["line"], 3);
    EXPECT_EQ(plain[0]["output"], "tier = 'gold'");
    EXPECT_EQ(plain[0]["variables"]["tier"], "gold");
    EXPECT_FALSE(plain[0].contains("error"));
    EXPECT_FALSE(plain[0].contains("stepId"));
    EXPECT_EQ(plain[1]["error"], "ValueError: bad");
    EXPECT_EQ(plain[1]["traceback"], "tb");

    json detailed = recorder.toJson(true);
    EXPECT_EQ(detailed[0]["instrumentedLine"], 7);
    EXPECT_EQ(detailed[0]["stepId"], "S2");
    EXPECT_FALSE(detailed[1].contains("stepId"));
}

TEST_F(StepRecorderTest, Lookup) {
    StepRecorder recorder;
    EXPECT_FALSE(recorder.getLatestStep().has_value());

    recorder.recordStep(1, 1, bindings, "a");
    recorder.recordStep(2, 2, bindings, "b");
    EXPECT_EQ(recorder.getLatestStep()->output, "b");
    EXPECT_EQ(recorder.getStep(0)->output, "a");
    EXPECT_FALSE(recorder.getStep(5).has_value());

    recorder.clear();
    EXPECT_TRUE(recorder.empty());
}
