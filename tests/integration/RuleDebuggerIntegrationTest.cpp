#include "RuleDebugger.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace RSE;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class RuleDebuggerIntegrationTest : public ::testing::Test {
protected:
    DebugResult debug(const std::string &source) {
        return debugBusinessRule(source, options);
    }

    static std::vector<std::string> outputsOf(const DebugResult &result) {
        std::vector<std::string> outputs;
        for (const auto &step : result.debugSteps) {
            outputs.push_back(step.output);
        }
        return outputs;
    }

    DebugOptions options;
};

TEST_F(RuleDebuggerIntegrationTest, ElseBranchSelectedWhenConditionIsFalse) {
    auto result = debug("new_bool = True\nnew_bool = False\nif new_bool:\n  log_message(\"m\")\nelse:\n  "
                        "log_message(\"b\")");

    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.debugSteps.size(), 3);
    EXPECT_THAT(outputsOf(result),
                ElementsAre("new_bool = True", "new_bool = False", "log_message('b') -> 'b'"));
    EXPECT_EQ(result.debugSteps[2].line, 6);
    EXPECT_EQ(result.debugSteps[2].variables["new_bool"], false);
    EXPECT_THAT(result.output, ElementsAre("LOG: b"));
}

TEST_F(RuleDebuggerIntegrationTest, OnlyTrueBranchProducesSteps) {
    auto result = debug("x = True\nif x:\n    log_message('A')\nelse:\n    log_message('B')\n");

    ASSERT_EQ(result.debugSteps.size(), 2);
    EXPECT_EQ(result.debugSteps[1].output, "log_message('A') -> 'A'");
    EXPECT_THAT(result.output, ElementsAre("LOG: A"));
}

TEST_F(RuleDebuggerIntegrationTest, StepCountMatchesAssignmentTargets) {
    auto result = debug("a = 1\nb = c = 2\nd = e = f = 3\n");
    EXPECT_EQ(result.debugSteps.size(), 6);
    EXPECT_EQ(result.findError(), nullptr);
}

TEST_F(RuleDebuggerIntegrationTest, LoopCompletionBranchRunsWithoutBreak) {
    auto result = debug("for n in [1, 2]:\n"
                        "    if n > 5:\n"
                        "        break\n"
                        "else:\n"
                        "    done = True\n");

    ASSERT_FALSE(result.debugSteps.empty());
    EXPECT_EQ(result.debugSteps.back().output, "done = True");
    EXPECT_EQ(result.debugSteps.back().line, 5);
}

TEST_F(RuleDebuggerIntegrationTest, LoopCompletionBranchSkippedAfterBreak) {
    auto result = debug("for n in [1, 9]:\n"
                        "    if n > 5:\n"
                        "        break\n"
                        "else:\n"
                        "    done = True\n");

    EXPECT_THAT(outputsOf(result), ElementsAre("break"));
    EXPECT_FALSE(result.debugSteps.back().variables.contains("done"));
}

TEST_F(RuleDebuggerIntegrationTest, RuntimeErrorKeepsEarlierSteps) {
    auto result = debug("total = 10\ncount = 0\naverage = total / count\n");

    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.debugSteps.size(), 3);
    EXPECT_FALSE(result.debugSteps[0].hasError());
    EXPECT_FALSE(result.debugSteps[1].hasError());

    const auto &last = result.debugSteps.back();
    ASSERT_TRUE(last.hasError());
    EXPECT_EQ(*last.error, "ZeroDivisionError: division by zero");
    EXPECT_EQ(last.line, 3);
    EXPECT_EQ(last.output, "average = total / count");
    ASSERT_TRUE(last.traceback.has_value());
    EXPECT_THAT(*last.traceback, HasSubstr("line 3: average = total / count"));
    EXPECT_EQ(result.findError(), &last);
}

TEST_F(RuleDebuggerIntegrationTest, UnknownNameReportedAsError) {
    auto result = debug("discount = rate * 2\n");
    ASSERT_EQ(result.debugSteps.size(), 1);
    EXPECT_EQ(*result.debugSteps[0].error, "NameError: name 'rate' is not defined");
}

TEST_F(RuleDebuggerIntegrationTest, SyntaxErrorIsSingleStepAtLineZero) {
    auto result = debug("x = 1\ny = (2 +\n");

    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.debugSteps.size(), 1);
    EXPECT_EQ(result.debugSteps[0].line, 0);
    ASSERT_TRUE(result.debugSteps[0].hasError());
    EXPECT_THAT(*result.debugSteps[0].error, ::testing::StartsWith("SyntaxError: "));
    EXPECT_TRUE(result.debugSteps[0].variables.empty());
}

TEST_F(RuleDebuggerIntegrationTest, DeeplyNestedRuleIsReportedAsSyntaxError) {
    const size_t depth = 100000;
    auto result = debug("x = " + std::string(depth, '(') + "1" + std::string(depth, ')'));

    ASSERT_EQ(result.debugSteps.size(), 1);
    EXPECT_EQ(result.debugSteps[0].line, 0);
    ASSERT_TRUE(result.debugSteps[0].hasError());
    EXPECT_THAT(*result.debugSteps[0].error, ::testing::StartsWith("SyntaxError: too many nested parentheses"));

    options.mode = ExecutionMode::Instrumented;
    auto instrumented = debug("x = " + std::string(depth, '(') + "1" + std::string(depth, ')'));
    ASSERT_FALSE(instrumented.debugSteps.empty());
    EXPECT_EQ(instrumented.debugSteps[0].line, 0);
    EXPECT_TRUE(instrumented.debugSteps[0].hasError());
}

TEST_F(RuleDebuggerIntegrationTest, RecordSnapshotsAreIsolated) {
    auto result = debug("class Order:\n"
                        "    total = 0\n"
                        "order = Order()\n"
                        "order.total = 5\n");

    ASSERT_EQ(result.debugSteps.size(), 2);
    EXPECT_EQ(result.debugSteps[0].variables["order"], "Order(total=0)");
    EXPECT_EQ(result.debugSteps[1].variables["order"], "Order(total=5)");
    EXPECT_EQ(result.debugSteps[1].variables["Order"], "<class 'Order'>");
}

TEST_F(RuleDebuggerIntegrationTest, CollectionSnapshotsAreStructured) {
    auto result = debug("prices = {'apple': 1.5, 'pear': [1, None]}\nprices['kiwi'] = True\n");

    ASSERT_EQ(result.debugSteps.size(), 2);
    const json &first = result.debugSteps[0].variables["prices"];
    EXPECT_EQ(first["apple"], 1.5);
    EXPECT_TRUE(first["pear"][1].is_null());
    EXPECT_FALSE(first.contains("kiwi"));
    EXPECT_EQ(result.debugSteps[1].variables["prices"]["kiwi"], true);
}

TEST_F(RuleDebuggerIntegrationTest, ControlStepsOption) {
    options.recordControlSteps = true;
    auto result = debug("x = 2\nif x > 1:\n    y = 1\n");
    EXPECT_THAT(outputsOf(result), ElementsAre("x = 2", "if x > 1 -> True", "y = 1"));
}

TEST_F(RuleDebuggerIntegrationTest, InfiniteLoopEndsWithLimitError) {
    options.maxLoopIterations = 50;
    auto result = debug("n = 0\nwhile True:\n    n += 1\n");

    const StepRecord *error = result.findError();
    ASSERT_NE(error, nullptr);
    EXPECT_THAT(*error->error, HasSubstr("LimitExceededError"));
    EXPECT_EQ(error->line, 2);
}

TEST_F(RuleDebuggerIntegrationTest, StepBudgetEndsRunawayRule) {
    options.maxSteps = 10;
    auto result = debug("n = 0\nwhile n < 1000:\n    n += 1\n");

    EXPECT_EQ(result.debugSteps.size(), 11);
    ASSERT_TRUE(result.debugSteps.back().hasError());
    EXPECT_THAT(*result.debugSteps.back().error, HasSubstr("step limit of 10 exceeded"));
}

TEST_F(RuleDebuggerIntegrationTest, MessageBufferDropsOldest) {
    options.messageCapacity = 2;
    auto result = debug("for i in range(5):\n    log_message(i)\n");

    EXPECT_THAT(result.output, ElementsAre("LOG: 3", "LOG: 4"));
    EXPECT_EQ(result.droppedMessages, 3);
    EXPECT_EQ(result.toJson()["droppedMessages"], 3);
}

TEST_F(RuleDebuggerIntegrationTest, WireShape) {
    auto result = debug("x = 1\ny = x / 0\n");
    json wire = result.toJson();

    EXPECT_EQ(wire["success"], true);
    ASSERT_EQ(wire["debugSteps"].size(), 2);
    const json &first = wire["debugSteps"][0];
    EXPECT_EQ(first["line"], 1);
    EXPECT_EQ(first["output"], "x = 1");
    EXPECT_EQ(first["variables"]["x"], 1);
    EXPECT_FALSE(first.contains("error"));
    EXPECT_FALSE(first.contains("stepId"));
    EXPECT_EQ(wire["debugSteps"][1]["error"], "ZeroDivisionError: division by zero");
    EXPECT_TRUE(wire["output"].is_array());
    EXPECT_FALSE(wire.contains("paused"));
}

TEST_F(RuleDebuggerIntegrationTest, EmptyRuleHasNoSteps) {
    auto result = debug("# nothing here\n");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.debugSteps.empty());
}
