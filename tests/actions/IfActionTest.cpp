#include "actions/IfAction.h"
#include "actions/AssignAction.h"
#include "actions/PassAction.h"
#include "mocks/MockActionExecutor.h"
#include "parsing/RuleParser.h"
#include <gtest/gtest.h>
#include <memory>

using namespace RSE;
using namespace RSE::Test;

class IfActionTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockExecutor = std::make_shared<MockActionExecutor>("if_test_run");
        context = std::make_shared<MockExecutionContext>(mockExecutor);
    }

    static std::shared_ptr<AssignAction> assign(const std::string &target, const std::string &value, int line) {
        return std::make_shared<AssignAction>(std::vector<ExpressionPtr>{RuleParser::parseExpression(target)},
                                              RuleParser::parseExpression(value), line);
    }

    // if total > 100: tier = 'gold' / elif total > 10: tier = 'silver' / else: tier = 'bronze'
    static std::shared_ptr<IfAction> makeTierRule() {
        auto action = std::make_shared<IfAction>(1);
        action->addConditionalBranch(RuleParser::parseExpression("total > 100"), 1);
        action->addActionToBranch(0, assign("tier", "'gold'", 2));
        action->addConditionalBranch(RuleParser::parseExpression("total > 10"), 3);
        action->addActionToBranch(1, assign("tier", "'silver'", 4));
        action->addElseBranch(5);
        action->addActionToBranch(2, assign("tier", "'bronze'", 6));
        return action;
    }

    std::shared_ptr<MockActionExecutor> mockExecutor;
    std::shared_ptr<MockExecutionContext> context;
};

TEST_F(IfActionTest, ConstructorAndBranches) {
    auto action = makeTierRule();

    EXPECT_EQ(action->getActionType(), "if");
    EXPECT_EQ(action->getBranchCount(), 3);
    EXPECT_TRUE(action->hasElseBranch());
    EXPECT_FALSE(action->getBranch(0).isElseBranch);
    EXPECT_EQ(action->getBranch(1).line, 3);
    EXPECT_TRUE(action->getBranch(2).isElseBranch);
    EXPECT_EQ(action->getSourceText(), "if total > 100:");
}

TEST_F(IfActionTest, FirstTruthyBranchRunsAlone) {
    auto action = makeTierRule();
    mockExecutor->setConditionResult("total > 100", true);
    mockExecutor->setConditionResult("total > 10", true);

    EXPECT_TRUE(action->execute(*context));

    const auto &assignments = mockExecutor->getAssignments();
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].second, "'gold'");
    // Later conditions are never evaluated once a branch was taken
    EXPECT_EQ(mockExecutor->getEvaluatedConditions().size(), 1);
}

TEST_F(IfActionTest, ElifBranchRuns) {
    auto action = makeTierRule();
    mockExecutor->setConditionResult("total > 100", false);
    mockExecutor->setConditionResult("total > 10", true);

    EXPECT_TRUE(action->execute(*context));

    const auto &assignments = mockExecutor->getAssignments();
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].second, "'silver'");
}

TEST_F(IfActionTest, ElseBranchRunsWhenNothingHolds) {
    auto action = makeTierRule();

    EXPECT_TRUE(action->execute(*context));

    const auto &assignments = mockExecutor->getAssignments();
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].second, "'bronze'");
    EXPECT_EQ(mockExecutor->getEvaluatedConditions().size(), 2);
}

TEST_F(IfActionTest, NoBranchTakenWithoutElse) {
    auto action = std::make_shared<IfAction>(1);
    action->addConditionalBranch(RuleParser::parseExpression("flag"), 1);
    action->addActionToBranch(0, assign("x", "1", 2));

    EXPECT_TRUE(action->execute(*context));
    EXPECT_TRUE(mockExecutor->getAssignments().empty());
}

TEST_F(IfActionTest, FailureInsideBranchPropagates) {
    auto action = makeTierRule();
    mockExecutor->setConditionResult("total > 100", true);
    mockExecutor->setAssignmentResult(false);

    EXPECT_FALSE(action->execute(*context));
}

TEST_F(IfActionTest, ValidationTests) {
    EXPECT_TRUE(makeTierRule()->validate().empty());

    IfAction empty(1);
    EXPECT_FALSE(empty.validate().empty());

    IfAction elseFirst(1);
    elseFirst.addElseBranch(1);
    elseFirst.addActionToBranch(0, std::make_shared<PassAction>(2));
    auto errors = elseFirst.validate();
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors[0].find("else"), std::string::npos);

    IfAction emptyBranch(1);
    emptyBranch.addConditionalBranch(RuleParser::parseExpression("x"), 1);
    EXPECT_FALSE(emptyBranch.validate().empty());
}

TEST_F(IfActionTest, CloneIsDeep) {
    auto original = makeTierRule();
    auto cloned = std::dynamic_pointer_cast<IfAction>(original->clone());
    ASSERT_NE(cloned, nullptr);

    ASSERT_EQ(cloned->getBranchCount(), original->getBranchCount());
    for (size_t i = 0; i < original->getBranchCount(); ++i) {
        ASSERT_EQ(cloned->getBranch(i).actions.size(), 1);
        EXPECT_NE(cloned->getBranch(i).actions[0].get(), original->getBranch(i).actions[0].get());
        EXPECT_EQ(cloned->getBranch(i).line, original->getBranch(i).line);
    }

    cloned->setBranchActions(0, {});
    EXPECT_EQ(original->getBranch(0).actions.size(), 1);
}

TEST_F(IfActionTest, OutOfRangeBranchAccess) {
    auto action = makeTierRule();
    const auto &missing = action->getBranch(10);
    EXPECT_TRUE(missing.actions.empty());
    EXPECT_EQ(missing.condition, nullptr);

    // Silently ignored
    action->addActionToBranch(10, assign("x", "1", 1));
    EXPECT_EQ(action->getBranchCount(), 3);
}
