#include "actions/ForeachAction.h"
#include "actions/AssignAction.h"
#include "actions/LoopControlAction.h"
#include "mocks/MockActionExecutor.h"
#include "parsing/RuleParser.h"
#include <gtest/gtest.h>
#include <memory>

using namespace RSE;
using namespace RSE::Test;

class ForeachActionTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockExecutor = std::make_shared<MockActionExecutor>("foreach_test_run");
        context = std::make_shared<MockExecutionContext>(mockExecutor);
    }

    static std::shared_ptr<AssignAction> assign(const std::string &target, const std::string &value, int line) {
        return std::make_shared<AssignAction>(std::vector<ExpressionPtr>{RuleParser::parseExpression(target)},
                                              RuleParser::parseExpression(value), line);
    }

    std::shared_ptr<MockActionExecutor> mockExecutor;
    std::shared_ptr<MockExecutionContext> context;
};

TEST_F(ForeachActionTest, ConstructorAndBasicProperties) {
    ForeachAction action("order", RuleParser::parseExpression("orders"), 2, "loop_orders");

    EXPECT_EQ(action.getId(), "loop_orders");
    EXPECT_EQ(action.getActionType(), "for");
    EXPECT_EQ(action.getItem(), "order");
    EXPECT_EQ(action.getArray()->toSource(), "orders");
    EXPECT_EQ(action.getIterationActionCount(), 0);
    EXPECT_FALSE(action.hasCompletionBranch());
    EXPECT_EQ(action.getCompletionLine(), 0);
    EXPECT_EQ(action.getSourceText(), "for order in orders:");
}

TEST_F(ForeachActionTest, IteratesEveryItem) {
    ForeachAction action("item", RuleParser::parseExpression("items"), 1);
    action.addIterationAction(assign("total", "total + item", 2));
    mockExecutor->setIterable("items", {int64_t(1), int64_t(2), int64_t(3)});

    EXPECT_TRUE(action.execute(*context));

    const auto &bindings = mockExecutor->getLoopBindings();
    ASSERT_EQ(bindings.size(), 3);
    EXPECT_EQ(bindings[0].second, "1");
    EXPECT_EQ(bindings[2].second, "3");
    EXPECT_EQ(mockExecutor->getOperationCount("assign"), 3);
}

TEST_F(ForeachActionTest, EmptyIterableRunsCompletionOnly) {
    ForeachAction action("item", RuleParser::parseExpression("items"), 1);
    action.addIterationAction(assign("seen", "True", 2));
    action.setCompletionLine(3);
    action.addCompletionAction(assign("done", "True", 4));
    mockExecutor->setIterable("items", {});

    EXPECT_TRUE(action.execute(*context));

    const auto &assignments = mockExecutor->getAssignments();
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].first, "done");
    EXPECT_TRUE(action.hasCompletionBranch());
    EXPECT_EQ(action.getCompletionLine(), 3);
}

TEST_F(ForeachActionTest, FailureInBodyStopsLoop) {
    ForeachAction action("item", RuleParser::parseExpression("items"), 1);
    action.addIterationAction(assign("x", "item", 2));
    mockExecutor->setIterable("items", {std::string("a"), std::string("b")});
    mockExecutor->setAssignmentResult(false);

    EXPECT_FALSE(action.execute(*context));
    EXPECT_EQ(mockExecutor->getLoopBindings().size(), 1);
}

TEST_F(ForeachActionTest, ValidationTests_RequiredParts) {
    ForeachAction valid("item", RuleParser::parseExpression("items"), 1);
    valid.addIterationAction(assign("x", "item", 2));
    EXPECT_TRUE(valid.validate().empty());

    ForeachAction noArray("item", nullptr, 1);
    noArray.addIterationAction(assign("x", "1", 2));
    auto errors = noArray.validate();
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors[0].find("iterable"), std::string::npos);

    ForeachAction noItem("", RuleParser::parseExpression("items"), 1);
    noItem.addIterationAction(assign("x", "1", 2));
    errors = noItem.validate();
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors[0].find("loop variable"), std::string::npos);

    ForeachAction emptyBody("item", RuleParser::parseExpression("items"), 1);
    EXPECT_FALSE(emptyBody.validate().empty());
}

TEST_F(ForeachActionTest, ValidationTests_VariableNaming) {
    auto makeLoop = [this](const std::string &item) {
        auto loop = std::make_shared<ForeachAction>(item, RuleParser::parseExpression("items"), 1);
        loop->addIterationAction(assign("x", "1", 2));
        return loop;
    };

    EXPECT_TRUE(makeLoop("item")->validate().empty());
    EXPECT_TRUE(makeLoop("_item")->validate().empty());
    EXPECT_TRUE(makeLoop("item123")->validate().empty());

    EXPECT_FALSE(makeLoop("123item")->validate().empty());
    EXPECT_FALSE(makeLoop("item-name")->validate().empty());
    EXPECT_FALSE(makeLoop("item.name")->validate().empty());
}

TEST_F(ForeachActionTest, ValidationTests_EmptyElseBranch) {
    ForeachAction action("item", RuleParser::parseExpression("items"), 1);
    action.addIterationAction(std::make_shared<LoopControlAction>(LoopControlAction::Kind::Break, 2));
    action.setCompletionLine(3);

    auto errors = action.validate();
    ASSERT_EQ(errors.size(), 1);
    EXPECT_NE(errors[0].find("else"), std::string::npos);
}

TEST_F(ForeachActionTest, CloneIsDeep) {
    ForeachAction original("item", RuleParser::parseExpression("items"), 1, "loop");
    original.addIterationAction(assign("x", "item", 2));
    original.addCompletionAction(assign("done", "True", 4));

    auto cloned = std::dynamic_pointer_cast<ForeachAction>(original.clone());
    ASSERT_NE(cloned, nullptr);
    EXPECT_EQ(cloned->getItem(), "item");
    EXPECT_EQ(cloned->getId(), "loop");
    EXPECT_TRUE(cloned->hasCompletionBranch());
    ASSERT_EQ(cloned->getIterationActionCount(), 1);
    EXPECT_NE(cloned->getIterationActions()[0].get(), original.getIterationActions()[0].get());

    cloned->setItem("other");
    cloned->setArray(RuleParser::parseExpression("others"));
    EXPECT_EQ(original.getItem(), "item");
    EXPECT_EQ(original.getArray()->toSource(), "items");
}

TEST_F(ForeachActionTest, NullIterationActionIgnored) {
    ForeachAction action("item", RuleParser::parseExpression("items"), 1);
    action.addIterationAction(nullptr);
    EXPECT_EQ(action.getIterationActionCount(), 0);
}
