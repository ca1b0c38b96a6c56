#include "runtime/Environment.h"
#include "common/RuleError.h"
#include "common/ValueHelper.h"
#include "scripting/BufferedMessageSink.h"
#include <gtest/gtest.h>

using namespace RSE;

class EnvironmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<BuiltinRegistry>(std::make_shared<BufferedMessageSink>());
        environment = std::make_unique<Environment>(registry);
    }

    std::shared_ptr<BuiltinRegistry> registry;
    std::unique_ptr<Environment> environment;
};

TEST_F(EnvironmentTest, RequiresBuiltinRegistry) {
    EXPECT_THROW(Environment(nullptr), std::invalid_argument);
}

TEST_F(EnvironmentTest, ResolvesBuiltinsWhenUnbound) {
    auto value = environment->get("len");
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(std::holds_alternative<BuiltinFunctionPtr>(*value));
    EXPECT_FALSE(environment->isBound("len"));
}

TEST_F(EnvironmentTest, BindingsShadowBuiltins) {
    environment->set("len", int64_t(3));

    auto value = environment->get("len");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(ValueHelper::toRepr(*value), "3");
    EXPECT_TRUE(environment->isBound("len"));
}

TEST_F(EnvironmentTest, UnknownNameRaisesNameError) {
    EXPECT_FALSE(environment->get("discount").has_value());

    try {
        environment->lookup("discount", 4);
        FAIL() << "Expected UnknownNameError";
    } catch (const UnknownNameError &e) {
        EXPECT_EQ(e.kind(), "NameError");
        EXPECT_EQ(e.message(), "name 'discount' is not defined");
        EXPECT_EQ(e.line(), 4);
    }
}

TEST_F(EnvironmentTest, RebindingKeepsInsertionOrder) {
    environment->set("b", int64_t(1));
    environment->set("a", int64_t(2));
    environment->set("b", std::string("x"));

    const auto &entries = environment->getBindings().entries();
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].first, "b");
    EXPECT_EQ(ValueHelper::toRepr(entries[0].second), "'x'");
    EXPECT_EQ(entries[1].first, "a");
}

TEST_F(EnvironmentTest, RegistryChangesAreVisible) {
    registry->registerFunction("tax_rate", [](const CallArguments &) -> RuleValue { return 0.2; });
    EXPECT_TRUE(environment->get("tax_rate").has_value());
    EXPECT_EQ(&environment->getBuiltins(), registry.get());

    registry->removeFunction("tax_rate");
    EXPECT_THROW(environment->lookup("tax_rate"), UnknownNameError);
}
