#include "scripting/BuiltinRegistry.h"
#include "common/RuleError.h"
#include "common/ValueHelper.h"
#include "parsing/RuleParser.h"
#include "runtime/Environment.h"
#include "scripting/BufferedMessageSink.h"
#include "scripting/ExpressionEvaluator.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace RSE;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class BuiltinRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink = std::make_shared<BufferedMessageSink>(50);
        registry = std::make_shared<BuiltinRegistry>(sink);
        environment = std::make_unique<Environment>(registry);
        evaluator = std::make_unique<ExpressionEvaluator>(*environment);
    }

    std::string repr(const std::string &source) {
        return ValueHelper::toRepr(evaluator->evaluate(*RuleParser::parseExpression(source)));
    }

    RuleError errorOf(const std::string &source) {
        try {
            evaluator->evaluate(*RuleParser::parseExpression(source));
        } catch (const RuleError &e) {
            return e;
        }
        ADD_FAILURE() << "expected an error from: " << source;
        return RuleError("None", "");
    }

    std::shared_ptr<BufferedMessageSink> sink;
    std::shared_ptr<BuiltinRegistry> registry;
    std::unique_ptr<Environment> environment;
    std::unique_ptr<ExpressionEvaluator> evaluator;
};

TEST_F(BuiltinRegistryTest, RequiresSink) {
    EXPECT_THROW(BuiltinRegistry(nullptr), std::invalid_argument);
}

TEST_F(BuiltinRegistryTest, RegistersClosedSet) {
    auto names = registry->getNames();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    for (const char *name : {"log_message", "print", "len", "str", "int", "float", "bool", "abs", "min", "max",
                             "sum", "round", "range", "list", "dict", "sorted"}) {
        EXPECT_TRUE(registry->contains(name)) << name;
    }
    // No access to the host: nothing that reads files, imports or evaluates code
    for (const char *name : {"open", "eval", "exec", "__import__", "getattr", "input"}) {
        EXPECT_FALSE(registry->contains(name)) << name;
    }
    EXPECT_EQ(registry->find("open"), nullptr);
}

TEST_F(BuiltinRegistryTest, CustomFunctionsCanBeAddedAndRemoved) {
    registry->registerFunction("double_it", [](const CallArguments &args) -> RuleValue {
        return ValueHelper::toInteger(args.positional.at(0)) * 2;
    });
    EXPECT_EQ(repr("double_it(21)"), "42");

    EXPECT_TRUE(registry->removeFunction("double_it"));
    EXPECT_FALSE(registry->removeFunction("double_it"));
    EXPECT_EQ(errorOf("double_it(1)").kind(), "NameError");
}

TEST_F(BuiltinRegistryTest, LogMessageWritesPrefixedLine) {
    EXPECT_EQ(repr("log_message('discount applied')"), "'discount applied'");
    EXPECT_EQ(repr("log_message(42, level='info')"), "42");

    EXPECT_THAT(sink->messages(), ElementsAre("LOG: discount applied", "LOG: 42 {'level': 'info'}"));
    EXPECT_EQ(errorOf("log_message()").kind(), "TypeError");
}

TEST_F(BuiltinRegistryTest, PrintJoinsArguments) {
    EXPECT_EQ(repr("print('a', 1, [2])"), "None");
    EXPECT_EQ(repr("print('x', 'y', sep='-')"), "None");
    EXPECT_THAT(sink->messages(), ElementsAre("a 1 [2]", "x-y"));
    EXPECT_THAT(errorOf("print('a', end='')").message(), HasSubstr("end"));
}

TEST_F(BuiltinRegistryTest, Conversions) {
    EXPECT_EQ(repr("str(1.5)"), "'1.5'");
    EXPECT_EQ(repr("str(None)"), "'None'");
    EXPECT_EQ(repr("int(' 42 ')"), "42");
    EXPECT_EQ(repr("int('1_000')"), "1000");
    EXPECT_EQ(repr("int(-2.9)"), "-2");
    EXPECT_EQ(repr("int(True)"), "1");
    EXPECT_EQ(repr("float('2.5')"), "2.5");
    EXPECT_EQ(repr("float('-inf')"), "-inf");
    EXPECT_EQ(repr("float(3)"), "3.0");
    EXPECT_EQ(repr("bool([])"), "False");
    EXPECT_EQ(repr("bool('x')"), "True");

    auto bad = errorOf("int('abc')");
    EXPECT_EQ(bad.kind(), "ValueError");
    EXPECT_EQ(bad.message(), "invalid literal for int() with base 10: 'abc'");
    EXPECT_EQ(errorOf("float('x1')").kind(), "ValueError");
    EXPECT_EQ(errorOf("int(float('nan'))").kind(), "ValueError");
    EXPECT_EQ(errorOf("int(float('inf'))").kind(), "OverflowError");
    EXPECT_EQ(errorOf("int([])").kind(), "TypeError");
}

TEST_F(BuiltinRegistryTest, NumericFunctions) {
    EXPECT_EQ(repr("abs(-3)"), "3");
    EXPECT_EQ(repr("abs(-2.5)"), "2.5");
    EXPECT_EQ(repr("min(3, 1, 2)"), "1");
    EXPECT_EQ(repr("max([1, 5, 2])"), "5");
    EXPECT_EQ(repr("max([], default=0)"), "0");
    EXPECT_EQ(repr("sum([1, 2, 3])"), "6");
    EXPECT_EQ(repr("sum([0.5, 0.25], 1)"), "1.75");
    EXPECT_EQ(repr("round(2.5)"), "2");
    EXPECT_EQ(repr("round(3.5)"), "4");
    EXPECT_EQ(repr("round(2.675, 2)"), "2.67");
    EXPECT_EQ(repr("round(1234, -2)"), "1200");

    EXPECT_EQ(errorOf("min([])").kind(), "ValueError");
    EXPECT_EQ(errorOf("sum(['a'], '')").kind(), "TypeError");
    EXPECT_EQ(errorOf("abs('x')").kind(), "TypeError");
}

TEST_F(BuiltinRegistryTest, RoundUsesStoredDecimalValue) {
    // 2.675 is stored as 2.67499999..., 0.125 and 0.375 are exact ties
    EXPECT_EQ(repr("round(2.675, 2)"), "2.67");
    EXPECT_EQ(repr("round(1.005, 2)"), "1.0");
    EXPECT_EQ(repr("round(0.125, 2)"), "0.12");
    EXPECT_EQ(repr("round(0.375, 2)"), "0.38");
    EXPECT_EQ(repr("round(-0.125, 2)"), "-0.12");
    EXPECT_EQ(repr("round(9.995, 2)"), "9.99");
    EXPECT_EQ(repr("round(99.5, 0)"), "100.0");
    EXPECT_EQ(repr("round(-0.4, 0)"), "-0.0");
    EXPECT_EQ(repr("round(0.1, 400)"), "0.1");

    EXPECT_EQ(repr("round(15.0, -1)"), "20.0");
    EXPECT_EQ(repr("round(25.0, -1)"), "20.0");
    EXPECT_EQ(repr("round(5.0, -1)"), "0.0");
    EXPECT_EQ(repr("round(1e300, -400)"), "0.0");
    EXPECT_EQ(repr("round(-1e300, -400)"), "-0.0");
    EXPECT_EQ(errorOf("round(1.7976931348623157e308, -308)").kind(), "OverflowError");

    EXPECT_EQ(repr("round(1250, -2)"), "1200");
    EXPECT_EQ(repr("round(1350, -2)"), "1400");
    EXPECT_EQ(repr("round(-1250, -2)"), "-1200");
    EXPECT_EQ(repr("round(9223372036854775807, -18)"), "9000000000000000000");
    EXPECT_EQ(repr("round(42, -25)"), "0");
    EXPECT_EQ(errorOf("round(9223372036854775807, -1)").kind(), "OverflowError");
}

TEST_F(BuiltinRegistryTest, CollectionFunctions) {
    EXPECT_EQ(repr("len('héllo')"), "5");
    EXPECT_EQ(repr("len({'a': 1})"), "1");
    EXPECT_EQ(repr("range(3)"), "[0, 1, 2]");
    EXPECT_EQ(repr("range(5, 0, -2)"), "[5, 3, 1]");
    EXPECT_EQ(repr("list('ab')"), "['a', 'b']");
    EXPECT_EQ(repr("dict([['a', 1]], b=2)"), "{'a': 1, 'b': 2}");
    EXPECT_EQ(repr("sorted([3, 1, 2])"), "[1, 2, 3]");
    EXPECT_EQ(repr("sorted(['b', 'a'], reverse=True)"), "['b', 'a']");

    EXPECT_EQ(errorOf("len(5)").kind(), "TypeError");
    EXPECT_EQ(errorOf("range(1, 2, 0)").kind(), "ValueError");
    EXPECT_EQ(errorOf("range(10000000)").kind(), "LimitExceededError");
    EXPECT_EQ(errorOf("sorted([1, 'a'])").kind(), "TypeError");
}

TEST_F(BuiltinRegistryTest, ListMethods) {
    environment->set("items", std::make_shared<RuleSequence>(std::initializer_list<RuleValue>{int64_t(1)}));

    repr("items.append(2)");
    repr("items.extend([3, 4])");
    repr("items.insert(0, 0)");
    EXPECT_EQ(repr("items"), "[0, 1, 2, 3, 4]");
    EXPECT_EQ(repr("items.pop()"), "4");
    EXPECT_EQ(repr("items.pop(0)"), "0");
    EXPECT_EQ(repr("items.index(2)"), "1");
    EXPECT_EQ(repr("items.count(3)"), "1");

    EXPECT_EQ(errorOf("items.index(99)").kind(), "ValueError");
    EXPECT_EQ(errorOf("[].pop()").message(), "pop from empty list");
    EXPECT_EQ(errorOf("items.push(1)").kind(), "AttributeError");
}

TEST_F(BuiltinRegistryTest, DictMethods) {
    environment->set("prices", std::make_shared<RuleMapping>(std::initializer_list<FieldTable::Entry>{
                                   {"apple", int64_t(3)}, {"pear", int64_t(5)}}));

    EXPECT_EQ(repr("prices.get('apple')"), "3");
    EXPECT_EQ(repr("prices.get('kiwi')"), "None");
    EXPECT_EQ(repr("prices.get('kiwi', 0)"), "0");
    EXPECT_EQ(repr("prices.keys()"), "['apple', 'pear']");
    EXPECT_EQ(repr("prices.items()"), "[['apple', 3], ['pear', 5]]");
    repr("prices.update({'kiwi': 7})");
    EXPECT_EQ(repr("prices.pop('apple')"), "3");
    EXPECT_EQ(repr("prices.values()"), "[5, 7]");
    EXPECT_EQ(errorOf("prices.pop('apple')").kind(), "KeyError");
}

TEST_F(BuiltinRegistryTest, StringMethods) {
    EXPECT_EQ(repr("'Gold'.upper()"), "'GOLD'");
    EXPECT_EQ(repr("'Gold'.lower()"), "'gold'");
    EXPECT_EQ(repr("'  x  '.strip()"), "'x'");
    EXPECT_EQ(repr("'a,b,,c'.split(',')"), "['a', 'b', '', 'c']");
    EXPECT_EQ(repr("' a  b '.split()"), "['a', 'b']");
    EXPECT_EQ(repr("'a-b-c'.split('-', 1)"), "['a', 'b-c']");
    EXPECT_EQ(repr("', '.join(['x', 'y'])"), "'x, y'");
    EXPECT_EQ(repr("'aaa'.replace('a', 'b', 2)"), "'bba'");
    EXPECT_EQ(repr("'order-1'.startswith('order')"), "True");
    EXPECT_EQ(repr("'order-1'.endswith('2')"), "False");

    EXPECT_EQ(errorOf("'a'.split('')").kind(), "ValueError");
    EXPECT_THAT(errorOf("'-'.join([1])").message(), HasSubstr("expected str instance, int found"));
}

TEST_F(BuiltinRegistryTest, BoundMethodsOnlyForCollectionsAndStrings) {
    EXPECT_EQ(BuiltinRegistry::bindMethod(int64_t(1), "upper"), nullptr);
    EXPECT_NE(BuiltinRegistry::bindMethod(std::string("x"), "upper"), nullptr);
    EXPECT_EQ(BuiltinRegistry::bindMethod(std::string("x"), "format"), nullptr);
}
