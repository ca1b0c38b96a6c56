#include "instrumentation/Instrumenter.h"
#include "actions/ExpressionAction.h"
#include "actions/IfAction.h"
#include "common/Constants.h"
#include "instrumentation/SourcePrinter.h"
#include "parsing/RuleParser.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>

using namespace RSE;
using ::testing::HasSubstr;

class InstrumenterTest : public ::testing::Test {
protected:
    InstrumentedProgram instrument(const std::string &source) {
        original = RuleParser::parse(source);
        return instrumenter.instrument(original);
    }

    static std::vector<std::string> splitLines(const std::string &text) {
        std::vector<std::string> lines;
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    Instrumenter instrumenter;
    ActionList original;
};

TEST_F(InstrumenterTest, MarkerFollowsEachStatement) {
    auto result = instrument("x = 1\nif x > 0:\n    y = 2\nelse:\n    pass\n");
    auto lines = splitLines(result.source);

    std::vector<std::string> expected = {
        "x = 1",
        "__rule_step__('S1', 2, 1, 'x = 1')",
        "if x > 0:",
        "    y = 2",
        "    __rule_step__('S2', 5, 3, 'y = 2')",
        "else:",
        "    pass",
        "__rule_step__('END', 8, 0, 'Execution completed')",
    };
    EXPECT_EQ(lines, expected);
    EXPECT_EQ(result.markerCount, 3);
}

TEST_F(InstrumenterTest, LineMapPointsBackToOriginalLines) {
    auto result = instrument("x = 1\nif x > 0:\n    y = 2\nelse:\n    pass\n");

    EXPECT_EQ(result.lineMap.size(), 8);
    EXPECT_EQ(result.lineMap.toOriginal(1), 1);
    EXPECT_EQ(result.lineMap.toOriginal(2), 1);
    EXPECT_EQ(result.lineMap.toOriginal(3), 2);
    EXPECT_EQ(result.lineMap.toOriginal(5), 3);
    EXPECT_EQ(result.lineMap.toOriginal(6), 4);
    EXPECT_EQ(result.lineMap.toOriginal(8), 0);
    EXPECT_FALSE(result.lineMap.find(42).has_value());
    EXPECT_EQ(result.lineMap.toOriginal(42), 0);

    json map = result.lineMap.toJson();
    EXPECT_EQ(map["5"], 3);
}

TEST_F(InstrumenterTest, ChainedAssignmentIsSplitPerTarget) {
    auto result = instrument("a = b = x + y\n");
    auto lines = splitLines(result.source);

    std::vector<std::string> expected = {
        "a = x + y",
        "__rule_step__('S1', 2, 1, 'a = x + y')",
        "b = a",
        "__rule_step__('S2', 4, 1, 'b = x + y')",
        "__rule_step__('END', 5, 0, 'Execution completed')",
    };
    EXPECT_EQ(lines, expected);
    EXPECT_EQ(result.lineMap.toOriginal(3), 1);

    // The input tree keeps its single chained statement
    ASSERT_EQ(original.size(), 1);
    EXPECT_EQ(original[0]->getSourceText(), "a = b = x + y");
}

TEST_F(InstrumenterTest, LoopControlIsPrecededByMarker) {
    auto result = instrument("for n in items:\n    if n:\n        break\n    continue\n");
    auto lines = splitLines(result.source);

    std::vector<std::string> expected = {
        "for n in items:",
        "    if n:",
        "        __rule_step__('S1', 3, 3, 'break')",
        "        break",
        "    __rule_step__('S2', 5, 4, 'continue')",
        "    continue",
        "__rule_step__('END', 7, 0, 'Execution completed')",
    };
    EXPECT_EQ(lines, expected);
}

TEST_F(InstrumenterTest, ClassDeclarationsGetNoMarker) {
    auto result = instrument("class Order:\n    total = 0\norder = Order()\n");
    auto lines = splitLines(result.source);

    ASSERT_EQ(lines.size(), 5);
    EXPECT_EQ(lines[0], "class Order:");
    EXPECT_EQ(lines[1], "    total = 0");
    EXPECT_EQ(lines[3], "__rule_step__('S1', 4, 3, 'order = Order()')");
}

TEST_F(InstrumenterTest, DescriptionsAreQuotedSafely) {
    auto result = instrument("msg = 'it\\'s done'\n");
    auto lines = splitLines(result.source);

    ASSERT_GE(lines.size(), 2);
    EXPECT_THAT(lines[1], HasSubstr("__rule_step__('S1', 2, 1, "));
    // The printed source must parse back
    EXPECT_NO_THROW(RuleParser::parse(result.source));
}

TEST_F(InstrumenterTest, PrintedSourceParsesBackToSameShape) {
    auto result = instrument("total = 0\n"
                             "for item in [1, 2]:\n"
                             "    total += item\n"
                             "else:\n"
                             "    done = True\n"
                             "while total > 0:\n"
                             "    total -= 1\n");

    auto reparsed = RuleParser::parse(result.source);
    ASSERT_EQ(reparsed.size(), result.program.size());
    EXPECT_EQ(SourcePrinter::render(SourcePrinter().print(reparsed)), result.source);
}

TEST_F(InstrumenterTest, OriginalTreeIsUntouched) {
    auto before = SourcePrinter::render(SourcePrinter().print(RuleParser::parse("if a:\n    b = 1\n")));
    instrument("if a:\n    b = 1\n");

    ASSERT_EQ(original.size(), 1);
    auto ifAction = std::dynamic_pointer_cast<IfAction>(original[0]);
    ASSERT_NE(ifAction, nullptr);
    EXPECT_EQ(ifAction->getBranch(0).actions.size(), 1);
    EXPECT_EQ(SourcePrinter::render(SourcePrinter().print(original)), before);
}

TEST_F(InstrumenterTest, EmptyProgramHasOnlyEndMarker) {
    auto result = instrument("");
    EXPECT_EQ(result.source, "__rule_step__('END', 1, 0, 'Execution completed')\n");
    EXPECT_EQ(result.markerCount, 1);
}

TEST_F(InstrumenterTest, StepIdsRestartPerProgram) {
    instrument("a = 1\nb = 2\n");
    auto second = instrument("c = 3\n");
    EXPECT_THAT(second.source, HasSubstr("'S1'"));
    EXPECT_THAT(second.source, ::testing::Not(HasSubstr("'S2'")));
}

TEST_F(InstrumenterTest, MarkerCallRendering) {
    auto call = Instrumenter::makeMarkerCall("S9", 12, 4, "x = 1");
    EXPECT_EQ(call->toSource(), std::string(Constants::STEP_MARKER_NAME) + "('S9', 12, 4, 'x = 1')");
}

class SourcePrinterTest : public ::testing::Test {};

TEST_F(SourcePrinterTest, EmptyBlocksPrintAsPass) {
    auto program = RuleParser::parse("if a:\n    x = 1\nelse:\n    y = 2\n");
    auto ifAction = std::dynamic_pointer_cast<IfAction>(program[0]);
    ASSERT_NE(ifAction, nullptr);
    ifAction->setBranchActions(1, {});

    auto lines = SourcePrinter().print(program);
    ASSERT_EQ(lines.size(), 4);
    EXPECT_EQ(lines[2].text, "else:");
    EXPECT_EQ(lines[3].text, "    pass");
    EXPECT_EQ(lines[3].originalLine, 3);
}

TEST_F(SourcePrinterTest, IndentWidthIsConfigurable) {
    auto lines = SourcePrinter(2).print(RuleParser::parse("while x:\n    x -= 1\n"));
    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines[1].text, "  x -= 1");
    EXPECT_EQ(lines[1].originalLine, 2);
}
