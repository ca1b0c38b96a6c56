#include "instrumentation/Instrumenter.h"
#include "actions/AssignAction.h"
#include "actions/ExpressionAction.h"
#include "actions/ForeachAction.h"
#include "actions/IfAction.h"
#include "actions/LoopControlAction.h"
#include "actions/WhileAction.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "instrumentation/SourcePrinter.h"

namespace RSE {

void LineMap::add(int instrumentedLine, int originalLine) {
    lines_[instrumentedLine] = originalLine;
}

std::optional<int> LineMap::find(int instrumentedLine) const {
    auto it = lines_.find(instrumentedLine);
    if (it == lines_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int LineMap::toOriginal(int instrumentedLine) const {
    return find(instrumentedLine).value_or(0);
}

json LineMap::toJson() const {
    json result = json::object();
    for (const auto &[instrumented, original] : lines_) {
        result[std::to_string(instrumented)] = original;
    }
    return result;
}

ExpressionPtr Instrumenter::makeMarkerCall(const std::string &stepId, int instrumentedLine, int originalLine,
                                           const std::string &description) {
    std::vector<ExpressionPtr> arguments{
        std::make_shared<LiteralExpression>(RuleValue{stepId}, originalLine),
        std::make_shared<LiteralExpression>(RuleValue{static_cast<int64_t>(instrumentedLine)}, originalLine),
        std::make_shared<LiteralExpression>(RuleValue{static_cast<int64_t>(originalLine)}, originalLine),
        std::make_shared<LiteralExpression>(RuleValue{description}, originalLine)};
    return std::make_shared<CallExpression>(
        std::make_shared<NameExpression>(Constants::STEP_MARKER_NAME, originalLine), std::move(arguments),
        std::vector<CallExpression::Keyword>{}, originalLine);
}

std::shared_ptr<IActionNode> Instrumenter::makeMarker(int originalLine, const std::string &description,
                                                      const std::string &stepId) {
    MarkerInfo info;
    info.stepId = stepId.empty() ? Constants::STEP_ID_PREFIX + std::to_string(++nextStep_) : stepId;
    info.originalLine = originalLine;
    info.description = description;

    auto marker =
        std::make_shared<ExpressionAction>(makeMarkerCall(info.stepId, 0, originalLine, description), originalLine,
                                           info.stepId);
    markers_[marker.get()] = {marker, info};
    return marker;
}

std::shared_ptr<IActionNode> Instrumenter::instrumentCompound(const IActionNode &action) {
    if (const auto *ifAction = dynamic_cast<const IfAction *>(&action)) {
        auto copy = std::dynamic_pointer_cast<IfAction>(ifAction->clone());
        for (size_t i = 0; i < copy->getBranchCount(); ++i) {
            copy->setBranchActions(i, instrumentBlock(ifAction->getBranch(i).actions));
        }
        return copy;
    }
    if (const auto *forAction = dynamic_cast<const ForeachAction *>(&action)) {
        auto copy = std::dynamic_pointer_cast<ForeachAction>(forAction->clone());
        copy->setIterationActions(instrumentBlock(forAction->getIterationActions()));
        if (forAction->hasCompletionBranch()) {
            copy->setCompletionActions(instrumentBlock(forAction->getCompletionActions()));
        }
        return copy;
    }
    if (const auto *whileAction = dynamic_cast<const WhileAction *>(&action)) {
        auto copy = std::dynamic_pointer_cast<WhileAction>(whileAction->clone());
        copy->setBodyActions(instrumentBlock(whileAction->getBodyActions()));
        if (whileAction->hasCompletionBranch()) {
            copy->setCompletionActions(instrumentBlock(whileAction->getCompletionActions()));
        }
        return copy;
    }
    return nullptr;
}

ActionList Instrumenter::instrumentBlock(const ActionList &block) {
    ActionList out;
    for (const auto &action : block) {
        if (!action) {
            continue;
        }

        if (auto compound = instrumentCompound(*action)) {
            out.push_back(std::move(compound));
            continue;
        }

        const std::string type = action->getActionType();
        if (type == "pass" || type == "class") {
            out.push_back(action->clone());
            continue;
        }

        if (dynamic_cast<const LoopControlAction *>(action.get())) {
            out.push_back(makeMarker(action->getLine(), action->getSourceText()));
            out.push_back(action->clone());
            continue;
        }

        // a = b = v becomes a = v; b = a, each followed by its marker, so every
        // target's snapshot shows only the bindings made so far
        const auto *assign = dynamic_cast<const AssignAction *>(action.get());
        if (assign && !assign->isAugmented() && assign->getTargets().size() > 1) {
            const auto &targets = assign->getTargets();
            for (size_t i = 0; i < targets.size(); ++i) {
                ExpressionPtr value = i == 0 ? assign->getValue() : targets.front();
                out.push_back(std::make_shared<AssignAction>(std::vector<ExpressionPtr>{targets[i]}, value,
                                                             action->getLine()));
                out.push_back(
                    makeMarker(action->getLine(), targets[i]->toSource() + " = " + assign->getValue()->toSource()));
            }
            continue;
        }

        out.push_back(action->clone());
        out.push_back(makeMarker(action->getLine(), action->getSourceText()));
    }
    return out;
}

InstrumentedProgram Instrumenter::instrument(const ActionList &program) {
    nextStep_ = 0;
    markers_.clear();

    InstrumentedProgram result;
    result.program = instrumentBlock(program);
    result.program.push_back(makeMarker(0, Constants::COMPLETION_DESCRIPTION, Constants::COMPLETION_STEP_ID));

    // First pass fixes each marker's printed line; markers stay single-line,
    // so rewriting them does not move anything
    SourcePrinter printer;
    auto lines = printer.print(result.program);
    for (size_t i = 0; i < lines.size(); ++i) {
        auto it = markers_.find(lines[i].node);
        if (it == markers_.end()) {
            continue;
        }
        const auto &[marker, info] = it->second;
        marker->setExpression(
            makeMarkerCall(info.stepId, static_cast<int>(i + 1), info.originalLine, info.description));
    }

    lines = printer.print(result.program);
    for (size_t i = 0; i < lines.size(); ++i) {
        result.lineMap.add(static_cast<int>(i + 1), lines[i].originalLine);
    }
    result.source = SourcePrinter::render(lines);
    result.markerCount = markers_.size();
    markers_.clear();

    LOG_DEBUG("Instrumenter: {} markers inserted, {} instrumented lines", result.markerCount, lines.size());
    return result;
}

}  // namespace RSE
