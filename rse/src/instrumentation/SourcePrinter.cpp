#include "instrumentation/SourcePrinter.h"
#include "actions/ForeachAction.h"
#include "actions/IfAction.h"
#include "actions/RecordTypeAction.h"
#include "actions/WhileAction.h"

namespace RSE {

SourcePrinter::SourcePrinter(int indentWidth) : indentWidth_(indentWidth > 0 ? indentWidth : 4) {}

std::vector<PrintedLine> SourcePrinter::print(const ActionList &program) const {
    std::vector<PrintedLine> lines;
    for (const auto &action : program) {
        if (action) {
            printAction(*action, 0, lines);
        }
    }
    return lines;
}

std::string SourcePrinter::render(const std::vector<PrintedLine> &lines) {
    std::string text;
    for (const auto &line : lines) {
        text += line.text;
        text += '\n';
    }
    return text;
}

void SourcePrinter::emit(std::vector<PrintedLine> &out, int depth, const std::string &text, int line,
                         const IActionNode *node) const {
    out.push_back(PrintedLine{std::string(static_cast<size_t>(depth * indentWidth_), ' ') + text, line, node});
}

void SourcePrinter::printBlock(const ActionList &block, int depth, int headerLine,
                               std::vector<PrintedLine> &out) const {
    size_t before = out.size();
    for (const auto &action : block) {
        if (action) {
            printAction(*action, depth, out);
        }
    }
    if (out.size() == before) {
        emit(out, depth, "pass", headerLine, nullptr);
    }
}

void SourcePrinter::printAction(const IActionNode &action, int depth, std::vector<PrintedLine> &out) const {
    if (const auto *ifAction = dynamic_cast<const IfAction *>(&action)) {
        const auto &branches = ifAction->getBranches();
        for (size_t i = 0; i < branches.size(); ++i) {
            const auto &branch = branches[i];
            std::string header;
            if (branch.isElseBranch) {
                header = "else:";
            } else {
                header = (i == 0 ? "if " : "elif ") + branch.condition->toSource() + ":";
            }
            emit(out, depth, header, branch.line, &action);
            printBlock(branch.actions, depth + 1, branch.line, out);
        }
        return;
    }

    if (const auto *forAction = dynamic_cast<const ForeachAction *>(&action)) {
        emit(out, depth, action.getSourceText(), action.getLine(), &action);
        printBlock(forAction->getIterationActions(), depth + 1, action.getLine(), out);
        if (forAction->hasCompletionBranch()) {
            emit(out, depth, "else:", forAction->getCompletionLine(), &action);
            printBlock(forAction->getCompletionActions(), depth + 1, forAction->getCompletionLine(), out);
        }
        return;
    }

    if (const auto *whileAction = dynamic_cast<const WhileAction *>(&action)) {
        emit(out, depth, action.getSourceText(), action.getLine(), &action);
        printBlock(whileAction->getBodyActions(), depth + 1, action.getLine(), out);
        if (whileAction->hasCompletionBranch()) {
            emit(out, depth, "else:", whileAction->getCompletionLine(), &action);
            printBlock(whileAction->getCompletionActions(), depth + 1, whileAction->getCompletionLine(), out);
        }
        return;
    }

    if (const auto *recordType = dynamic_cast<const RecordTypeAction *>(&action)) {
        emit(out, depth, action.getSourceText(), action.getLine(), &action);
        if (recordType->getFieldDefaults().empty()) {
            emit(out, depth + 1, "pass", action.getLine(), &action);
        }
        for (const auto &[field, value] : recordType->getFieldDefaults()) {
            emit(out, depth + 1, field + " = " + value->toSource(), action.getLine(), &action);
        }
        return;
    }

    emit(out, depth, action.getSourceText(), action.getLine(), &action);
}

}  // namespace RSE
