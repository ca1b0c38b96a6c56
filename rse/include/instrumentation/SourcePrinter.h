#pragma once

#include "actions/IActionNode.h"
#include <string>
#include <vector>

namespace RSE {

/**
 * @brief One rendered source line and the statement it came from
 */
struct PrintedLine {
    std::string text;
    int originalLine = 0;
    const IActionNode *node = nullptr;
};

/**
 * @brief Renders a statement tree back to rule source
 *
 * Every statement and block header prints on exactly one line, so the
 * printed line number of a node is stable as long as the tree shape is.
 * Empty blocks print as `pass`.
 */
class SourcePrinter {
public:
    explicit SourcePrinter(int indentWidth = 4);

    std::vector<PrintedLine> print(const ActionList &program) const;

    static std::string render(const std::vector<PrintedLine> &lines);

private:
    int indentWidth_;

    void printBlock(const ActionList &block, int depth, int headerLine, std::vector<PrintedLine> &out) const;
    void printAction(const IActionNode &action, int depth, std::vector<PrintedLine> &out) const;
    void emit(std::vector<PrintedLine> &out, int depth, const std::string &text, int line,
              const IActionNode *node) const;
};

}  // namespace RSE
