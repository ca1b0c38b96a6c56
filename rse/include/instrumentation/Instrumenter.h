#pragma once

#include "actions/IActionNode.h"
#include "common/JsonUtils.h"
#include "scripting/Expression.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace RSE {

class ExpressionAction;

/**
 * @brief Instrumented line -> original line side table
 *
 * Built once by the Instrumenter and read-only afterwards. Marker lines map
 * to the statement they report; the end marker maps to 0.
 */
class LineMap {
public:
    void add(int instrumentedLine, int originalLine);

    std::optional<int> find(int instrumentedLine) const;

    /**
     * @brief Original line for an instrumented line, 0 when unmapped
     */
    int toOriginal(int instrumentedLine) const;

    size_t size() const {
        return lines_.size();
    }

    const std::map<int, int> &entries() const {
        return lines_;
    }

    json toJson() const;

private:
    std::map<int, int> lines_;
};

/**
 * @brief Result of rewriting a program with step markers
 */
struct InstrumentedProgram {
    ActionList program;  // rewritten tree (the input tree is left untouched)
    std::string source;  // printed from `program`
    LineMap lineMap;
    size_t markerCount = 0;
};

/**
 * @brief Inserts __rule_step__ markers into a statement tree
 *
 * Markers go after every simple statement at every depth, immediately
 * before break and continue, and once at the end of the program. A chained
 * assignment is split into one assignment per target (later targets copy
 * the first), each with its own marker. pass and class declarations get none. Each marker
 * is an ordinary expression statement:
 *
 *   __rule_step__('S3', 7, 4, 'total = total + item')
 *
 * carrying its step id, its own line in the printed source, the original
 * line and the statement text. The printed source parses back into the
 * same tree.
 */
class Instrumenter {
public:
    InstrumentedProgram instrument(const ActionList &program);

    /**
     * @brief Build a marker call expression
     */
    static ExpressionPtr makeMarkerCall(const std::string &stepId, int instrumentedLine, int originalLine,
                                        const std::string &description);

private:
    struct MarkerInfo {
        std::string stepId;
        int originalLine = 0;
        std::string description;
    };

    size_t nextStep_ = 0;
    std::unordered_map<const IActionNode *, std::pair<std::shared_ptr<ExpressionAction>, MarkerInfo>> markers_;

    ActionList instrumentBlock(const ActionList &block);
    std::shared_ptr<IActionNode> instrumentCompound(const IActionNode &action);
    std::shared_ptr<IActionNode> makeMarker(int originalLine, const std::string &description,
                                            const std::string &stepId = "");
};

}  // namespace RSE
