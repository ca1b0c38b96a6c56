#include "common/ValueHelper.h"
#include "common/RuleError.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace RSE::ValueHelper {

namespace {

// Self-referencing lists (a.append(a)) render as [...] past this depth
constexpr int MAX_RENDER_DEPTH = 64;

template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string render(const RuleValue &value, bool quoteStrings, int depth) {
    if (depth > MAX_RENDER_DEPTH) {
        return "...";
    }

    return std::visit(
        Overloaded{
            [](const RuleNone &) -> std::string { return "None"; },
            [](bool b) -> std::string { return b ? "True" : "False"; },
            [](int64_t i) -> std::string { return std::to_string(i); },
            [](double d) -> std::string { return formatFloat(d); },
            [quoteStrings](const std::string &s) -> std::string { return quoteStrings ? quoteString(s) : s; },
            [depth](const RuleSequencePtr &seq) -> std::string {
                std::string out = "[";
                for (size_t i = 0; i < seq->elements.size(); ++i) {
                    if (i > 0) {
                        out += ", ";
                    }
                    out += render(seq->elements[i], true, depth + 1);
                }
                return out + "]";
            },
            [depth](const RuleMappingPtr &map) -> std::string {
                std::string out = "{";
                bool first = true;
                for (const auto &[key, item] : map->entries.entries()) {
                    if (!first) {
                        out += ", ";
                    }
                    first = false;
                    out += quoteString(key) + ": " + render(item, true, depth + 1);
                }
                return out + "}";
            },
            [depth](const RuleRecordPtr &record) -> std::string {
                std::string out = record->typeName + "(";
                bool first = true;
                for (const auto &[key, item] : record->fields.entries()) {
                    if (!first) {
                        out += ", ";
                    }
                    first = false;
                    out += key + "=" + render(item, true, depth + 1);
                }
                return out + ")";
            },
            [](const RuleRecordTypePtr &type) -> std::string { return "<class '" + type->name + "'>"; },
            [](const BuiltinFunctionPtr &fn) -> std::string { return "<built-in function " + fn->name + ">"; },
        },
        value);
}

bool isIntegral(const RuleValue &value) {
    return std::holds_alternative<bool>(value) || std::holds_alternative<int64_t>(value);
}

}  // namespace

std::string typeName(const RuleValue &value) {
    return std::visit(Overloaded{
                          [](const RuleNone &) -> std::string { return "NoneType"; },
                          [](bool) -> std::string { return "bool"; },
                          [](int64_t) -> std::string { return "int"; },
                          [](double) -> std::string { return "float"; },
                          [](const std::string &) -> std::string { return "str"; },
                          [](const RuleSequencePtr &) -> std::string { return "list"; },
                          [](const RuleMappingPtr &) -> std::string { return "dict"; },
                          [](const RuleRecordPtr &record) -> std::string { return record->typeName; },
                          [](const RuleRecordTypePtr &) -> std::string { return "type"; },
                          [](const BuiltinFunctionPtr &) -> std::string { return "builtin_function_or_method"; },
                      },
                      value);
}

bool isTruthy(const RuleValue &value) {
    return std::visit(Overloaded{
                          [](const RuleNone &) { return false; },
                          [](bool b) { return b; },
                          [](int64_t i) { return i != 0; },
                          [](double d) { return d != 0.0; },
                          [](const std::string &s) { return !s.empty(); },
                          [](const RuleSequencePtr &seq) { return !seq->elements.empty(); },
                          [](const RuleMappingPtr &map) { return !map->entries.empty(); },
                          [](const RuleRecordPtr &) { return true; },
                          [](const RuleRecordTypePtr &) { return true; },
                          [](const BuiltinFunctionPtr &) { return true; },
                      },
                      value);
}

std::string toRepr(const RuleValue &value) {
    return render(value, true, 0);
}

std::string toDisplayString(const RuleValue &value) {
    return render(value, false, 0);
}

std::string formatFloat(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    std::string text = fmt::format("{}", value);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string quoteString(const std::string &text) {
    char quote = '\'';
    if (text.find('\'') != std::string::npos && text.find('"') == std::string::npos) {
        quote = '"';
    }

    std::string out;
    out.reserve(text.size() + 2);
    out += quote;
    for (char c : text) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (c == quote) {
                out += '\\';
                out += c;
            } else if (static_cast<unsigned char>(c) < 0x20) {
                out += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
            } else {
                out += c;
            }
        }
    }
    out += quote;
    return out;
}

bool isNumeric(const RuleValue &value) {
    return isIntegral(value) || std::holds_alternative<double>(value);
}

double toDouble(const RuleValue &value, int line) {
    if (const auto *b = std::get_if<bool>(&value)) {
        return *b ? 1.0 : 0.0;
    }
    if (const auto *i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto *d = std::get_if<double>(&value)) {
        return *d;
    }
    throw RuleTypeError("expected a number, got '" + typeName(value) + "'", line);
}

int64_t toInteger(const RuleValue &value, int line) {
    if (const auto *b = std::get_if<bool>(&value)) {
        return *b ? 1 : 0;
    }
    if (const auto *i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    throw RuleTypeError("'" + typeName(value) + "' object cannot be interpreted as an integer", line);
}

bool equals(const RuleValue &lhs, const RuleValue &rhs) {
    if (isNumeric(lhs) && isNumeric(rhs)) {
        if (isIntegral(lhs) && isIntegral(rhs)) {
            return toInteger(lhs) == toInteger(rhs);
        }
        return toDouble(lhs) == toDouble(rhs);
    }
    if (lhs.index() != rhs.index()) {
        return false;
    }

    if (std::holds_alternative<RuleNone>(lhs)) {
        return true;
    }
    if (const auto *s = std::get_if<std::string>(&lhs)) {
        return *s == std::get<std::string>(rhs);
    }
    if (const auto *seq = std::get_if<RuleSequencePtr>(&lhs)) {
        const auto &other = std::get<RuleSequencePtr>(rhs);
        if (*seq == other) {
            return true;
        }
        if ((*seq)->elements.size() != other->elements.size()) {
            return false;
        }
        for (size_t i = 0; i < other->elements.size(); ++i) {
            if (!equals((*seq)->elements[i], other->elements[i])) {
                return false;
            }
        }
        return true;
    }
    if (const auto *map = std::get_if<RuleMappingPtr>(&lhs)) {
        const auto &other = std::get<RuleMappingPtr>(rhs);
        if (*map == other) {
            return true;
        }
        if ((*map)->entries.size() != other->entries.size()) {
            return false;
        }
        for (const auto &[key, item] : (*map)->entries.entries()) {
            const RuleValue *match = other->entries.find(key);
            if (!match || !equals(item, *match)) {
                return false;
            }
        }
        return true;
    }
    return isSame(lhs, rhs);
}

int compare(const RuleValue &lhs, const RuleValue &rhs, int line, const std::string &op) {
    if (isNumeric(lhs) && isNumeric(rhs)) {
        if (isIntegral(lhs) && isIntegral(rhs)) {
            int64_t a = toInteger(lhs);
            int64_t b = toInteger(rhs);
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        double a = toDouble(lhs);
        double b = toDouble(rhs);
        return a < b ? -1 : (a > b ? 1 : 0);
    }

    const auto *ls = std::get_if<std::string>(&lhs);
    const auto *rs = std::get_if<std::string>(&rhs);
    if (ls && rs) {
        int result = ls->compare(*rs);
        return result < 0 ? -1 : (result > 0 ? 1 : 0);
    }

    const auto *lseq = std::get_if<RuleSequencePtr>(&lhs);
    const auto *rseq = std::get_if<RuleSequencePtr>(&rhs);
    if (lseq && rseq) {
        const auto &a = (*lseq)->elements;
        const auto &b = (*rseq)->elements;
        for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
            if (!equals(a[i], b[i])) {
                return compare(a[i], b[i], line, op);
            }
        }
        return a.size() < b.size() ? -1 : (a.size() > b.size() ? 1 : 0);
    }

    throw RuleTypeError("'" + op + "' not supported between instances of '" + typeName(lhs) + "' and '" +
                            typeName(rhs) + "'",
                        line);
}

bool isSame(const RuleValue &lhs, const RuleValue &rhs) {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    return std::visit(Overloaded{
                          [](const RuleNone &) { return true; },
                          [&rhs](bool b) { return b == std::get<bool>(rhs); },
                          [&rhs](int64_t i) { return i == std::get<int64_t>(rhs); },
                          [&rhs](double d) { return d == std::get<double>(rhs); },
                          [&rhs](const std::string &s) { return s == std::get<std::string>(rhs); },
                          [&rhs](const RuleSequencePtr &p) { return p == std::get<RuleSequencePtr>(rhs); },
                          [&rhs](const RuleMappingPtr &p) { return p == std::get<RuleMappingPtr>(rhs); },
                          [&rhs](const RuleRecordPtr &p) { return p == std::get<RuleRecordPtr>(rhs); },
                          [&rhs](const RuleRecordTypePtr &p) { return p == std::get<RuleRecordTypePtr>(rhs); },
                          [&rhs](const BuiltinFunctionPtr &p) { return p == std::get<BuiltinFunctionPtr>(rhs); },
                      },
                      lhs);
}

}  // namespace RSE::ValueHelper
