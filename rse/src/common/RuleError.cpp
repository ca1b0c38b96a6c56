#include "common/RuleError.h"

namespace RSE {

RuleError::RuleError(const std::string &kind, const std::string &message, int line)
    : std::runtime_error(message), kind_(kind), message_(message), line_(line) {}

std::string RuleError::formatted() const {
    return kind_ + ": " + message_;
}

UnknownNameError::UnknownNameError(const std::string &name, int line)
    : RuleError("NameError", "name '" + name + "' is not defined", line), name_(name) {}

RuleSyntaxError::RuleSyntaxError(const std::string &message, int line, int column)
    : RuleError("SyntaxError", message + " (line " + std::to_string(line) + ")", line), column_(column) {}

}  // namespace RSE
