#pragma once

#include <stdexcept>
#include <string>

namespace RSE {

/**
 * @brief Base class of every failure raised while parsing or evaluating a rule
 *
 * Carries the error kind as the rule author sees it ("NameError",
 * "TypeError", ...) and the original source line, 0 when unknown.
 * what() returns the bare message; formatted() returns "<Kind>: <message>".
 */
class RuleError : public std::runtime_error {
public:
    RuleError(const std::string &kind, const std::string &message, int line = 0);

    const std::string &kind() const {
        return kind_;
    }

    const std::string &message() const {
        return message_;
    }

    int line() const {
        return line_;
    }

    /**
     * @brief Attach a line if none was known at the throw site
     */
    void setLineIfUnknown(int line) {
        if (line_ == 0) {
            line_ = line;
        }
    }

    std::string formatted() const;

private:
    std::string kind_;
    std::string message_;
    int line_;
};

/**
 * @brief Identifier neither bound nor a registered built-in
 */
class UnknownNameError : public RuleError {
public:
    explicit UnknownNameError(const std::string &name, int line = 0);

    const std::string &name() const {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief Operator, attribute or call applied to an incompatible value
 */
class RuleTypeError : public RuleError {
public:
    explicit RuleTypeError(const std::string &message, int line = 0) : RuleError("TypeError", message, line) {}
};

/**
 * @brief Source text does not parse
 */
class RuleSyntaxError : public RuleError {
public:
    RuleSyntaxError(const std::string &message, int line, int column = 0);

    int column() const {
        return column_;
    }

private:
    int column_;
};

/**
 * @brief A value has no JSON encoding
 *
 * Never reaches a caller: snapshot capture substitutes the display string.
 */
class SerializationError : public RuleError {
public:
    explicit SerializationError(const std::string &message) : RuleError("SerializationError", message, 0) {}
};

/**
 * @brief Evaluation failure with a runtime kind
 *
 * Kinds: ZeroDivisionError, IndexError, KeyError, AttributeError, ValueError.
 */
class RuleRuntimeError : public RuleError {
public:
    RuleRuntimeError(const std::string &kind, const std::string &message, int line = 0)
        : RuleError(kind, message, line) {}
};

/**
 * @brief Step or loop-iteration guard tripped
 */
class LimitExceededError : public RuleError {
public:
    explicit LimitExceededError(const std::string &message, int line = 0)
        : RuleError("LimitExceededError", message, line) {}
};

}  // namespace RSE
