#include "scripting/ExpressionEvaluator.h"
#include "common/Constants.h"
#include "common/RuleError.h"
#include "common/StringUtils.h"
#include "common/ValueHelper.h"
#include "runtime/Environment.h"
#include "scripting/BuiltinRegistry.h"
#include <cmath>
#include <fmt/format.h>
#include <limits>

namespace RSE {

namespace {

bool isIntegral(const RuleValue &value) {
    return std::holds_alternative<int64_t>(value) || std::holds_alternative<bool>(value);
}

[[noreturn]] void throwUnsupported(const std::string &op, const RuleValue &lhs, const RuleValue &rhs, int line) {
    throw RuleTypeError(fmt::format("unsupported operand type(s) for {}: '{}' and '{}'", op,
                                    ValueHelper::typeName(lhs), ValueHelper::typeName(rhs)),
                        line);
}

[[noreturn]] void throwOverflow(int line) {
    throw RuleRuntimeError("OverflowError", "integer result out of range", line);
}

int64_t checkedAdd(int64_t a, int64_t b, int line) {
    int64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        throwOverflow(line);
    }
    return result;
}

int64_t checkedSub(int64_t a, int64_t b, int line) {
    int64_t result = 0;
    if (__builtin_sub_overflow(a, b, &result)) {
        throwOverflow(line);
    }
    return result;
}

int64_t checkedMul(int64_t a, int64_t b, int line) {
    int64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        throwOverflow(line);
    }
    return result;
}

// Python rounds integer division toward negative infinity
int64_t floorDivide(int64_t a, int64_t b, int line) {
    if (b == 0) {
        throw RuleRuntimeError("ZeroDivisionError", "integer division or modulo by zero", line);
    }
    if (a == std::numeric_limits<int64_t>::min() && b == -1) {
        throwOverflow(line);
    }
    int64_t quotient = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --quotient;
    }
    return quotient;
}

// Result takes the sign of the divisor
int64_t floorModulo(int64_t a, int64_t b, int line) {
    if (b == 0) {
        throw RuleRuntimeError("ZeroDivisionError", "integer modulo by zero", line);
    }
    if (b == -1) {
        return 0;
    }
    int64_t remainder = a % b;
    if (remainder != 0 && ((remainder < 0) != (b < 0))) {
        remainder += b;
    }
    return remainder;
}

double floatModulo(double a, double b, int line) {
    if (b == 0.0) {
        throw RuleRuntimeError("ZeroDivisionError", "float modulo", line);
    }
    double remainder = std::fmod(a, b);
    if (remainder != 0.0) {
        if ((remainder < 0) != (b < 0)) {
            remainder += b;
        }
    } else {
        remainder = std::copysign(0.0, b);
    }
    return remainder;
}

RuleValue power(const RuleValue &lhs, const RuleValue &rhs, int line) {
    if (isIntegral(lhs) && isIntegral(rhs)) {
        int64_t base = ValueHelper::toInteger(lhs);
        int64_t exponent = ValueHelper::toInteger(rhs);
        if (exponent >= 0) {
            int64_t result = 1;
            while (exponent > 0) {
                if (exponent & 1) {
                    result = checkedMul(result, base, line);
                }
                exponent >>= 1;
                if (exponent > 0) {
                    base = checkedMul(base, base, line);
                }
            }
            return result;
        }
    }

    double base = ValueHelper::toDouble(lhs, line);
    double exponent = ValueHelper::toDouble(rhs, line);
    if (base == 0.0 && exponent < 0) {
        throw RuleRuntimeError("ZeroDivisionError", "0.0 cannot be raised to a negative power", line);
    }
    if (base < 0 && std::floor(exponent) != exponent) {
        throw RuleRuntimeError("ValueError", "negative number cannot be raised to a fractional power", line);
    }
    return std::pow(base, exponent);
}

void checkRepetitionSize(size_t itemSize, int64_t count, int line) {
    if (count > 0 && itemSize > 0 && itemSize > Constants::MAX_COLLECTION_SIZE / static_cast<size_t>(count)) {
        throw LimitExceededError("repetition result too large", line);
    }
}

RuleValue repeat(const RuleValue &sequence, int64_t count, int line) {
    if (const auto *text = std::get_if<std::string>(&sequence)) {
        checkRepetitionSize(text->size(), count, line);
        std::string result;
        for (int64_t i = 0; i < count; ++i) {
            result += *text;
        }
        return result;
    }

    const auto &elements = std::get<RuleSequencePtr>(sequence)->elements;
    checkRepetitionSize(elements.size(), count, line);
    auto result = std::make_shared<RuleSequence>();
    for (int64_t i = 0; i < count; ++i) {
        result->elements.insert(result->elements.end(), elements.begin(), elements.end());
    }
    return result;
}

bool isRepeatable(const RuleValue &value) {
    return std::holds_alternative<std::string>(value) || std::holds_alternative<RuleSequencePtr>(value);
}

size_t normalizeIndex(const RuleValue &key, size_t size, const char *what, int line) {
    if (!isIntegral(key)) {
        throw RuleTypeError(fmt::format("{} indices must be integers, not '{}'", what, ValueHelper::typeName(key)),
                            line);
    }
    int64_t index = ValueHelper::toInteger(key);
    int64_t length = static_cast<int64_t>(size);
    if (index < 0) {
        index += length;
    }
    if (index < 0 || index >= length) {
        throw RuleRuntimeError("IndexError", fmt::format("{} index out of range", what), line);
    }
    return static_cast<size_t>(index);
}

const std::string &requireStringKey(const RuleValue &key, int line) {
    const auto *text = std::get_if<std::string>(&key);
    if (!text) {
        throw RuleTypeError(fmt::format("dict keys must be str, not '{}'", ValueHelper::typeName(key)), line);
    }
    return *text;
}

RuleValue instantiateRecord(const RuleRecordTypePtr &type, const CallArguments &arguments, int line) {
    if (!arguments.positional.empty()) {
        throw RuleTypeError(fmt::format("{}() takes no positional arguments", type->name), line);
    }
    auto record = std::make_shared<RuleRecord>(type->name);
    for (const auto &[field, value] : type->defaults.entries()) {
        record->fields.set(field, value);
    }
    for (const auto &[field, value] : arguments.keywords) {
        record->fields.set(field, value);
    }
    return record;
}

}  // namespace

ExpressionEvaluator::ExpressionEvaluator(Environment &environment) : environment_(environment) {}

RuleValue ExpressionEvaluator::evaluate(const Expression &expression) {
    try {
        return expression.accept(*this);
    } catch (RuleError &e) {
        e.setLineIfUnknown(expression.getLine());
        throw;
    }
}

bool ExpressionEvaluator::evaluateCondition(const Expression &expression) {
    return ValueHelper::isTruthy(evaluate(expression));
}

void ExpressionEvaluator::assign(const Expression &target, const RuleValue &value) {
    if (const auto *name = dynamic_cast<const NameExpression *>(&target)) {
        environment_.set(name->getName(), value);
        return;
    }
    if (const auto *attribute = dynamic_cast<const AttributeExpression *>(&target)) {
        RuleValue object = evaluate(attribute->getObject());
        setAttribute(object, attribute->getAttribute(), value, target.getLine());
        return;
    }
    if (const auto *subscript = dynamic_cast<const SubscriptExpression *>(&target)) {
        RuleValue container = evaluate(subscript->getObject());
        RuleValue key = evaluate(subscript->getIndex());
        setItem(container, key, value, target.getLine());
        return;
    }
    throw RuleSyntaxError("cannot assign to " + target.toSource(), target.getLine());
}

RuleValue ExpressionEvaluator::visitLiteral(const LiteralExpression &expr) {
    return expr.getValue();
}

RuleValue ExpressionEvaluator::visitName(const NameExpression &expr) {
    return environment_.lookup(expr.getName(), expr.getLine());
}

RuleValue ExpressionEvaluator::visitList(const ListExpression &expr) {
    auto sequence = std::make_shared<RuleSequence>();
    sequence->elements.reserve(expr.getElements().size());
    for (const auto &element : expr.getElements()) {
        sequence->elements.push_back(evaluate(*element));
    }
    return sequence;
}

RuleValue ExpressionEvaluator::visitDict(const DictExpression &expr) {
    auto mapping = std::make_shared<RuleMapping>();
    for (const auto &[keyExpr, valueExpr] : expr.getEntries()) {
        RuleValue key = evaluate(*keyExpr);
        const std::string &text = requireStringKey(key, keyExpr->getLine());
        mapping->entries.set(text, evaluate(*valueExpr));
    }
    return mapping;
}

RuleValue ExpressionEvaluator::visitUnary(const UnaryExpression &expr) {
    return applyUnary(expr.getOperator(), evaluate(expr.getOperand()), expr.getLine());
}

RuleValue ExpressionEvaluator::visitBinary(const BinaryExpression &expr) {
    RuleValue lhs = evaluate(expr.getLeft());
    RuleValue rhs = evaluate(expr.getRight());
    return applyBinary(expr.getOperator(), lhs, rhs, expr.getLine());
}

RuleValue ExpressionEvaluator::visitBoolOp(const BoolOpExpression &expr) {
    RuleValue lhs = evaluate(expr.getLeft());
    bool truthy = ValueHelper::isTruthy(lhs);
    if (expr.getOperator() == "and" ? !truthy : truthy) {
        return lhs;
    }
    return evaluate(expr.getRight());
}

RuleValue ExpressionEvaluator::visitCompare(const CompareExpression &expr) {
    RuleValue lhs = evaluate(expr.getFirst());
    for (const auto &[op, operand] : expr.getRest()) {
        RuleValue rhs = evaluate(*operand);
        if (!applyComparison(op, lhs, rhs, expr.getLine())) {
            return false;
        }
        lhs = std::move(rhs);
    }
    return true;
}

RuleValue ExpressionEvaluator::visitConditional(const ConditionalExpression &expr) {
    if (evaluateCondition(expr.getTest())) {
        return evaluate(expr.getBody());
    }
    return evaluate(expr.getOrElse());
}

RuleValue ExpressionEvaluator::visitAttribute(const AttributeExpression &expr) {
    return getAttribute(evaluate(expr.getObject()), expr.getAttribute(), expr.getLine());
}

RuleValue ExpressionEvaluator::visitSubscript(const SubscriptExpression &expr) {
    RuleValue container = evaluate(expr.getObject());
    RuleValue key = evaluate(expr.getIndex());
    return getItem(container, key, expr.getLine());
}

RuleValue ExpressionEvaluator::visitCall(const CallExpression &expr) {
    RuleValue callee = evaluate(expr.getCallee());

    CallArguments arguments;
    arguments.positional.reserve(expr.getArguments().size());
    for (const auto &argument : expr.getArguments()) {
        arguments.positional.push_back(evaluate(*argument));
    }
    for (const auto &[name, valueExpr] : expr.getKeywords()) {
        if (arguments.keyword(name)) {
            throw RuleSyntaxError("keyword argument repeated: " + name, expr.getLine());
        }
        arguments.keywords.emplace_back(name, evaluate(*valueExpr));
    }

    return callValue(callee, arguments, expr.getLine());
}

RuleValue ExpressionEvaluator::applyBinary(const std::string &op, const RuleValue &lhs, const RuleValue &rhs,
                                           int line) {
    bool integral = isIntegral(lhs) && isIntegral(rhs);
    bool numeric = ValueHelper::isNumeric(lhs) && ValueHelper::isNumeric(rhs);

    if (op == "+") {
        if (integral) {
            return checkedAdd(ValueHelper::toInteger(lhs), ValueHelper::toInteger(rhs), line);
        }
        if (numeric) {
            return ValueHelper::toDouble(lhs) + ValueHelper::toDouble(rhs);
        }
        const auto *ls = std::get_if<std::string>(&lhs);
        const auto *rs = std::get_if<std::string>(&rhs);
        if (ls && rs) {
            if (ls->size() + rs->size() > Constants::MAX_COLLECTION_SIZE) {
                throw LimitExceededError("string result too large", line);
            }
            return *ls + *rs;
        }
        if (ls) {
            throw RuleTypeError(
                fmt::format("can only concatenate str (not \"{}\") to str", ValueHelper::typeName(rhs)), line);
        }
        const auto *lseq = std::get_if<RuleSequencePtr>(&lhs);
        const auto *rseq = std::get_if<RuleSequencePtr>(&rhs);
        if (lseq && rseq) {
            auto result = std::make_shared<RuleSequence>((*lseq)->elements);
            result->elements.insert(result->elements.end(), (*rseq)->elements.begin(), (*rseq)->elements.end());
            if (result->elements.size() > Constants::MAX_COLLECTION_SIZE) {
                throw LimitExceededError("list result too large", line);
            }
            return result;
        }
        throwUnsupported(op, lhs, rhs, line);
    }

    if (op == "-") {
        if (integral) {
            return checkedSub(ValueHelper::toInteger(lhs), ValueHelper::toInteger(rhs), line);
        }
        if (numeric) {
            return ValueHelper::toDouble(lhs) - ValueHelper::toDouble(rhs);
        }
        throwUnsupported(op, lhs, rhs, line);
    }

    if (op == "*") {
        if (integral) {
            return checkedMul(ValueHelper::toInteger(lhs), ValueHelper::toInteger(rhs), line);
        }
        if (numeric) {
            return ValueHelper::toDouble(lhs) * ValueHelper::toDouble(rhs);
        }
        if (isRepeatable(lhs) && isIntegral(rhs)) {
            return repeat(lhs, ValueHelper::toInteger(rhs), line);
        }
        if (isIntegral(lhs) && isRepeatable(rhs)) {
            return repeat(rhs, ValueHelper::toInteger(lhs), line);
        }
        throwUnsupported(op, lhs, rhs, line);
    }

    if (op == "/") {
        if (!numeric) {
            throwUnsupported(op, lhs, rhs, line);
        }
        double divisor = ValueHelper::toDouble(rhs);
        if (divisor == 0.0) {
            throw RuleRuntimeError("ZeroDivisionError", "division by zero", line);
        }
        return ValueHelper::toDouble(lhs) / divisor;
    }

    if (op == "//") {
        if (integral) {
            return floorDivide(ValueHelper::toInteger(lhs), ValueHelper::toInteger(rhs), line);
        }
        if (!numeric) {
            throwUnsupported(op, lhs, rhs, line);
        }
        double divisor = ValueHelper::toDouble(rhs);
        if (divisor == 0.0) {
            throw RuleRuntimeError("ZeroDivisionError", "float floor division by zero", line);
        }
        return std::floor(ValueHelper::toDouble(lhs) / divisor);
    }

    if (op == "%") {
        if (integral) {
            return floorModulo(ValueHelper::toInteger(lhs), ValueHelper::toInteger(rhs), line);
        }
        if (!numeric) {
            throwUnsupported(op, lhs, rhs, line);
        }
        return floatModulo(ValueHelper::toDouble(lhs), ValueHelper::toDouble(rhs), line);
    }

    if (op == "**") {
        if (!numeric) {
            throwUnsupported(op, lhs, rhs, line);
        }
        return power(lhs, rhs, line);
    }

    throw RuleSyntaxError("unknown operator '" + op + "'", line);
}

RuleValue ExpressionEvaluator::applyUnary(const std::string &op, const RuleValue &operand, int line) {
    if (op == "not") {
        return !ValueHelper::isTruthy(operand);
    }
    if (!ValueHelper::isNumeric(operand)) {
        throw RuleTypeError(fmt::format("bad operand type for unary {}: '{}'", op, ValueHelper::typeName(operand)),
                            line);
    }
    if (op == "+") {
        if (isIntegral(operand)) {
            return ValueHelper::toInteger(operand);
        }
        return operand;
    }
    if (op == "-") {
        if (isIntegral(operand)) {
            return checkedSub(0, ValueHelper::toInteger(operand), line);
        }
        return -std::get<double>(operand);
    }
    throw RuleSyntaxError("unknown unary operator '" + op + "'", line);
}

bool ExpressionEvaluator::applyComparison(const std::string &op, const RuleValue &lhs, const RuleValue &rhs, int line) {
    if (op == "==") {
        return ValueHelper::equals(lhs, rhs);
    }
    if (op == "!=") {
        return !ValueHelper::equals(lhs, rhs);
    }
    if (op == "is") {
        return ValueHelper::isSame(lhs, rhs);
    }
    if (op == "is not") {
        return !ValueHelper::isSame(lhs, rhs);
    }
    if (op == "in") {
        return containsValue(rhs, lhs, line);
    }
    if (op == "not in") {
        return !containsValue(rhs, lhs, line);
    }

    // NaN compares false under every ordering
    if ((std::holds_alternative<double>(lhs) && std::isnan(std::get<double>(lhs))) ||
        (std::holds_alternative<double>(rhs) && std::isnan(std::get<double>(rhs)))) {
        ValueHelper::compare(lhs, rhs, line, op);
        return false;
    }

    int order = ValueHelper::compare(lhs, rhs, line, op);
    if (op == "<") {
        return order < 0;
    }
    if (op == "<=") {
        return order <= 0;
    }
    if (op == ">") {
        return order > 0;
    }
    if (op == ">=") {
        return order >= 0;
    }
    throw RuleSyntaxError("unknown comparison operator '" + op + "'", line);
}

bool ExpressionEvaluator::containsValue(const RuleValue &container, const RuleValue &item, int line) {
    if (const auto *text = std::get_if<std::string>(&container)) {
        const auto *needle = std::get_if<std::string>(&item);
        if (!needle) {
            throw RuleTypeError(
                fmt::format("'in <string>' requires string as left operand, not {}", ValueHelper::typeName(item)),
                line);
        }
        return text->find(*needle) != std::string::npos;
    }
    if (const auto *sequence = std::get_if<RuleSequencePtr>(&container)) {
        for (const auto &element : (*sequence)->elements) {
            if (ValueHelper::equals(element, item)) {
                return true;
            }
        }
        return false;
    }
    if (const auto *mapping = std::get_if<RuleMappingPtr>(&container)) {
        const auto *key = std::get_if<std::string>(&item);
        return key && (*mapping)->entries.contains(*key);
    }
    throw RuleTypeError(
        fmt::format("argument of type '{}' is not iterable", ValueHelper::typeName(container)), line);
}

std::vector<RuleValue> ExpressionEvaluator::iterate(const RuleValue &iterable, int line) {
    if (const auto *sequence = std::get_if<RuleSequencePtr>(&iterable)) {
        return (*sequence)->elements;
    }
    if (const auto *mapping = std::get_if<RuleMappingPtr>(&iterable)) {
        std::vector<RuleValue> keys;
        keys.reserve((*mapping)->entries.size());
        for (const auto &entry : (*mapping)->entries.entries()) {
            keys.emplace_back(entry.first);
        }
        return keys;
    }
    if (const auto *text = std::get_if<std::string>(&iterable)) {
        std::vector<RuleValue> characters;
        for (auto &character : splitCharacters(*text)) {
            characters.emplace_back(std::move(character));
        }
        return characters;
    }
    throw RuleTypeError(fmt::format("'{}' object is not iterable", ValueHelper::typeName(iterable)), line);
}

RuleValue ExpressionEvaluator::getItem(const RuleValue &container, const RuleValue &key, int line) {
    if (const auto *sequence = std::get_if<RuleSequencePtr>(&container)) {
        const auto &elements = (*sequence)->elements;
        return elements[normalizeIndex(key, elements.size(), "list", line)];
    }
    if (const auto *mapping = std::get_if<RuleMappingPtr>(&container)) {
        const std::string &text = requireStringKey(key, line);
        if (const RuleValue *value = (*mapping)->entries.find(text)) {
            return *value;
        }
        throw RuleRuntimeError("KeyError", ValueHelper::toRepr(key), line);
    }
    if (const auto *text = std::get_if<std::string>(&container)) {
        auto characters = splitCharacters(*text);
        return characters[normalizeIndex(key, characters.size(), "string", line)];
    }
    throw RuleTypeError(fmt::format("'{}' object is not subscriptable", ValueHelper::typeName(container)), line);
}

void ExpressionEvaluator::setItem(const RuleValue &container, const RuleValue &key, const RuleValue &value,
                                  int line) {
    if (const auto *sequence = std::get_if<RuleSequencePtr>(&container)) {
        auto &elements = (*sequence)->elements;
        elements[normalizeIndex(key, elements.size(), "list assignment", line)] = value;
        return;
    }
    if (const auto *mapping = std::get_if<RuleMappingPtr>(&container)) {
        (*mapping)->entries.set(requireStringKey(key, line), value);
        return;
    }
    throw RuleTypeError(
        fmt::format("'{}' object does not support item assignment", ValueHelper::typeName(container)), line);
}

RuleValue ExpressionEvaluator::getAttribute(const RuleValue &object, const std::string &name, int line) {
    if (const auto *record = std::get_if<RuleRecordPtr>(&object)) {
        if (const RuleValue *field = (*record)->fields.find(name)) {
            return *field;
        }
    } else if (const auto *type = std::get_if<RuleRecordTypePtr>(&object)) {
        if (const RuleValue *field = (*type)->defaults.find(name)) {
            return *field;
        }
    } else if (auto method = BuiltinRegistry::bindMethod(object, name)) {
        return method;
    }
    throw RuleRuntimeError("AttributeError",
                           fmt::format("'{}' object has no attribute '{}'", ValueHelper::typeName(object), name),
                           line);
}

void ExpressionEvaluator::setAttribute(const RuleValue &object, const std::string &name, const RuleValue &value,
                                       int line) {
    const auto *record = std::get_if<RuleRecordPtr>(&object);
    if (!record) {
        throw RuleRuntimeError(
            "AttributeError",
            fmt::format("'{}' object has no attribute '{}' to assign", ValueHelper::typeName(object), name), line);
    }
    (*record)->fields.set(name, value);
}

RuleValue ExpressionEvaluator::callValue(const RuleValue &callee, const CallArguments &arguments, int line) {
    if (const auto *function = std::get_if<BuiltinFunctionPtr>(&callee)) {
        try {
            return (*function)->invoke(arguments);
        } catch (RuleError &e) {
            e.setLineIfUnknown(line);
            throw;
        }
    }
    if (const auto *type = std::get_if<RuleRecordTypePtr>(&callee)) {
        return instantiateRecord(*type, arguments, line);
    }
    throw RuleTypeError(fmt::format("'{}' object is not callable", ValueHelper::typeName(callee)), line);
}

}  // namespace RSE
