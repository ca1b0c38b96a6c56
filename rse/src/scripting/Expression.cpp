#include "scripting/Expression.h"
#include "common/ValueHelper.h"

namespace RSE {

std::string Expression::wrap(const Expression &child, Precedence minimum, bool strict) {
    bool needsParens = child.precedence() < minimum || (strict && child.precedence() == minimum);
    return needsParens ? "(" + child.toSource() + ")" : child.toSource();
}

// Literal

RuleValue LiteralExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitLiteral(*this);
}

std::string LiteralExpression::toSource() const {
    return ValueHelper::toRepr(value_);
}

// Name

RuleValue NameExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitName(*this);
}

// List

RuleValue ListExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitList(*this);
}

std::string ListExpression::toSource() const {
    std::string out = "[";
    for (size_t i = 0; i < elements_.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += wrap(*elements_[i], Precedence::Conditional, false);
    }
    return out + "]";
}

// Dict

RuleValue DictExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitDict(*this);
}

std::string DictExpression::toSource() const {
    std::string out = "{";
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += wrap(*entries_[i].first, Precedence::Conditional, false) + ": " +
               wrap(*entries_[i].second, Precedence::Conditional, false);
    }
    return out + "}";
}

// Unary

RuleValue UnaryExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitUnary(*this);
}

std::string UnaryExpression::toSource() const {
    if (op_ == "not") {
        return "not " + wrap(*operand_, Precedence::Not, false);
    }
    return op_ + wrap(*operand_, Precedence::Unary, false);
}

Expression::Precedence UnaryExpression::precedence() const {
    return op_ == "not" ? Precedence::Not : Precedence::Unary;
}

// Binary

RuleValue BinaryExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitBinary(*this);
}

std::string BinaryExpression::toSource() const {
    if (op_ == "**") {
        // Right-associative, and the exponent may carry a sign: 2 ** -1
        return wrap(*left_, Precedence::Power, true) + " ** " + wrap(*right_, Precedence::Unary, false);
    }
    return wrap(*left_, precedence(), false) + " " + op_ + " " + wrap(*right_, precedence(), true);
}

Expression::Precedence BinaryExpression::precedence() const {
    if (op_ == "+" || op_ == "-") {
        return Precedence::Additive;
    }
    if (op_ == "**") {
        return Precedence::Power;
    }
    return Precedence::Multiplicative;
}

// BoolOp

RuleValue BoolOpExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitBoolOp(*this);
}

std::string BoolOpExpression::toSource() const {
    return wrap(*left_, precedence(), false) + " " + op_ + " " + wrap(*right_, precedence(), true);
}

// Compare

RuleValue CompareExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitCompare(*this);
}

std::string CompareExpression::toSource() const {
    std::string out = wrap(*first_, Precedence::Comparison, true);
    for (const auto &[op, operand] : rest_) {
        out += " " + op + " " + wrap(*operand, Precedence::Comparison, true);
    }
    return out;
}

// Conditional

RuleValue ConditionalExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitConditional(*this);
}

std::string ConditionalExpression::toSource() const {
    return wrap(*body_, Precedence::Or, false) + " if " + wrap(*test_, Precedence::Or, false) + " else " +
           wrap(*orElse_, Precedence::Conditional, false);
}

// Attribute

RuleValue AttributeExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitAttribute(*this);
}

std::string AttributeExpression::toSource() const {
    return wrap(*object_, Precedence::Postfix, false) + "." + attribute_;
}

// Subscript

RuleValue SubscriptExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitSubscript(*this);
}

std::string SubscriptExpression::toSource() const {
    return wrap(*object_, Precedence::Postfix, false) + "[" + wrap(*index_, Precedence::Conditional, false) + "]";
}

// Call

RuleValue CallExpression::accept(IExpressionVisitor &visitor) const {
    return visitor.visitCall(*this);
}

std::string CallExpression::toSource() const {
    std::string out = wrap(*callee_, Precedence::Postfix, false) + "(";
    bool first = true;
    for (const auto &argument : arguments_) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += wrap(*argument, Precedence::Conditional, false);
    }
    for (const auto &[name, value] : keywords_) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += name + "=" + wrap(*value, Precedence::Conditional, false);
    }
    return out + ")";
}

}  // namespace RSE
