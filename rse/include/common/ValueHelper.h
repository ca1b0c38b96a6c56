#pragma once

#include "RSETypes.h"
#include <string>

namespace RSE::ValueHelper {

/**
 * @brief Type name as the rule language reports it ("int", "list", record type name, ...)
 */
std::string typeName(const RuleValue &value);

/**
 * @brief Truthiness: None, False, 0, 0.0, '', [] and {} are false
 */
bool isTruthy(const RuleValue &value);

/**
 * @brief Quoted display form used in descriptions and inside collections
 *
 * Strings are single-quoted ('abc'), everything else renders as toDisplayString.
 */
std::string toRepr(const RuleValue &value);

/**
 * @brief Display form as str() returns it (strings unquoted)
 */
std::string toDisplayString(const RuleValue &value);

std::string formatFloat(double value);
std::string quoteString(const std::string &text);

bool isNumeric(const RuleValue &value);

/**
 * @brief Numeric view of bool / int / float values
 * @throws RuleTypeError when the value is not numeric
 */
double toDouble(const RuleValue &value, int line = 0);

/**
 * @brief Integer view of bool / int values
 * @throws RuleTypeError when the value is not an integer
 */
int64_t toInteger(const RuleValue &value, int line = 0);

/**
 * @brief Equality with numeric promotion; records compare by identity
 */
bool equals(const RuleValue &lhs, const RuleValue &rhs);

/**
 * @brief Ordering for <, <=, >, >= and sorted()
 * @return negative, zero or positive
 * @throws RuleTypeError for unorderable operands
 */
int compare(const RuleValue &lhs, const RuleValue &rhs, int line = 0, const std::string &op = "<");

/**
 * @brief Identity test backing `is`
 */
bool isSame(const RuleValue &lhs, const RuleValue &rhs);

}  // namespace RSE::ValueHelper
