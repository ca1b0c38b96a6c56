#include "scripting/BuiltinRegistry.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/RuleError.h"
#include "common/StringUtils.h"
#include "common/ValueHelper.h"
#include "scripting/ExpressionEvaluator.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

namespace RSE {

namespace {

void expectPositional(const std::string &function, const CallArguments &args, size_t minimum, size_t maximum) {
    size_t given = args.positional.size();
    if (given >= minimum && given <= maximum) {
        return;
    }
    if (minimum == maximum) {
        throw RuleTypeError(fmt::format("{}() takes exactly {} argument{} ({} given)", function, minimum,
                                        minimum == 1 ? "" : "s", given));
    }
    if (given < minimum) {
        throw RuleTypeError(fmt::format("{}() expected at least {} argument{}, got {}", function, minimum,
                                        minimum == 1 ? "" : "s", given));
    }
    throw RuleTypeError(fmt::format("{}() expected at most {} argument{}, got {}", function, maximum,
                                    maximum == 1 ? "" : "s", given));
}

void rejectKeywords(const std::string &function, const CallArguments &args,
                    std::initializer_list<const char *> accepted = {}) {
    for (const auto &entry : args.keywords) {
        bool known = std::any_of(accepted.begin(), accepted.end(),
                                 [&entry](const char *name) { return entry.first == name; });
        if (!known) {
            throw RuleTypeError(
                fmt::format("{}() got an unexpected keyword argument '{}'", function, entry.first));
        }
    }
}

const std::string &expectString(const std::string &function, const RuleValue &value) {
    const auto *text = std::get_if<std::string>(&value);
    if (!text) {
        throw RuleTypeError(
            fmt::format("{}() argument must be str, not '{}'", function, ValueHelper::typeName(value)));
    }
    return *text;
}

bool isIntegral(const RuleValue &value) {
    return std::holds_alternative<int64_t>(value) || std::holds_alternative<bool>(value);
}

std::string asciiLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string asciiUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

RuleValue parseInteger(const std::string &text) {
    std::string trimmed = trimWhitespace(text);
    std::string digits = trimmed;
    digits.erase(std::remove(digits.begin(), digits.end(), '_'), digits.end());
    bool valid = !digits.empty();
    size_t start = (valid && (digits[0] == '+' || digits[0] == '-')) ? 1 : 0;
    if (start >= digits.size()) {
        valid = false;
    }
    for (size_t i = start; valid && i < digits.size(); ++i) {
        valid = std::isdigit(static_cast<unsigned char>(digits[i])) != 0;
    }
    if (!valid) {
        throw RuleRuntimeError("ValueError",
                               "invalid literal for int() with base 10: " + ValueHelper::quoteString(text));
    }
    errno = 0;
    long long result = std::strtoll(digits.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        throw RuleRuntimeError("OverflowError", "int too large to convert");
    }
    return static_cast<int64_t>(result);
}

RuleValue parseFloat(const std::string &text) {
    std::string trimmed = trimWhitespace(text);
    std::string lowered = asciiLower(trimmed);
    if (!lowered.empty() && (lowered[0] == '+' || lowered[0] == '-')) {
        std::string body = lowered.substr(1);
        double sign = lowered[0] == '-' ? -1.0 : 1.0;
        if (body == "inf" || body == "infinity") {
            return sign * std::numeric_limits<double>::infinity();
        }
        if (body == "nan") {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }
    if (lowered == "inf" || lowered == "infinity") {
        return std::numeric_limits<double>::infinity();
    }
    if (lowered == "nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    if (!trimmed.empty()) {
        char *end = nullptr;
        double result = std::strtod(trimmed.c_str(), &end);
        bool hexOrWord = lowered.find_first_of("xinp") != std::string::npos;
        if (end && *end == '\0' && !hexOrWord) {
            return result;
        }
    }
    throw RuleRuntimeError("ValueError", "could not convert string to float: " + ValueHelper::quoteString(text));
}

int64_t floatToInteger(double value) {
    if (std::isnan(value)) {
        throw RuleRuntimeError("ValueError", "cannot convert float NaN to integer");
    }
    if (std::isinf(value)) {
        throw RuleRuntimeError("OverflowError", "cannot convert float infinity to integer");
    }
    double truncated = std::trunc(value);
    if (truncated < -9223372036854775808.0 || truncated >= 9223372036854775808.0) {
        throw RuleRuntimeError("OverflowError", "int too large to convert");
    }
    return static_cast<int64_t>(truncated);
}

// min()/max() accept one iterable or several values
std::vector<RuleValue> extremumCandidates(const std::string &function, const CallArguments &args) {
    if (args.positional.empty()) {
        throw RuleTypeError(function + "() expected at least 1 argument, got 0");
    }
    if (args.positional.size() == 1) {
        return ExpressionEvaluator::iterate(args.positional[0]);
    }
    return args.positional;
}

RuleValue extremum(const std::string &function, const CallArguments &args, bool wantMax) {
    rejectKeywords(function, args, {"default"});
    auto candidates = extremumCandidates(function, args);
    if (candidates.empty()) {
        if (const RuleValue *fallback = args.keyword("default")) {
            return *fallback;
        }
        throw RuleRuntimeError("ValueError", function + "() arg is an empty sequence");
    }
    RuleValue best = candidates.front();
    for (size_t i = 1; i < candidates.size(); ++i) {
        int order = ValueHelper::compare(candidates[i], best, 0, wantMax ? ">" : "<");
        if (wantMax ? order > 0 : order < 0) {
            best = candidates[i];
        }
    }
    return best;
}

// Half-even rounding to a multiple of 10^-digits, exact over the whole int64 range
int64_t roundInteger(int64_t value, int64_t digits) {
    if (digits >= 0) {
        return value;
    }
    if (digits < -19) {
        return 0;
    }
    uint64_t scale = 1;
    for (int64_t i = 0; i < -digits; ++i) {
        scale *= 10;
    }
    uint64_t magnitude = value < 0 ? 0 - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);
    uint64_t quotient = magnitude / scale;
    uint64_t remainder = magnitude % scale;
    if (remainder > scale - remainder || (remainder == scale - remainder && quotient % 2 == 1)) {
        quotient++;
    }
    uint64_t rounded = 0;
    if (__builtin_mul_overflow(quotient, scale, &rounded) ||
        rounded > (value < 0 ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
                             : static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
        throw RuleRuntimeError("OverflowError", "rounded value too large to represent");
    }
    return value < 0 ? static_cast<int64_t>(0 - rounded) : static_cast<int64_t>(rounded);
}

// Rounds the exact decimal expansion of the double, half to even, then
// converts back, so round(2.675, 2) gives 2.67 like the stored value suggests
double roundFloat(double value, int64_t digits) {
    constexpr int64_t MAX_DIGITS = 323;   // beyond the smallest subnormal
    constexpr int64_t MIN_DIGITS = -308;  // beyond the largest finite double
    if (!std::isfinite(value) || value == 0.0 || digits > MAX_DIGITS) {
        return value;
    }
    if (digits < MIN_DIGITS) {
        return std::copysign(0.0, value);
    }

    // 25 extra places always expose a nonzero digit after a near-tie
    const int precision = static_cast<int>(std::max<int64_t>(digits, 0) + 25);
    std::string text = fmt::format("{:.{}f}", std::fabs(value), precision);
    size_t point = text.find('.');
    std::string decimal = text.substr(0, point) + text.substr(point + 1);
    const int64_t integerDigits = static_cast<int64_t>(point);

    int64_t keep = integerDigits + digits;
    if (keep < 0) {
        return std::copysign(0.0, value);
    }

    std::string kept = decimal.substr(0, static_cast<size_t>(keep));
    char first = decimal[static_cast<size_t>(keep)];
    bool restNonZero = decimal.find_first_not_of('0', static_cast<size_t>(keep) + 1) != std::string::npos;
    bool lastOdd = !kept.empty() && (kept.back() - '0') % 2 == 1;
    bool roundUp = first > '5' || (first == '5' && (restNonZero || lastOdd));

    if (roundUp) {
        size_t i = kept.size();
        while (i > 0 && kept[i - 1] == '9') {
            kept[--i] = '0';
        }
        if (i == 0) {
            kept.insert(kept.begin(), '1');
        } else {
            kept[i - 1]++;
        }
    }
    if (kept.empty()) {
        kept = "0";
    }

    std::string rounded;
    if (digits > 0) {
        rounded = kept.substr(0, kept.size() - static_cast<size_t>(digits)) + "." +
                  kept.substr(kept.size() - static_cast<size_t>(digits));
    } else {
        rounded = kept + std::string(static_cast<size_t>(-digits), '0');
    }

    double result = std::strtod(rounded.c_str(), nullptr);
    if (std::isinf(result)) {
        throw RuleRuntimeError("OverflowError", "rounded value too large to represent");
    }
    return std::copysign(result, value);
}

RuleValue roundValue(const CallArguments &args) {
    expectPositional("round", args, 1, 2);
    rejectKeywords("round", args, {"ndigits"});
    const RuleValue &number = args.positional[0];
    if (!ValueHelper::isNumeric(number)) {
        throw RuleTypeError(fmt::format("type {} doesn't define __round__ method", ValueHelper::typeName(number)));
    }

    const RuleValue *digitsArg = args.positional.size() > 1 ? &args.positional[1] : args.keyword("ndigits");
    if (!digitsArg || std::holds_alternative<RuleNone>(*digitsArg)) {
        if (isIntegral(number)) {
            return ValueHelper::toInteger(number);
        }
        // nearbyint honours the default round-half-to-even mode
        return floatToInteger(std::nearbyint(std::get<double>(number)));
    }

    int64_t digits = ValueHelper::toInteger(*digitsArg);
    if (isIntegral(number)) {
        return roundInteger(ValueHelper::toInteger(number), digits);
    }
    return roundFloat(std::get<double>(number), digits);
}

RuleValue buildRange(const CallArguments &args) {
    expectPositional("range", args, 1, 3);
    rejectKeywords("range", args);
    int64_t start = 0;
    int64_t stop = 0;
    int64_t step = 1;
    if (args.positional.size() == 1) {
        stop = ValueHelper::toInteger(args.positional[0]);
    } else {
        start = ValueHelper::toInteger(args.positional[0]);
        stop = ValueHelper::toInteger(args.positional[1]);
        if (args.positional.size() == 3) {
            step = ValueHelper::toInteger(args.positional[2]);
        }
    }
    if (step == 0) {
        throw RuleRuntimeError("ValueError", "range() arg 3 must not be zero");
    }

    auto sequence = std::make_shared<RuleSequence>();
    for (int64_t current = start; step > 0 ? current < stop : current > stop;) {
        if (sequence->elements.size() >= Constants::MAX_COLLECTION_SIZE) {
            throw LimitExceededError("range() result too large");
        }
        sequence->elements.emplace_back(current);
        if (__builtin_add_overflow(current, step, &current)) {
            break;
        }
    }
    return sequence;
}

RuleMappingPtr buildMapping(const CallArguments &args) {
    expectPositional("dict", args, 0, 1);
    auto mapping = std::make_shared<RuleMapping>();
    if (!args.positional.empty()) {
        const RuleValue &source = args.positional[0];
        if (const auto *other = std::get_if<RuleMappingPtr>(&source)) {
            mapping->entries = (*other)->entries;
        } else {
            for (const auto &item : ExpressionEvaluator::iterate(source)) {
                const auto *pair = std::get_if<RuleSequencePtr>(&item);
                if (!pair || (*pair)->elements.size() != 2) {
                    throw RuleRuntimeError("ValueError",
                                           "dictionary update sequence element has wrong length; 2 is required");
                }
                const auto *key = std::get_if<std::string>(&(*pair)->elements[0]);
                if (!key) {
                    throw RuleTypeError("dict keys must be str, not '" +
                                        ValueHelper::typeName((*pair)->elements[0]) + "'");
                }
                mapping->entries.set(*key, (*pair)->elements[1]);
            }
        }
    }
    for (const auto &[key, value] : args.keywords) {
        mapping->entries.set(key, value);
    }
    return mapping;
}

RuleValue sortedValues(const CallArguments &args) {
    expectPositional("sorted", args, 1, 1);
    rejectKeywords("sorted", args, {"reverse"});
    auto values = ExpressionEvaluator::iterate(args.positional[0]);
    bool reverse = false;
    if (const RuleValue *flag = args.keyword("reverse")) {
        reverse = ValueHelper::isTruthy(*flag);
    }
    std::stable_sort(values.begin(), values.end(), [reverse](const RuleValue &a, const RuleValue &b) {
        return reverse ? ValueHelper::compare(b, a) < 0 : ValueHelper::compare(a, b) < 0;
    });
    return std::make_shared<RuleSequence>(std::move(values));
}

BuiltinFunctionPtr makeMethod(const std::string &name, BuiltinFunction::Callback callback) {
    return std::make_shared<const BuiltinFunction>(name, std::move(callback));
}

BuiltinFunctionPtr bindSequenceMethod(const RuleSequencePtr &seq, const std::string &name) {
    if (name == "append") {
        return makeMethod("append", [seq](const CallArguments &args) -> RuleValue {
            expectPositional("append", args, 1, 1);
            if (seq->elements.size() >= Constants::MAX_COLLECTION_SIZE) {
                throw LimitExceededError("list too large");
            }
            seq->elements.push_back(args.positional[0]);
            return RuleNone{};
        });
    }
    if (name == "extend") {
        return makeMethod("extend", [seq](const CallArguments &args) -> RuleValue {
            expectPositional("extend", args, 1, 1);
            auto items = ExpressionEvaluator::iterate(args.positional[0]);
            if (seq->elements.size() + items.size() > Constants::MAX_COLLECTION_SIZE) {
                throw LimitExceededError("list too large");
            }
            seq->elements.insert(seq->elements.end(), items.begin(), items.end());
            return RuleNone{};
        });
    }
    if (name == "pop") {
        return makeMethod("pop", [seq](const CallArguments &args) -> RuleValue {
            expectPositional("pop", args, 0, 1);
            if (seq->elements.empty()) {
                throw RuleRuntimeError("IndexError", "pop from empty list");
            }
            int64_t size = static_cast<int64_t>(seq->elements.size());
            int64_t index = args.positional.empty() ? -1 : ValueHelper::toInteger(args.positional[0]);
            if (index < 0) {
                index += size;
            }
            if (index < 0 || index >= size) {
                throw RuleRuntimeError("IndexError", "pop index out of range");
            }
            RuleValue removed = seq->elements[static_cast<size_t>(index)];
            seq->elements.erase(seq->elements.begin() + index);
            return removed;
        });
    }
    if (name == "insert") {
        return makeMethod("insert", [seq](const CallArguments &args) -> RuleValue {
            expectPositional("insert", args, 2, 2);
            int64_t size = static_cast<int64_t>(seq->elements.size());
            int64_t index = ValueHelper::toInteger(args.positional[0]);
            if (index < 0) {
                index = std::max<int64_t>(0, index + size);
            }
            index = std::min(index, size);
            seq->elements.insert(seq->elements.begin() + index, args.positional[1]);
            return RuleNone{};
        });
    }
    if (name == "index") {
        return makeMethod("index", [seq](const CallArguments &args) -> RuleValue {
            expectPositional("index", args, 1, 1);
            for (size_t i = 0; i < seq->elements.size(); ++i) {
                if (ValueHelper::equals(seq->elements[i], args.positional[0])) {
                    return static_cast<int64_t>(i);
                }
            }
            throw RuleRuntimeError("ValueError", ValueHelper::toRepr(args.positional[0]) + " is not in list");
        });
    }
    if (name == "count") {
        return makeMethod("count", [seq](const CallArguments &args) -> RuleValue {
            expectPositional("count", args, 1, 1);
            return static_cast<int64_t>(
                std::count_if(seq->elements.begin(), seq->elements.end(),
                              [&args](const RuleValue &v) { return ValueHelper::equals(v, args.positional[0]); }));
        });
    }
    return nullptr;
}

BuiltinFunctionPtr bindMappingMethod(const RuleMappingPtr &map, const std::string &name) {
    if (name == "get") {
        return makeMethod("get", [map](const CallArguments &args) -> RuleValue {
            expectPositional("get", args, 1, 2);
            if (const auto *key = std::get_if<std::string>(&args.positional[0])) {
                if (const RuleValue *value = map->entries.find(*key)) {
                    return *value;
                }
            }
            return args.positional.size() > 1 ? args.positional[1] : RuleValue{RuleNone{}};
        });
    }
    if (name == "keys" || name == "values" || name == "items") {
        return makeMethod(name, [map, name](const CallArguments &args) -> RuleValue {
            expectPositional(name, args, 0, 0);
            auto result = std::make_shared<RuleSequence>();
            for (const auto &[key, value] : map->entries.entries()) {
                if (name == "keys") {
                    result->elements.emplace_back(key);
                } else if (name == "values") {
                    result->elements.push_back(value);
                } else {
                    result->elements.emplace_back(std::make_shared<RuleSequence>(RuleSequence{key, value}));
                }
            }
            return result;
        });
    }
    if (name == "pop") {
        return makeMethod("pop", [map](const CallArguments &args) -> RuleValue {
            expectPositional("pop", args, 1, 2);
            if (const auto *key = std::get_if<std::string>(&args.positional[0])) {
                if (const RuleValue *value = map->entries.find(*key)) {
                    RuleValue removed = *value;
                    map->entries.erase(*key);
                    return removed;
                }
            }
            if (args.positional.size() > 1) {
                return args.positional[1];
            }
            throw RuleRuntimeError("KeyError", ValueHelper::toRepr(args.positional[0]));
        });
    }
    if (name == "update") {
        return makeMethod("update", [map](const CallArguments &args) -> RuleValue {
            auto incoming = buildMapping(args);
            for (const auto &[key, value] : incoming->entries.entries()) {
                map->entries.set(key, value);
            }
            return RuleNone{};
        });
    }
    return nullptr;
}

std::vector<std::string> splitString(const std::string &text, const RuleValue *separator, int64_t maxSplit) {
    std::vector<std::string> parts;
    if (!separator || std::holds_alternative<RuleNone>(*separator)) {
        const char *whitespace = " \t\n\r\f\v";
        size_t position = text.find_first_not_of(whitespace);
        while (position != std::string::npos) {
            if (maxSplit >= 0 && static_cast<int64_t>(parts.size()) == maxSplit) {
                std::string rest = text.substr(position);
                parts.push_back(rest.substr(0, rest.find_last_not_of(whitespace) + 1));
                break;
            }
            size_t end = text.find_first_of(whitespace, position);
            parts.push_back(text.substr(position, end == std::string::npos ? std::string::npos : end - position));
            position = end == std::string::npos ? end : text.find_first_not_of(whitespace, end);
        }
        return parts;
    }

    const std::string &sep = expectString("split", *separator);
    if (sep.empty()) {
        throw RuleRuntimeError("ValueError", "empty separator");
    }
    size_t position = 0;
    while (maxSplit < 0 || static_cast<int64_t>(parts.size()) < maxSplit) {
        size_t found = text.find(sep, position);
        if (found == std::string::npos) {
            break;
        }
        parts.push_back(text.substr(position, found - position));
        position = found + sep.size();
    }
    parts.push_back(text.substr(position));
    return parts;
}

BuiltinFunctionPtr bindStringMethod(const std::string &text, const std::string &name) {
    if (name == "upper" || name == "lower") {
        return makeMethod(name, [text, name](const CallArguments &args) -> RuleValue {
            expectPositional(name, args, 0, 0);
            return name == "upper" ? asciiUpper(text) : asciiLower(text);
        });
    }
    if (name == "strip") {
        return makeMethod("strip", [text](const CallArguments &args) -> RuleValue {
            expectPositional("strip", args, 0, 1);
            if (args.positional.empty() || std::holds_alternative<RuleNone>(args.positional[0])) {
                return trimWhitespace(text);
            }
            return trimWhitespace(text, expectString("strip", args.positional[0]));
        });
    }
    if (name == "split") {
        return makeMethod("split", [text](const CallArguments &args) -> RuleValue {
            expectPositional("split", args, 0, 2);
            rejectKeywords("split", args, {"sep", "maxsplit"});
            const RuleValue *separator = !args.positional.empty() ? &args.positional[0] : args.keyword("sep");
            const RuleValue *limit = args.positional.size() > 1 ? &args.positional[1] : args.keyword("maxsplit");
            int64_t maxSplit = limit ? ValueHelper::toInteger(*limit) : -1;
            auto result = std::make_shared<RuleSequence>();
            for (auto &part : splitString(text, separator, maxSplit)) {
                result->elements.emplace_back(std::move(part));
            }
            return result;
        });
    }
    if (name == "join") {
        return makeMethod("join", [text](const CallArguments &args) -> RuleValue {
            expectPositional("join", args, 1, 1);
            auto items = ExpressionEvaluator::iterate(args.positional[0]);
            std::string result;
            for (size_t i = 0; i < items.size(); ++i) {
                const auto *piece = std::get_if<std::string>(&items[i]);
                if (!piece) {
                    throw RuleTypeError(fmt::format("sequence item {}: expected str instance, {} found", i,
                                                    ValueHelper::typeName(items[i])));
                }
                if (i > 0) {
                    result += text;
                }
                result += *piece;
                if (result.size() > Constants::MAX_COLLECTION_SIZE) {
                    throw LimitExceededError("string result too large");
                }
            }
            return result;
        });
    }
    if (name == "replace") {
        return makeMethod("replace", [text](const CallArguments &args) -> RuleValue {
            expectPositional("replace", args, 2, 3);
            const std::string &from = expectString("replace", args.positional[0]);
            const std::string &to = expectString("replace", args.positional[1]);
            int64_t remaining = args.positional.size() > 2 ? ValueHelper::toInteger(args.positional[2]) : -1;
            if (from.empty()) {
                return text;
            }
            std::string result;
            size_t position = 0;
            while (remaining != 0) {
                size_t found = text.find(from, position);
                if (found == std::string::npos) {
                    break;
                }
                result.append(text, position, found - position);
                result += to;
                position = found + from.size();
                if (remaining > 0) {
                    --remaining;
                }
            }
            result.append(text, position, std::string::npos);
            return result;
        });
    }
    if (name == "startswith" || name == "endswith") {
        return makeMethod(name, [text, name](const CallArguments &args) -> RuleValue {
            expectPositional(name, args, 1, 1);
            const std::string &affix = expectString(name, args.positional[0]);
            if (affix.size() > text.size()) {
                return false;
            }
            if (name == "startswith") {
                return text.compare(0, affix.size(), affix) == 0;
            }
            return text.compare(text.size() - affix.size(), affix.size(), affix) == 0;
        });
    }
    return nullptr;
}

}  // namespace

BuiltinRegistry::BuiltinRegistry(std::shared_ptr<BufferedMessageSink> sink) : sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("BuiltinRegistry requires a message sink");
    }
    registerOutputFunctions();
    registerConversionFunctions();
    registerNumericFunctions();
    registerCollectionFunctions();
    LOG_TRACE("BuiltinRegistry: {} built-ins registered", functions_.size());
}

void BuiltinRegistry::registerFunction(const std::string &name, BuiltinFunction::Callback callback) {
    functions_[name] = std::make_shared<const BuiltinFunction>(name, std::move(callback));
}

bool BuiltinRegistry::removeFunction(const std::string &name) {
    return functions_.erase(name) > 0;
}

BuiltinFunctionPtr BuiltinRegistry::find(const std::string &name) const {
    auto it = functions_.find(name);
    return it == functions_.end() ? nullptr : it->second;
}

bool BuiltinRegistry::contains(const std::string &name) const {
    return functions_.count(name) > 0;
}

std::vector<std::string> BuiltinRegistry::getNames() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto &entry : functions_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

BufferedMessageSink &BuiltinRegistry::getSink() const {
    return *sink_;
}

BuiltinFunctionPtr BuiltinRegistry::bindMethod(const RuleValue &receiver, const std::string &name) {
    if (const auto *seq = std::get_if<RuleSequencePtr>(&receiver)) {
        return bindSequenceMethod(*seq, name);
    }
    if (const auto *map = std::get_if<RuleMappingPtr>(&receiver)) {
        return bindMappingMethod(*map, name);
    }
    if (const auto *text = std::get_if<std::string>(&receiver)) {
        return bindStringMethod(*text, name);
    }
    return nullptr;
}

void BuiltinRegistry::registerOutputFunctions() {
    // The sink outlives every callable registered here: both belong to this registry
    BufferedMessageSink *sink = sink_.get();

    registerFunction("log_message", [sink](const CallArguments &args) -> RuleValue {
        expectPositional("log_message", args, 1, 1);
        std::string line = Constants::LOG_MESSAGE_PREFIX + ValueHelper::toDisplayString(args.positional[0]);
        if (!args.keywords.empty()) {
            auto metadata = std::make_shared<RuleMapping>();
            for (const auto &[key, value] : args.keywords) {
                metadata->entries.set(key, value);
            }
            line += " " + ValueHelper::toRepr(RuleValue{metadata});
        }
        sink->write(line);
        return args.positional[0];
    });

    registerFunction("print", [sink](const CallArguments &args) -> RuleValue {
        rejectKeywords("print", args, {"sep"});
        std::string separator = " ";
        if (const RuleValue *sep = args.keyword("sep")) {
            if (!std::holds_alternative<RuleNone>(*sep)) {
                separator = expectString("print", *sep);
            }
        }
        std::string line;
        for (size_t i = 0; i < args.positional.size(); ++i) {
            if (i > 0) {
                line += separator;
            }
            line += ValueHelper::toDisplayString(args.positional[i]);
        }
        sink->write(line);
        return RuleNone{};
    });
}

void BuiltinRegistry::registerConversionFunctions() {
    registerFunction("str", [](const CallArguments &args) -> RuleValue {
        expectPositional("str", args, 0, 1);
        return args.positional.empty() ? std::string() : ValueHelper::toDisplayString(args.positional[0]);
    });

    registerFunction("int", [](const CallArguments &args) -> RuleValue {
        expectPositional("int", args, 0, 1);
        if (args.positional.empty()) {
            return int64_t{0};
        }
        const RuleValue &value = args.positional[0];
        if (isIntegral(value)) {
            return ValueHelper::toInteger(value);
        }
        if (const auto *d = std::get_if<double>(&value)) {
            return floatToInteger(*d);
        }
        if (const auto *text = std::get_if<std::string>(&value)) {
            return parseInteger(*text);
        }
        throw RuleTypeError("int() argument must be a string or a number, not '" + ValueHelper::typeName(value) +
                            "'");
    });

    registerFunction("float", [](const CallArguments &args) -> RuleValue {
        expectPositional("float", args, 0, 1);
        if (args.positional.empty()) {
            return 0.0;
        }
        const RuleValue &value = args.positional[0];
        if (ValueHelper::isNumeric(value)) {
            return ValueHelper::toDouble(value);
        }
        if (const auto *text = std::get_if<std::string>(&value)) {
            return parseFloat(*text);
        }
        throw RuleTypeError("float() argument must be a string or a number, not '" +
                            ValueHelper::typeName(value) + "'");
    });

    registerFunction("bool", [](const CallArguments &args) -> RuleValue {
        expectPositional("bool", args, 0, 1);
        return !args.positional.empty() && ValueHelper::isTruthy(args.positional[0]);
    });
}

void BuiltinRegistry::registerNumericFunctions() {
    registerFunction("abs", [](const CallArguments &args) -> RuleValue {
        expectPositional("abs", args, 1, 1);
        const RuleValue &value = args.positional[0];
        if (isIntegral(value)) {
            int64_t number = ValueHelper::toInteger(value);
            if (number == std::numeric_limits<int64_t>::min()) {
                throw RuleRuntimeError("OverflowError", "integer result out of range");
            }
            return number < 0 ? -number : number;
        }
        if (const auto *d = std::get_if<double>(&value)) {
            return std::fabs(*d);
        }
        throw RuleTypeError("bad operand type for abs(): '" + ValueHelper::typeName(value) + "'");
    });

    registerFunction("min", [](const CallArguments &args) { return extremum("min", args, false); });
    registerFunction("max", [](const CallArguments &args) { return extremum("max", args, true); });

    registerFunction("sum", [](const CallArguments &args) -> RuleValue {
        expectPositional("sum", args, 1, 2);
        rejectKeywords("sum", args, {"start"});
        RuleValue total = int64_t{0};
        if (args.positional.size() > 1) {
            total = args.positional[1];
        } else if (const RuleValue *start = args.keyword("start")) {
            total = *start;
        }
        if (std::holds_alternative<std::string>(total)) {
            throw RuleTypeError("sum() can't sum strings [use ''.join(seq) instead]");
        }
        for (const auto &item : ExpressionEvaluator::iterate(args.positional[0])) {
            total = ExpressionEvaluator::applyBinary("+", total, item);
        }
        return total;
    });

    registerFunction("round", [](const CallArguments &args) { return roundValue(args); });
}

void BuiltinRegistry::registerCollectionFunctions() {
    registerFunction("len", [](const CallArguments &args) -> RuleValue {
        expectPositional("len", args, 1, 1);
        const RuleValue &value = args.positional[0];
        if (const auto *text = std::get_if<std::string>(&value)) {
            return static_cast<int64_t>(characterCount(*text));
        }
        if (const auto *seq = std::get_if<RuleSequencePtr>(&value)) {
            return static_cast<int64_t>((*seq)->elements.size());
        }
        if (const auto *map = std::get_if<RuleMappingPtr>(&value)) {
            return static_cast<int64_t>((*map)->entries.size());
        }
        throw RuleTypeError("object of type '" + ValueHelper::typeName(value) + "' has no len()");
    });

    registerFunction("range", [](const CallArguments &args) { return buildRange(args); });

    registerFunction("list", [](const CallArguments &args) -> RuleValue {
        expectPositional("list", args, 0, 1);
        if (args.positional.empty()) {
            return std::make_shared<RuleSequence>();
        }
        return std::make_shared<RuleSequence>(ExpressionEvaluator::iterate(args.positional[0]));
    });

    registerFunction("dict", [](const CallArguments &args) -> RuleValue { return buildMapping(args); });

    registerFunction("sorted", [](const CallArguments &args) { return sortedValues(args); });
}

}  // namespace RSE
