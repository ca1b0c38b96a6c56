#include "common/SnapshotSerializer.h"
#include "common/Logger.h"
#include "common/RuleError.h"
#include "common/ValueHelper.h"
#include <cmath>

namespace RSE {

namespace {
constexpr int MAX_ENCODE_DEPTH = 64;
}

json SnapshotSerializer::encode(const RuleValue &value) {
    return encodeAt(value, 0);
}

json SnapshotSerializer::encodeAt(const RuleValue &value, int depth) {
    if (depth > MAX_ENCODE_DEPTH) {
        throw SerializationError("nesting too deep to encode");
    }

    if (std::holds_alternative<RuleNone>(value)) {
        return nullptr;
    }
    if (const auto *b = std::get_if<bool>(&value)) {
        return *b;
    }
    if (const auto *i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (const auto *d = std::get_if<double>(&value)) {
        // JSON has no inf/nan; nlohmann would silently write null
        if (!std::isfinite(*d)) {
            throw SerializationError("Out of range float values are not JSON compliant: " +
                                     ValueHelper::toRepr(value));
        }
        return *d;
    }
    if (const auto *s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto *seq = std::get_if<RuleSequencePtr>(&value)) {
        json array = json::array();
        for (const auto &element : (*seq)->elements) {
            array.push_back(encodeAt(element, depth + 1));
        }
        return array;
    }
    if (const auto *map = std::get_if<RuleMappingPtr>(&value)) {
        json object = json::object();
        for (const auto &[key, item] : (*map)->entries.entries()) {
            object[key] = encodeAt(item, depth + 1);
        }
        return object;
    }

    throw SerializationError("Object of type " + ValueHelper::typeName(value) + " is not JSON serializable");
}

json SnapshotSerializer::encodeSafe(const RuleValue &value) {
    try {
        json encoded = encode(value);
        if (JsonUtils::isEncodable(encoded)) {
            return encoded;
        }
    } catch (const SerializationError &e) {
        LOG_TRACE("Falling back to display string: {}", e.message());
    }

    json fallback = ValueHelper::toDisplayString(value);
    if (JsonUtils::isEncodable(fallback)) {
        return fallback;
    }

    // Invalid UTF-8 inside the text itself: keep it readable with replacement characters
    std::string replaced = fallback.dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(replaced);
}

json SnapshotSerializer::captureVariables(const FieldTable &bindings) {
    json variables = json::object();
    for (const auto &[name, value] : bindings.entries()) {
        if (name.rfind("__", 0) == 0) {
            continue;
        }
        variables[name] = encodeSafe(value);
    }
    return variables;
}

}  // namespace RSE
