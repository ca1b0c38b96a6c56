#pragma once

#include "RSETypes.h"
#include "common/JsonUtils.h"

namespace RSE {

/**
 * @brief Converts rule values into JSON-safe snapshot data
 *
 * The produced json is a deep copy: later mutation of a sequence, mapping or
 * record never changes a snapshot that was already taken.
 */
class SnapshotSerializer {
public:
    /**
     * @brief Direct encoding
     * @throws SerializationError for records, record types, built-ins and
     *         collections containing them
     */
    static json encode(const RuleValue &value);

    /**
     * @brief Encoding with the display-string fallback; never throws
     */
    static json encodeSafe(const RuleValue &value);

    /**
     * @brief Snapshot of every binding, each one encoded independently
     *
     * Names starting with "__" are engine-internal and skipped.
     */
    static json captureVariables(const FieldTable &bindings);

private:
    static json encodeAt(const RuleValue &value, int depth);
};

}  // namespace RSE
