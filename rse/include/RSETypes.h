// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2026 The RSE Authors
//
// This file is part of RSE (Rule Step Engine).

#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#ifdef _WIN32
#ifdef RSE_ENGINE_EXPORTS
#define RSE_API __declspec(dllexport)
#else
#define RSE_API __declspec(dllimport)
#endif
#else
#ifdef RSE_ENGINE_EXPORTS
#define RSE_API __attribute__((visibility("default")))
#else
#define RSE_API
#endif
#endif

namespace RSE {

/**
 * @brief Forward declarations for compound types
 */
struct RuleSequence;
struct RuleMapping;
struct RuleRecord;
struct RuleRecordType;
struct BuiltinFunction;

/**
 * @brief The rule language's None
 */
struct RuleNone {
    bool operator==(const RuleNone &) const {
        return true;
    }
};

/**
 * @brief Runtime value of the rule language
 *
 * Scalars have value semantics. Sequences, mappings and record instances are
 * held through shared_ptr: two bindings may alias the same object and a
 * mutation through one is visible through the other.
 *
 * Record types and built-in functions are opaque: they can be bound and
 * called but have no JSON encoding.
 */
using RuleValue = std::variant<RuleNone,                                // None
                               bool,                                    // True / False
                               int64_t,                                 // int
                               double,                                  // float
                               std::string,                             // str
                               std::shared_ptr<RuleSequence>,           // list
                               std::shared_ptr<RuleMapping>,            // dict
                               std::shared_ptr<RuleRecord>,             // record instance
                               std::shared_ptr<const RuleRecordType>,   // class
                               std::shared_ptr<const BuiltinFunction>>;  // built-in

/**
 * @brief Insertion-ordered string-keyed field table
 *
 * Used both for dict values and record instance fields. Rules are small, so
 * a linear scan keeps the insertion order without a second index.
 */
class FieldTable {
public:
    using Entry = std::pair<std::string, RuleValue>;

    FieldTable() = default;

    FieldTable(std::initializer_list<Entry> init) {
        for (const auto &entry : init) {
            set(entry.first, entry.second);
        }
    }

    const RuleValue *find(const std::string &key) const;
    RuleValue *find(const std::string &key);

    bool contains(const std::string &key) const {
        return find(key) != nullptr;
    }

    void set(const std::string &key, RuleValue value);
    bool erase(const std::string &key);

    size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

    const std::vector<Entry> &entries() const {
        return entries_;
    }

private:
    std::vector<Entry> entries_;
};

/**
 * @brief Rule language list
 */
struct RuleSequence {
    std::vector<RuleValue> elements;

    RuleSequence() = default;

    RuleSequence(std::initializer_list<RuleValue> init) : elements(init) {}

    explicit RuleSequence(std::vector<RuleValue> elems) : elements(std::move(elems)) {}
};

/**
 * @brief Rule language dict (string keys only)
 */
struct RuleMapping {
    FieldTable entries;

    RuleMapping() = default;

    RuleMapping(std::initializer_list<FieldTable::Entry> init) : entries(init) {}
};

/**
 * @brief Type introduced by a `class Name:` declaration
 *
 * Only carries field defaults; the language has no methods.
 */
struct RuleRecordType {
    std::string name;
    FieldTable defaults;
};

/**
 * @brief Instance of a record type: a named bag of mutable fields
 *
 * Fields are created on first assignment.
 */
struct RuleRecord {
    std::string typeName;
    FieldTable fields;

    explicit RuleRecord(std::string type) : typeName(std::move(type)) {}
};

/**
 * @brief Positional and keyword arguments of a call
 */
struct CallArguments {
    std::vector<RuleValue> positional;
    std::vector<std::pair<std::string, RuleValue>> keywords;

    const RuleValue *keyword(const std::string &name) const {
        for (const auto &entry : keywords) {
            if (entry.first == name) {
                return &entry.second;
            }
        }
        return nullptr;
    }
};

/**
 * @brief Callable exposed to rule expressions
 *
 * Registry built-ins and bound value methods (list.append, str.upper, ...)
 * share this representation.
 */
struct BuiltinFunction {
    using Callback = std::function<RuleValue(const CallArguments &)>;

    std::string name;
    Callback invoke;

    BuiltinFunction(std::string n, Callback cb) : name(std::move(n)), invoke(std::move(cb)) {}
};

using RuleSequencePtr = std::shared_ptr<RuleSequence>;
using RuleMappingPtr = std::shared_ptr<RuleMapping>;
using RuleRecordPtr = std::shared_ptr<RuleRecord>;
using RuleRecordTypePtr = std::shared_ptr<const RuleRecordType>;
using BuiltinFunctionPtr = std::shared_ptr<const BuiltinFunction>;

}  // namespace RSE
