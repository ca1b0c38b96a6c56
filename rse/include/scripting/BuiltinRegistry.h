#pragma once

#include "RSETypes.h"
#include "scripting/BufferedMessageSink.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace RSE {

/**
 * @brief Fixed table of callables visible to rules
 *
 * Names that are neither bound in the environment nor registered here are
 * unknown: this table is the whole sandbox. One registry per run; the
 * logging built-ins write to that run's message sink.
 *
 * Default registrations:
 * - log_message(message, **metadata), print(*values, sep=' ')
 * - len, str, int, float, bool, abs, min, max, sum, round
 * - range, list, dict, sorted
 *
 * Hosts add engine built-ins (the instrumentation step marker) through
 * registerFunction().
 */
class BuiltinRegistry {
public:
    explicit BuiltinRegistry(std::shared_ptr<BufferedMessageSink> sink);

    void registerFunction(const std::string &name, BuiltinFunction::Callback callback);

    /**
     * @return true when a registration was removed
     */
    bool removeFunction(const std::string &name);

    /**
     * @return the callable, or nullptr when the name is not registered
     */
    BuiltinFunctionPtr find(const std::string &name) const;

    bool contains(const std::string &name) const;

    std::vector<std::string> getNames() const;

    BufferedMessageSink &getSink() const;

    /**
     * @brief Resolve a value method (items.append, name.upper, ...)
     *
     * The returned callable keeps the receiver alive and operates on it.
     * @return the bound method, or nullptr when the value has no such method
     */
    static BuiltinFunctionPtr bindMethod(const RuleValue &receiver, const std::string &name);

private:
    std::shared_ptr<BufferedMessageSink> sink_;
    std::unordered_map<std::string, BuiltinFunctionPtr> functions_;

    void registerOutputFunctions();
    void registerConversionFunctions();
    void registerNumericFunctions();
    void registerCollectionFunctions();
};

}  // namespace RSE
