#pragma once

#include "RSETypes.h"
#include "scripting/BuiltinRegistry.h"
#include <memory>
#include <optional>
#include <string>

namespace RSE {

/**
 * @brief Binding environment of one execution
 *
 * A single flat scope: branches and loop bodies write into the same table,
 * so names assigned inside an if or for stay visible after it. Bindings
 * shadow built-ins of the same name.
 */
class Environment {
public:
    explicit Environment(std::shared_ptr<BuiltinRegistry> builtins);

    /**
     * @brief Resolve a name against bindings, then built-ins
     * @return nullopt when the name is unbound
     */
    std::optional<RuleValue> get(const std::string &name) const;

    /**
     * @brief Resolve a name or fail
     * @throws UnknownNameError
     */
    RuleValue lookup(const std::string &name, int line = 0) const;

    void set(const std::string &name, RuleValue value);

    /**
     * @brief True only for names bound by the rule (built-ins excluded)
     */
    bool isBound(const std::string &name) const;

    const FieldTable &getBindings() const {
        return bindings_;
    }

    BuiltinRegistry &getBuiltins() const {
        return *builtins_;
    }

private:
    FieldTable bindings_;
    std::shared_ptr<BuiltinRegistry> builtins_;
};

}  // namespace RSE
