#include "runtime/Environment.h"
#include "common/RuleError.h"
#include <stdexcept>

namespace RSE {

Environment::Environment(std::shared_ptr<BuiltinRegistry> builtins) : builtins_(std::move(builtins)) {
    if (!builtins_) {
        throw std::invalid_argument("Environment requires a builtin registry");
    }
}

std::optional<RuleValue> Environment::get(const std::string &name) const {
    if (const RuleValue *bound = bindings_.find(name)) {
        return *bound;
    }
    if (auto builtin = builtins_->find(name)) {
        return RuleValue{builtin};
    }
    return std::nullopt;
}

RuleValue Environment::lookup(const std::string &name, int line) const {
    auto value = get(name);
    if (!value) {
        throw UnknownNameError(name, line);
    }
    return *value;
}

void Environment::set(const std::string &name, RuleValue value) {
    bindings_.set(name, std::move(value));
}

bool Environment::isBound(const std::string &name) const {
    return bindings_.contains(name);
}

}  // namespace RSE
