#include "RSETypes.h"
#include <algorithm>

namespace RSE {

const RuleValue *FieldTable::find(const std::string &key) const {
    for (const auto &entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

RuleValue *FieldTable::find(const std::string &key) {
    for (auto &entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

void FieldTable::set(const std::string &key, RuleValue value) {
    if (auto *existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    entries_.emplace_back(key, std::move(value));
}

bool FieldTable::erase(const std::string &key) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&key](const Entry &e) { return e.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

}  // namespace RSE
