/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "remold/Merge.hpp"

namespace remold {

Value deep_merge(const Value& base, const Value& override_val) {
    if (override_val.is_null()) {
        return base;
    }
    if (!base.is_object() || !override_val.is_object()) {
        return override_val;
    }

    Value result = base;
    for (auto it = override_val.begin(); it != override_val.end(); ++it) {
        auto existing = result.find(it.key());
        if (existing != result.end()) {
            *existing = deep_merge(*existing, it.value());
        } else {
            result[it.key()] = it.value();
        }
    }
    return result;
}

Value deep_merge_all(const std::vector<Value>& layers) {
    Value result = Value::object();
    for (const auto& layer : layers) {
        result = deep_merge(result, layer);
    }
    return result;
}

} // namespace remold
