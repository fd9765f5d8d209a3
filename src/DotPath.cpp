/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "remold/DotPath.hpp"
#include <algorithm>
#include <cctype>

namespace remold {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

namespace {
    /**
     * @brief Check if segment represents an array index
     */
    bool is_array_index(const std::string& segment) {
        if (segment.empty()) return false;
        if (segment[0] == '0' && segment.size() > 1) return false;
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }
}

const Value* find_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;

    for (const auto& seg : split_dot_path(path)) {
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) {
                return nullptr;
            }
            current = &*it;
        } else if (current->is_array()) {
            if (!is_array_index(seg)) {
                return nullptr;
            }
            size_t idx = std::stoull(seg);
            if (idx >= current->size()) {
                return nullptr;
            }
            current = &(*current)[idx];
        } else {
            throw TypeError(path, "object or array", type_name(*current));
        }
    }

    return current;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        throw KeyError(path, "(empty path)");
    }

    if (data.is_null()) {
        data = Value::object();
    }

    Value* current = &data;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current->is_object()) {
            throw TypeError(path, "object", type_name(*current));
        }
        Value& child = (*current)[segments[i]];
        if (child.is_null()) {
            child = Value::object();
        }
        current = &child;
    }

    if (!current->is_object()) {
        throw TypeError(path, "object", type_name(*current));
    }
    (*current)[segments.back()] = value;
}

} // namespace remold
