/**
 * @file Parse.cpp
 * @brief Implementation of override value typing
 */

#include "remold/Parse.hpp"
#include "remold/Util.hpp"
#include <regex>

namespace remold {

namespace {
    const std::regex& integer_re() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_re() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }

    bool looks_compound(const std::string& str) {
        return (str.front() == '{' && str.back() == '}') ||
               (str.front() == '[' && str.back() == ']');
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (std::regex_match(str, integer_re())) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // too large for int64: keep as text
        }
    }

    if (std::regex_match(str, float_re())) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // overflows double: keep as text
        }
    }

    if (looks_compound(str)) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (parsed.is_string()) {
            return parsed;
        }
    }

    return str;
}

} // namespace remold
