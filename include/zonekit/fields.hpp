#pragma once

#include "zonekit/types.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

namespace zonekit {

    enum class FieldState { Absent, Numeric, NonNumeric };

    // Result of reading a property as a number; value is 0 unless state is Numeric
    struct FieldLookup {
        FieldState state = FieldState::Absent;
        double value = 0.0;

        bool numeric() const { return state == FieldState::Numeric; }
    };

    inline const FieldValue *findField(const Feature &feature, const std::string &name) {
        auto it = feature.properties.find(name);
        return (it != feature.properties.end()) ? &it->second : nullptr;
    }

    inline bool isNull(const FieldValue &value) { return std::holds_alternative<std::monostate>(value); }

    // Numbers and booleans are numeric, strings only when the whole text parses as a number
    inline FieldLookup toNumber(const FieldValue &value) {
        return std::visit(
            [](auto const &v) -> FieldLookup {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, double>) {
                    return {FieldState::Numeric, v};
                } else if constexpr (std::is_same_v<T, bool>) {
                    return {FieldState::Numeric, v ? 1.0 : 0.0};
                } else if constexpr (std::is_same_v<T, std::string>) {
                    if (v.empty())
                        return {FieldState::NonNumeric, 0.0};
                    const char *begin = v.c_str();
                    char *end = nullptr;
                    errno = 0;
                    double parsed = std::strtod(begin, &end);
                    if (errno != 0 || end != begin + v.size())
                        return {FieldState::NonNumeric, 0.0};
                    return {FieldState::Numeric, parsed};
                } else {
                    return {FieldState::NonNumeric, 0.0};
                }
            },
            value);
    }

    inline FieldLookup numericField(const Feature &feature, const std::string &name) {
        const FieldValue *value = findField(feature, name);
        if (!value)
            return {};
        return toNumber(*value);
    }

    // Display form used in messages and group labels
    inline std::string toText(const FieldValue &value) {
        return std::visit(
            [](auto const &v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "NULL";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "true" : "false";
                } else if constexpr (std::is_same_v<T, double>) {
                    std::string s = std::to_string(v);
                    s.erase(s.find_last_not_of('0') + 1);
                    if (!s.empty() && s.back() == '.')
                        s.pop_back();
                    return s;
                } else {
                    return v;
                }
            },
            value);
    }

} // namespace zonekit
