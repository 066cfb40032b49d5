#pragma once

#include <cctype>
#include <cstddef>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Enumerators are PascalCase in code and snake_case in TOML, JSON and on the CLI
namespace enum_utils {

// "SingleValued" -> "single_valued"
inline std::string toSnakeCase(std::string_view pascal) {
    std::string result;
    result.reserve(pascal.size() + 4);

    for (size_t i = 0; i < pascal.size(); ++i) {
        auto c = static_cast<unsigned char>(pascal[i]);
        if (std::isupper(c)) {
            if (i > 0) {
                result += '_';
            }
            result += static_cast<char>(std::tolower(c));
        } else {
            result += static_cast<char>(c);
        }
    }
    return result;
}

template <typename E>
std::string toString(E value) {
    return toSnakeCase(magic_enum::enum_name(value));
}

// Accepts the enumerator name ("SingleValued") or its snake_case form in any
// case, with '-' allowed for '_' ("single_valued", "Single-Valued", "MEDIAN")
template <typename E>
std::optional<E> fromString(std::string_view str) {
    if (auto exact = magic_enum::enum_cast<E>(str)) {
        return exact;
    }

    std::string key;
    key.reserve(str.size());
    for (char c : str) {
        key += c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (E value : magic_enum::enum_values<E>()) {
        if (toString(value) == key) {
            return value;
        }
    }
    return std::nullopt;
}

// snake_case names for usage text and warnings
template <typename E>
std::vector<std::string> names() {
    std::vector<std::string> result;
    for (E value : magic_enum::enum_values<E>()) {
        result.push_back(toString(value));
    }
    return result;
}

inline std::string joinNames(std::vector<std::string> const& names, char const* sep = "|") {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += names[i];
    }
    return out;
}

} // namespace enum_utils
