#pragma once

#include <map>
#include <string>
#include <variant>

namespace dotsmith {

// A binding is either a string or a boolean; nothing else is representable.
using value = std::variant<std::string, bool>;

// Binding set available to template rendering. Built once per run and only
// read afterwards, so concurrent renders share it by const reference.
using env = std::map<std::string, value>;

inline std::string to_display(const value& v) {
    if (const auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    return std::get<std::string>(v);
}

inline bool is_truthy(const value& v) {
    if (const auto* b = std::get_if<bool>(&v)) return *b;
    return !std::get<std::string>(v).empty();
}

} // namespace dotsmith
