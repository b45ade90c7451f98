#pragma once

#include "env.hpp"
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dotsmith {

// File name extension (without the dot) marking a file as a template.
inline constexpr std::string_view template_extension = "tpl";

class template_error : public std::runtime_error {
public:
    template_error(const std::string& message, std::size_t line);

    // 1-based line of the template where the problem was found.
    std::size_t line() const noexcept { return m_line; }

private:
    std::size_t m_line;
};

class template_parse_error : public template_error {
public:
    using template_error::template_error;
};

class template_render_error : public template_error {
public:
    using template_error::template_error;
};

struct template_body;

// Parsed template. Cheap to copy; the syntax tree is shared and immutable.
//
// Syntax:
//   {{ name }}  {{ "literal" }}                       substitution
//   {% if cond %} .. {% elif cond %} .. {% else %} .. {% end %}
//   {# comment #}
// where cond is `name`, `not name`, `!name`, `name == "lit"` or `name != "lit"`.
// A '-' just inside a tag delimiter ({{- or -%}) trims whitespace on that side.
class compiled_template {
public:
    // Throws template_render_error if a referenced variable is not bound.
    std::string render(const env& bindings) const;

    // Every variable name referenced anywhere in the template, sorted and unique.
    std::vector<std::string> list_variables() const;

private:
    friend compiled_template parse_template(std::string_view text);

    explicit compiled_template(std::shared_ptr<const template_body> body);

    std::shared_ptr<const template_body> m_body;
};

// Throws template_parse_error on malformed input.
compiled_template parse_template(std::string_view text);

} // namespace dotsmith
