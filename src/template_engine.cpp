#include "template_engine.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace dotsmith {

namespace {

struct expression {
    bool is_literal = false;
    std::string text; // variable name or literal contents
    std::size_t line = 0;
};

enum class condition_op {
    truthy,
    falsy,
    equals,
    not_equals
};

struct condition {
    condition_op op = condition_op::truthy;
    std::string variable;
    std::string literal;
    std::size_t line = 0;
};

struct template_node;

struct branch_arm {
    condition cond;
    std::vector<template_node> body;
};

enum class node_kind {
    text,
    substitution,
    branch
};

struct template_node {
    node_kind kind = node_kind::text;
    std::string text;
    expression expr;
    std::vector<branch_arm> arms;
    std::vector<template_node> else_body;
};

enum class token_kind {
    text,
    output,
    statement
};

struct token {
    token_kind kind;
    std::string content;
    std::size_t line;
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool is_identifier(std::string_view s) {
    if (s.empty()) return false;
    auto first = static_cast<unsigned char>(s.front());
    if (!std::isalpha(first) && s.front() != '_') return false;
    return std::all_of(s.begin() + 1, s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
    });
}

// Position of `delim` at or after `from`, skipping over double-quoted
// literals so that a delimiter inside a string does not close the tag.
std::size_t find_closing(std::string_view text, std::string_view delim, std::size_t from) {
    bool quoted = false;
    for (std::size_t i = from; i < text.size(); ++i) {
        char c = text[i];
        if (quoted) {
            if (c == '\\') ++i;
            else if (c == '"') quoted = false;
        } else if (c == '"') {
            quoted = true;
        } else if (text.substr(i, delim.size()) == delim) {
            return i;
        }
    }
    return std::string_view::npos;
}

std::vector<token> tokenize(std::string_view text) {
    std::vector<token> tokens;
    std::size_t line = 1;
    std::size_t pos = 0;
    bool trim_next_text = false;

    auto push_text = [&](std::string_view chunk) {
        if (trim_next_text) {
            while (!chunk.empty() && is_space(chunk.front())) chunk.remove_prefix(1);
            trim_next_text = false;
        }
        if (!chunk.empty()) tokens.push_back({token_kind::text, std::string(chunk), line});
    };

    while (pos < text.size()) {
        auto open = text.find('{', pos);
        while (open != std::string_view::npos && open + 1 < text.size()) {
            char next = text[open + 1];
            if (next == '{' || next == '%' || next == '#') break;
            open = text.find('{', open + 1);
        }
        if (open == std::string_view::npos || open + 1 >= text.size()) {
            push_text(text.substr(pos));
            break;
        }

        std::string_view before = text.substr(pos, open - pos);
        char marker = text[open + 1];
        std::size_t inner_begin = open + 2;
        bool trim_before = inner_begin < text.size() && text[inner_begin] == '-';
        if (trim_before) {
            ++inner_begin;
            while (!before.empty() && is_space(before.back())) before.remove_suffix(1);
        }
        push_text(before);
        line += std::count(text.begin() + pos, text.begin() + open, '\n');
        std::size_t tag_line = line;

        const char* close_delim = marker == '{' ? "}}" : marker == '%' ? "%}" : "#}";
        // comments hold no literals
        auto close = marker == '#' ? text.find(close_delim, inner_begin)
                                   : find_closing(text, close_delim, inner_begin);
        if (close == std::string_view::npos) {
            throw template_parse_error("unterminated tag", tag_line);
        }

        std::size_t inner_end = close;
        if (inner_end > inner_begin && text[inner_end - 1] == '-') {
            --inner_end;
            trim_next_text = true;
        }

        if (marker != '#') {
            std::string_view inner = trim(text.substr(inner_begin, inner_end - inner_begin));
            tokens.push_back({marker == '{' ? token_kind::output : token_kind::statement,
                              std::string(inner), tag_line});
        }

        line += std::count(text.begin() + open, text.begin() + close, '\n');
        pos = close + 2;
    }

    return tokens;
}

// Parses a double-quoted literal; supports \" \\ \n and \t escapes.
std::string parse_literal(std::string_view s, std::size_t line) {
    if (s.size() < 2 || s.front() != '"' || s.back() != '"') {
        throw template_parse_error("malformed string literal '" + std::string(s) + "'", line);
    }
    std::string out;
    for (std::size_t i = 1; i + 1 < s.size(); ++i) {
        char c = s[i];
        if (c == '"') {
            throw template_parse_error("unescaped quote in string literal", line);
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (i + 2 >= s.size()) {
            throw template_parse_error("dangling escape in string literal", line);
        }
        switch (s[++i]) {
            case 'n':  out += '\n'; break;
            case 't':  out += '\t'; break;
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            default:
                throw template_parse_error(std::string("unknown escape '\\") + s[i] + "'", line);
        }
    }
    return out;
}

expression parse_expression(std::string_view s, std::size_t line) {
    s = trim(s);
    if (s.empty()) throw template_parse_error("empty expression", line);

    expression expr;
    expr.line = line;
    if (s.front() == '"') {
        expr.is_literal = true;
        expr.text = parse_literal(s, line);
        return expr;
    }
    if (!is_identifier(s)) {
        throw template_parse_error("invalid expression '" + std::string(s) + "'", line);
    }
    expr.text = std::string(s);
    return expr;
}

condition parse_condition(std::string_view s, std::size_t line) {
    s = trim(s);
    if (s.empty()) throw template_parse_error("missing condition", line);

    condition cond;
    cond.line = line;

    std::string_view name = s;
    if (s.front() == '!') {
        cond.op = condition_op::falsy;
        name = trim(s.substr(1));
    } else if (s.size() > 4 && s.substr(0, 3) == "not" && is_space(s[3])) {
        cond.op = condition_op::falsy;
        name = trim(s.substr(4));
    } else {
        // the operator sits before the literal; anything after the first quote is literal text
        std::string_view head = s.substr(0, s.find('"'));
        auto eq = head.find("==");
        auto ne = head.find("!=");
        auto op = std::min(eq, ne);
        if (op != std::string_view::npos) {
            cond.op = op == eq ? condition_op::equals : condition_op::not_equals;
            name = trim(s.substr(0, op));
            cond.literal = parse_literal(trim(s.substr(op + 2)), line);
        }
    }

    if (!is_identifier(name)) {
        throw template_parse_error("invalid condition '" + std::string(s) + "'", line);
    }
    cond.variable = std::string(name);
    return cond;
}

enum class stop_kind {
    eof,
    elif_tag,
    else_tag,
    end_tag
};

struct block_stop {
    stop_kind kind = stop_kind::eof;
    std::string rest;
    std::size_t line = 0;
};

class parser {
public:
    explicit parser(std::vector<token> tokens) : m_tokens(std::move(tokens)) {}

    std::vector<template_node> parse_document() {
        block_stop stop;
        auto nodes = parse_body(stop);
        switch (stop.kind) {
            case stop_kind::eof:      break;
            case stop_kind::elif_tag: throw template_parse_error("'elif' without matching 'if'", stop.line);
            case stop_kind::else_tag: throw template_parse_error("'else' without matching 'if'", stop.line);
            case stop_kind::end_tag:  throw template_parse_error("'end' without matching 'if'", stop.line);
        }
        return nodes;
    }

private:
    // Consumes tokens until end of input or an elif/else/end statement.
    std::vector<template_node> parse_body(block_stop& stop) {
        std::vector<template_node> nodes;

        while (m_pos < m_tokens.size()) {
            const token& tok = m_tokens[m_pos++];

            if (tok.kind == token_kind::text) {
                template_node node;
                node.kind = node_kind::text;
                node.text = tok.content;
                nodes.push_back(std::move(node));
                continue;
            }

            if (tok.kind == token_kind::output) {
                template_node node;
                node.kind = node_kind::substitution;
                node.expr = parse_expression(tok.content, tok.line);
                nodes.push_back(std::move(node));
                continue;
            }

            std::string_view content = tok.content;
            auto split = std::find_if(content.begin(), content.end(), is_space);
            std::string_view keyword = content.substr(0, split - content.begin());
            std::string_view rest = trim(content.substr(keyword.size()));

            if (keyword == "if") {
                nodes.push_back(parse_branch(rest, tok.line));
            } else if (keyword == "elif") {
                stop = {stop_kind::elif_tag, std::string(rest), tok.line};
                return nodes;
            } else if (keyword == "else" || keyword == "end" || keyword == "endif") {
                if (!rest.empty()) {
                    throw template_parse_error("unexpected text after '" + std::string(keyword) + "'", tok.line);
                }
                stop = {keyword == "else" ? stop_kind::else_tag : stop_kind::end_tag, {}, tok.line};
                return nodes;
            } else if (keyword.empty()) {
                throw template_parse_error("empty statement", tok.line);
            } else {
                throw template_parse_error("unknown directive '" + std::string(keyword) + "'", tok.line);
            }
        }

        stop = {stop_kind::eof, {}, 0};
        return nodes;
    }

    template_node parse_branch(std::string_view first_condition, std::size_t line) {
        template_node node;
        node.kind = node_kind::branch;

        condition cond = parse_condition(first_condition, line);
        while (true) {
            block_stop stop;
            auto body = parse_body(stop);
            node.arms.push_back({std::move(cond), std::move(body)});

            if (stop.kind == stop_kind::eof) {
                throw template_parse_error("unclosed 'if' block", line);
            }
            if (stop.kind == stop_kind::end_tag) {
                return node;
            }
            if (stop.kind == stop_kind::elif_tag) {
                cond = parse_condition(stop.rest, stop.line);
                continue;
            }

            // else: the remaining body must be closed by 'end'
            block_stop else_stop;
            node.else_body = parse_body(else_stop);
            switch (else_stop.kind) {
                case stop_kind::end_tag:  return node;
                case stop_kind::eof:      throw template_parse_error("unclosed 'if' block", line);
                case stop_kind::elif_tag: throw template_parse_error("'elif' after 'else'", else_stop.line);
                case stop_kind::else_tag: throw template_parse_error("duplicate 'else'", else_stop.line);
            }
        }
    }

    std::vector<token> m_tokens;
    std::size_t m_pos = 0;
};

const value& lookup(const env& bindings, const std::string& name, std::size_t line) {
    auto it = bindings.find(name);
    if (it == bindings.end()) {
        throw template_render_error("undefined variable '" + name + "'", line);
    }
    return it->second;
}

bool evaluate(const condition& cond, const env& bindings) {
    const value& v = lookup(bindings, cond.variable, cond.line);
    switch (cond.op) {
        case condition_op::truthy:     return is_truthy(v);
        case condition_op::falsy:      return !is_truthy(v);
        case condition_op::equals:     return to_display(v) == cond.literal;
        case condition_op::not_equals: return to_display(v) != cond.literal;
    }
    return false;
}

void render_nodes(const std::vector<template_node>& nodes, const env& bindings, std::string& out) {
    for (const auto& node : nodes) {
        switch (node.kind) {
            case node_kind::text:
                out += node.text;
                break;
            case node_kind::substitution:
                if (node.expr.is_literal) {
                    out += node.expr.text;
                } else {
                    out += to_display(lookup(bindings, node.expr.text, node.expr.line));
                }
                break;
            case node_kind::branch: {
                const std::vector<template_node>* taken = &node.else_body;
                for (const auto& arm : node.arms) {
                    if (evaluate(arm.cond, bindings)) {
                        taken = &arm.body;
                        break;
                    }
                }
                render_nodes(*taken, bindings, out);
                break;
            }
        }
    }
}

void collect_variables(const std::vector<template_node>& nodes, std::set<std::string>& names) {
    for (const auto& node : nodes) {
        if (node.kind == node_kind::substitution && !node.expr.is_literal) {
            names.insert(node.expr.text);
        } else if (node.kind == node_kind::branch) {
            for (const auto& arm : node.arms) {
                names.insert(arm.cond.variable);
                collect_variables(arm.body, names);
            }
            collect_variables(node.else_body, names);
        }
    }
}

} // namespace

struct template_body {
    std::vector<template_node> nodes;
};

template_error::template_error(const std::string& message, std::size_t line)
    : std::runtime_error("line " + std::to_string(line) + ": " + message),
      m_line(line)
{}

compiled_template::compiled_template(std::shared_ptr<const template_body> body)
    : m_body(std::move(body))
{}

std::string compiled_template::render(const env& bindings) const {
    std::string out;
    render_nodes(m_body->nodes, bindings, out);
    return out;
}

std::vector<std::string> compiled_template::list_variables() const {
    std::set<std::string> names;
    collect_variables(m_body->nodes, names);
    return {names.begin(), names.end()};
}

compiled_template parse_template(std::string_view text) {
    auto body = std::make_shared<template_body>();
    body->nodes = parser(tokenize(text)).parse_document();
    return compiled_template(std::move(body));
}

} // namespace dotsmith
