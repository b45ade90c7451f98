#include "error.hpp"
#include <spdlog/fmt/fmt.h>
#include <iterator>

namespace dotsmith {

const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::io:              return "IO error";
        case error_kind::template_parse:  return "Failed to parse template file";
        case error_kind::template_render: return "Failed to render template file";
        case error_kind::variables_parse: return "Failed to parse variables file";
        case error_kind::variable_type:   return "Unsupported variable type";
        case error_kind::internal:        return "Internal error";
    }
    return "Unknown error";
}

std::string located_error::describe() const {
    if (message.empty()) return to_string(kind);
    return fmt::format("{}: {}", to_string(kind), message);
}

located_error io_error(const std::filesystem::path& location, const std::error_code& ec) {
    return {location, error_kind::io, ec.message()};
}

located_exception::located_exception(located_error error)
    : std::runtime_error(error.location.string() + ": " + error.describe()),
      m_error(std::move(error))
{}

error_collection::error_collection(located_error error) {
    m_errors.push_back(std::move(error));
}

void error_collection::add(located_error error) {
    m_errors.push_back(std::move(error));
}

void error_collection::merge(error_collection&& other) {
    if (m_errors.empty()) {
        m_errors = std::move(other.m_errors);
    } else {
        m_errors.insert(m_errors.end(),
                        std::make_move_iterator(other.m_errors.begin()),
                        std::make_move_iterator(other.m_errors.end()));
    }
    other.m_errors.clear();
}

std::string error_collection::report() const {
    std::string out = fmt::format("{} errors occurred:\n", m_errors.size());
    for (std::size_t i = 0; i < m_errors.size(); ++i) {
        out += fmt::format("  err {:02} at \"{}\":\n", i, m_errors[i].location.string());
        out += fmt::format("      {}\n", m_errors[i].describe());
    }
    return out;
}

void error_collection::log(spdlog::logger& log) const {
    if (m_errors.empty()) return;

    log.error("{} errors occurred:", m_errors.size());
    for (std::size_t i = 0; i < m_errors.size(); ++i) {
        log.error("  err {:02} at \"{}\":", i, m_errors[i].location.string());
        log.error("      {}", m_errors[i].describe());
    }
}

} // namespace dotsmith
