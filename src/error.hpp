#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace dotsmith {

enum class error_kind {
    io,
    template_parse,
    template_render,
    variables_parse,
    variable_type,
    internal
};

const char* to_string(error_kind kind);

// A failure tagged with the filesystem path it concerns.
struct located_error {
    std::filesystem::path location;
    error_kind kind = error_kind::internal;
    std::string message;

    // "<kind>: <message>"
    std::string describe() const;
};

located_error io_error(const std::filesystem::path& location, const std::error_code& ec);

// Carries a located_error out of a file action or directory pre-action.
class located_exception : public std::runtime_error {
public:
    explicit located_exception(located_error error);

    const located_error& error() const noexcept { return m_error; }

private:
    located_error m_error;
};

// Append-only sequence of located errors. Each concurrent branch owns its own
// collection; merging only happens where branches are joined.
class error_collection {
public:
    using const_iterator = std::vector<located_error>::const_iterator;

    error_collection() = default;
    explicit error_collection(located_error error);

    void add(located_error error);
    void merge(error_collection&& other);

    bool empty() const { return m_errors.empty(); }
    std::size_t size() const { return m_errors.size(); }

    const_iterator begin() const { return m_errors.begin(); }
    const_iterator end() const { return m_errors.end(); }

    // Count followed by every error's location and description.
    std::string report() const;

    // Writes report() at error level, one line per entry.
    void log(spdlog::logger& log) const;

private:
    std::vector<located_error> m_errors;
};

// Outcome of a traversal: value is only meaningful when ok().
template <typename T>
struct walk_result {
    T value{};
    error_collection errors;

    bool ok() const { return errors.empty(); }
};

} // namespace dotsmith
