#pragma once

#include "config.hpp"
#include "error.hpp"
#include "tree_walker.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace dotsmith {

// Collects the variable names referenced by the templates in template_dir.
// Reads only; nothing is written anywhere.
class tree_peeker {
public:
    tree_peeker(const config& cfg, std::shared_ptr<spdlog::logger> log);

    walk_plan<std::vector<std::string>> plan() const;

    // Empty for non-template files. Throws located_exception.
    std::vector<std::string> peek_file(const std::filesystem::path& relative) const;

private:
    const config& m_cfg;
    std::shared_ptr<spdlog::logger> m_log;
};

// Sorted, without duplicates.
walk_result<std::vector<std::string>> peek_variables(const config& cfg, worker_pool& pool,
                                                     std::shared_ptr<spdlog::logger> log);

// Writes one variable name per line to `out`. Nothing is written on failure.
error_collection print_variables(const config& cfg, worker_pool& pool,
                                 std::shared_ptr<spdlog::logger> log, std::ostream& out);

} // namespace dotsmith
