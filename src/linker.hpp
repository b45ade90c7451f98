#pragma once

#include "config.hpp"
#include "error.hpp"
#include "tree_walker.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <filesystem>
#include <memory>

namespace dotsmith {

// Mirrors build_dir's directories into link_dir and replaces each file
// position there with a symlink to the corresponding build file.
class tree_linker {
public:
    // Captures the current working directory for relative link targets.
    tree_linker(const config& cfg, std::shared_ptr<spdlog::logger> log);

    walk_plan<std::size_t> plan() const;

    void make_link_dir(const std::filesystem::path& relative) const;

    // Returns 1. Throws located_exception.
    std::size_t link_file(const std::filesystem::path& relative) const;

private:
    const config& m_cfg;
    std::shared_ptr<spdlog::logger> m_log;
    std::filesystem::path m_working_dir;
};

walk_result<std::size_t> link_tree(const config& cfg, worker_pool& pool,
                                   std::shared_ptr<spdlog::logger> log);

} // namespace dotsmith
