#pragma once

#include "config.hpp"
#include "env.hpp"
#include "error.hpp"
#include "tree_walker.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <filesystem>
#include <memory>

namespace dotsmith {

// Mirrors template_dir into build_dir: *.tpl files are rendered with the
// binding set (and lose the extension), everything else is copied.
class tree_builder {
public:
    tree_builder(const config& cfg, const env& bindings,
                 std::shared_ptr<spdlog::logger> log);

    // Accumulates the number of files written.
    walk_plan<std::size_t> plan() const;

    void make_build_dir(const std::filesystem::path& relative) const;

    // Returns 1. Throws located_exception.
    std::size_t build_file(const std::filesystem::path& relative) const;

private:
    void render_template(const std::filesystem::path& template_path,
                         std::filesystem::path new_path) const;

    const config& m_cfg;
    const env& m_bindings;
    std::shared_ptr<spdlog::logger> m_log;
};

walk_result<std::size_t> build_tree(const config& cfg, const env& bindings,
                                    worker_pool& pool,
                                    std::shared_ptr<spdlog::logger> log);

} // namespace dotsmith
