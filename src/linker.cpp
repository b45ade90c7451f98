#include "linker.hpp"
#include "fs_ops.hpp"
#include "path_resolver.hpp"
#include <unistd.h>
#include <cerrno>
#include <system_error>

namespace dotsmith {

namespace fs = std::filesystem;

tree_linker::tree_linker(const config& cfg, std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_log(std::move(log)), m_working_dir(fs::current_path())
{}

walk_plan<std::size_t> tree_linker::plan() const {
    walk_plan<std::size_t> p;
    p.name = "link";
    p.source_root = m_cfg.build_dir;
    p.enter_dir = [this](const fs::path& relative) { make_link_dir(relative); };
    p.visit_file = [this](const fs::path& relative) { return link_file(relative); };
    p.merge = [](std::size_t& total, std::size_t&& n) { total += n; };
    return p;
}

void tree_linker::make_link_dir(const fs::path& relative) const {
    ensure_directory(join_relative(m_cfg.link_dir, relative));
}

std::size_t tree_linker::link_file(const fs::path& relative) const {
    const fs::path build_path = m_cfg.build_dir / relative;
    const fs::path link_path = m_cfg.link_dir / relative;

    // unlink rather than remove: a directory in the way is an error, not something to delete
    if (::unlink(link_path.c_str()) == 0) {
        m_log->debug("removed existing file \"{}\"", link_path.string());
    } else if (errno != ENOENT) {
        throw located_exception(io_error(link_path, std::error_code(errno, std::generic_category())));
    }

    auto target = symlink_target(link_path, build_path, m_working_dir);
    m_log->debug("linking \"{}\" to \"{}\"", link_path.string(), target.string());

    std::error_code ec;
    fs::create_symlink(target, link_path, ec);
    if (ec) throw located_exception(io_error(link_path, ec));
    return 1;
}

walk_result<std::size_t> link_tree(const config& cfg, worker_pool& pool,
                                   std::shared_ptr<spdlog::logger> log) {
    tree_linker linker(cfg, log);
    tree_walker<std::size_t> walker(pool.executor(), linker.plan(), log);

    auto result = walker.run();
    if (result.ok()) {
        log->info("linked {} files into \"{}\"", result.value, cfg.link_dir.string());
    }
    return result;
}

} // namespace dotsmith
