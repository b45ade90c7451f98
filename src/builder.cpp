#include "builder.hpp"
#include "fs_ops.hpp"
#include "template_engine.hpp"
#include <system_error>

namespace dotsmith {

namespace fs = std::filesystem;

tree_builder::tree_builder(const config& cfg, const env& bindings,
                           std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_bindings(bindings), m_log(std::move(log))
{}

walk_plan<std::size_t> tree_builder::plan() const {
    walk_plan<std::size_t> p;
    p.name = "build";
    p.source_root = m_cfg.template_dir;
    p.enter_dir = [this](const fs::path& relative) { make_build_dir(relative); };
    p.visit_file = [this](const fs::path& relative) { return build_file(relative); };
    p.merge = [](std::size_t& total, std::size_t&& n) { total += n; };
    return p;
}

void tree_builder::make_build_dir(const fs::path& relative) const {
    ensure_directory(join_relative(m_cfg.build_dir, relative));
}

std::size_t tree_builder::build_file(const fs::path& relative) const {
    const fs::path template_path = m_cfg.template_dir / relative;
    const fs::path new_path = m_cfg.build_dir / relative;

    if (has_template_extension(template_path)) {
        render_template(template_path, new_path);
        return 1;
    }

    m_log->debug("copying \"{}\" -> \"{}\"", template_path.string(), new_path.string());
    std::error_code ec;
    fs::copy_file(template_path, new_path, fs::copy_options::overwrite_existing, ec);
    if (ec) throw located_exception(io_error(template_path, ec));
    return 1;
}

void tree_builder::render_template(const fs::path& template_path, fs::path new_path) const {
    m_log->debug("rendering \"{}\"", template_path.string());

    std::string text = read_text_file(template_path);

    std::error_code ec;
    auto permissions = fs::status(template_path, ec).permissions();
    if (ec) throw located_exception(io_error(template_path, ec));

    std::string rendered;
    try {
        rendered = parse_template(text).render(m_bindings);
    } catch (const template_parse_error& e) {
        throw located_exception({template_path, error_kind::template_parse, e.what()});
    } catch (const template_render_error& e) {
        throw located_exception({template_path, error_kind::template_render, e.what()});
    }

    // remove template file extension
    new_path.replace_extension();

    write_file(new_path, rendered);

    // carry the template's permissions over
    fs::permissions(new_path, permissions, fs::perm_options::replace, ec);
    if (ec) throw located_exception(io_error(new_path, ec));
}

walk_result<std::size_t> build_tree(const config& cfg, const env& bindings,
                                    worker_pool& pool,
                                    std::shared_ptr<spdlog::logger> log) {
    tree_builder builder(cfg, bindings, log);
    tree_walker<std::size_t> walker(pool.executor(), builder.plan(), log);

    auto result = walker.run();
    if (result.ok()) {
        log->info("built {} files into \"{}\"", result.value, cfg.build_dir.string());
    }
    return result;
}

} // namespace dotsmith
