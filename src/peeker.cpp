#include "peeker.hpp"
#include "fs_ops.hpp"
#include "template_engine.hpp"
#include <algorithm>
#include <iterator>

namespace dotsmith {

namespace fs = std::filesystem;

tree_peeker::tree_peeker(const config& cfg, std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_log(std::move(log))
{}

walk_plan<std::vector<std::string>> tree_peeker::plan() const {
    walk_plan<std::vector<std::string>> p;
    p.name = "peek";
    p.source_root = m_cfg.template_dir;
    p.visit_file = [this](const fs::path& relative) { return peek_file(relative); };
    p.merge = [](std::vector<std::string>& vars, std::vector<std::string>&& more) {
        vars.insert(vars.end(), std::make_move_iterator(more.begin()),
                    std::make_move_iterator(more.end()));
    };
    return p;
}

std::vector<std::string> tree_peeker::peek_file(const fs::path& relative) const {
    const fs::path template_path = m_cfg.template_dir / relative;
    if (!has_template_extension(template_path)) return {};

    m_log->debug("reading \"{}\"", template_path.string());
    std::string text = read_text_file(template_path);

    try {
        return parse_template(text).list_variables();
    } catch (const template_parse_error& e) {
        throw located_exception({template_path, error_kind::template_parse, e.what()});
    }
}

walk_result<std::vector<std::string>> peek_variables(const config& cfg, worker_pool& pool,
                                                     std::shared_ptr<spdlog::logger> log) {
    tree_peeker peeker(cfg, log);
    tree_walker<std::vector<std::string>> walker(pool.executor(), peeker.plan(), log);

    auto result = walker.run();
    if (result.ok()) {
        auto& vars = result.value;
        std::sort(vars.begin(), vars.end());
        vars.erase(std::unique(vars.begin(), vars.end()), vars.end());
    }
    return result;
}

error_collection print_variables(const config& cfg, worker_pool& pool,
                                 std::shared_ptr<spdlog::logger> log, std::ostream& out) {
    auto result = peek_variables(cfg, pool, log);
    if (!result.ok()) return std::move(result.errors);

    for (const auto& var : result.value) {
        out << var << '\n';
    }
    return {};
}

} // namespace dotsmith
