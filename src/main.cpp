#include "builder.hpp"
#include "config.hpp"
#include "environment.hpp"
#include "error.hpp"
#include "linker.hpp"
#include "peeker.hpp"
#include "worker_pool.hpp"
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

// Builds the environment and the tree. Returns false (after logging the
// report) if either failed.
bool build(const dotsmith::config& cfg, dotsmith::worker_pool& pool,
           const std::shared_ptr<spdlog::logger>& console) {
    dotsmith::env bindings;
    try {
        bindings = dotsmith::build_environment(cfg, dotsmith::probe_host(console), console);
    } catch (const dotsmith::located_exception& e) {
        dotsmith::error_collection(e.error()).log(*console);
        return false;
    }

    console->info("building tree");
    auto built = dotsmith::build_tree(cfg, bindings, pool, console);
    if (!built.ok()) {
        built.errors.log(*console);
        return false;
    }
    return true;
}

int run(int argc, char* argv[], const std::shared_ptr<spdlog::logger>& console) {
    cxxopts::Options options("dotsmith",
        "Render a tree of templates and link the result into place");

    options.add_options()
        ("t,template-dir", "Template tree (default: $DOTFILES_PATH or $XDG_CONFIG_HOME/dotfiles/tree)",
            cxxopts::value<std::string>())
        ("b,build-dir", "Build tree (default: $XDG_CACHE_HOME/dotfiles)", cxxopts::value<std::string>())
        ("l,link-dir", "Link tree (default: $HOME)", cxxopts::value<std::string>())
        ("variables", "Variables file (default: $XDG_CONFIG_HOME/dotfiles/variables.yaml)",
            cxxopts::value<std::string>())
        ("j,jobs", "Worker threads (0 = one per core)", cxxopts::value<unsigned int>()->default_value("0"))
        ("v,verbose", "Increase verbosity (repeatable)")
        ("h,help", "Print help")
        ("action", "sync, diff or print", cxxopts::value<std::string>())
        ("flags", "Variables to set to true", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"action", "flags"});
    options.positional_help("<sync|diff|print> [flags...]");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("action")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    auto act = dotsmith::parse_action(result["action"].as<std::string>());
    if (!act) {
        console->error("unknown action '{}'", result["action"].as<std::string>());
        std::cout << options.help() << std::endl;
        return 1;
    }

    spdlog::set_level(dotsmith::log_level_for(static_cast<int>(result.count("verbose"))));

    // CLI overrides
    dotsmith::config_overrides overrides;
    if (result.count("template-dir")) overrides.template_dir = result["template-dir"].as<std::string>();
    if (result.count("build-dir"))    overrides.build_dir = result["build-dir"].as<std::string>();
    if (result.count("link-dir"))     overrides.link_dir = result["link-dir"].as<std::string>();
    if (result.count("variables"))    overrides.variables_path = result["variables"].as<std::string>();

    std::vector<std::string> flags;
    if (result.count("flags")) flags = result["flags"].as<std::vector<std::string>>();

    dotsmith::config cfg;
    try {
        cfg = dotsmith::resolve_config(overrides, std::move(flags));
    } catch (const std::exception& e) {
        console->error("Failed to resolve configuration: {}", e.what());
        return 1;
    }
    cfg.worker_threads = result["jobs"].as<unsigned int>();

    console->info("dotsmith starting");
    console->info("  templates: {}", cfg.template_dir.string());
    console->info("  build:     {}", cfg.build_dir.string());
    console->info("  links:     {}", cfg.link_dir.string());
    console->info("  variables: {}", cfg.variables_path.string());

    dotsmith::worker_pool pool(cfg, console);
    pool.start();

    switch (*act) {
        case dotsmith::action::sync: {
            if (!build(cfg, pool, console)) return 1;

            console->info("linking tree");
            auto linked = dotsmith::link_tree(cfg, pool, console);
            if (!linked.ok()) {
                linked.errors.log(*console);
                return 1;
            }
            return 0;
        }
        case dotsmith::action::diff: {
            if (!build(cfg, pool, console)) return 1;

            console->info("checking differences between current state and dotfiles");
            console->error("diff is not implemented");
            return 1;
        }
        case dotsmith::action::print: {
            console->info("scanning tree");
            auto errors = dotsmith::print_variables(cfg, pool, console, std::cout);
            if (!errors.empty()) {
                errors.log(*console);
                return 1;
            }
            return 0;
        }
    }
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    auto console = spdlog::stderr_color_mt("dotsmith");
    spdlog::set_level(spdlog::level::warn);

    try {
        return run(argc, argv, console);
    } catch (const std::exception& e) {
        console->error("{}", e.what());
        return 1;
    }
}
