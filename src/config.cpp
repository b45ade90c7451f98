#include "config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace dotsmith {

namespace fs = std::filesystem;

static const char* app_prefix = "dotfiles";

static std::optional<std::string> non_empty_env(const char* name) {
    const char* v = std::getenv(name);
    if (v && *v) return std::string(v);
    return std::nullopt;
}

static fs::path home_dir() {
    auto home = non_empty_env("HOME");
    if (!home) throw std::runtime_error("config: $HOME is not set");
    return *home;
}

static fs::path xdg_dir(const char* variable, const char* fallback) {
    if (auto v = non_empty_env(variable)) return *v;
    return home_dir() / fallback;
}

static fs::path created(fs::path dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("config: cannot create \"" + dir.string() + "\": " + ec.message());
    }
    return dir;
}

std::optional<action> parse_action(const std::string& s) {
    if (s == "sync")  return action::sync;
    if (s == "diff")  return action::diff;
    if (s == "print") return action::print;
    return std::nullopt;
}

spdlog::level::level_enum log_level_for(int verbosity) {
    if (verbosity <= 0) return spdlog::level::warn;
    if (verbosity == 1) return spdlog::level::info;
    if (verbosity == 2) return spdlog::level::debug;
    return spdlog::level::trace;
}

config resolve_config(const config_overrides& overrides,
                      std::vector<std::string> flags) {
    config cfg;

    if (overrides.template_dir) {
        cfg.template_dir = *overrides.template_dir;
    } else if (auto v = non_empty_env("DOTFILES_PATH")) {
        cfg.template_dir = *v;
    } else {
        cfg.template_dir = created(xdg_dir("XDG_CONFIG_HOME", ".config") / app_prefix / "tree");
    }

    if (overrides.build_dir) {
        cfg.build_dir = *overrides.build_dir;
    } else {
        cfg.build_dir = created(xdg_dir("XDG_CACHE_HOME", ".cache") / app_prefix);
    }

    cfg.link_dir = overrides.link_dir ? *overrides.link_dir : home_dir();

    if (overrides.variables_path) {
        cfg.variables_path = *overrides.variables_path;
    } else {
        cfg.variables_path = xdg_dir("XDG_CONFIG_HOME", ".config") / app_prefix / "variables.yaml";
    }

    cfg.flags = std::move(flags);
    return cfg;
}

} // namespace dotsmith
