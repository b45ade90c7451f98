#pragma once

#include <spdlog/common.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dotsmith {

enum class action {
    sync,   // build, then link
    diff,   // build, then compare with the linked tree (not implemented)
    print   // list template variables
};

struct config {
    // Source of templates and static files
    std::filesystem::path template_dir;

    // Materialized tree: rendered templates and copied statics
    std::filesystem::path build_dir;

    // Where symlinks into build_dir are created (usually $HOME)
    std::filesystem::path link_dir;

    // Flat YAML mapping of string/boolean variables (optional)
    std::filesystem::path variables_path;

    // Each flag becomes a `true` binding, overriding the variables file
    std::vector<std::string> flags;

    // Worker threads for the traversal pool (0 = hardware_concurrency)
    unsigned int worker_threads = 0;
};

// Paths given on the command line; unset ones fall back to the defaults.
struct config_overrides {
    std::optional<std::filesystem::path> template_dir;
    std::optional<std::filesystem::path> build_dir;
    std::optional<std::filesystem::path> link_dir;
    std::optional<std::filesystem::path> variables_path;
};

// Fills unset paths from $DOTFILES_PATH, $XDG_CONFIG_HOME, $XDG_CACHE_HOME
// and $HOME. Default template and build directories are created.
// Throws std::runtime_error when a needed variable is missing or a default
// directory cannot be created.
config resolve_config(const config_overrides& overrides,
                      std::vector<std::string> flags);

// Parse action from string. Returns nullopt if invalid.
std::optional<action> parse_action(const std::string& s);

// 0 = warn, 1 = info, 2 = debug, more = trace
spdlog::level::level_enum log_level_for(int verbosity);

} // namespace dotsmith
