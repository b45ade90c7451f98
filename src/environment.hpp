#pragma once

#include "config.hpp"
#include "env.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace dotsmith {

// Values computed from the host before any file or flag is applied.
struct host_info {
    std::string hostname;
    std::string username;
    std::string os;
};

// Runs a shell command and returns its stdout. Returns nullopt if the
// command could not be started or exited unsuccessfully.
std::optional<std::string> run_command(const std::string& command);

// /etc/hostname, falling back to the `hostname` command, else empty.
std::string probe_hostname(std::shared_ptr<spdlog::logger> log);

// First non-empty of $USER and $USERNAME, else empty.
std::string probe_username();

// Lower-cased output of `uname`, or "unknown" if it cannot be run.
std::string probe_operating_system(std::shared_ptr<spdlog::logger> log);

host_info probe_host(std::shared_ptr<spdlog::logger> log);

// Merges a flat YAML mapping of string/boolean values into `bindings`,
// overriding existing keys. A missing file is not an error.
// Throws located_exception (located at `path`) on read, parse or type errors.
void load_variables_file(const std::filesystem::path& path, env& bindings,
                         std::shared_ptr<spdlog::logger> log);

// Assembles the binding set with precedence host < variables file < flags.
// Throws located_exception if the variables file is unusable.
env build_environment(const config& cfg, const host_info& host,
                      std::shared_ptr<spdlog::logger> log);

} // namespace dotsmith
