#include "environment.hpp"
#include "error.hpp"
#include <yaml-cpp/yaml.h>
#include <sys/wait.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace dotsmith {

namespace fs = std::filesystem;

static std::string trimmed(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::optional<std::string> run_command(const std::string& command) {
    std::string redirected = command + " 2>/dev/null";
    FILE* pipe = ::popen(redirected.c_str(), "r");
    if (!pipe) return std::nullopt;

    std::string output;
    std::array<char, 256> buffer{};
    std::size_t n;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), n);
    }

    int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::nullopt;
    }
    return output;
}

std::string probe_hostname(std::shared_ptr<spdlog::logger> log) {
    std::ifstream file("/etc/hostname");
    if (file) {
        std::stringstream ss;
        ss << file.rdbuf();
        if (!file.bad()) return trimmed(ss.str());
    }

    log->debug("/etc/hostname unreadable, falling back to `hostname`");
    if (auto out = run_command("hostname")) return trimmed(*out);

    log->debug("`hostname` failed, using empty hostname");
    return {};
}

std::string probe_username() {
    for (const char* name : {"USER", "USERNAME"}) {
        const char* v = std::getenv(name);
        if (v && *v) return v;
    }
    return {};
}

std::string probe_operating_system(std::shared_ptr<spdlog::logger> log) {
    auto out = run_command("uname");
    if (!out) {
        log->debug("`uname` failed, reporting unknown operating system");
        return "unknown";
    }

    std::string os = trimmed(*out);
    std::transform(os.begin(), os.end(), os.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return os;
}

host_info probe_host(std::shared_ptr<spdlog::logger> log) {
    return {probe_hostname(log), probe_username(), probe_operating_system(log)};
}

// Only strings and booleans are accepted. Quoted scalars are always strings.
// Of the plain scalars only `true` and `false` are booleans (yes/on stay
// strings), and numbers are rejected.
static std::optional<value> to_binding(const YAML::Node& node) {
    if (!node.IsScalar()) return std::nullopt;

    const std::string& tag = node.Tag();
    const std::string& text = node.Scalar();
    if (tag == "!" || tag == "tag:yaml.org,2002:str") {
        return value(text);
    }
    if (tag == "tag:yaml.org,2002:bool") {
        bool b;
        if (YAML::convert<bool>::decode(node, b)) return value(b);
        return std::nullopt;
    }

    if (text == "true") return value(true);
    if (text == "false") return value(false);

    long long i;
    double d;
    if (YAML::convert<long long>::decode(node, i) || YAML::convert<double>::decode(node, d)) {
        return std::nullopt;
    }
    return value(text);
}

void load_variables_file(const fs::path& path, env& bindings,
                         std::shared_ptr<spdlog::logger> log) {
    log->debug("trying to read \"{}\"", path.string());

    std::error_code ec;
    bool present = fs::exists(path, ec);
    if (ec) throw located_exception(io_error(path, ec));
    if (!present) {
        fs::path legacy = path;
        legacy.replace_extension(".toml");
        if (legacy != path && fs::exists(legacy, ec)) {
            throw located_exception({legacy, error_kind::variables_parse,
                "TOML variables files are no longer read; convert it to \"" + path.filename().string() + "\""});
        }
        log->debug("no variables file at \"{}\"", path.string());
        return;
    }

    log->debug("parsing \"{}\"", path.string());
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile& e) {
        throw located_exception({path, error_kind::io, e.what()});
    } catch (const YAML::Exception& e) {
        throw located_exception({path, error_kind::variables_parse, e.what()});
    }

    if (root.IsNull()) return;
    if (!root.IsMap()) {
        throw located_exception({path, error_kind::variables_parse, "expected a mapping of variables"});
    }

    for (const auto& item : root) {
        std::string key;
        try {
            key = item.first.as<std::string>();
        } catch (const YAML::Exception& e) {
            throw located_exception({path, error_kind::variables_parse, e.what()});
        }

        auto v = to_binding(item.second);
        if (!v) {
            throw located_exception({path, error_kind::variable_type, "variable '" + key + "'"});
        }
        bindings.insert_or_assign(std::move(key), std::move(*v));
    }
}

env build_environment(const config& cfg, const host_info& host,
                      std::shared_ptr<spdlog::logger> log) {
    env bindings;
    bindings.insert_or_assign("hostname", host.hostname);
    bindings.insert_or_assign("username", host.username);
    bindings.insert_or_assign("os", host.os);

    load_variables_file(cfg.variables_path, bindings, log);

    for (const auto& flag : cfg.flags) {
        bindings.insert_or_assign(flag, true);
    }

    log->info("env:");
    for (const auto& [k, v] : bindings) {
        log->info("  {}: {}", k, to_display(v));
    }

    return bindings;
}

} // namespace dotsmith
