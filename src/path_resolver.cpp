#include "path_resolver.hpp"

namespace dotsmith {

namespace fs = std::filesystem;

static fs::path anchored(const fs::path& p, const fs::path& working_dir) {
    return (p.is_absolute() ? p : working_dir / p).lexically_normal();
}

fs::path symlink_target(const fs::path& link_path, const fs::path& build_path,
                        const fs::path& working_dir) {
    if (build_path.is_absolute()) return build_path;

    fs::path target = anchored(build_path, working_dir);
    fs::path link_dir = anchored(link_path, working_dir).parent_path();

    fs::path relative = target.lexically_relative(link_dir);
    if (relative.empty()) return target;
    return relative;
}

} // namespace dotsmith
