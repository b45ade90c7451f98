#pragma once

#include <filesystem>

namespace dotsmith {

// Target to store in a symlink at `link_path` so that it resolves to `build_path`.
//
// An absolute build path is used as is. Otherwise both paths are anchored at
// `working_dir`, lexically normalized, and the build path is expressed
// relative to the directory containing the link. Falls back to the absolute
// build path when no lexical relative path exists. Symlinks inside the link
// directory's own ancestry are not resolved.
std::filesystem::path symlink_target(const std::filesystem::path& link_path,
                                     const std::filesystem::path& build_path,
                                     const std::filesystem::path& working_dir);

} // namespace dotsmith
