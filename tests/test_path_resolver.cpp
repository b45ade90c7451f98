#include "path_resolver.hpp"
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using dotsmith::symlink_target;

TEST(path_resolver, absolute_build_path_is_used_as_is) {
    EXPECT_EQ(symlink_target("links/sub/file", "/cache/dotfiles/sub/file", "/work"),
              fs::path("/cache/dotfiles/sub/file"));
    EXPECT_EQ(symlink_target("/home/u/sub/file", "/cache/sub/file", "/work"),
              fs::path("/cache/sub/file"));
}

TEST(path_resolver, relative_roots_walk_up_from_link_directory) {
    EXPECT_EQ(symlink_target("links/sub/file", "build/sub/file", "/work"),
              fs::path("../../build/sub/file"));
    EXPECT_EQ(symlink_target("links/file", "build/file", "/work"),
              fs::path("../build/file"));
}

TEST(path_resolver, target_resolves_to_build_file_from_link_directory) {
    const fs::path link = "links/a/b/c/file";
    const fs::path build = "build/a/b/c/file";
    auto target = symlink_target(link, build, "/work");

    auto resolved = (fs::path("/work") / link.parent_path() / target).lexically_normal();
    EXPECT_EQ(resolved, fs::path("/work/build/a/b/c/file"));
}

TEST(path_resolver, dot_and_dotdot_segments_are_normalized) {
    EXPECT_EQ(symlink_target("./links/./sub/file", "./build/sub/file", "/work"),
              fs::path("../../build/sub/file"));
    EXPECT_EQ(symlink_target("links/sub/file", "../shared/build/sub/file", "/work/repo"),
              fs::path("../../../shared/build/sub/file"));
}

TEST(path_resolver, absolute_link_root_with_relative_build_root) {
    auto target = symlink_target("/home/u/.config/app/rc", "build/.config/app/rc", "/work");
    auto resolved = (fs::path("/home/u/.config/app") / target).lexically_normal();
    EXPECT_EQ(resolved, fs::path("/work/build/.config/app/rc"));
}
