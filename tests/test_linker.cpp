#include "linker.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using dotsmith::error_kind;

namespace {

// Runs from inside the scratch directory so that relative roots can be used.
class linker_test : public ::testing::Test {
protected:
    void SetUp() override {
        m_saved_cwd = fs::current_path();
        fs::current_path(m_scratch.path());

        m_cfg.build_dir = "build";
        m_cfg.link_dir = "home";
        m_cfg.worker_threads = 4;
        fs::create_directories(m_cfg.build_dir);

        m_pool = std::make_unique<dotsmith::worker_pool>(m_cfg, m_log);
        m_pool->start();
    }

    void TearDown() override {
        m_pool->stop();
        fs::current_path(m_saved_cwd);
    }

    dotsmith::walk_result<std::size_t> link() {
        return dotsmith::link_tree(m_cfg, *m_pool, m_log);
    }

    fs::path built(const fs::path& relative) const { return m_cfg.build_dir / relative; }
    fs::path linked(const fs::path& relative) const { return m_cfg.link_dir / relative; }

    std::shared_ptr<spdlog::logger> m_log = test_support::make_log();
    test_support::scratch_dir m_scratch;
    fs::path m_saved_cwd;
    dotsmith::config m_cfg;
    std::unique_ptr<dotsmith::worker_pool> m_pool;
};

} // namespace

TEST_F(linker_test, links_every_file_and_mirrors_directories) {
    test_support::write_file(built(".bashrc"), "rc");
    test_support::write_file(built(".config/app/settings"), "s");
    fs::create_directories(built(".config/empty"));

    auto result = link();
    ASSERT_TRUE(result.ok()) << result.errors.report();
    EXPECT_EQ(result.value, 2u);

    EXPECT_TRUE(fs::is_symlink(linked(".bashrc")));
    EXPECT_TRUE(fs::is_symlink(linked(".config/app/settings")));
    EXPECT_TRUE(fs::is_directory(fs::symlink_status(linked(".config/app"))));
    EXPECT_TRUE(fs::is_directory(linked(".config/empty")));

    EXPECT_EQ(test_support::read_file(linked(".bashrc")), "rc");
    EXPECT_EQ(test_support::read_file(linked(".config/app/settings")), "s");
}

TEST_F(linker_test, relative_targets_resolve_from_link_directory) {
    test_support::write_file(built("sub/file"), "content");

    auto result = link();
    ASSERT_TRUE(result.ok()) << result.errors.report();

    auto target = fs::read_symlink(linked("sub/file"));
    EXPECT_TRUE(target.is_relative());
    EXPECT_EQ(target, fs::path("../../build/sub/file"));
    EXPECT_EQ((linked("sub") / target).lexically_normal(), fs::path("build/sub/file"));
    EXPECT_EQ(test_support::read_file(linked("sub/file")), "content");
}

TEST_F(linker_test, absolute_build_root_is_linked_verbatim) {
    m_cfg.build_dir = fs::absolute("build");
    test_support::write_file(built("f"), "abs");

    auto result = link();
    ASSERT_TRUE(result.ok()) << result.errors.report();
    EXPECT_EQ(fs::read_symlink(linked("f")), m_cfg.build_dir / "f");
}

TEST_F(linker_test, relinking_replaces_existing_links_and_files) {
    test_support::write_file(built("a"), "new-a");
    test_support::write_file(built("d/b"), "new-b");

    auto first = link();
    ASSERT_TRUE(first.ok()) << first.errors.report();

    // a stale regular file takes the place of one link
    fs::remove(linked("a"));
    test_support::write_file(linked("a"), "stale");

    auto second = link();
    ASSERT_TRUE(second.ok()) << second.errors.report();
    EXPECT_TRUE(fs::is_symlink(linked("a")));
    EXPECT_EQ(test_support::read_file(linked("a")), "new-a");
    EXPECT_EQ(test_support::read_file(linked("d/b")), "new-b");
}

TEST_F(linker_test, dangling_link_is_replaced) {
    test_support::write_file(built("x"), "x");
    fs::create_directories(m_cfg.link_dir);
    fs::create_symlink("nowhere", linked("x"));

    auto result = link();
    ASSERT_TRUE(result.ok()) << result.errors.report();
    EXPECT_EQ(test_support::read_file(linked("x")), "x");
}

TEST_F(linker_test, directory_in_the_way_fails_only_that_file) {
    test_support::write_file(built("blocked"), "b");
    test_support::write_file(built("free"), "f");
    fs::create_directories(linked("blocked"));

    auto result = link();
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.begin()->kind, error_kind::io);
    EXPECT_EQ(result.errors.begin()->location, linked("blocked"));
    EXPECT_TRUE(fs::is_directory(fs::symlink_status(linked("blocked"))));
    EXPECT_EQ(test_support::read_file(linked("free")), "f");
}

TEST_F(linker_test, link_tree_mirrors_build_tree_paths) {
    test_support::write_file(built("one"), "");
    test_support::write_file(built("two/three"), "");
    test_support::write_file(built("two/four/five"), "");

    auto result = link();
    ASSERT_TRUE(result.ok()) << result.errors.report();
    EXPECT_EQ(test_support::relative_paths(m_cfg.link_dir), test_support::relative_paths(m_cfg.build_dir));
}
