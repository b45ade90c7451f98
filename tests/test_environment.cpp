#include "environment.hpp"
#include "error.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cctype>
#include <cstdlib>

using dotsmith::env;
using dotsmith::error_kind;
using dotsmith::value;

namespace {

dotsmith::host_info sample_host() {
    return {"box", "alice", "linux"};
}

dotsmith::config config_with(const std::filesystem::path& variables,
                             std::vector<std::string> flags = {}) {
    dotsmith::config cfg;
    cfg.variables_path = variables;
    cfg.flags = std::move(flags);
    return cfg;
}

} // namespace

TEST(environment, host_values_are_bound) {
    test_support::scratch_dir dir;
    auto bindings = dotsmith::build_environment(config_with(dir / "absent.yaml"), sample_host(),
                                                test_support::make_log());

    EXPECT_EQ(bindings.at("hostname"), value(std::string("box")));
    EXPECT_EQ(bindings.at("username"), value(std::string("alice")));
    EXPECT_EQ(bindings.at("os"), value(std::string("linux")));
    EXPECT_EQ(bindings.size(), 3u);
}

TEST(environment, flag_overrides_file_value) {
    test_support::scratch_dir dir;
    test_support::write_file(dir / "variables.yaml", "k: false\n");

    auto bindings = dotsmith::build_environment(config_with(dir / "variables.yaml", {"k"}),
                                                sample_host(), test_support::make_log());
    EXPECT_EQ(bindings.at("k"), value(true));
}

TEST(environment, file_overrides_host_and_flag_overrides_both) {
    test_support::scratch_dir dir;
    test_support::write_file(dir / "variables.yaml", "hostname: desk\nos: plan9\n");

    auto bindings = dotsmith::build_environment(config_with(dir / "variables.yaml", {"os"}),
                                                sample_host(), test_support::make_log());
    EXPECT_EQ(bindings.at("hostname"), value(std::string("desk")));
    EXPECT_EQ(bindings.at("os"), value(true));
}

TEST(environment, variables_file_strings_and_booleans) {
    test_support::scratch_dir dir;
    test_support::write_file(dir / "variables.yaml",
        "editor: vim\n"
        "quoted_bool: \"true\"\n"
        "dark: true\n"
        "work: false\n"
        "greeting: 'hello world'\n");

    env bindings;
    dotsmith::load_variables_file(dir / "variables.yaml", bindings, test_support::make_log());

    EXPECT_EQ(bindings.at("editor"), value(std::string("vim")));
    EXPECT_EQ(bindings.at("quoted_bool"), value(std::string("true")));
    EXPECT_EQ(bindings.at("dark"), value(true));
    EXPECT_EQ(bindings.at("work"), value(false));
    EXPECT_EQ(bindings.at("greeting"), value(std::string("hello world")));
}

TEST(environment, yaml11_boolean_spellings_stay_strings) {
    test_support::scratch_dir dir;
    test_support::write_file(dir / "variables.yaml",
        "a: yes\n"
        "b: on\n"
        "c: no\n"
        "d: True\n"
        "e: !!bool true\n");

    env bindings;
    dotsmith::load_variables_file(dir / "variables.yaml", bindings, test_support::make_log());

    EXPECT_EQ(bindings.at("a"), value(std::string("yes")));
    EXPECT_EQ(bindings.at("b"), value(std::string("on")));
    EXPECT_EQ(bindings.at("c"), value(std::string("no")));
    EXPECT_EQ(bindings.at("d"), value(std::string("True")));
    EXPECT_EQ(bindings.at("e"), value(true));
}

TEST(environment, leftover_toml_variables_file_is_reported) {
    test_support::scratch_dir dir;
    test_support::write_file(dir / "variables.toml", "editor = \"vim\"\n");

    env bindings;
    try {
        dotsmith::load_variables_file(dir / "variables.yaml", bindings, test_support::make_log());
        FAIL() << "expected the TOML file to be reported";
    } catch (const dotsmith::located_exception& e) {
        EXPECT_EQ(e.error().kind, error_kind::variables_parse);
        EXPECT_EQ(e.error().location, dir / "variables.toml");
    }
    EXPECT_TRUE(bindings.empty());
}

TEST(environment, yaml_file_wins_over_leftover_toml_file) {
    test_support::scratch_dir dir;
    test_support::write_file(dir / "variables.toml", "editor = \"vim\"\n");
    test_support::write_file(dir / "variables.yaml", "editor: nano\n");

    env bindings;
    dotsmith::load_variables_file(dir / "variables.yaml", bindings, test_support::make_log());
    EXPECT_EQ(bindings.at("editor"), value(std::string("nano")));
}

TEST(environment, missing_variables_file_is_skipped) {
    test_support::scratch_dir dir;
    env bindings;
    EXPECT_NO_THROW(dotsmith::load_variables_file(dir / "nope.yaml", bindings, test_support::make_log()));
    EXPECT_TRUE(bindings.empty());
}

TEST(environment, empty_variables_file_adds_nothing) {
    test_support::scratch_dir dir;
    test_support::write_file(dir / "variables.yaml", "");
    env bindings;
    dotsmith::load_variables_file(dir / "variables.yaml", bindings, test_support::make_log());
    EXPECT_TRUE(bindings.empty());
}

TEST(environment, unsupported_types_are_located_errors) {
    test_support::scratch_dir dir;
    const auto path = dir / "variables.yaml";

    for (const char* doc : {"n: 42\n", "f: 1.5\n", "l: [a, b]\n", "m: {a: b}\n", "z: ~\n"}) {
        test_support::write_file(path, doc);
        env bindings;
        try {
            dotsmith::load_variables_file(path, bindings, test_support::make_log());
            FAIL() << "expected a type error for: " << doc;
        } catch (const dotsmith::located_exception& e) {
            EXPECT_EQ(e.error().kind, error_kind::variable_type) << doc;
            EXPECT_EQ(e.error().location, path);
        }
    }
}

TEST(environment, malformed_variables_file_is_parse_error) {
    test_support::scratch_dir dir;
    const auto path = dir / "variables.yaml";

    for (const char* doc : {"key: [unclosed\n", "- just\n- a list\n"}) {
        test_support::write_file(path, doc);
        env bindings;
        try {
            dotsmith::load_variables_file(path, bindings, test_support::make_log());
            FAIL() << "expected a parse error for: " << doc;
        } catch (const dotsmith::located_exception& e) {
            EXPECT_EQ(e.error().kind, error_kind::variables_parse) << doc;
            EXPECT_EQ(e.error().location, path);
        }
    }
}

TEST(environment, build_environment_propagates_type_error) {
    test_support::scratch_dir dir;
    test_support::write_file(dir / "variables.yaml", "n: 3\n");

    EXPECT_THROW(dotsmith::build_environment(config_with(dir / "variables.yaml"), sample_host(),
                                             test_support::make_log()),
                 dotsmith::located_exception);
}

TEST(host_probe, username_prefers_user_then_username) {
    const char* saved_user = std::getenv("USER");
    const char* saved_username = std::getenv("USERNAME");
    std::string user = saved_user ? saved_user : "";
    std::string username = saved_username ? saved_username : "";

    ::setenv("USER", "first", 1);
    ::setenv("USERNAME", "second", 1);
    EXPECT_EQ(dotsmith::probe_username(), "first");

    ::setenv("USER", "", 1);
    EXPECT_EQ(dotsmith::probe_username(), "second");

    ::unsetenv("USER");
    ::unsetenv("USERNAME");
    EXPECT_EQ(dotsmith::probe_username(), "");

    if (saved_user) ::setenv("USER", user.c_str(), 1);
    if (saved_username) ::setenv("USERNAME", username.c_str(), 1);
}

TEST(host_probe, run_command_reports_output_and_failure) {
    auto out = dotsmith::run_command("echo hello");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "hello\n");

    EXPECT_FALSE(dotsmith::run_command("exit 3").has_value());
    EXPECT_FALSE(dotsmith::run_command("dotsmith-command-that-does-not-exist").has_value());
}

TEST(host_probe, operating_system_is_lowercase_and_trimmed) {
    auto os = dotsmith::probe_operating_system(test_support::make_log());
    EXPECT_FALSE(os.empty());
    for (char c : os) {
        EXPECT_FALSE(std::isupper(static_cast<unsigned char>(c)));
        EXPECT_FALSE(std::isspace(static_cast<unsigned char>(c)));
    }
}
