#include <gtest/gtest.h>

#include <optional>
#include <string>

#include <envconst/read_envvar.hpp>

#include "common.hpp"

using namespace envconst;

TEST(read_envvar, snapshot) {
    environment env = {
        {"ENVCONST_A", "12"},
        {"ENVCONST_B", ""},
        {"ENVCONST_C", " 7 "}
    };

    EXPECT_EQ(3u, env.size());
    EXPECT_EQ("12", read_env(env, "ENVCONST_A"));
    EXPECT_FALSE(read_env(env, "ENVCONST_D"));

    // Empty values read as unset.
    EXPECT_FALSE(read_env(env, "ENVCONST_B"));
    EXPECT_EQ("", env.lookup("ENVCONST_B"));

    // No trimming.
    EXPECT_EQ(" 7 ", read_env(env, "ENVCONST_C"));
}

TEST(read_envvar, empty_environment) {
    environment env;
    EXPECT_EQ(0u, env.size());
    EXPECT_FALSE(env.lookup("PATH"));
    EXPECT_FALSE(read_env(env, "PATH"));
}

TEST(read_envvar, process) {
    // Compare the snapshot against getenv for a variable the test
    // harness is very likely to define.
    auto env = environment::from_process();
    for (const char* name: {"PATH", "HOME", "ENVCONST_SURELY_NOT_DEFINED"}) {
        EXPECT_EQ(read_env(name), read_env(env, name)) << name;
    }
}
