#include <cstdlib>

#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/scoped_directory.hpp"
#include "config.hpp"

using namespace std;
using namespace passk;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (auto key : ENV_KEYS) unsetenv(key);
    }

    void TearDown() override {
        for (auto key : ENV_KEYS) unsetenv(key);
    }

    static constexpr const char *ENV_KEYS[] = {"PASSK_COMPILE_TIMEOUT", "PASSK_RUN_TIMEOUT", "PASSK_CXX",
                                               "PASSK_MAX_OUTPUT", "PASSK_NETWORK_ISOLATION", "PASSK_WORK_ROOT"};

    scoped_directory dir;
};

TEST_F(ConfigTest, Defaults) {
    execution_config config = load_execution_config(nullopt);
    EXPECT_EQ(config.compile_budget, 30);
    EXPECT_EQ(config.run_budget, 10);
    EXPECT_EQ(config.compiler, "g++");
    EXPECT_EQ(config.compile_flags, (vector<string>{"-std=c++17", "-O0"}));
    EXPECT_EQ(config.max_output_bytes, 1024u * 1024u);
    EXPECT_EQ(config.isolation, network_isolation::REQUIRED);
    EXPECT_TRUE(config.work_root.empty());
}

TEST_F(ConfigTest, ConfigurationFile) {
    write_file_content(dir.path() / "config.json", R"({
        "compileTimeLimit": 60,
        "runTimeLimit": 2.5,
        "compiler": "clang++",
        "compileFlags": ["-std=c++20"],
        "maxOutputSize": 4096,
        "networkIsolation": "best_effort",
        "workRoot": "/var/tmp/passk"
    })");
    execution_config config = load_execution_config(dir.path() / "config.json");
    EXPECT_EQ(config.compile_budget, 60);
    EXPECT_EQ(config.run_budget, 2.5);
    EXPECT_EQ(config.compiler, "clang++");
    EXPECT_EQ(config.compile_flags, vector<string>{"-std=c++20"});
    EXPECT_EQ(config.max_output_bytes, 4096u);
    EXPECT_EQ(config.isolation, network_isolation::BEST_EFFORT);
    EXPECT_EQ(config.work_root.string(), "/var/tmp/passk");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write_file_content(dir.path() / "config.json", R"({"compileTimeLimit": 60, "runTimeLimit": 20})");
    setenv("PASSK_RUN_TIMEOUT", "3", 1);
    setenv("PASSK_CXX", "g++-12", 1);
    setenv("PASSK_NETWORK_ISOLATION", "disabled", 1);

    execution_config config = load_execution_config(dir.path() / "config.json");
    EXPECT_EQ(config.compile_budget, 60);
    EXPECT_EQ(config.run_budget, 3);
    EXPECT_EQ(config.compiler, "g++-12");
    EXPECT_EQ(config.isolation, network_isolation::DISABLED);
}

TEST_F(ConfigTest, MalformedEnvironment) {
    setenv("PASSK_COMPILE_TIMEOUT", "soon", 1);
    EXPECT_THROW(load_execution_config(nullopt), passk_exception);
}

TEST_F(ConfigTest, NonPositiveBudget) {
    setenv("PASSK_RUN_TIMEOUT", "0", 1);
    EXPECT_THROW(load_execution_config(nullopt), passk_exception);

    execution_config config;
    config.compile_budget = -1;
    EXPECT_THROW(validate(config), passk_exception);
}

TEST_F(ConfigTest, BudgetUpperBound) {
    execution_config config;
    config.run_budget = 1e20;
    EXPECT_THROW(validate(config), passk_exception);

    config.run_budget = MAX_BUDGET_SECONDS;
    EXPECT_NO_THROW(validate(config));

    setenv("PASSK_COMPILE_TIMEOUT", "1e20", 1);
    EXPECT_THROW(load_execution_config(nullopt), passk_exception);
}

TEST_F(ConfigTest, UnknownIsolationMode) {
    EXPECT_THROW(parse_network_isolation("sometimes"), passk_exception);
    EXPECT_EQ(parse_network_isolation("required"), network_isolation::REQUIRED);
    EXPECT_STREQ(isolation_name(network_isolation::BEST_EFFORT), "best_effort");
}

TEST_F(ConfigTest, MissingOrMalformedFile) {
    EXPECT_THROW(load_execution_config(dir.path() / "missing.json"), passk_exception);

    write_file_content(dir.path() / "broken.json", "{\"compileTimeLimit\": ");
    EXPECT_THROW(load_execution_config(dir.path() / "broken.json"), passk_exception);

    write_file_content(dir.path() / "wrong_type.json", R"({"compileTimeLimit": "long"})");
    EXPECT_THROW(load_execution_config(dir.path() / "wrong_type.json"), passk_exception);
}
