#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include "../test_util.h"

#include <cstdlib>

using namespace Shardrun;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
        ::unsetenv("SHARDRUN_MAX_DOCKER_CONCURRENCY");
        ::unsetenv("SHARDRUN_NUM_PROCESSES");
    }

    void TearDown() override {
        ::unsetenv("SHARDRUN_MAX_DOCKER_CONCURRENCY");
        ::unsetenv("SHARDRUN_NUM_PROCESSES");
        Configuration::getInstance().reset();
    }

    Configuration& config() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    const ShardrunConfig& c = config().config();
    EXPECT_EQ(c.sandbox.max_concurrency.get(), 4);
    EXPECT_EQ(c.sandbox.expiry_s.get(), 7200);
    EXPECT_EQ(c.sandbox.start_settle_ms.get(), 5000);
    EXPECT_EQ(c.sandbox.remove_settle_ms.get(), 10000);
    EXPECT_FALSE(c.sandbox.remove_image.get());
    EXPECT_EQ(c.run.num_processes.get(), 8);
    EXPECT_EQ(c.run.num_candidate_solutions.get(), 8);
    EXPECT_EQ(c.agent.credential_env.get(), "ANTHROPIC_API_KEY");
    EXPECT_TRUE(config().validate());
}

TEST_F(ConfigurationTest, LoadFromString) {
    const char* yaml = R"(
shardrun:
  sandbox:
    max_concurrency: 2
    remove_image: true
    start_settle_ms: 0
  agent:
    command: "python my_agent.py"
    extra_env:
      AGENT_MODE: fast
  run:
    num_processes: 3
    num_candidate_solutions: 5
    evals_dir: /data/evals
)";
    ASSERT_TRUE(config().loadFromString(yaml));
    const ShardrunConfig& c = config().config();
    EXPECT_EQ(c.sandbox.max_concurrency.get(), 2);
    EXPECT_TRUE(c.sandbox.remove_image.get());
    EXPECT_EQ(c.sandbox.start_settle_ms.get(), 0);
    EXPECT_EQ(c.agent.command.get(), "python my_agent.py");
    ASSERT_EQ(c.agent.extra_env.count("AGENT_MODE"), 1u);
    EXPECT_EQ(c.agent.extra_env.at("AGENT_MODE"), "fast");
    EXPECT_EQ(c.run.num_processes.get(), 3);
    EXPECT_EQ(c.run.num_candidate_solutions.get(), 5);
    EXPECT_EQ(c.run.evals_dir.get(), "/data/evals");
    // Untouched keys keep their defaults
    EXPECT_EQ(c.sandbox.expiry_s.get(), 7200);
}

TEST_F(ConfigurationTest, LoadFromFile) {
    testing_util::TempDir dir;
    auto path = dir.path() / "shardrun.yaml";
    testing_util::WriteText(path, "shardrun:\n  evaluation:\n    enabled: false\n");

    ASSERT_TRUE(config().loadFromFile(path.string()));
    EXPECT_FALSE(config().config().evaluation.enabled.get());
}

TEST_F(ConfigurationTest, MissingFileFails) {
    EXPECT_FALSE(config().loadFromFile("/nonexistent/shardrun.yaml"));
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(config().loadFromString("shardrun: [unterminated"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFileValue) {
    ASSERT_TRUE(config().loadFromString("shardrun:\n  sandbox:\n    max_concurrency: 2\n"));
    ::setenv("SHARDRUN_MAX_DOCKER_CONCURRENCY", "7", 1);
    EXPECT_EQ(config().config().sandbox.max_concurrency.get(), 7);
}

TEST_F(ConfigurationTest, MalformedEnvironmentValueIsIgnored) {
    ::setenv("SHARDRUN_NUM_PROCESSES", "many", 1);
    EXPECT_EQ(config().config().run.num_processes.get(), 8);
}

TEST_F(ConfigurationTest, ValidationReportsEveryError) {
    config().config().run.num_processes.set(0);
    config().config().sandbox.max_concurrency.set(0);
    config().config().sandbox.testbed_path.set("testbed");

    EXPECT_FALSE(config().validate());
    auto errors = config().getValidationErrors();
    EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigurationTest, InvalidValuesInFileFailLoad) {
    EXPECT_FALSE(config().loadFromString("shardrun:\n  run:\n    num_candidate_solutions: 0\n"));
    EXPECT_FALSE(config().getValidationErrors().empty());
}
