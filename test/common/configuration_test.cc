#include <gtest/gtest.h>
#include "../../src/common/configuration.h"

#include <cstdlib>
#include <string>

using namespace Sluice;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("SLUICE_WORKERS");
        unsetenv("SLUICE_EXCHANGE_CHANNEL");
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("SLUICE_WORKERS");
        unsetenv("SLUICE_EXCHANGE_CHANNEL");
        Configuration::getInstance().reset();
    }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    Configuration& config = Configuration::getInstance();
    EXPECT_EQ(config.getWorkers(), 4);
    EXPECT_EQ(config.getAwaitTimeoutMs(), 10);
    EXPECT_EQ(config.config().exchange.rounds.get(), 1000);
    EXPECT_EQ(config.config().exchange.channel_id.get(), 0u);
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigurationTest, LoadFromStringOverridesDefaults) {
    Configuration& config = Configuration::getInstance();
    const std::string yaml = R"(
sluice:
  runtime:
    workers: 6
    await_timeout_ms: 25
  exchange:
    rounds: 12
    channel_id: 9
)";
    ASSERT_TRUE(config.loadFromString(yaml));
    EXPECT_EQ(config.getWorkers(), 6);
    EXPECT_EQ(config.getAwaitTimeoutMs(), 25);
    EXPECT_EQ(config.config().exchange.rounds.get(), 12);
    EXPECT_EQ(config.config().exchange.channel_id.get(), 9u);
}

TEST_F(ConfigurationTest, PartialSectionKeepsOtherDefaults) {
    Configuration& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString("sluice:\n  exchange:\n    rounds: 3\n"));
    EXPECT_EQ(config.getWorkers(), 4);
    EXPECT_EQ(config.config().exchange.rounds.get(), 3);
}

TEST_F(ConfigurationTest, MissingRootSectionKeepsDefaults) {
    Configuration& config = Configuration::getInstance();
    EXPECT_TRUE(config.loadFromString("other:\n  workers: 2\n"));
    EXPECT_EQ(config.getWorkers(), 4);
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    Configuration& config = Configuration::getInstance();
    EXPECT_FALSE(config.loadFromString("sluice: [unclosed"));
    EXPECT_FALSE(config.loadFromString("sluice:\n  runtime:\n    workers: many\n"));
}

TEST_F(ConfigurationTest, ZeroWorkersFailsValidation) {
    Configuration& config = Configuration::getInstance();
    EXPECT_FALSE(config.loadFromString("sluice:\n  runtime:\n    workers: 0\n    await_timeout_ms: -1\n"));
    auto errors = config.getValidationErrors();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_NE(errors[0].find("Workers"), std::string::npos);
    EXPECT_NE(errors[1].find("timeout"), std::string::npos);
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    Configuration& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString("sluice:\n  runtime:\n    workers: 2\n"));
    EXPECT_EQ(config.getWorkers(), 2);

    setenv("SLUICE_WORKERS", "7", 1);
    EXPECT_EQ(config.getWorkers(), 7);

    // Unparseable values fall back to the configured one.
    setenv("SLUICE_WORKERS", "seven", 1);
    EXPECT_EQ(config.getWorkers(), 2);
}

TEST_F(ConfigurationTest, MissingFileIsRejected) {
    EXPECT_FALSE(Configuration::getInstance().loadFromFile("/nonexistent/sluice.yaml"));
}

TEST_F(ConfigurationTest, ChannelIdFromEnvironment) {
    Configuration& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString("sluice:\n  exchange:\n    channel_id: 3\n"));
    setenv("SLUICE_EXCHANGE_CHANNEL", "11", 1);
    EXPECT_EQ(config.config().exchange.channel_id.get(), 11u);
}

TEST_F(ConfigurationTest, ExplicitSetIsShadowedByEnvironment) {
    ConfigValue<int>& workers = Configuration::getInstance().config().runtime.workers;
    workers.set(8);
    EXPECT_FALSE(workers.overriddenByEnv());
    EXPECT_EQ(workers.get(), 8);

    setenv("SLUICE_WORKERS", "3", 1);
    EXPECT_TRUE(workers.overriddenByEnv());
    EXPECT_EQ(workers.get(), 3);

    // An unparseable value does not shadow anything.
    setenv("SLUICE_WORKERS", "three", 1);
    EXPECT_FALSE(workers.overriddenByEnv());
    EXPECT_EQ(workers.get(), 8);

    ConfigValue<int> no_env(5);
    EXPECT_FALSE(no_env.overriddenByEnv());
}
