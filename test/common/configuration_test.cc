#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace Shepherd;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("SHEPHERD_STORE_ENDPOINT");
        unsetenv("SHEPHERD_LEADER_LEASE_TTL");
        Configuration::getInstance().reset();
    }

    Configuration& config_ = Configuration::getInstance();
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    EXPECT_TRUE(config_.validate());
    EXPECT_EQ(config_.config().store.endpoint.get(), "127.0.0.1:2379");
    EXPECT_EQ(config_.config().store.key_root.get(), "v1");
    EXPECT_EQ(config_.config().leader.lease_ttl_s.get(), 10);
    EXPECT_EQ(config_.config().leader.selection_policy.get(), "random");
}

TEST_F(ConfigurationTest, LoadsYamlSections) {
    const char* yaml = R"(
shepherd:
  store:
    endpoint: "etcd-0:2379"
    rpc_timeout_ms: 250
    key_root: "staging"
  leader:
    lease_ttl_s: 3
    barrier_lease_ttl_s: 30
    selection_policy: "lowest"
)";
    ASSERT_TRUE(config_.loadFromString(yaml));
    EXPECT_EQ(config_.config().store.endpoint.get(), "etcd-0:2379");
    EXPECT_EQ(config_.config().store.rpc_timeout_ms.get(), 250);
    EXPECT_EQ(config_.config().store.connect_timeout_ms.get(), 5000);
    EXPECT_EQ(config_.config().store.key_root.get(), "staging");
    EXPECT_EQ(config_.config().leader.lease_ttl_s.get(), 3);
    EXPECT_EQ(config_.config().leader.barrier_lease_ttl_s.get(), 30);
    EXPECT_EQ(config_.config().leader.marker_lease_ttl_s.get(), 10);
    EXPECT_EQ(config_.config().leader.selection_policy.get(), "lowest");
}

TEST_F(ConfigurationTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "shepherd_config_test.yaml";
    {
        std::ofstream out(path);
        out << "shepherd:\n  leader:\n    marker_lease_ttl_s: 7\n";
    }
    ASSERT_TRUE(config_.loadFromFile(path));
    EXPECT_EQ(config_.config().leader.marker_lease_ttl_s.get(), 7);
    std::remove(path.c_str());

    EXPECT_FALSE(config_.loadFromFile(path));
}

TEST_F(ConfigurationTest, EnvironmentOverridesYaml) {
    ASSERT_TRUE(config_.loadFromString("shepherd:\n  store:\n    endpoint: \"from-yaml:2379\"\n"));
    setenv("SHEPHERD_STORE_ENDPOINT", "from-env:2379", 1);
    setenv("SHEPHERD_LEADER_LEASE_TTL", "42", 1);
    EXPECT_EQ(config_.config().store.endpoint.get(), "from-env:2379");
    EXPECT_EQ(config_.config().leader.lease_ttl_s.get(), 42);

    // Unparsable numbers fall back to the configured value.
    setenv("SHEPHERD_LEADER_LEASE_TTL", "soon", 1);
    EXPECT_EQ(config_.config().leader.lease_ttl_s.get(), 10);
}

TEST_F(ConfigurationTest, RejectsInvalidValues) {
    const char* yaml = R"(
shepherd:
  store:
    key_root: "v1/"
  leader:
    barrier_lease_ttl_s: 0
    selection_policy: "round-robin"
)";
    EXPECT_FALSE(config_.loadFromString(yaml));
    auto errors = config_.getValidationErrors();
    EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(config_.loadFromString("shepherd: [unterminated"));
}
