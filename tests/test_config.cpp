#include <gtest/gtest.h>
#include "../common/Config.hpp"

#include <cstdio>
#include <fstream>

namespace net_survey::common {

namespace {

EngineConfig Load(std::vector<const char *> args) {
    args.insert(args.begin(), "net_survey_server");
    return LoadConfig(static_cast<int>(args.size()), args.data());
}

}

TEST(ConfigTest, DefaultsApplyWithoutArguments) {
    EngineConfig config = Load({});
    EXPECT_EQ(config.port, 9443);
    EXPECT_EQ(config.hard_cap, 4096u);
    EXPECT_EQ(config.max_hosts, 254u);
    EXPECT_EQ(config.concurrency, 80u);
    EXPECT_EQ(config.batch_size, 40u);
    EXPECT_EQ(config.snmp_version, "2c");
    EXPECT_EQ(config.walk_max_depth, 3);
    EXPECT_EQ(config.walk_max_switches, 50);
    EXPECT_FALSE(config.allow_public);
    EXPECT_EQ(config.ports.size(), 20u);
    EXPECT_FALSE(config.show_help);
    EXPECT_NE(config.usage.find("--max-hosts"), std::string::npos);
}

TEST(ConfigTest, CommandLineOverrides) {
    EngineConfig config = Load({"--port", "7000", "--max-hosts", "512", "--allow-public", "--ports", "22", "443",
                                "--snmp-version", "1", "--walk-max-depth", "0"});
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.max_hosts, 512u);
    EXPECT_TRUE(config.allow_public);
    EXPECT_EQ(config.ports, (std::vector<uint16_t>{22, 443}));
    EXPECT_EQ(config.snmp_version, "1");
    EXPECT_EQ(config.walk_max_depth, 0);
}

TEST(ConfigTest, HelpIsReported) {
    EXPECT_TRUE(Load({"--help"}).show_help);
}

TEST(ConfigTest, ConfigFileFillsUnsetOptions) {
    const std::string path = ::testing::TempDir() + "net_survey_test.conf";
    {
        std::ofstream out(path);
        out << "port = 7100\n"
            << "snmp-community = lab\n"
            << "max-hosts = 100\n";
    }

    EngineConfig config = Load({"--config", path.c_str(), "--max-hosts", "200"});
    EXPECT_EQ(config.port, 7100);
    EXPECT_EQ(config.snmp_community, "lab");
    EXPECT_EQ(config.max_hosts, 200u);
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingConfigFileIsAnError) {
    EXPECT_THROW(Load({"--config", "/nonexistent/net_survey.conf"}), ConfigError);
}

TEST(ConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(Load({"--port", "70000"}), ConfigError);
    EXPECT_THROW(Load({"--port", "abc"}), ConfigError);
    EXPECT_THROW(Load({"--concurrency", "0"}), ConfigError);
    EXPECT_THROW(Load({"--ports", "0"}), ConfigError);
    EXPECT_THROW(Load({"--snmp-version", "3"}), ConfigError);
    EXPECT_THROW(Load({"--max-hosts", "5000"}), ConfigError);
    EXPECT_THROW(Load({"--no-such-option"}), ConfigError);
}

TEST(ValidateConfigTest, CatchesInconsistentSettings) {
    EngineConfig config = Load({});
    EXPECT_NO_THROW(ValidateConfig(config));

    EngineConfig bad = config;
    bad.probe_timeout_ms = 0;
    EXPECT_THROW(ValidateConfig(bad), ConfigError);

    bad = config;
    bad.snmp_retries = -1;
    EXPECT_THROW(ValidateConfig(bad), ConfigError);

    bad = config;
    bad.walk_max_switches = 0;
    EXPECT_THROW(ValidateConfig(bad), ConfigError);

    bad = config;
    bad.ports.clear();
    EXPECT_THROW(ValidateConfig(bad), ConfigError);
}

}
