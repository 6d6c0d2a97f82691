#include "application/config/ConfigManager.hpp"

#include <boost/program_options/errors.hpp>
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using core::config::ConfigManager;

class ConfigManagerTest : public ::testing::Test {
protected:
    ConfigManager &config = ConfigManager::getInstance();
    std::string configPath = ::testing::TempDir() + "config_manager_test.json";

    void SetUp() override {
        clearEnv();
        config.loadDefaults();
    }

    void TearDown() override {
        clearEnv();
        std::remove(configPath.c_str());
    }

    static void clearEnv() {
        for (const char *name: {"PRINTER_BLUETOOTH", "PRINTER_SERIAL", "PRINTER_MODEL", "PRINT_PORT", "PRINT_HOST",
                                "PRINT_TIMEOUT_MS", "PRINT_FONT", "PRINT_MODELS"}) {
            unsetenv(name);
        }
    }

    void writeConfig(const std::string &content) {
        std::ofstream out(configPath);
        out << content;
    }

    core::config::CommandLine parse(std::vector<const char *> args) {
        args.insert(args.begin(), "print_server");
        return ConfigManager::parseCommandLine(static_cast<int>(args.size()), args.data());
    }
};

TEST_F(ConfigManagerTest, DefaultsMatchDocumentedValues) {
    auto server = config.getServerConfig();
    EXPECT_EQ(server.host, "0.0.0.0");
    EXPECT_EQ(server.port, 8080);
    EXPECT_EQ(server.maxBodyBytes, 10240);

    auto print = config.getPrintConfig();
    EXPECT_EQ(print.timeoutMs, 60000);
    EXPECT_EQ(print.scanTimeoutMs, 5000);
    EXPECT_FALSE(print.strictAddress);
    EXPECT_EQ(print.serialBaudrate, 115200);

    auto encoder = config.getEncoderConfig();
    EXPECT_EQ(encoder.energy, 12000);
    EXPECT_EQ(encoder.speed, 10);
    EXPECT_EQ(encoder.feedLines, 80);
}

TEST_F(ConfigManagerTest, FileIsFlattenedToDottedKeys) {
    writeConfig(R"({"server": {"port": 9100}, "ble": {"strict": {"address": true}}, "font": {"path": "/f.ttf"}})");

    config.loadFromFile(configPath);

    EXPECT_EQ(config.getServerConfig().port, 9100);
    EXPECT_TRUE(config.getPrintConfig().strictAddress);
    EXPECT_EQ(config.getPrintConfig().fontPath, "/f.ttf");
    EXPECT_EQ(config.getServerConfig().host, "0.0.0.0");
}

TEST_F(ConfigManagerTest, MissingFileKeepsDefaults) {
    config.loadFromFile(configPath + ".missing");
    EXPECT_EQ(config.getServerConfig().port, 8080);
}

TEST_F(ConfigManagerTest, PrecedenceIsDefaultsFileEnvCommandLine) {
    writeConfig(R"({"server": {"port": 9000, "host": "127.0.0.1"}, "print": {"timeout": {"ms": 1000}}})");
    setenv("PRINT_PORT", "9001", 1);
    setenv("PRINTER_BLUETOOTH", "TiMini", 1);

    auto commandLine = parse({"--config", configPath.c_str(), "--port", "9002"});
    config.load(commandLine);

    EXPECT_EQ(config.getServerConfig().port, 9002);
    EXPECT_EQ(config.getServerConfig().host, "127.0.0.1");
    EXPECT_EQ(config.getPrintConfig().timeoutMs, 1000);
    EXPECT_EQ(config.get<std::string>("printer.bluetooth", ""), "TiMini");
}

TEST_F(ConfigManagerTest, CommandLineOptions) {
    auto commandLine = parse({"--serial", "/dev/rfcomm0", "--model", "X6", "--host", "127.0.0.1"});

    EXPECT_FALSE(commandLine.helpRequested);
    EXPECT_EQ(commandLine.configPath, "config.json");
    EXPECT_EQ(commandLine.overrides.at("printer.serial"), "/dev/rfcomm0");
    EXPECT_EQ(commandLine.overrides.at("printer.model"), "X6");
    EXPECT_EQ(commandLine.overrides.at("server.host"), "127.0.0.1");

    EXPECT_TRUE(parse({"--help"}).helpRequested);
    EXPECT_THROW(parse({"--colour", "red"}), boost::program_options::error);
    EXPECT_THROW(parse({"--port", "eighty"}), boost::program_options::error);
}

TEST_F(ConfigManagerTest, ValidationNeedsExactlyOneTarget) {
    EXPECT_FALSE(config.validate().isValid);

    config.set("printer.bluetooth", "TiMini");
    EXPECT_TRUE(config.validate().isValid);

    config.set("printer.serial", "/dev/rfcomm0");
    auto result = config.validate();
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("mutually exclusive"), std::string::npos);
}

TEST_F(ConfigManagerTest, ValidationChecksRanges) {
    config.set("printer.bluetooth", "TiMini");
    config.set("server.port", "70000");
    config.set("print.timeout.ms", "0");

    auto result = config.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST_F(ConfigManagerTest, LogRotationLimitsComeFromFile) {
    writeConfig(R"({"log": {"folder": "/var/log/print", "max": {"file": {"mb": 5}, "files": 3}}})");
    config.loadFromFile(configPath);

    auto log = config.getLogConfig();
    EXPECT_EQ(log.folder, "/var/log/print");
    EXPECT_EQ(log.maxFileMb, 5);
    EXPECT_EQ(log.maxFiles, 3);
    EXPECT_EQ(log.retentionDays, 7);
    EXPECT_FALSE(log.debug);
}

TEST_F(ConfigManagerTest, ValidationRejectsZeroLogRetention) {
    config.set("printer.serial", "/dev/ttyUSB0");
    config.set("log.retention.days", "0");

    auto result = config.validate();
    ASSERT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("log.retention.days"), std::string::npos);
}

TEST_F(ConfigManagerTest, BuildsBleTargetWithOptionalModel) {
    config.set("printer.bluetooth", "AA:BB:CC:DD:EE:FF");

    auto target = config.buildTargetSpec();
    EXPECT_EQ(target.kind, core::device::TransportKind::BLE);
    EXPECT_TRUE(target.isHardwareAddress());
    EXPECT_FALSE(target.modelOverride.has_value());
}

TEST_F(ConfigManagerTest, BuildsSerialTarget) {
    config.set("printer.serial", "/dev/rfcomm0");
    config.set("printer.model", "X6");

    auto target = config.buildTargetSpec();
    EXPECT_EQ(target.kind, core::device::TransportKind::SERIAL);
    EXPECT_EQ(target.addressOrPath, "/dev/rfcomm0");
    EXPECT_EQ(target.modelOverride.value_or(""), "X6");
}

TEST_F(ConfigManagerTest, TargetRequiresASelection) {
    EXPECT_THROW(config.buildTargetSpec(), std::invalid_argument);
}
