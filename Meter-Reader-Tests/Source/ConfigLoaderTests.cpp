#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "utils/ConfigLoader.hpp"

using nlohmann::json;

static bool parse(const char* text, AppConfig& cfg, std::string& err) {
    return ParseConfigStrict(cfg, err, json::parse(text));
}

TEST(ConfigLoader, MinimalConfigUsesDefaults) {
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(parse(R"({"serial": {"port": "auto"}})", cfg, err)) << err;

    EXPECT_EQ(cfg.serial.port, "auto");
    EXPECT_EQ(cfg.serial.timeoutMs, 400u);
    EXPECT_TRUE(cfg.protocol.deviceAddress.empty());
    EXPECT_FALSE(cfg.protocol.verifyBcc);
    EXPECT_EQ(cfg.protocol.blockIdleTimeoutMs, 0u);
    EXPECT_EQ(cfg.output, OutputFormat::Json);
    EXPECT_FALSE(cfg.api.enabled);
    EXPECT_EQ(cfg.api.host, "127.0.0.1");
    EXPECT_EQ(cfg.api.port, 8765);
    EXPECT_FALSE(cfg.verbose);
}

TEST(ConfigLoader, FullConfig) {
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(parse(R"({
        "serial":   { "port": "/dev/ttyUSB0", "timeoutMs": 800 },
        "protocol": { "deviceAddress": "12345678", "verifyBcc": true, "blockIdleTimeoutMs": 5000 },
        "output":   { "format": "TABLE" },
        "api":      { "enabled": true, "host": "0.0.0.0", "port": 9000, "cors": true },
        "log":      { "verbose": true }
    })", cfg, err)) << err;

    EXPECT_EQ(cfg.serial.port, "/dev/ttyUSB0");
    EXPECT_EQ(cfg.serial.timeoutMs, 800u);
    EXPECT_EQ(cfg.protocol.deviceAddress, "12345678");
    EXPECT_TRUE(cfg.protocol.verifyBcc);
    EXPECT_EQ(cfg.protocol.blockIdleTimeoutMs, 5000u);
    EXPECT_EQ(cfg.output, OutputFormat::Table);
    EXPECT_TRUE(cfg.api.enabled);
    EXPECT_EQ(cfg.api.port, 9000);
    EXPECT_TRUE(cfg.api.cors);
    EXPECT_TRUE(cfg.verbose);
}

TEST(ConfigLoader, RejectsInvalidValues) {
    const char* bad[] = {
        R"([])",
        R"({})",
        R"({"serial": {}})",
        R"({"serial": {"port": ""}})",
        R"({"serial": {"port": 3}})",
        R"({"serial": {"port": "auto", "timeoutMs": 0}})",
        R"({"serial": {"port": "auto", "timeoutMs": -5}})",
        R"({"serial": {"port": "auto"}, "protocol": {"deviceAddress": "12!34"}})",
        R"({"serial": {"port": "auto"}, "protocol": {"deviceAddress": "123456789012345678901234567890123"}})",
        R"({"serial": {"port": "auto"}, "protocol": {"verifyBcc": "yes"}})",
        R"({"serial": {"port": "auto"}, "output": {"format": "xml"}})",
        R"({"serial": {"port": "auto"}, "api": {"port": 70000}})",
        R"({"serial": {"port": "auto"}, "api": {"port": 0}})",
        R"({"serial": {"port": "auto"}, "log": true})",
        R"({"serial": {"port": "auto", "timeoutMs": 4294967296}})",
        R"({"serial": {"port": "auto"}, "protocol": {"blockIdleTimeoutMs": 18446744073709551615}})",
        R"({"serial": {"port": "auto"}, "api": {"port": 4294967297}})",
    };
    for (const char* text : bad) {
        AppConfig cfg;
        std::string err;
        EXPECT_FALSE(parse(text, cfg, err)) << text;
        EXPECT_FALSE(err.empty()) << text;
    }
}

TEST(ConfigLoader, LargestUnsignedIsAccepted) {
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(parse(R"({"serial": {"port": "auto", "timeoutMs": 4294967295}})", cfg, err)) << err;
    EXPECT_EQ(cfg.serial.timeoutMs, 4294967295u);
}

TEST(ConfigLoader, MissingFile) {
    AppConfig cfg;
    std::string err;
    EXPECT_FALSE(LoadConfigStrict(cfg, err, "/nonexistent/meter-reader.json"));
    EXPECT_NE(err.find("Impossibile aprire"), std::string::npos);
}

TEST(ConfigLoader, FileWithComments) {
    const auto path = std::filesystem::temp_directory_path() / "meter-reader-config-test.json";
    {
        std::ofstream f(path);
        f << "{ // commento\n \"serial\": { \"port\": \"auto\" } }\n";
    }

    AppConfig cfg;
    std::string err;
    EXPECT_FALSE(LoadConfigStrict(cfg, err, path.string()));
    EXPECT_NE(err.find("parsing JSON"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(ConfigLoader, LoadsFile) {
    const auto path = std::filesystem::temp_directory_path() / "meter-reader-config-ok.json";
    {
        std::ofstream f(path);
        f << R"({ "serial": { "port": "/dev/ttyACM0" }, "output": { "format": "json" } })";
    }

    AppConfig cfg;
    std::string err;
    EXPECT_TRUE(LoadConfigStrict(cfg, err, path.string())) << err;
    EXPECT_EQ(cfg.serial.port, "/dev/ttyACM0");
    std::filesystem::remove(path);
}
