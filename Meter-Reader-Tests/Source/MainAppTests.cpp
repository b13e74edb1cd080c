#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "utils/MainApp.hpp"

namespace fs = std::filesystem;

class MainAppConfigTest : public ::testing::Test {
protected:
    std::string writeConfig(const std::string& name, const std::string& text) {
        const fs::path path = fs::temp_directory_path() / name;
        std::ofstream f(path);
        f << text;
        m_files.push_back(path);
        return path.string();
    }

    void TearDown() override {
        std::error_code ec;
        for (const auto& p : m_files) fs::remove(p, ec);
    }

private:
    std::vector<fs::path> m_files;
};

TEST(MainApp, ExitCodeForReadoutErrors) {
    EXPECT_EQ(MainApp::ExitCodeFor(""), kExitOk);
    EXPECT_EQ(MainApp::ExitCodeFor("no_port"), kExitNoPort);
    EXPECT_EQ(MainApp::ExitCodeFor("timeout"), kExitTimeout);
    EXPECT_EQ(MainApp::ExitCodeFor("invalid_message"), kExitInvalidMessage);
    EXPECT_EQ(MainApp::ExitCodeFor("open_failed"), kExitIo);
    EXPECT_EQ(MainApp::ExitCodeFor("io_error"), kExitIo);
    EXPECT_EQ(MainApp::ExitCodeFor("busy"), kExitIo);
}

TEST_F(MainAppConfigTest, MissingConfigExitsWithConfigCode) {
    MainApp app("/nonexistent/meter-reader.json");
    EXPECT_EQ(app.run(), kExitConfig);
}

TEST_F(MainAppConfigTest, InvalidConfigExitsWithConfigCode) {
    MainApp app(writeConfig("meter-reader-app-bad.json", R"({"serial": {"port": ""}})"));
    EXPECT_EQ(app.run(), kExitConfig);
}

TEST_F(MainAppConfigTest, MissingPortExitsWithIoCode) {
    MainApp app(writeConfig("meter-reader-app-noport.json",
        R"({"serial": {"port": "/nonexistent/ttyUSB9", "timeoutMs": 100}})"));
    EXPECT_EQ(app.run(), kExitIo);

    nlohmann::json out;
    std::string err;
    EXPECT_FALSE(app.readout(out, err));
    EXPECT_EQ(err, "open_failed");

    const nlohmann::json status = app.getSerialStatusJson();
    EXPECT_EQ(status.at("configuredPort"), "/nonexistent/ttyUSB9");
    EXPECT_EQ(status.at("lastError"), "open_failed");
    EXPECT_FALSE(status.at("busy").get<bool>());
}

TEST_F(MainAppConfigTest, ApiBindFailureExitsWithApiCode) {
    MainApp app(writeConfig("meter-reader-app-api.json", R"({
        "serial": {"port": "/nonexistent/ttyUSB9"},
        "api": {"enabled": true, "host": "256.256.256.256", "port": 8765}
    })"));
    EXPECT_EQ(app.run(), kExitApi);
}
