#pragma once
#include <string>
#include <mutex>
#include <memory>
#include <atomic>
#include <vector>
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"
#include "utils/SerialService.hpp"
#include "Api/ApiServer.hpp"

// Codici di uscita del processo
enum ExitCode : int {
    kExitOk = 0,
    kExitConfig = 2,
    kExitNoPort = 3,
    kExitApi = 4,
    kExitTimeout = 5,
    kExitInvalidMessage = 6,
    kExitIo = 7
};

class MainApp {
public:
    explicit MainApp(std::string configPath = "config.json");
    int run();

    // ---- API ----
    bool readout(nlohmann::json& out, std::string& err);             // /readout
    nlohmann::json getSerialStatusJson();                            // /serial/status
    std::vector<std::string> listSerialPorts();                      // /serial/ports
    void requestShutdown();

    // Codice d'errore di SerialService -> codice di uscita
    static int ExitCodeFor(const std::string& err);

private:
    // ---- setup di base ----
    bool loadConfig();
    std::string resolvePort(std::string& err);
    ReadoutRequest makeRequest(const std::string& port) const;
    bool readoutOnce(Readout& r, std::string& port, std::string& err);

    int runOnce();
    int runApi();

    // ---- stato app ----
    std::string m_configPath;
    AppConfig   m_cfg;
    std::mutex  m_cfgMtx;

    std::atomic<bool> m_shouldExit{ false };

    SerialService m_serial;
    std::unique_ptr<ApiServer> m_api;
};
