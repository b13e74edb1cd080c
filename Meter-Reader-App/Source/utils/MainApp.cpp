#include "utils/MainApp.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/ReadoutJson.hpp"
#include "utils/Utils.hpp"
#include "Api/ApiWiring.hpp"
#include "Core/Serial/SerialPortEnumerator.hpp"
#include "Core/Log.hpp"

#include <fmt/core.h>
#include <chrono>
#include <thread>

using Json = nlohmann::json;

// -----------------------------------------------------------------------------
// Costruzione
// -----------------------------------------------------------------------------
MainApp::MainApp(std::string configPath)
    : m_configPath(std::move(configPath)) {
}

// -----------------------------------------------------------------------------
// Config + porta
// -----------------------------------------------------------------------------
bool MainApp::loadConfig() {
    std::string cfgErr;
    AppConfig cfg;
    if (!LoadConfigStrict(cfg, cfgErr, m_configPath)) {
        LOGF("ERRORE CONFIG: {}", cfgErr);
        return false;
    }
    std::lock_guard<std::mutex> lock(m_cfgMtx);
    m_cfg = cfg;
    SetLogVerbose(m_cfg.verbose);
    return true;
}

std::vector<std::string> MainApp::listSerialPorts() {
    return ListSerialPorts();
}

std::string MainApp::resolvePort(std::string& err) {
    std::string port;
    {
        std::lock_guard<std::mutex> lock(m_cfgMtx);
        port = m_cfg.serial.port;
    }
    if (port != "auto") return port;

    auto ports = ListSerialPorts();
    if (ports.empty()) {
        err = "no_port";
        return {};
    }
    // euristica semplice: usa l'ultima (spesso la testa ottica appena collegata)
    LOGD("[SER] porta automatica: {}", ports.back());
    return ports.back();
}

ReadoutRequest MainApp::makeRequest(const std::string& port) const {
    ReadoutRequest req;
    req.port = port;
    req.timeoutMs = m_cfg.serial.timeoutMs;
    req.session.deviceAddress = m_cfg.protocol.deviceAddress;
    req.session.verifyBcc = m_cfg.protocol.verifyBcc;
    if (m_cfg.protocol.blockIdleTimeoutMs > 0) {
        req.session.blockIdleTimeout = std::chrono::milliseconds(m_cfg.protocol.blockIdleTimeoutMs);
    }
    return req;
}

int MainApp::ExitCodeFor(const std::string& err) {
    if (err.empty()) return kExitOk;
    if (err == "no_port") return kExitNoPort;
    if (err == "timeout") return kExitTimeout;
    if (err == "invalid_message") return kExitInvalidMessage;
    return kExitIo; // open_failed, io_error, busy
}

// -----------------------------------------------------------------------------
// Thin wrappers per ApiWiring (REST)
// -----------------------------------------------------------------------------
bool MainApp::readoutOnce(Readout& r, std::string& port, std::string& err) {
    port = resolvePort(err);
    if (port.empty()) return false;

    ReadoutRequest req;
    {
        std::lock_guard<std::mutex> lock(m_cfgMtx);
        req = makeRequest(port);
    }
    return m_serial.readout(req, r, &err);
}

bool MainApp::readout(Json& out, std::string& err) {
    Readout r;
    std::string port;
    if (!readoutOnce(r, port, err)) return false;

    out = r;
    out["port"] = port;
    out["timestamp"] = NowIsoUtc();
    return true;
}

Json MainApp::getSerialStatusJson() {
    Json out = m_serial.statusJson();
    std::lock_guard<std::mutex> lock(m_cfgMtx);
    out["configuredPort"] = m_cfg.serial.port;
    return out;
}

void MainApp::requestShutdown() {
    // segnale di uscita (consumato nel loop di runApi)
    m_shouldExit.store(true, std::memory_order_relaxed);
}

// -----------------------------------------------------------------------------
// run() — ciclo di vita principale dell'app
// -----------------------------------------------------------------------------
int MainApp::runOnce() {
    Readout r;
    std::string port, err;
    if (!readoutOnce(r, port, err)) {
        LOGF("Lettura fallita su '{}': {}", port, err);
        return ExitCodeFor(err);
    }

    if (m_cfg.output == OutputFormat::Table) {
        fmt::print("{}", FormatReadoutTable(r));
    }
    else {
        Json out = r;
        out["port"] = port;
        out["timestamp"] = NowIsoUtc();
        fmt::print("{}\n", out.dump(2));
    }
    return kExitOk;
}

int MainApp::runApi() {
    ApiServer::Callbacks cbs = ApiWiring::MakeCallbacks(*this);
    m_api = std::make_unique<ApiServer>(m_cfg.api.host, m_cfg.api.port, cbs, m_cfg.api.cors);
    if (!m_api->start()) {
        LOGF("[API] avvio fallito");
        return kExitApi;
    }

    LOGF("REST su http://{}:{}  |  POST /control/shutdown per uscire.", m_cfg.api.host, m_cfg.api.port);

    using namespace std::chrono_literals;
    while (!m_shouldExit.load(std::memory_order_relaxed)) {
        if (m_api->failed()) {
            LOGF("[API] server terminato, uscita");
            m_api->stop();
            m_api.reset();
            return kExitApi;
        }
        std::this_thread::sleep_for(100ms);
    }

    // Teardown ordinato
    m_api->stop();
    m_api.reset();
    return kExitOk;
}

int MainApp::run() {
    if (!loadConfig()) return kExitConfig;
    return m_cfg.api.enabled ? runApi() : runOnce();
}
