#include "ApiServer.hpp"
#include "Core/Log.hpp"
#include <chrono>

using Json = nlohmann::json;

ApiServer::ApiServer(std::string host, int port, Callbacks cbs, bool enableCORS)
    : m_host(std::move(host)), m_port(port), m_cbs(std::move(cbs)), m_cors(enableCORS) {
}

ApiServer::~ApiServer() { stop(); }

bool ApiServer::start() {
    if (m_running.exchange(true)) return false;
    m_failed.store(false);
    m_srv = std::make_unique<httplib::Server>();
    installRoutes();

    // bind sincrono: porta occupata o host non valido -> start() fallisce subito
    if (!m_srv->bind_to_port(m_host.c_str(), m_port)) {
        LOGF("[API] bind fallito su {}:{}", m_host, m_port);
        m_srv.reset();
        m_running.store(false);
        return false;
    }

    try {
        m_thr = std::thread(&ApiServer::run, this);   // <<-- può lanciare std::system_error
    }
    catch (const std::system_error& e) {
        LOGF("[API] FATAL: cannot start server thread: {}", e.what());
        m_srv.reset();
        m_running.store(false);
        return false;
    }
    return true;
}

void ApiServer::stop() {
    if (!m_running.exchange(false)) return;
    if (m_srv) m_srv->stop();
    if (m_thr.joinable()) m_thr.join();
    m_srv.reset();
}

void ApiServer::run() {
    try {
        LOGF("[API] Listening http://{}:{} (CORS: {})", m_host, m_port, m_cors ? "on" : "off");
        if (!m_srv->listen_after_bind() && m_running.load()) {
            LOGF("[API] listen() failed");
            m_failed.store(true);
        }
    }
    catch (const std::exception& e) {
        LOGF("[API] FATAL in server thread: {}", e.what());
        m_failed.store(true);
    }
}

int ApiServer::HttpStatusFor(const std::string& err) {
    if (err == "busy") return 409;
    if (err == "no_port") return 503;
    if (err == "timeout") return 504;
    if (err == "invalid_message") return 502;
    return 500; // open_failed, io_error
}

void ApiServer::setCORSHeaders(httplib::Response& res) const {
    if (!m_cors) return;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET,POST,OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

void ApiServer::ok(httplib::Response& res, const Json& result) {
    res.status = 200;
    Json env = { {"ok", true}, {"result", result} };
    res.set_content(env.dump(), "application/json");
}

void ApiServer::fail(httplib::Response& res, int status, const std::string& msg) {
    res.status = status;
    Json env = { {"ok", false}, {"error", msg} };
    res.set_content(env.dump(), "application/json");
}

void ApiServer::installRoutes() {
    m_srv->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOGD("[HTTP] {} {} -> {}", req.method, req.path, res.status);
        });

    // 404 JSON
    m_srv->set_error_handler([this](const httplib::Request&, httplib::Response& res) {
        fail(res, 404, "not_found");
        setCORSHeaders(res);
        });

    // Preflight CORS
    m_srv->Options(R"(.*)", [this](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
        setCORSHeaders(res);
        });

    // GET /health
    m_srv->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        Json payload = { {"alive", true} };
        if (m_cbs.getSerialStatusJson) payload["serial"] = m_cbs.getSerialStatusJson();
        ok(res, payload);
        setCORSHeaders(res);
        });

    // GET /version
    m_srv->Get("/version", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.getVersionJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getVersionJson());
        setCORSHeaders(res);
        });

    // GET /serial/status
    m_srv->Get("/serial/status", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.getSerialStatusJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getSerialStatusJson());
        setCORSHeaders(res);
        });

    // GET /serial/ports
    m_srv->Get("/serial/ports", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.listSerialPorts) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        auto v = m_cbs.listSerialPorts();
        Json out = { {"ports", Json::array()} };
        for (auto& p : v) out["ports"].push_back(p);
        ok(res, out);
        setCORSHeaders(res);
        });

    // GET /readout  -> sign-on + blocco dati (può durare qualche secondo a 300 baud)
    m_srv->Get("/readout", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.readout) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        Json out;
        std::string err;
        if (m_cbs.readout(out, err)) ok(res, out);
        else fail(res, HttpStatusFor(err), err.empty() ? "readout_failed" : err);
        setCORSHeaders(res);
        });

    // POST /control/shutdown  { "confirm": "SHUTDOWN" }
    m_srv->Post("/control/shutdown", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.requestShutdown) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        Json j = Json::parse(req.body, nullptr, /*allow_exceptions*/ false);
        if (j.is_discarded() || !j.is_object()) { fail(res, 400, "bad_json"); setCORSHeaders(res); return; }
        const std::string confirm = j.value("confirm", "");
        if (confirm != "SHUTDOWN") { fail(res, 400, "confirmation_required"); setCORSHeaders(res); return; }
        ok(res, Json{ {"shutting_down", true} }); setCORSHeaders(res);
        std::thread([cb = m_cbs.requestShutdown] {
            using namespace std::chrono_literals;
            std::this_thread::sleep_for(100ms);
            cb();
            }).detach();
        });

    // GET /__routes
    m_srv->Get("/__routes", [this](const httplib::Request&, httplib::Response& res) {
        ok(res, Json{
            {"routes", Json::array({
                "/health", "/version", "/serial/status", "/serial/ports", "/readout",
                "/control/shutdown (POST)"
            })}
            });
        setCORSHeaders(res);
        });
}
