#pragma once
#include <string>
#include <thread>
#include <atomic>
#include <functional>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>
#include <httplib.h>

class ApiServer {
public:
    using Json = nlohmann::json;

    struct Callbacks {
        // Letture
        std::function<Json()> getVersionJson;
        std::function<Json()> getSerialStatusJson;
        std::function<std::vector<std::string>()> listSerialPorts;

        // Un ciclo di lettura completo sul contatore
        std::function<bool(Json& out, std::string& err)> readout;

        std::function<void()> requestShutdown;
    };

    ApiServer(std::string host, int port, Callbacks cbs, bool enableCORS = false);
    ~ApiServer();

    // false se il bind non riesce
    bool start();
    void stop();

    // Il thread del server è terminato con errore dopo start()
    [[nodiscard]] bool failed() const { return m_failed.load(); }

    // Codice d'errore di lettura -> stato HTTP
    static int HttpStatusFor(const std::string& err);

private:
    void run();
    void installRoutes();

    // Envelope helpers
    void setCORSHeaders(httplib::Response& res) const;
    static void ok(httplib::Response& res, const Json& result);
    static void fail(httplib::Response& res, int status, const std::string& msg);

    std::string   m_host;
    int           m_port;
    Callbacks     m_cbs;
    bool          m_cors{ false };

    std::unique_ptr<httplib::Server> m_srv;
    std::thread       m_thr;
    std::atomic<bool> m_running{ false };
    std::atomic<bool> m_failed{ false };
};
