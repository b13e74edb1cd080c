#include "Api/ApiWiring.hpp"
#include "Api/ApiServer.hpp"
#include "utils/MainApp.hpp"

ApiServer::Callbacks ApiWiring::MakeCallbacks(MainApp& app) {
    ApiServer::Callbacks cbs;
    cbs.getVersionJson = []() {
        return nlohmann::json{ {"app","Meter-Reader"},{"api","1.0.0"},{"protocol","IEC 62056-21"} };
        };
    cbs.getSerialStatusJson = [&app]() { return app.getSerialStatusJson(); };
    cbs.listSerialPorts = [&app]() { return app.listSerialPorts(); };
    cbs.readout = [&app](nlohmann::json& out, std::string& err) { return app.readout(out, err); };
    cbs.requestShutdown = [&app]() { app.requestShutdown(); };
    return cbs;
}
