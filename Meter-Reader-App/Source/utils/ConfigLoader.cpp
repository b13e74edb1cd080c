#include "utils/ConfigLoader.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include "utils/Utils.hpp"

using nlohmann::json;

// Legge un booleano opzionale: assente -> lascia il default
static bool readBool(const json& obj, const char* key, bool& out, std::string& outErr, const std::string& path) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_boolean()) { outErr = "Chiave '" + path + "." + key + "' non booleana."; return false; }
    out = obj[key].get<bool>();
    return true;
}

static bool readUnsigned(const json& obj, const char* key, unsigned& out, std::string& outErr, const std::string& path) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_number_unsigned()) { outErr = "Chiave '" + path + "." + key + "' non intero positivo."; return false; }
    const auto v = obj[key].get<std::uint64_t>();
    if (v > std::numeric_limits<unsigned>::max()) { outErr = "Chiave '" + path + "." + key + "' fuori intervallo."; return false; }
    out = static_cast<unsigned>(v);
    return true;
}

static bool readString(const json& obj, const char* key, std::string& out, std::string& outErr, const std::string& path) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_string()) { outErr = "Chiave '" + path + "." + key + "' non stringa."; return false; }
    out = obj[key].get<std::string>();
    return true;
}

static bool parseSerial(AppConfig& cfg, std::string& outErr, const json& j) {
    if (!j.contains("serial") || !j["serial"].is_object()) { outErr = "Chiave 'serial' mancante o non oggetto."; return false; }
    const auto& s = j["serial"];
    if (!s.contains("port") || !s["port"].is_string()) { outErr = "Chiave 'serial.port' mancante o non stringa."; return false; }
    cfg.serial.port = s["port"].get<std::string>();
    if (cfg.serial.port.empty()) { outErr = "'serial.port' vuota (usa \"auto\")."; return false; }

    if (!readUnsigned(s, "timeoutMs", cfg.serial.timeoutMs, outErr, "serial")) return false;
    if (cfg.serial.timeoutMs == 0) { outErr = "'serial.timeoutMs' deve essere > 0."; return false; }
    return true;
}

static bool parseProtocol(AppConfig& cfg, std::string& outErr, const json& j) {
    if (!j.contains("protocol")) return true;
    if (!j["protocol"].is_object()) { outErr = "Chiave 'protocol' non oggetto."; return false; }
    const auto& p = j["protocol"];

    if (!readString(p, "deviceAddress", cfg.protocol.deviceAddress, outErr, "protocol")) return false;
    // L'indirizzo finisce dentro "/?...!": niente caratteri di controllo né '!'
    if (cfg.protocol.deviceAddress.size() > 32) { outErr = "'protocol.deviceAddress' supera 32 caratteri."; return false; }
    for (char c : cfg.protocol.deviceAddress) {
        if (c < 0x20 || c > 0x7e || c == '!') {
            outErr = "'protocol.deviceAddress' contiene caratteri non ammessi.";
            return false;
        }
    }

    if (!readBool(p, "verifyBcc", cfg.protocol.verifyBcc, outErr, "protocol")) return false;
    return readUnsigned(p, "blockIdleTimeoutMs", cfg.protocol.blockIdleTimeoutMs, outErr, "protocol");
}

static bool parseOutput(AppConfig& cfg, std::string& outErr, const json& j) {
    if (!j.contains("output")) return true;
    if (!j["output"].is_object()) { outErr = "Chiave 'output' non oggetto."; return false; }

    std::string format = "json";
    if (!readString(j["output"], "format", format, outErr, "output")) return false;
    format = toLower(format);
    if (format == "json") cfg.output = OutputFormat::Json;
    else if (format == "table") cfg.output = OutputFormat::Table;
    else { outErr = "'output.format' sconosciuto: '" + format + "' (json|table)."; return false; }
    return true;
}

static bool parseApi(AppConfig& cfg, std::string& outErr, const json& j) {
    if (!j.contains("api")) return true;
    if (!j["api"].is_object()) { outErr = "Chiave 'api' non oggetto."; return false; }
    const auto& a = j["api"];

    if (!readBool(a, "enabled", cfg.api.enabled, outErr, "api")) return false;
    if (!readString(a, "host", cfg.api.host, outErr, "api")) return false;
    if (!readBool(a, "cors", cfg.api.cors, outErr, "api")) return false;

    unsigned port = static_cast<unsigned>(cfg.api.port);
    if (!readUnsigned(a, "port", port, outErr, "api")) return false;
    if (port == 0 || port > 65535) { outErr = "'api.port' fuori intervallo (1..65535)."; return false; }
    cfg.api.port = static_cast<int>(port);
    return true;
}

bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const json& j) {
    cfg = {};
    if (!j.is_object()) { outErr = "Il config deve essere un oggetto JSON."; return false; }

    if (!parseSerial(cfg, outErr, j)) return false;
    if (!parseProtocol(cfg, outErr, j)) return false;
    if (!parseOutput(cfg, outErr, j)) return false;
    if (!parseApi(cfg, outErr, j)) return false;

    if (j.contains("log")) {
        if (!j["log"].is_object()) { outErr = "Chiave 'log' non oggetto."; return false; }
        if (!readBool(j["log"], "verbose", cfg.verbose, outErr, "log")) return false;
    }
    return true;
}

bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath) {
    try {
        std::ifstream f(configPath);
        if (!f) { outErr = "Impossibile aprire il file: " + configPath; return false; }

        json j; f >> j; // può lanciare
        return ParseConfigStrict(cfg, outErr, j);
    }
    catch (const std::exception& ex) {
        outErr = std::string("Errore di parsing JSON: ") + ex.what() + ". Ricorda: il JSON standard non supporta i commenti.";
        return false;
    }
}
