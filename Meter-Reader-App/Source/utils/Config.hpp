#pragma once
#include <string>

enum class OutputFormat {
    Json,   // un documento JSON su stdout
    Table   // righe allineate, per la console
};

struct SerialConfig {
    std::string port = "auto";      // "auto" -> ultima porta trovata
    unsigned    timeoutMs = 400;    // timeout di lettura (2x tempo di reazione)
};

struct ProtocolConfig {
    std::string deviceAddress;      // vuoto = sign-on generico "/?!"
    bool        verifyBcc = false;
    unsigned    blockIdleTimeoutMs = 0; // 0 = nessun limite
};

struct ApiConfig {
    bool        enabled = false;
    std::string host = "127.0.0.1";
    int         port = 8765;
    bool        cors = false;
};

struct AppConfig {
    SerialConfig   serial;
    ProtocolConfig protocol;
    OutputFormat   output = OutputFormat::Json;
    ApiConfig      api;
    bool           verbose = false;
};
