#pragma once
#include "Core/Iec/Session.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct ReadoutRequest {
    std::string    port;
    unsigned       timeoutMs = 400;
    SessionOptions session;
};

// Una lettura alla volta: la porta viene aperta per la sessione e chiusa
// subito dopo, così nessun'altra richiesta condivide il canale fisico.
class SerialService {
public:
    // Esegue un ciclo completo. outErr riceve un codice:
    // "busy", "open_failed", "timeout", "invalid_message", "io_error".
    bool readout(const ReadoutRequest& req, Readout& out, std::string* outErr = nullptr);

    // Stato thread-safe (utile per /serial/status)
    [[nodiscard]] bool isBusy() const;
    [[nodiscard]] nlohmann::json statusJson() const;

private:
    void remember(const std::string& port, const std::string& err);

    std::mutex m_sessionMx;           // serializza le sessioni
    mutable std::mutex m_mx;          // protegge lo stato sotto
    bool m_busy{ false };
    std::string m_lastPort;
    std::string m_lastError;
    std::string m_lastReadoutAt;
    std::optional<IdentificationMessage> m_lastIdent;
    unsigned m_readouts{ 0 };
};
