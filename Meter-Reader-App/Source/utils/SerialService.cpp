#include "utils/SerialService.hpp"
#include "utils/ReadoutJson.hpp"
#include "utils/Utils.hpp"
#include "Core/Iec/Errors.hpp"
#include "Core/Serial/Serial.hpp"
#include "Core/Log.hpp"
#include <system_error>

bool SerialService::readout(const ReadoutRequest& req, Readout& out, std::string* outErr) {
    std::unique_lock<std::mutex> session(m_sessionMx, std::try_to_lock);
    if (!session.owns_lock()) {
        if (outErr) *outErr = "busy";
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(m_mx);
        m_busy = true;
    }

    std::string err;
    SerialSettings settings;
    settings.port = req.port;
    settings.timeout = std::chrono::milliseconds(req.timeoutMs);
    SerialChannel channel(settings);

    try {
        channel.open();
    }
    catch (const std::system_error& e) {
        LOGF("[SER] Errore apertura {}: {}", req.port, e.what());
        err = "open_failed";
    }

    if (err.empty()) {
        try {
            MeterSession meter(channel, req.session);
            out = meter.readAll();
        }
        catch (const TimeoutError& e) {
            LOGF("[IEC] {}", e.what());
            err = "timeout";
        }
        catch (const InvalidMessageError& e) {
            LOGF("[IEC] Messaggio non valido: {}", e.what());
            err = "invalid_message";
        }
        catch (const std::system_error& e) {
            LOGF("[SER] Errore IO su {}: {}", req.port, e.what());
            err = "io_error";
        }
    }
    channel.close();

    remember(req.port, err);
    if (err.empty()) {
        std::lock_guard<std::mutex> lk(m_mx);
        m_lastIdent = out.identification;
        ++m_readouts;
    }
    if (!err.empty() && outErr) *outErr = err;
    return err.empty();
}

void SerialService::remember(const std::string& port, const std::string& err) {
    std::lock_guard<std::mutex> lk(m_mx);
    m_busy = false;
    m_lastPort = port;
    m_lastError = err;
    m_lastReadoutAt = NowIsoUtc();
}

bool SerialService::isBusy() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_busy;
}

nlohmann::json SerialService::statusJson() const {
    std::lock_guard<std::mutex> lk(m_mx);
    nlohmann::json out = {
        {"busy", m_busy},
        {"readouts", m_readouts}
    };
    if (!m_lastPort.empty()) {
        out["port"] = m_lastPort;
        out["lastAttempt"] = m_lastReadoutAt;
        out["lastError"] = m_lastError.empty() ? nlohmann::json(nullptr) : nlohmann::json(m_lastError);
    }
    if (m_lastIdent) out["meter"] = *m_lastIdent;
    return out;
}
