#include "Core/Iec/Session.hpp"
#include "Core/Iec/Errors.hpp"
#include "Core/Iec/Escape.hpp"
#include "Core/Log.hpp"
#include <stdexcept>

std::optional<DataSetRecord> DataSetStream::next() {
    if (m_finished) return std::nullopt;

    std::optional<Bytes> raw;
    try {
        raw = m_reader->next();
        if (!raw) {
            m_finished = true;
            return std::nullopt;
        }
        LOGD("[IEC] << {}", EscapeBytes(*raw));
        return ParseDataSet(std::string_view(reinterpret_cast<const char*>(raw->data()), raw->size()));
    }
    catch (const std::exception&) {
        m_finished = true; // niente recupero parziale
        throw;
    }
}

MeterSession::MeterSession(ByteChannel& channel, SessionOptions options)
    : MeterSession(channel, DefaultClock(), std::move(options)) {
}

MeterSession::MeterSession(ByteChannel& channel, Clock& clock, SessionOptions options)
    : m_channel(channel), m_clock(clock), m_options(std::move(options)),
    m_timing(clock), m_lines(channel) {
}

void MeterSession::signOn() {
    m_channel.setBaudRate(kDiscoveryBaud);

    Bytes request{ kStartChar, kRequestChar };
    request.insert(request.end(), m_options.deviceAddress.begin(), m_options.deviceAddress.end());
    request.push_back(kEndChar);
    request.push_back(kCr);
    request.push_back(kLf);

    LOGD("[IEC] >> {}", EscapeBytes(request));
    m_timing.write(m_channel, request);
}

void MeterSession::acknowledge(const IdentificationMessage& ident) {
    // ACK V Z Y: V=0 protocollo normale, Z=baud proposto, Y=0 lettura dati
    const Bytes ack{ kAck, '0', static_cast<std::uint8_t>(ident.baudId), '0', kCr, kLf };
    LOGD("[IEC] >> {}", EscapeBytes(ack));
    m_timing.write(m_channel, ack);

    m_clock.sleepFor(kMinReactionTime);
    m_channel.setBaudRate(ident.baudRate);
}

DataSetStream MeterSession::read() {
    if (m_started) throw std::logic_error("sessione già letta: crearne una nuova");
    m_started = true;

    signOn();

    IdentificationReader identReader(m_channel, m_lines);
    m_ident = identReader.read();

    if (m_ident->baudRate == 0) {
        throw InvalidMessageError(fmt::format("Baud rate riservato per l'identificativo '{}'",
            m_ident->baudId));
    }

    acknowledge(*m_ident);

    DataBlockOptions blockOpts;
    blockOpts.verifyBcc = m_options.verifyBcc;
    blockOpts.idleTimeout = m_options.blockIdleTimeout;
    m_block = std::make_unique<DataBlockReader>(m_channel, m_lines, m_clock, blockOpts);
    return DataSetStream(*m_block);
}

Readout MeterSession::readAll() {
    DataSetStream stream = read();

    Readout out;
    out.identification = *m_ident;
    while (auto rec = stream.next()) out.records.push_back(std::move(*rec));

    LOGD("[IEC] {} dataset letti da {}{}", out.records.size(),
        out.identification.manufacturerId, out.identification.identification);
    return out;
}
