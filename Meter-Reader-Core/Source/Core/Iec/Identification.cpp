#include "Core/Iec/Identification.hpp"
#include "Core/Iec/Errors.hpp"
#include "Core/Iec/Escape.hpp"
#include "Core/Log.hpp"
#include <fmt/core.h>

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

unsigned BaudRateForId(char baudId) {
    const int idx = hexValue(baudId);
    if (idx < 0) {
        throw InvalidMessageError(fmt::format("Identificativo baud rate non valido: '{}'",
            EscapeBytes(std::string_view(&baudId, 1))));
    }
    return kBaudRateTable[static_cast<size_t>(idx)];
}

ProtocolMode ProtocolModeFor(char baudId, bool enhanced) {
    if (baudId > 'A' && baudId <= 'I') return ProtocolMode::B;
    if (baudId > '0' && baudId <= '9') return enhanced ? ProtocolMode::E : ProtocolMode::C;
    return ProtocolMode::A;
}

char ProtocolModeChar(ProtocolMode mode) {
    return static_cast<char>(mode);
}

IdentificationMessage ParseIdentification(const Bytes& line) {
    if (line.empty()) throw TimeoutError();

    if (line[0] != kStartChar) {
        throw InvalidMessageError("Manca il carattere iniziale: " + EscapeBytes(line));
    }
    if (line.size() < 6) {
        throw InvalidMessageError(fmt::format(
            "Messaggio di identificazione troppo corto ({} < 6 byte): {}",
            line.size(), EscapeBytes(line)));
    }

    IdentificationMessage msg;
    msg.manufacturerId.assign(line.begin() + 1, line.begin() + 4);
    msg.baudId = static_cast<char>(line[4]);

    const bool enhanced = (line[5] == kEscapeChar);
    size_t identStart = 5;
    if (enhanced) {
        // "\W": carattere di modo esteso, poi l'identificativo vero
        if (line.size() < 8) {
            throw InvalidMessageError(fmt::format(
                "Messaggio di identificazione troppo corto ({} < 8 byte): {}",
                line.size(), EscapeBytes(line)));
        }
        identStart = 7;
    }
    // gli ultimi due byte della riga restano fuori dall'identificativo
    const size_t identEnd = line.size() - 2;
    if (identEnd > identStart) {
        msg.identification.assign(line.begin() + static_cast<std::ptrdiff_t>(identStart),
            line.begin() + static_cast<std::ptrdiff_t>(identEnd));
    }

    msg.protocolMode = ProtocolModeFor(msg.baudId, enhanced);
    msg.baudRate = BaudRateForId(msg.baudId);
    return msg;
}

IdentificationReader::IdentificationReader(ByteChannel& channel, LineReader& lines)
    : m_channel(channel), m_lines(lines) {
}

IdentificationMessage IdentificationReader::read() {
    Bytes line = m_lines.readLine();

    if (!line.empty() && line[0] != kStartChar) {
        // risincronizza: consuma tutto fino al silenzio del canale
        while (auto b = m_channel.readByte()) line.push_back(*b);
    }

    IdentificationMessage msg = ParseIdentification(line);
    LOGD("[IEC] identificazione: costruttore={} baud='{}' ({}) modo={} id='{}'",
        msg.manufacturerId, msg.baudId, msg.baudRate, ProtocolModeChar(msg.protocolMode),
        msg.identification);
    return msg;
}
