#include "Core/Iec/DataBlockReader.hpp"
#include "Core/Iec/Errors.hpp"
#include "Core/Iec/Escape.hpp"
#include "Core/Log.hpp"
#include <fmt/core.h>

DataBlockReader::DataBlockReader(ByteChannel& channel, LineReader& lines, Clock& clock,
    DataBlockOptions options)
    : m_channel(channel), m_lines(lines), m_clock(clock), m_options(options) {
}

std::optional<Bytes> DataBlockReader::next() {
    if (m_state == State::Done) return std::nullopt;
    if (m_state == State::AwaitStx) awaitStx();

    auto idleSince = m_clock.now();
    while (true) {
        auto b = m_channel.readByte();
        if (!b) {
            // silenzio tra due righe: non chiude il blocco, si riprova
            if (m_options.idleTimeout &&
                m_clock.now() - idleSince >= *m_options.idleTimeout) {
                throw TimeoutError("timeout: blocco dati interrotto");
            }
            continue;
        }

        if (*b == kEndChar) {
            m_bcc.add(*b);
            readTrailer();
            return std::nullopt;
        }

        // la riga comprende già il byte letto qui
        Bytes line = m_lines.readLine(Bytes{ *b });
        m_bcc.add(line);
        if (m_lines.lastLineComplete()) {
            m_bcc.add(kCr);
            m_bcc.add(kLf);
        }
        return line;
    }
}

void DataBlockReader::awaitStx() {
    auto b = m_channel.readByte();
    if (!b) throw TimeoutError();
    if (*b != kStx) {
        throw InvalidMessageError("Manca il carattere STX di inizio blocco: " +
            EscapeBytes(Bytes{ *b }));
    }
    m_bcc.reset();
    m_state = State::Lines;
}

std::uint8_t DataBlockReader::requireByte(const char* what) {
    auto b = m_channel.readByte();
    if (!b) throw TimeoutError(fmt::format("timeout: manca {} a fine blocco", what));
    return *b;
}

void DataBlockReader::readTrailer() {
    m_state = State::Done;

    // CR LF dopo "!"
    m_bcc.add(requireByte("CR"));
    m_bcc.add(requireByte("LF"));

    const std::uint8_t etx = requireByte("ETX");
    if (etx != kEtx) {
        throw InvalidMessageError("Manca il carattere ETX di fine blocco: " +
            EscapeBytes(Bytes{ etx }));
    }
    m_bcc.add(etx);

    m_receivedBcc = m_channel.readByte();
    if (!m_receivedBcc) {
        LOGF("[IEC] BCC non ricevuto");
        if (m_options.verifyBcc) throw TimeoutError("timeout: manca il BCC");
        return;
    }

    LOGD("[IEC] BCC ricevuto: 0x{:02X}, calcolato: 0x{:02X}", *m_receivedBcc, m_bcc.value());
    if (*m_receivedBcc != m_bcc.value()) {
        const std::string msg = fmt::format("BCC errato: ricevuto 0x{:02X}, atteso 0x{:02X}",
            *m_receivedBcc, m_bcc.value());
        if (m_options.verifyBcc) throw InvalidMessageError(msg);
        LOGF("[IEC] {}", msg);
    }
}
