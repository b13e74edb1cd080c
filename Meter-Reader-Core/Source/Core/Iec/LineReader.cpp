#include "Core/Iec/LineReader.hpp"
#include "Core/Iec/Errors.hpp"
#include "Core/Iec/Escape.hpp"
#include "Core/Log.hpp"

// Stato del riconoscimento di CR LF in coda: 0, 1 (visto CR) o 2 (completo)
static int advanceMatch(int matched, std::uint8_t b) {
    if (matched == 1 && b == kLf) return 2;
    return b == kCr ? 1 : 0;
}

LineReader::LineReader(ByteChannel& channel) : m_channel(channel) {
}

Bytes LineReader::readLine(Bytes prefix) {
    Bytes line = std::move(prefix);
    m_complete = false;

    int matched = 0;
    for (std::uint8_t b : line) matched = advanceMatch(matched, b);

    while (matched < 2) {
        auto b = m_channel.readByte();
        if (!b) {
            if (line.empty()) throw TimeoutError();
            LOGD("[IEC] riga interrotta da timeout: {}", EscapeBytes(line));
            return line;
        }
        line.push_back(*b);
        matched = advanceMatch(matched, *b);
    }

    line.resize(line.size() - 2); // via CR LF
    m_complete = true;
    return line;
}
