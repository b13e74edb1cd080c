#pragma once
#include <array>
#include <string>
#include "Core/Iec/LineReader.hpp"
#include "Core/Iec/Protocol.hpp"
#include "Core/Serial/ByteChannel.hpp"

enum class ProtocolMode : char { A = 'A', B = 'B', C = 'C', E = 'E' };

// Risposta al sign-on: "/XXXZ[\W]Ident CR LF"
struct IdentificationMessage {
    std::string  manufacturerId;   // 3 caratteri
    char         baudId = '0';
    std::string  identification;
    ProtocolMode protocolMode = ProtocolMode::A;
    unsigned     baudRate = 0;     // 0 = riservato, da rifiutare prima del cambio baud
};

// Indici 7..9 riservati
inline constexpr std::array<unsigned, 16> kBaudRateTable = {
    300, 600, 1200, 2400, 4800, 9600, 19200,
    0, 0, 0,
    600, 1200, 2400, 4800, 9600, 19200
};

// Lancia InvalidMessageError se baudId non è una cifra esadecimale
unsigned BaudRateForId(char baudId);
ProtocolMode ProtocolModeFor(char baudId, bool enhanced);
char ProtocolModeChar(ProtocolMode mode);

// Decodifica la riga (già senza CR LF).
// Riga vuota -> TimeoutError; formato errato -> InvalidMessageError.
IdentificationMessage ParseIdentification(const Bytes& line);

// Legge la riga dal canale e la decodifica. Se manca il carattere '/'
// svuota il canale prima di lanciare, per non lasciare byte spuri.
class IdentificationReader {
public:
    IdentificationReader(ByteChannel& channel, LineReader& lines);
    IdentificationMessage read();

private:
    ByteChannel& m_channel;
    LineReader& m_lines;
};
