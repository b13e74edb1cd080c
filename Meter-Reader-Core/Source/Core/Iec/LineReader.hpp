#pragma once
#include "Core/Iec/Protocol.hpp"
#include "Core/Serial/ByteChannel.hpp"

// Legge una riga terminata da CR LF, un byte alla volta.
class LineReader {
public:
    explicit LineReader(ByteChannel& channel);

    // "prefix" sono byte già letti dal chiamante (es. il primo byte di una
    // riga del blocco dati). Ritorna la riga senza CR LF.
    // TimeoutError se il canale tace e non c'è nulla di accumulato;
    // se tace a metà riga ritorna quello che ha (lastLineComplete() == false).
    Bytes readLine(Bytes prefix = {});

    [[nodiscard]] bool lastLineComplete() const { return m_complete; }

private:
    ByteChannel& m_channel;
    bool m_complete = false;
};
