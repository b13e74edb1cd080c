#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include "Core/Iec/Bcc.hpp"
#include "Core/Iec/LineReader.hpp"
#include "Core/Iec/Timing.hpp"
#include "Core/Serial/ByteChannel.hpp"

struct DataBlockOptions {
    // Se true un BCC diverso da quello calcolato è un InvalidMessageError;
    // altrimenti viene solo segnalato nel log.
    bool verifyBcc = false;
    // Silenzio massimo tra due righe; nullopt = attende indefinitamente
    std::optional<std::chrono::milliseconds> idleTimeout;
};

// Macchina a stati del blocco dati:
//   STX, righe "...CR LF", "!" CR LF, ETX, BCC
// next() restituisce una riga grezza alla volta; nullopt a blocco finito.
// Un solo passaggio: per rileggere serve una nuova sessione.
class DataBlockReader {
public:
    DataBlockReader(ByteChannel& channel, LineReader& lines, Clock& clock,
        DataBlockOptions options = {});

    std::optional<Bytes> next();

    [[nodiscard]] bool finished() const { return m_state == State::Done; }
    [[nodiscard]] std::optional<std::uint8_t> receivedBcc() const { return m_receivedBcc; }
    [[nodiscard]] std::uint8_t computedBcc() const { return m_bcc.value(); }

private:
    enum class State { AwaitStx, Lines, Done };

    void awaitStx();
    void readTrailer();
    std::uint8_t requireByte(const char* what);

    ByteChannel& m_channel;
    LineReader& m_lines;
    Clock& m_clock;
    DataBlockOptions m_options;

    State m_state = State::AwaitStx;
    BccAccumulator m_bcc;
    std::optional<std::uint8_t> m_receivedBcc;
};
