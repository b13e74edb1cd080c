#pragma once
#include <cstdint>
#include <optional>
#include "Core/Iec/Protocol.hpp"

// Canale a byte half-duplex visto dal motore di protocollo.
// Implementazioni: SerialChannel (asio) e i canali finti dei test.
class ByteChannel {
public:
    virtual ~ByteChannel() = default;

    // Scrive tutti i byte (può tornare prima che siano sul filo)
    virtual void write(const Bytes& data) = 0;
    // Attende lo svuotamento del buffer di uscita, se il driver lo permette
    virtual void flush() = 0;
    // Un byte, oppure nullopt se scade il timeout di lettura
    virtual std::optional<std::uint8_t> readByte() = 0;

    virtual void setBaudRate(unsigned baud) = 0;
    [[nodiscard]] virtual unsigned baudRate() const = 0;
    [[nodiscard]] virtual unsigned characterSize() const = 0;
};
