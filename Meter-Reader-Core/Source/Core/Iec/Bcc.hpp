#pragma once
#include <cstdint>
#include <optional>
#include "Core/Iec/Protocol.hpp"

// Block check character IEC 62056-21 (ISO 1155 / DIN 66219):
// XOR di tutti i byte dopo il primo SOH o STX, fino a ETX compreso.
class BccAccumulator {
public:
    void add(std::uint8_t b) { m_value ^= b; }
    void add(const Bytes& data) { for (std::uint8_t b : data) m_value ^= b; }
    void reset() { m_value = 0; }
    [[nodiscard]] std::uint8_t value() const { return m_value; }

private:
    std::uint8_t m_value = 0;
};

// Calcola il BCC di un frame completo.
// nullopt se mancano SOH/STX iniziale o ETX finale.
std::optional<std::uint8_t> ComputeBcc(const Bytes& frame);
