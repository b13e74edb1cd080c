#pragma once
#include <chrono>
#include <cstdint>
#include <vector>

using Bytes = std::vector<std::uint8_t>;

// Caratteri di controllo ASCII usati dal protocollo
inline constexpr std::uint8_t kSoh = 0x01;
inline constexpr std::uint8_t kStx = 0x02;
inline constexpr std::uint8_t kEtx = 0x03;
inline constexpr std::uint8_t kAck = 0x06;
inline constexpr std::uint8_t kNak = 0x15;
inline constexpr std::uint8_t kCr = 0x0D;
inline constexpr std::uint8_t kLf = 0x0A;

inline constexpr std::uint8_t kStartChar = '/';
inline constexpr std::uint8_t kRequestChar = '?';
inline constexpr std::uint8_t kEndChar = '!';   // chiude anche il blocco dati
inline constexpr std::uint8_t kEscapeChar = '\\';

// Sign-on sempre a 300 baud, 7E1
inline constexpr unsigned kDiscoveryBaud = 300;
inline constexpr unsigned kDataBits = 7;

// Tempo minimo di reazione tra messaggio e risposta (IEC 62056-21)
inline constexpr std::chrono::milliseconds kMinReactionTime{ 200 };
inline constexpr std::chrono::milliseconds kDefaultReadTimeout{ 2 * kMinReactionTime };
