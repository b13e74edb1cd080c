#pragma once
#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Core/Iec/Bcc.hpp"
#include "Core/Iec/Protocol.hpp"
#include "Core/Iec/Timing.hpp"
#include "Core/Serial/ByteChannel.hpp"

// Orologio manuale: il tempo avanza solo con sleepFor()/advance().
class ManualClock : public Clock {
public:
    time_point now() override { return m_now; }

    void sleepFor(Seconds d) override {
        sleeps.push_back(d);
        advance(d);
    }

    void advance(Seconds d) {
        m_now += std::chrono::duration_cast<time_point::duration>(d);
    }

    // secondi trascorsi dall'origine
    double at(time_point t) const { return Seconds(t - time_point{}).count(); }

    std::vector<Seconds> sleeps;

private:
    time_point m_now{};
};

// Canale a copione: i byte in "rx" escono uno per readByte(); un nullopt
// nel copione (o il copione finito) simula un timeout di lettura.
class ScriptedChannel : public ByteChannel {
public:
    struct WriteEvent {
        Bytes data;
        Clock::time_point at;   // inizio della scrittura
        unsigned baud;
    };
    struct BaudEvent {
        unsigned baud;
        Clock::time_point at;
    };

    explicit ScriptedChannel(ManualClock& clock) : m_clock(clock) {}

    void feed(std::string_view s) { for (char c : s) rx.push_back(static_cast<std::uint8_t>(c)); }
    void feed(const Bytes& b) { for (std::uint8_t c : b) rx.push_back(c); }
    void feedTimeout() { rx.push_back(std::nullopt); }

    void write(const Bytes& data) override {
        writes.push_back({ data, m_clock.now(), m_baud });
        m_clock.advance(writeCostPerByte * static_cast<double>(data.size()));
    }

    void flush() override { ++flushes; }

    std::optional<std::uint8_t> readByte() override {
        if (rx.empty()) {
            m_clock.advance(readTimeoutCost);
            return std::nullopt;
        }
        auto b = rx.front();
        rx.pop_front();
        if (!b) m_clock.advance(readTimeoutCost);
        return b;
    }

    void setBaudRate(unsigned baud) override {
        m_baud = baud;
        bauds.push_back({ baud, m_clock.now() });
    }
    unsigned baudRate() const override { return m_baud; }
    unsigned characterSize() const override { return kDataBits; }

    std::deque<std::optional<std::uint8_t>> rx;
    std::vector<WriteEvent> writes;
    std::vector<BaudEvent> bauds;
    int flushes = 0;

    // 0 = il driver accoda e ritorna subito (scrittura non bloccante)
    Seconds writeCostPerByte{ 0 };
    Seconds readTimeoutCost{ 0 };

private:
    ManualClock& m_clock;
    unsigned m_baud = kDiscoveryBaud;
};

inline Bytes ToBytes(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

// STX righe "!" CR LF ETX BCC, con BCC corretto salvo "bcc" esplicito
inline Bytes MakeDataBlock(const std::vector<std::string>& lines,
    std::optional<std::uint8_t> bcc = std::nullopt) {
    Bytes frame{ kStx };
    for (const auto& l : lines) {
        frame.insert(frame.end(), l.begin(), l.end());
        frame.push_back(kCr);
        frame.push_back(kLf);
    }
    frame.push_back(kEndChar);
    frame.push_back(kCr);
    frame.push_back(kLf);
    frame.push_back(kEtx);
    frame.push_back(bcc ? *bcc : *ComputeBcc(frame));
    return frame;
}
