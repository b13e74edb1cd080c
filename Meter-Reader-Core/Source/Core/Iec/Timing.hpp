#pragma once
#include <chrono>
#include <cstddef>
#include "Core/Iec/Protocol.hpp"
#include "Core/Serial/ByteChannel.hpp"

using Seconds = std::chrono::duration<double>;

// Sorgente di tempo + sleep, sostituibile nei test.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() = 0;
    virtual void sleepFor(Seconds d) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() override;
    void sleepFor(Seconds d) override;
};

// Istanza condivisa (senza stato) usata quando non si inietta un Clock
SteadyClock& DefaultClock();

// start + dati + parità + stop
constexpr unsigned BitsPerFrame(unsigned dataBits) { return dataBits + 3; }

// byteCount * bitsPerFrame / baudRate, in secondi
Seconds ExpectedDuration(std::size_t byteCount, unsigned baudRate, unsigned bitsPerFrame);

// Scritture temporizzate sul canale.
//
// Alcuni stack seriali accodano i byte nel kernel e ritornano subito:
// senza compensazione il motore cambierebbe baud rate mentre l'ack è
// ancora in trasmissione. La prima scrittura (il sign-on) misura il tempo
// reale e decide una volta per sessione se il canale è "non bloccante";
// da lì in poi ogni scrittura dorme il tempo residuo.
class TimingController {
public:
    explicit TimingController(Clock& clock);

    void write(ByteChannel& channel, const Bytes& data);

    // Applica la regola di compensazione; ritorna il tempo dormito.
    Seconds compensate(Seconds expected, Seconds elapsed);

    [[nodiscard]] bool detected() const { return m_detected; }
    [[nodiscard]] bool nonBlocking() const { return m_nonBlocking; }

private:
    Clock& m_clock;
    bool m_detected = false;
    bool m_nonBlocking = false;
};
