#include "Core/Iec/Timing.hpp"
#include "Core/Log.hpp"
#include <stdexcept>
#include <thread>

Clock::time_point SteadyClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleepFor(Seconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
}

SteadyClock& DefaultClock() {
    static SteadyClock clock;
    return clock;
}

Seconds ExpectedDuration(std::size_t byteCount, unsigned baudRate, unsigned bitsPerFrame) {
    if (baudRate == 0) throw std::invalid_argument("baud rate nullo");
    return Seconds(static_cast<double>(byteCount) * bitsPerFrame / baudRate);
}

TimingController::TimingController(Clock& clock) : m_clock(clock) {
}

void TimingController::write(ByteChannel& channel, const Bytes& data) {
    const Seconds expected = ExpectedDuration(data.size(), channel.baudRate(),
        BitsPerFrame(channel.characterSize()));

    const auto start = m_clock.now();
    channel.write(data);
    channel.flush();
    const Seconds elapsed = m_clock.now() - start;

    compensate(expected, elapsed);
}

Seconds TimingController::compensate(Seconds expected, Seconds elapsed) {
    if (!m_detected) {
        m_detected = true;
        if (elapsed < expected) {
            m_nonBlocking = true;
            LOGF("[IEC] Scritture non bloccanti. Attese: {:.3f} s, effettive: {:.3f} s",
                expected.count(), elapsed.count());
        }
    }

    if (!m_nonBlocking) return Seconds(0);

    const Seconds residual = expected - elapsed;
    if (residual.count() <= 0) return Seconds(0);
    m_clock.sleepFor(residual);
    return residual;
}
