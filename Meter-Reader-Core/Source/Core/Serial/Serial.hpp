#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <asio.hpp>
#include "Core/Serial/ByteChannel.hpp"

struct SerialSettings {
    std::string port;
    unsigned baud = kDiscoveryBaud;
    unsigned characterSize = kDataBits;           // 7E1
    std::chrono::milliseconds timeout = kDefaultReadTimeout;
};

// Porta seriale sincrona con timeout di lettura.
// Le letture usano async_read + io_context::run_for, così un byte che
// non arriva entro "timeout" diventa nullopt invece di bloccare.
class SerialChannel : public ByteChannel {
public:
    explicit SerialChannel(SerialSettings settings);
    ~SerialChannel() override;

    SerialChannel(const SerialChannel&) = delete;
    SerialChannel& operator=(const SerialChannel&) = delete;

    // Lancia std::system_error se la porta non si apre
    void open();
    void close();
    [[nodiscard]] bool isOpen() const { return m_serial && m_serial->is_open(); }

    void write(const Bytes& data) override;
    void flush() override;
    std::optional<std::uint8_t> readByte() override;

    void setBaudRate(unsigned baud) override;
    [[nodiscard]] unsigned baudRate() const override { return m_settings.baud; }
    [[nodiscard]] unsigned characterSize() const override { return m_settings.characterSize; }

    [[nodiscard]] const std::string& port() const { return m_settings.port; }

private:
    void ensureOpen() const;

    SerialSettings m_settings;
    asio::io_context m_io;
    std::unique_ptr<asio::serial_port> m_serial;
};
