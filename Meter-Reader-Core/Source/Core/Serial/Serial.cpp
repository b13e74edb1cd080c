#include "Serial.hpp"
#include "Core/Log.hpp"
#include <cerrno>
#include <system_error>
#include <termios.h>

SerialChannel::SerialChannel(SerialSettings settings)
    : m_settings(std::move(settings)) {
}

SerialChannel::~SerialChannel() { close(); }

void SerialChannel::open() {
    if (m_serial) return;

    m_serial = std::make_unique<asio::serial_port>(m_io);
    asio::error_code ec;
    m_serial->open(m_settings.port, ec);
    if (ec) {
        m_serial.reset();
        throw std::system_error(ec, fmt::format("apertura {}", m_settings.port));
    }

    m_serial->set_option(asio::serial_port_base::baud_rate(m_settings.baud));
    m_serial->set_option(asio::serial_port_base::character_size(m_settings.characterSize));
    m_serial->set_option(asio::serial_port_base::parity(asio::serial_port_base::parity::even));
    m_serial->set_option(asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one));
    m_serial->set_option(asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none));

    LOGD("[SER] {} @ {} aperta ({}E1, timeout {} ms)", m_settings.port, m_settings.baud,
        m_settings.characterSize, m_settings.timeout.count());
}

void SerialChannel::close() {
    if (!m_serial) return;
    asio::error_code ignored;
    m_serial->cancel(ignored);
    m_serial->close(ignored);
    m_serial.reset();
    LOGD("[SER] {} chiusa", m_settings.port);
}

void SerialChannel::ensureOpen() const {
    if (!isOpen()) {
        throw std::system_error(std::make_error_code(std::errc::bad_file_descriptor),
            fmt::format("porta {} non aperta", m_settings.port));
    }
}

void SerialChannel::write(const Bytes& data) {
    ensureOpen();
    asio::write(*m_serial, asio::buffer(data)); // lancia std::system_error
}

void SerialChannel::flush() {
    ensureOpen();
    // tcdrain: alcuni driver (USB) ritornano comunque prima della fine
    // della trasmissione, per questo esiste il TimingController.
    if (::tcdrain(m_serial->native_handle()) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcdrain");
    }
}

std::optional<std::uint8_t> SerialChannel::readByte() {
    ensureOpen();

    std::uint8_t b = 0;
    std::size_t got = 0;
    asio::error_code result = asio::error::would_block;

    m_io.restart();
    asio::async_read(*m_serial, asio::buffer(&b, 1),
        [&](const asio::error_code& ec, std::size_t n) {
            result = ec;
            got = n;
        });

    m_io.run_for(m_settings.timeout);
    if (!m_io.stopped()) {
        // timeout: annulla la lettura pendente e lascia girare l'handler
        asio::error_code ignored;
        m_serial->cancel(ignored);
        m_io.run();
    }

    if (result == asio::error::operation_aborted) return std::nullopt;
    if (result) throw std::system_error(result, fmt::format("lettura {}", m_settings.port));
    if (got == 0) return std::nullopt;
    return b;
}

void SerialChannel::setBaudRate(unsigned baud) {
    m_settings.baud = baud;
    if (isOpen()) {
        m_serial->set_option(asio::serial_port_base::baud_rate(baud));
    }
    LOGD("[SER] {} -> {} baud", m_settings.port, baud);
}
