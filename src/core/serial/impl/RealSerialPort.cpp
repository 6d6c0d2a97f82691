#include "core/serial/impl/RealSerialPort.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <boost/system/error_code.hpp>

namespace core {
    RealSerialPort::~RealSerialPort() {
        close();
    }

    void RealSerialPort::open(const std::string &path, uint32_t baudrate) {
        close();

        try {
            serial_port_ = std::make_unique<boost::asio::serial_port>(io_context_, path);
        } catch (const boost::system::system_error &e) {
            serial_port_.reset();
            throw types::TransportError("cannot open " + path + ": " + e.what());
        }

        if (!serial_port_->is_open()) {
            serial_port_.reset();
            throw types::TransportError("cannot open " + path);
        }

        path_ = path;
        try {
            configurePort(baudrate);
        } catch (...) {
            close();
            throw;
        }

        Logger::logInfo("[SerialPort] Opened " + path + " at " + std::to_string(baudrate) + " baud");
    }

    void RealSerialPort::configurePort(uint32_t baudrate) {
        boost::system::error_code ec;

        serial_port_->set_option(boost::asio::serial_port_base::baud_rate(baudrate), ec);
        if (ec) {
            throw types::TransportError("failed to set baud rate on " + path_ + ": " + ec.message());
        }

        // Some USB adapters reject character_size; the driver default is already 8
        serial_port_->set_option(boost::asio::serial_port_base::character_size(8), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Character size setting failed (non-critical): " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::parity(
                boost::asio::serial_port_base::parity::none), ec);
        if (ec) {
            throw types::TransportError("failed to set parity on " + path_ + ": " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::stop_bits(
                boost::asio::serial_port_base::stop_bits::one), ec);
        if (ec) {
            throw types::TransportError("failed to set stop bits on " + path_ + ": " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::flow_control(
                boost::asio::serial_port_base::flow_control::none), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Failed to set flow control: " + ec.message());
        }
    }

    void RealSerialPort::write(const uint8_t *data, size_t size) {
        if (!isOpen()) {
            throw types::TransportError("serial port not open");
        }

        boost::system::error_code ec;
        size_t written = boost::asio::write(*serial_port_, boost::asio::buffer(data, size), ec);
        if (ec) {
            throw types::TransportError("write error on " + path_ + ": " + ec.message());
        }
        if (written != size) {
            throw types::TransportError("short write on " + path_ + ": " +
                                        std::to_string(written) + "/" + std::to_string(size));
        }
    }

    void RealSerialPort::close() noexcept {
        if (!serial_port_) return;

        boost::system::error_code ec;
        if (serial_port_->is_open()) {
            serial_port_->close(ec);
        }
        if (ec) {
            Logger::logError("[SerialPort] Error closing port: " + ec.message());
        }
        serial_port_.reset();
    }

    bool RealSerialPort::isOpen() const {
        return serial_port_ && serial_port_->is_open();
    }
} // namespace core
