#pragma once

#include "core/SerialPort.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <string>

namespace core {

/**
 * @brief Implementazione di SerialPort usando Boost.Asio
 */
    class RealSerialPort : public SerialPort {
    public:
        RealSerialPort() = default;

        ~RealSerialPort() override;

        void open(const std::string &path, uint32_t baudrate) override;

        void write(const uint8_t *data, size_t size) override;

        void close() noexcept override;

        bool isOpen() const override;

    private:
        boost::asio::io_context io_context_;
        std::unique_ptr<boost::asio::serial_port> serial_port_;
        std::string path_;

        void configurePort(uint32_t baudrate);
    };

} // namespace core
