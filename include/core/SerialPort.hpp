//
// Created by redeg on 26/04/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace core {

/**
 * @brief Byte-oriented serial device, opened per print job.
 */
    class SerialPort {
    public:
        virtual ~SerialPort() = default;

        /**
         * @brief Opens the device at 8N1 without flow control.
         * @throws types::TransportError if the device cannot be opened or configured.
         */
        virtual void open(const std::string &path, uint32_t baudrate) = 0;

        /**
         * @brief Writes the whole buffer, blocking until it is handed to the driver.
         */
        virtual void write(const uint8_t *data, size_t size) = 0;

        virtual void close() noexcept = 0;

        virtual bool isOpen() const = 0;
    };

} // namespace core
