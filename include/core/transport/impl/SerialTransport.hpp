//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/SerialPort.hpp"
#include "core/transport/Transport.hpp"
#include <cstdint>
#include <memory>

namespace core::transport {

    class SerialTransport : public Transport {
    public:
        SerialTransport(std::shared_ptr<SerialPort> port, uint32_t baudrate = 115200);

        void deliver(const device::ResolvedDevice &device,
                     const std::vector<uint8_t> &stream,
                     const types::Deadline &deadline) override;

    private:
        std::shared_ptr<SerialPort> port_;
        uint32_t baudrate_;
    };

} // namespace core::transport
