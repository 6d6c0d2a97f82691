//
// Created by Andrea on 17/10/2025.
//

#include "core/transport/impl/SerialTransport.hpp"
#include "core/transport/ChunkPacer.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace core::transport {

    SerialTransport::SerialTransport(std::shared_ptr<SerialPort> port, uint32_t baudrate)
            : port_(std::move(port)), baudrate_(baudrate) {
        if (!port_) {
            throw std::invalid_argument("SerialTransport requires a port");
        }
    }

    void SerialTransport::deliver(const device::ResolvedDevice &device,
                                  const std::vector<uint8_t> &stream,
                                  const types::Deadline &deadline) {
        const auto &profile = device.profile;
        ChunkPacer pacer(static_cast<size_t>(profile.mtuOr(device::DEFAULT_SERIAL_MTU)),
                         std::chrono::milliseconds(profile.intervalOr(device::DEFAULT_WRITE_INTERVAL_MS)));

        Logger::logInfo("[SerialTransport] Sending " + std::to_string(stream.size()) + " bytes to " +
                        device.address + " in " + std::to_string(pacer.chunkCount(stream.size())) + " chunks");

        try {
            port_->open(device.address, baudrate_);
            pacer.run(stream, [this](const uint8_t *data, size_t size) {
                port_->write(data, size);
            }, deadline);
        } catch (const types::PrintException &) {
            port_->close();
            throw;
        } catch (const std::exception &e) {
            port_->close();
            throw types::TransportError(e.what());
        }

        port_->close();
        Logger::logInfo("[SerialTransport] Delivery to " + device.address + " complete");
    }

} // namespace core::transport
