//
// Created by Andrea on 16/10/2025.
//

#include "core/ble/impl/SimpleBleCentral.hpp"
#include "core/types/Error.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"

#include <utility>

namespace core::ble {

    SimpleBLE::Adapter &SimpleBleCentral::adapter() {
        if (adapter_) {
            return *adapter_;
        }

        if (!SimpleBLE::Adapter::bluetooth_enabled()) {
            throw types::TransportError("Bluetooth is disabled on this host");
        }

        auto adapters = SimpleBLE::Adapter::get_adapters();
        if (adapters.empty()) {
            throw types::TransportError("no Bluetooth adapter available");
        }

        adapter_ = adapters.front();
        Logger::logInfo("[SimpleBleCentral] Using adapter " + adapter_->identifier() + " [" + adapter_->address() + "]");
        return *adapter_;
    }

    std::vector<SimpleBLE::Peripheral> SimpleBleCentral::scanLocked(std::chrono::milliseconds timeout) {
        auto &central = adapter();
        central.scan_for(static_cast<int>(timeout.count()));
        lastResults_ = central.scan_get_results();
        return lastResults_;
    }

    std::vector<AdvertisedDevice> SimpleBleCentral::discover(std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lock(mutex_);

        Logger::logInfo("[SimpleBleCentral] Scanning for " + std::to_string(timeout.count()) + " ms...");
        std::vector<AdvertisedDevice> devices;
        for (auto &peripheral: scanLocked(timeout)) {
            devices.push_back({peripheral.identifier(), peripheral.address()});
        }
        Logger::logInfo("[SimpleBleCentral] Scan found " + std::to_string(devices.size()) + " device(s)");
        return devices;
    }

    std::optional<SimpleBLE::Peripheral> SimpleBleCentral::findPeripheral(const std::string &address,
                                                                          std::chrono::milliseconds rescanTimeout) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto match = [&](std::vector<SimpleBLE::Peripheral> &candidates) -> std::optional<SimpleBLE::Peripheral> {
            for (auto &peripheral: candidates) {
                if (utils::equalsIgnoreCase(peripheral.address(), address)) {
                    return peripheral;
                }
            }
            return std::nullopt;
        };

        if (auto cached = match(lastResults_)) {
            return cached;
        }

        Logger::logInfo("[SimpleBleCentral] " + address + " not in last scan, rescanning");
        auto results = scanLocked(rescanTimeout);
        return match(results);
    }

    SimpleBleLink::SimpleBleLink(std::shared_ptr<SimpleBleCentral> central, std::chrono::milliseconds rescanTimeout)
            : central_(std::move(central)), rescanTimeout_(rescanTimeout) {
    }

    SimpleBleLink::~SimpleBleLink() {
        disconnect();
    }

    void SimpleBleLink::connect(const std::string &address, const std::string &characteristicUuid,
                                const types::Deadline &deadline) {
        auto peripheral = central_->findPeripheral(address, deadline.clamp(rescanTimeout_));
        deadline.checkpoint("peripheral lookup");
        if (!peripheral) {
            throw types::TransportError("peripheral " + address + " is not advertising");
        }

        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            peripheral_ = peripheral;
            serviceUuid_.clear();
            characteristicUuid_.clear();
        }

        peripheral->connect();
        deadline.checkpoint("connect");

        for (auto &service: peripheral->services()) {
            for (auto &characteristic: service.characteristics()) {
                if (utils::equalsIgnoreCase(characteristic.uuid(), characteristicUuid)) {
                    std::lock_guard<std::mutex> lock(stateMutex_);
                    if (!peripheral_) {
                        throw types::TransportError("link to " + address + " closed while connecting");
                    }
                    serviceUuid_ = service.uuid();
                    characteristicUuid_ = characteristic.uuid();
                    Logger::logInfo("[SimpleBleLink] Connected to " + address + ", writing to " +
                                    characteristicUuid_ + " (service " + serviceUuid_ + ")");
                    return;
                }
            }
        }

        disconnect();
        throw types::TransportError("characteristic " + characteristicUuid + " not exposed by " + address);
    }

    void SimpleBleLink::writeWithoutResponse(const uint8_t *data, size_t size) {
        std::optional<SimpleBLE::Peripheral> peripheral;
        std::string service;
        std::string characteristic;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (!peripheral_ || characteristicUuid_.empty()) {
                throw types::TransportError("write on a closed BLE link");
            }
            peripheral = peripheral_;
            service = serviceUuid_;
            characteristic = characteristicUuid_;
        }
        SimpleBLE::ByteArray payload(std::string(reinterpret_cast<const char *>(data), size));
        peripheral->write_command(service, characteristic, payload);
    }

    void SimpleBleLink::disconnect() noexcept {
        std::optional<SimpleBLE::Peripheral> peripheral;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            peripheral.swap(peripheral_);
            serviceUuid_.clear();
            characteristicUuid_.clear();
        }
        if (!peripheral) return;

        try {
            if (peripheral->is_connected()) {
                peripheral->disconnect();
                Logger::logInfo("[SimpleBleLink] Disconnected from " + peripheral->address());
            }
        } catch (const std::exception &e) {
            Logger::logWarning("[SimpleBleLink] Disconnect failed: " + std::string(e.what()));
        }
    }

    bool SimpleBleLink::isConnected() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return peripheral_.has_value() && !characteristicUuid_.empty();
    }

} // namespace core::ble
