//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include "core/ble/BleScanner.hpp"
#include "core/ble/BleLink.hpp"
#include <simpleble/SimpleBLE.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace core::ble {

    /**
     * @brief Central role on the first host adapter, via SimpleBLE.
     *
     * Keeps the peripherals of the last scan so a link can connect by address
     * without scanning again.
     */
    class SimpleBleCentral : public BleScanner {
    public:
        SimpleBleCentral() = default;

        std::vector<AdvertisedDevice> discover(std::chrono::milliseconds timeout) override;

        /**
         * @brief Peripheral with the given address from the last scan, rescanning once if absent.
         */
        std::optional<SimpleBLE::Peripheral> findPeripheral(const std::string &address,
                                                            std::chrono::milliseconds rescanTimeout);

    private:
        std::mutex mutex_;
        std::optional<SimpleBLE::Adapter> adapter_;
        std::vector<SimpleBLE::Peripheral> lastResults_;

        SimpleBLE::Adapter &adapter();

        std::vector<SimpleBLE::Peripheral> scanLocked(std::chrono::milliseconds timeout);
    };

    class SimpleBleLink : public BleLink {
    public:
        SimpleBleLink(std::shared_ptr<SimpleBleCentral> central, std::chrono::milliseconds rescanTimeout);

        ~SimpleBleLink() override;

        void connect(const std::string &address, const std::string &characteristicUuid,
                     const types::Deadline &deadline) override;

        void writeWithoutResponse(const uint8_t *data, size_t size) override;

        void disconnect() noexcept override;

        bool isConnected() const override;

    private:
        std::shared_ptr<SimpleBleCentral> central_;
        std::chrono::milliseconds rescanTimeout_;
        // Guards the connection state, the peripheral handle is copied out before blocking calls
        mutable std::mutex stateMutex_;
        std::optional<SimpleBLE::Peripheral> peripheral_;
        std::string serviceUuid_;
        std::string characteristicUuid_;
    };

} // namespace core::ble
