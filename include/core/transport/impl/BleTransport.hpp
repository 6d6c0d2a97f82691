//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/ble/BleLink.hpp"
#include "core/transport/Transport.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace core::transport {

    // Write characteristic exposed by the whole TiMini family
    inline const std::string PRINT_CHARACTERISTIC_UUID = "0000ae01-0000-1000-8000-00805f9b34fb";

    /**
     * @brief Delivers over a BLE link with the deadline enforced from outside the link.
     *
     * Connect and writes run on a delivery thread. When the deadline passes first,
     * the caller forces the link down and gets a TimeoutError immediately, whether or
     * not the blocked call ever returns. A delivery left behind this way must drain
     * before the next one starts.
     */
    class BleTransport : public Transport {
    public:
        // How long the destructor waits for a stalled delivery before leaving it behind
        static constexpr std::chrono::milliseconds DRAIN_GRACE{1000};

        explicit BleTransport(std::shared_ptr<ble::BleLink> link,
                              std::string characteristicUuid = PRINT_CHARACTERISTIC_UUID);

        ~BleTransport() override;

        BleTransport(const BleTransport &) = delete;

        BleTransport &operator=(const BleTransport &) = delete;

        void deliver(const device::ResolvedDevice &device,
                     const std::vector<uint8_t> &stream,
                     const types::Deadline &deadline) override;

    private:
        struct Delivery;

        std::shared_ptr<ble::BleLink> link_;
        std::string characteristicUuid_;
        std::shared_ptr<Delivery> pending_;
        std::thread worker_;

        void awaitPrevious(const types::Deadline &deadline);

        void reap();
    };

} // namespace core::transport
