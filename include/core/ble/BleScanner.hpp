//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace core::ble {

    struct AdvertisedDevice {
        std::string name;
        std::string address;
    };

    /**
     * @brief Bounded BLE discovery.
     */
    class BleScanner {
    public:
        virtual ~BleScanner() = default;

        /**
         * @brief Scans for the given duration and returns every device seen, in discovery order.
         */
        virtual std::vector<AdvertisedDevice> discover(std::chrono::milliseconds timeout) = 0;
    };

} // namespace core::ble
