//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include "core/types/Deadline.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace core::ble {

    /**
     * @brief Connection to one peripheral's write characteristic.
     *
     * Implementations throw on connect/write faults; disconnect() never throws.
     * disconnect() may be called from another thread to abort a blocked connect or write.
     */
    class BleLink {
    public:
        virtual ~BleLink() = default;

        /**
         * @brief Any lookup or rescan needed to reach the address is clamped to the deadline.
         */
        virtual void connect(const std::string &address, const std::string &characteristicUuid,
                             const types::Deadline &deadline) = 0;

        /**
         * @brief Write without response (no link-layer acknowledgment awaited).
         */
        virtual void writeWithoutResponse(const uint8_t *data, size_t size) = 0;

        virtual void disconnect() noexcept = 0;

        virtual bool isConnected() const = 0;
    };

} // namespace core::ble
