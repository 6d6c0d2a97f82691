//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace core::device {

    enum class TransportKind {
        BLE,
        SERIAL
    };

    inline std::string transportKindToString(TransportKind kind) {
        return kind == TransportKind::BLE ? "BLE" : "SERIAL";
    }

    /**
     * @brief The configured printer target, fixed for the process lifetime.
     */
    struct TargetSpec {
        TransportKind kind = TransportKind::BLE;
        std::string addressOrPath;
        std::optional<std::string> modelOverride;

        /**
         * @brief A BLE target containing ':' is a hardware address, anything else a name prefix.
         */
        bool isHardwareAddress() const {
            return kind == TransportKind::BLE && addressOrPath.find(':') != std::string::npos;
        }

        static TargetSpec ble(std::string target, std::optional<std::string> model = std::nullopt) {
            return {TransportKind::BLE, std::move(target), std::move(model)};
        }

        static TargetSpec serial(std::string path, std::optional<std::string> model = std::nullopt) {
            return {TransportKind::SERIAL, std::move(path), std::move(model)};
        }
    };

} // namespace core::device
