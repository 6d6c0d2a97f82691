//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace core::device {
    constexpr int DEFAULT_BLE_MTU = 20;
    constexpr int DEFAULT_SERIAL_MTU = 180;
    constexpr int DEFAULT_WRITE_INTERVAL_MS = 4;

    /**
     * @brief Per-model constants needed to drive a printer. Immutable once loaded.
     */
    struct DeviceProfile {
        std::string model;
        int widthDots = 384;
        std::optional<int> imageMtuBytes;
        std::optional<int> writeIntervalMs;
        std::vector<std::string> namePrefixes; // advertised-name prefixes used for inference

        int mtuOr(int fallback) const {
            return imageMtuBytes && *imageMtuBytes > 0 ? *imageMtuBytes : fallback;
        }

        int intervalOr(int fallback) const {
            return writeIntervalMs && *writeIntervalMs >= 0 ? *writeIntervalMs : fallback;
        }

        /**
         * @brief Paper width rounded down to whole bytes (8 dots), at least one byte.
         */
        int normalizedWidth() const {
            int width = widthDots - (widthDots % 8);
            return width < 8 ? 8 : width;
        }
    };

} // namespace core::device
