//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include "core/device/DeviceProfile.hpp"
#include <optional>
#include <string>

namespace core::device {

    class ProfileRegistry {
    public:
        virtual ~ProfileRegistry() = default;

        virtual std::optional<DeviceProfile> lookup(const std::string &modelName) const = 0;

        /**
         * @brief Model name guessed from a BLE advertised name, if any profile claims it.
         */
        virtual std::optional<std::string> inferModel(const std::string &advertisedName) const = 0;
    };

} // namespace core::device
