//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include "core/ble/BleScanner.hpp"
#include "core/device/DeviceProfile.hpp"
#include "core/device/ProfileRegistry.hpp"
#include "core/device/TargetSpec.hpp"
#include "core/types/Deadline.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace core::device {

    struct ResolverOptions {
        std::chrono::milliseconds scanTimeout{5000};
        // Fail when a configured hardware address is not seen advertising
        bool strictAddress = false;
    };

    /**
     * @brief Where to send the job and how: link address (or serial path) plus a
     * profile whose MTU and write interval are always filled in.
     */
    struct ResolvedDevice {
        std::string address;
        std::string advertisedName;
        DeviceProfile profile;
    };

    class DeviceResolver {
    public:
        /**
         * @param scanner may be null for serial-only deployments.
         */
        DeviceResolver(std::shared_ptr<ProfileRegistry> registry,
                       std::shared_ptr<ble::BleScanner> scanner,
                       ResolverOptions options = {});

        /**
         * @throws types::DeviceNotFoundError, types::UnknownModelError, types::ModelRequiredError,
         *         types::TimeoutError (discovery outlived the deadline)
         */
        ResolvedDevice resolve(const TargetSpec &target, const types::Deadline &deadline) const;

    private:
        std::shared_ptr<ProfileRegistry> registry_;
        std::shared_ptr<ble::BleScanner> scanner_;
        ResolverOptions options_;

        ResolvedDevice resolveBle(const TargetSpec &target, const types::Deadline &deadline) const;

        ResolvedDevice resolveSerial(const TargetSpec &target) const;

        std::vector<ble::AdvertisedDevice> scan(const types::Deadline &deadline) const;

        DeviceProfile determineProfile(const std::optional<std::string> &modelOverride,
                                       const std::string &advertisedName) const;

        static DeviceProfile withDefaults(DeviceProfile profile, int defaultMtu);
    };

} // namespace core::device
