//
// Created by Andrea on 16/10/2025.
//

#include "core/device/DeviceResolver.hpp"
#include "core/types/Error.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace core::device {

    DeviceResolver::DeviceResolver(std::shared_ptr<ProfileRegistry> registry,
                                   std::shared_ptr<ble::BleScanner> scanner,
                                   ResolverOptions options)
            : registry_(std::move(registry)), scanner_(std::move(scanner)), options_(options) {
        if (!registry_) {
            throw std::invalid_argument("DeviceResolver requires a profile registry");
        }
    }

    ResolvedDevice DeviceResolver::resolve(const TargetSpec &target, const types::Deadline &deadline) const {
        if (target.kind == TransportKind::SERIAL) {
            return resolveSerial(target);
        }
        return resolveBle(target, deadline);
    }

    ResolvedDevice DeviceResolver::resolveSerial(const TargetSpec &target) const {
        if (!target.modelOverride || utils::trim(*target.modelOverride).empty()) {
            throw types::ModelRequiredError();
        }

        auto profile = registry_->lookup(*target.modelOverride);
        if (!profile) {
            throw types::UnknownModelError(*target.modelOverride);
        }

        Logger::logInfo("[DeviceResolver] Serial " + target.addressOrPath + " as model " + profile->model);
        return {target.addressOrPath, "", withDefaults(*profile, DEFAULT_SERIAL_MTU)};
    }

    ResolvedDevice DeviceResolver::resolveBle(const TargetSpec &target, const types::Deadline &deadline) const {
        const std::string &wanted = target.addressOrPath;
        const auto devices = scan(deadline);

        std::string address;
        std::string advertisedName;

        if (!target.isHardwareAddress()) {
            const ble::AdvertisedDevice *match = nullptr;
            for (const auto &device: devices) {
                if (!device.name.empty() && utils::startsWithIgnoreCase(device.name, wanted)) {
                    match = &device;
                    break;
                }
            }
            if (!match) {
                throw types::DeviceNotFoundError(wanted);
            }
            address = match->address;
            advertisedName = match->name;
            Logger::logInfo("[DeviceResolver] '" + wanted + "' matched " + advertisedName + " [" + address + "]");
        } else {
            address = wanted;
            advertisedName = wanted;
            bool seen = false;
            for (const auto &device: devices) {
                if (utils::equalsIgnoreCase(device.address, wanted)) {
                    seen = true;
                    if (!device.name.empty()) {
                        advertisedName = device.name;
                    }
                    break;
                }
            }
            if (!seen) {
                if (options_.strictAddress) {
                    throw types::DeviceNotFoundError(wanted);
                }
                Logger::logWarning("[DeviceResolver] " + wanted + " not advertising, connecting to the raw address");
            }
        }

        return {address, advertisedName, withDefaults(determineProfile(target.modelOverride, advertisedName),
                                                      DEFAULT_BLE_MTU)};
    }

    std::vector<ble::AdvertisedDevice> DeviceResolver::scan(const types::Deadline &deadline) const {
        if (!scanner_) {
            throw types::TransportError("no BLE scanner available");
        }

        deadline.checkpoint("BLE discovery");
        auto devices = scanner_->discover(deadline.clamp(options_.scanTimeout));
        deadline.checkpoint("BLE discovery");
        return devices;
    }

    DeviceProfile DeviceResolver::determineProfile(const std::optional<std::string> &modelOverride,
                                                   const std::string &advertisedName) const {
        if (modelOverride && !utils::trim(*modelOverride).empty()) {
            auto profile = registry_->lookup(*modelOverride);
            if (!profile) {
                throw types::UnknownModelError(*modelOverride);
            }
            return *profile;
        }

        auto inferred = registry_->inferModel(advertisedName);
        if (!inferred) {
            throw types::UnknownModelError(advertisedName);
        }
        auto profile = registry_->lookup(*inferred);
        if (!profile) {
            throw types::UnknownModelError(*inferred);
        }
        Logger::logInfo("[DeviceResolver] Inferred model " + profile->model + " from '" + advertisedName + "'");
        return *profile;
    }

    DeviceProfile DeviceResolver::withDefaults(DeviceProfile profile, int defaultMtu) {
        profile.imageMtuBytes = profile.mtuOr(defaultMtu);
        profile.writeIntervalMs = profile.intervalOr(DEFAULT_WRITE_INTERVAL_MS);
        return profile;
    }

} // namespace core::device
