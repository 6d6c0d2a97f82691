//
// Created by Andrea on 16/10/2025.
//

#include "core/device/JsonProfileRegistry.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace core::device {

    JsonProfileRegistry::JsonProfileRegistry() : profiles_(builtinProfiles()) {
    }

    std::vector<DeviceProfile> JsonProfileRegistry::builtinProfiles() {
        // model, width, mtu, interval, advertised prefixes
        return {
            {"GB01", 384, std::nullopt, std::nullopt, {"GB01"}},
            {"GB02", 384, std::nullopt, std::nullopt, {"GB02"}},
            {"GB03", 384, std::nullopt, std::nullopt, {"GB03"}},
            {"GT01", 384, std::nullopt, std::nullopt, {"GT01"}},
            {"MX05", 384, std::nullopt, std::nullopt, {"MX05"}},
            {"MX06", 384, std::nullopt, std::nullopt, {"MX06"}},
            {"MX08", 384, std::nullopt, std::nullopt, {"MX08"}},
            {"MX10", 384, std::nullopt, std::nullopt, {"MX10"}},
            {"YT01", 384, std::nullopt, std::nullopt, {"YT01"}},
            {"X5", 384, std::nullopt, std::nullopt, {"X5"}},
            {"X6", 384, std::nullopt, std::nullopt, {"X6"}},
            {"X6h", 384, 180, 4, {"X6h"}},
            {"X7", 384, std::nullopt, std::nullopt, {"X7"}},
        };
    }

    size_t JsonProfileRegistry::loadFromFile(const std::string &path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open model file " + path);
        }

        nlohmann::json entries;
        try {
            file >> entries;
        } catch (const nlohmann::json::parse_error &e) {
            throw std::runtime_error("invalid model file " + path + ": " + e.what());
        }

        size_t merged = loadFromJson(entries);
        Logger::logInfo("[ProfileRegistry] Loaded " + std::to_string(merged) + " model(s) from " + path);
        return merged;
    }

    size_t JsonProfileRegistry::loadFromJson(const nlohmann::json &entries) {
        if (!entries.is_array()) {
            throw std::runtime_error("model definitions must be a JSON array");
        }

        size_t merged = 0;
        for (const auto &entry: entries) {
            add(profileFromJson(entry));
            ++merged;
        }
        return merged;
    }

    void JsonProfileRegistry::add(DeviceProfile profile) {
        if (profile.namePrefixes.empty()) {
            profile.namePrefixes.push_back(profile.model);
        }

        for (auto &existing: profiles_) {
            if (utils::equalsIgnoreCase(existing.model, profile.model)) {
                existing = std::move(profile);
                return;
            }
        }
        profiles_.push_back(std::move(profile));
    }

    std::optional<DeviceProfile> JsonProfileRegistry::lookup(const std::string &modelName) const {
        for (const auto &profile: profiles_) {
            if (utils::equalsIgnoreCase(profile.model, modelName)) {
                return profile;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> JsonProfileRegistry::inferModel(const std::string &advertisedName) const {
        if (advertisedName.empty()) return std::nullopt;

        const DeviceProfile *best = nullptr;
        size_t bestLength = 0;
        for (const auto &profile: profiles_) {
            for (const auto &prefix: profile.namePrefixes) {
                if (!prefix.empty() && prefix.size() > bestLength &&
                    utils::startsWithIgnoreCase(advertisedName, prefix)) {
                    best = &profile;
                    bestLength = prefix.size();
                }
            }
        }

        if (!best) return std::nullopt;
        return best->model;
    }

    DeviceProfile JsonProfileRegistry::profileFromJson(const nlohmann::json &entry) {
        if (!entry.is_object() || !entry.contains("model") || !entry["model"].is_string()) {
            throw std::runtime_error("model entry requires a string \"model\": " + entry.dump());
        }

        DeviceProfile profile;
        profile.model = entry["model"].get<std::string>();
        profile.widthDots = entry.value("width", 384);
        if (profile.widthDots <= 0) {
            throw std::runtime_error("model " + profile.model + " has a non-positive width");
        }
        if (entry.contains("mtu") && !entry["mtu"].is_null()) {
            profile.imageMtuBytes = entry["mtu"].get<int>();
        }
        if (entry.contains("interval_ms") && !entry["interval_ms"].is_null()) {
            profile.writeIntervalMs = entry["interval_ms"].get<int>();
        }
        if (entry.contains("name_prefixes")) {
            profile.namePrefixes = entry["name_prefixes"].get<std::vector<std::string>>();
        }
        return profile;
    }

} // namespace core::device
