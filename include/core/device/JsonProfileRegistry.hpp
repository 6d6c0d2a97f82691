//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include "core/device/ProfileRegistry.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace core::device {

    /**
     * @brief Profile registry seeded with the built-in TiMini-family table.
     *
     * A JSON file may extend or override entries:
     * [ { "model": "X6h", "width": 384, "mtu": 180, "interval_ms": 4, "name_prefixes": ["X6h"] } ]
     * Lookups are case-insensitive. Populate before sharing; reads are not synchronized.
     */
    class JsonProfileRegistry : public ProfileRegistry {
    public:
        JsonProfileRegistry();

        /**
         * @brief Merges the entries of a JSON file.
         * @return Number of entries merged.
         * @throws std::runtime_error if the file cannot be read or is malformed.
         */
        size_t loadFromFile(const std::string &path);

        size_t loadFromJson(const nlohmann::json &entries);

        void add(DeviceProfile profile);

        std::optional<DeviceProfile> lookup(const std::string &modelName) const override;

        /**
         * Longest matching name prefix wins, so "X6h-1234" resolves to X6h rather than X6.
         */
        std::optional<std::string> inferModel(const std::string &advertisedName) const override;

        size_t size() const {
            return profiles_.size();
        }

        static std::vector<DeviceProfile> builtinProfiles();

    private:
        std::vector<DeviceProfile> profiles_;

        static DeviceProfile profileFromJson(const nlohmann::json &entry);
    };

} // namespace core::device
