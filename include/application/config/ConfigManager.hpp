//
// Created by Andrea on 27/08/2025.
//

#pragma once

#include "core/device/TargetSpec.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace core::config {
    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 8080;
        int maxBodyBytes = 10240;
    };

    struct PrintConfig {
        int timeoutMs = 60000;
        int scanTimeoutMs = 5000;
        bool strictAddress = false;
        int serialBaudrate = 115200;
        std::string fontPath;
        std::string modelsPath;
    };

    struct EncoderConfig {
        int energy = 12000;
        int speed = 10;
        int feedLines = 80;
    };

    struct LogConfig {
        std::string folder = "logs";
        bool debug = false;
        int maxFileMb = 50;
        int maxFiles = 10;
        int retentionDays = 7;
    };

    /**
     * @brief Command line as parsed, before it is merged over file and environment.
     */
    struct CommandLine {
        bool helpRequested = false;
        std::string configPath = "config.json";
        std::unordered_map<std::string, std::string> overrides;
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        /**
         * @brief Drops every loaded value and restores the built-in defaults.
         */
        void loadDefaults();

        // Load configuration
        void loadFromFile(const std::string &configPath = "config.json");

        void loadFromEnv();

        /**
         * @throws boost::program_options::error on unknown options or malformed values
         */
        static CommandLine parseCommandLine(int argc, const char *const argv[]);

        static std::string usage();

        void applyOverrides(const std::unordered_map<std::string, std::string> &overrides);

        /**
         * @brief defaults, then file, then environment, then command line.
         */
        void load(const CommandLine &commandLine);

        // Configuration access
        ServerConfig getServerConfig() const;

        PrintConfig getPrintConfig() const;

        EncoderConfig getEncoderConfig() const;

        LogConfig getLogConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        void set(const std::string &key, const std::string &value);

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

        /**
         * @brief Printer target from printer.bluetooth / printer.serial / printer.model.
         * @throws std::invalid_argument unless exactly one of the two targets is set
         */
        device::TargetSpec buildTargetSpec() const;

    private:
        ConfigManager() = default;

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;

        void setDefaults();
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }
} // namespace core::config
