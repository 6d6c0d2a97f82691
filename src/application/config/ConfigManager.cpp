//
// Created by Andrea on 27/08/2025.
//

#include "application/config/ConfigManager.hpp"
#include "core/utils/StringUtils.hpp"
#include "logger/Logger.hpp"
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace po = boost::program_options;

namespace core::config {
    namespace {
        const std::pair<const char *, const char *> ENV_KEYS[] = {
            {"PRINTER_BLUETOOTH", "printer.bluetooth"},
            {"PRINTER_SERIAL", "printer.serial"},
            {"PRINTER_MODEL", "printer.model"},
            {"PRINT_PORT", "server.port"},
            {"PRINT_HOST", "server.host"},
            {"PRINT_TIMEOUT_MS", "print.timeout.ms"},
            {"PRINT_FONT", "font.path"},
            {"PRINT_MODELS", "models.path"},
        };

        po::options_description commandLineOptions() {
            po::options_description desc(
                "BLE/serial print server: prints text and an optional QR code on a TiMini-compatible thermal printer.\n"
                "Options");
            desc.add_options()
                ("help,h", "show this help and exit")
                ("bluetooth", po::value<std::string>()->value_name("NAME_OR_ADDR"),
                 "BLE printer name prefix or address (env: PRINTER_BLUETOOTH)")
                ("serial", po::value<std::string>()->value_name("PATH"),
                 "serial device path, requires --model (env: PRINTER_SERIAL)")
                ("model", po::value<std::string>()->value_name("MODEL"),
                 "printer model, inferred from the BLE name when omitted (env: PRINTER_MODEL)")
                ("port", po::value<int>()->value_name("PORT"), "HTTP port, default 8080 (env: PRINT_PORT)")
                ("host", po::value<std::string>()->value_name("HOST"),
                 "HTTP bind address, default 0.0.0.0 (env: PRINT_HOST)")
                ("config", po::value<std::string>()->value_name("FILE")->default_value("config.json"),
                 "JSON configuration file");
            return desc;
        }
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    void ConfigManager::loadDefaults() {
        std::lock_guard<std::mutex> lock(configMutex_);
        setDefaults();
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            if (!json.is_object()) {
                throw std::runtime_error("top-level value must be an object");
            }

            // Flatten JSON into key-value pairs
            std::unordered_map<std::string, std::string> loaded;
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        loaded[key] = it.value().get<std::string>();
                    } else if (!it.value().is_null()) {
                        loaded[key] = it.value().dump();
                    }
                }
            };

            flatten(json, "");
            for (auto &[key, value]: loaded) {
                config_[key] = std::move(value);
            }

            Logger::logInfo(
                "[ConfigManager] Loaded " + std::to_string(loaded.size()) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config: " + std::string(e.what()));
            setDefaults();
        }
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        int loaded = 0;
        for (const auto &[envVar, key]: ENV_KEYS) {
            const char *value = std::getenv(envVar);
            if (value && *value) {
                config_[key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    CommandLine ConfigManager::parseCommandLine(int argc, const char *const argv[]) {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, commandLineOptions()), vm);
        po::notify(vm);

        CommandLine commandLine;
        commandLine.helpRequested = vm.count("help") > 0;
        commandLine.configPath = vm["config"].as<std::string>();

        if (vm.count("bluetooth")) commandLine.overrides["printer.bluetooth"] = vm["bluetooth"].as<std::string>();
        if (vm.count("serial")) commandLine.overrides["printer.serial"] = vm["serial"].as<std::string>();
        if (vm.count("model")) commandLine.overrides["printer.model"] = vm["model"].as<std::string>();
        if (vm.count("port")) commandLine.overrides["server.port"] = std::to_string(vm["port"].as<int>());
        if (vm.count("host")) commandLine.overrides["server.host"] = vm["host"].as<std::string>();

        return commandLine;
    }

    std::string ConfigManager::usage() {
        std::ostringstream out;
        out << commandLineOptions();
        return out.str();
    }

    void ConfigManager::applyOverrides(const std::unordered_map<std::string, std::string> &overrides) {
        std::lock_guard<std::mutex> lock(configMutex_);
        for (const auto &[key, value]: overrides) {
            config_[key] = value;
        }
        if (!overrides.empty()) {
            Logger::logInfo("[ConfigManager] Applied " + std::to_string(overrides.size()) +
                            " settings from command line");
        }
    }

    void ConfigManager::load(const CommandLine &commandLine) {
        loadDefaults();
        loadFromFile(commandLine.configPath);
        loadFromEnv();
        applyOverrides(commandLine.overrides);
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    ServerConfig ConfigManager::getServerConfig() const {
        ServerConfig config;
        config.host = get<std::string>("server.host", "0.0.0.0");
        config.port = get<int>("server.port", 8080);
        config.maxBodyBytes = get<int>("request.max.body.bytes", 10240);
        return config;
    }

    PrintConfig ConfigManager::getPrintConfig() const {
        PrintConfig config;
        config.timeoutMs = get<int>("print.timeout.ms", 60000);
        config.scanTimeoutMs = get<int>("ble.scan.timeout.ms", 5000);
        config.strictAddress = get<bool>("ble.strict.address", false);
        config.serialBaudrate = get<int>("serial.baudrate", 115200);
        config.fontPath = get<std::string>("font.path", "");
        config.modelsPath = get<std::string>("models.path", "");
        return config;
    }

    EncoderConfig ConfigManager::getEncoderConfig() const {
        EncoderConfig config;
        config.energy = get<int>("encoder.energy", 12000);
        config.speed = get<int>("encoder.speed", 10);
        config.feedLines = get<int>("encoder.feed.lines", 80);
        return config;
    }

    LogConfig ConfigManager::getLogConfig() const {
        LogConfig config;
        config.folder = get<std::string>("log.folder", "logs");
        config.debug = get<bool>("log.debug", false);
        config.maxFileMb = get<int>("log.max.file.mb", 50);
        config.maxFiles = get<int>("log.max.files", 10);
        config.retentionDays = get<int>("log.retention.days", 7);
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        const bool hasBluetooth = !utils::isBlank(get<std::string>("printer.bluetooth", ""));
        const bool hasSerial = !utils::isBlank(get<std::string>("printer.serial", ""));
        if (hasBluetooth && hasSerial) {
            result.errors.push_back("--bluetooth and --serial are mutually exclusive");
        } else if (!hasBluetooth && !hasSerial) {
            result.errors.push_back("one of --bluetooth or --serial is required");
        }

        const int port = get<int>("server.port", -1);
        if (port < 1 || port > 65535) {
            result.errors.push_back("server.port must be in 1..65535");
        }

        if (get<int>("print.timeout.ms", -1) <= 0) {
            result.errors.push_back("print.timeout.ms must be > 0");
        }

        if (get<int>("ble.scan.timeout.ms", -1) <= 0) {
            result.errors.push_back("ble.scan.timeout.ms must be > 0");
        }

        if (get<int>("serial.baudrate", -1) <= 0) {
            result.errors.push_back("serial.baudrate must be > 0");
        }

        if (get<int>("request.max.body.bytes", -1) <= 0) {
            result.errors.push_back("request.max.body.bytes must be > 0");
        }

        const int energy = get<int>("encoder.energy", -1);
        if (energy < 0 || energy > 0xFFFF) {
            result.errors.push_back("encoder.energy must be in 0..65535");
        }

        const int speed = get<int>("encoder.speed", -1);
        if (speed < 0 || speed > 0xFF) {
            result.errors.push_back("encoder.speed must be in 0..255");
        }

        const int feed = get<int>("encoder.feed.lines", -1);
        if (feed < 0 || feed > 0xFFFF) {
            result.errors.push_back("encoder.feed.lines must be in 0..65535");
        }

        const auto log = getLogConfig();
        if (log.maxFileMb <= 0 || log.maxFiles <= 0 || log.retentionDays <= 0) {
            result.errors.push_back("log.max.file.mb, log.max.files and log.retention.days must be > 0");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    device::TargetSpec ConfigManager::buildTargetSpec() const {
        const std::string bluetooth = utils::trim(get<std::string>("printer.bluetooth", ""));
        const std::string serial = utils::trim(get<std::string>("printer.serial", ""));
        const std::string model = utils::trim(get<std::string>("printer.model", ""));

        std::optional<std::string> modelOverride;
        if (!model.empty()) modelOverride = model;

        if (!bluetooth.empty() && serial.empty()) {
            return device::TargetSpec::ble(bluetooth, modelOverride);
        }
        if (!serial.empty() && bluetooth.empty()) {
            return device::TargetSpec::serial(serial, modelOverride);
        }
        throw std::invalid_argument("exactly one of printer.bluetooth or printer.serial must be set");
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        // Server defaults
        config_["server.host"] = "0.0.0.0";
        config_["server.port"] = "8080";
        config_["request.max.body.bytes"] = "10240";

        // Print job defaults
        config_["print.timeout.ms"] = "60000";
        config_["ble.scan.timeout.ms"] = "5000";
        config_["ble.strict.address"] = "false";
        config_["serial.baudrate"] = "115200";
        config_["font.path"] = "";
        config_["models.path"] = "";

        // Encoder defaults
        config_["encoder.energy"] = "12000";
        config_["encoder.speed"] = "10";
        config_["encoder.feed.lines"] = "80";

        // Logging defaults
        config_["log.folder"] = "logs";
        config_["log.debug"] = "false";
        config_["log.max.file.mb"] = "50";
        config_["log.max.files"] = "10";
        config_["log.retention.days"] = "7";

        Logger::logDebug("[ConfigManager] Loaded default configuration");
    }
} // namespace core::config
