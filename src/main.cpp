#include "application/config/ConfigManager.hpp"
#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <boost/program_options/errors.hpp>
#include <chrono>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>

// Global shutdown mechanism
std::atomic<bool> running{true};
std::condition_variable shutdownCondition;
std::mutex shutdownMutex;

void handleSignal(int signal) {
    (void) signal;
    running = false;
    shutdownCondition.notify_all();
}

void waitForShutdownSignal() {
    std::unique_lock<std::mutex> lock(shutdownMutex);
    shutdownCondition.wait(lock, [] { return !running.load(); });
}

constexpr int EXIT_CONFIG_ERROR = 2;

int main(int argc, char *argv[]) {
    auto &config = core::config::ConfigManager::getInstance();

    core::config::CommandLine commandLine;
    try {
        commandLine = core::config::ConfigManager::parseCommandLine(argc, argv);
    } catch (const boost::program_options::error &e) {
        std::cerr << "error: " << e.what() << "\n\n" << core::config::ConfigManager::usage();
        return EXIT_CONFIG_ERROR;
    }

    if (commandLine.helpRequested) {
        std::cout << core::config::ConfigManager::usage();
        return 0;
    }

    try {
        config.load(commandLine);

        const auto logConfig = config.getLogConfig();
        LogSettings logSettings;
        logSettings.folder = logConfig.folder;
        if (logConfig.maxFileMb > 0) {
            logSettings.maxFileBytes = static_cast<size_t>(logConfig.maxFileMb) * 1024 * 1024;
        }
        if (logConfig.maxFiles > 0) {
            logSettings.maxFiles = static_cast<size_t>(logConfig.maxFiles);
        }
        if (logConfig.retentionDays > 0) {
            logSettings.retention = std::chrono::hours(24 * logConfig.retentionDays);
        }
        Logger::init(logSettings);
        Logger::setDebugEnabled(logConfig.debug);

        auto validation = config.validate();
        if (!validation.isValid) {
            for (const auto &error: validation.errors) {
                Logger::logError("[Config] " + error);
            }
            std::cerr << "\n" << core::config::ConfigManager::usage();
            Logger::shutdown();
            return EXIT_CONFIG_ERROR;
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        {
            ApplicationController app(config);

            if (!app.initialize()) {
                Logger::logError("Application initialization failed");
                Logger::shutdown();
                return 1;
            }

            // Wait for shutdown signal
            waitForShutdownSignal();
            Logger::logInfo("Shutdown signal received");

            app.shutdown();
        }
        Logger::shutdown();
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        Logger::shutdown();
        return 1;
    }

    return 0;
}
