//
// Created by redeg on 26/04/2025.
//

#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstddef>

/**
 * @brief Where log files go and how long they are kept.
 */
struct LogSettings {
    std::string folder = "logs";
    size_t maxFileBytes = 50 * 1024 * 1024;
    size_t maxFiles = 10;
    std::chrono::hours retention{24 * 7};
};

class Logger {
public:
    /**
     * @brief Opens a fresh log file under settings.folder and starts the cleanup thread.
     * Rotation happens once the file exceeds maxFileBytes; the cleanup thread keeps at most
     * maxFiles files and removes any older than retention.
     */
    static void init(const LogSettings &settings = LogSettings());

    static void shutdown();

    static void setDebugEnabled(bool enabled);

    static bool isDebugEnabled();

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static LogSettings settings_;
    static std::string currentLogPath_;
    static std::atomic<size_t> currentLogSize_;
    static std::atomic<bool> rotationEnabled_;
    static std::atomic<bool> debugEnabled_;
    static std::thread cleanupThread_;
    static std::atomic<bool> shutdownRequested_;

    static void log(const std::string &level, const std::string &message);

    static void rotateLogFile();

    static void startCleanupThread();

    static void cleanupOldLogs();

    static std::string currentTimestamp();

    static std::string generateLogFilename();
};
