//
// Created by redeg on 26/04/2025.
//

#include "logger/Logger.hpp"

#include <algorithm>
#include <iostream>
#include <chrono>
#include <condition_variable>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
LogSettings Logger::settings_;
std::string Logger::currentLogPath_;
std::atomic<size_t> Logger::currentLogSize_{0};
std::atomic<bool> Logger::rotationEnabled_{true};
std::atomic<bool> Logger::debugEnabled_{false};
std::thread Logger::cleanupThread_;
std::atomic<bool> Logger::shutdownRequested_{false};

namespace {
    std::mutex cleanupWaitMutex;
    std::condition_variable cleanupWake;
}

void Logger::init(const LogSettings &settings) {
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        settings_ = settings;
        if (settings_.folder.empty()) {
            settings_.folder = "logs";
        }
        rotationEnabled_ = settings_.maxFileBytes > 0;
        shutdownRequested_ = false;
        rotateLogFile();
    }
    startCleanupThread();
    std::cout << "[Logger] Initialized in '" << settings_.folder << "' (rotate at "
              << settings_.maxFileBytes / 1024 / 1024 << "MB, keep " << settings_.maxFiles << " files for "
              << settings_.retention.count() / 24 << " days)" << std::endl;
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> wait(cleanupWaitMutex);
        shutdownRequested_ = true;
    }
    cleanupWake.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setDebugEnabled(bool enabled) {
    debugEnabled_ = enabled;
}

bool Logger::isDebugEnabled() {
    return debugEnabled_;
}

void Logger::logDebug(const std::string &message) {
    if (debugEnabled_) {
        log("DEBUG", message);
    }
}

void Logger::logInfo(const std::string &message) {
    log("INFO", message);
}

void Logger::logWarning(const std::string &message) {
    log("WARNING", message);
}

void Logger::logError(const std::string &message) {
    log("ERROR", message);
}

void Logger::log(const std::string &level, const std::string &message) {
    if (message.empty() || message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    std::string timestamp = currentTimestamp();
    std::string formatted = "[" + level + "] [" + timestamp + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    if (level == "ERROR") {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }

    if (rotationEnabled_ && currentLogSize_ > settings_.maxFileBytes) {
        rotateLogFile();
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
        currentLogSize_ += formatted.length() + 1;
    }
}

void Logger::rotateLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }

    currentLogPath_ = generateLogFilename();
    logFile_.open(currentLogPath_, std::ios::out | std::ios::trunc);
    currentLogSize_ = 0;

    if (!logFile_.is_open()) {
        std::cerr << "[Logger] ERROR: Cannot open log file: " << currentLogPath_ << std::endl;
    }
}

void Logger::startCleanupThread() {
    if (cleanupThread_.joinable()) {
        return;
    }
    cleanupThread_ = std::thread([]() {
        while (!shutdownRequested_) {
            cleanupOldLogs();
            std::unique_lock<std::mutex> wait(cleanupWaitMutex);
            cleanupWake.wait_for(wait, std::chrono::hours(1), [] { return shutdownRequested_.load(); });
        }
    });
}

void Logger::cleanupOldLogs() {
    try {
        LogSettings settings;
        {
            std::lock_guard<std::mutex> lock(logMutex_);
            settings = settings_;
        }
        const std::string &logsFolder = settings.folder;
        if (!fs::exists(logsFolder)) return;

        auto cutoffTime = std::chrono::system_clock::now() - settings.retention;
        std::vector<fs::path> logFiles;

        for (const auto &entry: fs::directory_iterator(logsFolder)) {
            if (entry.path().extension() == ".log") {
                auto writeTime = fs::last_write_time(entry);
                auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    writeTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());

                if (sctp < cutoffTime) {
                    fs::remove(entry);
                } else {
                    logFiles.push_back(entry.path());
                }
            }
        }

        if (settings.maxFiles > 0 && logFiles.size() > settings.maxFiles) {
            std::sort(logFiles.begin(), logFiles.end(), [](const fs::path &a, const fs::path &b) {
                return fs::last_write_time(a) < fs::last_write_time(b);
            });

            for (size_t i = 0; i < logFiles.size() - settings.maxFiles; ++i) {
                fs::remove(logFiles[i]);
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
    }
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm localTime{};
    localtime_r(&in_time_t, &localTime);

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm localTime{};
    localtime_r(&in_time_t, &localTime);

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y%m%d_%H%M%S");

    std::error_code ec;
    if (!fs::exists(settings_.folder, ec)) {
        fs::create_directories(settings_.folder, ec);
    }

    return settings_.folder + "/print_server_" + ss.str() + ".log";
}
