//
// Created by Andrea on 23/08/2025.
//

#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"

#include "core/ble/impl/SimpleBleCentral.hpp"
#include "core/encoder/TiMiniEncoder.hpp"
#include "core/layout/FontLocator.hpp"
#include "core/layout/FreeTypeFontSource.hpp"
#include "core/layout/LayoutEngine.hpp"
#include "core/serial/impl/RealSerialPort.hpp"
#include "core/transport/impl/BleTransport.hpp"
#include "core/transport/impl/SerialTransport.hpp"
#include "core/types/Error.hpp"

#include <chrono>

ApplicationController::ApplicationController(core::config::ConfigManager &config)
        : config_(config),
          target_(config.buildTargetSpec()),
          isRunning_(false) {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] CONSTRUCTING PRINT SERVER");
    Logger::logInfo("===============================================");
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize() {
    Logger::logInfo("[ApplicationController] Build Date: " + std::string(__DATE__) + " " + std::string(__TIME__));
    Logger::logInfo("[ApplicationController] Target: " + core::device::transportKindToString(target_.kind) + " " +
                    target_.addressOrPath + (target_.modelOverride ? " (model " + *target_.modelOverride + ")" : ""));

    Logger::logInfo("[ApplicationController] [1/4] Loading device profiles...");
    if (!initializeProfiles()) {
        Logger::logError("[ApplicationController] ✗ Device profiles FAILED");
        return false;
    }
    Logger::logInfo("[ApplicationController] ✓ " + std::to_string(registry_->size()) + " device profiles loaded");

    Logger::logInfo("[ApplicationController] [2/4] Initializing layout...");
    if (!initializeLayout()) {
        Logger::logError("[ApplicationController] ✗ Layout initialization FAILED");
        return false;
    }
    Logger::logInfo("[ApplicationController] ✓ Layout ready");

    Logger::logInfo("[ApplicationController] [3/4] Initializing printer link...");
    if (!initializePrinterLink()) {
        Logger::logError("[ApplicationController] ✗ Printer link initialization FAILED");
        return false;
    }
    Logger::logInfo("[ApplicationController] ✓ Printer link ready");

    Logger::logInfo("[ApplicationController] [4/4] Starting HTTP endpoint...");
    if (!initializeHttp()) {
        Logger::logError("[ApplicationController] ✗ HTTP endpoint FAILED");
        return false;
    }
    Logger::logInfo("[ApplicationController] ✓ HTTP endpoint listening");

    printInitializationSummary();
    isRunning_ = true;

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SYSTEM READY - WAITING FOR PRINT REQUESTS");
    Logger::logInfo("===============================================");
    return true;
}

bool ApplicationController::initializeProfiles() {
    try {
        registry_ = std::make_shared<core::device::JsonProfileRegistry>();

        const auto modelsPath = config_.getPrintConfig().modelsPath;
        if (!modelsPath.empty()) {
            registry_->loadFromFile(modelsPath);
        }

        if (target_.modelOverride && !registry_->lookup(*target_.modelOverride)) {
            Logger::logWarning("[ApplicationController] Model '" + *target_.modelOverride +
                               "' is not a known profile, every job will fail");
        }
        return true;
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Profile loading error: " + std::string(e.what()));
        return false;
    }
}

bool ApplicationController::initializeLayout() {
    try {
        core::layout::FontLocator locator(config_.getPrintConfig().fontPath);
        try {
            Logger::logInfo("[ApplicationController] Font: " + locator.locate());
        } catch (const core::types::RenderError &e) {
            Logger::logWarning("[ApplicationController] " + std::string(e.what()) + " - jobs will fail until fixed");
        }

        composer_ = std::make_shared<core::layout::LayoutEngine>(
                std::make_shared<core::layout::FreeTypeFontSource>(locator));

        const auto encoderConfig = config_.getEncoderConfig();
        core::encoder::EncoderSettings settings;
        settings.energy = static_cast<uint16_t>(encoderConfig.energy);
        settings.speed = static_cast<uint8_t>(encoderConfig.speed);
        settings.feedLines = static_cast<uint16_t>(encoderConfig.feedLines);
        encoder_ = std::make_shared<core::encoder::TiMiniEncoder>(settings);
        return true;
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Layout error: " + std::string(e.what()));
        return false;
    }
}

bool ApplicationController::initializePrinterLink() {
    try {
        const auto printConfig = config_.getPrintConfig();

        core::device::ResolverOptions options;
        options.scanTimeout = std::chrono::milliseconds(printConfig.scanTimeoutMs);
        options.strictAddress = printConfig.strictAddress;

        if (target_.kind == core::device::TransportKind::BLE) {
            auto central = std::make_shared<core::ble::SimpleBleCentral>();
            auto link = std::make_shared<core::ble::SimpleBleLink>(central, options.scanTimeout);
            transport_ = std::make_shared<core::transport::BleTransport>(link);
            resolver_ = std::make_shared<core::device::DeviceResolver>(registry_, central, options);
        } else {
            auto port = std::make_shared<core::RealSerialPort>();
            transport_ = std::make_shared<core::transport::SerialTransport>(
                    port, static_cast<uint32_t>(printConfig.serialBaudrate));
            resolver_ = std::make_shared<core::device::DeviceResolver>(registry_, nullptr, options);
        }
        return true;
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Printer link error: " + std::string(e.what()));
        return false;
    }
}

bool ApplicationController::initializeHttp() {
    try {
        core::print::CoordinatorConfig coordinatorConfig;
        coordinatorConfig.printTimeout = std::chrono::milliseconds(config_.getPrintConfig().timeoutMs);

        coordinator_ = std::make_shared<core::print::PrintCoordinator>(
                target_, resolver_, composer_, encoder_, transport_, coordinatorConfig);

        const auto serverConfig = config_.getServerConfig();
        printController_ = std::make_shared<connector::controllers::PrintController>(
                coordinator_, connector::http::RequestParser(static_cast<size_t>(serverConfig.maxBodyBytes)));

        httpServer_ = std::make_unique<connector::http::PrintHttpServer>(
                serverConfig.host, static_cast<unsigned short>(serverConfig.port), printController_);
        return httpServer_->start();
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] HTTP error: " + std::string(e.what()));
        return false;
    }
}

void ApplicationController::shutdown() {
    if (!isRunning_.exchange(false) && !httpServer_) {
        return;
    }

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SHUTTING DOWN APPLICATION");
    Logger::logInfo("===============================================");

    if (httpServer_) {
        httpServer_->stop();
        httpServer_.reset();
        Logger::logInfo("[ApplicationController] ✓ HTTP endpoint stopped");
    }

    if (printController_) {
        auto stats = printController_->getStatistics();
        Logger::logInfo("[ApplicationController] Requests: " + std::to_string(stats.requestsReceived) +
                        ", rejected: " + std::to_string(stats.requestsRejected) +
                        ", printed: " + std::to_string(stats.jobsSucceeded) +
                        ", failed: " + std::to_string(stats.jobsFailed));
    }

    Logger::logInfo("[ApplicationController] Shutdown complete");
}

void ApplicationController::printInitializationSummary() {
    const auto serverConfig = config_.getServerConfig();
    const auto printConfig = config_.getPrintConfig();

    Logger::logInfo("========== INITIALIZATION SUMMARY ==========");
    Logger::logInfo("Printer target:   " + core::device::transportKindToString(target_.kind) + " " +
                    target_.addressOrPath);
    Logger::logInfo("Model:            " + target_.modelOverride.value_or("(inferred from advertised name)"));
    Logger::logInfo("Endpoint:         http://" + serverConfig.host + ":" + std::to_string(serverConfig.port) + "/print");
    Logger::logInfo("Job timeout:      " + (target_.kind == core::device::TransportKind::BLE
                                            ? std::to_string(printConfig.timeoutMs) + " ms"
                                            : std::string("none (serial)")));
    Logger::logInfo("Max body:         " + std::to_string(serverConfig.maxBodyBytes) + " bytes");
    Logger::logInfo("=============================================");
}
