//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include <atomic>
#include <memory>

#include "application/config/ConfigManager.hpp"

// Core includes
#include "core/device/DeviceResolver.hpp"
#include "core/device/JsonProfileRegistry.hpp"
#include "core/print/PrintCoordinator.hpp"
#include "core/transport/Transport.hpp"

// Connector includes
#include "connector/controllers/PrintController.hpp"
#include "connector/http/PrintHttpServer.hpp"


/**
 * @class ApplicationController
 * @brief Main application controller for the print server
 *
 * Wires the print pipeline from the validated configuration:
 * - Loads device profiles (built-in table plus optional models file)
 * - Sets up fonts and the layout engine
 * - Opens the printer link (BLE central or serial port) and the device resolver
 * - Starts the HTTP endpoint in front of the print coordinator
 */
class ApplicationController {
public:
    explicit ApplicationController(core::config::ConfigManager &config);

    ~ApplicationController();

    /**
     * @brief Initialize all application components
     *
     * Initialization sequence:
     * 1. Device profiles
     * 2. Layout (fonts, composer, encoder)
     * 3. Printer link and device resolver
     * 4. Print coordinator and HTTP endpoint
     *
     * @return true if initialization successful, false otherwise
     */
    bool initialize();

    /**
     * @brief Shutdown the application gracefully
     *
     * Stops all components in reverse initialization order
     */
    void shutdown();

private:
    core::config::ConfigManager &config_;
    core::device::TargetSpec target_;

    // ========== Pipeline ==========
    std::shared_ptr<core::device::JsonProfileRegistry> registry_;
    std::shared_ptr<core::layout::Composer> composer_;
    std::shared_ptr<core::encoder::CommandEncoder> encoder_;
    std::shared_ptr<core::device::DeviceResolver> resolver_;
    std::shared_ptr<core::transport::Transport> transport_;
    std::shared_ptr<core::print::PrintCoordinator> coordinator_;

    // ========== HTTP ==========
    std::shared_ptr<connector::controllers::PrintController> printController_;
    std::unique_ptr<connector::http::PrintHttpServer> httpServer_;

    // ========== State Management ==========
    std::atomic<bool> isRunning_;

    bool initializeProfiles();

    bool initializeLayout();

    /**
     * @brief Creates the BLE central or the serial port, the transport and the resolver.
     */
    bool initializePrinterLink();

    bool initializeHttp();

    void printInitializationSummary();
};
