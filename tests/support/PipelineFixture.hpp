#pragma once

#include "core/device/JsonProfileRegistry.hpp"
#include "core/print/PrintCoordinator.hpp"
#include "support/Fakes.hpp"

#include <memory>

namespace fakes {

    /**
     * @brief Coordinator wired to in-memory collaborators.
     */
    struct Pipeline {
        std::shared_ptr<core::device::JsonProfileRegistry> registry =
                std::make_shared<core::device::JsonProfileRegistry>();
        std::shared_ptr<FakeScanner> scanner = std::make_shared<FakeScanner>();
        std::shared_ptr<FakeComposer> composer = std::make_shared<FakeComposer>();
        std::shared_ptr<FakeEncoder> encoder = std::make_shared<FakeEncoder>();
        std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();

        std::shared_ptr<core::print::PrintCoordinator> coordinator(
                const core::device::TargetSpec &target,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(60000),
                std::shared_ptr<core::transport::Transport> deliveredBy = nullptr) {
            auto resolver = std::make_shared<core::device::DeviceResolver>(registry, scanner);
            core::print::CoordinatorConfig config;
            config.printTimeout = timeout;
            if (!deliveredBy) {
                deliveredBy = transport;
            }
            return std::make_shared<core::print::PrintCoordinator>(target, resolver, composer, encoder, deliveredBy,
                                                                   config);
        }
    };

} // namespace fakes
