//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/device/DeviceResolver.hpp"
#include "core/types/Deadline.hpp"
#include <cstdint>
#include <vector>

namespace core::transport {

    /**
     * @brief Delivers an encoded command stream to a resolved device.
     *
     * The stream is written in order, in chunks of at most the profile MTU, with the
     * profile's write interval after each chunk. Connections are opened per call and
     * always released before returning.
     *
     * @throws types::TransportError on connect or write failure,
     *         types::TimeoutError when the deadline expires mid-delivery.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        virtual void deliver(const device::ResolvedDevice &device,
                             const std::vector<uint8_t> &stream,
                             const types::Deadline &deadline) = 0;
    };

} // namespace core::transport
