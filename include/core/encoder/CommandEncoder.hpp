//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/device/DeviceProfile.hpp"
#include "core/layout/RasterImage.hpp"
#include <cstdint>
#include <vector>

namespace core::encoder {

    /**
     * @brief Serializes a monochrome raster into the printer's command stream.
     *
     * The output is opaque to the transport, which only chunks and paces it.
     */
    class CommandEncoder {
    public:
        virtual ~CommandEncoder() = default;

        virtual std::vector<uint8_t> encode(const layout::RasterImage &image,
                                            const device::DeviceProfile &profile) const = 0;
    };

} // namespace core::encoder
