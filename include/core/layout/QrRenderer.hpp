//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/layout/RasterImage.hpp"
#include <string>

namespace core::layout {

    /**
     * @brief Encodes a payload as a QR symbol (error correction MEDIUM) and rasterizes it.
     */
    class QrRenderer {
    public:
        static constexpr int QUIET_ZONE_MODULES = 1;

        /**
         * @brief One dot per module, black on white, with the quiet zone included.
         * @throws types::RenderError when the payload exceeds the symbol capacity.
         */
        static RasterImage renderMatrix(const std::string &payload);

        /**
         * @brief Matrix resized with OpenCV's Lanczos filter to exactly sizeDots x sizeDots, then
         * thresholded back to pure black/white.
         */
        static RasterImage render(const std::string &payload, int sizeDots);
    };

} // namespace core::layout
