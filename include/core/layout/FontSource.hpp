//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/layout/RasterImage.hpp"
#include <memory>
#include <string>

namespace core::layout {

    /**
     * @brief A monospace face at a fixed pixel size.
     */
    class FontFace {
    public:
        virtual ~FontFace() = default;

        virtual int lineHeight() const = 0;

        /**
         * @brief Horizontal advance of one column, in dots.
         */
        virtual int advance() const = 0;

        /**
         * @brief Paints a UTF-8 line in black with its top edge at y, one column per code point.
         * Pixels falling outside the image are discarded.
         */
        virtual void drawLine(RasterImage &image, int x, int y, const std::string &line) const = 0;
    };

    class FontSource {
    public:
        virtual ~FontSource() = default;

        /**
         * @brief Largest face whose advance times columns fits in areaWidth.
         * @throws types::RenderError when no usable font can be loaded.
         */
        virtual std::unique_ptr<FontFace> fit(int areaWidth, int columns) = 0;
    };

} // namespace core::layout
