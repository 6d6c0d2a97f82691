//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace core::layout {

    /**
     * @brief 8-bit grayscale bitmap, row-major. 255 is white (paper), 0 is black.
     */
    class RasterImage {
    public:
        static constexpr uint8_t WHITE = 255;
        static constexpr uint8_t BLACK = 0;

        RasterImage() = default;

        RasterImage(int width, int height, uint8_t fill = WHITE);

        int width() const { return width_; }

        int height() const { return height_; }

        bool empty() const { return width_ == 0 || height_ == 0; }

        uint8_t at(int x, int y) const;

        void set(int x, int y, uint8_t value);

        /**
         * @brief Copies another image with its top-left corner at (x, y), clipping to bounds.
         */
        void paste(const RasterImage &source, int x, int y);

        /**
         * @brief Counts pixels darker than the threshold inside [x0, x1) x [y0, y1).
         */
        size_t countDark(int x0, int y0, int x1, int y1, uint8_t threshold = 128) const;

        const std::vector<uint8_t> &pixels() const { return pixels_; }

    private:
        int width_ = 0;
        int height_ = 0;
        std::vector<uint8_t> pixels_;
    };

} // namespace core::layout
