//
// Created by Andrea on 14/10/2025.
//

#include "core/layout/RasterImage.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace core::layout {

    RasterImage::RasterImage(int width, int height, uint8_t fill)
            : width_(width), height_(height) {
        if (width < 0 || height < 0) {
            throw std::invalid_argument("RasterImage: negative size " + std::to_string(width) + "x" +
                                        std::to_string(height));
        }
        pixels_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), fill);
    }

    uint8_t RasterImage::at(int x, int y) const {
        if (x < 0 || y < 0 || x >= width_ || y >= height_) {
            throw std::out_of_range("RasterImage: pixel out of range");
        }
        return pixels_[static_cast<size_t>(y) * width_ + x];
    }

    void RasterImage::set(int x, int y, uint8_t value) {
        if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
        pixels_[static_cast<size_t>(y) * width_ + x] = value;
    }

    void RasterImage::paste(const RasterImage &source, int x, int y) {
        int startX = std::max(0, x);
        int startY = std::max(0, y);
        int endX = std::min(width_, x + source.width());
        int endY = std::min(height_, y + source.height());
        if (startX >= endX || startY >= endY) return;

        for (int dy = startY; dy < endY; ++dy) {
            const auto *src = source.pixels_.data() + static_cast<size_t>(dy - y) * source.width_ + (startX - x);
            auto *dst = pixels_.data() + static_cast<size_t>(dy) * width_ + startX;
            std::copy(src, src + (endX - startX), dst);
        }
    }

    size_t RasterImage::countDark(int x0, int y0, int x1, int y1, uint8_t threshold) const {
        x0 = std::max(0, x0);
        y0 = std::max(0, y0);
        x1 = std::min(width_, x1);
        y1 = std::min(height_, y1);

        size_t count = 0;
        for (int y = y0; y < y1; ++y) {
            for (int x = x0; x < x1; ++x) {
                if (pixels_[static_cast<size_t>(y) * width_ + x] < threshold) {
                    ++count;
                }
            }
        }
        return count;
    }

} // namespace core::layout
