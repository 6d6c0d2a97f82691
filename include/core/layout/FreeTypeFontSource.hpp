//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/layout/FontSource.hpp"
#include "core/layout/FontLocator.hpp"

namespace core::layout {

    /**
     * @brief FontSource backed by FreeType. Each fit() loads a private face, so
     * concurrent jobs never share glyph slots.
     */
    class FreeTypeFontSource : public FontSource {
    public:
        static constexpr int MIN_PIXEL_SIZE = 4;
        static constexpr int MAX_PIXEL_SIZE = 200;

        explicit FreeTypeFontSource(FontLocator locator);

        std::unique_ptr<FontFace> fit(int areaWidth, int columns) override;

        /**
         * @brief Column advance of the located font at the given pixel size.
         */
        int advanceAt(int pixelSize) const;

        // Pixel size chosen by the most recent fit(), 0 before the first
        int lastPixelSize() const { return lastPixelSize_; }

    private:
        FontLocator locator_;
        int lastPixelSize_ = 0;
    };

} // namespace core::layout
