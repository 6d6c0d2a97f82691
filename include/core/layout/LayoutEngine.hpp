//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/layout/FontSource.hpp"
#include "core/layout/RasterImage.hpp"
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace core::layout {

    /**
     * @brief Turns display text and an optional QR payload into one monochrome raster.
     */
    class Composer {
    public:
        virtual ~Composer() = default;

        virtual RasterImage compose(const std::string &displayText,
                                    const std::optional<std::string> &qrData,
                                    int printerWidthDots) = 0;
    };

    /**
     * @brief Geometry chosen for one composition, exposed for diagnostics and tests.
     */
    struct LayoutPlan {
        int printerWidth = 0;
        int qrSize = 0;
        int textAreaWidth = 0;
        int columns = 0;
        int lineHeight = 0;
        std::vector<std::string> lines;

        int textBlockHeight() const {
            return lineHeight * static_cast<int>(std::max<size_t>(1, lines.size()));
        }

        int totalHeight() const {
            return qrSize > 0 ? std::max(qrSize, textBlockHeight()) : textBlockHeight();
        }
    };

    class LayoutEngine : public Composer {
    public:
        explicit LayoutEngine(std::shared_ptr<FontSource> fonts);

        /**
         * With a QR payload the left width/2 dots hold the symbol and the text flows in the
         * remaining area; without one the text spans the full width. Both blocks are
         * vertically centered in the output.
         *
         * @throws types::RenderError on font or QR failure, or a non-positive width.
         */
        RasterImage compose(const std::string &displayText,
                            const std::optional<std::string> &qrData,
                            int printerWidthDots) override;

        LayoutPlan plan(const std::string &displayText, bool withQr, int printerWidthDots,
                        const FontFace &face) const;

    private:
        std::shared_ptr<FontSource> fonts_;
    };

} // namespace core::layout
