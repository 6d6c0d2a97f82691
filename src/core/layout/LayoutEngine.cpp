//
// Created by Andrea on 15/10/2025.
//

#include "core/layout/LayoutEngine.hpp"
#include "core/layout/QrRenderer.hpp"
#include "core/layout/TextFlow.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace core::layout {

    LayoutEngine::LayoutEngine(std::shared_ptr<FontSource> fonts) : fonts_(std::move(fonts)) {
        if (!fonts_) {
            throw std::invalid_argument("LayoutEngine requires a font source");
        }
    }

    LayoutPlan LayoutEngine::plan(const std::string &displayText, bool withQr, int printerWidthDots,
                                  const FontFace &face) const {
        LayoutPlan plan;
        plan.printerWidth = printerWidthDots;
        plan.qrSize = withQr ? printerWidthDots / 2 : 0;
        plan.textAreaWidth = printerWidthDots - plan.qrSize;
        plan.columns = columnsForWidth(plan.textAreaWidth);
        plan.lineHeight = std::max(1, face.lineHeight());
        plan.lines = wrapText(displayText, plan.columns);
        return plan;
    }

    RasterImage LayoutEngine::compose(const std::string &displayText,
                                      const std::optional<std::string> &qrData,
                                      int printerWidthDots) {
        if (printerWidthDots <= 0) {
            throw types::RenderError("printer width must be positive, got " + std::to_string(printerWidthDots));
        }

        const bool withQr = qrData.has_value();
        const int qrSize = withQr ? printerWidthDots / 2 : 0;
        const int areaWidth = printerWidthDots - qrSize;

        auto face = fonts_->fit(areaWidth, columnsForWidth(areaWidth));
        const LayoutPlan layout = plan(displayText, withQr, printerWidthDots, *face);

        RasterImage textBlock(layout.textAreaWidth, layout.textBlockHeight());
        for (size_t i = 0; i < layout.lines.size(); ++i) {
            if (!layout.lines[i].empty()) {
                face->drawLine(textBlock, 0, static_cast<int>(i) * layout.lineHeight, layout.lines[i]);
            }
        }

        const int totalHeight = layout.totalHeight();
        RasterImage out(printerWidthDots, totalHeight);

        if (withQr) {
            out.paste(QrRenderer::render(*qrData, qrSize), 0, (totalHeight - qrSize) / 2);
        }
        out.paste(textBlock, qrSize, (totalHeight - textBlock.height()) / 2);

        Logger::logInfo("[LayoutEngine] Composed " + std::to_string(out.width()) + "x" + std::to_string(out.height()) +
                        " raster: " + std::to_string(layout.lines.size()) + " lines @ " +
                        std::to_string(layout.columns) + " columns" +
                        (withQr ? ", QR " + std::to_string(qrSize) + "px" : ""));
        return out;
    }

} // namespace core::layout
