//
// Created by Andrea on 15/10/2025.
//

#include "core/layout/QrRenderer.hpp"
#include "core/types/Error.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <qrcodegen.hpp>
#include <exception>

namespace core::layout {

    RasterImage QrRenderer::renderMatrix(const std::string &payload) {
        try {
            const auto qr = qrcodegen::QrCode::encodeText(payload.c_str(), qrcodegen::QrCode::Ecc::MEDIUM);
            const int modules = qr.getSize();
            const int side = modules + 2 * QUIET_ZONE_MODULES;

            RasterImage matrix(side, side, RasterImage::WHITE);
            for (int y = 0; y < modules; ++y) {
                for (int x = 0; x < modules; ++x) {
                    if (qr.getModule(x, y)) {
                        matrix.set(x + QUIET_ZONE_MODULES, y + QUIET_ZONE_MODULES, RasterImage::BLACK);
                    }
                }
            }
            return matrix;
        } catch (const std::exception &e) {
            throw types::RenderError("QR payload cannot be encoded (" + std::to_string(payload.size()) +
                                     " bytes): " + e.what());
        }
    }

    RasterImage QrRenderer::render(const std::string &payload, int sizeDots) {
        if (sizeDots <= 0) {
            throw types::RenderError("QR area has no room (" + std::to_string(sizeDots) + " dots)");
        }

        const auto matrix = renderMatrix(payload);
        const cv::Mat modules(matrix.height(), matrix.width(), CV_8UC1,
                              const_cast<uint8_t *>(matrix.pixels().data()));

        cv::Mat scaled;
        cv::resize(modules, scaled, cv::Size(sizeDots, sizeDots), 0, 0, cv::INTER_LANCZOS4);
        // Back to pure black/white: anything darker than mid-grey prints
        cv::Mat binary;
        cv::threshold(scaled, binary, 127, RasterImage::WHITE, cv::THRESH_BINARY);

        RasterImage out(sizeDots, sizeDots);
        for (int y = 0; y < sizeDots; ++y) {
            const uint8_t *row = binary.ptr<uint8_t>(y);
            for (int x = 0; x < sizeDots; ++x) {
                out.set(x, y, row[x]);
            }
        }
        return out;
    }

} // namespace core::layout
