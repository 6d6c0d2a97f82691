//
// Created by Andrea on 15/10/2025.
//

#include "core/layout/FreeTypeFontSource.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Utf8.hpp"
#include "logger/Logger.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <utility>

namespace core::layout {

    namespace {
        struct LibraryDeleter {
            void operator()(FT_Library library) const {
                FT_Done_FreeType(library);
            }
        };

        struct FaceDeleter {
            void operator()(FT_Face face) const {
                FT_Done_Face(face);
            }
        };

        using LibraryHandle = std::unique_ptr<FT_LibraryRec_, LibraryDeleter>;
        using FaceHandle = std::unique_ptr<FT_FaceRec_, FaceDeleter>;

        constexpr unsigned char COVERAGE_THRESHOLD = 128;

        int ceilPixels(FT_Pos value26_6) {
            return static_cast<int>((value26_6 + 63) >> 6);
        }

        class FreeTypeFontFace : public FontFace {
        public:
            FreeTypeFontFace(LibraryHandle library, FaceHandle face, int advance)
                    : library_(std::move(library)), face_(std::move(face)), advance_(advance) {
                lineHeight_ = ceilPixels(face_->size->metrics.height);
                ascender_ = ceilPixels(face_->size->metrics.ascender);
            }

            int lineHeight() const override {
                return lineHeight_;
            }

            int advance() const override {
                return advance_;
            }

            void drawLine(RasterImage &image, int x, int y, const std::string &line) const override {
                int penX = x;
                for (char32_t cp: utils::decodeUtf8(line)) {
                    if (cp != U' ') {
                        drawGlyph(image, penX, y, cp);
                    }
                    penX += advance_;
                }
            }

        private:
            // library_ must outlive face_, members are destroyed in reverse order
            LibraryHandle library_;
            FaceHandle face_;
            int advance_;
            int lineHeight_ = 0;
            int ascender_ = 0;

            void drawGlyph(RasterImage &image, int penX, int top, char32_t cp) const {
                if (FT_Load_Char(face_.get(), cp, FT_LOAD_RENDER) != 0) {
                    Logger::logDebug("[FreeTypeFontSource] Missing glyph U+" + std::to_string(static_cast<uint32_t>(cp)));
                    return;
                }

                const FT_GlyphSlot slot = face_->glyph;
                const FT_Bitmap &bitmap = slot->bitmap;
                const int originX = penX + slot->bitmap_left;
                const int originY = top + ascender_ - slot->bitmap_top;

                for (unsigned row = 0; row < bitmap.rows; ++row) {
                    const unsigned char *src = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
                    for (unsigned col = 0; col < bitmap.width; ++col) {
                        bool ink;
                        if (bitmap.pixel_mode == FT_PIXEL_MODE_MONO) {
                            ink = (src[col >> 3] & (0x80 >> (col & 7))) != 0;
                        } else {
                            ink = src[col] >= COVERAGE_THRESHOLD;
                        }
                        if (ink) {
                            image.set(originX + static_cast<int>(col), originY + static_cast<int>(row),
                                      RasterImage::BLACK);
                        }
                    }
                }
            }
        };

        int measureAdvance(FT_Face face, int pixelSize) {
            if (FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(pixelSize)) != 0) {
                return -1;
            }
            if (FT_Load_Char(face, 'M', FT_LOAD_DEFAULT) != 0) {
                return -1;
            }
            return ceilPixels(face->glyph->advance.x);
        }

        std::pair<LibraryHandle, FaceHandle> loadScalableFace(const std::string &path) {
            FT_Library rawLibrary = nullptr;
            if (FT_Init_FreeType(&rawLibrary) != 0) {
                throw types::RenderError("FreeType initialization failed");
            }
            LibraryHandle library(rawLibrary);

            FT_Face rawFace = nullptr;
            if (FT_New_Face(library.get(), path.c_str(), 0, &rawFace) != 0) {
                throw types::RenderError("cannot load font " + path);
            }
            FaceHandle face(rawFace);

            if (!FT_IS_SCALABLE(face.get())) {
                throw types::RenderError("font is not scalable: " + path);
            }
            return {std::move(library), std::move(face)};
        }
    }

    FreeTypeFontSource::FreeTypeFontSource(FontLocator locator) : locator_(std::move(locator)) {
    }

    std::unique_ptr<FontFace> FreeTypeFontSource::fit(int areaWidth, int columns) {
        const std::string path = locator_.locate();
        auto [library, face] = loadScalableFace(path);

        // Largest pixel size whose column advance still fits the text area
        int low = MIN_PIXEL_SIZE;
        int high = MAX_PIXEL_SIZE;
        int best = MIN_PIXEL_SIZE;
        while (low <= high) {
            int mid = (low + high) / 2;
            int advance = measureAdvance(face.get(), mid);
            if (advance < 0) {
                throw types::RenderError("cannot measure glyphs of " + path);
            }
            if (advance * columns <= areaWidth) {
                best = mid;
                low = mid + 1;
            } else {
                high = mid - 1;
            }
        }

        int advance = measureAdvance(face.get(), best);
        if (advance <= 0) {
            throw types::RenderError("cannot measure glyphs of " + path);
        }

        lastPixelSize_ = best;
        Logger::logDebug("[FreeTypeFontSource] " + path + " fitted at " + std::to_string(best) + "px, advance " +
                         std::to_string(advance) + " x " + std::to_string(columns) + " columns in " +
                         std::to_string(areaWidth) + " dots");

        return std::make_unique<FreeTypeFontFace>(std::move(library), std::move(face), advance);
    }

    int FreeTypeFontSource::advanceAt(int pixelSize) const {
        const std::string path = locator_.locate();
        auto loaded = loadScalableFace(path);
        int advance = measureAdvance(loaded.second.get(), pixelSize);
        if (advance < 0) {
            throw types::RenderError("cannot measure glyphs of " + path);
        }
        return advance;
    }

} // namespace core::layout
