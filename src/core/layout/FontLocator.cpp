//
// Created by Andrea on 15/10/2025.
//

#include "core/layout/FontLocator.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <fontconfig/fontconfig.h>
#include <filesystem>
#include <utility>

namespace core::layout {

    FontLocator::FontLocator(std::string explicitPath) : explicitPath_(std::move(explicitPath)) {
    }

    std::string FontLocator::locate() const {
        if (!explicitPath_.empty()) {
            if (std::filesystem::exists(explicitPath_)) {
                return explicitPath_;
            }
            Logger::logWarning("[FontLocator] Configured font not found: " + explicitPath_ + ", searching system fonts");
        }

        if (auto match = queryFontconfig("monospace:bold")) {
            Logger::logDebug("[FontLocator] fontconfig matched " + *match);
            return *match;
        }

        for (const auto &candidate: wellKnownPaths()) {
            if (std::filesystem::exists(candidate)) {
                return candidate;
            }
        }

        throw types::RenderError("no monospace bold font found (set font.path)");
    }

    std::optional<std::string> FontLocator::queryFontconfig(const std::string &pattern) {
        FcConfig *config = FcInitLoadConfigAndFonts();
        if (!config) return std::nullopt;

        std::optional<std::string> result;
        FcPattern *query = FcNameParse(reinterpret_cast<const FcChar8 *>(pattern.c_str()));
        if (query) {
            FcConfigSubstitute(config, query, FcMatchPattern);
            FcDefaultSubstitute(query);

            FcResult matchResult = FcResultNoMatch;
            FcPattern *match = FcFontMatch(config, query, &matchResult);
            if (match) {
                FcChar8 *file = nullptr;
                int spacing = FC_PROPORTIONAL;
                FcPatternGetInteger(match, FC_SPACING, 0, &spacing);
                if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file &&
                    spacing == FC_MONO && std::filesystem::exists(reinterpret_cast<const char *>(file))) {
                    result = std::string(reinterpret_cast<const char *>(file));
                }
                FcPatternDestroy(match);
            }
            FcPatternDestroy(query);
        }

        FcConfigDestroy(config);
        return result;
    }

    const std::vector<std::string> &FontLocator::wellKnownPaths() {
        static const std::vector<std::string> paths = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSansMono-Bold.ttf",
            "/usr/share/fonts/dejavu/DejaVuSansMono-Bold.ttf",
            "/usr/share/fonts/TTF/DejaVuSansMono-Bold.ttf",
            "/usr/share/fonts/truetype/liberation/LiberationMono-Bold.ttf",
            "/usr/share/fonts/liberation-mono/LiberationMono-Bold.ttf",
        };
        return paths;
    }

} // namespace core::layout
