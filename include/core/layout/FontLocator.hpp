//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace core::layout {

    /**
     * @brief Finds a monospace bold font file on the host.
     *
     * Search order: explicit path, fontconfig match for "monospace:bold", well-known paths.
     */
    class FontLocator {
    public:
        explicit FontLocator(std::string explicitPath = "");

        /**
         * @throws types::RenderError when nothing usable exists.
         */
        std::string locate() const;

        static std::optional<std::string> queryFontconfig(const std::string &pattern);

        static const std::vector<std::string> &wellKnownPaths();

    private:
        std::string explicitPath_;
    };

} // namespace core::layout
