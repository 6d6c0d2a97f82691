//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <string>

namespace core::utils {

    /**
     * @brief Decodes UTF-8 into code points. Malformed sequences become U+FFFD.
     */
    inline std::u32string decodeUtf8(const std::string &input) {
        std::u32string out;
        out.reserve(input.size());

        size_t i = 0;
        while (i < input.size()) {
            auto lead = static_cast<unsigned char>(input[i]);
            char32_t cp;
            size_t extra;

            if (lead < 0x80) {
                cp = lead;
                extra = 0;
            } else if ((lead & 0xE0) == 0xC0) {
                cp = lead & 0x1F;
                extra = 1;
            } else if ((lead & 0xF0) == 0xE0) {
                cp = lead & 0x0F;
                extra = 2;
            } else if ((lead & 0xF8) == 0xF0) {
                cp = lead & 0x07;
                extra = 3;
            } else {
                out.push_back(U'\uFFFD');
                ++i;
                continue;
            }

            if (i + extra >= input.size()) {
                out.push_back(U'\uFFFD');
                break;
            }

            bool valid = true;
            for (size_t k = 1; k <= extra; ++k) {
                auto cont = static_cast<unsigned char>(input[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (cont & 0x3F);
            }

            if (!valid) {
                out.push_back(U'\uFFFD');
                ++i;
                continue;
            }

            out.push_back(cp);
            i += extra + 1;
        }
        return out;
    }

    inline std::string encodeUtf8(const std::u32string &input) {
        std::string out;
        out.reserve(input.size());

        for (char32_t cp: input) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }
        return out;
    }

} // namespace core::utils
