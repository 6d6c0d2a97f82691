//
// Created by Andrea on 14/10/2025.
//

#include "core/layout/TextFlow.hpp"
#include "core/utils/Utf8.hpp"

#include <algorithm>

namespace core::layout {

    namespace {
        bool isSpace(char32_t c) {
            return c == U' ' || c == U'\t' || c == U'\r' || c == U'\f' || c == U'\v';
        }

        bool isBlankLine(const std::u32string &line) {
            return std::all_of(line.begin(), line.end(), isSpace);
        }

        std::u32string rightTrimmed(std::u32string value) {
            while (!value.empty() && isSpace(value.back())) {
                value.pop_back();
            }
            return value;
        }

        /**
         * @brief Alternating runs of whitespace and non-whitespace, in order.
         */
        std::vector<std::u32string> splitChunks(const std::u32string &line) {
            std::vector<std::u32string> chunks;
            std::u32string current;
            bool currentIsSpace = false;

            for (char32_t c: line) {
                bool space = isSpace(c);
                if (!current.empty() && space != currentIsSpace) {
                    chunks.push_back(current);
                    current.clear();
                }
                currentIsSpace = space;
                current.push_back(c == U'\t' ? U' ' : c);
            }
            if (!current.empty()) {
                chunks.push_back(current);
            }
            return chunks;
        }
    }

    int columnsForWidth(int widthDots) {
        return std::max(1, widthDots / DOTS_PER_COLUMN);
    }

    std::u32string expandTabs(const std::u32string &line, int tabStop) {
        std::u32string out;
        out.reserve(line.size());
        for (char32_t c: line) {
            if (c == U'\t') {
                size_t pad = tabStop - (out.size() % tabStop);
                out.append(pad, U' ');
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    std::vector<std::u32string> wrapLine(const std::u32string &line, int columns) {
        const size_t width = static_cast<size_t>(std::max(1, columns));
        std::vector<std::u32string> lines;
        std::u32string current;
        bool firstLine = true;

        auto flush = [&]() {
            auto trimmed = rightTrimmed(current);
            if (!trimmed.empty()) {
                lines.push_back(trimmed);
                firstLine = false;
            }
            current.clear();
        };

        for (const auto &chunk: splitChunks(line)) {
            bool space = isSpace(chunk.front());

            if (space) {
                // Indentation survives only at the very start of the paragraph
                if (current.empty() && !firstLine) continue;
                if (current.size() + chunk.size() <= width) {
                    current += chunk;
                } else {
                    flush();
                }
                continue;
            }

            if (current.size() + chunk.size() <= width) {
                current += chunk;
                continue;
            }

            flush();

            std::u32string word = chunk;
            while (word.size() > width) {
                lines.push_back(word.substr(0, width));
                firstLine = false;
                word.erase(0, width);
            }
            current = word;
        }

        flush();
        return lines;
    }

    std::vector<std::string> wrapText(const std::string &text, int columns) {
        std::vector<std::string> output;

        size_t start = 0;
        while (true) {
            size_t end = text.find('\n', start);
            std::string raw = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
            if (!raw.empty() && raw.back() == '\r') {
                raw.pop_back();
            }

            auto expanded = expandTabs(utils::decodeUtf8(raw));
            if (isBlankLine(expanded)) {
                output.emplace_back();
            } else {
                for (const auto &wrapped: wrapLine(expanded, columns)) {
                    output.push_back(utils::encodeUtf8(wrapped));
                }
            }

            if (end == std::string::npos) break;
            start = end + 1;
        }

        if (output.empty()) {
            output.emplace_back();
        }
        return output;
    }

} // namespace core::layout
