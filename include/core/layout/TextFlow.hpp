//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <string>
#include <vector>

namespace core::layout {
    constexpr int TAB_STOP = 4;
    constexpr int DOTS_PER_COLUMN = 12;

    /**
     * @brief Column count targeted for a text area, one column every DOTS_PER_COLUMN dots (at least 1).
     */
    int columnsForWidth(int widthDots);

    /**
     * @brief Expands tabs to the next multiple of tabStop columns.
     */
    std::u32string expandTabs(const std::u32string &line, int tabStop = TAB_STOP);

    /**
     * @brief Greedy word wrap of a single non-blank line.
     *
     * Breaks between words, keeps the leading indentation on the first output line,
     * drops whitespace at the wrap points and hard-breaks words longer than columns.
     */
    std::vector<std::u32string> wrapLine(const std::u32string &line, int columns);

    /**
     * @brief Splits on newlines, expands tabs, keeps blank lines and wraps the rest.
     * @return UTF-8 output lines, never empty (an empty input yields one blank line).
     */
    std::vector<std::string> wrapText(const std::string &text, int columns);

} // namespace core::layout
