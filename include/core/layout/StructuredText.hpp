//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace core::layout {
    constexpr int STRUCTURED_INDENT = 2;

    /**
     * @brief Flattens a structured payload into printable lines.
     *
     * Objects print "key: value" in declared order; a nested value gets a "key:" header
     * followed by its block indented by STRUCTURED_INDENT spaces per level. Arrays print
     * one scalar per line and recurse into nested containers without a key prefix.
     */
    std::vector<std::string> flattenStructuredLines(const nlohmann::ordered_json &value);

    std::string flattenStructured(const nlohmann::ordered_json &value);

    /**
     * @brief Scalar rendering: strings verbatim, everything else in JSON notation.
     */
    std::string scalarToText(const nlohmann::ordered_json &value);

} // namespace core::layout
