//
// Created by Andrea on 15/10/2025.
//

#include "core/layout/StructuredText.hpp"

namespace core::layout {

    namespace {
        bool isContainer(const nlohmann::ordered_json &value) {
            return value.is_object() || value.is_array();
        }

        void flattenInto(const nlohmann::ordered_json &value, int depth, std::vector<std::string> &lines) {
            const std::string indent(static_cast<size_t>(depth * STRUCTURED_INDENT), ' ');

            switch (value.type()) {
                case nlohmann::ordered_json::value_t::object:
                    for (auto it = value.begin(); it != value.end(); ++it) {
                        if (isContainer(it.value())) {
                            lines.push_back(indent + it.key() + ":");
                            flattenInto(it.value(), depth + 1, lines);
                        } else {
                            lines.push_back(indent + it.key() + ": " + scalarToText(it.value()));
                        }
                    }
                    break;

                case nlohmann::ordered_json::value_t::array:
                    for (const auto &element: value) {
                        if (isContainer(element)) {
                            flattenInto(element, depth, lines);
                        } else {
                            lines.push_back(indent + scalarToText(element));
                        }
                    }
                    break;

                default:
                    lines.push_back(indent + scalarToText(value));
                    break;
            }
        }
    }

    std::string scalarToText(const nlohmann::ordered_json &value) {
        if (value.is_string()) {
            return value.get<std::string>();
        }
        return value.dump();
    }

    std::vector<std::string> flattenStructuredLines(const nlohmann::ordered_json &value) {
        std::vector<std::string> lines;
        flattenInto(value, 0, lines);
        return lines;
    }

    std::string flattenStructured(const nlohmann::ordered_json &value) {
        auto lines = flattenStructuredLines(value);
        std::string text;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) text += "\n";
            text += lines[i];
        }
        return text;
    }

} // namespace core::layout
