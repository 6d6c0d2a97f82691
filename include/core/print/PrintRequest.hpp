//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace core::print {

    /**
     * @brief One normalized print request. Without a QR payload the layout is text-only.
     */
    struct PrintRequest {
        std::string text;
        std::optional<std::string> qr;

        bool hasQr() const {
            return qr.has_value();
        }

        /**
         * @brief Builds a request applying the defaulting rule: empty text falls back to the QR payload.
         */
        static PrintRequest make(std::string text, std::optional<std::string> qr) {
            PrintRequest request{std::move(text), std::move(qr)};
            if (request.text.empty() && request.qr) {
                request.text = *request.qr;
            }
            return request;
        }
    };

} // namespace core::print
