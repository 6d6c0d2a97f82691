//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include "core/print/PrintRequest.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace connector::http {
    constexpr size_t DEFAULT_MAX_BODY_BYTES = 10240;
    inline const std::string PRINT_PATH = "/print";
    inline const std::string USAGE_LINE = "Usage: GET /print?text=...&qr=... or POST /print with JSON body.\n";

    /**
     * @brief Either a normalized print request or the HTTP rejection to send instead.
     */
    struct ParsedRequest {
        int status = 200;
        std::string message;
        std::optional<core::print::PrintRequest> request;

        bool accepted() const {
            return request.has_value();
        }

        static ParsedRequest accept(core::print::PrintRequest request) {
            return {200, "", std::move(request)};
        }

        static ParsedRequest reject(int status, std::string message) {
            return {status, std::move(message), std::nullopt};
        }
    };

    /**
     * @brief Maps an HTTP request onto a PrintRequest. No I/O, no printing.
     *
     * Query parameters win over the body. A POST body is read only when the query
     * carries neither "text" nor "qr".
     */
    class RequestParser {
    public:
        explicit RequestParser(size_t maxBodyBytes = DEFAULT_MAX_BODY_BYTES);

        ParsedRequest parse(const std::string &method, const std::string &target, const std::string &body) const;

        size_t maxBodyBytes() const { return maxBodyBytes_; }

        static std::string percentDecode(const std::string &encoded);

        /**
         * @brief Query string split into decoded pairs, blank values dropped.
         */
        static std::vector<std::pair<std::string, std::string>> parseQuery(const std::string &query);

        static std::string pathOf(const std::string &target);

    private:
        size_t maxBodyBytes_;

        ParsedRequest fromBody(const std::string &body) const;

        static ParsedRequest finish(std::string text, std::optional<std::string> qr);
    };

} // namespace connector::http
