//
// Created by Andrea on 18/10/2025.
//

#include "connector/http/RequestParser.hpp"
#include "core/layout/StructuredText.hpp"
#include "core/utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

namespace connector::http {
    namespace {
        int hexValue(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        std::optional<std::string> firstValue(const std::vector<std::pair<std::string, std::string>> &params,
                                              const std::string &key) {
            for (const auto &[name, value]: params) {
                if (name == key) return value;
            }
            return std::nullopt;
        }
    }

    RequestParser::RequestParser(size_t maxBodyBytes) : maxBodyBytes_(maxBodyBytes) {
    }

    std::string RequestParser::percentDecode(const std::string &encoded) {
        std::string decoded;
        decoded.reserve(encoded.size());
        for (size_t i = 0; i < encoded.size(); ++i) {
            char c = encoded[i];
            if (c == '+') {
                decoded += ' ';
            } else if (c == '%' && i + 2 < encoded.size() &&
                       hexValue(encoded[i + 1]) >= 0 && hexValue(encoded[i + 2]) >= 0) {
                decoded += static_cast<char>(hexValue(encoded[i + 1]) * 16 + hexValue(encoded[i + 2]));
                i += 2;
            } else {
                decoded += c;
            }
        }
        return decoded;
    }

    std::vector<std::pair<std::string, std::string>> RequestParser::parseQuery(const std::string &query) {
        std::vector<std::pair<std::string, std::string>> params;
        size_t start = 0;
        while (start <= query.size()) {
            size_t end = query.find_first_of("&;", start);
            if (end == std::string::npos) end = query.size();

            std::string field = query.substr(start, end - start);
            if (!field.empty()) {
                size_t eq = field.find('=');
                std::string name = percentDecode(field.substr(0, eq));
                std::string value = eq == std::string::npos ? "" : percentDecode(field.substr(eq + 1));
                if (!value.empty()) {
                    params.emplace_back(std::move(name), std::move(value));
                }
            }
            start = end + 1;
        }
        return params;
    }

    std::string RequestParser::pathOf(const std::string &target) {
        return target.substr(0, target.find_first_of("?#"));
    }

    ParsedRequest RequestParser::parse(const std::string &method, const std::string &target,
                                       const std::string &body) const {
        if (pathOf(target) != PRINT_PATH) {
            return ParsedRequest::reject(404, "Not found.\n\n" + USAGE_LINE);
        }
        if (method != "GET" && method != "POST") {
            return ParsedRequest::reject(405, "Method not allowed.\n\n" + USAGE_LINE);
        }

        std::string query;
        size_t questionMark = target.find('?');
        if (questionMark != std::string::npos) {
            query = target.substr(questionMark + 1);
            query = query.substr(0, query.find('#'));
        }

        const auto params = parseQuery(query);
        auto textParam = firstValue(params, "text");
        auto qrParam = firstValue(params, "qr");
        if (textParam || qrParam) {
            return finish(textParam.value_or(""), qrParam);
        }

        if (method == "POST" && !body.empty()) {
            return fromBody(body);
        }

        return ParsedRequest::reject(400, "Missing \"text\" or \"qr\" parameter.\n\n" + USAGE_LINE);
    }

    ParsedRequest RequestParser::fromBody(const std::string &body) const {
        if (body.size() > maxBodyBytes_) {
            return ParsedRequest::reject(413, "Request body too large (max " + std::to_string(maxBodyBytes_) +
                                              " bytes).\n");
        }

        nlohmann::ordered_json json;
        try {
            json = nlohmann::ordered_json::parse(body);
        } catch (const nlohmann::json::parse_error &) {
            return ParsedRequest::reject(400, "Invalid JSON body.\n");
        }

        if (!json.is_object()) {
            return ParsedRequest::reject(400, "JSON body must be an object.\n");
        }

        auto member = [&json](const char *key) -> const nlohmann::ordered_json * {
            auto it = json.find(key);
            if (it == json.end() || it->is_null()) return nullptr;
            return &*it;
        };

        const auto *textValue = member("text");
        const auto *qrValue = member("qr");
        if (!textValue && !qrValue) {
            return ParsedRequest::reject(400, "JSON body must contain \"text\" and/or \"qr\".\n");
        }

        std::string text;
        if (textValue) {
            text = textValue->is_structured() ? core::layout::flattenStructured(*textValue)
                                              : core::layout::scalarToText(*textValue);
        }

        std::optional<std::string> qr;
        if (qrValue) {
            qr = qrValue->is_string() ? qrValue->get<std::string>() : qrValue->dump();
        }

        return finish(std::move(text), std::move(qr));
    }

    ParsedRequest RequestParser::finish(std::string text, std::optional<std::string> qr) {
        if (qr && core::utils::isBlank(*qr)) {
            return ParsedRequest::reject(400, "Empty text.\n");
        }

        auto request = core::print::PrintRequest::make(std::move(text), std::move(qr));
        if (core::utils::isBlank(request.text)) {
            return ParsedRequest::reject(400, "Empty text.\n");
        }
        return ParsedRequest::accept(std::move(request));
    }

} // namespace connector::http
