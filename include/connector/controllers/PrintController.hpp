//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include "connector/http/RequestParser.hpp"
#include "core/print/PrintCoordinator.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace connector::controllers {

    struct HttpReply {
        int status = 200;
        std::string body;
    };

    /**
     * @brief Glue between the HTTP endpoint and the print coordinator.
     */
    class PrintController {
    public:
        PrintController(std::shared_ptr<core::print::PrintCoordinator> coordinator,
                        http::RequestParser parser = http::RequestParser());

        HttpReply handle(const std::string &method, const std::string &target, const std::string &body);

        size_t maxBodyBytes() const;

        struct Statistics {
            size_t requestsReceived = 0;
            size_t requestsRejected = 0;
            size_t jobsSucceeded = 0;
            size_t jobsFailed = 0;
        };

        Statistics getStatistics() const;

    private:
        std::shared_ptr<core::print::PrintCoordinator> coordinator_;
        http::RequestParser parser_;

        std::atomic<size_t> requestsReceived_{0};
        std::atomic<size_t> requestsRejected_{0};
        std::atomic<size_t> jobsSucceeded_{0};
        std::atomic<size_t> jobsFailed_{0};
    };

} // namespace connector::controllers
