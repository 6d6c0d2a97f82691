//
// Created by Andrea on 18/10/2025.
//

#include "connector/controllers/PrintController.hpp"
#include "logger/Logger.hpp"
#include <stdexcept>
#include <utility>

namespace connector::controllers {
    PrintController::PrintController(std::shared_ptr<core::print::PrintCoordinator> coordinator,
                                     http::RequestParser parser)
        : coordinator_(std::move(coordinator)), parser_(parser) {
        if (!coordinator_) {
            throw std::invalid_argument("PrintCoordinator cannot be null");
        }
    }

    HttpReply PrintController::handle(const std::string &method, const std::string &target, const std::string &body) {
        ++requestsReceived_;

        auto parsed = parser_.parse(method, target, body);
        if (!parsed.accepted()) {
            ++requestsRejected_;
            Logger::logWarning("[PrintController] " + method + " " + target + " rejected with " +
                               std::to_string(parsed.status));
            return {parsed.status, parsed.message};
        }

        auto result = coordinator_->print(*parsed.request);
        if (!result.isSuccess()) {
            ++jobsFailed_;
            return {500, "Print error - check server logs.\n"};
        }

        ++jobsSucceeded_;
        return {200, "OK\n"};
    }

    size_t PrintController::maxBodyBytes() const {
        return parser_.maxBodyBytes();
    }

    PrintController::Statistics PrintController::getStatistics() const {
        Statistics stats;
        stats.requestsReceived = requestsReceived_.load();
        stats.requestsRejected = requestsRejected_.load();
        stats.jobsSucceeded = jobsSucceeded_.load();
        stats.jobsFailed = jobsFailed_.load();
        return stats;
    }
} // namespace connector::controllers
