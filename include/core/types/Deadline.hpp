//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include "core/types/Error.hpp"
#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <thread>

namespace core::types {

    /**
     * @brief Wall-clock budget of a single print job.
     *
     * Every suspension point (discovery scan, paced write, connect) calls
     * checkpoint() or sleepFor(), which throw TimeoutError once expired.
     * An unbounded deadline never expires.
     */
    class Deadline {
    public:
        using Clock = std::chrono::steady_clock;

        static Deadline unbounded() {
            return Deadline(std::nullopt);
        }

        static Deadline after(std::chrono::milliseconds budget) {
            return Deadline(Clock::now() + budget);
        }

        bool isBounded() const {
            return expiresAt_.has_value();
        }

        std::optional<Clock::time_point> expiresAt() const {
            return expiresAt_;
        }

        bool expired() const {
            return expiresAt_ && Clock::now() >= *expiresAt_;
        }

        std::chrono::milliseconds remaining() const {
            if (!expiresAt_) return std::chrono::milliseconds::max();
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*expiresAt_ - Clock::now());
            return left.count() > 0 ? left : std::chrono::milliseconds(0);
        }

        /**
         * @brief Clamps a bounded wait (e.g. a scan timeout) to what is left of the job budget.
         */
        std::chrono::milliseconds clamp(std::chrono::milliseconds wait) const {
            return std::min(wait, remaining());
        }

        void checkpoint(const std::string &where) const {
            if (expired()) {
                throw TimeoutError(where);
            }
        }

        void sleepFor(std::chrono::milliseconds pause, const std::string &where) const {
            if (pause.count() > 0) {
                std::this_thread::sleep_for(clamp(pause));
            }
            checkpoint(where);
        }

    private:
        explicit Deadline(std::optional<Clock::time_point> expiresAt) : expiresAt_(expiresAt) {}

        std::optional<Clock::time_point> expiresAt_;
    };

}
