//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/device/DeviceResolver.hpp"
#include "core/device/TargetSpec.hpp"
#include "core/encoder/CommandEncoder.hpp"
#include "core/layout/LayoutEngine.hpp"
#include "core/print/JobState.hpp"
#include "core/print/PrintRequest.hpp"
#include "core/transport/Transport.hpp"
#include "core/types/Result.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace core::print {

    struct CoordinatorConfig {
        // Wall-clock budget of a BLE job, from Composing to the end of Delivering
        std::chrono::milliseconds printTimeout{60000};
    };

    using JobObserver = std::function<void(uint64_t jobId, JobState from, JobState to)>;

    /**
     * @brief Runs one print job at a time: resolve and compose, encode, deliver.
     *
     * Jobs are serialized by a single lock held from Composing until Delivering is
     * left, whatever the outcome. BLE jobs run under a deadline; serial jobs do not.
     * print() never throws: every failure becomes a Result and one error log line.
     */
    class PrintCoordinator {
    public:
        PrintCoordinator(device::TargetSpec target,
                         std::shared_ptr<device::DeviceResolver> resolver,
                         std::shared_ptr<layout::Composer> composer,
                         std::shared_ptr<encoder::CommandEncoder> encoder,
                         std::shared_ptr<transport::Transport> transport,
                         CoordinatorConfig config = {});

        types::Result print(const PrintRequest &request);

        /**
         * @brief Observers are called on the job's thread for each transition; register before serving.
         */
        void addObserver(JobObserver observer);

        JobState currentState() const;

        uint64_t jobsStarted() const;

        const device::TargetSpec &target() const;

    private:
        device::TargetSpec target_;
        std::shared_ptr<device::DeviceResolver> resolver_;
        std::shared_ptr<layout::Composer> composer_;
        std::shared_ptr<encoder::CommandEncoder> encoder_;
        std::shared_ptr<transport::Transport> transport_;
        CoordinatorConfig config_;

        std::mutex jobMutex_;
        std::atomic<JobState> state_{JobState::IDLE};
        std::atomic<uint64_t> jobCounter_{0};
        std::vector<JobObserver> observers_;

        void transition(uint64_t jobId, JobState next);

        void runJob(uint64_t jobId, const PrintRequest &request);

        types::Deadline deadlineFor() const;
    };

} // namespace core::print
