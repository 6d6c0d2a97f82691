//
// Created by Andrea on 17/10/2025.
//

#include "core/print/PrintCoordinator.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace core::print {

    PrintCoordinator::PrintCoordinator(device::TargetSpec target,
                                       std::shared_ptr<device::DeviceResolver> resolver,
                                       std::shared_ptr<layout::Composer> composer,
                                       std::shared_ptr<encoder::CommandEncoder> encoder,
                                       std::shared_ptr<transport::Transport> transport,
                                       CoordinatorConfig config)
            : target_(std::move(target)),
              resolver_(std::move(resolver)),
              composer_(std::move(composer)),
              encoder_(std::move(encoder)),
              transport_(std::move(transport)),
              config_(config) {
        if (!resolver_ || !composer_ || !encoder_ || !transport_) {
            throw std::invalid_argument("PrintCoordinator requires resolver, composer, encoder and transport");
        }
    }

    void PrintCoordinator::addObserver(JobObserver observer) {
        std::lock_guard<std::mutex> lock(jobMutex_);
        observers_.push_back(std::move(observer));
    }

    JobState PrintCoordinator::currentState() const {
        return state_.load();
    }

    uint64_t PrintCoordinator::jobsStarted() const {
        return jobCounter_.load();
    }

    const device::TargetSpec &PrintCoordinator::target() const {
        return target_;
    }

    types::Deadline PrintCoordinator::deadlineFor() const {
        if (target_.kind == device::TransportKind::BLE) {
            return types::Deadline::after(config_.printTimeout);
        }
        return types::Deadline::unbounded();
    }

    void PrintCoordinator::transition(uint64_t jobId, JobState next) {
        JobState previous = state_.exchange(next);
        Logger::logDebug("[PrintCoordinator] Job #" + std::to_string(jobId) + " " +
                         jobStateToCode(previous) + " -> " + jobStateToCode(next));

        for (const auto &observer: observers_) {
            try {
                observer(jobId, previous, next);
            } catch (const std::exception &e) {
                Logger::logWarning("[PrintCoordinator] Observer failed: " + std::string(e.what()));
            }
        }
    }

    void PrintCoordinator::runJob(uint64_t jobId, const PrintRequest &request) {
        const auto deadline = deadlineFor();

        transition(jobId, JobState::COMPOSING);
        const auto device = resolver_->resolve(target_, deadline);
        const auto image = composer_->compose(request.text, request.qr, device.profile.normalizedWidth());
        deadline.checkpoint("composition");

        transition(jobId, JobState::ENCODING);
        const auto stream = encoder_->encode(image, device.profile);
        deadline.checkpoint("encoding");

        transition(jobId, JobState::DELIVERING);
        transport_->deliver(device, stream, deadline);
    }

    types::Result PrintCoordinator::print(const PrintRequest &request) {
        std::lock_guard<std::mutex> lock(jobMutex_);
        const uint64_t jobId = ++jobCounter_;

        Logger::logInfo("[PrintCoordinator] Job #" + std::to_string(jobId) + " started (" +
                        (request.hasQr() ? "text+qr" : "text only") + ", " +
                        device::transportKindToString(target_.kind) + " " + target_.addressOrPath + ")");

        types::Result result = types::Result::success("OK");
        try {
            runJob(jobId, request);
        } catch (const types::TimeoutError &e) {
            result = types::Result::failure(types::ResultCode::Timeout, e.what());
        } catch (const types::RenderError &e) {
            result = types::Result::failure(types::ResultCode::RenderError, e.what());
        } catch (const types::DeviceNotFoundError &e) {
            result = types::Result::failure(types::ResultCode::DeviceNotFound, e.what());
        } catch (const types::UnknownModelError &e) {
            result = types::Result::failure(types::ResultCode::UnknownModel, e.what());
        } catch (const types::ModelRequiredError &e) {
            result = types::Result::failure(types::ResultCode::ModelRequired, e.what());
        } catch (const types::TransportError &e) {
            result = types::Result::failure(types::ResultCode::TransportError, e.what());
        } catch (const std::exception &e) {
            result = types::Result::error(e.what());
        }

        if (result.isSuccess()) {
            transition(jobId, JobState::DONE);
            Logger::logInfo("[PrintCoordinator] Job #" + std::to_string(jobId) + " done");
        } else {
            transition(jobId, JobState::FAILED);
            Logger::logError("[PrintCoordinator] Job #" + std::to_string(jobId) + " failed [" +
                             types::resultCodeToString(result.code) + "]: " + result.message);
        }

        state_ = JobState::IDLE;
        return result;
    }

} // namespace core::print
