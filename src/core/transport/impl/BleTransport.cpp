//
// Created by Andrea on 17/10/2025.
//

#include "core/transport/impl/BleTransport.hpp"
#include "core/transport/ChunkPacer.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace core::transport {

    struct BleTransport::Delivery {
        std::mutex mutex;
        std::condition_variable finishedCv;
        bool finished = false;
        std::exception_ptr error;
        std::atomic<bool> abandoned{false};

        // false when the deadline passed first
        bool waitUntil(const types::Deadline &deadline) {
            std::unique_lock<std::mutex> lock(mutex);
            auto isFinished = [this] { return finished; };
            if (auto expiresAt = deadline.expiresAt()) {
                return finishedCv.wait_until(lock, *expiresAt, isFinished);
            }
            finishedCv.wait(lock, isFinished);
            return true;
        }

        bool waitFor(std::chrono::milliseconds grace) {
            std::unique_lock<std::mutex> lock(mutex);
            return finishedCv.wait_for(lock, grace, [this] { return finished; });
        }
    };

    BleTransport::BleTransport(std::shared_ptr<ble::BleLink> link, std::string characteristicUuid)
            : link_(std::move(link)), characteristicUuid_(std::move(characteristicUuid)) {
        if (!link_) {
            throw std::invalid_argument("BleTransport requires a link");
        }
    }

    BleTransport::~BleTransport() {
        if (!worker_.joinable()) {
            return;
        }
        if (pending_->waitFor(DRAIN_GRACE)) {
            worker_.join();
            return;
        }
        pending_->abandoned = true;
        link_->disconnect();
        Logger::logWarning("[BleTransport] Leaving a stalled delivery behind on shutdown");
        worker_.detach();
    }

    void BleTransport::reap() {
        worker_.join();
        pending_.reset();
    }

    void BleTransport::awaitPrevious(const types::Deadline &deadline) {
        if (!worker_.joinable()) {
            return;
        }
        if (!pending_->waitUntil(deadline)) {
            throw types::TimeoutError("wait for the previous delivery to drain");
        }
        reap();
    }

    void BleTransport::deliver(const device::ResolvedDevice &device,
                               const std::vector<uint8_t> &stream,
                               const types::Deadline &deadline) {
        const auto &profile = device.profile;
        ChunkPacer pacer(static_cast<size_t>(profile.mtuOr(device::DEFAULT_BLE_MTU)),
                         std::chrono::milliseconds(profile.intervalOr(device::DEFAULT_WRITE_INTERVAL_MS)));

        awaitPrevious(deadline);

        Logger::logInfo("[BleTransport] Sending " + std::to_string(stream.size()) + " bytes to " +
                        device.address + " in " + std::to_string(pacer.chunkCount(stream.size())) + " chunks");

        auto delivery = std::make_shared<Delivery>();
        pending_ = delivery;
        worker_ = std::thread([delivery, link = link_, characteristic = characteristicUuid_,
                                      address = device.address, payload = stream, pacer, deadline]() {
            try {
                deadline.checkpoint("connect");
                link->connect(address, characteristic, deadline);
                deadline.checkpoint("connect");

                pacer.run(payload, [&](const uint8_t *data, size_t size) {
                    if (delivery->abandoned) {
                        throw types::TimeoutError("delivery");
                    }
                    link->writeWithoutResponse(data, size);
                }, deadline);
            } catch (const std::exception &) {
                // Handed to the caller below
                delivery->error = std::current_exception();
            }
            link->disconnect();
            {
                std::lock_guard<std::mutex> lock(delivery->mutex);
                delivery->finished = true;
            }
            delivery->finishedCv.notify_all();
        });

        if (!delivery->waitUntil(deadline)) {
            delivery->abandoned = true;
            Logger::logWarning("[BleTransport] Deadline passed mid-delivery, forcing the link to " +
                               device.address + " down");
            link_->disconnect();
            throw types::TimeoutError("delivery");
        }
        reap();

        if (delivery->error) {
            try {
                std::rethrow_exception(delivery->error);
            } catch (const types::PrintException &) {
                throw;
            } catch (const std::exception &e) {
                throw types::TransportError(e.what());
            }
        }
        Logger::logInfo("[BleTransport] Delivery to " + device.address + " complete");
    }

} // namespace core::transport
