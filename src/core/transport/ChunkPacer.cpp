//
// Created by Andrea on 17/10/2025.
//

#include "core/transport/ChunkPacer.hpp"

#include <algorithm>
#include <stdexcept>

namespace core::transport {

    ChunkPacer::ChunkPacer(size_t mtu, std::chrono::milliseconds interval) : mtu_(mtu), interval_(interval) {
        if (mtu_ == 0) {
            throw std::invalid_argument("chunk size must be positive");
        }
        if (interval_.count() < 0) {
            interval_ = std::chrono::milliseconds(0);
        }
    }

    size_t ChunkPacer::chunkCount(size_t streamSize) const {
        return (streamSize + mtu_ - 1) / mtu_;
    }

    size_t ChunkPacer::run(const std::vector<uint8_t> &stream, const Writer &writer,
                           const types::Deadline &deadline) const {
        size_t chunks = 0;
        for (size_t offset = 0; offset < stream.size(); offset += mtu_) {
            deadline.checkpoint("delivery");
            const size_t size = std::min(mtu_, stream.size() - offset);
            writer(stream.data() + offset, size);
            ++chunks;
            deadline.sleepFor(interval_, "delivery");
        }
        return chunks;
    }

} // namespace core::transport
