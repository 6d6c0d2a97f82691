//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/types/Deadline.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace core::transport {

    /**
     * @brief Splits a stream into consecutive chunks of at most mtu bytes and hands each
     * to a writer, pausing for the interval after every chunk (the last one included).
     */
    class ChunkPacer {
    public:
        using Writer = std::function<void(const uint8_t *data, size_t size)>;

        ChunkPacer(size_t mtu, std::chrono::milliseconds interval);

        /**
         * @return number of chunks written
         */
        size_t run(const std::vector<uint8_t> &stream, const Writer &writer, const types::Deadline &deadline) const;

        size_t chunkCount(size_t streamSize) const;

    private:
        size_t mtu_;
        std::chrono::milliseconds interval_;
    };

} // namespace core::transport
