//
// Created by Andrea on 17/10/2025.
//

#include "core/encoder/TiMiniEncoder.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <string>

namespace core::encoder {
    namespace {
        const std::vector<uint8_t> LATTICE_START = {0xAA, 0x55, 0x17, 0x38, 0x44, 0x5F, 0x5F, 0x5F, 0x44, 0x38, 0x2C};
        const std::vector<uint8_t> LATTICE_END = {0xAA, 0x55, 0x17, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x17};

        std::vector<uint8_t> le16(uint16_t value) {
            return {static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>((value >> 8) & 0xFF)};
        }
    }

    TiMiniEncoder::TiMiniEncoder(EncoderSettings settings) : settings_(settings) {
    }

    uint8_t TiMiniEncoder::crc8(const uint8_t *data, size_t size) {
        uint8_t crc = 0;
        for (size_t i = 0; i < size; ++i) {
            crc ^= data[i];
            for (int bit = 0; bit < 8; ++bit) {
                crc = (crc & 0x80) ? static_cast<uint8_t>((crc << 1) ^ 0x07) : static_cast<uint8_t>(crc << 1);
            }
        }
        return crc;
    }

    void TiMiniEncoder::appendPacket(std::vector<uint8_t> &out, uint8_t command, const std::vector<uint8_t> &payload) {
        out.push_back(0x51);
        out.push_back(0x78);
        out.push_back(command);
        out.push_back(0x00);
        out.push_back(static_cast<uint8_t>(payload.size() & 0xFF));
        out.push_back(static_cast<uint8_t>((payload.size() >> 8) & 0xFF));
        out.insert(out.end(), payload.begin(), payload.end());
        out.push_back(crc8(payload.data(), payload.size()));
        out.push_back(0xFF);
    }

    std::vector<uint8_t> TiMiniEncoder::packRow(const layout::RasterImage &image, int y, int widthDots) {
        std::vector<uint8_t> row(static_cast<size_t>(widthDots / 8), 0);
        const int limit = std::min(widthDots, image.width());
        for (int x = 0; x < limit; ++x) {
            if (image.at(x, y) < 128) {
                row[x / 8] |= static_cast<uint8_t>(1u << (x % 8));
            }
        }
        return row;
    }

    std::vector<uint8_t> TiMiniEncoder::encode(const layout::RasterImage &image,
                                               const device::DeviceProfile &profile) const {
        const int width = profile.normalizedWidth();
        if (image.width() != width) {
            Logger::logDebug("[TiMiniEncoder] Raster width " + std::to_string(image.width()) +
                             " fitted to " + std::to_string(width) + " dots");
        }

        std::vector<uint8_t> out;
        out.reserve(static_cast<size_t>(image.height()) * (width / 8 + 8) + 128);

        appendPacket(out, CMD_QUALITY, {0x33});
        appendPacket(out, CMD_ENERGY, le16(settings_.energy));
        appendPacket(out, CMD_DRAWING_MODE, {0x01});
        appendPacket(out, CMD_LATTICE, LATTICE_START);
        appendPacket(out, CMD_SPEED, {settings_.speed});

        for (int y = 0; y < image.height(); ++y) {
            appendPacket(out, CMD_DRAW_BITMAP, packRow(image, y, width));
        }

        appendPacket(out, CMD_LATTICE, LATTICE_END);
        appendPacket(out, CMD_FEED_PAPER, le16(settings_.feedLines));
        appendPacket(out, CMD_DEVICE_STATE, {0x00});

        Logger::logDebug("[TiMiniEncoder] Encoded " + std::to_string(image.height()) + " rows into " +
                         std::to_string(out.size()) + " bytes");
        return out;
    }

} // namespace core::encoder
