//
// Created by Andrea on 17/10/2025.
//

#pragma once

#include "core/encoder/CommandEncoder.hpp"
#include <cstdint>
#include <vector>

namespace core::encoder {

    struct EncoderSettings {
        uint16_t energy = 12000;
        uint8_t speed = 10;
        uint16_t feedLines = 80;
    };

    /**
     * @brief Command set of the TiMini / "cat printer" family.
     *
     * Each command is framed as 51 78 <cmd> 00 <len lo> <len hi> <payload> <crc8> FF,
     * the CRC covering the payload only.
     */
    class TiMiniEncoder : public CommandEncoder {
    public:
        static constexpr uint8_t CMD_FEED_PAPER = 0xA1;
        static constexpr uint8_t CMD_DRAW_BITMAP = 0xA2;
        static constexpr uint8_t CMD_DEVICE_STATE = 0xA3;
        static constexpr uint8_t CMD_QUALITY = 0xA4;
        static constexpr uint8_t CMD_LATTICE = 0xA6;
        static constexpr uint8_t CMD_SPEED = 0xBD;
        static constexpr uint8_t CMD_DRAWING_MODE = 0xBE;
        static constexpr uint8_t CMD_ENERGY = 0xAF;

        explicit TiMiniEncoder(EncoderSettings settings = {});

        /**
         * Pixels darker than 128 print. Rows are cropped or white-padded to the
         * profile's normalized width.
         */
        std::vector<uint8_t> encode(const layout::RasterImage &image,
                                    const device::DeviceProfile &profile) const override;

        static uint8_t crc8(const uint8_t *data, size_t size);

        static void appendPacket(std::vector<uint8_t> &out, uint8_t command, const std::vector<uint8_t> &payload);

        /**
         * @brief One raster row packed LSB-first (bit 0 is the leftmost dot), 1 = black.
         */
        static std::vector<uint8_t> packRow(const layout::RasterImage &image, int y, int widthDots);

    private:
        EncoderSettings settings_;
    };

} // namespace core::encoder
