/**
 * @file serialization_helpers.hpp
 * @brief Pure static helper classes for header field encoding
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 * Field codec helpers:
 * - TextHelper: 32-byte Windows-1252 text slots <-> UTF-8
 * - FlagsHelper: pack/unpack the flags word at 0x76
 *
 * These are pure static classes (no state) that work on raw byte buffers.
 * They are used during serialization/deserialization.
 *
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <boost/core/span.hpp>
#include "../enums/protocol.hpp"
#include "../header/tune_header.hpp"

using namespace boost;

namespace sidfile {

    /**
     * @brief Static helper for fixed-width text slots
     *
     * Slots are SIDFILE_TEXT_SIZE bytes of Windows-1252, zero padded and not
     * necessarily zero terminated. Bytes Windows-1252 leaves undefined
     * (0x81, 0x8D, 0x8F, 0x90, 0x9D) map to the C1 control with the same value,
     * so every byte decodes.
     */
    class TextHelper {
        public:
            using Slot = std::array<std::uint8_t, SIDFILE_TEXT_SIZE>;

            /**
             * @brief Decode a slot into UTF-8
             *
             * Stops at the first zero byte or at the end of the slot.
             * Never fails.
             *
             * @param slot Raw slot bytes (usually exactly 32)
             * @return std::string UTF-8 text
             */
            static std::string decode(span<const std::uint8_t> slot);

            /**
             * @brief Encode UTF-8 text into a zero-padded slot
             *
             * @param text UTF-8 text
             * @param field Field name used in the exception context
             * @return Slot Encoded bytes
             * @throws EncodingException ETEXT_TOO_LONG if more than 32 bytes are needed
             * @throws EncodingException EUNREPRESENTABLE for malformed UTF-8, embedded
             * zero characters or characters outside Windows-1252
             */
            static Slot encode(const std::string& text, const std::string& field);

            /**
             * @brief Number of slot bytes the text needs
             * @throws EncodingException as encode() for unrepresentable text
             */
            static std::size_t encoded_length(const std::string& text, const std::string& field);
    };

    /**
     * @brief Static helper for the flags word
     *
     * The flags word structure (16 bits, big-endian at 0x76):
     * - Bit 0: MUS player data
     * - Bit 1: PSID PlaySID specific / RSID C64 BASIC
     * - Bits 3-2: clock
     * - Bits 5-4: primary SID model
     * - Bits 7-6: second SID model (V3, V4)
     * - Bits 9-8: third SID model (V4)
     * - Bits 15-10: reserved
     */
    class FlagsHelper {
        public:
            static constexpr std::uint16_t RESERVED_MASK = 0xFC00;
            static constexpr std::uint16_t SECOND_MODEL_MASK = 0x00C0;
            static constexpr std::uint16_t THIRD_MODEL_MASK = 0x0300;

            struct FlagComponents {
                Flags flags;
                SidModel second_model;
                SidModel third_model;
                std::uint16_t reserved;     // bits 15-10 as found
            };

            /**
             * @brief Encode flags and extra SID models into a word
             * @throws EncodingException EUNREPRESENTABLE if an enum holds more than two bits
             *
             * @example
             * @code
             * Flags f;
             * f.clock = Clock::PAL;
             * f.sid_model = SidModel::MOS_8580;
             * auto word = FlagsHelper::compute_word(f); // 0x0024
             * @endcode
             */
            static std::uint16_t compute_word(const Flags& flags,
                SidModel second_model = SidModel::UNKNOWN,
                SidModel third_model = SidModel::UNKNOWN);

            static FlagComponents parse_word(std::uint16_t word) {
                FlagComponents result;
                result.flags.mus_player = from_byte<MusPlayer>(word & 0x01);
                result.flags.psid_specific = (word & 0x02) != 0;
                result.flags.clock = from_byte<Clock>((word >> 2) & 0x03);
                result.flags.sid_model = from_byte<SidModel>((word >> 4) & 0x03);
                result.second_model = from_byte<SidModel>((word >> 6) & 0x03);
                result.third_model = from_byte<SidModel>((word >> 8) & 0x03);
                result.reserved = static_cast<std::uint16_t>(word & RESERVED_MASK);
                return result;
            }
    };

}  // namespace sidfile
