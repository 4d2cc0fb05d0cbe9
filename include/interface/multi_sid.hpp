/**
 * @file multi_sid.hpp
 * @brief Vendor multi-SID trailer codec
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 * The vendor variant replaces the classic second/third SID bytes with a
 * zero-terminated list of 16-bit big-endian descriptor words at 0x7A.
 *
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <boost/core/span.hpp>

#include "../header/tune_header.hpp"

using namespace boost;

namespace sidfile {

    /**
     * @brief Static helper for descriptor words
     *
     * Descriptor word structure (16 bits):
     * - Bits 15-11: unused, must be 0
     * - Bit 10: output channel
     * - Bits 9-8: SID model
     * - Bits 7-0: chip-address middle byte ($Dxx0)
     */
    class MultiSidHelper {
        public:
            static constexpr std::uint16_t RESERVED_MASK = 0xF800;
            static constexpr std::uint16_t TERMINATOR = 0x0000;

            struct WordComponents {
                SidDescriptor descriptor;
                std::uint16_t reserved;     // bits 15-11 as found
            };

            struct ScanResult {
                std::vector<std::uint16_t> words;   // non-zero words, terminator excluded
                bool terminated = false;            // false if the buffer ended first
            };

            /**
             * @brief Encode one descriptor
             * @throws EncodingException EUNREPRESENTABLE if the model or channel do
             * not fit their bits, or if the word would equal the terminator
             *
             * @example
             * @code
             * SidDescriptor d{SidModel::MOS_6581, 0, 0x42};
             * auto word = MultiSidHelper::compute_word(d); // 0x0142
             * @endcode
             */
            static std::uint16_t compute_word(const SidDescriptor& descriptor);

            static WordComponents parse_word(std::uint16_t word) {
                WordComponents result;
                result.descriptor.address = static_cast<std::uint8_t>(word & 0xFF);
                result.descriptor.sid_model = from_byte<SidModel>((word >> 8) & 0x03);
                result.descriptor.output_channel = static_cast<std::uint8_t>((word >> 10) & 0x01);
                result.reserved = static_cast<std::uint16_t>(word & RESERVED_MASK);
                return result;
            }

            /**
             * @brief Collect descriptor words up to the zero terminator
             *
             * The scan is bounded by the words that fit in the buffer after
             * `start`, so corrupted input always terminates.
             *
             * @param buffer Whole header buffer
             * @param start Offset of the first descriptor word
             * @return ScanResult Words found and whether a terminator was seen
             */
            static ScanResult scan(span<const std::uint8_t> buffer, std::size_t start);

            /**
             * @brief Serialize descriptors followed by the terminator word
             */
            static std::vector<std::uint8_t> serialize(const std::vector<SidDescriptor>& descriptors);
    };

} // namespace sidfile
