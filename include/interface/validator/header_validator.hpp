/**
 * @file header_validator.hpp
 * @brief Cross-field and variant-specific constraint checks
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */


#pragma once

#include <boost/core/span.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "../../header/tune_header.hpp"
#include "../../header/diagnostic.hpp"

using namespace boost;

namespace sidfile {

    /**
     * @brief Half-open C64 memory range [begin, end)
     * @note end may reach 0x10000, so it does not fit a 16-bit word.
     */
    struct AddressRange {
        std::uint32_t begin = 0;
        std::uint32_t end = 0;

        bool empty() const {
            return end <= begin;
        }

        bool intersects(const AddressRange& other) const {
            return !empty() && !other.empty() && begin < other.end && other.begin < end;
        }
    };

    /**
     * @brief Constraint validation for a decoded or built header
     *
     * Every rule is applied and every violation is collected; nothing stops
     * at the first failure. Rules:
     *
     * - Common: dataOffset, songCount, startSong
     *
     * - RSID: version, load/play/speed lockdown, init address ranges
     *
     * - Relocation: page pair consistency, overlap with the load range and,
     *   for RSID, with zero page/stack/vectors and the ROM/IO areas
     *
     * - Extra SIDs: address validity (Warning) and uniqueness (Fatal)
     *
     * Without a payload, checks that need the load range are skipped.
     */
    class HeaderValidator {
        private:
            const TuneHeader* header_;
            std::optional<span<const std::uint8_t> > payload_;

        public:
            explicit HeaderValidator(const TuneHeader& header) : header_(&header) {
            }

            HeaderValidator(const TuneHeader& header, span<const std::uint8_t> payload)
                : header_(&header), payload_(payload) {
            }

            // Holds a pointer to the header; temporaries would dangle
            explicit HeaderValidator(TuneHeader&&) = delete;
            HeaderValidator(TuneHeader&&, span<const std::uint8_t>) = delete;

            /**
             * @brief Run every rule
             * @return Diagnostics Empty when the header is valid
             */
            Diagnostics validate() const;

            /**
             * @brief Memory covered by the program once loaded
             *
             * Uses loadAddress, or the first two payload bytes (little-endian)
             * when loadAddress is 0.
             * @return std::nullopt without a payload or when the payload is too
             * short to carry its load address
             */
            std::optional<AddressRange> load_range() const;

        private:
            void check_common(Diagnostics& out) const;
            void check_rsid(Diagnostics& out) const;
            void check_payload(Diagnostics& out) const;
            void check_relocation(Diagnostics& out) const;
            void check_chips(Diagnostics& out) const;
    };

} // namespace sidfile
