/**
 * @file version_dispatcher.hpp
 * @brief Selects the header variant and its exact size from raw bytes
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <boost/core/span.hpp>

#include "../enums/protocol.hpp"

using namespace boost;

namespace sidfile {

    /**
     * @brief Outcome of variant selection
     */
    struct Dispatch {
        MagicId magic = MagicId::PSID;
        Variant variant = Variant::V1;
        std::uint16_t version = 0;
        std::uint16_t declared_data_offset = 0;
        std::size_t header_size = 0;                    // computed, never taken from the buffer
        std::vector<std::uint16_t> descriptor_words;    // vendor variant only
    };

    /**
     * @brief Variant selection from magic, version, dataOffset and buffer length
     *
     * Checks run in this order, each raising StructuralException:
     * 1. Buffer holds magic, version and dataOffset (SHEADER_TOO_SHORT)
     * 2. Magic is PSID or RSID (SUNKNOWN_MAGIC)
     * 3. Version is 1..4, or the vendor sentinel when accepted (SUNSUPPORTED_VERSION)
     * 4. Buffer holds the whole variant, vendor terminator included (SHEADER_TOO_SHORT)
     * 5. Declared dataOffset equals the computed size (SDATA_OFFSET_MISMATCH)
     */
    class VersionDispatcher {
        public:
            /**
             * @brief Select the variant for a buffer
             * @param buffer Whole file or at least the whole header
             * @param accept_multisid Whether the vendor sentinel is a known version
             * @return Dispatch Selected variant and size
             * @throws StructuralException on any failed check
             */
            static Dispatch select(span<const std::uint8_t> buffer, bool accept_multisid = true);

            /**
             * @brief Map a version word to a variant
             * @throws StructuralException SUNSUPPORTED_VERSION
             */
            static Variant variant_for_version(std::uint16_t version, bool accept_multisid = true);

            /**
             * @brief Exact header size of a variant
             * @param extra_sids Descriptor count, used only for the vendor variant
             */
            static std::size_t header_size(Variant variant, std::size_t extra_sids = 0);
    };

} // namespace sidfile
