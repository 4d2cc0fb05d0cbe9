/**
 * @file header_codec.hpp
 * @brief decode/encode entry points for PSID/RSID files
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 * All functions are pure: no shared state, no I/O. They can run
 * concurrently on independent buffers.
 *
 * @code
 * auto result = sidfile::decode(file_bytes);
 * if (!sidfile::has_fatal(result.diagnostics)) {
 *     auto bytes = sidfile::encode(result.header, result.payload);
 * }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <vector>
#include <boost/core/span.hpp>

#include "tune_header.hpp"
#include "diagnostic.hpp"

using namespace boost;

namespace sidfile {

    /**
     * @brief Header, payload and every constraint violation found
     * @note The header is best-effort when diagnostics contain FATAL entries.
     */
    struct DecodeResult {
        TuneHeader header;
        std::vector<std::uint8_t> payload;
        Diagnostics diagnostics;
    };

    /**
     * @brief Decode and validate a whole file
     * @param buffer File contents, header followed by payload
     * @param accept_multisid Whether the vendor multi-SID variant is recognized
     * @return DecodeResult Header, untouched payload bytes, diagnostics
     * @throws StructuralException if no header can be read
     */
    DecodeResult decode(span<const std::uint8_t> buffer, bool accept_multisid = true);

    /**
     * @brief Serialize a header and its payload
     *
     * dataOffset is recomputed from the variant and descriptor count; reserved
     * bytes are zero; the payload is appended unchanged.
     * @throws EncodingException if any field cannot be represented
     */
    std::vector<std::uint8_t> encode(const TuneHeader& header, span<const std::uint8_t> payload);

    /**
     * @brief Re-validate a header, e.g. after editing a copy
     */
    Diagnostics validate(const TuneHeader& header, span<const std::uint8_t> payload);

    /**
     * @brief Validate a header without its payload
     * @note Load-range checks are skipped.
     */
    Diagnostics validate(const TuneHeader& header);

} // namespace sidfile
