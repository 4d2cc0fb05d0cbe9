/**
 * @file tune_codec.hpp
 * @brief Configured entry point for reading and writing SID files
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 * Wraps the free decode/encode/validate functions with a CodecConfig:
 * vendor variant acceptance, warning policy and diagnostic logging.
 *
 * @code
 * TuneCodec codec(CodecConfig::load("config/codec_config.json"));
 * auto result = codec.load("Commando.sid");
 * if (codec.is_acceptable(result.diagnostics)) {
 *     codec.save("Commando_v2.sid", result.header, result.payload);
 * }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include <boost/core/span.hpp>

#include "codec_config.hpp"
#include "../header/header_codec.hpp"

using namespace boost;

namespace sidfile {

    /**
     * @brief Decode with the vendor-variant setting of a config
     */
    DecodeResult decode(span<const std::uint8_t> buffer, const CodecConfig& config);

    class TuneCodec {
        private:
            CodecConfig config_;
            std::ostream* log_;     // diagnostic sink, not owned

            void log_diagnostics(const std::string& source, const Diagnostics& diagnostics) const;

        public:
            /**
             * @brief Construct a codec
             * @param config Policy, validated here
             * @param log Stream receiving "[SIDFILE] ..." lines when logging is enabled
             * @throws std::invalid_argument if config is invalid
             */
            explicit TuneCodec(CodecConfig config = CodecConfig::create_default(),
                std::ostream& log = std::cerr);

            const CodecConfig& config() const {
                return config_;
            }

            // === Memory Operations ===

            /**
             * @brief Decode a buffer
             * @throws StructuralException if no header can be read
             */
            DecodeResult decode(span<const std::uint8_t> buffer) const;

            /**
             * @brief Encode a header and payload
             * @throws EncodingException if a field cannot be represented
             */
            std::vector<std::uint8_t> encode(const TuneHeader& header,
                span<const std::uint8_t> payload) const;

            Diagnostics validate(const TuneHeader& header, span<const std::uint8_t> payload) const;

            bool is_acceptable(const Diagnostics& diagnostics) const {
                return config_.is_acceptable(diagnostics);
            }

            // === File Operations ===

            /**
             * @brief Read a whole file
             * @throws std::runtime_error if the file cannot be read or exceeds max_file_size
             */
            std::vector<std::uint8_t> read_file(const std::string& path) const;

            /**
             * @brief Write bytes to a file, replacing it
             * @throws std::runtime_error on I/O failure
             */
            void write_file(const std::string& path, const std::vector<std::uint8_t>& bytes) const;

            /**
             * @brief read_file() followed by decode()
             */
            DecodeResult load(const std::string& path) const;

            /**
             * @brief encode() followed by write_file()
             */
            void save(const std::string& path, const TuneHeader& header,
                span<const std::uint8_t> payload) const;
    };

} // namespace sidfile
