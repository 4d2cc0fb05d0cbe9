/**
 * @file codec_config.hpp
 * @brief Decode policy configuration
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (config/codec_config.json)
 * 2. Environment variables (SIDFILE_*)
 * 3. Programmatic defaults
 *
 * Priority: Environment variables > JSON file > Defaults
 *
 */

#pragma once

#include <cstddef>
#include <string>
#include <optional>
#include <map>

#include <nlohmann/json.hpp>

#include "../header/diagnostic.hpp"

namespace sidfile {

    /**
     * @brief Configuration for TuneCodec
     *
     * Environment Variables:
     *
     * - SIDFILE_ACCEPT_MULTISID: recognize the vendor multi-SID version (default: true)
     *
     * - SIDFILE_REJECT_WARNINGS: treat warnings as unacceptable (default: false)
     *
     * - SIDFILE_LOG_DIAGNOSTICS: print diagnostics to stderr (default: false)
     *
     * - SIDFILE_MAX_FILE_SIZE: largest file read_file() accepts, in bytes (default: 1048576)
     */
    struct CodecConfig {
        static constexpr std::size_t MIN_FILE_SIZE = 0x76;          // V1 header
        static constexpr std::size_t MAX_FILE_SIZE = 16 * 1024 * 1024;

        bool accept_multisid = true;
        bool reject_warnings = false;
        bool log_diagnostics = false;
        std::size_t max_file_size = 1024 * 1024;

        /**
         * @brief Validate configuration
         * @throws std::invalid_argument if config is invalid
         */
        void validate() const;

        /**
         * @brief Whether a decode outcome passes this policy
         * @return false on any FATAL entry, or on any entry when reject_warnings is set
         */
        bool is_acceptable(const Diagnostics& diagnostics) const;

        static CodecConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file (e.g., codec_config.json)
         * @throws std::runtime_error if file cannot be read or parsed
         */
        static CodecConfig from_file(const std::string& filepath);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing codec_config
         * @throws std::invalid_argument if a value is malformed
         */
        static CodecConfig from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         */
        static CodecConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        private:
            static void apply_config_map(CodecConfig& config,
                const std::map<std::string, std::string>& vars);

            static std::string get_env(const std::string& name,
                const std::string& default_val = "");
    };

} // namespace sidfile
