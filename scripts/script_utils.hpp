/**
 * @file script_utils.hpp
 * @brief Shared utilities for the sidfile command line tools
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "../include/sidfile.hpp"
#include <string>
#include <iostream>
#include <optional>
#include <vector>
#include <getopt.h>

namespace sidfile {

// === Command-Line Argument Parsing ===

/**
 * @brief Program configuration structure
 */
    struct ScriptConfig {
        std::optional<std::string> config_file;
        bool strict = false;        // warnings make a file unacceptable
        bool force = false;         // resave even if the file is unacceptable
        std::optional<Variant> target_variant;
        std::vector<std::string> files;
    };

/**
 * @brief Script type enumeration for help display
 */
    enum class ScriptType {
        INFO,
        RESAVE
    };

/**
 * @brief Display help message for script usage
 * @param program_name The name of the program (argv[0])
 * @param script_type The type of script (info or resave)
 */
    inline void display_help(const std::string& program_name, ScriptType script_type) {
        if (script_type == ScriptType::INFO) {
            std::cout << "Usage: " << program_name << " [OPTIONS] <file.sid>...\n\n";
        } else {
            std::cout << "Usage: " << program_name << " [OPTIONS] <in.sid> <out.sid>\n\n";
        }
        std::cout << "Options:\n";
        std::cout << "  -c <file>       JSON configuration file (codec_config section)\n";
        std::cout << "  -s              Strict: treat warnings as errors\n";

        if (script_type == ScriptType::RESAVE) {
            std::cout << "  -V <variant>    Write as another variant\n";
            std::cout << "                  Supported: V1, V2, V3, V4, MULTISID\n";
            std::cout << "  -f              Write even if the input has fatal diagnostics\n";
        }

        std::cout << "  -h              Display this help message\n";
        std::cout << "\n";
        std::cout << "Environment: SIDFILE_ACCEPT_MULTISID, SIDFILE_REJECT_WARNINGS,\n";
        std::cout << "             SIDFILE_LOG_DIAGNOSTICS, SIDFILE_MAX_FILE_SIZE\n";
        std::cout << "\n";

        switch (script_type) {
        case ScriptType::INFO:
            std::cout << "Decodes SID files and prints header and diagnostics as JSON.\n";
            std::cout << "Exits with 1 if any file cannot be read or is not acceptable.\n";
            break;
        case ScriptType::RESAVE:
            std::cout << "Decodes a SID file and writes it back, recomputing dataOffset.\n";
            std::cout << "\n";
            std::cout << "Examples:\n";
            std::cout << "  # Normalize a file:\n";
            std::cout << "  " << program_name << " Commando.sid out.sid\n\n";
            std::cout << "  # Upgrade a v2 file to v3 layout:\n";
            std::cout << "  " << program_name << " -V V3 Commando.sid out.sid\n";
            break;
        }
    }

/**
 * @brief Parse command-line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param script_type The type of script
 * @return ScriptConfig Parsed configuration
 * @throws std::invalid_argument if arguments are invalid
 */
    inline ScriptConfig parse_arguments(int argc, char* argv[], ScriptType script_type) {
        ScriptConfig config;
        int opt;

        const char* optstring = (script_type == ScriptType::RESAVE) ? "hc:sfV:" : "hc:s";

        while ((opt = getopt(argc, argv, optstring)) != -1) {
            switch (opt) {
            case 'h':
                display_help(argv[0], script_type);
                std::exit(0);

            case 'c':
                config.config_file = std::string(optarg);
                break;

            case 's':
                config.strict = true;
                break;

            case 'f':
                config.force = true;
                break;

            case 'V': {
                bool variant_not_found = false;
                config.target_variant = variant_from_string(optarg, variant_not_found);
                if (variant_not_found) {
                    std::cerr << "Invalid variant: " << optarg << "\n";
                    std::cerr << "Supported: V1, V2, V3, V4, MULTISID\n";
                    throw std::invalid_argument("Unsupported variant: " + std::string(optarg));
                }
                break;
            }

            default:
                display_help(argv[0], script_type);
                throw std::invalid_argument("Invalid command-line arguments");
            }
        }

        for (int i = optind; i < argc; ++i) {
            config.files.emplace_back(argv[i]);
        }

        const std::size_t expected = (script_type == ScriptType::RESAVE) ? 2 : 1;
        if ((script_type == ScriptType::RESAVE && config.files.size() != expected) ||
            config.files.size() < expected) {
            display_help(argv[0], script_type);
            throw std::invalid_argument("Missing file arguments");
        }

        return config;
    }

/**
 * @brief Build the codec for a script run
 *
 * Loads the configuration (env > file > defaults) and applies -s on top.
 */
    inline TuneCodec make_codec(const ScriptConfig& script) {
        CodecConfig config = CodecConfig::load(script.config_file);
        if (script.strict) {
            config.reject_warnings = true;
        }
        return TuneCodec(config);
    }

} // namespace sidfile
