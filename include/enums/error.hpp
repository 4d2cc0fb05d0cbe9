/**
 * @file error.hpp
 * @brief Status codes for the sidfile codec, usable as std::error_code.
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace sidfile {

/**
 * @enum Status
 * @brief Enumeration of status codes for sidfile operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * If starts with 'S' it is a structural error (decode aborts).
 * If starts with 'C' it is a constraint violation (collected as a Diagnostic).
 * If starts with 'E' it is an encoding error (serialize aborts).
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,                /**< No error */
        SHEADER_TOO_SHORT = 1,      /**< Buffer shorter than the header variant */
        SUNKNOWN_MAGIC = 2,         /**< Magic is neither PSID nor RSID */
        SUNSUPPORTED_VERSION = 3,   /**< Version matches no known variant */
        SDATA_OFFSET_MISMATCH = 4,  /**< Declared dataOffset differs from variant size */
        CBAD_DATA_OFFSET = 5,       /**< dataOffset differs from variant size (built header) */
        CBAD_SONG_COUNT = 6,        /**< songCount outside [1,256] */
        CBAD_START_SONG = 7,        /**< startSong outside [1,songCount] */
        CBAD_LOAD_ADDRESS = 8,      /**< Load address not allowed */
        CBAD_INIT_ADDRESS = 9,      /**< Init address not allowed */
        CBAD_PLAY_ADDRESS = 10,     /**< Play address not allowed */
        CBAD_SPEED = 11,            /**< Speed bitmap not allowed */
        CBAD_VERSION = 12,          /**< Version not allowed for this magic */
        CBAD_RELOCATION = 13,       /**< Relocation range invalid or overlapping */
        CBAD_CHIP_ADDRESS = 14,     /**< Extra SID address invalid (treated as absent) */
        CDUPLICATE_CHIP_ADDRESS = 15, /**< Two present SIDs share one address */
        CRESERVED_NOT_ZERO = 16,    /**< Bits or bytes reserved for this variant are set */
        CBAD_PAYLOAD = 17,          /**< Payload cannot carry its embedded load address */
        ETEXT_TOO_LONG = 18,        /**< Text does not fit its 32-byte slot */
        EUNREPRESENTABLE = 19,      /**< Value has no encoding in this variant */
        ECHIP_CAPACITY = 20,        /**< More extra SIDs than the variant can carry */
        UNKNOWN = 255               /**< Unknown error */
    };

/**
 * @class SidFileErrorCategory
 * @brief Custom error category for sidfile status codes.
 */
    class SidFileErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "sidfile::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::SHEADER_TOO_SHORT:
                    return "Header too short";
                case Status::SUNKNOWN_MAGIC:
                    return "Unknown magic";
                case Status::SUNSUPPORTED_VERSION:
                    return "Unsupported version";
                case Status::SDATA_OFFSET_MISMATCH:
                    return "Data offset mismatch";
                case Status::CBAD_DATA_OFFSET:
                    return "Bad data offset";
                case Status::CBAD_SONG_COUNT:
                    return "Bad song count";
                case Status::CBAD_START_SONG:
                    return "Bad start song";
                case Status::CBAD_LOAD_ADDRESS:
                    return "Bad load address";
                case Status::CBAD_INIT_ADDRESS:
                    return "Bad init address";
                case Status::CBAD_PLAY_ADDRESS:
                    return "Bad play address";
                case Status::CBAD_SPEED:
                    return "Bad speed bitmap";
                case Status::CBAD_VERSION:
                    return "Bad version";
                case Status::CBAD_RELOCATION:
                    return "Bad relocation range";
                case Status::CBAD_CHIP_ADDRESS:
                    return "Bad chip address";
                case Status::CDUPLICATE_CHIP_ADDRESS:
                    return "Duplicate chip address";
                case Status::CRESERVED_NOT_ZERO:
                    return "Reserved field not zero";
                case Status::CBAD_PAYLOAD:
                    return "Bad payload";
                case Status::ETEXT_TOO_LONG:
                    return "Text too long";
                case Status::EUNREPRESENTABLE:
                    return "Unrepresentable value";
                case Status::ECHIP_CAPACITY:
                    return "Chip capacity exceeded";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &sidfile_category() {
        static SidFileErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), sidfile_category()};
    }

} // namespace sidfile

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<sidfile::Status> : true_type {};
} // namespace std
