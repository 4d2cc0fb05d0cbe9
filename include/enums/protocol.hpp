/**
 * @file protocol.hpp
 * @brief Format definitions and byte helpers for PSID/RSID headers.
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 * Enum definitions, magic/version constants and big-endian integer helpers
 * shared by every header variant.
 *
 */


#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <string>
#include <array>
#include <boost/core/span.hpp>
using namespace boost;

/**
 * @namespace sidfile
 * @brief Namespace containing the PSID/RSID header codec.
 */
namespace sidfile {
    // === Utility Defines ===
    #define SIDFILE_TEXT_SIZE 32
    #define SIDFILE_MAX_SONGS 256

    // === Format Constants ===

    /**
     * @brief Magic identifier at offset 0x00.
     * @note Available families are:
     *
     * - PSID: relaxed format aimed at emulator playback
     *
     * - RSID: strict format requiring a real C64 environment
     */
    enum class MagicId : std::uint8_t {
        PSID = 0,
        RSID = 1
    };

    // * Version word announcing the vendor multi-SID trailer ("MS")
    static constexpr std::uint16_t MULTISID_VERSION = 0x4D53;

    /**
     * @brief Header variants.
     * V1 through V4 are the classic numbered revisions, MULTISID is the vendor
     * variable-length extension.
     */
    enum class Variant : std::uint8_t {
        V1 = 0,
        V2 = 1,
        V3 = 2,
        V4 = 3,
        MULTISID = 4
    };

    /**
     * @brief Flags bit 0: format of the payload.
     */
    enum class MusPlayer : std::uint8_t {
        BUILT_IN = 0,
        COMPUTE_SIDPLAYER = 1
    };

    /**
     * @brief Flags bits 2-3: video standard / clock the tune was written for.
     */
    enum class Clock : std::uint8_t {
        UNKNOWN = 0,
        PAL = 1,
        NTSC = 2,
        PAL_AND_NTSC = 3
    };

    /**
     * @brief Two-bit SID model field used for every chip.
     */
    enum class SidModel : std::uint8_t {
        UNKNOWN = 0,
        MOS_6581 = 1,
        MOS_8580 = 2,
        MOS_BOTH = 3
    };

    /**
     * @brief Per-song playback speed, one bit of the speed bitmap.
     */
    enum class SongSpeed : std::uint8_t {
        VBI = 0,     // vertical blank interrupt
        CIA = 1      // CIA 1 timer
    };

    /**
     * @brief Diagnostic severity.
     * @note FATAL means the header must be rejected by a player, WARNING means
     * an invalid value was read as "absent" or ignored.
     */
    enum class Severity : std::uint8_t {
        WARNING = 0,
        FATAL = 1
    };

    // === Enum Helpers ===

    /**
     * @brief Converts enum values to their underlying byte.
     */
    template<typename EnumType> constexpr std::uint8_t to_byte(EnumType value) {
        return static_cast<std::uint8_t>(value);
    }

    template<typename EnumType> constexpr EnumType from_byte(std::uint8_t value) {
        return static_cast<EnumType>(
            static_cast<std::underlying_type_t<EnumType> >(value));
    }

    inline std::string to_string(MagicId magic) {
        return magic == MagicId::RSID ? "RSID" : "PSID";
    }

    inline std::string to_string(Variant variant) {
        switch (variant) {
        case Variant::V1:       return "V1";
        case Variant::V2:       return "V2";
        case Variant::V3:       return "V3";
        case Variant::V4:       return "V4";
        case Variant::MULTISID: return "MULTISID";
        default:                return "UNKNOWN";
        }
    }

    inline std::string to_string(Clock clock) {
        switch (clock) {
        case Clock::PAL:          return "PAL";
        case Clock::NTSC:         return "NTSC";
        case Clock::PAL_AND_NTSC: return "PAL_AND_NTSC";
        default:                  return "UNKNOWN";
        }
    }

    inline std::string to_string(SidModel model) {
        switch (model) {
        case SidModel::MOS_6581: return "MOS_6581";
        case SidModel::MOS_8580: return "MOS_8580";
        case SidModel::MOS_BOTH: return "MOS_BOTH";
        default:                 return "UNKNOWN";
        }
    }

    inline std::string to_string(Severity severity) {
        return severity == Severity::FATAL ? "FATAL" : "WARNING";
    }

    // === String Parsers ===
    // Each parser sets not_found and returns the enum's default on unknown input.

    inline MagicId magic_from_string(const std::string& str, bool& not_found) {
        not_found = false;
        if (str == "PSID") return MagicId::PSID;
        if (str == "RSID") return MagicId::RSID;
        not_found = true;
        return MagicId::PSID;
    }

    inline Variant variant_from_string(const std::string& str, bool& not_found) {
        not_found = false;
        if (str == "V1") return Variant::V1;
        if (str == "V2") return Variant::V2;
        if (str == "V3") return Variant::V3;
        if (str == "V4") return Variant::V4;
        if (str == "MULTISID") return Variant::MULTISID;
        not_found = true;
        return Variant::V2;
    }

    inline Clock clock_from_string(const std::string& str, bool& not_found) {
        not_found = false;
        if (str == "UNKNOWN") return Clock::UNKNOWN;
        if (str == "PAL") return Clock::PAL;
        if (str == "NTSC") return Clock::NTSC;
        if (str == "PAL_AND_NTSC") return Clock::PAL_AND_NTSC;
        not_found = true;
        return Clock::UNKNOWN;
    }

    inline SidModel sidmodel_from_string(const std::string& str, bool& not_found) {
        not_found = false;
        if (str == "UNKNOWN") return SidModel::UNKNOWN;
        if (str == "MOS_6581") return SidModel::MOS_6581;
        if (str == "MOS_8580") return SidModel::MOS_8580;
        if (str == "MOS_BOTH") return SidModel::MOS_BOTH;
        not_found = true;
        return SidModel::UNKNOWN;
    }

    /**
     * @brief Version word written for a variant.
     */
    constexpr std::uint16_t version_of(Variant variant) {
        switch (variant) {
        case Variant::V1:       return 1;
        case Variant::V2:       return 2;
        case Variant::V3:       return 3;
        case Variant::V4:       return 4;
        case Variant::MULTISID: return MULTISID_VERSION;
        default:                return 0;
        }
    }

    // === Byte Manipulation Helpers ===

    /**
     * @brief Converts an unsigned integer to a big-endian byte array.
     * @param T The unsigned integer type to convert from
     * @param N The number of bytes to output (must be between 1 and sizeof(T))
     * @param value The unsigned integer value to convert
     * @return std::array<std::uint8_t, N> The big-endian byte array
     * @example
     * @code
     * auto bytes = int_to_bytes_be<uint16_t, 2>(0x1003); // bytes = {0x10, 0x03}
     * @endcode
     */
    template<typename T, std::size_t N>
    constexpr std::array<std::uint8_t, N> int_to_bytes_be(T value) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        static_assert(N > 0 && N <= sizeof(T), "N must be between 1 and sizeof(T)");
        std::array<std::uint8_t, N> bytes = {};
        for (std::size_t i = 0; i < N; ++i) {
            bytes[N - 1 - i] = static_cast<std::uint8_t>(value & 0xFF);
            value >>= 8;
        }
        return bytes;
    }

    /**
     * @brief Converts a big-endian byte sequence to an unsigned integer.
     * @param T The unsigned integer type to convert to
     * @param bytes The big-endian bytes (only the first sizeof(T) are used)
     * @return T The unsigned integer value
     * @example
     * @code
     * // bytes = {0x00, 0x7C}
     * auto value = bytes_to_int_be<uint16_t>(bytes); // value = 0x7C
     * @endcode
     */
    template<typename T>
    constexpr T bytes_to_int_be(span<const std::uint8_t> bytes) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        T value = 0;
        for (std::size_t i = 0; i < bytes.size() && i < sizeof(T); ++i) {
            value = static_cast<T>((value << 8) | (static_cast<T>(bytes[i]) & 0xFF));
        }
        return value;
    }

    /**
     * @brief Reads a little-endian word, as the C64 stores addresses.
     */
    constexpr std::uint16_t bytes_to_word_le(std::uint8_t lo, std::uint8_t hi) {
        return static_cast<std::uint16_t>(lo | (hi << 8));
    }

} // namespace sidfile
