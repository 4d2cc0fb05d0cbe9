/**
 * @file tune_header.hpp
 * @brief In-memory PSID/RSID header, tagged by variant
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 * State-only model:
 * - Each variant struct holds only the fields the format defines for it
 * - CommonFields and ExtendedFields are shared sub-structures
 * - TuneHeader wraps the variant and exposes read accessors
 * - No setters; edits go through TuneHeaderBuilder::from()
 *
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../enums/protocol.hpp"
#include "../template/header_traits.hpp"

namespace sidfile {

    /**
     * @brief Fields present at 0x00-0x75 in every variant
     */
    struct CommonFields {
        MagicId magic = MagicId::PSID;
        std::uint16_t declared_data_offset = 0;     // as read from the buffer or set by the builder
        std::uint16_t load_address = 0;
        std::uint16_t init_address = 0;
        std::uint16_t play_address = 0;
        std::uint16_t songs = 1;
        std::uint16_t start_song = 1;
        std::uint32_t speed = 0;
        std::string name;                           // UTF-8
        std::string author;                         // UTF-8
        std::string released;                       // UTF-8
    };

    /**
     * @brief Meaningful bits of the flags word common to V2+ and the vendor variant
     * @note Second and third SID models are kept with their chip, not here.
     */
    struct Flags {
        MusPlayer mus_player = MusPlayer::BUILT_IN;
        bool psid_specific = false;     // PSID: PlaySID specific, RSID: C64 BASIC
        Clock clock = Clock::UNKNOWN;
        SidModel sid_model = SidModel::UNKNOWN;
    };

    /**
     * @brief Flags word and relocation hint (0x76-0x79)
     */
    struct ExtendedFields {
        Flags flags;
        std::uint8_t start_page = 0;
        std::uint8_t page_length = 0;
    };

    /**
     * @brief Classic fixed-byte extra SID (V3/V4)
     */
    struct ExtraSid {
        std::uint8_t address = 0;       // middle byte of $Dxx0, 0 = absent
        SidModel model = SidModel::UNKNOWN;
    };

    /**
     * @brief One vendor trailer entry
     */
    struct SidDescriptor {
        SidModel sid_model = SidModel::UNKNOWN;
        std::uint8_t output_channel = 0;    // 0 or 1
        std::uint8_t address = 0;           // middle byte of $Dxx0
    };

    struct V1Header {
        CommonFields common;
    };

    struct V2Header {
        CommonFields common;
        ExtendedFields extended;
    };

    struct V3Header {
        CommonFields common;
        ExtendedFields extended;
        ExtraSid second_sid;
    };

    struct V4Header {
        CommonFields common;
        ExtendedFields extended;
        ExtraSid second_sid;
        ExtraSid third_sid;
    };

    struct MultiSidHeader {
        CommonFields common;
        ExtendedFields extended;
        std::vector<SidDescriptor> extra_sids;
    };

    using HeaderState = std::variant<V1Header, V2Header, V3Header, V4Header, MultiSidHeader>;

    /**
     * @brief Uniform view of one extra SID, independent of its encoding
     */
    struct ChipInfo {
        std::size_t offset = 0;             // byte offset of the address in the header
        std::uint8_t address = 0;           // raw middle byte
        std::uint16_t base_address = 0;     // $Dxx0, 0 when absent
        bool present = false;
        SidModel declared_model = SidModel::UNKNOWN;
        SidModel effective_model = SidModel::UNKNOWN;   // UNKNOWN inherits the primary model
        std::uint8_t output_channel = 0;
    };

    /**
     * @brief Immutable PSID/RSID header
     *
     * Produced by decode() or TuneHeaderBuilder. Accessors that only make sense
     * for some variants return std::optional.
     */
    class TuneHeader {
        private:
            HeaderState state_;

        public:
            explicit TuneHeader(HeaderState state) : state_(std::move(state)) {}

            // === Variant Access ===

            const HeaderState& state() const {
                return state_;
            }

            Variant get_variant() const;

            /**
             * @brief Version word as written in the header
             * @return 1..4 for classic variants, MULTISID_VERSION for the vendor variant
             */
            std::uint16_t get_version() const {
                return version_of(get_variant());
            }

            /**
             * @brief Header size computed from the variant and descriptor count
             */
            std::uint16_t get_data_offset() const;

            std::uint16_t get_declared_data_offset() const {
                return common().declared_data_offset;
            }

            // === Common Fields ===

            const CommonFields& common() const;

            MagicId get_magic() const { return common().magic; }
            bool is_rsid() const { return common().magic == MagicId::RSID; }
            std::uint16_t get_load_address() const { return common().load_address; }
            std::uint16_t get_init_address() const { return common().init_address; }
            std::uint16_t get_play_address() const { return common().play_address; }
            std::uint16_t get_songs() const { return common().songs; }
            std::uint16_t get_start_song() const { return common().start_song; }
            std::uint32_t get_speed() const { return common().speed; }
            const std::string& get_name() const { return common().name; }
            const std::string& get_author() const { return common().author; }
            const std::string& get_released() const { return common().released; }

            /**
             * @brief Speed of a song, with the per-magic extrapolation past 32
             *
             * PSID reuses bit (n-1) mod 32, RSID saturates at bit 31.
             * @param song 1-based song number
             * @throws std::out_of_range if song is 0 or above 256
             */
            SongSpeed speed_for_song(std::size_t song) const;

            // === Extended Fields (V2+) ===

            std::optional<ExtendedFields> get_extended_fields() const;
            std::optional<Flags> get_flags() const;
            std::optional<std::uint8_t> get_relocation_start_page() const;
            std::optional<std::uint8_t> get_relocation_page_length() const;

            /**
             * @brief RSID flag bit 1: program is a C64 BASIC program
             */
            bool is_basic() const;

            /**
             * @brief PSID flag bit 1: program needs PlaySID samples
             */
            bool is_playsid_specific() const;

            /**
             * @brief Model of the SID at $D400, UNKNOWN for V1
             */
            SidModel get_sid_model() const;

            Clock get_clock() const;

            // === Extra SIDs ===

            /**
             * @brief Every extra SID slot the variant carries, in header order
             * @note Classic slots with address 0 are reported as absent entries.
             */
            std::vector<ChipInfo> get_extra_sids() const;

            /**
             * @brief Number of SIDs the tune uses, primary included
             */
            std::size_t sid_count() const;

            // === Utility ===

            /**
             * @brief Semantic equality, text compared after decoding
             */
            bool operator==(const TuneHeader& other) const;
            bool operator!=(const TuneHeader& other) const { return !(*this == other); }

            std::string to_string() const;
    };

    // === Chip Address Helpers ===

    /**
     * @brief Static helper for the chip-address middle byte
     *
     * An extra SID at $Dxx0 is stored as the byte xx. Only even bytes in
     * 0x42-0x7F and 0xE0-0xFE address a usable location.
     */
    class ChipAddressHelper {
        public:
            static constexpr bool is_present(std::uint8_t address) {
                return (address & 0x01) == 0 &&
                       ((address >= 0x42 && address <= 0x7F) ||
                        (address >= 0xE0 && address <= 0xFE));
            }

            static constexpr std::uint16_t base_address(std::uint8_t address) {
                return static_cast<std::uint16_t>(0xD000 | (address << 4));
            }
    };

} // namespace sidfile
