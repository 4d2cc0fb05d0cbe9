/**
 * @file header_builder.hpp
 * @brief Fluent builder for TuneHeader construction and editing.
 *
 * TuneHeader has no setters. New headers and edited copies are both made
 * here: start from make_header_builder() or TuneHeaderBuilder::from(), chain
 * with_* calls, then build().
 *
 * build() rejects what the byte layout cannot hold (text that does not fit a
 * slot, too many extra SIDs for a classic variant, V2+ fields on V1). Format
 * constraints such as RSID lockdown are not checked here; run validate() on
 * the result.
 *
 * Example Usage:
 * @code
 * auto header = make_header_builder(Variant::V3)
 *     .with_magic(MagicId::PSID)
 *     .with_load_address(0x1000)
 *     .with_init_address(0x1000)
 *     .with_play_address(0x1003)
 *     .with_name("Commando")
 *     .with_clock(Clock::PAL)
 *     .with_extra_sid(0x42, SidModel::MOS_8580)
 *     .build();
 *
 * // Edit a decoded header
 * auto edited = TuneHeaderBuilder::from(result.header)
 *     .with_songs(3)
 *     .build();
 * @endcode
 *
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../header/tune_header.hpp"
#include "../enums/protocol.hpp"

namespace sidfile {

    /**
     * @brief Extra SID as requested through the builder
     * @note output_channel is only representable in the vendor variant.
     */
    struct ExtraSidRequest {
        std::uint8_t address = 0;
        SidModel model = SidModel::UNKNOWN;
        std::uint8_t output_channel = 0;
    };

    /**
     * @brief Internal state holder for header construction.
     */
    struct HeaderBuilderState {
        Variant variant = Variant::V2;
        CommonFields common;
        std::optional<std::uint16_t> init_address;
        std::optional<std::uint16_t> declared_data_offset;

        // V2+ fields, unset until touched so V1 can refuse them
        std::optional<MusPlayer> mus_player;
        std::optional<bool> psid_specific;
        std::optional<Clock> clock;
        std::optional<SidModel> sid_model;
        std::optional<std::uint8_t> start_page;
        std::optional<std::uint8_t> page_length;

        std::vector<ExtraSidRequest> extra_sids;
    };

    class TuneHeaderBuilder {
        private:
            HeaderBuilderState state_;

            void check_representable() const;
            ExtendedFields make_extended() const;
            HeaderState construct_state() const;

        public:
            TuneHeaderBuilder() = default;

            explicit TuneHeaderBuilder(Variant variant) {
                state_.variant = variant;
            }

            /**
             * @brief Builder pre-filled with every field of an existing header
             *
             * Classic extra SID slots are copied positionally, absent ones
             * included, so the third SID of a V4 keeps its slot. Empty slots
             * are dropped again when the target variant has no room for them.
             */
            static TuneHeaderBuilder from(const TuneHeader& header);

            // === Identity ===

            [[nodiscard]] TuneHeaderBuilder& with_magic(MagicId magic) {
                state_.common.magic = magic;
                return *this;
            }

            /**
             * @brief Change the variant; non-default fields that do not exist in
             * the new variant make build() fail
             */
            [[nodiscard]] TuneHeaderBuilder& with_variant(Variant variant) {
                state_.variant = variant;
                return *this;
            }

            /**
             * @brief Override the dataOffset recorded in the header
             *
             * Defaults to the computed size. A mismatching value is kept so
             * validate() can report it.
             */
            [[nodiscard]] TuneHeaderBuilder& with_declared_data_offset(std::uint16_t offset) {
                state_.declared_data_offset = offset;
                return *this;
            }

            // === Addresses ===

            [[nodiscard]] TuneHeaderBuilder& with_load_address(std::uint16_t address) {
                state_.common.load_address = address;
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_init_address(std::uint16_t address) {
                state_.init_address = address;
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_play_address(std::uint16_t address) {
                state_.common.play_address = address;
                return *this;
            }

            // === Songs ===

            [[nodiscard]] TuneHeaderBuilder& with_songs(std::uint16_t songs) {
                state_.common.songs = songs;
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_start_song(std::uint16_t start_song) {
                state_.common.start_song = start_song;
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_speed(std::uint32_t speed) {
                state_.common.speed = speed;
                return *this;
            }

            /**
             * @brief Set the speed bit of one song
             * @param song 1-based song number, 1..32
             * @throws std::out_of_range for songs without their own bit
             */
            [[nodiscard]] TuneHeaderBuilder& with_song_speed(std::size_t song, SongSpeed speed);

            // === Text ===

            [[nodiscard]] TuneHeaderBuilder& with_name(std::string name) {
                state_.common.name = std::move(name);
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_author(std::string author) {
                state_.common.author = std::move(author);
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_released(std::string released) {
                state_.common.released = std::move(released);
                return *this;
            }

            // === Flags (V2+) ===

            [[nodiscard]] TuneHeaderBuilder& with_mus_player(MusPlayer player) {
                state_.mus_player = player;
                return *this;
            }

            /**
             * @brief Flag bit 1: PlaySID specific for PSID, C64 BASIC for RSID
             */
            [[nodiscard]] TuneHeaderBuilder& with_psid_specific(bool value) {
                state_.psid_specific = value;
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_basic(bool value) {
                state_.psid_specific = value;
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_clock(Clock clock) {
                state_.clock = clock;
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_sid_model(SidModel model) {
                state_.sid_model = model;
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& with_relocation(std::uint8_t start_page,
                std::uint8_t page_length) {
                state_.start_page = start_page;
                state_.page_length = page_length;
                return *this;
            }

            // === Extra SIDs ===

            /**
             * @brief Append an extra SID
             * @param address Chip-address middle byte ($Dxx0)
             * @param model SID model, UNKNOWN inherits the primary model
             * @param output_channel Vendor variant only
             */
            [[nodiscard]] TuneHeaderBuilder& with_extra_sid(std::uint8_t address,
                SidModel model = SidModel::UNKNOWN, std::uint8_t output_channel = 0) {
                state_.extra_sids.push_back(ExtraSidRequest{address, model, output_channel});
                return *this;
            }

            [[nodiscard]] TuneHeaderBuilder& without_extra_sids() {
                state_.extra_sids.clear();
                return *this;
            }

            // === Build ===

            /**
             * @brief Build the header
             * @return TuneHeader
             * @throws std::runtime_error if the init address was never set
             * @throws EncodingException ECHIP_CAPACITY if a classic variant gets
             * more extra SIDs than it has slots
             * @throws EncodingException EUNREPRESENTABLE for V2+ fields on V1, an
             * output channel outside the vendor variant, or a field that does not
             * fit its bits
             * @throws EncodingException ETEXT_TOO_LONG for text over 32 bytes
             */
            TuneHeader build() const;
    };

    // === Factory Functions ===

    inline TuneHeaderBuilder make_header_builder(Variant variant = Variant::V2) {
        return TuneHeaderBuilder(variant);
    }

} // namespace sidfile
