/**
 * @file tune_header.cpp
 * @brief TuneHeader accessor implementation
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <sstream>
#include <stdexcept>
#include <iomanip>

#include "../include/header/tune_header.hpp"

namespace sidfile {

    namespace {

        ChipInfo make_chip_info(std::size_t offset, std::uint8_t address,
            SidModel declared, SidModel primary, std::uint8_t channel) {
            ChipInfo info;
            info.offset = offset;
            info.address = address;
            info.present = ChipAddressHelper::is_present(address);
            info.base_address = info.present ? ChipAddressHelper::base_address(address) : 0;
            info.declared_model = declared;
            info.effective_model = (declared == SidModel::UNKNOWN) ? primary : declared;
            info.output_channel = channel;
            return info;
        }

        bool same_common(const CommonFields& a, const CommonFields& b) {
            return a.magic == b.magic &&
                   a.declared_data_offset == b.declared_data_offset &&
                   a.load_address == b.load_address &&
                   a.init_address == b.init_address &&
                   a.play_address == b.play_address &&
                   a.songs == b.songs &&
                   a.start_song == b.start_song &&
                   a.speed == b.speed &&
                   a.name == b.name &&
                   a.author == b.author &&
                   a.released == b.released;
        }

        bool same_extended(const ExtendedFields& a, const ExtendedFields& b) {
            return a.flags.mus_player == b.flags.mus_player &&
                   a.flags.psid_specific == b.flags.psid_specific &&
                   a.flags.clock == b.flags.clock &&
                   a.flags.sid_model == b.flags.sid_model &&
                   a.start_page == b.start_page &&
                   a.page_length == b.page_length;
        }

        bool same_sid(const ExtraSid& a, const ExtraSid& b) {
            return a.address == b.address && a.model == b.model;
        }

        bool same_descriptor(const SidDescriptor& a, const SidDescriptor& b) {
            return a.sid_model == b.sid_model &&
                   a.output_channel == b.output_channel &&
                   a.address == b.address;
        }

    } // namespace

    // === Variant Access ===

    Variant TuneHeader::get_variant() const {
        return std::visit([](const auto& h) {
                return traits_t<decltype(h)>::VARIANT;
            }, state_);
    }

    std::uint16_t TuneHeader::get_data_offset() const {
        return std::visit([](const auto& h) -> std::uint16_t {
                if constexpr (is_multisid_header_v<decltype(h)>) {
                    return static_cast<std::uint16_t>(
                        MultiSidLayout::header_size(h.extra_sids.size()));
                } else {
                    return static_cast<std::uint16_t>(traits_t<decltype(h)>::HEADER_SIZE);
                }
            }, state_);
    }

    const CommonFields& TuneHeader::common() const {
        return std::visit([](const auto& h) -> const CommonFields& {
                return h.common;
            }, state_);
    }

    SongSpeed TuneHeader::speed_for_song(std::size_t song) const {
        if (song == 0 || song > SIDFILE_MAX_SONGS) {
            throw std::out_of_range("Song number must be in [1,256]");
        }
        std::size_t bit = song - 1;
        if (bit > 31) {
            bit = is_rsid() ? 31 : bit % 32;
        }
        return ((common().speed >> bit) & 0x01) ? SongSpeed::CIA : SongSpeed::VBI;
    }

    // === Extended Fields ===

    std::optional<ExtendedFields> TuneHeader::get_extended_fields() const {
        return std::visit([](const auto& h) -> std::optional<ExtendedFields> {
                if constexpr (has_extended_fields_v<decltype(h)>) {
                    return h.extended;
                } else {
                    return std::nullopt;
                }
            }, state_);
    }

    std::optional<Flags> TuneHeader::get_flags() const {
        auto extended = get_extended_fields();
        if (!extended) {
            return std::nullopt;
        }
        return extended->flags;
    }

    std::optional<std::uint8_t> TuneHeader::get_relocation_start_page() const {
        auto extended = get_extended_fields();
        if (!extended) {
            return std::nullopt;
        }
        return extended->start_page;
    }

    std::optional<std::uint8_t> TuneHeader::get_relocation_page_length() const {
        auto extended = get_extended_fields();
        if (!extended) {
            return std::nullopt;
        }
        return extended->page_length;
    }

    bool TuneHeader::is_basic() const {
        auto flags = get_flags();
        return is_rsid() && flags && flags->psid_specific;
    }

    bool TuneHeader::is_playsid_specific() const {
        auto flags = get_flags();
        return !is_rsid() && flags && flags->psid_specific;
    }

    SidModel TuneHeader::get_sid_model() const {
        auto flags = get_flags();
        return flags ? flags->sid_model : SidModel::UNKNOWN;
    }

    Clock TuneHeader::get_clock() const {
        auto flags = get_flags();
        return flags ? flags->clock : Clock::UNKNOWN;
    }

    // === Extra SIDs ===

    std::vector<ChipInfo> TuneHeader::get_extra_sids() const {
        const SidModel primary = get_sid_model();
        std::vector<ChipInfo> chips;

        std::visit([&chips, primary](const auto& h) {
                if constexpr (has_second_sid_v<decltype(h)>) {
                    chips.push_back(make_chip_info(ClassicLayout::SECOND_SID_ADDRESS,
                        h.second_sid.address, h.second_sid.model, primary, 0));
                }
                if constexpr (has_third_sid_v<decltype(h)>) {
                    chips.push_back(make_chip_info(ClassicLayout::THIRD_SID_ADDRESS,
                        h.third_sid.address, h.third_sid.model, primary, 0));
                }
                if constexpr (is_multisid_header_v<decltype(h)>) {
                    for (std::size_t i = 0; i < h.extra_sids.size(); ++i) {
                        const auto& d = h.extra_sids[i];
                        // Address is the low byte of the big-endian word
                        chips.push_back(make_chip_info(MultiSidLayout::descriptor_offset(i) + 1,
                            d.address, d.sid_model, primary, d.output_channel));
                    }
                }
            }, state_);

        return chips;
    }

    std::size_t TuneHeader::sid_count() const {
        std::size_t count = 1;
        for (const auto& chip : get_extra_sids()) {
            if (chip.present) {
                ++count;
            }
        }
        return count;
    }

    // === Utility ===

    bool TuneHeader::operator==(const TuneHeader& other) const {
        if (state_.index() != other.state_.index()) {
            return false;
        }
        return std::visit([&other](const auto& h) {
                using H = std::decay_t<decltype(h)>;
                const H& o = std::get<H>(other.state_);
                if (!same_common(h.common, o.common)) {
                    return false;
                }
                if constexpr (has_extended_fields_v<H>) {
                    if (!same_extended(h.extended, o.extended)) {
                        return false;
                    }
                }
                if constexpr (has_second_sid_v<H>) {
                    if (!same_sid(h.second_sid, o.second_sid)) {
                        return false;
                    }
                }
                if constexpr (has_third_sid_v<H>) {
                    if (!same_sid(h.third_sid, o.third_sid)) {
                        return false;
                    }
                }
                if constexpr (is_multisid_header_v<H>) {
                    if (h.extra_sids.size() != o.extra_sids.size()) {
                        return false;
                    }
                    for (std::size_t i = 0; i < h.extra_sids.size(); ++i) {
                        if (!same_descriptor(h.extra_sids[i], o.extra_sids[i])) {
                            return false;
                        }
                    }
                }
                return true;
            }, state_);
    }

    std::string TuneHeader::to_string() const {
        std::ostringstream oss;
        oss << sidfile::to_string(get_magic()) << " " << sidfile::to_string(get_variant())
            << std::hex << std::uppercase << std::setfill('0')
            << " load=$" << std::setw(4) << get_load_address()
            << " init=$" << std::setw(4) << get_init_address()
            << " play=$" << std::setw(4) << get_play_address()
            << std::dec
            << " songs=" << get_songs() << "/" << get_start_song()
            << " sids=" << sid_count()
            << " \"" << get_name() << "\"";
        return oss.str();
    }

} // namespace sidfile
