/**
 * @file header_builder.cpp
 * @brief TuneHeaderBuilder implementation
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <stdexcept>
#include <string>
#include <vector>

#include "../include/pattern/header_builder.hpp"
#include "../include/interface/serialization_helpers.hpp"
#include "../include/interface/multi_sid.hpp"
#include "../include/interface/version_dispatcher.hpp"
#include "../include/exception/sidfile_exception.hpp"

namespace sidfile {

    namespace {

        std::size_t classic_capacity(Variant variant) {
            switch (variant) {
            case Variant::V3: return HeaderTraits<V3Header>::MAX_EXTRA_SIDS;
            case Variant::V4: return HeaderTraits<V4Header>::MAX_EXTRA_SIDS;
            case Variant::V2: return HeaderTraits<V2Header>::MAX_EXTRA_SIDS;
            case Variant::V1:
            default:          return HeaderTraits<V1Header>::MAX_EXTRA_SIDS;
            }
        }

        // All-zero requests are empty classic slots carried over by from()
        std::vector<ExtraSidRequest> vendor_sids(const std::vector<ExtraSidRequest>& requests) {
            std::vector<ExtraSidRequest> out;
            for (const auto& r : requests) {
                if (r.address != 0 || r.model != SidModel::UNKNOWN || r.output_channel != 0) {
                    out.push_back(r);
                }
            }
            return out;
        }

        ExtraSid to_extra_sid(const ExtraSidRequest& request) {
            return ExtraSid{request.address, request.model};
        }

    } // namespace

    // === Construction From Existing Header ===

    TuneHeaderBuilder TuneHeaderBuilder::from(const TuneHeader& header) {
        TuneHeaderBuilder builder(header.get_variant());
        auto& s = builder.state_;

        s.common = header.common();
        s.init_address = header.get_init_address();
        if (header.get_declared_data_offset() != header.get_data_offset()) {
            s.declared_data_offset = header.get_declared_data_offset();
        }

        if (auto extended = header.get_extended_fields()) {
            s.mus_player = extended->flags.mus_player;
            s.psid_specific = extended->flags.psid_specific;
            s.clock = extended->flags.clock;
            s.sid_model = extended->flags.sid_model;
            s.start_page = extended->start_page;
            s.page_length = extended->page_length;
        }

        std::visit([&s](const auto& h) {
                using H = std::decay_t<decltype(h)>;
                if constexpr (has_second_sid_v<H>) {
                    s.extra_sids.push_back({h.second_sid.address, h.second_sid.model, 0});
                }
                if constexpr (has_third_sid_v<H>) {
                    s.extra_sids.push_back({h.third_sid.address, h.third_sid.model, 0});
                }
                if constexpr (is_multisid_header_v<H>) {
                    for (const auto& d : h.extra_sids) {
                        s.extra_sids.push_back({d.address, d.sid_model, d.output_channel});
                    }
                }
            }, header.state());

        return builder;
    }

    // === Speed ===

    TuneHeaderBuilder& TuneHeaderBuilder::with_song_speed(std::size_t song, SongSpeed speed) {
        if (song < 1 || song > 32) {
            throw std::out_of_range("Song " + std::to_string(song) +
                " has no speed bit of its own (1-32)");
        }
        const std::uint32_t bit = 1u << (song - 1);
        if (speed == SongSpeed::CIA) {
            state_.common.speed |= bit;
        } else {
            state_.common.speed &= ~bit;
        }
        return *this;
    }

    // === Build ===

    ExtendedFields TuneHeaderBuilder::make_extended() const {
        ExtendedFields extended;
        extended.flags.mus_player = state_.mus_player.value_or(MusPlayer::BUILT_IN);
        extended.flags.psid_specific = state_.psid_specific.value_or(false);
        extended.flags.clock = state_.clock.value_or(Clock::UNKNOWN);
        extended.flags.sid_model = state_.sid_model.value_or(SidModel::UNKNOWN);
        extended.start_page = state_.start_page.value_or(0);
        extended.page_length = state_.page_length.value_or(0);
        return extended;
    }

    void TuneHeaderBuilder::check_representable() const {
        if (!state_.init_address) {
            throw std::runtime_error("Init address not set");
        }

        // Text must fit its slot
        TextHelper::encoded_length(state_.common.name, "name");
        TextHelper::encoded_length(state_.common.author, "author");
        TextHelper::encoded_length(state_.common.released, "released");

        const Variant variant = state_.variant;
        const auto& sids = state_.extra_sids;

        if (variant == Variant::V1) {
            const ExtendedFields extended = make_extended();
            const bool has_extended = extended.flags.mus_player != MusPlayer::BUILT_IN ||
                extended.flags.psid_specific || extended.flags.clock != Clock::UNKNOWN ||
                extended.flags.sid_model != SidModel::UNKNOWN ||
                extended.start_page != 0 || extended.page_length != 0;
            if (has_extended) {
                throw_error(Status::EUNREPRESENTABLE, "V1 has no flags or relocation fields");
            }
        }

        if (variant == Variant::MULTISID) {
            for (const auto& sid : vendor_sids(sids)) {
                MultiSidHelper::compute_word(
                    SidDescriptor{sid.model, sid.output_channel, sid.address});
            }
            FlagsHelper::compute_word(make_extended().flags);
            return;
        }

        // Trailing empty slots carried over by from() do not count
        std::size_t used = sids.size();
        while (used > 0 && sids[used - 1].address == 0) {
            --used;
        }
        const std::size_t capacity = classic_capacity(variant);
        if (used > capacity) {
            throw_error(Status::ECHIP_CAPACITY, to_string(variant) + " holds " +
                std::to_string(capacity) + " extra SIDs, " + std::to_string(used) +
                " requested");
        }
        for (const auto& sid : sids) {
            if (sid.output_channel != 0) {
                throw_error(Status::EUNREPRESENTABLE,
                    to_string(variant) + " has no output channel field");
            }
        }

        if (variant != Variant::V1) {
            auto slot_model = [&sids, capacity](std::size_t i) {
                    return (i < capacity && i < sids.size()) ? sids[i].model : SidModel::UNKNOWN;
                };
            FlagsHelper::compute_word(make_extended().flags, slot_model(0), slot_model(1));
        }
    }

    HeaderState TuneHeaderBuilder::construct_state() const {
        CommonFields common = state_.common;
        common.init_address = state_.init_address.value();

        const auto sids = (state_.variant == Variant::MULTISID) ?
            vendor_sids(state_.extra_sids) : state_.extra_sids;
        const std::size_t computed = VersionDispatcher::header_size(state_.variant, sids.size());
        common.declared_data_offset =
            state_.declared_data_offset.value_or(static_cast<std::uint16_t>(computed));

        switch (state_.variant) {
        case Variant::V1:
            return V1Header{std::move(common)};

        case Variant::V2:
            return V2Header{std::move(common), make_extended()};

        case Variant::V3: {
            V3Header h{std::move(common), make_extended(), {}};
            if (!sids.empty()) {
                h.second_sid = to_extra_sid(sids[0]);
            }
            return h;
        }

        case Variant::V4: {
            V4Header h{std::move(common), make_extended(), {}, {}};
            if (sids.size() > 0) {
                h.second_sid = to_extra_sid(sids[0]);
            }
            if (sids.size() > 1) {
                h.third_sid = to_extra_sid(sids[1]);
            }
            return h;
        }

        case Variant::MULTISID:
        default: {
            MultiSidHeader h{std::move(common), make_extended(), {}};
            h.extra_sids.reserve(sids.size());
            for (const auto& sid : sids) {
                h.extra_sids.push_back(SidDescriptor{sid.model, sid.output_channel, sid.address});
            }
            return h;
        }
        }
    }

    TuneHeader TuneHeaderBuilder::build() const {
        check_representable();
        return TuneHeader(construct_state());
    }

} // namespace sidfile
