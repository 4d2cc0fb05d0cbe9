/**
 * @file header_codec.cpp
 * @brief PSID/RSID decode and encode
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 * Decode: VersionDispatcher picks the variant, fields are read at their
 * layout offsets into the variant struct, then HeaderValidator runs.
 * Encode: the inverse, with dataOffset recomputed.
 */

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "../include/header/header_codec.hpp"
#include "../include/interface/serialization_helpers.hpp"
#include "../include/interface/multi_sid.hpp"
#include "../include/interface/version_dispatcher.hpp"
#include "../include/interface/validator/header_validator.hpp"
#include "../include/exception/sidfile_exception.hpp"

namespace sidfile {

    namespace {

        std::string hex(std::uint32_t value, int width) {
            std::ostringstream oss;
            oss << "$" << std::hex << std::uppercase << std::setfill('0') << std::setw(width) << value;
            return oss.str();
        }

        Diagnostic reserved_warning(std::string field, std::size_t offset,
            std::uint32_t observed, int width, std::string message) {
            Diagnostic d;
            d.severity = Severity::WARNING;
            d.status = Status::CRESERVED_NOT_ZERO;
            d.field = std::move(field);
            d.offset = offset;
            d.observed = hex(observed, width);
            d.expected = hex(0, width);
            d.message = std::move(message);
            return d;
        }

        std::uint16_t read_word(span<const std::uint8_t> buffer, std::size_t offset) {
            return bytes_to_int_be<std::uint16_t>(buffer.subspan(offset, 2));
        }

        template<std::size_t N>
        void write_bytes(std::vector<std::uint8_t>& buffer, std::size_t offset,
            const std::array<std::uint8_t, N>& bytes) {
            std::copy(bytes.begin(), bytes.end(), buffer.begin() + offset);
        }

        CommonFields read_common(span<const std::uint8_t> buffer, const Dispatch& dispatch) {
            using Layout = CommonLayout;
            CommonFields common;
            common.magic = dispatch.magic;
            common.declared_data_offset = dispatch.declared_data_offset;
            common.load_address = read_word(buffer, Layout::LOAD_ADDRESS);
            common.init_address = read_word(buffer, Layout::INIT_ADDRESS);
            common.play_address = read_word(buffer, Layout::PLAY_ADDRESS);
            common.songs = read_word(buffer, Layout::SONGS);
            common.start_song = read_word(buffer, Layout::START_SONG);
            common.speed = bytes_to_int_be<std::uint32_t>(buffer.subspan(Layout::SPEED, 4));
            common.name = TextHelper::decode(buffer.subspan(Layout::NAME, Layout::TEXT_SIZE));
            common.author = TextHelper::decode(buffer.subspan(Layout::AUTHOR, Layout::TEXT_SIZE));
            common.released = TextHelper::decode(buffer.subspan(Layout::RELEASED, Layout::TEXT_SIZE));
            return common;
        }

        /**
         * @brief Read flags and relocation bytes shared by V2+ and the vendor variant
         * @return FlagComponents with the raw second/third model bits for the caller
         */
        FlagsHelper::FlagComponents read_extended(span<const std::uint8_t> buffer,
            ExtendedFields& extended, Diagnostics& notes) {
            const std::uint16_t word = read_word(buffer, ClassicLayout::FLAGS);
            auto components = FlagsHelper::parse_word(word);
            extended.flags = components.flags;
            extended.start_page = buffer[ClassicLayout::START_PAGE];
            extended.page_length = buffer[ClassicLayout::PAGE_LENGTH];

            if (components.reserved != 0) {
                notes.push_back(reserved_warning("flags", ClassicLayout::FLAGS,
                    components.reserved, 4, "flags bits 10-15 are reserved and ignored"));
            }
            return components;
        }

        HeaderState read_state(span<const std::uint8_t> buffer, const Dispatch& dispatch,
            Diagnostics& notes) {
            using Layout = ClassicLayout;
            CommonFields common = read_common(buffer, dispatch);

            switch (dispatch.variant) {
            case Variant::V1:
                return V1Header{std::move(common)};

            case Variant::V2: {
                V2Header h{std::move(common), {}};
                read_extended(buffer, h.extended, notes);
                const std::uint16_t models = read_word(buffer, Layout::FLAGS) &
                    (FlagsHelper::SECOND_MODEL_MASK | FlagsHelper::THIRD_MODEL_MASK);
                if (models != 0) {
                    notes.push_back(reserved_warning("flags", Layout::FLAGS, models, 4,
                        "V2 has no extra SID models, flags bits 6-9 are ignored"));
                }
                if (buffer[Layout::SECOND_SID_ADDRESS] != 0) {
                    notes.push_back(reserved_warning("secondSidAddress", Layout::SECOND_SID_ADDRESS,
                        buffer[Layout::SECOND_SID_ADDRESS], 2, "V2 has no second SID, byte ignored"));
                }
                if (buffer[Layout::THIRD_SID_ADDRESS] != 0) {
                    notes.push_back(reserved_warning("thirdSidAddress", Layout::THIRD_SID_ADDRESS,
                        buffer[Layout::THIRD_SID_ADDRESS], 2, "V2 has no third SID, byte ignored"));
                }
                return h;
            }

            case Variant::V3: {
                V3Header h{std::move(common), {}, {}};
                auto flags = read_extended(buffer, h.extended, notes);
                h.second_sid.address = buffer[Layout::SECOND_SID_ADDRESS];
                h.second_sid.model = flags.second_model;
                if (flags.third_model != SidModel::UNKNOWN) {
                    notes.push_back(reserved_warning("flags", Layout::FLAGS,
                        read_word(buffer, Layout::FLAGS) & FlagsHelper::THIRD_MODEL_MASK, 4,
                        "V3 has no third SID model, flags bits 8-9 are ignored"));
                }
                if (buffer[Layout::THIRD_SID_ADDRESS] != 0) {
                    notes.push_back(reserved_warning("thirdSidAddress", Layout::THIRD_SID_ADDRESS,
                        buffer[Layout::THIRD_SID_ADDRESS], 2, "V3 has no third SID, byte ignored"));
                }
                return h;
            }

            case Variant::V4: {
                V4Header h{std::move(common), {}, {}, {}};
                auto flags = read_extended(buffer, h.extended, notes);
                h.second_sid.address = buffer[Layout::SECOND_SID_ADDRESS];
                h.second_sid.model = flags.second_model;
                h.third_sid.address = buffer[Layout::THIRD_SID_ADDRESS];
                h.third_sid.model = flags.third_model;
                return h;
            }

            case Variant::MULTISID:
            default: {
                MultiSidHeader h{std::move(common), {}, {}};
                read_extended(buffer, h.extended, notes);
                const std::uint16_t models = read_word(buffer, MultiSidLayout::FLAGS) &
                    (FlagsHelper::SECOND_MODEL_MASK | FlagsHelper::THIRD_MODEL_MASK);
                if (models != 0) {
                    notes.push_back(reserved_warning("flags", MultiSidLayout::FLAGS, models, 4,
                        "multi-SID models live in the descriptors, flags bits 6-9 are ignored"));
                }

                h.extra_sids.reserve(dispatch.descriptor_words.size());
                for (std::size_t i = 0; i < dispatch.descriptor_words.size(); ++i) {
                    auto parsed = MultiSidHelper::parse_word(dispatch.descriptor_words[i]);
                    if (parsed.reserved != 0) {
                        notes.push_back(reserved_warning("sidDescriptor[" + std::to_string(i) + "]",
                            MultiSidLayout::descriptor_offset(i), parsed.reserved, 4,
                            "descriptor bits 11-15 are unused and ignored"));
                    }
                    h.extra_sids.push_back(parsed.descriptor);
                }
                return h;
            }
            }
        }

        void write_common(std::vector<std::uint8_t>& buffer, const TuneHeader& header) {
            using Layout = CommonLayout;
            const std::string magic = to_string(header.get_magic());
            std::copy(magic.begin(), magic.end(), buffer.begin() + Layout::MAGIC);

            write_bytes(buffer, Layout::VERSION, int_to_bytes_be<std::uint16_t, 2>(header.get_version()));
            write_bytes(buffer, Layout::DATA_OFFSET,
                int_to_bytes_be<std::uint16_t, 2>(header.get_data_offset()));
            write_bytes(buffer, Layout::LOAD_ADDRESS,
                int_to_bytes_be<std::uint16_t, 2>(header.get_load_address()));
            write_bytes(buffer, Layout::INIT_ADDRESS,
                int_to_bytes_be<std::uint16_t, 2>(header.get_init_address()));
            write_bytes(buffer, Layout::PLAY_ADDRESS,
                int_to_bytes_be<std::uint16_t, 2>(header.get_play_address()));
            write_bytes(buffer, Layout::SONGS, int_to_bytes_be<std::uint16_t, 2>(header.get_songs()));
            write_bytes(buffer, Layout::START_SONG,
                int_to_bytes_be<std::uint16_t, 2>(header.get_start_song()));
            write_bytes(buffer, Layout::SPEED, int_to_bytes_be<std::uint32_t, 4>(header.get_speed()));
            write_bytes(buffer, Layout::NAME, TextHelper::encode(header.get_name(), "name"));
            write_bytes(buffer, Layout::AUTHOR, TextHelper::encode(header.get_author(), "author"));
            write_bytes(buffer, Layout::RELEASED, TextHelper::encode(header.get_released(), "released"));
        }

        void write_extended(std::vector<std::uint8_t>& buffer, const ExtendedFields& extended,
            SidModel second_model, SidModel third_model) {
            write_bytes(buffer, ClassicLayout::FLAGS, int_to_bytes_be<std::uint16_t, 2>(
                FlagsHelper::compute_word(extended.flags, second_model, third_model)));
            buffer[ClassicLayout::START_PAGE] = extended.start_page;
            buffer[ClassicLayout::PAGE_LENGTH] = extended.page_length;
        }

    } // namespace

    // === Decode ===

    DecodeResult decode(span<const std::uint8_t> buffer, bool accept_multisid) {
        const Dispatch dispatch = VersionDispatcher::select(buffer, accept_multisid);

        Diagnostics diagnostics;
        TuneHeader header(read_state(buffer, dispatch, diagnostics));

        std::vector<std::uint8_t> payload(buffer.begin() + dispatch.header_size, buffer.end());

        auto violations = HeaderValidator(header, payload).validate();
        diagnostics.insert(diagnostics.end(), violations.begin(), violations.end());

        return DecodeResult{std::move(header), std::move(payload), std::move(diagnostics)};
    }

    // === Encode ===

    std::vector<std::uint8_t> encode(const TuneHeader& header, span<const std::uint8_t> payload) {
        const std::size_t header_size = header.get_data_offset();
        std::vector<std::uint8_t> buffer(header_size, 0x00);

        write_common(buffer, header);

        std::visit([&buffer](const auto& h) {
                using H = std::decay_t<decltype(h)>;
                if constexpr (std::is_same_v<H, V2Header>) {
                    write_extended(buffer, h.extended, SidModel::UNKNOWN, SidModel::UNKNOWN);
                } else if constexpr (std::is_same_v<H, V3Header>) {
                    write_extended(buffer, h.extended, h.second_sid.model, SidModel::UNKNOWN);
                    buffer[ClassicLayout::SECOND_SID_ADDRESS] = h.second_sid.address;
                } else if constexpr (std::is_same_v<H, V4Header>) {
                    write_extended(buffer, h.extended, h.second_sid.model, h.third_sid.model);
                    buffer[ClassicLayout::SECOND_SID_ADDRESS] = h.second_sid.address;
                    buffer[ClassicLayout::THIRD_SID_ADDRESS] = h.third_sid.address;
                } else if constexpr (std::is_same_v<H, MultiSidHeader>) {
                    write_extended(buffer, h.extended, SidModel::UNKNOWN, SidModel::UNKNOWN);
                    const auto trailer = MultiSidHelper::serialize(h.extra_sids);
                    std::copy(trailer.begin(), trailer.end(),
                        buffer.begin() + MultiSidLayout::DESCRIPTORS);
                }
            }, header.state());

        buffer.insert(buffer.end(), payload.begin(), payload.end());
        return buffer;
    }

    // === Validate ===

    Diagnostics validate(const TuneHeader& header, span<const std::uint8_t> payload) {
        return HeaderValidator(header, payload).validate();
    }

    Diagnostics validate(const TuneHeader& header) {
        return HeaderValidator(header).validate();
    }

} // namespace sidfile
