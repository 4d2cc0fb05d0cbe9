/**
 * @file header_json.cpp
 * @brief JSON dump and import of TuneHeader
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 */

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "../include/pattern/header_json.hpp"
#include "../include/interface/version_dispatcher.hpp"

using json = nlohmann::json;

namespace sidfile {

    namespace {

        template<typename EnumType, typename Parser>
        EnumType parse_enum(const json& j, const char* key, Parser parser) {
            const std::string value = j.at(key).get<std::string>();
            bool not_found = false;
            EnumType result = parser(value, not_found);
            if (not_found) {
                throw std::invalid_argument("Invalid " + std::string(key) + ": " + value);
            }
            return result;
        }

        // Integer that must fit the field width; JSON numbers are never wrapped
        template<typename UIntType>
        UIntType parse_uint(const json& j, const char* key) {
            const json& value = j.at(key);
            if (!value.is_number_integer()) {
                throw std::invalid_argument("Invalid " + std::string(key) + ": " + value.dump() +
                    " is not an integer");
            }
            const bool in_range = value.is_number_unsigned()
                ? value.get<std::uint64_t>() <= std::numeric_limits<UIntType>::max()
                : value.get<std::int64_t>() >= 0 &&
                static_cast<std::uint64_t>(value.get<std::int64_t>()) <=
                std::numeric_limits<UIntType>::max();
            if (!in_range) {
                throw std::invalid_argument("Invalid " + std::string(key) + ": " + value.dump() +
                    " is outside 0-" + std::to_string(std::numeric_limits<UIntType>::max()));
            }
            return static_cast<UIntType>(value.get<std::uint64_t>());
        }

    } // namespace

    // === Export ===

    json to_json(const TuneHeader& header) {
        json j;
        j["magic"] = to_string(header.get_magic());
        j["variant"] = to_string(header.get_variant());
        j["version"] = header.get_version();
        j["dataOffset"] = header.get_data_offset();
        j["loadAddress"] = header.get_load_address();
        j["initAddress"] = header.get_init_address();
        j["playAddress"] = header.get_play_address();
        j["songCount"] = header.get_songs();
        j["startSong"] = header.get_start_song();
        j["speedBitmap"] = header.get_speed();
        j["name"] = header.get_name();
        j["author"] = header.get_author();
        j["released"] = header.get_released();

        if (auto extended = header.get_extended_fields()) {
            j["flags"] = {
                {"musPlayer", extended->flags.mus_player == MusPlayer::COMPUTE_SIDPLAYER},
                {"psidSpecific", extended->flags.psid_specific},
                {"clock", to_string(extended->flags.clock)},
                {"sidModel", to_string(extended->flags.sid_model)}
            };
            j["relocationStartPage"] = extended->start_page;
            j["relocationPageCount"] = extended->page_length;
        }

        json sids = json::array();
        for (const auto& chip : header.get_extra_sids()) {
            sids.push_back({
                {"address", chip.address},
                {"baseAddress", chip.base_address},
                {"present", chip.present},
                {"sidModel", to_string(chip.declared_model)},
                {"effectiveModel", to_string(chip.effective_model)},
                {"outputChannel", chip.output_channel}
            });
        }
        j["extraSids"] = sids;
        return j;
    }

    json to_json(const Diagnostic& diagnostic) {
        return json{
            {"severity", to_string(diagnostic.severity)},
            {"status", static_cast<int>(diagnostic.status)},
            {"field", diagnostic.field},
            {"offset", diagnostic.offset},
            {"observed", diagnostic.observed},
            {"expected", diagnostic.expected},
            {"message", diagnostic.message}
        };
    }

    json to_json(const Diagnostics& diagnostics) {
        json j = json::array();
        for (const auto& d : diagnostics) {
            j.push_back(to_json(d));
        }
        return j;
    }

    // === Import ===

    TuneHeaderBuilder header_from_json(const json& j) {
        Variant variant;
        if (j.contains("variant")) {
            variant = parse_enum<Variant>(j, "variant", variant_from_string);
        } else if (j.contains("version")) {
            variant = VersionDispatcher::variant_for_version(
                parse_uint<std::uint16_t>(j, "version"));
        } else {
            throw std::invalid_argument("JSON header has neither variant nor version");
        }

        auto builder = make_header_builder(variant);

        if (j.contains("magic")) {
            builder = builder.with_magic(parse_enum<MagicId>(j, "magic", magic_from_string));
        }
        if (j.contains("loadAddress")) {
            builder = builder.with_load_address(parse_uint<std::uint16_t>(j, "loadAddress"));
        }
        if (j.contains("initAddress")) {
            builder = builder.with_init_address(parse_uint<std::uint16_t>(j, "initAddress"));
        }
        if (j.contains("playAddress")) {
            builder = builder.with_play_address(parse_uint<std::uint16_t>(j, "playAddress"));
        }
        if (j.contains("songCount")) {
            builder = builder.with_songs(parse_uint<std::uint16_t>(j, "songCount"));
        }
        if (j.contains("startSong")) {
            builder = builder.with_start_song(parse_uint<std::uint16_t>(j, "startSong"));
        }
        if (j.contains("speedBitmap")) {
            builder = builder.with_speed(parse_uint<std::uint32_t>(j, "speedBitmap"));
        }
        if (j.contains("name")) {
            builder = builder.with_name(j.at("name").get<std::string>());
        }
        if (j.contains("author")) {
            builder = builder.with_author(j.at("author").get<std::string>());
        }
        if (j.contains("released")) {
            builder = builder.with_released(j.at("released").get<std::string>());
        }

        if (j.contains("flags")) {
            const auto& flags = j.at("flags");
            if (flags.contains("musPlayer")) {
                builder = builder.with_mus_player(flags.at("musPlayer").get<bool>()
                    ? MusPlayer::COMPUTE_SIDPLAYER : MusPlayer::BUILT_IN);
            }
            if (flags.contains("psidSpecific")) {
                builder = builder.with_psid_specific(flags.at("psidSpecific").get<bool>());
            }
            if (flags.contains("clock")) {
                builder = builder.with_clock(parse_enum<Clock>(flags, "clock", clock_from_string));
            }
            if (flags.contains("sidModel")) {
                builder = builder.with_sid_model(
                    parse_enum<SidModel>(flags, "sidModel", sidmodel_from_string));
            }
        }
        if (j.contains("relocationStartPage") || j.contains("relocationPageCount")) {
            const std::uint8_t start = j.contains("relocationStartPage")
                ? parse_uint<std::uint8_t>(j, "relocationStartPage") : 0;
            const std::uint8_t length = j.contains("relocationPageCount")
                ? parse_uint<std::uint8_t>(j, "relocationPageCount") : 0;
            builder = builder.with_relocation(start, length);
        }

        if (j.contains("extraSids")) {
            for (const auto& sid : j.at("extraSids")) {
                SidModel model = SidModel::UNKNOWN;
                if (sid.contains("sidModel")) {
                    model = parse_enum<SidModel>(sid, "sidModel", sidmodel_from_string);
                }
                const std::uint8_t channel = sid.contains("outputChannel")
                    ? parse_uint<std::uint8_t>(sid, "outputChannel") : 0;
                builder = builder.with_extra_sid(parse_uint<std::uint8_t>(sid, "address"),
                    model, channel);
            }
        }

        return builder;
    }

} // namespace sidfile
