/**
 * @file test_header_builder.cpp
 * @brief Unit tests for TuneHeaderBuilder
 *
 * Test Strategy:
 * 1. Defaults and required fields
 * 2. Fluent setters land in the right variant struct
 * 3. Representability checks raise EncodingException
 * 4. from() edits and variant conversion
 *
 * @note Run: ./test_header_builder
 */

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>

#include "test_utils.hpp"

using namespace sidfile;
using namespace sidfile::test;

namespace {

    Status build_status(const TuneHeaderBuilder& builder) {
        try {
            (void)builder.build();
        } catch (const EncodingException& e) {
            return e.status();
        }
        return Status::SUCCESS;
    }

}

// ============================================================================
// DEFAULTS
// ============================================================================

TEST_CASE("TuneHeaderBuilder - Defaults", "[builder]") {
    SECTION("Init address is required") {
        REQUIRE_THROWS_AS(make_header_builder().build(), std::runtime_error);
    }

    SECTION("Minimal V2 header") {
        auto header = make_header_builder().with_init_address(0x1000).build();
        REQUIRE(header.get_variant() == Variant::V2);
        REQUIRE(header.get_magic() == MagicId::PSID);
        REQUIRE(header.get_songs() == 1);
        REQUIRE(header.get_start_song() == 1);
        REQUIRE(header.get_declared_data_offset() == 0x7C);
        REQUIRE(header.get_clock() == Clock::UNKNOWN);
        REQUIRE(header.get_extra_sids().empty());
    }

    SECTION("Declared dataOffset follows the descriptor count") {
        auto header = make_header_builder(Variant::MULTISID)
                      .with_init_address(0x1000)
                      .with_extra_sid(0x42)
                      .with_extra_sid(0x44)
                      .build();
        REQUIRE(header.get_declared_data_offset() == 0x80);
        REQUIRE(header.get_data_offset() == 0x80);
    }
}

// ============================================================================
// SETTERS
// ============================================================================

TEST_CASE("TuneHeaderBuilder - Field setters", "[builder]") {
    auto header = make_header_builder(Variant::V4)
                  .with_magic(MagicId::RSID)
                  .with_init_address(0x0000)
                  .with_songs(5)
                  .with_start_song(2)
                  .with_name("Name")
                  .with_author("Author")
                  .with_released("2024 Group")
                  .with_basic(true)
                  .with_clock(Clock::PAL_AND_NTSC)
                  .with_sid_model(SidModel::MOS_8580)
                  .with_relocation(0xC0, 0x10)
                  .with_extra_sid(0x42, SidModel::MOS_6581)
                  .with_extra_sid(0xE0)
                  .build();

    REQUIRE(header.is_rsid());
    REQUIRE(header.get_init_address() == 0x0000);
    REQUIRE(header.get_songs() == 5);
    REQUIRE(header.get_start_song() == 2);
    REQUIRE(header.get_released() == "2024 Group");
    REQUIRE(header.is_basic());
    REQUIRE(header.get_clock() == Clock::PAL_AND_NTSC);
    REQUIRE(header.get_relocation_start_page() == 0xC0);

    const auto& state = std::get<V4Header>(header.state());
    REQUIRE(state.second_sid.address == 0x42);
    REQUIRE(state.second_sid.model == SidModel::MOS_6581);
    REQUIRE(state.third_sid.address == 0xE0);
    REQUIRE(header.get_extra_sids()[1].effective_model == SidModel::MOS_8580);
    REQUIRE(validate(header, RSID_PAYLOAD).empty());
}

TEST_CASE("TuneHeaderBuilder - Song speed bits", "[builder][speed]") {
    auto builder = make_header_builder().with_init_address(0x1000).with_songs(3);

    SECTION("Set and clear") {
        builder = builder.with_song_speed(1, SongSpeed::CIA).with_song_speed(3, SongSpeed::CIA);
        REQUIRE(builder.build().get_speed() == 0x00000005);

        builder = builder.with_song_speed(1, SongSpeed::VBI);
        REQUIRE(builder.build().get_speed() == 0x00000004);
    }

    SECTION("Song 32 is the last own bit") {
        builder = builder.with_song_speed(32, SongSpeed::CIA);
        REQUIRE(builder.build().get_speed() == 0x80000000);
    }

    SECTION("Songs without a bit") {
        REQUIRE_THROWS_AS(builder.with_song_speed(0, SongSpeed::CIA), std::out_of_range);
        REQUIRE_THROWS_AS(builder.with_song_speed(33, SongSpeed::CIA), std::out_of_range);
    }
}

// ============================================================================
// REPRESENTABILITY
// ============================================================================

TEST_CASE("TuneHeaderBuilder - Unrepresentable headers", "[builder][error]") {
    auto v1 = make_header_builder(Variant::V1).with_init_address(0x1000);

    SECTION("V1 has no flags") {
        REQUIRE(build_status(v1.with_clock(Clock::PAL)) == Status::EUNREPRESENTABLE);
    }

    SECTION("V1 has no relocation") {
        REQUIRE(build_status(v1.with_relocation(0xC0, 1)) == Status::EUNREPRESENTABLE);
    }

    SECTION("Too many extra SIDs for the variant") {
        auto v3 = make_header_builder(Variant::V3)
                  .with_init_address(0x1000)
                  .with_extra_sid(0x42)
                  .with_extra_sid(0x44);
        REQUIRE(build_status(v3) == Status::ECHIP_CAPACITY);
        REQUIRE(build_status(make_header_builder(Variant::V2)
            .with_init_address(0x1000).with_extra_sid(0x42)) == Status::ECHIP_CAPACITY);
    }

    SECTION("Output channel only exists in the vendor variant") {
        auto v4 = make_header_builder(Variant::V4)
                  .with_init_address(0x1000)
                  .with_extra_sid(0x42, SidModel::MOS_6581, 1);
        REQUIRE(build_status(v4) == Status::EUNREPRESENTABLE);
    }

    SECTION("Output channel above 1") {
        auto vendor = make_header_builder(Variant::MULTISID)
                      .with_init_address(0x1000)
                      .with_extra_sid(0x42, SidModel::MOS_6581, 2);
        REQUIRE(build_status(vendor) == Status::EUNREPRESENTABLE);
    }

    SECTION("Name longer than its slot") {
        auto builder = make_header_builder()
                       .with_init_address(0x1000)
                       .with_name(std::string(33, 'n'));
        REQUIRE(build_status(builder) == Status::ETEXT_TOO_LONG);
    }

    SECTION("Author outside Windows-1252") {
        auto builder = make_header_builder()
                       .with_init_address(0x1000)
                       .with_author("\xE6\x97\xA5");
        REQUIRE(build_status(builder) == Status::EUNREPRESENTABLE);
    }

    SECTION("Constraint violations still build") {
        auto header = make_header_builder()
                      .with_init_address(0x1000)
                      .with_songs(0)
                      .build();
        REQUIRE(has_fatal(validate(header)));
    }
}

// ============================================================================
// EDITING
// ============================================================================

TEST_CASE("TuneHeaderBuilder::from - Edit a decoded header", "[builder][from]") {
    auto original = decode(psid_v2().file(SAMPLE_PAYLOAD)).header;

    SECTION("Unchanged copy is equal") {
        REQUIRE(TuneHeaderBuilder::from(original).build() == original);
    }

    SECTION("Single field edit") {
        auto edited = TuneHeaderBuilder::from(original).with_songs(7).build();
        REQUIRE(edited.get_songs() == 7);
        REQUIRE(edited.get_name() == original.get_name());
        REQUIRE(edited.get_sid_model() == SidModel::MOS_6581);
        REQUIRE(original.get_songs() == 1);
    }

    SECTION("V2 to V3 keeps flags and adds a chip") {
        auto edited = TuneHeaderBuilder::from(original)
                      .with_variant(Variant::V3)
                      .with_extra_sid(0x42, SidModel::MOS_8580)
                      .build();
        REQUIRE(edited.get_variant() == Variant::V3);
        REQUIRE(edited.get_clock() == Clock::PAL);
        REQUIRE(edited.sid_count() == 2);
    }

    SECTION("V2 to V1 without extended values") {
        auto plain = make_header_builder().with_init_address(0x1000).build();
        auto edited = TuneHeaderBuilder::from(plain).with_variant(Variant::V1).build();
        REQUIRE(edited.get_variant() == Variant::V1);
        REQUIRE(edited.get_declared_data_offset() == 0x76);
    }

    SECTION("V2 to V1 with a clock fails") {
        REQUIRE(build_status(TuneHeaderBuilder::from(original).with_variant(Variant::V1)) ==
            Status::EUNREPRESENTABLE);
    }
}

TEST_CASE("TuneHeaderBuilder::from - Extra SID slots", "[builder][from]") {
    auto raw = psid_v2();
    raw.word(0x04, 4).byte(0x7B, 0xE0);     // second absent, third at $DE00
    auto v4 = decode(raw.file(SAMPLE_PAYLOAD)).header;

    SECTION("Third SID keeps its slot") {
        auto copy = TuneHeaderBuilder::from(v4).build();
        const auto& state = std::get<V4Header>(copy.state());
        REQUIRE(state.second_sid.address == 0x00);
        REQUIRE(state.third_sid.address == 0xE0);
    }

    SECTION("V4 to vendor variant drops the empty slot") {
        auto vendor = TuneHeaderBuilder::from(v4).with_variant(Variant::MULTISID).build();
        const auto& state = std::get<MultiSidHeader>(vendor.state());
        REQUIRE(state.extra_sids.size() == 1);
        REQUIRE(state.extra_sids[0].address == 0xE0);
        REQUIRE(vendor.get_data_offset() == 0x7E);
    }

    SECTION("V3 without a second SID converts to V2") {
        auto v3_raw = psid_v2();
        v3_raw.word(0x04, 3);
        auto v3 = decode(v3_raw.file(SAMPLE_PAYLOAD)).header;
        auto v2 = TuneHeaderBuilder::from(v3).with_variant(Variant::V2).build();
        REQUIRE(v2.get_variant() == Variant::V2);
        REQUIRE(v2.get_extra_sids().empty());
    }

    SECTION("Vendor descriptors carry their channel") {
        auto vendor = decode(multisid({0x06E0}).file(SAMPLE_PAYLOAD)).header;
        auto copy = TuneHeaderBuilder::from(vendor).build();
        REQUIRE(copy.get_extra_sids()[0].output_channel == 1);
        REQUIRE(copy == vendor);
    }
}
