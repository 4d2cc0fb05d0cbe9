/**
 * @file test_header_validator.cpp
 * @brief Unit tests for header constraint validation
 *
 * Test Strategy:
 * 1. Headers are made with the builder, which does not enforce constraints
 * 2. Each rule is broken in isolation and the diagnostic is checked by field
 * 3. Collection is exhaustive: several broken rules give several diagnostics
 *
 * @note Run: ./test_header_validator
 */

#include <catch2/catch_test_macros.hpp>
#include <type_traits>
#include <vector>

#include "test_utils.hpp"

using namespace sidfile;
using namespace sidfile::test;

namespace {

    TuneHeaderBuilder psid() {
        return make_header_builder(Variant::V2)
               .with_load_address(0x1000)
               .with_init_address(0x1000)
               .with_play_address(0x1003);
    }

    TuneHeaderBuilder rsid(Variant variant = Variant::V2) {
        return make_header_builder(variant)
               .with_magic(MagicId::RSID)
               .with_init_address(0x0810);
    }

}

// ============================================================================
// COMMON RULES
// ============================================================================

TEST_CASE("HeaderValidator - Valid headers have no diagnostics", "[validator]") {
    SECTION("PSID with payload") {
        auto header = psid().build();
        REQUIRE(validate(header, SAMPLE_PAYLOAD).empty());
    }

    SECTION("RSID with embedded load address") {
        auto header = rsid().build();
        REQUIRE(validate(header, RSID_PAYLOAD).empty());
    }

    SECTION("Header alone") {
        REQUIRE(validate(psid().build()).empty());
    }
}

TEST_CASE("HeaderValidator - dataOffset", "[validator][common]") {
    auto header = psid().with_declared_data_offset(0x76).build();
    auto diagnostics = validate(header);

    REQUIRE(diagnostics.size() == 1);
    REQUIRE(diagnostics[0].field == "dataOffset");
    REQUIRE(diagnostics[0].status == Status::CBAD_DATA_OFFSET);
    REQUIRE(diagnostics[0].is_fatal());
    REQUIRE(diagnostics[0].offset == 0x06);
}

TEST_CASE("HeaderValidator - Song count and start song", "[validator][common]") {
    SECTION("Zero songs") {
        auto diagnostics = validate(psid().with_songs(0).build());
        const auto* d = find_diagnostic(diagnostics, "songCount");
        REQUIRE(d != nullptr);
        REQUIRE(d->status == Status::CBAD_SONG_COUNT);
    }

    SECTION("257 songs") {
        auto diagnostics = validate(psid().with_songs(257).build());
        REQUIRE(find_diagnostic(diagnostics, "songCount") != nullptr);
    }

    SECTION("256 songs is the maximum") {
        auto diagnostics = validate(psid().with_songs(256).with_start_song(256).build());
        REQUIRE(diagnostics.empty());
    }

    SECTION("Start song 0") {
        auto diagnostics = validate(psid().with_start_song(0).build());
        const auto* d = find_diagnostic(diagnostics, "startSong");
        REQUIRE(d != nullptr);
        REQUIRE(d->status == Status::CBAD_START_SONG);
    }

    SECTION("Start song after the last song") {
        auto diagnostics = validate(psid().with_songs(3).with_start_song(4).build());
        REQUIRE(find_diagnostic(diagnostics, "startSong") != nullptr);
    }
}

// ============================================================================
// RSID RULES
// ============================================================================

TEST_CASE("HeaderValidator - RSID lockdown names the field", "[validator][rsid]") {
    SECTION("loadAddress") {
        auto diagnostics = validate(rsid().with_load_address(0x0800).build());
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "loadAddress");
        REQUIRE(diagnostics[0].message == "loadAddress must be 0 for RSID");
    }

    SECTION("playAddress") {
        auto diagnostics = validate(rsid().with_play_address(0x1003).build(), RSID_PAYLOAD);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "playAddress");
        REQUIRE(diagnostics[0].status == Status::CBAD_PLAY_ADDRESS);
    }

    SECTION("speedBitmap") {
        auto diagnostics = validate(rsid().with_speed(0x00000001).build(), RSID_PAYLOAD);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "speedBitmap");
        REQUIRE(diagnostics[0].status == Status::CBAD_SPEED);
    }

    SECTION("All three at once") {
        auto diagnostics = validate(rsid()
                .with_load_address(0x0800)
                .with_play_address(0x1003)
                .with_speed(0x3)
                .build());
        REQUIRE(diagnostics.size() == 3);
    }

    SECTION("RSID requires version 2") {
        auto diagnostics = validate(rsid(Variant::V1).build(), RSID_PAYLOAD);
        const auto* d = find_diagnostic(diagnostics, "version");
        REQUIRE(d != nullptr);
        REQUIRE(d->status == Status::CBAD_VERSION);
    }
}

TEST_CASE("HeaderValidator - RSID init address", "[validator][rsid]") {
    auto init_diagnostic = [](std::uint16_t init) {
            auto header = rsid().with_init_address(init).build();
            auto diagnostics = validate(header, RSID_PAYLOAD);
            const auto* d = find_diagnostic(diagnostics, "initAddress");
            return d ? *d : Diagnostic{};
        };

    SECTION("Accepted windows") {
        REQUIRE(init_diagnostic(0x07E8).field.empty());
        REQUIRE(init_diagnostic(0x9FFF).field.empty());
        REQUIRE(init_diagnostic(0xC000).field.empty());
        REQUIRE(init_diagnostic(0xCFFF).field.empty());
    }

    SECTION("Rejected areas") {
        REQUIRE(init_diagnostic(0x07E7).status == Status::CBAD_INIT_ADDRESS);
        REQUIRE(init_diagnostic(0xA000).status == Status::CBAD_INIT_ADDRESS);
        REQUIRE(init_diagnostic(0xBFFF).status == Status::CBAD_INIT_ADDRESS);
        REQUIRE(init_diagnostic(0xD000).status == Status::CBAD_INIT_ADDRESS);
        REQUIRE(init_diagnostic(0xFFFF).status == Status::CBAD_INIT_ADDRESS);
    }

    SECTION("Zero init needs the BASIC flag") {
        REQUIRE(init_diagnostic(0x0000).status == Status::CBAD_INIT_ADDRESS);

        auto basic = rsid().with_init_address(0).with_basic(true).build();
        REQUIRE(validate(basic, RSID_PAYLOAD).empty());
    }

    SECTION("BASIC programs must have init 0") {
        auto basic = rsid().with_init_address(0x0810).with_basic(true).build();
        auto diagnostics = validate(basic, RSID_PAYLOAD);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "initAddress");
    }

    SECTION("PSID init is unrestricted") {
        REQUIRE(validate(psid().with_init_address(0xE000).build(), SAMPLE_PAYLOAD).empty());
    }
}

// ============================================================================
// PAYLOAD AND RELOCATION
// ============================================================================

TEST_CASE("HeaderValidator - Payload carrying its load address", "[validator][payload]") {
    auto header = psid().with_load_address(0).build();

    SECTION("One byte is too short") {
        std::vector<std::uint8_t> payload = {0x00};
        auto diagnostics = validate(header, payload);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "payload");
        REQUIRE(diagnostics[0].status == Status::CBAD_PAYLOAD);
    }

    SECTION("Two bytes are enough") {
        std::vector<std::uint8_t> payload = {0x00, 0x10};
        REQUIRE(validate(header, payload).empty());
    }

    SECTION("Skipped without a payload") {
        REQUIRE(validate(header).empty());
    }
}

TEST_CASE("HeaderValidator - Relocation range", "[validator][relocation]") {
    SECTION("No relocation") {
        REQUIRE(validate(psid().with_relocation(0x00, 0x00).build(), SAMPLE_PAYLOAD).empty());
        REQUIRE(validate(psid().with_relocation(0xFF, 0x00).build(), SAMPLE_PAYLOAD).empty());
    }

    SECTION("Page count without a start page") {
        auto diagnostics = validate(psid().with_relocation(0x00, 0x04).build(), SAMPLE_PAYLOAD);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "relocationPageCount");
        REQUIRE(diagnostics[0].status == Status::CBAD_RELOCATION);
    }

    SECTION("Range past $FFFF") {
        auto diagnostics = validate(psid().with_relocation(0xF0, 0x20).build(), SAMPLE_PAYLOAD);
        REQUIRE(find_diagnostic(diagnostics, "relocationPageCount") != nullptr);
    }

    SECTION("Overlap with the load range") {
        auto diagnostics = validate(psid().with_relocation(0x10, 0x01).build(), SAMPLE_PAYLOAD);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "relocationStartPage");
    }

    SECTION("Adjacent to the load range") {
        REQUIRE(validate(psid().with_relocation(0x11, 0x10).build(), SAMPLE_PAYLOAD).empty());
    }

    SECTION("RSID forbidden areas") {
        auto zero_page = validate(rsid().with_relocation(0x02, 0x01).build(), RSID_PAYLOAD);
        REQUIRE(zero_page.size() == 1);

        auto basic_rom = validate(rsid().with_relocation(0xA0, 0x10).build(), RSID_PAYLOAD);
        REQUIRE(basic_rom.size() == 1);

        auto io = validate(rsid().with_relocation(0xC0, 0x20).build(), RSID_PAYLOAD);
        REQUIRE(io.size() == 1);

        REQUIRE(validate(rsid().with_relocation(0xC0, 0x10).build(), RSID_PAYLOAD).empty());
    }

    SECTION("PSID may relocate into ROM areas") {
        REQUIRE(validate(psid().with_relocation(0xA0, 0x10).build(), SAMPLE_PAYLOAD).empty());
    }
}

// ============================================================================
// EXTRA SIDS
// ============================================================================

TEST_CASE("HeaderValidator - Chip addresses", "[validator][chip]") {
    SECTION("Invalid address is a warning") {
        auto header = psid().with_variant(Variant::V3).with_extra_sid(0x80).build();
        auto diagnostics = validate(header, SAMPLE_PAYLOAD);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "secondSidAddress");
        REQUIRE(diagnostics[0].severity == Severity::WARNING);
        REQUIRE(diagnostics[0].status == Status::CBAD_CHIP_ADDRESS);
        REQUIRE_FALSE(has_fatal(diagnostics));
    }

    SECTION("Address 0 is silently absent") {
        auto header = psid().with_variant(Variant::V4).with_extra_sid(0x00).with_extra_sid(0x42)
                      .build();
        REQUIRE(validate(header, SAMPLE_PAYLOAD).empty());
        REQUIRE(header.sid_count() == 2);
    }

    SECTION("Duplicate classic addresses") {
        auto header = psid().with_variant(Variant::V4).with_extra_sid(0x42).with_extra_sid(0x42)
                      .build();
        auto diagnostics = validate(header, SAMPLE_PAYLOAD);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "thirdSidAddress");
        REQUIRE(diagnostics[0].status == Status::CDUPLICATE_CHIP_ADDRESS);
        REQUIRE(diagnostics[0].is_fatal());
    }

    SECTION("Duplicate vendor descriptors") {
        auto header = psid().with_variant(Variant::MULTISID)
                      .with_extra_sid(0x42)
                      .with_extra_sid(0x50)
                      .with_extra_sid(0x42, SidModel::MOS_8580, 1)
                      .build();
        auto diagnostics = validate(header, SAMPLE_PAYLOAD);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(diagnostics[0].field == "sidDescriptor[2]");
        REQUIRE(diagnostics[0].status == Status::CDUPLICATE_CHIP_ADDRESS);
    }
}

TEST_CASE("HeaderValidator - Every violation is reported", "[validator]") {
    auto header = rsid()
                  .with_load_address(0x0800)
                  .with_songs(0)
                  .with_relocation(0x00, 0x01)
                  .with_declared_data_offset(0x80)
                  .build();
    auto diagnostics = validate(header, RSID_PAYLOAD);

    REQUIRE(find_diagnostic(diagnostics, "dataOffset") != nullptr);
    REQUIRE(find_diagnostic(diagnostics, "songCount") != nullptr);
    REQUIRE(find_diagnostic(diagnostics, "startSong") == nullptr);
    REQUIRE(find_diagnostic(diagnostics, "loadAddress") != nullptr);
    REQUIRE(find_diagnostic(diagnostics, "relocationPageCount") != nullptr);
    REQUIRE(diagnostics.size() == 4);
}

TEST_CASE("HeaderValidator - Only binds to a living header", "[validator]") {
    using Payload = span<const std::uint8_t>;

    STATIC_REQUIRE(std::is_constructible_v<HeaderValidator, const TuneHeader&>);
    STATIC_REQUIRE(std::is_constructible_v<HeaderValidator, TuneHeader&, Payload>);
    STATIC_REQUIRE_FALSE(std::is_constructible_v<HeaderValidator, TuneHeader&&>);
    STATIC_REQUIRE_FALSE(std::is_constructible_v<HeaderValidator, TuneHeader&&, Payload>);
}
