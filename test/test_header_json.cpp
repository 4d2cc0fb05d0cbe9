/**
 * @file test_header_json.cpp
 * @brief Unit tests for the JSON header dump and import
 *
 * @note Run: ./test_header_json
 */

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "test_utils.hpp"

using namespace sidfile;
using namespace sidfile::test;
using json = nlohmann::json;

TEST_CASE("to_json - Header dump", "[json]") {
    auto header = decode(psid_v2().file(SAMPLE_PAYLOAD)).header;
    auto j = to_json(header);

    REQUIRE(j["magic"] == "PSID");
    REQUIRE(j["variant"] == "V2");
    REQUIRE(j["version"] == 2);
    REQUIRE(j["dataOffset"] == 0x7C);
    REQUIRE(j["loadAddress"] == 0x1000);
    REQUIRE(j["playAddress"] == 0x1003);
    REQUIRE(j["name"] == "Commando");
    REQUIRE(j["flags"]["clock"] == "PAL");
    REQUIRE(j["flags"]["sidModel"] == "MOS_6581");
    REQUIRE(j["flags"]["musPlayer"] == false);
    REQUIRE(j["relocationPageCount"] == 0);
    REQUIRE(j["extraSids"].is_array());
    REQUIRE(j["extraSids"].empty());
}

TEST_CASE("to_json - V1 has no flags key", "[json]") {
    auto header = make_header_builder(Variant::V1).with_init_address(0x1000).build();
    auto j = to_json(header);

    REQUIRE(j["version"] == 1);
    REQUIRE_FALSE(j.contains("flags"));
    REQUIRE_FALSE(j.contains("relocationStartPage"));
}

TEST_CASE("to_json - Extra SIDs with derived fields", "[json][multisid]") {
    auto header = decode(multisid({0x0142, 0x0643}).file(SAMPLE_PAYLOAD)).header;
    auto j = to_json(header);

    REQUIRE(j["version"] == MULTISID_VERSION);
    REQUIRE(j["dataOffset"] == 0x80);
    REQUIRE(j["extraSids"].size() == 2);

    const auto& first = j["extraSids"][0];
    REQUIRE(first["address"] == 0x42);
    REQUIRE(first["baseAddress"] == 0xD420);
    REQUIRE(first["present"] == true);
    REQUIRE(first["sidModel"] == "MOS_6581");

    const auto& second = j["extraSids"][1];
    REQUIRE(second["present"] == false);
    REQUIRE(second["baseAddress"] == 0);
    REQUIRE(second["sidModel"] == "MOS_8580");
    REQUIRE(second["outputChannel"] == 1);
}

TEST_CASE("to_json - Diagnostics", "[json][diagnostic]") {
    auto raw = rsid_v3();
    raw.word(0x08, 0x0800);
    auto diagnostics = decode(raw.file(SAMPLE_PAYLOAD)).diagnostics;
    auto j = to_json(diagnostics);

    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    REQUIRE(j[0]["field"] == "loadAddress");
    REQUIRE(j[0]["offset"] == 0x08);
    REQUIRE(j[0]["status"] == static_cast<int>(Status::CBAD_LOAD_ADDRESS));
    REQUIRE(j[0]["message"] == "loadAddress must be 0 for RSID");
}

TEST_CASE("header_from_json - Import", "[json][import]") {
    SECTION("Dump of a header rebuilds the same header") {
        auto raw = psid_v2();
        raw.word(0x04, 4).word(0x76, 0x0294).byte(0x7A, 0x42).byte(0x7B, 0xE0);
        auto header = decode(raw.file(SAMPLE_PAYLOAD)).header;

        auto rebuilt = header_from_json(to_json(header)).build();
        REQUIRE(rebuilt == header);
    }

    SECTION("Vendor dump keeps channels") {
        auto header = decode(multisid({0x0142, 0x06E0}).file(SAMPLE_PAYLOAD)).header;
        REQUIRE(header_from_json(to_json(header)).build() == header);
    }

    SECTION("Hand-written input, version instead of variant") {
        auto j = json::parse(R"({
            "magic": "RSID",
            "version": 3,
            "initAddress": 2064,
            "name": "Hand made",
            "flags": {"clock": "NTSC"},
            "extraSids": [{"address": 66, "sidModel": "MOS_8580"}]
        })");
        auto header = header_from_json(j).build();

        REQUIRE(header.get_variant() == Variant::V3);
        REQUIRE(header.is_rsid());
        REQUIRE(header.get_init_address() == 0x0810);
        REQUIRE(header.get_clock() == Clock::NTSC);
        REQUIRE(header.get_extra_sids()[0].base_address == 0xD420);
    }

    SECTION("Missing variant and version") {
        REQUIRE_THROWS_AS(header_from_json(json{{"initAddress", 4096}}), std::invalid_argument);
    }

    SECTION("Unknown enum name") {
        auto j = json{{"variant", "V2"}, {"magic", "ZSID"}};
        REQUIRE_THROWS_AS(header_from_json(j), std::invalid_argument);
    }

    SECTION("Address wider than 16 bits") {
        auto j = json{{"variant", "V2"}, {"loadAddress", 70000}};
        REQUIRE_THROWS_AS(header_from_json(j), std::invalid_argument);
    }

    SECTION("Negative song count") {
        auto j = json{{"variant", "V2"}, {"songCount", -1}};
        REQUIRE_THROWS_AS(header_from_json(j), std::invalid_argument);
    }

    SECTION("Chip address wider than one byte") {
        auto j = json::parse(R"({"variant": "V3", "extraSids": [{"address": 322}]})");
        REQUIRE_THROWS_AS(header_from_json(j), std::invalid_argument);
    }

    SECTION("Fractional relocation page") {
        auto j = json{{"variant", "V2"}, {"relocationStartPage", 4.5}};
        REQUIRE_THROWS_AS(header_from_json(j), std::invalid_argument);
    }

    SECTION("Unsupported version") {
        auto j = json{{"version", 9}, {"initAddress", 4096}};
        REQUIRE_THROWS_AS(header_from_json(j), StructuralException);
    }
}
