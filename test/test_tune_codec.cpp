/**
 * @file test_tune_codec.cpp
 * @brief Unit tests for TuneCodec policy, logging and file access
 *
 * @note Run: ./test_tune_codec
 */

#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "test_utils.hpp"

using namespace sidfile;
using namespace sidfile::test;

namespace {

    CodecConfig logging_config() {
        auto config = CodecConfig::create_default();
        config.log_diagnostics = true;
        return config;
    }

}

TEST_CASE("TuneCodec - Construction", "[tune_codec]") {
    SECTION("Default config") {
        TuneCodec codec;
        REQUIRE(codec.config().accept_multisid);
    }

    SECTION("Invalid config throws") {
        auto config = CodecConfig::create_default();
        config.max_file_size = 0;
        REQUIRE_THROWS_AS(TuneCodec(config), std::invalid_argument);
    }
}

TEST_CASE("TuneCodec::decode - Vendor variant switch", "[tune_codec][multisid]") {
    const auto bytes = multisid({0x0142}).file(SAMPLE_PAYLOAD);

    SECTION("Accepted by default") {
        TuneCodec codec;
        REQUIRE(codec.decode(bytes).header.get_variant() == Variant::MULTISID);
    }

    SECTION("Rejected when disabled") {
        auto config = CodecConfig::create_default();
        config.accept_multisid = false;
        TuneCodec codec(config);
        REQUIRE_THROWS_AS(codec.decode(bytes), StructuralException);
    }
}

TEST_CASE("TuneCodec - Diagnostic logging", "[tune_codec][log]") {
    auto raw = rsid_v3();
    raw.word(0x08, 0x0800);
    const auto bytes = raw.file(SAMPLE_PAYLOAD);

    SECTION("Silent by default") {
        std::ostringstream log;
        TuneCodec codec(CodecConfig::create_default(), log);
        (void)codec.decode(bytes);
        REQUIRE(log.str().empty());
    }

    SECTION("One line per diagnostic") {
        std::ostringstream log;
        TuneCodec codec(logging_config(), log);
        auto result = codec.decode(bytes);

        REQUIRE(result.diagnostics.size() == 1);
        REQUIRE(log.str().find("[SIDFILE] decode: ") == 0);
        REQUIRE(log.str().find("loadAddress") != std::string::npos);
    }

    SECTION("Structural errors are logged and rethrown") {
        std::ostringstream log;
        TuneCodec codec(logging_config(), log);
        const auto junk = RawHeader("XSID", 2, 0x7C).file(SAMPLE_PAYLOAD);

        REQUIRE_THROWS_AS(codec.decode(junk), StructuralException);
        REQUIRE(log.str().find("Unknown magic") != std::string::npos);
    }

    SECTION("validate logs with its own source") {
        std::ostringstream log;
        TuneCodec codec(logging_config(), log);
        auto header = make_header_builder().with_init_address(0x1000).with_songs(0).build();

        auto diagnostics = codec.validate(header, SAMPLE_PAYLOAD);
        REQUIRE(diagnostics.size() == 1);
        REQUIRE(log.str().find("[SIDFILE] validate: ") == 0);
    }
}

TEST_CASE("TuneCodec::is_acceptable - Strict mode", "[tune_codec]") {
    auto raw = psid_v2();
    raw.word(0x04, 3).byte(0x7A, 0x80);
    const auto bytes = raw.file(SAMPLE_PAYLOAD);

    TuneCodec lenient;
    REQUIRE(lenient.is_acceptable(lenient.decode(bytes).diagnostics));

    auto config = CodecConfig::create_default();
    config.reject_warnings = true;
    TuneCodec strict(config);
    REQUIRE_FALSE(strict.is_acceptable(strict.decode(bytes).diagnostics));
}

TEST_CASE("TuneCodec - File round trip", "[tune_codec][file]") {
    const std::string path = "/tmp/test_tune_codec.sid";
    TuneCodec codec;

    auto header = make_header_builder(Variant::V3)
                  .with_load_address(0x1000)
                  .with_init_address(0x1000)
                  .with_play_address(0x1003)
                  .with_name("On disk")
                  .with_extra_sid(0x42)
                  .build();
    codec.save(path, header, SAMPLE_PAYLOAD);

    auto loaded = codec.load(path);
    REQUIRE(loaded.header == header);
    REQUIRE(loaded.payload == SAMPLE_PAYLOAD);
    REQUIRE(loaded.diagnostics.empty());

    SECTION("Size limit") {
        auto config = CodecConfig::create_default();
        config.max_file_size = 0x76;
        TuneCodec small(config);
        REQUIRE_THROWS_AS(small.read_file(path), std::runtime_error);
    }

    std::remove(path.c_str());
}

TEST_CASE("TuneCodec::read_file - Missing file", "[tune_codec][file]") {
    TuneCodec codec;
    REQUIRE_THROWS_AS(codec.read_file("/tmp/does_not_exist.sid"), std::runtime_error);
}
