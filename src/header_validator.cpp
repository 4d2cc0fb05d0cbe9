/**
 * @file header_validator.cpp
 * @brief Constraint checks for PSID/RSID headers
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <iomanip>
#include <map>
#include <sstream>
#include <string>

#include "../include/interface/validator/header_validator.hpp"

namespace sidfile {

    namespace {

        // RSID init address windows
        constexpr std::uint16_t RSID_MIN_INIT = 0x07E8;
        constexpr AddressRange RSID_INIT_LOW = {0x07E8, 0xA000};
        constexpr AddressRange RSID_INIT_HIGH = {0xC000, 0xD000};

        // Areas an RSID relocation range must avoid
        constexpr AddressRange SYSTEM_AREA = {0x0000, 0x0400};
        constexpr AddressRange BASIC_ROM = {0xA000, 0xC000};
        constexpr AddressRange IO_KERNAL = {0xD000, 0x10000};

        std::string hex(std::uint32_t value, int width = 4) {
            std::ostringstream oss;
            oss << "$" << std::hex << std::uppercase << std::setfill('0') << std::setw(width) << value;
            return oss.str();
        }

        std::string range_text(const AddressRange& range) {
            return hex(range.begin) + "-" + hex(range.end - 1);
        }

        bool contains(const AddressRange& range, std::uint32_t address) {
            return address >= range.begin && address < range.end;
        }

        Diagnostic make(Severity severity, Status status, std::string field, std::size_t offset,
            std::string observed, std::string expected, std::string message) {
            Diagnostic d;
            d.severity = severity;
            d.status = status;
            d.field = std::move(field);
            d.offset = offset;
            d.observed = std::move(observed);
            d.expected = std::move(expected);
            d.message = std::move(message);
            return d;
        }

        std::string chip_field(const TuneHeader& header, std::size_t index) {
            if (header.get_variant() == Variant::MULTISID) {
                return "sidDescriptor[" + std::to_string(index) + "]";
            }
            return index == 0 ? "secondSidAddress" : "thirdSidAddress";
        }

    } // namespace

    Diagnostics HeaderValidator::validate() const {
        Diagnostics out;
        check_common(out);
        if (header_->is_rsid()) {
            check_rsid(out);
        }
        check_payload(out);
        check_relocation(out);
        check_chips(out);
        return out;
    }

    std::optional<AddressRange> HeaderValidator::load_range() const {
        if (!payload_) {
            return std::nullopt;
        }
        const auto& payload = *payload_;
        const std::uint16_t load = header_->get_load_address();

        if (load != 0) {
            return AddressRange{load, load + static_cast<std::uint32_t>(payload.size())};
        }
        if (payload.size() < 2) {
            return std::nullopt;
        }
        const std::uint16_t embedded = bytes_to_word_le(payload[0], payload[1]);
        return AddressRange{embedded, embedded + static_cast<std::uint32_t>(payload.size() - 2)};
    }

    // === Common ===

    void HeaderValidator::check_common(Diagnostics& out) const {
        const std::uint16_t computed = header_->get_data_offset();
        const std::uint16_t declared = header_->get_declared_data_offset();
        if (declared != computed) {
            out.push_back(make(Severity::FATAL, Status::CBAD_DATA_OFFSET, "dataOffset",
                CommonLayout::DATA_OFFSET, hex(declared), hex(computed),
                "dataOffset must equal the " + to_string(header_->get_variant()) +
                " header size"));
        }

        const std::uint16_t songs = header_->get_songs();
        const bool songs_valid = songs >= 1 && songs <= SIDFILE_MAX_SONGS;
        if (!songs_valid) {
            out.push_back(make(Severity::FATAL, Status::CBAD_SONG_COUNT, "songCount",
                CommonLayout::SONGS, std::to_string(songs), "1-256",
                "songCount must be between 1 and 256"));
        }

        const std::uint16_t start = header_->get_start_song();
        const std::uint16_t last = songs_valid ? songs : SIDFILE_MAX_SONGS;
        if (start < 1 || start > last) {
            out.push_back(make(Severity::FATAL, Status::CBAD_START_SONG, "startSong",
                CommonLayout::START_SONG, std::to_string(start), "1-" + std::to_string(last),
                "startSong must be between 1 and songCount"));
        }
    }

    // === RSID ===

    void HeaderValidator::check_rsid(Diagnostics& out) const {
        if (header_->get_variant() == Variant::V1) {
            out.push_back(make(Severity::FATAL, Status::CBAD_VERSION, "version",
                CommonLayout::VERSION, "1", "2-4",
                "RSID requires version 2 or later"));
        }

        if (header_->get_load_address() != 0) {
            out.push_back(make(Severity::FATAL, Status::CBAD_LOAD_ADDRESS, "loadAddress",
                CommonLayout::LOAD_ADDRESS, hex(header_->get_load_address()), hex(0),
                "loadAddress must be 0 for RSID"));
        }

        if (header_->get_play_address() != 0) {
            out.push_back(make(Severity::FATAL, Status::CBAD_PLAY_ADDRESS, "playAddress",
                CommonLayout::PLAY_ADDRESS, hex(header_->get_play_address()), hex(0),
                "playAddress must be 0 for RSID"));
        }

        if (header_->get_speed() != 0) {
            out.push_back(make(Severity::FATAL, Status::CBAD_SPEED, "speedBitmap",
                CommonLayout::SPEED, hex(header_->get_speed(), 8), hex(0, 8),
                "speedBitmap must be 0 for RSID"));
        }

        const std::uint16_t init = header_->get_init_address();
        if (header_->is_basic()) {
            if (init != 0) {
                out.push_back(make(Severity::FATAL, Status::CBAD_INIT_ADDRESS, "initAddress",
                    CommonLayout::INIT_ADDRESS, hex(init), hex(0),
                    "initAddress must be 0 for RSID BASIC programs"));
            }
            return;
        }

        if (contains(RSID_INIT_LOW, init) || contains(RSID_INIT_HIGH, init)) {
            return;
        }

        std::string message;
        if (init == 0) {
            message = "initAddress 0 requires the RSID BASIC flag";
        } else if (init < RSID_MIN_INIT) {
            message = "initAddress must not be below $07E8 for RSID";
        } else if (contains(BASIC_ROM, init)) {
            message = "initAddress must not be in BASIC ROM for RSID";
        } else {
            message = "initAddress must not be in I/O or KERNAL ROM for RSID";
        }
        out.push_back(make(Severity::FATAL, Status::CBAD_INIT_ADDRESS, "initAddress",
            CommonLayout::INIT_ADDRESS, hex(init),
            range_text(RSID_INIT_LOW) + " or " + range_text(RSID_INIT_HIGH), message));
    }

    // === Payload ===

    void HeaderValidator::check_payload(Diagnostics& out) const {
        if (!payload_ || header_->get_load_address() != 0) {
            return;
        }
        if (payload_->size() < 2) {
            out.push_back(make(Severity::FATAL, Status::CBAD_PAYLOAD, "payload",
                header_->get_data_offset(), std::to_string(payload_->size()) + " bytes",
                "at least 2 bytes",
                "payload must start with its load address when loadAddress is 0"));
        }
    }

    // === Relocation ===

    void HeaderValidator::check_relocation(Diagnostics& out) const {
        const auto extended = header_->get_extended_fields();
        if (!extended) {
            return;
        }
        const std::uint8_t start = extended->start_page;
        const std::uint8_t length = extended->page_length;

        if (start == 0x00 || start == 0xFF) {
            if (length != 0) {
                out.push_back(make(Severity::FATAL, Status::CBAD_RELOCATION,
                    "relocationPageCount", ClassicLayout::PAGE_LENGTH,
                    std::to_string(length), "0",
                    "relocationPageCount must be 0 when relocationStartPage is $00 or $FF"));
            }
            return;
        }

        const AddressRange range{static_cast<std::uint32_t>(start) << 8,
                                 static_cast<std::uint32_t>(start + length) << 8};
        if (range.empty()) {
            return;
        }

        if (range.end > 0x10000) {
            out.push_back(make(Severity::FATAL, Status::CBAD_RELOCATION,
                "relocationPageCount", ClassicLayout::PAGE_LENGTH,
                std::to_string(length), "at most " + std::to_string(0x100 - start),
                "relocation range must end at or below $FFFF"));
        }

        const auto load = load_range();
        if (load && range.intersects(*load)) {
            out.push_back(make(Severity::FATAL, Status::CBAD_RELOCATION,
                "relocationStartPage", ClassicLayout::START_PAGE,
                range_text(range), "outside " + range_text(*load),
                "relocation range must not overlap the load range"));
        }

        if (!header_->is_rsid()) {
            return;
        }
        const std::pair<AddressRange, const char*> forbidden[] = {
            {SYSTEM_AREA, "relocation range must not overlap $0000-$03FF for RSID"},
            {BASIC_ROM, "relocation range must not overlap BASIC ROM for RSID"},
            {IO_KERNAL, "relocation range must not overlap I/O or KERNAL ROM for RSID"},
        };
        for (const auto& area : forbidden) {
            if (range.intersects(area.first)) {
                out.push_back(make(Severity::FATAL, Status::CBAD_RELOCATION,
                    "relocationStartPage", ClassicLayout::START_PAGE,
                    range_text(range), "outside " + range_text(area.first), area.second));
            }
        }
    }

    // === Extra SIDs ===

    void HeaderValidator::check_chips(Diagnostics& out) const {
        const auto chips = header_->get_extra_sids();
        std::map<std::uint8_t, std::size_t> seen;  // address -> chip index

        for (std::size_t i = 0; i < chips.size(); ++i) {
            const auto& chip = chips[i];
            if (chip.address == 0) {
                continue;
            }
            const std::string field = chip_field(*header_, i);

            if (!chip.present) {
                out.push_back(make(Severity::WARNING, Status::CBAD_CHIP_ADDRESS, field,
                    chip.offset, hex(chip.address, 2), "even value in $42-$7F or $E0-$FE",
                    field + " is not a valid SID address and is treated as absent"));
                continue;
            }

            auto it = seen.find(chip.address);
            if (it != seen.end()) {
                out.push_back(make(Severity::FATAL, Status::CDUPLICATE_CHIP_ADDRESS, field,
                    chip.offset, hex(chip.base_address),
                    "distinct from " + chip_field(*header_, it->second),
                    field + " shares its address with " + chip_field(*header_, it->second)));
                continue;
            }
            seen.emplace(chip.address, i);
        }
    }

} // namespace sidfile
