/**
 * @file serialization_helpers.cpp
 * @brief Text slot and flags word codec
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <algorithm>
#include <vector>

#include "../include/interface/serialization_helpers.hpp"
#include "../include/exception/sidfile_exception.hpp"

namespace sidfile {

    namespace {

        // Windows-1252 code points for bytes 0x80-0x9F
        constexpr std::array<char32_t, 32> CP1252_HIGH = {
            0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
            0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
            0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
            0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178
        };

        char32_t byte_to_code_point(std::uint8_t byte) {
            if (byte >= 0x80 && byte <= 0x9F) {
                return CP1252_HIGH[byte - 0x80];
            }
            return byte;
        }

        bool code_point_to_byte(char32_t cp, std::uint8_t& byte) {
            if (cp < 0x80 || (cp >= 0xA0 && cp <= 0xFF)) {
                byte = static_cast<std::uint8_t>(cp);
                return true;
            }
            for (std::size_t i = 0; i < CP1252_HIGH.size(); ++i) {
                if (CP1252_HIGH[i] == cp) {
                    byte = static_cast<std::uint8_t>(0x80 + i);
                    return true;
                }
            }
            return false;
        }

        void append_utf8(std::string& out, char32_t cp) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        /**
         * @brief Convert UTF-8 text to Windows-1252 bytes
         * @throws EncodingException EUNREPRESENTABLE
         */
        std::vector<std::uint8_t> to_cp1252(const std::string& text, const std::string& field) {
            std::vector<std::uint8_t> out;
            out.reserve(text.size());

            std::size_t i = 0;
            while (i < text.size()) {
                const auto lead = static_cast<std::uint8_t>(text[i]);
                char32_t cp = 0;
                std::size_t extra = 0;

                if (lead < 0x80) {
                    cp = lead;
                } else if (lead == 0xC0 || lead == 0xC1 || lead >= 0xF5) {
                    // Lead bytes that only start overlong or out-of-range sequences
                    throw EncodingException(Status::EUNREPRESENTABLE,
                        field + ": malformed UTF-8");
                } else if ((lead & 0xE0) == 0xC0) {
                    cp = lead & 0x1F;
                    extra = 1;
                } else if ((lead & 0xF0) == 0xE0) {
                    cp = lead & 0x0F;
                    extra = 2;
                } else if ((lead & 0xF8) == 0xF0) {
                    cp = lead & 0x07;
                    extra = 3;
                } else {
                    throw EncodingException(Status::EUNREPRESENTABLE,
                        field + ": malformed UTF-8");
                }

                if (extra > 0 && i + extra >= text.size()) {
                    throw EncodingException(Status::EUNREPRESENTABLE,
                        field + ": truncated UTF-8 sequence");
                }
                for (std::size_t k = 1; k <= extra; ++k) {
                    const auto cont = static_cast<std::uint8_t>(text[i + k]);
                    if ((cont & 0xC0) != 0x80) {
                        throw EncodingException(Status::EUNREPRESENTABLE,
                            field + ": malformed UTF-8");
                    }
                    cp = (cp << 6) | (cont & 0x3F);
                }
                i += extra + 1;

                static constexpr char32_t MIN_CODE_POINT[] = {0x0, 0x80, 0x800, 0x10000};
                if (cp < MIN_CODE_POINT[extra]) {
                    throw EncodingException(Status::EUNREPRESENTABLE,
                        field + ": overlong UTF-8 sequence");
                }

                // A zero byte would end the slot early on decode
                if (cp == 0) {
                    throw EncodingException(Status::EUNREPRESENTABLE,
                        field + ": embedded NUL character");
                }

                std::uint8_t byte = 0;
                if (!code_point_to_byte(cp, byte)) {
                    throw EncodingException(Status::EUNREPRESENTABLE,
                        field + ": character outside Windows-1252");
                }
                out.push_back(byte);
            }
            return out;
        }

    } // namespace

    // === TextHelper ===

    std::string TextHelper::decode(span<const std::uint8_t> slot) {
        std::string text;
        const std::size_t limit = slot.size() < SIDFILE_TEXT_SIZE ? slot.size() : SIDFILE_TEXT_SIZE;
        for (std::size_t i = 0; i < limit; ++i) {
            if (slot[i] == 0x00) {
                break;
            }
            append_utf8(text, byte_to_code_point(slot[i]));
        }
        return text;
    }

    TextHelper::Slot TextHelper::encode(const std::string& text, const std::string& field) {
        const auto bytes = to_cp1252(text, field);
        if (bytes.size() > SIDFILE_TEXT_SIZE) {
            throw EncodingException(Status::ETEXT_TOO_LONG,
                field + ": " + std::to_string(bytes.size()) + " bytes, maximum is " +
                std::to_string(SIDFILE_TEXT_SIZE));
        }

        Slot slot = {};
        std::copy(bytes.begin(), bytes.end(), slot.begin());
        return slot;
    }

    std::size_t TextHelper::encoded_length(const std::string& text, const std::string& field) {
        return to_cp1252(text, field).size();
    }

    // === FlagsHelper ===

    std::uint16_t FlagsHelper::compute_word(const Flags& flags,
        SidModel second_model,
        SidModel third_model) {
        if (to_byte(flags.mus_player) > 1) {
            throw EncodingException(Status::EUNREPRESENTABLE, "flags.musPlayer");
        }
        if (to_byte(flags.clock) > 3) {
            throw EncodingException(Status::EUNREPRESENTABLE, "flags.clock");
        }
        if (to_byte(flags.sid_model) > 3 || to_byte(second_model) > 3 ||
            to_byte(third_model) > 3) {
            throw EncodingException(Status::EUNREPRESENTABLE, "flags.sidModel");
        }

        std::uint16_t word = to_byte(flags.mus_player);
        if (flags.psid_specific) {
            word |= 0x02;
        }
        word |= static_cast<std::uint16_t>(to_byte(flags.clock) << 2);
        word |= static_cast<std::uint16_t>(to_byte(flags.sid_model) << 4);
        word |= static_cast<std::uint16_t>(to_byte(second_model) << 6);
        word |= static_cast<std::uint16_t>(to_byte(third_model) << 8);
        return word;
    }

}  // namespace sidfile
