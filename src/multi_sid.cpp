/**
 * @file multi_sid.cpp
 * @brief Vendor multi-SID trailer codec
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <string>

#include "../include/interface/multi_sid.hpp"
#include "../include/template/header_traits.hpp"
#include "../include/exception/sidfile_exception.hpp"

namespace sidfile {

    std::uint16_t MultiSidHelper::compute_word(const SidDescriptor& descriptor) {
        if (to_byte(descriptor.sid_model) > 3) {
            throw EncodingException(Status::EUNREPRESENTABLE, "sidDescriptor.sidModel");
        }
        if (descriptor.output_channel > 1) {
            throw EncodingException(Status::EUNREPRESENTABLE,
                "sidDescriptor.outputChannel: " + std::to_string(descriptor.output_channel));
        }

        std::uint16_t word = descriptor.address;
        word |= static_cast<std::uint16_t>(to_byte(descriptor.sid_model) << 8);
        word |= static_cast<std::uint16_t>(descriptor.output_channel << 10);

        if (word == TERMINATOR) {
            throw EncodingException(Status::EUNREPRESENTABLE,
                "sidDescriptor: all-zero entry would terminate the list");
        }
        return word;
    }

    MultiSidHelper::ScanResult MultiSidHelper::scan(span<const std::uint8_t> buffer,
        std::size_t start) {
        ScanResult result;
        if (start >= buffer.size()) {
            return result;
        }

        const std::size_t max_words = (buffer.size() - start) / MultiSidLayout::DESCRIPTOR_SIZE;
        for (std::size_t i = 0; i < max_words; ++i) {
            const std::size_t offset = start + i * MultiSidLayout::DESCRIPTOR_SIZE;
            const auto word = bytes_to_int_be<std::uint16_t>(buffer.subspan(offset, 2));
            if (word == TERMINATOR) {
                result.terminated = true;
                break;
            }
            result.words.push_back(word);
        }
        return result;
    }

    std::vector<std::uint8_t> MultiSidHelper::serialize(
        const std::vector<SidDescriptor>& descriptors) {
        std::vector<std::uint8_t> bytes;
        bytes.reserve((descriptors.size() + 1) * MultiSidLayout::DESCRIPTOR_SIZE);

        for (const auto& descriptor : descriptors) {
            auto word = int_to_bytes_be<std::uint16_t, 2>(compute_word(descriptor));
            bytes.insert(bytes.end(), word.begin(), word.end());
        }
        bytes.push_back(0x00);
        bytes.push_back(0x00);
        return bytes;
    }

} // namespace sidfile
