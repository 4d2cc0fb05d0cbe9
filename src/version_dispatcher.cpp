/**
 * @file version_dispatcher.cpp
 * @brief Variant selection implementation
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <sstream>
#include <iomanip>

#include "../include/interface/version_dispatcher.hpp"
#include "../include/interface/multi_sid.hpp"
#include "../include/template/header_traits.hpp"
#include "../include/exception/sidfile_exception.hpp"

namespace sidfile {

    namespace {

        std::string hex(std::size_t value) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::uppercase << value;
            return oss.str();
        }

    } // namespace

    Variant VersionDispatcher::variant_for_version(std::uint16_t version, bool accept_multisid) {
        switch (version) {
        case 1: return Variant::V1;
        case 2: return Variant::V2;
        case 3: return Variant::V3;
        case 4: return Variant::V4;
        default:
            break;
        }
        if (version == MULTISID_VERSION && accept_multisid) {
            return Variant::MULTISID;
        }
        throw StructuralException(Status::SUNSUPPORTED_VERSION,
            "version " + hex(version));
    }

    std::size_t VersionDispatcher::header_size(Variant variant, std::size_t extra_sids) {
        switch (variant) {
        case Variant::V1:       return HeaderTraits<V1Header>::HEADER_SIZE;
        case Variant::V2:       return HeaderTraits<V2Header>::HEADER_SIZE;
        case Variant::V3:       return HeaderTraits<V3Header>::HEADER_SIZE;
        case Variant::V4:       return HeaderTraits<V4Header>::HEADER_SIZE;
        case Variant::MULTISID: return MultiSidLayout::header_size(extra_sids);
        default:                return 0;
        }
    }

    Dispatch VersionDispatcher::select(span<const std::uint8_t> buffer, bool accept_multisid) {
        if (buffer.size() < CommonLayout::DISPATCH_SIZE) {
            throw StructuralException(Status::SHEADER_TOO_SHORT,
                "buffer of " + std::to_string(buffer.size()) + " bytes");
        }

        Dispatch dispatch;

        // Magic
        const char* magic = reinterpret_cast<const char*>(buffer.data());
        const std::string magic_str(magic, CommonLayout::MAGIC_SIZE);
        if (magic_str == "PSID") {
            dispatch.magic = MagicId::PSID;
        } else if (magic_str == "RSID") {
            dispatch.magic = MagicId::RSID;
        } else {
            throw StructuralException(Status::SUNKNOWN_MAGIC, "magic");
        }

        // Version
        dispatch.version = bytes_to_int_be<std::uint16_t>(
            buffer.subspan(CommonLayout::VERSION, 2));
        dispatch.variant = variant_for_version(dispatch.version, accept_multisid);
        dispatch.declared_data_offset = bytes_to_int_be<std::uint16_t>(
            buffer.subspan(CommonLayout::DATA_OFFSET, 2));

        // Size
        if (dispatch.variant == Variant::MULTISID) {
            if (buffer.size() < MultiSidLayout::header_size(0)) {
                throw StructuralException(Status::SHEADER_TOO_SHORT,
                    "buffer of " + std::to_string(buffer.size()) + " bytes, need at least " +
                    hex(MultiSidLayout::header_size(0)));
            }
            auto scan = MultiSidHelper::scan(buffer, MultiSidLayout::DESCRIPTORS);
            if (!scan.terminated) {
                throw StructuralException(Status::SHEADER_TOO_SHORT,
                    "multi-SID list has no terminator within " +
                    std::to_string(buffer.size()) + " bytes");
            }
            dispatch.descriptor_words = std::move(scan.words);
            dispatch.header_size = header_size(dispatch.variant, dispatch.descriptor_words.size());
        } else {
            dispatch.header_size = header_size(dispatch.variant);
            if (buffer.size() < dispatch.header_size) {
                throw StructuralException(Status::SHEADER_TOO_SHORT,
                    "buffer of " + std::to_string(buffer.size()) + " bytes, " +
                    to_string(dispatch.variant) + " needs " + hex(dispatch.header_size));
            }
        }

        // dataOffset must match the computed size exactly
        if (dispatch.declared_data_offset != dispatch.header_size) {
            throw StructuralException(Status::SDATA_OFFSET_MISMATCH,
                "dataOffset " + hex(dispatch.declared_data_offset) + ", " +
                to_string(dispatch.variant) + " header is " + hex(dispatch.header_size));
        }

        return dispatch;
    }

} // namespace sidfile
