/**
 * @file header_traits.hpp
 * @brief Pure compile-time traits for PSID/RSID header variants.
 *
 * This file provides compile-time metadata for header structure and layout.
 * Header structs hold state only; byte offsets live here and are used by the
 * codec when bytes are produced or consumed.
 *
 * ## Layout Structures
 * - CommonLayout: offsets 0x00-0x75, identical across every variant
 * - ClassicLayout: V2/V3/V4 extension at 0x76-0x7B
 * - MultiSidLayout: vendor extension, descriptor words from 0x7A
 *
 * ## Specializations:
 * - HeaderTraits<V1Header>: 0x76 bytes, no flags
 * - HeaderTraits<V2Header>: 0x7C bytes, flags + relocation
 * - HeaderTraits<V3Header>: 0x7C bytes, + second SID
 * - HeaderTraits<V4Header>: 0x7C bytes, + second and third SID
 * - HeaderTraits<MultiSidHeader>: 0x7A + 2*(n+1) bytes
 *
 * ## Usage Examples:
 * @code
 * using Layout = HeaderTraits<V3Header>::Layout;
 * buffer[Layout::SECOND_SID_ADDRESS] = address;
 *
 * static_assert(has_extended_fields_v<V2Header>);
 * static_assert(HeaderTraits<V4Header>::MAX_EXTRA_SIDS == 2);
 * @endcode
 *
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstddef>
#include <type_traits>

#include "../enums/protocol.hpp"

namespace sidfile {

    // Forward declarations
    struct V1Header;
    struct V2Header;
    struct V3Header;
    struct V4Header;
    struct MultiSidHeader;

    // === Layout Definitions ===

    /**
     * @brief Fields shared by every variant (0x00-0x75)
     */
    struct CommonLayout {
        static constexpr std::size_t MAGIC = 0x00;
        static constexpr std::size_t VERSION = 0x04;
        static constexpr std::size_t DATA_OFFSET = 0x06;
        static constexpr std::size_t LOAD_ADDRESS = 0x08;
        static constexpr std::size_t INIT_ADDRESS = 0x0A;
        static constexpr std::size_t PLAY_ADDRESS = 0x0C;
        static constexpr std::size_t SONGS = 0x0E;
        static constexpr std::size_t START_SONG = 0x10;
        static constexpr std::size_t SPEED = 0x12;
        static constexpr std::size_t NAME = 0x16;
        static constexpr std::size_t AUTHOR = 0x36;
        static constexpr std::size_t RELEASED = 0x56;
        static constexpr std::size_t END = 0x76;

        // Field sizes
        static constexpr std::size_t MAGIC_SIZE = 4;
        static constexpr std::size_t TEXT_SIZE = SIDFILE_TEXT_SIZE;

        // Bytes needed before a variant can be selected
        static constexpr std::size_t DISPATCH_SIZE = DATA_OFFSET + 2;
    };

    /**
     * @brief V2/V3/V4 extension (0x76-0x7B)
     */
    struct ClassicLayout : CommonLayout {
        static constexpr std::size_t FLAGS = 0x76;
        static constexpr std::size_t START_PAGE = 0x78;
        static constexpr std::size_t PAGE_LENGTH = 0x79;
        static constexpr std::size_t SECOND_SID_ADDRESS = 0x7A;
        static constexpr std::size_t THIRD_SID_ADDRESS = 0x7B;
        static constexpr std::size_t HEADER_SIZE = 0x7C;
    };

    /**
     * @brief Vendor multi-SID extension
     * Descriptor words start where the classic chip bytes would be
     */
    struct MultiSidLayout : CommonLayout {
        static constexpr std::size_t FLAGS = 0x76;
        static constexpr std::size_t START_PAGE = 0x78;
        static constexpr std::size_t PAGE_LENGTH = 0x79;
        static constexpr std::size_t DESCRIPTORS = 0x7A;
        static constexpr std::size_t DESCRIPTOR_SIZE = 2;

        static constexpr std::size_t descriptor_offset(std::size_t index) {
            return DESCRIPTORS + DESCRIPTOR_SIZE * index;
        }

        // Header size including the zero terminator word
        static constexpr std::size_t header_size(std::size_t extra_sids) {
            return DESCRIPTORS + DESCRIPTOR_SIZE * (extra_sids + 1);
        }
    };

    // === Header Traits ===

    template<typename Header>
    struct HeaderTraits;

    template<>
    struct HeaderTraits<V1Header> {
        using Layout = CommonLayout;
        static constexpr Variant VARIANT = Variant::V1;
        static constexpr std::size_t HEADER_SIZE = CommonLayout::END;
        static constexpr std::size_t MAX_EXTRA_SIDS = 0;
        static constexpr bool HAS_EXTENDED_FIELDS = false;
    };

    template<>
    struct HeaderTraits<V2Header> {
        using Layout = ClassicLayout;
        static constexpr Variant VARIANT = Variant::V2;
        static constexpr std::size_t HEADER_SIZE = ClassicLayout::HEADER_SIZE;
        static constexpr std::size_t MAX_EXTRA_SIDS = 0;
        static constexpr bool HAS_EXTENDED_FIELDS = true;
    };

    template<>
    struct HeaderTraits<V3Header> {
        using Layout = ClassicLayout;
        static constexpr Variant VARIANT = Variant::V3;
        static constexpr std::size_t HEADER_SIZE = ClassicLayout::HEADER_SIZE;
        static constexpr std::size_t MAX_EXTRA_SIDS = 1;
        static constexpr bool HAS_EXTENDED_FIELDS = true;
    };

    template<>
    struct HeaderTraits<V4Header> {
        using Layout = ClassicLayout;
        static constexpr Variant VARIANT = Variant::V4;
        static constexpr std::size_t HEADER_SIZE = ClassicLayout::HEADER_SIZE;
        static constexpr std::size_t MAX_EXTRA_SIDS = 2;
        static constexpr bool HAS_EXTENDED_FIELDS = true;
    };

    template<>
    struct HeaderTraits<MultiSidHeader> {
        using Layout = MultiSidLayout;
        static constexpr Variant VARIANT = Variant::MULTISID;
        // Minimum size, zero extra SIDs
        static constexpr std::size_t HEADER_SIZE = MultiSidLayout::header_size(0);
        static constexpr bool HAS_EXTENDED_FIELDS = true;
    };

    // === Type Predicates ===

    template<typename Header>
    using traits_t = HeaderTraits<std::decay_t<Header> >;

    template<typename Header>
    inline constexpr bool has_extended_fields_v = traits_t<Header>::HAS_EXTENDED_FIELDS;

    template<typename Header>
    inline constexpr bool is_multisid_header_v =
        std::is_same_v<std::decay_t<Header>, MultiSidHeader>;

    template<typename Header>
    inline constexpr bool has_second_sid_v =
        std::is_same_v<std::decay_t<Header>, V3Header> ||
        std::is_same_v<std::decay_t<Header>, V4Header>;

    template<typename Header>
    inline constexpr bool has_third_sid_v = std::is_same_v<std::decay_t<Header>, V4Header>;

} // namespace sidfile
