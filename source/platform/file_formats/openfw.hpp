#pragma once

#include <framework/formats.hpp>

#include <boost/hana/define_struct.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace FileFormat {

using Magic = std::array<uint8_t, 4>;

constexpr Magic MakeMagic(std::string_view text) {
    return Magic { static_cast<uint8_t>(text[0]), static_cast<uint8_t>(text[1]),
                   static_cast<uint8_t>(text[2]), static_cast<uint8_t>(text[3]) };
}

namespace Magics {
constexpr Magic Header = MakeMagic("OPEN");
constexpr Magic Part = MakeMagic("PART");        // data segment
constexpr Magic Exec = MakeMagic("EXEC");        // executable segment
constexpr Magic End = MakeMagic("END.");         // terminal signature
constexpr Magic EndSigned = MakeMagic("ENDS");   // terminal signature, variant used by some generations
} // namespace Magics

/**
 * Container header. Usually at file offset 0, but vendor wrappers may
 * prepend arbitrary data.
 */
struct ContainerHeader {
    BOOST_HANA_DEFINE_STRUCT(ContainerHeader,
        (Magic, magic), // "OPEN"
        (std::array<uint8_t, 256>, version), // NUL-terminated unless all 256 bytes are used
        (uint32_t, crc), // CRC-32 over magic and version
        (uint32_t, pad)
    );

    // Number of leading bytes covered by crc
    static constexpr uint32_t crc_covered_size = 260;

    struct Tags : big_endian_tag, expected_size_tag<0x10c> {};
};

/**
 * Header preceding the payload of each segment.
 */
struct SegmentHeader {
    BOOST_HANA_DEFINE_STRUCT(SegmentHeader,
        (Magic, magic), // "PART" or "EXEC"
        (std::array<uint8_t, 16>, name), // NUL-terminated
        (std::array<uint8_t, 12>, reserved),
        (uint32_t, load_address), // memory address the payload is loaded to
        (uint32_t, index),
        (uint32_t, base_address), // flash address of the partition
        (uint32_t, entry_address),
        (uint32_t, data_size), // payload size in bytes
        (uint32_t, part_size) // size of the flash partition reserved for this segment
    );

    struct Tags : big_endian_tag, expected_size_tag<0x38> {};
};

/**
 * Follows the payload of each segment.
 */
struct SegmentTrailer {
    BOOST_HANA_DEFINE_STRUCT(SegmentTrailer,
        (uint32_t, crc), // CRC-32 over SegmentHeader and payload
        (uint32_t, pad)
    );

    struct Tags : big_endian_tag, expected_size_tag<0x8> {};
};

/**
 * Terminates the segment list. May be followed by a 256 or 512 byte RSA
 * signature block.
 */
struct SignatureTrailer {
    BOOST_HANA_DEFINE_STRUCT(SignatureTrailer,
        (Magic, magic), // "END." or "ENDS"
        (uint32_t, crc),
        (uint32_t, pad)
    );

    struct Tags : big_endian_tag, expected_size_tag<0xc> {};
};

// Serialized sizes, mirrored here so that users don't need formats_impl.hpp
constexpr size_t container_header_size = 0x10c;
constexpr size_t segment_header_size = 0x38;
constexpr size_t segment_trailer_size = 0x8;
constexpr size_t signature_trailer_size = 0xc;

// Accepted sizes of the RSA signature block following SignatureTrailer
constexpr std::array<size_t, 2> signature_block_sizes = { 256, 512 };

} // namespace FileFormat
