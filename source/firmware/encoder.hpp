#pragma once

#include "container.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Firmware {

class CodecEvents;

/// Description of a segment to be written by Encode
struct SegmentSpec {
    SegmentKind kind = SegmentKind::Data;
    std::string name; // at most 15 bytes are stored

    uint32_t load_address = 0;
    uint32_t index = 0;
    uint32_t base_address = 0;
    uint32_t entry_address = 0;
    uint32_t allocated_size = 0;

    std::vector<uint8_t> payload;
};

/// Policy for text that exceeds its fixed-width field
enum class FieldOverflow {
    Truncate, // silently cut off; lossy
    Reject,   // throw FieldTooLong
};

struct EncodeOptions {
    FieldOverflow overflow = FieldOverflow::Truncate;

    /// Optional observer, notified for each written segment
    CodecEvents* events = nullptr;
};

// Longest text stored in the fixed-width fields such that a NUL terminator remains
constexpr size_t max_version_length = 255;
constexpr size_t max_name_length = 15;

/// Total size of the image Encode produces for the given segments
size_t GetEncodedSize(std::span<const SegmentSpec> segments);

/**
 * Serializes the given segments into a new container image, in order.
 *
 * The image uses the "END." terminal magic with a checksum over all
 * preceding bytes and never carries an RSA signature block. Decoding it
 * yields a valid signature and valid segment checksums.
 *
 * @throw FieldTooLong if a text field doesn't fit and options.overflow is Reject
 * @throw OpenFw::Exceptions::Invalid if a payload exceeds the 32-bit size field
 */
std::vector<uint8_t> Encode(std::string_view version, std::span<const SegmentSpec> segments, const EncodeOptions& options = {});

} // namespace Firmware
