#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace Firmware {

enum class SegmentKind {
    Data,       // "PART"
    Executable, // "EXEC"
};

enum class SignatureVariant {
    Plain,  // "END."
    Signed, // "ENDS"
};

/// Byte range matched by the checksum stored in the signature trailer
enum class SignatureCoverage {
    None,             // the stored checksum matches neither range
    ExcludingTrailer, // [base, signature offset)
    IncludingTrailer, // [base, signature offset + 12)
};

enum class SignatureBlockStatus {
    Absent,     // no 256/512 byte block follows the signature trailer
    Unverified, // block present, but no public key was provided
    Valid,
    Invalid,
};

/**
 * Segment as decoded from a container. The payload refers to the buffer the
 * container was decoded from, which must outlive this object.
 */
struct Segment {
    SegmentKind kind;
    std::string name;

    uint32_t load_address;
    uint32_t index; // informational only; stream order is authoritative
    uint32_t base_address;
    uint32_t entry_address;

    uint32_t declared_size;
    uint32_t allocated_size;

    std::span<const uint8_t> payload;

    size_t offset; // absolute buffer offset of the segment header

    uint32_t crc_claim;    // as stored in the segment trailer
    uint32_t crc_computed; // over segment header and payload
    bool crc_valid;
};

struct Signature {
    SignatureVariant variant;

    size_t offset; // absolute buffer offset of the signature trailer

    uint32_t crc_claim;
    SignatureCoverage coverage;
    bool crc_valid;

    std::span<const uint8_t> block; // empty unless block_status != Absent
    SignatureBlockStatus block_status;

    // crc_valid, combined with the RSA verification result if a key was provided
    bool valid;
};

/**
 * Read-only view of a decoded container image.
 *
 * Checksum and signature results are computed during decoding and stored
 * alongside the data they cover, so that damaged images can be inspected.
 */
struct Container {
    size_t header_offset; // where the header was found in the buffer

    std::string version;
    uint32_t header_crc_claim;
    bool header_crc_valid;

    std::vector<Segment> segments;

    Signature signature;

    // Bytes after the signature trailer that don't form a signature block
    size_t trailing_bytes;

    /// True iff the header, all segment checksums and the signature are valid
    bool IsValid() const;
};

const char* GetKindName(SegmentKind kind);
const char* GetStatusName(SignatureBlockStatus status);

} // namespace Firmware
