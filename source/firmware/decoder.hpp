#pragma once

#include "container.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace Firmware {

class CodecEvents;
class SignatureVerifier;

struct DecodeOptions {
    /// Used to check the optional signature block. If null, the block is reported as unverified
    const SignatureVerifier* verifier = nullptr;

    /// Optional observer, notified for each decoded structure
    CodecEvents* events = nullptr;
};

/**
 * Decodes the container header found by LocateHeader.
 *
 * The returned Container refers to buffer, which must outlive it.
 *
 * @throw FormatError (or a subclass) if the image is structurally malformed
 */
Container Decode(std::span<const uint8_t> buffer, const DecodeOptions& options = {});

/**
 * Decodes a container with its header at the given offset. The header
 * checksum is not required to match; its validity is recorded instead.
 */
Container DecodeAt(std::span<const uint8_t> buffer, size_t header_offset, const DecodeOptions& options = {});

} // namespace Firmware
