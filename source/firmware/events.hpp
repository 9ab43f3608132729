#pragma once

#include "container.hpp"

#include <cstddef>
#include <string_view>

namespace Firmware {

/**
 * Observer notified while containers are decoded or encoded, e.g. for
 * progress reporting. Callbacks run in stream order on the calling thread
 * and cannot influence the result.
 */
class CodecEvents {
public:
    virtual ~CodecEvents() = default;

    virtual void OnHeaderFound(size_t /*offset*/, std::string_view /*version*/) {}

    /// Called once per segment after its checksum has been computed
    virtual void OnSegmentDecoded(size_t /*position*/, const Segment&) {}

    virtual void OnSignatureDecoded(const Signature&) {}

    /// Called once per segment after it has been written, with the checksum stored for it
    virtual void OnSegmentEncoded(size_t /*position*/, std::string_view /*name*/, size_t /*offset*/, uint32_t /*crc*/) {}
};

} // namespace Firmware
