#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace Firmware {

/**
 * Checks whether a self-consistent container header starts at the given
 * offset, i.e. whether the header fits into the buffer and its stored
 * checksum matches the bytes it covers. The magic is not checked.
 */
bool IsHeaderAt(std::span<const uint8_t> buffer, size_t offset);

/**
 * Finds the offset of the first self-consistent container header.
 *
 * Images are often embedded in vendor wrappers, so the header is searched
 * for rather than assumed at offset 0. Occurrences of the header magic are
 * tried first. If none of them checks out, the header is assumed to directly
 * precede an occurrence of a segment magic, which recovers images whose
 * header magic was altered.
 *
 * @throw HeaderNotFound if neither strategy yields a header
 */
size_t LocateHeader(std::span<const uint8_t> buffer);

} // namespace Firmware
