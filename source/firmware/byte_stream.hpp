#pragma once

#include "errors.hpp"

#include <framework/exceptions.hpp>

#include <cstdint>
#include <cstring>
#include <span>

namespace Firmware {

/**
 * Bounds-checked read cursor over an immutable buffer, usable as input
 * stream for FileFormat::Load. Offsets are absolute within the buffer.
 */
class BufferStreamIn {
    std::span<const uint8_t> buffer;
    size_t cursor;

public:
    BufferStreamIn(std::span<const uint8_t> buffer, size_t offset = 0) : buffer(buffer), cursor(offset) {
    }

    static constexpr bool IsStreamInInstance = true;

    /// Throws TruncatedInput if fewer than size bytes are left
    void Read(char* dest, size_t size) {
        Require(size);
        if (size == 0) {
            return;
        }
        std::memcpy(dest, buffer.data() + cursor, size);
        cursor += size;
    }

    /// Returns a view of the next size bytes and advances past them
    std::span<const uint8_t> ReadSpan(size_t size) {
        Require(size);
        auto ret = buffer.subspan(cursor, size);
        cursor += size;
        return ret;
    }

    void Require(size_t size) const {
        if (size > Remaining()) {
            throw TruncatedInput(cursor, size, Remaining());
        }
    }

    size_t Tell() const {
        return cursor;
    }

    size_t Remaining() const {
        return cursor <= buffer.size() ? buffer.size() - cursor : 0;
    }
};

/**
 * Write cursor over a preallocated buffer, usable as output stream for
 * FileFormat::Save. Writing past the end is a programming error.
 */
class BufferStreamOut {
    std::span<uint8_t> buffer;
    size_t cursor;

public:
    BufferStreamOut(std::span<uint8_t> buffer, size_t offset = 0) : buffer(buffer), cursor(offset) {
    }

    static constexpr bool IsStreamOutInstance = true;

    void Write(const char* src, size_t size) {
        ValidateContract(size <= buffer.size() - cursor);
        if (size == 0) {
            return;
        }
        std::memcpy(buffer.data() + cursor, src, size);
        cursor += size;
    }

    void Write(std::span<const uint8_t> data) {
        Write(reinterpret_cast<const char*>(data.data()), data.size());
    }

    size_t Tell() const {
        return cursor;
    }
};

} // namespace Firmware
