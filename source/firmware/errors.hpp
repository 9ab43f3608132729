#pragma once

#include <platform/file_formats/openfw.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Firmware {

/**
 * Base class for structural malformations of a container image.
 *
 * Checksum and signature mismatches are not reported through exceptions;
 * they are recorded as validity flags on the decoded Container instead.
 */
struct FormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// No offset in the buffer holds a self-consistent container header
struct HeaderNotFound : FormatError {
    HeaderNotFound();
};

/// A structure at the given offset extends past the end of the buffer
struct TruncatedInput : FormatError {
    TruncatedInput(size_t offset, size_t needed, size_t available);

    size_t offset;    // absolute buffer offset of the read that failed
    size_t needed;    // number of bytes requested at offset
    size_t available; // number of bytes left at offset
};

/// Neither a segment nor a terminal signature magic was found where one was expected
struct UnknownSegmentMagic : FormatError {
    UnknownSegmentMagic(const FileFormat::Magic& magic, size_t offset);

    FileFormat::Magic magic;
    size_t offset;
};

/// The bytes following the last segment don't start with a terminal signature magic
struct BadSignatureMagic : FormatError {
    BadSignatureMagic(const FileFormat::Magic& magic, size_t offset);

    FileFormat::Magic magic;
    size_t offset;
};

/// A text field exceeds its fixed width and the encoder was asked not to truncate it
struct FieldTooLong : FormatError {
    FieldTooLong(std::string field, size_t length, size_t max_length);

    std::string field;
    size_t length;
    size_t max_length;
};

/// Printable representation of a magic value, e.g. "PART" or "\x00\x12PA"
std::string FormatMagic(const FileFormat::Magic& magic);

} // namespace Firmware
