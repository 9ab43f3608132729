#include "errors.hpp"

#include <fmt/format.h>

#include <cctype>
#include <utility>

namespace Firmware {

std::string FormatMagic(const FileFormat::Magic& magic) {
    std::string ret;
    for (auto byte : magic) {
        if (std::isprint(byte)) {
            ret += static_cast<char>(byte);
        } else {
            ret += fmt::format("\\x{:02x}", byte);
        }
    }
    return ret;
}

HeaderNotFound::HeaderNotFound()
    : FormatError("No valid firmware header found (tried header and segment magic heuristics)") {
}

TruncatedInput::TruncatedInput(size_t offset, size_t needed, size_t available)
    : FormatError(fmt::format("Truncated input: need {:#x} bytes at offset {:#x}, but only {:#x} are left", needed, offset, available)),
      offset(offset), needed(needed), available(available) {
}

UnknownSegmentMagic::UnknownSegmentMagic(const FileFormat::Magic& magic, size_t offset)
    : FormatError(fmt::format("Unknown segment magic '{}' at offset {:#x}", FormatMagic(magic), offset)),
      magic(magic), offset(offset) {
}

BadSignatureMagic::BadSignatureMagic(const FileFormat::Magic& magic, size_t offset)
    : FormatError(fmt::format("Bad signature magic '{}' at offset {:#x}", FormatMagic(magic), offset)),
      magic(magic), offset(offset) {
}

FieldTooLong::FieldTooLong(std::string field_, size_t length, size_t max_length)
    : FormatError(fmt::format("{} is {} bytes long, but at most {} bytes fit", field_, length, max_length)),
      field(std::move(field_)), length(length), max_length(max_length) {
}

} // namespace Firmware
