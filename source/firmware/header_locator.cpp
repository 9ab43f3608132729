#include "header_locator.hpp"
#include "crc32.hpp"
#include "errors.hpp"

#include <framework/ranges.hpp>
#include <platform/file_formats/openfw.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <iterator>
#include <vector>

namespace Firmware {

bool IsHeaderAt(std::span<const uint8_t> buffer, size_t offset) {
    if (offset > buffer.size() || buffer.size() - offset < FileFormat::container_header_size) {
        return false;
    }

    const auto covered = FileFormat::ContainerHeader::crc_covered_size;
    const auto stored = boost::endian::load_big_u32(buffer.data() + offset + covered);
    return stored == Crc32(buffer.subspan(offset, covered));
}

size_t LocateHeader(std::span<const uint8_t> buffer) {
    for (auto offset : ranges::find_all_offsets(buffer, FileFormat::Magics::Header)) {
        if (IsHeaderAt(buffer, offset)) {
            return offset;
        }
    }

    // Fall back to the first segment: The header is expected right in front of it
    auto part_offsets = ranges::find_all_offsets(buffer, FileFormat::Magics::Part);
    auto exec_offsets = ranges::find_all_offsets(buffer, FileFormat::Magics::Exec);
    std::vector<size_t> segment_offsets;
    std::merge(part_offsets.begin(), part_offsets.end(), exec_offsets.begin(), exec_offsets.end(),
               std::back_inserter(segment_offsets));
    for (auto segment_offset : segment_offsets) {
        if (segment_offset < FileFormat::container_header_size) {
            continue;
        }

        auto candidate = segment_offset - FileFormat::container_header_size;
        if (IsHeaderAt(buffer, candidate)) {
            return candidate;
        }
    }

    throw HeaderNotFound();
}

} // namespace Firmware
