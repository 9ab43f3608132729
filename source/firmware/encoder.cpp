#include "encoder.hpp"
#include "byte_stream.hpp"
#include "crc32.hpp"
#include "errors.hpp"
#include "events.hpp"

#include <framework/exceptions.hpp>
#include <platform/file_formats/openfw.hpp>

#include <range/v3/algorithm/copy_n.hpp>

#include <algorithm>
#include <cstddef>
#include <limits>

namespace Firmware {

template<size_t N>
static std::array<uint8_t, N> MakeTextField(std::string_view text, size_t max_length, const char* field_name, FieldOverflow overflow) {
    static_assert(N > 0);
    if (text.size() > max_length && overflow == FieldOverflow::Reject) {
        throw FieldTooLong(field_name, text.size(), max_length);
    }

    std::array<uint8_t, N> field {};
    ranges::copy_n(text.begin(), static_cast<std::ptrdiff_t>(std::min(text.size(), max_length)), field.begin());
    return field;
}

size_t GetEncodedSize(std::span<const SegmentSpec> segments) {
    size_t total = FileFormat::container_header_size + FileFormat::signature_trailer_size;
    for (auto& segment : segments) {
        total += FileFormat::segment_header_size + segment.payload.size() + FileFormat::segment_trailer_size;
    }
    return total;
}

std::vector<uint8_t> Encode(std::string_view version, std::span<const SegmentSpec> segments, const EncodeOptions& options) {
    for (auto& segment : segments) {
        if (segment.payload.size() > std::numeric_limits<uint32_t>::max()) {
            throw OpenFw::Exceptions::Invalid("Payload of segment \"{}\" is too large ({} bytes)", segment.name, segment.payload.size());
        }
    }

    std::vector<uint8_t> image(GetEncodedSize(segments), 0);
    BufferStreamOut stream(image);

    FileFormat::ContainerHeader header {};
    header.magic = FileFormat::Magics::Header;
    header.version = MakeTextField<256>(version, max_version_length, "Version", options.overflow);
    FileFormat::Save(header, stream);
    // The header checksum covers magic and version as written
    header.crc = Crc32(std::span<const uint8_t>(image).first(FileFormat::ContainerHeader::crc_covered_size));
    BufferStreamOut header_stream(image);
    FileFormat::Save(header, header_stream);

    for (size_t position = 0; position < segments.size(); ++position) {
        const auto& segment = segments[position];
        const auto offset = stream.Tell();

        FileFormat::SegmentHeader segment_header {};
        segment_header.magic = (segment.kind == SegmentKind::Executable) ? FileFormat::Magics::Exec : FileFormat::Magics::Part;
        segment_header.name = MakeTextField<16>(segment.name, max_name_length, "Segment name", options.overflow);
        segment_header.load_address = segment.load_address;
        segment_header.index = segment.index;
        segment_header.base_address = segment.base_address;
        segment_header.entry_address = segment.entry_address;
        segment_header.data_size = static_cast<uint32_t>(segment.payload.size());
        segment_header.part_size = segment.allocated_size;
        FileFormat::Save(segment_header, stream);
        stream.Write(segment.payload);

        FileFormat::SegmentTrailer trailer {};
        trailer.crc = Crc32(std::span<const uint8_t>(image).subspan(offset, stream.Tell() - offset));
        FileFormat::Save(trailer, stream);

        if (options.events) {
            options.events->OnSegmentEncoded(position, segment.name, offset, trailer.crc);
        }
    }

    FileFormat::SignatureTrailer signature {};
    signature.magic = FileFormat::Magics::End;
    signature.crc = Crc32(std::span<const uint8_t>(image).first(stream.Tell()));
    FileFormat::Save(signature, stream);

    ValidateContract(stream.Tell() == image.size());
    return image;
}

} // namespace Firmware
