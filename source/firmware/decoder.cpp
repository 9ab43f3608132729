#include "decoder.hpp"
#include "byte_stream.hpp"
#include "crc32.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "header_locator.hpp"
#include "signature.hpp"

#include <platform/file_formats/openfw.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find.hpp>

#include <boost/container/static_vector.hpp>

#include <algorithm>
#include <string>

namespace Firmware {

static std::string ReadCString(std::span<const uint8_t> field) {
    auto end = ranges::find(field, uint8_t { 0 });
    return std::string(field.begin(), end);
}

static FileFormat::Magic PeekMagic(const BufferStreamIn& stream, std::span<const uint8_t> buffer) {
    stream.Require(sizeof(FileFormat::Magic));

    FileFormat::Magic magic;
    std::copy_n(buffer.begin() + stream.Tell(), magic.size(), magic.begin());
    return magic;
}

static bool IsSignatureMagic(const FileFormat::Magic& magic) {
    return magic == FileFormat::Magics::End || magic == FileFormat::Magics::EndSigned;
}

static bool IsSignatureBlockSize(size_t size) {
    return ranges::find(FileFormat::signature_block_sizes, size) != FileFormat::signature_block_sizes.end();
}

static Segment DecodeSegment(BufferStreamIn& stream, std::span<const uint8_t> buffer) {
    const auto offset = stream.Tell();
    stream.Require(FileFormat::segment_header_size);
    auto header = FileFormat::Load<FileFormat::SegmentHeader>(stream);
    auto payload = stream.ReadSpan(header.data_size);
    stream.Require(FileFormat::segment_trailer_size);
    auto trailer = FileFormat::Load<FileFormat::SegmentTrailer>(stream);

    Segment segment {};
    segment.kind = (header.magic == FileFormat::Magics::Exec) ? SegmentKind::Executable : SegmentKind::Data;
    segment.name = ReadCString(header.name);
    segment.load_address = header.load_address;
    segment.index = header.index;
    segment.base_address = header.base_address;
    segment.entry_address = header.entry_address;
    segment.declared_size = header.data_size;
    segment.allocated_size = header.part_size;
    segment.payload = payload;
    segment.offset = offset;
    segment.crc_claim = trailer.crc;
    segment.crc_computed = Crc32(buffer.subspan(offset, FileFormat::segment_header_size + payload.size()));
    segment.crc_valid = (segment.crc_claim == segment.crc_computed);
    return segment;
}

static Signature DecodeSignature(BufferStreamIn& stream, std::span<const uint8_t> buffer, size_t header_offset, const DecodeOptions& options) {
    const auto offset = stream.Tell();
    auto magic = PeekMagic(stream, buffer);
    if (magic == FileFormat::Magics::Part || magic == FileFormat::Magics::Exec) {
        // Segment header cut short of the signature trailer size
        throw TruncatedInput(offset, FileFormat::segment_header_size, stream.Remaining());
    }
    if (!IsSignatureMagic(magic)) {
        throw BadSignatureMagic(magic, offset);
    }
    stream.Require(FileFormat::signature_trailer_size);
    auto trailer = FileFormat::Load<FileFormat::SignatureTrailer>(stream);

    Signature signature {};
    signature.variant = (magic == FileFormat::Magics::EndSigned) ? SignatureVariant::Signed : SignatureVariant::Plain;
    signature.offset = offset;
    signature.crc_claim = trailer.crc;

    // Checksums and the RSA signature are measured from the container start.
    // Wrapped images may have been signed including their wrapper instead.
    boost::container::static_vector<size_t, 2> bases = { header_offset };
    if (header_offset != 0) {
        bases.push_back(0);
    }

    signature.coverage = SignatureCoverage::None;
    for (auto base : bases) {
        // Firmware generations disagree on whether the trailer itself is covered, so accept both
        if (Crc32(buffer.subspan(base, offset - base)) == trailer.crc) {
            signature.coverage = SignatureCoverage::ExcludingTrailer;
            break;
        }
        if (Crc32(buffer.subspan(base, offset + FileFormat::signature_trailer_size - base)) == trailer.crc) {
            signature.coverage = SignatureCoverage::IncludingTrailer;
            break;
        }
    }
    signature.crc_valid = (signature.coverage != SignatureCoverage::None);

    signature.block_status = SignatureBlockStatus::Absent;
    if (IsSignatureBlockSize(stream.Remaining())) {
        signature.block = stream.ReadSpan(stream.Remaining());
        if (!options.verifier) {
            signature.block_status = SignatureBlockStatus::Unverified;
        } else {
            const auto message_end = offset + FileFormat::signature_trailer_size;
            bool verified = ranges::any_of(bases, [&](size_t base) {
                return options.verifier->Verify(buffer.subspan(base, message_end - base), signature.block);
            });
            signature.block_status = verified ? SignatureBlockStatus::Valid : SignatureBlockStatus::Invalid;
        }
    }

    signature.valid = signature.crc_valid && signature.block_status != SignatureBlockStatus::Invalid;
    return signature;
}

Container DecodeAt(std::span<const uint8_t> buffer, size_t header_offset, const DecodeOptions& options) {
    BufferStreamIn stream(buffer, header_offset);
    stream.Require(FileFormat::container_header_size);
    auto header = FileFormat::Load<FileFormat::ContainerHeader>(stream);

    Container ret {};
    ret.header_offset = header_offset;
    ret.version = ReadCString(header.version);
    ret.header_crc_claim = header.crc;
    ret.header_crc_valid = (header.crc == Crc32(buffer.subspan(header_offset, FileFormat::ContainerHeader::crc_covered_size)));
    if (options.events) {
        options.events->OnHeaderFound(header_offset, ret.version);
    }

    // Segments follow back-to-back until the terminal signature magic.
    // Each segment's offset depends on the size of the previous one.
    while (stream.Remaining() >= FileFormat::signature_trailer_size) {
        auto magic = PeekMagic(stream, buffer);
        if (IsSignatureMagic(magic)) {
            break;
        }
        if (magic != FileFormat::Magics::Part && magic != FileFormat::Magics::Exec) {
            throw UnknownSegmentMagic(magic, stream.Tell());
        }

        ret.segments.push_back(DecodeSegment(stream, buffer));
        if (options.events) {
            options.events->OnSegmentDecoded(ret.segments.size() - 1, ret.segments.back());
        }
    }

    ret.signature = DecodeSignature(stream, buffer, header_offset, options);
    ret.trailing_bytes = stream.Remaining();
    if (options.events) {
        options.events->OnSignatureDecoded(ret.signature);
    }

    return ret;
}

Container Decode(std::span<const uint8_t> buffer, const DecodeOptions& options) {
    return DecodeAt(buffer, LocateHeader(buffer), options);
}

} // namespace Firmware
