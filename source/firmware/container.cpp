#include "container.hpp"

#include <range/v3/algorithm/all_of.hpp>

namespace Firmware {

bool Container::IsValid() const {
    return header_crc_valid &&
           ranges::all_of(segments, &Segment::crc_valid) &&
           signature.valid;
}

const char* GetKindName(SegmentKind kind) {
    switch (kind) {
    case SegmentKind::Data:
        return "data";

    case SegmentKind::Executable:
        return "executable";
    }
    return "unknown";
}

const char* GetStatusName(SignatureBlockStatus status) {
    switch (status) {
    case SignatureBlockStatus::Absent:
        return "absent";

    case SignatureBlockStatus::Unverified:
        return "unverified";

    case SignatureBlockStatus::Valid:
        return "valid";

    case SignatureBlockStatus::Invalid:
        return "invalid";
    }
    return "unknown";
}

} // namespace Firmware
