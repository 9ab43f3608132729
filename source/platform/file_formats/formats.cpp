#define FORMATS_IMPL_EXPLICIT_FORMAT_INSTANTIATIONS_INTENDED
#include <framework/formats_impl.hpp>

#include "openfw.hpp"

namespace FileFormat {

// Container structures
template struct SerializationInterface<ContainerHeader>;
template struct SerializationInterface<SegmentHeader>;
template struct SerializationInterface<SegmentTrailer>;
template struct SerializationInterface<SignatureTrailer>;

static_assert(SerializedSize<ContainerHeader> == container_header_size);
static_assert(SerializedSize<SegmentHeader> == segment_header_size);
static_assert(SerializedSize<SegmentTrailer> == segment_trailer_size);
static_assert(SerializedSize<SignatureTrailer> == signature_trailer_size);

} // namespace FileFormat
