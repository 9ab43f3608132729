#pragma once

#include <boost/endian/buffers.hpp>

#include <cstddef>
#include <functional>
#include <type_traits>

namespace FileFormat {

enum class Endianness {
    Big,
    Little,
    Undefined
};

template<Endianness E>
struct endianness_tag {
    static constexpr auto endianness = E;
};

using big_endian_tag = endianness_tag<Endianness::Big>;
using little_endian_tag = endianness_tag<Endianness::Little>;

struct expected_size_tag_base { };

/// Used to annotate serializeable structures with the expected total size of the serialized data (used as a static assertion)
template<size_t Size>
struct expected_size_tag : expected_size_tag_base { static constexpr auto expected_serialized_size = Size; };

/// Copies the next N bytes of the underlying medium into the given buffer
using ReadCallback = std::function<void(char*, size_t)>;

/// Appends N bytes from the given buffer to the underlying medium
using WriteCallback = std::function<void(const char*, size_t)>;

/**
 * Loading and saving of structures annotated with BOOST_HANA_DEFINE_STRUCT.
 *
 * The implementation walks the structure members recursively at compile
 * time, which is expensive to compile. Hence it lives in formats_impl.hpp
 * and is explicitly instantiated in a single translation unit for each
 * serialized structure. Members are encoded back-to-back with no padding,
 * using the byte order given by the Tags of the innermost structure that
 * specifies one.
 */
template<typename Data>
struct SerializationInterface {
    static Data Load(ReadCallback reader);
    static void Save(const Data& data, WriteCallback writer);
};

template<typename Data, typename Stream>
Data Load(Stream& stream_in) {
    static_assert(Stream::IsStreamInInstance, "Given stream must have an IsStreamInInstance member");

    return SerializationInterface<Data>::Load([&stream_in](char* dest, size_t size) { stream_in.Read(dest, size); });
}

template<typename Data, typename Stream>
auto Save(const Data& data, Stream& stream_out) -> std::enable_if_t<Stream::IsStreamOutInstance> {
    SerializationInterface<Data>::Save(data, [&stream_out](const char* src, size_t size) { stream_out.Write(src, size); });
}

/// Reads a single integer of the given byte order without going through SerializationInterface
template<typename Data, boost::endian::order Order>
Data LoadValue(const ReadCallback& reader) {
    boost::endian::endian_buffer<Order, Data, sizeof(Data) * 8> buffer;
    reader(reinterpret_cast<char*>(buffer.data()), sizeof(Data));
    return buffer.value();
}

template<typename Data, boost::endian::order Order>
void SaveValue(Data value, const WriteCallback& writer) {
    boost::endian::endian_buffer<Order, Data, sizeof(Data) * 8> buffer { value };
    writer(reinterpret_cast<const char*>(buffer.data()), sizeof(Data));
}

} // namespace FileFormat
