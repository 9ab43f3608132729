/**
 * The purpose of this file is to provide the definitions of
 * SerializationInterface::Load and SerializationInterface::Save. These are
 * heavy on template metaprogramming, so we don't want to recompile them in
 * every translation unit. Instead, the serialized structures of a format
 * are explicitly instantiated in exactly one file that includes this header.
 */

#pragma once

#ifndef FORMATS_IMPL_EXPLICIT_FORMAT_INSTANTIATIONS_INTENDED
#error This file should only be included if you want to explicitly instantiate SerializationInterface for user-defined structures
#endif

#include <framework/formats.hpp>
#include <framework/meta_tools.hpp>

#include <boost/hana.hpp>
#include <boost/hana/ext/std/tuple.hpp>

#include <array>
#include <tuple>

namespace FileFormat {

namespace hana = boost::hana;

namespace detail {

template<typename T>
constexpr bool is_hana_struct_v = hana::Struct<T>::value;

template<typename T, typename = void>
struct OwnEndianness : std::integral_constant<Endianness, Endianness::Undefined> {};

template<typename T>
struct OwnEndianness<T, Meta::void_t<decltype(T::Tags::endianness)>> : std::integral_constant<Endianness, T::Tags::endianness> {};

/// Byte order used for the members of T when it is nested in a structure that uses Outer
template<typename T, Endianness Outer>
constexpr Endianness InnerEndianness = (OwnEndianness<T>::value == Endianness::Undefined) ? Outer : OwnEndianness<T>::value;

template<typename T, typename = void>
struct ExpectedSize : std::integral_constant<size_t, 0> {};

template<typename T>
struct ExpectedSize<T, Meta::void_t<decltype(T::Tags::expected_serialized_size)>> : std::integral_constant<size_t, T::Tags::expected_serialized_size> {};

/// std::tuple of the member types of the given hana structure
template<typename T>
using MembersAsTuple_t = decltype(hana::to<hana::ext::std::tuple_tag>(hana::transform(hana::to_tuple(std::declval<T>()), hana::second)));

template<typename T, typename = void>
struct SerializedSize : std::integral_constant<size_t, sizeof(T)> {
    static_assert(std::is_integral_v<T>, "Only integers, std::arrays and hana structures can be serialized");
};

template<typename T, size_t N>
struct SerializedSize<std::array<T, N>, void> : std::integral_constant<size_t, N * SerializedSize<T>::value> {};

template<typename... Members>
struct SerializedSize<std::tuple<Members...>, void> : std::integral_constant<size_t, (SerializedSize<Members>::value + ... + 0)> {};

template<typename T>
struct SerializedSize<T, std::enable_if_t<is_hana_struct_v<T>>> : SerializedSize<MembersAsTuple_t<T>> {};

template<typename T>
void CheckSizeExpectations() {
    if constexpr (ExpectedSize<T>::value != 0) {
        static_assert(SerializedSize<T>::value == ExpectedSize<T>::value, "Serialized size does not match the expected_size_tag");
    }
}

template<Endianness E>
constexpr auto ToBoostOrder() {
    static_assert(E != Endianness::Undefined, "Multi-byte members require an endianness tag on the enclosing structure");
    return E == Endianness::Big ? boost::endian::order::big : boost::endian::order::little;
}

template<typename T, Endianness E>
T ReadElement(ReadCallback& reader) {
    if constexpr (Meta::is_std_array_v<T>) {
        using Value = typename T::value_type;
        T ret;
        if constexpr (sizeof(Value) == 1 && std::is_integral_v<Value>) {
            // Byte arrays don't need per-element conversion
            reader(reinterpret_cast<char*>(ret.data()), ret.size());
        } else {
            for (auto& elem : ret)
                elem = ReadElement<Value, E>(reader);
        }
        return ret;
    } else if constexpr (is_hana_struct_v<T>) {
        T ret {};
        hana::for_each(hana::accessors<T>(), [&](auto accessor) {
            auto& member = hana::second(accessor)(ret);
            using Member = std::remove_reference_t<decltype(member)>;
            member = ReadElement<Member, InnerEndianness<Member, E>>(reader);
        });
        return ret;
    } else if constexpr (sizeof(T) == 1) {
        unsigned char byte;
        reader(reinterpret_cast<char*>(&byte), 1);
        return static_cast<T>(byte);
    } else {
        return LoadValue<T, ToBoostOrder<E>()>(reader);
    }
}

template<typename T, Endianness E>
void WriteElement(const T& data, WriteCallback& writer) {
    if constexpr (Meta::is_std_array_v<T>) {
        using Value = typename T::value_type;
        if constexpr (sizeof(Value) == 1 && std::is_integral_v<Value>) {
            writer(reinterpret_cast<const char*>(data.data()), data.size());
        } else {
            for (auto& elem : data)
                WriteElement<Value, E>(elem, writer);
        }
    } else if constexpr (is_hana_struct_v<T>) {
        hana::for_each(hana::accessors<T>(), [&](auto accessor) {
            const auto& member = hana::second(accessor)(data);
            using Member = std::remove_cv_t<std::remove_reference_t<decltype(member)>>;
            WriteElement<Member, InnerEndianness<Member, E>>(member, writer);
        });
    } else if constexpr (sizeof(T) == 1) {
        auto byte = static_cast<unsigned char>(data);
        writer(reinterpret_cast<const char*>(&byte), 1);
    } else {
        SaveValue<T, ToBoostOrder<E>()>(data, writer);
    }
}

} // namespace detail

/// Number of bytes occupied by the serialized form of T
template<typename T>
constexpr size_t SerializedSize = detail::SerializedSize<T>::value;

template<typename Data>
Data SerializationInterface<Data>::Load(ReadCallback reader) {
    detail::CheckSizeExpectations<Data>();
    return detail::ReadElement<Data, detail::OwnEndianness<Data>::value>(reader);
}

template<typename Data>
void SerializationInterface<Data>::Save(const Data& data, WriteCallback writer) {
    detail::CheckSizeExpectations<Data>();
    detail::WriteElement<Data, detail::OwnEndianness<Data>::value>(data, writer);
}

} // namespace FileFormat
