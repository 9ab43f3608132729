#define FORMATS_IMPL_EXPLICIT_FORMAT_INSTANTIATIONS_INTENDED
#include <framework/formats_impl.hpp>

#include <firmware/byte_stream.hpp>
#include <firmware/errors.hpp>

#include <boost/hana/define_struct.hpp>

#include <catch2/catch.hpp>

#include <array>
#include <vector>

namespace TestFormats {

struct LittleInner {
    BOOST_HANA_DEFINE_STRUCT(LittleInner,
        (uint16_t, value)
    );

    struct Tags : FileFormat::little_endian_tag {};
};

struct Mixed {
    BOOST_HANA_DEFINE_STRUCT(Mixed,
        (std::array<uint8_t, 3>, bytes),
        (uint32_t, word),
        (LittleInner, inner),
        (std::array<uint16_t, 2>, halfwords),
        (uint8_t, byte)
    );

    struct Tags : FileFormat::big_endian_tag, FileFormat::expected_size_tag<14> {};
};

} // namespace TestFormats

namespace FileFormat {
template struct SerializationInterface<TestFormats::Mixed>;
}

static_assert(FileFormat::SerializedSize<TestFormats::Mixed> == 14);
static_assert(FileFormat::SerializedSize<TestFormats::LittleInner> == 2);

static const std::vector<uint8_t> mixed_bytes {
    'a', 'b', 'c',          // bytes
    0x12, 0x34, 0x56, 0x78, // word, big-endian
    0xcd, 0xab,             // inner.value, little-endian
    0x00, 0x01, 0xff, 0xfe, // halfwords, big-endian
    0x7f,                   // byte
};

TEST_CASE("Load honors nested byte order") {
    Firmware::BufferStreamIn stream(mixed_bytes);
    auto data = FileFormat::Load<TestFormats::Mixed>(stream);

    REQUIRE(data.bytes == std::array<uint8_t, 3> { 'a', 'b', 'c' });
    REQUIRE(data.word == 0x12345678);
    REQUIRE(data.inner.value == 0xabcd);
    REQUIRE(data.halfwords == std::array<uint16_t, 2> { 0x0001, 0xfffe });
    REQUIRE(data.byte == 0x7f);
    REQUIRE(stream.Tell() == mixed_bytes.size());
}

TEST_CASE("Save produces the same byte sequence") {
    TestFormats::Mixed data {};
    data.bytes = { 'a', 'b', 'c' };
    data.word = 0x12345678;
    data.inner.value = 0xabcd;
    data.halfwords = { 0x0001, 0xfffe };
    data.byte = 0x7f;

    std::vector<uint8_t> output(mixed_bytes.size());
    Firmware::BufferStreamOut stream(output);
    FileFormat::Save(data, stream);

    REQUIRE(stream.Tell() == output.size());
    REQUIRE(output == mixed_bytes);
}

TEST_CASE("Load from short buffer throws TruncatedInput") {
    std::vector<uint8_t> short_buffer(mixed_bytes.begin(), mixed_bytes.begin() + 5);
    Firmware::BufferStreamIn stream(short_buffer);
    REQUIRE_THROWS_AS(FileFormat::Load<TestFormats::Mixed>(stream), Firmware::TruncatedInput);
}
