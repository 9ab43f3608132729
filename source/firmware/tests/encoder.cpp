#include "test_images.hpp"

#include <firmware/decoder.hpp>
#include <firmware/encoder.hpp>
#include <firmware/errors.hpp>
#include <firmware/events.hpp>

#include <catch2/catch.hpp>

#include <string>

using namespace TestImages;

TEST_CASE("Encode writes the expected byte layout") {
    const auto image = MakeKernelImage();
    REQUIRE(image.size() == 268 + 56 + 3 + 8 + 12);

    REQUIRE(std::string(image.begin(), image.begin() + 4) == "OPEN");
    REQUIRE(std::string(reinterpret_cast<const char*>(image.data() + 4)) == "TEST-1.0");
    REQUIRE(LoadBigU32(image, 260) == Firmware::Crc32(std::span<const uint8_t>(image).first(260)));
    REQUIRE(LoadBigU32(image, 264) == 0);

    const size_t segment = 268;
    REQUIRE(std::string(image.begin() + segment, image.begin() + segment + 4) == "PART");
    REQUIRE(std::string(reinterpret_cast<const char*>(image.data() + segment + 4)) == "kernel");
    for (size_t i = 0; i < 12; ++i) {
        REQUIRE(image[segment + 20 + i] == 0);
    }
    REQUIRE(LoadBigU32(image, segment + 32) == 0);       // load address
    REQUIRE(LoadBigU32(image, segment + 36) == 0);       // index
    REQUIRE(LoadBigU32(image, segment + 40) == 0x10000); // base address
    REQUIRE(LoadBigU32(image, segment + 44) == 0);       // entry address
    REQUIRE(LoadBigU32(image, segment + 48) == 3);       // payload size
    REQUIRE(image[segment + 56] == 1);
    REQUIRE(image[segment + 57] == 2);
    REQUIRE(image[segment + 58] == 3);
    REQUIRE(LoadBigU32(image, segment + 59) == Firmware::Crc32(std::span<const uint8_t>(image).subspan(segment, 59)));
    REQUIRE(LoadBigU32(image, segment + 63) == 0);

    const size_t signature = segment + 67;
    REQUIRE(std::string(image.begin() + signature, image.begin() + signature + 4) == "END.");
    REQUIRE(LoadBigU32(image, signature + 4) == Firmware::Crc32(std::span<const uint8_t>(image).first(signature)));
    REQUIRE(LoadBigU32(image, signature + 8) == 0);
}

TEST_CASE("Encode output decodes as valid") {
    std::vector<Firmware::SegmentSpec> segments {
        MakeSegment("u-boot", { 0xde, 0xad }, 0, 0),
        MakeSegment("empty", {}, 1, 0x40000),
        MakeSegment("rootfs", std::vector<uint8_t>(0x1234, 0x77), 2, 0x100000),
    };
    segments[2].load_address = 0x80000000;
    segments[2].entry_address = 0x80001000;
    segments[2].allocated_size = 0x20000;

    auto image = Firmware::Encode("v2.0", segments);
    REQUIRE(image.size() == Firmware::GetEncodedSize(segments));

    auto container = Firmware::Decode(image);
    REQUIRE(container.IsValid());
    REQUIRE(container.segments.size() == 3);
    REQUIRE(container.segments[1].payload.empty());
    REQUIRE(container.segments[2].load_address == 0x80000000);
    REQUIRE(container.segments[2].entry_address == 0x80001000);
    REQUIRE(container.segments[2].allocated_size == 0x20000);
    REQUIRE(container.segments[2].index == 2);
}

TEST_CASE("Encode with no segments") {
    auto image = Firmware::Encode("nothing", {});
    REQUIRE(image.size() == 268 + 12);

    auto container = Firmware::Decode(image);
    REQUIRE(container.segments.empty());
    REQUIRE(container.IsValid());
}

TEST_CASE("Encode stores executable segments with EXEC magic") {
    auto segment = MakeSegment("script", { 's', 'h' });
    segment.kind = Firmware::SegmentKind::Executable;
    std::vector<Firmware::SegmentSpec> segments { segment };

    auto image = Firmware::Encode("v1", segments);
    REQUIRE(std::string(image.begin() + 268, image.begin() + 272) == "EXEC");
    REQUIRE(Firmware::Decode(image).segments.at(0).kind == Firmware::SegmentKind::Executable);
}

TEST_CASE("Encode handles over-long text fields") {
    const std::string long_name = "a-very-long-segment-name";
    const std::string long_version(300, 'v');
    std::vector<Firmware::SegmentSpec> segments { MakeSegment(long_name, { 1 }) };

    SECTION("Truncate") {
        auto image = Firmware::Encode(long_version, segments);
        auto container = Firmware::Decode(image);
        REQUIRE(container.version == long_version.substr(0, Firmware::max_version_length));
        REQUIRE(container.segments.at(0).name == long_name.substr(0, Firmware::max_name_length));
        REQUIRE(container.IsValid());
    }

    SECTION("Reject name") {
        Firmware::EncodeOptions options;
        options.overflow = Firmware::FieldOverflow::Reject;
        try {
            Firmware::Encode("short", segments, options);
            FAIL("Expected FieldTooLong");
        } catch (const Firmware::FieldTooLong& err) {
            REQUIRE(err.length == long_name.size());
            REQUIRE(err.max_length == Firmware::max_name_length);
        }
    }

    SECTION("Reject version") {
        Firmware::EncodeOptions options;
        options.overflow = Firmware::FieldOverflow::Reject;
        std::vector<Firmware::SegmentSpec> short_segments { MakeSegment("kernel", { 1 }) };
        REQUIRE_THROWS_AS(Firmware::Encode(long_version, short_segments, options), Firmware::FieldTooLong);
    }

    SECTION("Names of exactly 15 bytes are kept") {
        Firmware::EncodeOptions options;
        options.overflow = Firmware::FieldOverflow::Reject;
        std::vector<Firmware::SegmentSpec> exact { MakeSegment("fifteen-chars!!", { 1 }) };
        auto image = Firmware::Encode("v", exact, options);
        REQUIRE(Firmware::Decode(image).segments.at(0).name == "fifteen-chars!!");
    }
}

namespace {

struct EncodeRecorder : Firmware::CodecEvents {
    std::vector<std::pair<std::string, size_t>> segments;
    std::vector<uint32_t> crcs;

    void OnSegmentEncoded(size_t position, std::string_view name, size_t offset, uint32_t crc) override {
        REQUIRE(position == segments.size());
        segments.emplace_back(std::string(name), offset);
        crcs.push_back(crc);
    }
};

} // anonymous namespace

TEST_CASE("Encode notifies observer for each segment") {
    std::vector<Firmware::SegmentSpec> segments {
        MakeSegment("first", { 1, 2, 3, 4 }),
        MakeSegment("second", { 5 }),
    };

    EncodeRecorder recorder;
    Firmware::EncodeOptions options;
    options.events = &recorder;
    auto image = Firmware::Encode("v", segments, options);

    REQUIRE(recorder.segments.size() == 2);
    REQUIRE(recorder.segments[0] == std::pair<std::string, size_t> { "first", 268 });
    REQUIRE(recorder.segments[1] == std::pair<std::string, size_t> { "second", 268 + 56 + 4 + 8 });

    auto container = Firmware::Decode(image);
    REQUIRE(recorder.crcs[0] == container.segments[0].crc_claim);
    REQUIRE(recorder.crcs[1] == container.segments[1].crc_claim);
}
