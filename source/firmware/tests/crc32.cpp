#include <firmware/crc32.hpp>

#include <catch2/catch.hpp>

#include <string_view>
#include <vector>

static uint32_t Crc32Of(std::string_view text) {
    return Firmware::Crc32(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

TEST_CASE("Crc32 check values") {
    REQUIRE(Crc32Of("") == 0);
    REQUIRE(Crc32Of("123456789") == 0xcbf43926);
    REQUIRE(Crc32Of("The quick brown fox jumps over the lazy dog") == 0x414fa339);
}

TEST_CASE("Crc32 of zero bytes") {
    std::vector<uint8_t> zeroes(4, 0);
    REQUIRE(Firmware::Crc32(zeroes) == 0x2144df1c);
}
