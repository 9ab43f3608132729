#include "crc32.hpp"

#include <boost/endian/conversion.hpp>

#include <cryptopp/crc.h>

namespace Firmware {

uint32_t Crc32(std::span<const uint8_t> data) {
    // The digest holds the checksum in little-endian byte order
    CryptoPP::byte digest[CryptoPP::CRC32::DIGESTSIZE];
    CryptoPP::CRC32().CalculateDigest(digest, reinterpret_cast<const CryptoPP::byte*>(data.data()), data.size());
    return boost::endian::load_little_u32(digest);
}

} // namespace Firmware
