#include "test_images.hpp"

#include <firmware/decoder.hpp>
#include <firmware/signature.hpp>
#include <framework/exceptions.hpp>

#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cryptopp/osrng.h>
#include <cryptopp/queue.h>
#include <cryptopp/rsa.h>
#include <cryptopp/sha.h>

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace TestImages;

namespace {

using Signer = CryptoPP::RSASSA_PKCS1v15_SHA_Signer;

struct TestKey {
    CryptoPP::AutoSeededRandomPool rng;
    CryptoPP::RSA::PrivateKey private_key;

    TestKey(unsigned bits = 2048) {
        private_key.GenerateRandomWithKeySize(rng, bits);
    }

    std::vector<uint8_t> Sign(std::span<const uint8_t> message) {
        Signer signer(private_key);
        std::vector<uint8_t> signature(signer.MaxSignatureLength());
        auto length = signer.SignMessage(rng, message.data(), message.size(), signature.data());
        signature.resize(length);
        return signature;
    }

    std::string Der(bool pkcs1) const {
        CryptoPP::RSA::PublicKey public_key(private_key);
        std::string der;
        CryptoPP::StringSink sink(der);
        if (pkcs1) {
            public_key.DEREncodePublicKey(sink);
        } else {
            public_key.DEREncode(sink);
        }
        sink.MessageEnd();
        return der;
    }

    std::string Pem(bool pkcs1) const {
        auto der = Der(pkcs1);
        std::string body;
        CryptoPP::StringSource source(der, true, new CryptoPP::Base64Encoder(new CryptoPP::StringSink(body), true, 64));

        const std::string label = pkcs1 ? "RSA PUBLIC KEY" : "PUBLIC KEY";
        return "-----BEGIN " + label + "-----\n" + body + "-----END " + label + "-----\n";
    }
};

// Key generation is slow, so all tests share the same keys
TestKey& GetKey() {
    static TestKey key;
    return key;
}

TestKey& GetOtherKey() {
    static TestKey key;
    return key;
}

TestKey& GetLargeKey() {
    static TestKey key { 4096 };
    return key;
}

/// Signs MakeKernelImage() with the "ENDS" magic, covering everything up to the end of the signature trailer
std::vector<uint8_t> MakeSignedImage(TestKey& key) {
    auto image = MakeKernelImage();
    const size_t sig = image.size() - 12;
    std::copy_n("ENDS", 4, image.begin() + sig);

    auto signature = key.Sign(image);
    image.insert(image.end(), signature.begin(), signature.end());
    return image;
}

} // anonymous namespace

TEST_CASE("ParsePublicKeyPem accepts both key encodings") {
    auto& key = GetKey();

    auto spki = Firmware::ParsePublicKeyPem(key.Pem(false));
    REQUIRE(spki->GetSignatureLength() == 256);

    auto pkcs1 = Firmware::ParsePublicKeyPem(key.Pem(true));
    REQUIRE(pkcs1->GetSignatureLength() == 256);
}

TEST_CASE("ParsePublicKeyPem rejects malformed input") {
    REQUIRE_THROWS_AS(Firmware::ParsePublicKeyPem(""), OpenFw::Exceptions::InvalidUserInput);
    REQUIRE_THROWS_AS(Firmware::ParsePublicKeyPem("-----BEGIN PUBLIC KEY-----\nAAAA\n"), OpenFw::Exceptions::InvalidUserInput);
    REQUIRE_THROWS_AS(Firmware::ParsePublicKeyPem("-----BEGIN PUBLIC KEY-----\nAAAA\n-----END PUBLIC KEY-----\n"), OpenFw::Exceptions::InvalidUserInput);
}

TEST_CASE("LoadPublicKeyPem") {
    auto filename = std::filesystem::temp_directory_path() / "openfw_test_key.pem";
    {
        std::ofstream file(filename);
        file << GetKey().Pem(false);
    }
    REQUIRE(Firmware::LoadPublicKeyPem(filename)->GetSignatureLength() == 256);
    std::filesystem::remove(filename);

    REQUIRE_THROWS_AS(Firmware::LoadPublicKeyPem(filename), OpenFw::Exceptions::InvalidUserInput);
}

TEST_CASE("RsaSha1Verifier checks signatures") {
    auto& key = GetKey();
    auto verifier = Firmware::ParsePublicKeyPem(key.Pem(false));

    std::vector<uint8_t> message { 'h', 'e', 'l', 'l', 'o' };
    auto signature = key.Sign(message);
    REQUIRE(verifier->Verify(message, signature));

    message[0] = 'j';
    REQUIRE_FALSE(verifier->Verify(message, signature));

    // Wrong length
    signature.resize(128);
    REQUIRE_FALSE(verifier->Verify(message, signature));
}

TEST_CASE("Decode verifies signature blocks") {
    auto image = MakeSignedImage(GetKey());

    SECTION("Matching key") {
        auto verifier = Firmware::ParsePublicKeyPem(GetKey().Pem(false));
        Firmware::DecodeOptions options;
        options.verifier = verifier.get();

        auto container = Firmware::Decode(image, options);
        REQUIRE(container.signature.variant == Firmware::SignatureVariant::Signed);
        REQUIRE(container.signature.block.size() == 256);
        REQUIRE(container.signature.block_status == Firmware::SignatureBlockStatus::Valid);
        REQUIRE(container.signature.valid);
        REQUIRE(container.IsValid());
    }

    SECTION("Wrong key") {
        auto verifier = Firmware::ParsePublicKeyPem(GetOtherKey().Pem(true));
        Firmware::DecodeOptions options;
        options.verifier = verifier.get();

        auto container = Firmware::Decode(image, options);
        REQUIRE(container.signature.crc_valid);
        REQUIRE(container.signature.block_status == Firmware::SignatureBlockStatus::Invalid);
        REQUIRE_FALSE(container.signature.valid);
        REQUIRE_FALSE(container.IsValid());
    }

    SECTION("No key") {
        auto container = Firmware::Decode(image);
        REQUIRE(container.signature.block_status == Firmware::SignatureBlockStatus::Unverified);
        REQUIRE(container.signature.valid);
    }

    SECTION("Tampered payload") {
        auto verifier = Firmware::ParsePublicKeyPem(GetKey().Pem(false));
        Firmware::DecodeOptions options;
        options.verifier = verifier.get();

        image[268 + 56] ^= 0xff;
        auto container = Firmware::Decode(image, options);
        REQUIRE(container.signature.block_status == Firmware::SignatureBlockStatus::Invalid);
        REQUIRE_FALSE(container.IsValid());
    }
}

TEST_CASE("Decode verifies 4096-bit signature blocks") {
    auto image = MakeSignedImage(GetLargeKey());
    REQUIRE(image.size() == MakeKernelImage().size() + 512);

    SECTION("Matching key") {
        auto verifier = Firmware::ParsePublicKeyPem(GetLargeKey().Pem(true));
        REQUIRE(verifier->GetSignatureLength() == 512);
        Firmware::DecodeOptions options;
        options.verifier = verifier.get();

        auto container = Firmware::Decode(image, options);
        REQUIRE(container.signature.block.size() == 512);
        REQUIRE(container.signature.block_status == Firmware::SignatureBlockStatus::Valid);
        REQUIRE(container.trailing_bytes == 0);
        REQUIRE(container.IsValid());
    }

    SECTION("Key of a different size") {
        auto verifier = Firmware::ParsePublicKeyPem(GetKey().Pem(false));
        Firmware::DecodeOptions options;
        options.verifier = verifier.get();

        auto container = Firmware::Decode(image, options);
        REQUIRE(container.signature.block_status == Firmware::SignatureBlockStatus::Invalid);
        REQUIRE_FALSE(container.IsValid());
    }

    SECTION("No key") {
        auto container = Firmware::Decode(image);
        REQUIRE(container.signature.block.size() == 512);
        REQUIRE(container.signature.block_status == Firmware::SignatureBlockStatus::Unverified);
    }
}

TEST_CASE("Decode ignores missing signature block when given a key") {
    auto verifier = Firmware::ParsePublicKeyPem(GetKey().Pem(false));
    Firmware::DecodeOptions options;
    options.verifier = verifier.get();

    auto image = MakeKernelImage();
    auto container = Firmware::Decode(image, options);
    REQUIRE(container.signature.block_status == Firmware::SignatureBlockStatus::Absent);
    REQUIRE(container.IsValid());
}
