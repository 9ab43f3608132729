#include "signature.hpp"

#include <framework/exceptions.hpp>

#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cryptopp/queue.h>
#include <cryptopp/rsa.h>
#include <cryptopp/sha.h>

#include <fstream>
#include <iterator>
#include <string>

namespace Firmware {

using Verifier = CryptoPP::RSASSA_PKCS1v15_SHA_Verifier;

struct RsaSha1Verifier::Impl {
    explicit Impl(const CryptoPP::RSA::PublicKey& key) : verifier(key) {
    }

    Verifier verifier;
};

RsaSha1Verifier::RsaSha1Verifier(std::span<const uint8_t> der_public_key, KeyFormat format) {
    CryptoPP::RSA::PublicKey key;
    CryptoPP::ByteQueue queue;
    queue.Put(der_public_key.data(), der_public_key.size());
    queue.MessageEnd();

    try {
        if (format == KeyFormat::Pkcs1) {
            key.BERDecodePublicKey(queue, false, der_public_key.size());
        } else {
            key.BERDecode(queue);
        }
    } catch (const CryptoPP::Exception& err) {
        throw OpenFw::Exceptions::InvalidUserInput("Malformed RSA public key: {}", err.what());
    }

    if (!key.Validate(CryptoPP::NullRNG(), 0)) {
        throw OpenFw::Exceptions::InvalidUserInput("RSA public key failed validation");
    }

    impl = std::make_unique<Impl>(key);
}

RsaSha1Verifier::~RsaSha1Verifier() = default;

bool RsaSha1Verifier::Verify(std::span<const uint8_t> message, std::span<const uint8_t> signature) const {
    if (signature.size() != impl->verifier.SignatureLength()) {
        return false;
    }

    try {
        return impl->verifier.VerifyMessage(message.data(), message.size(), signature.data(), signature.size());
    } catch (const CryptoPP::Exception&) {
        // Signature representatives out of range for the modulus end up here
        return false;
    }
}

size_t RsaSha1Verifier::GetSignatureLength() const {
    return impl->verifier.SignatureLength();
}

static std::string_view ExtractPemBody(std::string_view pem, std::string_view label) {
    const auto begin_marker = "-----BEGIN " + std::string(label) + "-----";
    const auto end_marker = "-----END " + std::string(label) + "-----";

    auto begin = pem.find(begin_marker);
    if (begin == std::string_view::npos) {
        return {};
    }
    begin += begin_marker.size();

    auto end = pem.find(end_marker, begin);
    if (end == std::string_view::npos) {
        throw OpenFw::Exceptions::InvalidUserInput("PEM block \"{}\" is not terminated", label);
    }
    return pem.substr(begin, end - begin);
}

std::unique_ptr<RsaSha1Verifier> ParsePublicKeyPem(std::string_view pem) {
    auto format = RsaSha1Verifier::KeyFormat::SubjectPublicKeyInfo;
    auto body = ExtractPemBody(pem, "PUBLIC KEY");
    if (body.empty()) {
        format = RsaSha1Verifier::KeyFormat::Pkcs1;
        body = ExtractPemBody(pem, "RSA PUBLIC KEY");
    }
    if (body.empty()) {
        throw OpenFw::Exceptions::InvalidUserInput("No PEM-encoded public key found");
    }

    // Base64Decoder skips line breaks and other characters outside of the alphabet
    std::string der;
    CryptoPP::StringSource source(reinterpret_cast<const CryptoPP::byte*>(body.data()), body.size(), true,
                                  new CryptoPP::Base64Decoder(new CryptoPP::StringSink(der)));

    return std::make_unique<RsaSha1Verifier>(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(der.data()), der.size()), format);
}

std::unique_ptr<RsaSha1Verifier> LoadPublicKeyPem(const std::filesystem::path& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw OpenFw::Exceptions::InvalidUserInput("Failed to load public key: Could not open {}", filename.string());
    }

    std::string pem { std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
    return ParsePublicKeyPem(pem);
}

} // namespace Firmware
