#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>

namespace Firmware {

/**
 * Verifies the optional signature block of a container.
 */
class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;

    /// Returns true iff signature is a valid signature of message
    virtual bool Verify(std::span<const uint8_t> message, std::span<const uint8_t> signature) const = 0;
};

/**
 * RSA signatures over the SHA-1 digest of the message with PKCS#1 v1.5
 * padding. Only verification is supported.
 */
class RsaSha1Verifier : public SignatureVerifier {
    struct Impl;
    std::unique_ptr<Impl> impl;

public:
    enum class KeyFormat {
        SubjectPublicKeyInfo, // X.509, "-----BEGIN PUBLIC KEY-----"
        Pkcs1,                // "-----BEGIN RSA PUBLIC KEY-----"
    };

    /// @throw OpenFw::Exceptions::InvalidUserInput if the key can't be decoded
    RsaSha1Verifier(std::span<const uint8_t> der_public_key, KeyFormat format);
    ~RsaSha1Verifier() override;

    bool Verify(std::span<const uint8_t> message, std::span<const uint8_t> signature) const override;

    /// Size of signatures produced by the matching private key, in bytes
    size_t GetSignatureLength() const;
};

/**
 * Parses a PEM-encoded RSA public key ("PUBLIC KEY" or "RSA PUBLIC KEY").
 *
 * @throw OpenFw::Exceptions::InvalidUserInput if no usable key is found
 */
std::unique_ptr<RsaSha1Verifier> ParsePublicKeyPem(std::string_view pem);

/// Reads and parses the given PEM file
std::unique_ptr<RsaSha1Verifier> LoadPublicKeyPem(const std::filesystem::path& filename);

} // namespace Firmware
