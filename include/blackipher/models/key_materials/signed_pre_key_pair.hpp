#pragma once
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"
#include "blackipher/models/key_materials/identity_key_pair.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace blackipher::protocol::models {

/// X25519 pre-key whose public half is signed by the owner's Ed25519
/// identity key. The id is the owner's rotation sequence number.
class SignedPreKeyPair {
public:
    [[nodiscard]] static Result<SignedPreKeyPair, ProtocolFailure> Generate(
        uint32_t id,
        const IdentityKeyPair& signer);

    SignedPreKeyPair(
        uint32_t id,
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key,
        std::vector<uint8_t> signature);

    SignedPreKeyPair(SignedPreKeyPair&&) noexcept = default;
    SignedPreKeyPair& operator=(SignedPreKeyPair&&) noexcept = default;
    SignedPreKeyPair(const SignedPreKeyPair&) = delete;
    SignedPreKeyPair& operator=(const SignedPreKeyPair&) = delete;

    /// True when the stored signature covers the public half under the given identity key.
    [[nodiscard]] bool IsSignedBy(std::span<const uint8_t> identity_public) const;

    [[nodiscard]] uint32_t GetId() const noexcept { return id_; }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept { return public_key_; }
    [[nodiscard]] const std::vector<uint8_t>& GetSignature() const noexcept { return signature_; }
private:
    uint32_t id_;
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
    std::vector<uint8_t> signature_;
};
}
