#pragma once
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace blackipher::protocol::models {

/// Long-term Ed25519 signing key of one participant. Signs the owner's
/// pre-keys; the secret half never leaves its guarded handle.
class IdentityKeyPair {
public:
    [[nodiscard]] static Result<IdentityKeyPair, ProtocolFailure> Generate();

    IdentityKeyPair(crypto::SecureMemoryHandle signing_key, std::vector<uint8_t> verifying_key);

    IdentityKeyPair(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair& operator=(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Sign(std::span<const uint8_t> message) const;

    [[nodiscard]] bool Verifies(std::span<const uint8_t> message, std::span<const uint8_t> signature) const;

    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return signing_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return verifying_key_;
    }
private:
    crypto::SecureMemoryHandle signing_key_;
    std::vector<uint8_t> verifying_key_;
};
}
