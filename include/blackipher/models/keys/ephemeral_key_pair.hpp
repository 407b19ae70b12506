#pragma once
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include <vector>
#include <cstdint>
namespace blackipher::protocol::models {

/**
 * @brief Single-use X25519 key pair for one outgoing message.
 *
 * Move-only. Key agreement takes it by rvalue and the scalar is freed
 * (and zeroed by sodium_free) when the agreement returns.
 */
class EphemeralKeyPair {
public:
    [[nodiscard]] static Result<EphemeralKeyPair, ProtocolFailure> Generate();
    EphemeralKeyPair(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair& operator=(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair(const EphemeralKeyPair&) = delete;
    EphemeralKeyPair& operator=(const EphemeralKeyPair&) = delete;
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] bool IsConsumed() const noexcept {
        return secret_key_handle_.IsInvalid();
    }
private:
    EphemeralKeyPair(crypto::SecureMemoryHandle secret_key_handle, std::vector<uint8_t> public_key)
        : secret_key_handle_(std::move(secret_key_handle))
        , public_key_(std::move(public_key)) {}
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
