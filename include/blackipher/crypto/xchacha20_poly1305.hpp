#pragma once
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace blackipher::protocol::crypto {

/**
 * XChaCha20-Poly1305 (IETF) authenticated encryption with associated data.
 *
 * Stateless primitive over libsodium. The 24-byte nonce is large enough
 * that callers draw it at random per message; this class does not track
 * nonces. Ciphertext output carries the 16-byte tag at its end.
 *
 * Any tag, nonce, key or associated-data mismatch on Decrypt yields a
 * Decryption failure with no partial plaintext.
 */
class XChaCha20Poly1305 {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static std::vector<uint8_t> GenerateNonce();
private:
    XChaCha20Poly1305() = delete;
};
}
