#include "blackipher/crypto/xchacha20_poly1305.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/protocol/constants.hpp"
#include <sodium.h>
#include <format>
namespace blackipher::protocol::crypto {
static_assert(crypto_aead_xchacha20poly1305_ietf_KEYBYTES == kAeadKeyBytes);
static_assert(crypto_aead_xchacha20poly1305_ietf_NPUBBYTES == kAeadNonceBytes);
static_assert(crypto_aead_xchacha20poly1305_ietf_ABYTES == kAeadTagBytes);
namespace {
    Result<Unit, ProtocolFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        const bool decrypting) {
        if (key.size() != kAeadKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    std::format("XChaCha20-Poly1305 key must be {} bytes, got {}",
                        kAeadKeyBytes, key.size())));
        }
        if (nonce.size() != kAeadNonceBytes) {
            auto message = std::format("XChaCha20-Poly1305 nonce must be {} bytes, got {}",
                kAeadNonceBytes, nonce.size());
            return Result<Unit, ProtocolFailure>::Err(
                decrypting ? ProtocolFailure::Decryption(std::move(message))
                           : ProtocolFailure::InvalidInput(std::move(message)));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, ProtocolFailure>
XChaCha20Poly1305::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce, false); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    std::vector<uint8_t> output(plaintext.size() + kAeadTagBytes);
    unsigned long long ciphertext_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_encrypt(
            output.data(), &ciphertext_len,
            plaintext.data(), plaintext.size(),
            associated_data.empty() ? nullptr : associated_data.data(), associated_data.size(),
            nullptr,
            nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("XChaCha20-Poly1305 encryption failed"));
    }
    output.resize(static_cast<size_t>(ciphertext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, ProtocolFailure>
XChaCha20Poly1305::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce, true); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kAeadTagBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decryption(
                std::format("{}: {} bytes (minimum {} for tag)",
                    ErrorMessages::CIPHERTEXT_TOO_SMALL, ciphertext_with_tag.size(), kAeadTagBytes)));
    }
    std::vector<uint8_t> output(ciphertext_with_tag.size() - kAeadTagBytes);
    unsigned long long plaintext_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
            output.data(), &plaintext_len,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            associated_data.empty() ? nullptr : associated_data.data(), associated_data.size(),
            nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decryption(std::string(ErrorMessages::AEAD_DECRYPTION_FAILED)));
    }
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
std::vector<uint8_t> XChaCha20Poly1305::GenerateNonce() {
    return SodiumInterop::GetRandomBytes(kAeadNonceBytes);
}
}
