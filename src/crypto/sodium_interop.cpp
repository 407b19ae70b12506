#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"
#include "blackipher/protocol/constants.hpp"

#include <algorithm>

namespace blackipher::protocol::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });
    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) + ": " +
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;
    auto sk_handle_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            "Cannot allocate " + std::string(key_purpose) + " secret: " +
            sk_handle_result.UnwrapErr().message));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();
    // Scalar is drawn straight into guarded memory and never copied out.
    auto fill_result = sk_handle.WithWriteAccess([](std::span<uint8_t> secret) {
        randombytes_buf(secret.data(), secret.size());
        return unit;
    });
    if (fill_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(fill_result.UnwrapErr()));
    }
    std::vector<uint8_t> pk_bytes(kX25519PublicKeyBytes);
    auto derive_result = sk_handle.WithReadAccess([&pk_bytes](std::span<const uint8_t> secret) {
        return crypto_scalarmult_base(pk_bytes.data(), secret.data());
    });
    if (derive_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (derive_result.Unwrap() != SodiumConstants::SUCCESS) {
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            "Failed to derive " + std::string(key_purpose) + " public key"));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;
    auto sk_handle_result = SecureMemoryHandle::Allocate(kEd25519SecretKeyBytes);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            "Cannot allocate Ed25519 secret: " + sk_handle_result.UnwrapErr().message));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();
    std::vector<uint8_t> pk(kEd25519PublicKeyBytes);
    auto keypair_result = sk_handle.WithWriteAccess([&pk](std::span<uint8_t> secret) {
        return crypto_sign_keypair(pk.data(), secret.data());
    });
    if (keypair_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(keypair_result.UnwrapErr()));
    }
    if (keypair_result.Unwrap() != SodiumConstants::SUCCESS) {
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::SignDetached(
    const SecureMemoryHandle& ed25519_secret,
    std::span<const uint8_t> message) {
    if (ed25519_secret.Size() != kEd25519SecretKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Ed25519 secret key handle has wrong size"));
    }
    std::vector<uint8_t> signature(kEd25519SignatureBytes);
    unsigned long long sig_len = 0;
    auto sign_result = ed25519_secret.WithReadAccess([&](std::span<const uint8_t> secret) {
        return crypto_sign_detached(
            signature.data(), &sig_len, message.data(), message.size(), secret.data());
    });
    if (sign_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    if (sign_result.Unwrap() != SodiumConstants::SUCCESS || sig_len != kEd25519SignatureBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration("Ed25519 signing failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> ed25519_public,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (ed25519_public.size() != kEd25519PublicKeyBytes ||
        signature.size() != kEd25519SignatureBytes) {
        return false;
    }
    return crypto_sign_verify_detached(
        signature.data(), message.data(), message.size(),
        ed25519_public.data()) == SodiumConstants::SUCCESS;
}

Result<Unit, ProtocolFailure> SodiumInterop::ComputeX25519SharedSecret(
    const SecureMemoryHandle& x25519_secret,
    std::span<const uint8_t> peer_public,
    std::span<uint8_t> output) {
    if (peer_public.size() != kX25519PublicKeyBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::PeerPubKey(
                "X25519 public key must be " + std::to_string(kX25519PublicKeyBytes) +
                " bytes, got " + std::to_string(peer_public.size())));
    }
    if (output.size() != kX25519SharedSecretBytes || x25519_secret.Size() != kX25519PrivateKeyBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("X25519 buffer sizes are wrong"));
    }
    auto dh_result = x25519_secret.WithReadAccess([&](std::span<const uint8_t> secret) {
        return crypto_scalarmult(output.data(), secret.data(), peer_public.data());
    });
    if (dh_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(dh_result.UnwrapErr()));
    }
    if (dh_result.Unwrap() != SodiumConstants::SUCCESS) {
        SecureWipe(output);
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::PeerPubKey("X25519 produced a low-order result"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace blackipher::protocol::crypto
