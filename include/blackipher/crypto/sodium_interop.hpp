#pragma once

#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include "blackipher/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace blackipher::protocol::crypto {

class SecureMemoryHandle;

/**
 * @brief Static facade over the libsodium primitives the protocol uses.
 *
 * Key generation, Ed25519 detached signatures, X25519 scalar multiplication,
 * the CSPRNG and guarded allocation all go through here so that every
 * private scalar is created and consumed inside secure memory.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /// Zeroes @p buffer in a way the optimiser cannot elide.
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /**
     * @brief Generate an X25519 key pair with the scalar held in secure memory.
     *
     * @param key_purpose Used only in failure messages
     * @return Ok((secret_handle, public_key)) or KeyGeneration failure
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate an Ed25519 signing key pair.
     *
     * @return Ok((secret_handle, public_key)) or KeyGeneration failure
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateEd25519KeyPair();

    /**
     * @brief Ed25519 detached signature over @p message.
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> SignDetached(
        const SecureMemoryHandle& ed25519_secret,
        std::span<const uint8_t> message);

    /**
     * @brief Ed25519 detached signature check. Malformed sizes verify false.
     */
    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> ed25519_public,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

    /**
     * @brief X25519(private, peer_public) into @p output.
     *
     * Fails with PeerPubKey for a malformed peer key or a low-order point
     * (libsodium reports an all-zero result).
     */
    static Result<Unit, ProtocolFailure> ComputeX25519SharedSecret(
        const SecureMemoryHandle& x25519_secret,
        std::span<const uint8_t> peer_public,
        std::span<uint8_t> output);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace blackipher::protocol::crypto
