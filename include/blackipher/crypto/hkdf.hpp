#pragma once

#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace blackipher::protocol::crypto {

/**
 * @brief RFC 5869 HKDF-SHA256 on top of the OpenSSL 3 EVP_KDF API.
 *
 * Extract and expand run as one EVP_KDF_derive call.
 */
class Hkdf {
public:
    /**
     * @brief Fill @p output with key material derived from @p ikm.
     *
     * @param ikm Input key material, must not be empty
     * @param output Destination, at most MAX_OUTPUT_LEN bytes
     * @param salt Optional salt (empty means the RFC default of zeros)
     * @param info Optional context string
     */
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /**
     * @brief Derive straight into a fresh secure memory handle.
     *
     * The intermediate buffer is wiped before returning.
     */
    static Result<SecureMemoryHandle, ProtocolFailure> DeriveKeyHandle(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace blackipher::protocol::crypto
