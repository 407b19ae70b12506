#include "blackipher/crypto/hkdf.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/core_names.h>
#include <memory>
#include <string>

namespace blackipher::protocol::crypto {
namespace {
    struct EvpKdfDeleter {
        void operator()(EVP_KDF* kdf) const {
            EVP_KDF_free(kdf);
        }
    };
    struct EvpKdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using EvpKdfPtr = std::unique_ptr<EVP_KDF, EvpKdfDeleter>;
    using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, EvpKdfCtxDeleter>;
}

Result<Unit, ProtocolFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "HKDF output size out of range: " + std::to_string(output.size())));
    }
    if (ikm.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    EvpKdfPtr kdf(EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF.data(), nullptr));
    if (!kdf) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to fetch HKDF algorithm"));
    }
    EvpKdfCtxPtr kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("HKDF key derivation failed"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<SecureMemoryHandle, ProtocolFailure> Hkdf::DeriveKeyHandle(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    auto alloc_result = SecureMemoryHandle::Allocate(output_size);
    if (alloc_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(alloc_result.UnwrapErr()));
    }
    auto handle = std::move(alloc_result).Unwrap();
    auto derive_result = handle.WithWriteAccess([&](std::span<uint8_t> out) {
        return DeriveKey(ikm, out, salt, info);
    });
    if (derive_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (auto inner = std::move(derive_result).Unwrap(); inner.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(std::move(inner).UnwrapErr());
    }
    return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle));
}

} // namespace blackipher::protocol::crypto
