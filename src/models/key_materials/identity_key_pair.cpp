#include "blackipher/models/key_materials/identity_key_pair.hpp"
#include "blackipher/crypto/sodium_interop.hpp"

namespace blackipher::protocol::models {
    using crypto::SodiumInterop;

    Result<IdentityKeyPair, ProtocolFailure> IdentityKeyPair::Generate() {
        auto generated = SodiumInterop::GenerateEd25519KeyPair();
        if (generated.IsErr()) {
            return Result<IdentityKeyPair, ProtocolFailure>::Err(std::move(generated).UnwrapErr());
        }
        auto [signing_key, verifying_key] = std::move(generated).Unwrap();
        return Result<IdentityKeyPair, ProtocolFailure>::Ok(
            IdentityKeyPair(std::move(signing_key), std::move(verifying_key)));
    }

    IdentityKeyPair::IdentityKeyPair(
        crypto::SecureMemoryHandle signing_key,
        std::vector<uint8_t> verifying_key)
        : signing_key_(std::move(signing_key))
          , verifying_key_(std::move(verifying_key)) {
    }

    Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeyPair::Sign(
        const std::span<const uint8_t> message) const {
        return SodiumInterop::SignDetached(signing_key_, message);
    }

    bool IdentityKeyPair::Verifies(
        const std::span<const uint8_t> message,
        const std::span<const uint8_t> signature) const {
        return SodiumInterop::VerifyDetached(verifying_key_, message, signature);
    }
}
