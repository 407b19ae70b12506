#include "blackipher/models/key_materials/signed_pre_key_pair.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/protocol/constants.hpp"

namespace blackipher::protocol::models {
    using crypto::SodiumInterop;

    Result<SignedPreKeyPair, ProtocolFailure> SignedPreKeyPair::Generate(
        const uint32_t id,
        const IdentityKeyPair &signer) {
        auto generated = SodiumInterop::GenerateX25519KeyPair(kPurposeSignedPreKey);
        if (generated.IsErr()) {
            return Result<SignedPreKeyPair, ProtocolFailure>::Err(std::move(generated).UnwrapErr());
        }
        auto [secret_handle, public_key] = std::move(generated).Unwrap();
        auto signature = signer.Sign(public_key);
        if (signature.IsErr()) {
            return Result<SignedPreKeyPair, ProtocolFailure>::Err(
                ProtocolFailure::KeyGeneration(
                    "Failed to sign signed pre-key " + std::to_string(id) + ": " +
                    signature.UnwrapErr().message));
        }
        return Result<SignedPreKeyPair, ProtocolFailure>::Ok(SignedPreKeyPair(
            id, std::move(secret_handle), std::move(public_key), std::move(signature).Unwrap()));
    }

    SignedPreKeyPair::SignedPreKeyPair(
        const uint32_t id,
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key,
        std::vector<uint8_t> signature)
        : id_(id)
          , secret_key_handle_(std::move(secret_key_handle))
          , public_key_(std::move(public_key))
          , signature_(std::move(signature)) {
    }

    bool SignedPreKeyPair::IsSignedBy(const std::span<const uint8_t> identity_public) const {
        return SodiumInterop::VerifyDetached(identity_public, public_key_, signature_);
    }
}
