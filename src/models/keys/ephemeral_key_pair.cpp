#include "blackipher/models/keys/ephemeral_key_pair.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/protocol/constants.hpp"

namespace blackipher::protocol::models {
    Result<EphemeralKeyPair, ProtocolFailure> EphemeralKeyPair::Generate() {
        auto key_result = crypto::SodiumInterop::GenerateX25519KeyPair(kPurposeEphemeralX25519);
        if (key_result.IsErr()) {
            return Result<EphemeralKeyPair, ProtocolFailure>::Err(std::move(key_result).UnwrapErr());
        }
        auto [secret_handle, public_key] = std::move(key_result).Unwrap();
        return Result<EphemeralKeyPair, ProtocolFailure>::Ok(
            EphemeralKeyPair(std::move(secret_handle), std::move(public_key)));
    }
}
