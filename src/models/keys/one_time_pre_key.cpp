#include "blackipher/models/keys/one_time_pre_key.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/protocol/constants.hpp"

namespace blackipher::protocol::models {
    Result<OneTimePreKey, ProtocolFailure> OneTimePreKey::Generate(const uint32_t one_time_pre_key_id) {
        auto generated = crypto::SodiumInterop::GenerateX25519KeyPair(kPurposeOneTimePreKey);
        if (generated.IsErr()) {
            return Result<OneTimePreKey, ProtocolFailure>::Err(std::move(generated).UnwrapErr());
        }
        auto [secret, public_key] = std::move(generated).Unwrap();
        return Result<OneTimePreKey, ProtocolFailure>::Ok(
            OneTimePreKey(one_time_pre_key_id, std::move(secret), std::move(public_key)));
    }

    OneTimePreKey OneTimePreKey::Restore(
        const uint32_t one_time_pre_key_id,
        crypto::SecureMemoryHandle private_key_handle,
        std::vector<uint8_t> public_key) {
        return {one_time_pre_key_id, std::move(private_key_handle), std::move(public_key)};
    }

    OneTimePreKey::OneTimePreKey(
        const uint32_t one_time_pre_key_id,
        crypto::SecureMemoryHandle private_key_handle,
        std::vector<uint8_t> public_key)
        : one_time_pre_key_id_(one_time_pre_key_id)
          , private_key_handle_(std::move(private_key_handle))
          , public_key_(std::move(public_key)) {
    }
}
