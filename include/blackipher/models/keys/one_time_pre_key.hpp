#pragma once
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include "blackipher/models/keys/one_time_pre_key_public.hpp"
#include <vector>
#include <cstdint>
namespace blackipher::protocol::models {

/// Receiver-side one-time pre-key. Removed from its owner's pool the moment
/// a message referencing it is opened, so each id is consumed at most once.
class OneTimePreKey {
public:
    static Result<OneTimePreKey, ProtocolFailure> Generate(uint32_t one_time_pre_key_id);

    /// Rebuilds a key loaded from persisted state. Sizes are checked by the caller.
    static OneTimePreKey Restore(
        uint32_t one_time_pre_key_id,
        crypto::SecureMemoryHandle private_key_handle,
        std::vector<uint8_t> public_key);

    OneTimePreKey(OneTimePreKey&&) noexcept = default;
    OneTimePreKey& operator=(OneTimePreKey&&) noexcept = default;
    OneTimePreKey(const OneTimePreKey&) = delete;
    OneTimePreKey& operator=(const OneTimePreKey&) = delete;

    [[nodiscard]] OneTimePreKeyPublic ToPublic() const {
        return {one_time_pre_key_id_, public_key_};
    }

    [[nodiscard]] uint32_t GetOneTimePreKeyId() const noexcept { return one_time_pre_key_id_; }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetPrivateKeyHandle() const noexcept {
        return private_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept { return public_key_; }
private:
    OneTimePreKey(
        uint32_t one_time_pre_key_id,
        crypto::SecureMemoryHandle private_key_handle,
        std::vector<uint8_t> public_key);

    uint32_t one_time_pre_key_id_;
    crypto::SecureMemoryHandle private_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
