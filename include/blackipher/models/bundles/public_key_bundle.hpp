#pragma once
#include "blackipher/models/keys/one_time_pre_key_public.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>
namespace blackipher::protocol::models {

/// Everything a peer needs to start an agreement with the owner.
/// Carries no private material and is freely copyable.
class PublicKeyBundle {
public:
    PublicKeyBundle(
        std::string owner_id,
        std::vector<uint8_t> identity_ed25519_public,
        uint32_t signed_pre_key_id,
        std::vector<uint8_t> signed_pre_key_public,
        std::vector<uint8_t> signed_pre_key_signature,
        std::vector<OneTimePreKeyPublic> one_time_pre_keys);
    [[nodiscard]] const std::string& GetOwnerId() const noexcept {
        return owner_id_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetIdentityEd25519Public() const noexcept {
        return identity_ed25519_public_;
    }
    [[nodiscard]] uint32_t GetSignedPreKeyId() const noexcept {
        return signed_pre_key_id_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignedPreKeyPublic() const noexcept {
        return signed_pre_key_public_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignedPreKeySignature() const noexcept {
        return signed_pre_key_signature_;
    }
    [[nodiscard]] const std::vector<OneTimePreKeyPublic>& GetOneTimePreKeys() const noexcept {
        return one_time_pre_keys_;
    }
    [[nodiscard]] bool HasOneTimePreKeys() const noexcept {
        return !one_time_pre_keys_.empty();
    }
    /// Removes and returns the oldest advertised one-time pre-key.
    std::optional<OneTimePreKeyPublic> PopOneTimePreKey();
    /// Returns a popped key to the front. False if the id is already advertised.
    bool RestoreOneTimePreKey(OneTimePreKeyPublic one_time_pre_key);
    bool operator==(const PublicKeyBundle&) const = default;
private:
    std::string owner_id_;
    std::vector<uint8_t> identity_ed25519_public_;
    uint32_t signed_pre_key_id_;
    std::vector<uint8_t> signed_pre_key_public_;
    std::vector<uint8_t> signed_pre_key_signature_;
    std::vector<OneTimePreKeyPublic> one_time_pre_keys_;
};
}
