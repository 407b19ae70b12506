#include "blackipher/models/bundles/public_key_bundle.hpp"
#include <algorithm>

namespace blackipher::protocol::models {
    PublicKeyBundle::PublicKeyBundle(
        std::string owner_id,
        std::vector<uint8_t> identity_ed25519_public,
        const uint32_t signed_pre_key_id,
        std::vector<uint8_t> signed_pre_key_public,
        std::vector<uint8_t> signed_pre_key_signature,
        std::vector<OneTimePreKeyPublic> one_time_pre_keys)
        : owner_id_(std::move(owner_id))
          , identity_ed25519_public_(std::move(identity_ed25519_public))
          , signed_pre_key_id_(signed_pre_key_id)
          , signed_pre_key_public_(std::move(signed_pre_key_public))
          , signed_pre_key_signature_(std::move(signed_pre_key_signature))
          , one_time_pre_keys_(std::move(one_time_pre_keys)) {
    }

    std::optional<OneTimePreKeyPublic> PublicKeyBundle::PopOneTimePreKey() {
        if (one_time_pre_keys_.empty()) {
            return std::nullopt;
        }
        OneTimePreKeyPublic front = std::move(one_time_pre_keys_.front());
        one_time_pre_keys_.erase(one_time_pre_keys_.begin());
        return front;
    }

    bool PublicKeyBundle::RestoreOneTimePreKey(OneTimePreKeyPublic one_time_pre_key) {
        const auto id = one_time_pre_key.GetOneTimePreKeyId();
        const bool advertised = std::any_of(
            one_time_pre_keys_.begin(), one_time_pre_keys_.end(),
            [id](const OneTimePreKeyPublic &opk) { return opk.GetOneTimePreKeyId() == id; });
        if (advertised) {
            return false;
        }
        one_time_pre_keys_.insert(one_time_pre_keys_.begin(), std::move(one_time_pre_key));
        return true;
    }
}
