#pragma once
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include "blackipher/configuration/protocol_config.hpp"
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"
#include "blackipher/models/key_materials/identity_key_pair.hpp"
#include "blackipher/models/key_materials/signed_pre_key_pair.hpp"
#include "blackipher/models/keys/one_time_pre_key.hpp"
#include "blackipher/models/bundles/public_key_bundle.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <vector>
#include <cstdint>
namespace blackipher::proto::state {
class IdentityState;
}
namespace blackipher::protocol::identity {
using configuration::ProtocolConfig;
using crypto::SecureMemoryHandle;
using models::IdentityKeyPair;
using models::OneTimePreKey;
using models::PublicKeyBundle;
using models::SignedPreKeyPair;

/**
 * @brief Owns one local user's long-term key material.
 *
 * Holds the Ed25519 identity key pair, the advertised signed pre-key, up to
 * ProtocolConfig::GetRetainedSignedPreKeys() rotated-out signed pre-keys and
 * the pool of one-time pre-keys. The identity secret never leaves this
 * object; signing happens here.
 *
 * Thread-safe. Pool and rotation mutations take the lock exclusively,
 * bundle reads and signed pre-key lookups take it shared.
 */
class IdentityManager {
public:
    [[nodiscard]] static Result<IdentityManager, ProtocolFailure> Create(
        std::string owner_id,
        const ProtocolConfig& config = ProtocolConfig::Default());

    [[nodiscard]] static Result<IdentityManager, ProtocolFailure> FromProtoState(
        const proto::state::IdentityState& state,
        const ProtocolConfig& config = ProtocolConfig::Default());

    /// Exports every secret. The caller seals the result and clears it.
    [[nodiscard]] Result<proto::state::IdentityState, ProtocolFailure> ToProtoState() const;

    [[nodiscard]] const std::string& GetOwnerId() const noexcept {
        return owner_id_;
    }
    [[nodiscard]] std::vector<uint8_t> GetIdentityPublicCopy() const;
    [[nodiscard]] const ProtocolConfig& GetConfig() const noexcept {
        return config_;
    }

    [[nodiscard]] PublicKeyBundle CreatePublicBundle() const;

    /// Generates and signs a new signed pre-key and advertises it. Returns
    /// its id. The previous key moves to the retained list.
    [[nodiscard]] Result<uint32_t, ProtocolFailure> RotateSignedPreKey();

    /// Removes the one-time pre-key atomically. Empty when unknown or
    /// already taken.
    [[nodiscard]] std::optional<OneTimePreKey> TakeOneTimePreKey(uint32_t one_time_pre_key_id);

    /// Appends @p count fresh one-time pre-keys. Returns the new pool size.
    [[nodiscard]] Result<size_t, ProtocolFailure> ReplenishOneTimePreKeys(uint32_t count);

    [[nodiscard]] size_t AvailableOneTimePreKeyCount() const;
    [[nodiscard]] uint32_t GetCurrentSignedPreKeyId() const;
    [[nodiscard]] std::vector<uint32_t> GetRetainedSignedPreKeyIds() const;

    /**
     * @brief Run @p func against the signed pre-key with @p signed_pre_key_id.
     *
     * @p func must return a Result<T, ProtocolFailure>. Runs under the shared
     * lock. An id that was never issued or was evicted by rotation yields
     * StalePreKey without calling @p func.
     */
    template<typename F>
    auto WithSignedPreKey(const uint32_t signed_pre_key_id, F&& func) const
        -> std::invoke_result_t<F, const SignedPreKeyPair&> {
        using R = std::invoke_result_t<F, const SignedPreKeyPair&>;
        std::shared_lock lock(*lock_);
        const SignedPreKeyPair* spk = FindSignedPreKeyLocked(signed_pre_key_id);
        if (spk == nullptr) {
            return R::Err(ProtocolFailure::StalePreKey(
                "Signed pre-key " + std::to_string(signed_pre_key_id) +
                " is not retained by " + owner_id_));
        }
        return std::forward<F>(func)(*spk);
    }

    IdentityManager(IdentityManager&&) noexcept = default;
    IdentityManager& operator=(IdentityManager&&) noexcept = default;
    IdentityManager(const IdentityManager&) = delete;
    IdentityManager& operator=(const IdentityManager&) = delete;
    ~IdentityManager() = default;
private:
    IdentityManager(
        std::string owner_id,
        const ProtocolConfig& config,
        IdentityKeyPair identity,
        SignedPreKeyPair signed_pre_key,
        std::deque<SignedPreKeyPair> previous_signed_pre_keys,
        std::vector<OneTimePreKey> one_time_pre_keys,
        uint32_t next_one_time_pre_key_id);
    [[nodiscard]] static Result<std::vector<OneTimePreKey>, ProtocolFailure> GenerateOneTimePreKeys(
        uint32_t first_id,
        uint32_t count);
    [[nodiscard]] const SignedPreKeyPair* FindSignedPreKeyLocked(uint32_t signed_pre_key_id) const;
    void EvictSignedPreKeysLocked();
    std::string owner_id_;
    ProtocolConfig config_;
    IdentityKeyPair identity_;
    SignedPreKeyPair signed_pre_key_;
    std::deque<SignedPreKeyPair> previous_signed_pre_keys_;
    std::vector<OneTimePreKey> one_time_pre_keys_;
    uint32_t next_one_time_pre_key_id_;
    mutable std::unique_ptr<std::shared_mutex> lock_;
};
}
