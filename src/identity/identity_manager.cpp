#include "blackipher/identity/identity_manager.hpp"
#include "blackipher/protocol/constants.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/debug/key_logger.hpp"
#include "blackipher/state.pb.h"
#include <algorithm>
#include <cstdio>
#include <limits>

namespace blackipher::protocol::identity {
    using crypto::SodiumInterop;
    using models::OneTimePreKeyPublic;

    namespace {
        std::span<const uint8_t> AsBytes(const std::string &value) {
            return {reinterpret_cast<const uint8_t *>(value.data()), value.size()};
        }

        Result<SecureMemoryHandle, ProtocolFailure> ImportSecret(
            const std::string &bytes,
            const size_t expected_size,
            const char *what) {
            if (bytes.size() != expected_size) {
                return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(std::string("Invalid ") + what + " size in stored state"));
            }
            auto handle_result = SecureMemoryHandle::FromBytes(AsBytes(bytes));
            if (handle_result.IsErr()) {
                return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
            }
            return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle_result).Unwrap());
        }

        Result<Unit, ProtocolFailure> ExportSecret(
            const SecureMemoryHandle &handle,
            const size_t size,
            std::string *out) {
            auto read_result = handle.ReadBytes(size);
            if (read_result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
            }
            auto bytes = std::move(read_result).Unwrap();
            out->assign(reinterpret_cast<const char *>(bytes.data()), bytes.size());
            SodiumInterop::SecureWipe(std::span(bytes));
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<SignedPreKeyPair, ProtocolFailure> ImportSignedPreKey(
            const proto::state::SignedPreKeySecret &proto,
            const std::vector<uint8_t> &identity_public) {
            if (proto.public_key().size() != kX25519PublicKeyBytes ||
                proto.signature().size() != kEd25519SignatureBytes) {
                return Result<SignedPreKeyPair, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Invalid signed pre-key " + std::to_string(proto.id()) +
                                            " in stored state"));
            }
            auto secret_result = ImportSecret(proto.secret_key(), kX25519PrivateKeyBytes, "signed pre-key secret");
            if (secret_result.IsErr()) {
                return Result<SignedPreKeyPair, ProtocolFailure>::Err(secret_result.UnwrapErr());
            }
            SignedPreKeyPair spk(
                proto.id(),
                std::move(secret_result).Unwrap(),
                std::vector<uint8_t>(proto.public_key().begin(), proto.public_key().end()),
                std::vector<uint8_t>(proto.signature().begin(), proto.signature().end()));
            if (!spk.IsSignedBy(identity_public)) {
                return Result<SignedPreKeyPair, ProtocolFailure>::Err(
                    ProtocolFailure::SignatureVerification(
                        "Stored signed pre-key " + std::to_string(proto.id()) +
                        " is not signed by the stored identity"));
            }
            return Result<SignedPreKeyPair, ProtocolFailure>::Ok(std::move(spk));
        }

        Result<Unit, ProtocolFailure> ExportSignedPreKey(
            const SignedPreKeyPair &spk,
            proto::state::SignedPreKeySecret *out) {
            out->set_id(spk.GetId());
            out->set_public_key(spk.GetPublicKey().data(), spk.GetPublicKey().size());
            out->set_signature(spk.GetSignature().data(), spk.GetSignature().size());
            return ExportSecret(spk.GetSecretKeyHandle(), kX25519PrivateKeyBytes, out->mutable_secret_key());
        }
    }

    IdentityManager::IdentityManager(
        std::string owner_id,
        const ProtocolConfig &config,
        IdentityKeyPair identity,
        SignedPreKeyPair signed_pre_key,
        std::deque<SignedPreKeyPair> previous_signed_pre_keys,
        std::vector<OneTimePreKey> one_time_pre_keys,
        const uint32_t next_one_time_pre_key_id)
        : owner_id_(std::move(owner_id))
          , config_(config)
          , identity_(std::move(identity))
          , signed_pre_key_(std::move(signed_pre_key))
          , previous_signed_pre_keys_(std::move(previous_signed_pre_keys))
          , one_time_pre_keys_(std::move(one_time_pre_keys))
          , next_one_time_pre_key_id_(next_one_time_pre_key_id)
          , lock_(std::make_unique<std::shared_mutex>()) {
    }

    Result<std::vector<OneTimePreKey>, ProtocolFailure> IdentityManager::GenerateOneTimePreKeys(
        const uint32_t first_id,
        const uint32_t count) {
        if (count == 0) {
            return Result<std::vector<OneTimePreKey>, ProtocolFailure>::Ok(
                std::vector<OneTimePreKey>{});
        }
        if (first_id > std::numeric_limits<uint32_t>::max() - count) {
            return Result<std::vector<OneTimePreKey>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("One-time pre-key id space exhausted"));
        }
        std::vector<OneTimePreKey> opks;
        opks.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            auto opk_result = OneTimePreKey::Generate(first_id + i);
            if (opk_result.IsErr()) {
                return Result<std::vector<OneTimePreKey>, ProtocolFailure>::Err(
                    opk_result.UnwrapErr());
            }
            opks.push_back(std::move(opk_result).Unwrap());
        }
        return Result<std::vector<OneTimePreKey>, ProtocolFailure>::Ok(std::move(opks));
    }

    Result<IdentityManager, ProtocolFailure> IdentityManager::Create(
        std::string owner_id,
        const ProtocolConfig &config) {
        if (owner_id.empty()) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Owner id must not be empty"));
        }
        if (auto config_check = config.Validate(); config_check.IsErr()) {
            return Result<IdentityManager, ProtocolFailure>::Err(config_check.UnwrapErr());
        }
        if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
            fprintf(stderr, "[IDENTITY] libsodium initialization failed for '%s'\n", owner_id.c_str());
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::KeyGeneration(init_result.UnwrapErr().message));
        }
        auto identity_result = IdentityKeyPair::Generate();
        if (identity_result.IsErr()) {
            fprintf(stderr, "[IDENTITY] Identity key generation failed for '%s'\n", owner_id.c_str());
            return Result<IdentityManager, ProtocolFailure>::Err(identity_result.UnwrapErr());
        }
        auto identity = std::move(identity_result).Unwrap();
        auto spk_result = SignedPreKeyPair::Generate(kFirstSignedPreKeyId, identity);
        if (spk_result.IsErr()) {
            fprintf(stderr, "[IDENTITY] Signed pre-key generation failed for '%s'\n", owner_id.c_str());
            return Result<IdentityManager, ProtocolFailure>::Err(spk_result.UnwrapErr());
        }
        auto spk = std::move(spk_result).Unwrap();
        const uint32_t batch = config.UsesOneTimePreKeys() ? config.GetOneTimePreKeyBatchSize() : 0;
        auto opks_result = GenerateOneTimePreKeys(kFirstOneTimePreKeyId, batch);
        if (opks_result.IsErr()) {
            fprintf(stderr, "[IDENTITY] One-time pre-key generation failed for '%s'\n", owner_id.c_str());
            return Result<IdentityManager, ProtocolFailure>::Err(opks_result.UnwrapErr());
        }
        debug::LogIdentityCreated(owner_id, identity.GetPublicKey(), spk.GetId(), spk.GetPublicKey(), batch);
        return Result<IdentityManager, ProtocolFailure>::Ok(IdentityManager(
            std::move(owner_id),
            config,
            std::move(identity),
            std::move(spk),
            {},
            std::move(opks_result).Unwrap(),
            kFirstOneTimePreKeyId + batch));
    }

    std::vector<uint8_t> IdentityManager::GetIdentityPublicCopy() const {
        std::shared_lock lock(*lock_);
        return identity_.GetPublicKey();
    }

    PublicKeyBundle IdentityManager::CreatePublicBundle() const {
        std::shared_lock lock(*lock_);
        std::vector<OneTimePreKeyPublic> opk_publics;
        opk_publics.reserve(one_time_pre_keys_.size());
        for (const auto &opk : one_time_pre_keys_) {
            opk_publics.push_back(opk.ToPublic());
        }
        return {
            owner_id_,
            identity_.GetPublicKey(),
            signed_pre_key_.GetId(),
            signed_pre_key_.GetPublicKey(),
            signed_pre_key_.GetSignature(),
            std::move(opk_publics)
        };
    }

    Result<uint32_t, ProtocolFailure> IdentityManager::RotateSignedPreKey() {
        std::unique_lock lock(*lock_);
        if (signed_pre_key_.GetId() == std::numeric_limits<uint32_t>::max()) {
            return Result<uint32_t, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Signed pre-key id space exhausted"));
        }
        const uint32_t new_id = signed_pre_key_.GetId() + 1;
        auto spk_result = SignedPreKeyPair::Generate(new_id, identity_);
        if (spk_result.IsErr()) {
            fprintf(stderr, "[IDENTITY] Signed pre-key rotation failed for '%s'\n", owner_id_.c_str());
            return Result<uint32_t, ProtocolFailure>::Err(spk_result.UnwrapErr());
        }
        previous_signed_pre_keys_.push_back(std::move(signed_pre_key_));
        signed_pre_key_ = std::move(spk_result).Unwrap();
        EvictSignedPreKeysLocked();
        debug::LogSignedPreKeyRotated(new_id, signed_pre_key_.GetPublicKey(), previous_signed_pre_keys_.size());
        return Result<uint32_t, ProtocolFailure>::Ok(new_id);
    }

    void IdentityManager::EvictSignedPreKeysLocked() {
        while (previous_signed_pre_keys_.size() > config_.GetRetainedSignedPreKeys()) {
            previous_signed_pre_keys_.pop_front();
        }
    }

    const SignedPreKeyPair *IdentityManager::FindSignedPreKeyLocked(const uint32_t signed_pre_key_id) const {
        if (signed_pre_key_.GetId() == signed_pre_key_id) {
            return &signed_pre_key_;
        }
        const auto it = std::find_if(previous_signed_pre_keys_.begin(), previous_signed_pre_keys_.end(),
                                     [signed_pre_key_id](const SignedPreKeyPair &spk) {
                                         return spk.GetId() == signed_pre_key_id;
                                     });
        if (it == previous_signed_pre_keys_.end()) {
            return nullptr;
        }
        return &*it;
    }

    std::optional<OneTimePreKey> IdentityManager::TakeOneTimePreKey(const uint32_t one_time_pre_key_id) {
        std::unique_lock lock(*lock_);
        const auto it = std::find_if(one_time_pre_keys_.begin(), one_time_pre_keys_.end(),
                                     [one_time_pre_key_id](const OneTimePreKey &opk) {
                                         return opk.GetOneTimePreKeyId() == one_time_pre_key_id;
                                     });
        if (it == one_time_pre_keys_.end()) {
            return std::nullopt;
        }
        OneTimePreKey taken = std::move(*it);
        one_time_pre_keys_.erase(it);
        return taken;
    }

    Result<size_t, ProtocolFailure> IdentityManager::ReplenishOneTimePreKeys(const uint32_t count) {
        if (count > ProtocolConfig::kMaxOneTimePreKeyBatch) {
            return Result<size_t, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Replenish count " + std::to_string(count) + " exceeds " +
                                              std::to_string(ProtocolConfig::kMaxOneTimePreKeyBatch)));
        }
        std::unique_lock lock(*lock_);
        auto opks_result = GenerateOneTimePreKeys(next_one_time_pre_key_id_, count);
        if (opks_result.IsErr()) {
            return Result<size_t, ProtocolFailure>::Err(opks_result.UnwrapErr());
        }
        auto opks = std::move(opks_result).Unwrap();
        one_time_pre_keys_.insert(one_time_pre_keys_.end(),
                                  std::make_move_iterator(opks.begin()),
                                  std::make_move_iterator(opks.end()));
        next_one_time_pre_key_id_ += count;
        return Result<size_t, ProtocolFailure>::Ok(one_time_pre_keys_.size());
    }

    size_t IdentityManager::AvailableOneTimePreKeyCount() const {
        std::shared_lock lock(*lock_);
        return one_time_pre_keys_.size();
    }

    uint32_t IdentityManager::GetCurrentSignedPreKeyId() const {
        std::shared_lock lock(*lock_);
        return signed_pre_key_.GetId();
    }

    std::vector<uint32_t> IdentityManager::GetRetainedSignedPreKeyIds() const {
        std::shared_lock lock(*lock_);
        std::vector<uint32_t> ids;
        ids.reserve(previous_signed_pre_keys_.size());
        for (const auto &spk : previous_signed_pre_keys_) {
            ids.push_back(spk.GetId());
        }
        return ids;
    }

    Result<proto::state::IdentityState, ProtocolFailure> IdentityManager::ToProtoState() const {
        std::shared_lock lock(*lock_);
        proto::state::IdentityState proto;
        proto.set_version(kStateFormatVersion);
        proto.set_owner_id(owner_id_);
        proto.set_identity_ed25519_public(identity_.GetPublicKey().data(), identity_.GetPublicKey().size());
        if (auto r = ExportSecret(identity_.GetSecretKeyHandle(), kEd25519SecretKeyBytes,
                                  proto.mutable_identity_ed25519_secret()); r.IsErr()) {
            return Result<proto::state::IdentityState, ProtocolFailure>::Err(r.UnwrapErr());
        }
        if (auto r = ExportSignedPreKey(signed_pre_key_, proto.mutable_current_signed_pre_key()); r.IsErr()) {
            return Result<proto::state::IdentityState, ProtocolFailure>::Err(r.UnwrapErr());
        }
        for (const auto &spk : previous_signed_pre_keys_) {
            if (auto r = ExportSignedPreKey(spk, proto.add_previous_signed_pre_keys()); r.IsErr()) {
                return Result<proto::state::IdentityState, ProtocolFailure>::Err(r.UnwrapErr());
            }
        }
        for (const auto &opk : one_time_pre_keys_) {
            auto *opk_proto = proto.add_one_time_pre_keys();
            opk_proto->set_id(opk.GetOneTimePreKeyId());
            opk_proto->set_public_key(opk.GetPublicKey().data(), opk.GetPublicKey().size());
            if (auto r = ExportSecret(opk.GetPrivateKeyHandle(), kX25519PrivateKeyBytes,
                                      opk_proto->mutable_secret_key()); r.IsErr()) {
                return Result<proto::state::IdentityState, ProtocolFailure>::Err(r.UnwrapErr());
            }
        }
        proto.set_next_one_time_pre_key_id(next_one_time_pre_key_id_);
        return Result<proto::state::IdentityState, ProtocolFailure>::Ok(std::move(proto));
    }

    Result<IdentityManager, ProtocolFailure> IdentityManager::FromProtoState(
        const proto::state::IdentityState &proto,
        const ProtocolConfig &config) {
        if (proto.version() != kStateFormatVersion) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Unsupported identity state version " + std::to_string(proto.version())));
        }
        if (proto.owner_id().empty()) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Stored identity has no owner id"));
        }
        if (auto config_check = config.Validate(); config_check.IsErr()) {
            return Result<IdentityManager, ProtocolFailure>::Err(config_check.UnwrapErr());
        }
        if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::KeyGeneration(init_result.UnwrapErr().message));
        }
        if (proto.identity_ed25519_public().size() != kEd25519PublicKeyBytes) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Invalid identity public key size in stored state"));
        }
        const auto &secret = proto.identity_ed25519_secret();
        // libsodium Ed25519 secret keys end with the public key.
        if (secret.size() != kEd25519SecretKeyBytes ||
            !std::equal(secret.end() - kEd25519PublicKeyBytes, secret.end(),
                        proto.identity_ed25519_public().begin())) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Stored identity secret does not match its public key"));
        }
        auto identity_secret = ImportSecret(secret, kEd25519SecretKeyBytes, "identity secret");
        if (identity_secret.IsErr()) {
            return Result<IdentityManager, ProtocolFailure>::Err(identity_secret.UnwrapErr());
        }
        std::vector<uint8_t> identity_public(proto.identity_ed25519_public().begin(),
                                             proto.identity_ed25519_public().end());
        if (!proto.has_current_signed_pre_key()) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Stored identity has no signed pre-key"));
        }
        auto current_spk = ImportSignedPreKey(proto.current_signed_pre_key(), identity_public);
        if (current_spk.IsErr()) {
            return Result<IdentityManager, ProtocolFailure>::Err(current_spk.UnwrapErr());
        }
        std::deque<SignedPreKeyPair> previous;
        for (const auto &spk_proto : proto.previous_signed_pre_keys()) {
            if (spk_proto.id() >= proto.current_signed_pre_key().id()) {
                return Result<IdentityManager, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Retained signed pre-key is newer than the current one"));
            }
            auto spk = ImportSignedPreKey(spk_proto, identity_public);
            if (spk.IsErr()) {
                return Result<IdentityManager, ProtocolFailure>::Err(spk.UnwrapErr());
            }
            previous.push_back(std::move(spk).Unwrap());
        }
        std::vector<OneTimePreKey> opks;
        opks.reserve(static_cast<size_t>(proto.one_time_pre_keys_size()));
        for (const auto &opk_proto : proto.one_time_pre_keys()) {
            if (opk_proto.id() >= proto.next_one_time_pre_key_id() ||
                opk_proto.public_key().size() != kX25519PublicKeyBytes) {
                return Result<IdentityManager, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Invalid one-time pre-key " + std::to_string(opk_proto.id()) +
                                            " in stored state"));
            }
            auto opk_secret = ImportSecret(opk_proto.secret_key(), kX25519PrivateKeyBytes,
                                           "one-time pre-key secret");
            if (opk_secret.IsErr()) {
                return Result<IdentityManager, ProtocolFailure>::Err(opk_secret.UnwrapErr());
            }
            opks.push_back(OneTimePreKey::Restore(
                opk_proto.id(),
                std::move(opk_secret).Unwrap(),
                std::vector<uint8_t>(opk_proto.public_key().begin(), opk_proto.public_key().end())));
        }
        IdentityManager manager(
            proto.owner_id(),
            config,
            IdentityKeyPair(std::move(identity_secret).Unwrap(), std::move(identity_public)),
            std::move(current_spk).Unwrap(),
            std::move(previous),
            std::move(opks),
            proto.next_one_time_pre_key_id());
        manager.EvictSignedPreKeysLocked();
        return Result<IdentityManager, ProtocolFailure>::Ok(std::move(manager));
    }
}
