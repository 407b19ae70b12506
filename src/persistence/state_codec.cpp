#include "blackipher/persistence/state_codec.hpp"
#include "blackipher/protocol/session_store.hpp"
#include "blackipher/protocol/constants.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/crypto/xchacha20_poly1305.hpp"
#include "blackipher/state.pb.h"
#include <cstdio>

namespace blackipher::protocol::persistence {
    using crypto::SodiumInterop;
    using crypto::XChaCha20Poly1305;
    using models::OneTimePreKeyPublic;

    namespace {
        std::span<const uint8_t> AsBytes(const std::string &value) {
            return {reinterpret_cast<const uint8_t *>(value.data()), value.size()};
        }

        std::vector<uint8_t> ToVector(const std::string &value) {
            return {value.begin(), value.end()};
        }

        void WipeString(std::string &value) {
            SodiumInterop::SecureWipe(std::span(reinterpret_cast<uint8_t *>(value.data()), value.size()));
            value.clear();
        }

        void WipeIdentityState(proto::state::IdentityState &state) {
            WipeString(*state.mutable_identity_ed25519_secret());
            WipeString(*state.mutable_current_signed_pre_key()->mutable_secret_key());
            for (auto &spk : *state.mutable_previous_signed_pre_keys()) {
                WipeString(*spk.mutable_secret_key());
            }
            for (auto &opk : *state.mutable_one_time_pre_keys()) {
                WipeString(*opk.mutable_secret_key());
            }
        }

        template<typename Message>
        Result<std::vector<uint8_t>, ProtocolFailure> Serialize(const Message &message, const char *what) {
            std::string buffer;
            if (!message.SerializeToString(&buffer)) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::Encode(std::string("Failed to serialize ") + what));
            }
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(ToVector(buffer));
        }

        template<typename Message>
        Result<Message, ProtocolFailure> Parse(const std::span<const uint8_t> bytes, const char *what) {
            if (bytes.size() > kMaxProtobufMessageSize) {
                return Result<Message, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(std::string(what) + " is too large"));
            }
            Message message;
            if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
                return Result<Message, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(std::string("Failed to parse ") + what));
            }
            return Result<Message, ProtocolFailure>::Ok(std::move(message));
        }

        Result<crypto::SecureMemoryHandle, ProtocolFailure> FetchStateKey(IStateKeyProvider &key_provider) {
            auto key_result = key_provider.GetStateEncryptionKey();
            if (key_result.IsErr()) {
                return key_result;
            }
            if (key_result.Unwrap().Size() != kStateKeyBytes) {
                return Result<crypto::SecureMemoryHandle, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("State key must be " + std::to_string(kStateKeyBytes) + " bytes"));
            }
            return key_result;
        }
    }

    proto::state::PublicKeyBundle StateCodec::ToProto(const PublicKeyBundle &bundle) {
        proto::state::PublicKeyBundle proto;
        proto.set_owner_id(bundle.GetOwnerId());
        proto.set_identity_ed25519_public(bundle.GetIdentityEd25519Public().data(),
                                          bundle.GetIdentityEd25519Public().size());
        proto.set_signed_pre_key_id(bundle.GetSignedPreKeyId());
        proto.set_signed_pre_key_public(bundle.GetSignedPreKeyPublic().data(),
                                        bundle.GetSignedPreKeyPublic().size());
        proto.set_signed_pre_key_signature(bundle.GetSignedPreKeySignature().data(),
                                           bundle.GetSignedPreKeySignature().size());
        for (const auto &opk : bundle.GetOneTimePreKeys()) {
            auto *opk_proto = proto.add_one_time_pre_keys();
            opk_proto->set_id(opk.GetOneTimePreKeyId());
            opk_proto->set_public_key(opk.GetPublicKey().data(), opk.GetPublicKey().size());
        }
        return proto;
    }

    Result<PublicKeyBundle, ProtocolFailure> StateCodec::FromProto(const proto::state::PublicKeyBundle &proto) {
        if (proto.owner_id().empty()) {
            return Result<PublicKeyBundle, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Bundle has no owner id"));
        }
        if (proto.identity_ed25519_public().size() != kEd25519PublicKeyBytes ||
            proto.signed_pre_key_public().size() != kX25519PublicKeyBytes ||
            proto.signed_pre_key_signature().size() != kEd25519SignatureBytes) {
            return Result<PublicKeyBundle, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Bundle of '" + proto.owner_id() + "' has wrong key sizes"));
        }
        std::vector<OneTimePreKeyPublic> opks;
        opks.reserve(static_cast<size_t>(proto.one_time_pre_keys_size()));
        for (const auto &opk : proto.one_time_pre_keys()) {
            if (opk.public_key().size() != kX25519PublicKeyBytes) {
                return Result<PublicKeyBundle, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("One-time pre-key " + std::to_string(opk.id()) + " has the wrong size"));
            }
            opks.emplace_back(opk.id(), ToVector(opk.public_key()));
        }
        return Result<PublicKeyBundle, ProtocolFailure>::Ok(PublicKeyBundle(
            proto.owner_id(),
            ToVector(proto.identity_ed25519_public()),
            proto.signed_pre_key_id(),
            ToVector(proto.signed_pre_key_public()),
            ToVector(proto.signed_pre_key_signature()),
            std::move(opks)));
    }

    proto::state::EncryptedMessage StateCodec::ToProto(const EncryptedMessage &message) {
        proto::state::EncryptedMessage proto;
        proto.set_sender_id(message.GetSenderId());
        proto.set_receiver_id(message.GetReceiverId());
        proto.set_ephemeral_public(message.GetEphemeralPublic().data(), message.GetEphemeralPublic().size());
        proto.set_signed_pre_key_id(message.GetSignedPreKeyId());
        if (const auto opk_id = message.GetOneTimePreKeyId(); opk_id.has_value()) {
            proto.set_one_time_pre_key_id(*opk_id);
        }
        proto.set_nonce(message.GetNonce().data(), message.GetNonce().size());
        proto.set_ciphertext(message.GetCiphertext().data(), message.GetCiphertext().size());
        return proto;
    }

    Result<EncryptedMessage, ProtocolFailure> StateCodec::FromProto(const proto::state::EncryptedMessage &proto) {
        if (proto.sender_id().empty() || proto.receiver_id().empty()) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Message is missing sender or receiver id"));
        }
        if (proto.ephemeral_public().size() != kX25519PublicKeyBytes) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Message ephemeral key has the wrong size"));
        }
        std::optional<uint32_t> opk_id;
        if (proto.has_one_time_pre_key_id()) {
            opk_id = proto.one_time_pre_key_id();
        }
        return Result<EncryptedMessage, ProtocolFailure>::Ok(EncryptedMessage(
            proto.sender_id(),
            proto.receiver_id(),
            ToVector(proto.ephemeral_public()),
            proto.signed_pre_key_id(),
            opk_id,
            ToVector(proto.nonce()),
            ToVector(proto.ciphertext())));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> StateCodec::EncodeBundle(const PublicKeyBundle &bundle) {
        return Serialize(ToProto(bundle), "public key bundle");
    }

    Result<PublicKeyBundle, ProtocolFailure> StateCodec::DecodeBundle(const std::span<const uint8_t> bytes) {
        auto parsed = Parse<proto::state::PublicKeyBundle>(bytes, "public key bundle");
        if (parsed.IsErr()) {
            return Result<PublicKeyBundle, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        return FromProto(parsed.Unwrap());
    }

    Result<std::vector<uint8_t>, ProtocolFailure> StateCodec::EncodeMessage(const EncryptedMessage &message) {
        return Serialize(ToProto(message), "encrypted message");
    }

    Result<EncryptedMessage, ProtocolFailure> StateCodec::DecodeMessage(const std::span<const uint8_t> bytes) {
        auto parsed = Parse<proto::state::EncryptedMessage>(bytes, "encrypted message");
        if (parsed.IsErr()) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        return FromProto(parsed.Unwrap());
    }

    Result<std::vector<uint8_t>, ProtocolFailure> StateCodec::SealIdentity(
        const IdentityManager &identity,
        IStateKeyProvider &key_provider) {
        auto key_result = FetchStateKey(key_provider);
        if (key_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(key_result.UnwrapErr());
        }
        const auto state_key = std::move(key_result).Unwrap();
        auto state_result = identity.ToProtoState();
        if (state_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(state_result.UnwrapErr());
        }
        auto state = std::move(state_result).Unwrap();
        std::string plaintext;
        const bool serialized = state.SerializeToString(&plaintext);
        WipeIdentityState(state);
        if (!serialized) {
            WipeString(plaintext);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Failed to serialize identity state"));
        }
        auto nonce = XChaCha20Poly1305::GenerateNonce();
        auto seal_result = state_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return XChaCha20Poly1305::Encrypt(key, nonce, AsBytes(plaintext), AsBytes(identity.GetOwnerId()));
        });
        WipeString(plaintext);
        if (seal_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(seal_result.UnwrapErr()));
        }
        auto ciphertext_result = std::move(seal_result).Unwrap();
        if (ciphertext_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(ciphertext_result.UnwrapErr());
        }
        const auto ciphertext = std::move(ciphertext_result).Unwrap();
        proto::state::SealedIdentity sealed;
        sealed.set_version(kStateFormatVersion);
        sealed.set_owner_id(identity.GetOwnerId());
        sealed.set_nonce(nonce.data(), nonce.size());
        sealed.set_ciphertext(ciphertext.data(), ciphertext.size());
        return Serialize(sealed, "sealed identity");
    }

    Result<IdentityManager, ProtocolFailure> StateCodec::OpenIdentity(
        const std::span<const uint8_t> sealed,
        IStateKeyProvider &key_provider,
        const ProtocolConfig &config) {
        auto parsed = Parse<proto::state::SealedIdentity>(sealed, "sealed identity");
        if (parsed.IsErr()) {
            return Result<IdentityManager, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        const auto &envelope = parsed.Unwrap();
        if (envelope.version() != kStateFormatVersion) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Unsupported sealed identity version " + std::to_string(envelope.version())));
        }
        if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::KeyGeneration(init_result.UnwrapErr().message));
        }
        auto key_result = FetchStateKey(key_provider);
        if (key_result.IsErr()) {
            return Result<IdentityManager, ProtocolFailure>::Err(key_result.UnwrapErr());
        }
        const auto state_key = std::move(key_result).Unwrap();
        auto open_result = state_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return XChaCha20Poly1305::Decrypt(
                key, AsBytes(envelope.nonce()), AsBytes(envelope.ciphertext()), AsBytes(envelope.owner_id()));
        });
        if (open_result.IsErr()) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(open_result.UnwrapErr()));
        }
        auto plaintext_result = std::move(open_result).Unwrap();
        if (plaintext_result.IsErr()) {
            fprintf(stderr, "[PERSISTENCE] Sealed identity of '%s' failed authentication\n",
                    envelope.owner_id().c_str());
            return Result<IdentityManager, ProtocolFailure>::Err(plaintext_result.UnwrapErr());
        }
        auto plaintext = std::move(plaintext_result).Unwrap();
        proto::state::IdentityState state;
        const bool parsed_state = state.ParseFromArray(plaintext.data(), static_cast<int>(plaintext.size()));
        SodiumInterop::SecureWipe(std::span(plaintext));
        if (!parsed_state) {
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Sealed identity does not contain an identity state"));
        }
        if (state.owner_id() != envelope.owner_id()) {
            WipeIdentityState(state);
            return Result<IdentityManager, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Sealed identity owner does not match its contents"));
        }
        auto identity = IdentityManager::FromProtoState(state, config);
        WipeIdentityState(state);
        return identity;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> StateCodec::EncodeContactBook(const ContactBook &contacts) {
        proto::state::ContactBookState proto;
        proto.set_version(kStateFormatVersion);
        for (const auto &peer_id : contacts.ListPeerIds()) {
            // A peer removed between listing and lookup is skipped.
            auto record = contacts.Get(peer_id);
            if (!record.has_value()) {
                continue;
            }
            auto *entry = proto.add_contacts();
            entry->set_peer_id(record->peer_id);
            *entry->mutable_bundle() = ToProto(record->bundle);
        }
        return Serialize(proto, "contact book");
    }

    Result<ContactBook, ProtocolFailure> StateCodec::DecodeContactBook(const std::span<const uint8_t> bytes) {
        auto parsed = Parse<proto::state::ContactBookState>(bytes, "contact book");
        if (parsed.IsErr()) {
            return Result<ContactBook, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        const auto &proto = parsed.Unwrap();
        if (proto.version() != kStateFormatVersion) {
            return Result<ContactBook, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Unsupported contact book version " + std::to_string(proto.version())));
        }
        ContactBook contacts;
        for (const auto &entry : proto.contacts()) {
            auto bundle = FromProto(entry.bundle());
            if (bundle.IsErr()) {
                return Result<ContactBook, ProtocolFailure>::Err(bundle.UnwrapErr());
            }
            if (auto learned = contacts.LearnBundle(entry.peer_id(), std::move(bundle).Unwrap()); learned.IsErr()) {
                return Result<ContactBook, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(learned.UnwrapErr().message));
            }
        }
        return Result<ContactBook, ProtocolFailure>::Ok(std::move(contacts));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> StateCodec::EncodeHistory(const SessionStore &sessions) {
        auto state = sessions.ToProtoState();
        if (state.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(state.UnwrapErr());
        }
        return Serialize(state.Unwrap(), "session history");
    }

    Result<Unit, ProtocolFailure> StateCodec::RestoreHistory(
        const std::span<const uint8_t> bytes,
        SessionStore &sessions) {
        auto parsed = Parse<proto::state::SessionHistoryState>(bytes, "session history");
        if (parsed.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        return sessions.RestoreHistory(parsed.Unwrap());
    }
}
