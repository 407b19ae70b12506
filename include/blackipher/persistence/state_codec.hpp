#pragma once
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include "blackipher/configuration/protocol_config.hpp"
#include "blackipher/contacts/contact_book.hpp"
#include "blackipher/identity/identity_manager.hpp"
#include "blackipher/interfaces/i_state_key_provider.hpp"
#include "blackipher/models/bundles/public_key_bundle.hpp"
#include "blackipher/models/encrypted_message.hpp"
#include <span>
#include <vector>
#include <cstdint>
namespace blackipher::proto::state {
class PublicKeyBundle;
class EncryptedMessage;
}
namespace blackipher::protocol {
class SessionStore;
}
namespace blackipher::protocol::persistence {
using configuration::ProtocolConfig;
using contacts::ContactBook;
using identity::IdentityManager;
using interfaces::IStateKeyProvider;
using models::EncryptedMessage;
using models::PublicKeyBundle;

/**
 * @brief Protobuf encoding of bundles, messages and saved state.
 *
 * Identity state holds private keys and is only ever written sealed with
 * XChaCha20-Poly1305 under the key from an IStateKeyProvider, with the
 * owner id as associated data. Contacts and history hold public data and
 * are written as plain protobuf.
 */
class StateCodec {
public:
    [[nodiscard]] static proto::state::PublicKeyBundle ToProto(const PublicKeyBundle& bundle);
    [[nodiscard]] static Result<PublicKeyBundle, ProtocolFailure> FromProto(
        const proto::state::PublicKeyBundle& proto);

    [[nodiscard]] static proto::state::EncryptedMessage ToProto(const EncryptedMessage& message);
    [[nodiscard]] static Result<EncryptedMessage, ProtocolFailure> FromProto(
        const proto::state::EncryptedMessage& proto);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> EncodeBundle(const PublicKeyBundle& bundle);
    [[nodiscard]] static Result<PublicKeyBundle, ProtocolFailure> DecodeBundle(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> EncodeMessage(const EncryptedMessage& message);
    [[nodiscard]] static Result<EncryptedMessage, ProtocolFailure> DecodeMessage(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> SealIdentity(
        const IdentityManager& identity,
        IStateKeyProvider& key_provider);
    /// Decryption when the key or associated data is wrong, Decode when the
    /// sealed payload is not a valid identity.
    [[nodiscard]] static Result<IdentityManager, ProtocolFailure> OpenIdentity(
        std::span<const uint8_t> sealed,
        IStateKeyProvider& key_provider,
        const ProtocolConfig& config = ProtocolConfig::Default());

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> EncodeContactBook(const ContactBook& contacts);
    [[nodiscard]] static Result<ContactBook, ProtocolFailure> DecodeContactBook(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> EncodeHistory(const SessionStore& sessions);
    /// Replaces the session history of @p sessions with the decoded one.
    [[nodiscard]] static Result<Unit, ProtocolFailure> RestoreHistory(
        std::span<const uint8_t> bytes,
        SessionStore& sessions);
private:
    StateCodec() = delete;
};
}
