#pragma once
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include "blackipher/contacts/contact_book.hpp"
#include "blackipher/identity/identity_manager.hpp"
#include "blackipher/interfaces/i_trace_sink.hpp"
#include "blackipher/models/encrypted_message.hpp"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
namespace blackipher::proto::state {
class SessionHistoryState;
}
namespace blackipher::protocol {
using contacts::ContactBook;
using identity::IdentityManager;
using interfaces::ITraceSink;
using models::EncryptedMessage;

/**
 * @brief Message exchange for one local identity.
 *
 * Every Send runs a fresh agreement against the contact's stored bundle
 * with a new ephemeral key, drawing one of the contact's one-time pre-keys
 * while any remain. The bundle is verified before a one-time pre-key is
 * reserved. Every Receive runs the mirrored agreement and accepts only
 * senders present in the contact book (UnknownContact otherwise). Successful
 * messages in either direction are appended to the per-contact history.
 *
 * The identity and contact book are borrowed and must outlive the store.
 * The trace sink, when set, receives one event per Send or Receive.
 */
class SessionStore {
public:
    SessionStore(
        IdentityManager& identity,
        ContactBook& contacts,
        std::shared_ptr<ITraceSink> trace_sink = nullptr);

    [[nodiscard]] Result<EncryptedMessage, ProtocolFailure> Send(
        const std::string& contact_id,
        std::string_view plaintext);

    [[nodiscard]] Result<std::string, ProtocolFailure> Receive(const EncryptedMessage& message);

    [[nodiscard]] std::vector<EncryptedMessage> History(const std::string& contact_id) const;
    [[nodiscard]] std::optional<std::vector<uint8_t>> LastEphemeralPublic(const std::string& contact_id) const;
    [[nodiscard]] std::vector<std::string> ContactIds() const;
    bool Clear(const std::string& contact_id);
    void ClearAll();

    [[nodiscard]] const std::string& GetOwnerId() const noexcept {
        return identity_.GetOwnerId();
    }

    [[nodiscard]] Result<proto::state::SessionHistoryState, ProtocolFailure> ToProtoState() const;
    [[nodiscard]] Result<Unit, ProtocolFailure> RestoreHistory(const proto::state::SessionHistoryState& state);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;
private:
    struct ContactHistory {
        std::vector<EncryptedMessage> messages;
        std::vector<uint8_t> last_ephemeral_public;
    };
    void AppendLocked(const std::string& contact_id, const EncryptedMessage& message);
    void ReportFailure(bool sending, const std::string& peer_id, const ProtocolFailure& failure) const;
    IdentityManager& identity_;
    ContactBook& contacts_;
    std::shared_ptr<ITraceSink> trace_sink_;
    std::map<std::string, ContactHistory> histories_;
    mutable std::unique_ptr<std::shared_mutex> lock_;
};
}
