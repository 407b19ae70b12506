#include "blackipher/protocol/session_store.hpp"
#include "blackipher/protocol/key_agreement.hpp"
#include "blackipher/protocol/message_cipher.hpp"
#include "blackipher/protocol/constants.hpp"
#include "blackipher/persistence/state_codec.hpp"
#include "blackipher/trace/trace_events.hpp"
#include "blackipher/state.pb.h"

namespace blackipher::protocol {
    using persistence::StateCodec;

    namespace {
        bool IsValidUtf8(const std::span<const uint8_t> bytes) {
            size_t i = 0;
            while (i < bytes.size()) {
                const uint8_t lead = bytes[i];
                size_t length;
                uint32_t code_point;
                if (lead < 0x80) {
                    ++i;
                    continue;
                }
                if ((lead & 0xE0) == 0xC0) {
                    length = 2;
                    code_point = lead & 0x1F;
                } else if ((lead & 0xF0) == 0xE0) {
                    length = 3;
                    code_point = lead & 0x0F;
                } else if ((lead & 0xF8) == 0xF0) {
                    length = 4;
                    code_point = lead & 0x07;
                } else {
                    return false;
                }
                if (i + length > bytes.size()) {
                    return false;
                }
                for (size_t k = 1; k < length; ++k) {
                    if ((bytes[i + k] & 0xC0) != 0x80) {
                        return false;
                    }
                    code_point = (code_point << 6) | (bytes[i + k] & 0x3F);
                }
                // Overlong forms, surrogates and values past U+10FFFF.
                if ((length == 2 && code_point < 0x80) ||
                    (length == 3 && code_point < 0x800) ||
                    (length == 4 && code_point < 0x10000) ||
                    (code_point >= 0xD800 && code_point <= 0xDFFF) ||
                    code_point > 0x10FFFF) {
                    return false;
                }
                i += length;
            }
            return true;
        }
    }

    SessionStore::SessionStore(
        IdentityManager &identity,
        ContactBook &contacts,
        std::shared_ptr<ITraceSink> trace_sink)
        : identity_(identity)
          , contacts_(contacts)
          , trace_sink_(std::move(trace_sink))
          , lock_(std::make_unique<std::shared_mutex>()) {
    }

    void SessionStore::ReportFailure(
        const bool sending,
        const std::string &peer_id,
        const ProtocolFailure &failure) const {
        if (!trace_sink_) {
            return;
        }
        trace_sink_->OnExchangeFailed(trace::FailureTrace{
            sending ? trace::TraceDirection::Send : trace::TraceDirection::Receive,
            identity_.GetOwnerId(),
            peer_id,
            failure.type,
            failure.message
        });
    }

    void SessionStore::AppendLocked(const std::string &contact_id, const EncryptedMessage &message) {
        auto &history = histories_[contact_id];
        history.messages.push_back(message);
        history.last_ephemeral_public = message.GetEphemeralPublic();
    }

    Result<EncryptedMessage, ProtocolFailure> SessionStore::Send(
        const std::string &contact_id,
        const std::string_view plaintext) {
        const auto fail = [&](ProtocolFailure failure) {
            ReportFailure(true, contact_id, failure);
            return Result<EncryptedMessage, ProtocolFailure>::Err(std::move(failure));
        };
        const auto &config = identity_.GetConfig();
        if (plaintext.size() > config.GetMaxPlaintextBytes()) {
            return fail(ProtocolFailure::InvalidInput(
                "Plaintext of " + std::to_string(plaintext.size()) + " bytes exceeds the limit of " +
                std::to_string(config.GetMaxPlaintextBytes())));
        }
        auto record = contacts_.Get(contact_id);
        if (!record.has_value()) {
            return fail(ProtocolFailure::UnknownContact("No bundle learned for '" + contact_id + "'"));
        }
        if (auto verified = KeyAgreement::VerifyPeerBundle(*record); verified.IsErr()) {
            return fail(verified.UnwrapErr());
        }
        auto ephemeral_result = EphemeralKeyPair::Generate();
        if (ephemeral_result.IsErr()) {
            return fail(ephemeral_result.UnwrapErr());
        }
        std::optional<OneTimePreKeyPublic> one_time_pre_key;
        if (config.UsesOneTimePreKeys()) {
            one_time_pre_key = contacts_.ReserveOneTimePreKey(contact_id);
        }
        // An unusable peer key is discarded; a local failure hands the reserved key back.
        const auto release_unused = [&](const ProtocolFailure &failure) {
            if (one_time_pre_key.has_value() && !failure.Is(ProtocolFailureType::PeerPubKey)) {
                contacts_.ReleaseOneTimePreKey(contact_id, record->bundle.GetSignedPreKeyId(),
                                               *one_time_pre_key);
            }
        };
        auto agreement_result = KeyAgreement::Initiate(
            identity_.GetOwnerId(), *record, std::move(ephemeral_result).Unwrap(), one_time_pre_key);
        if (agreement_result.IsErr()) {
            release_unused(agreement_result.UnwrapErr());
            return fail(agreement_result.UnwrapErr());
        }
        auto outcome = std::move(agreement_result).Unwrap();
        const auto *text = reinterpret_cast<const uint8_t *>(plaintext.data());
        auto seal_result = MessageCipher::Encrypt(
            outcome.shared_secret,
            MessageHeader{
                identity_.GetOwnerId(),
                contact_id,
                outcome.ephemeral_public,
                outcome.signed_pre_key_id,
                outcome.one_time_pre_key_id
            },
            std::span<const uint8_t>(text, plaintext.size()));
        if (seal_result.IsErr()) {
            release_unused(seal_result.UnwrapErr());
            return fail(seal_result.UnwrapErr());
        }
        auto message = std::move(seal_result).Unwrap();
        {
            std::unique_lock lock(*lock_);
            AppendLocked(contact_id, message);
        }
        if (trace_sink_) {
            trace_sink_->OnMessageSent(trace::SendTrace{
                identity_.GetOwnerId(),
                contact_id,
                true,
                message.GetEphemeralPublic(),
                outcome.dh_output_bytes,
                message.GetSignedPreKeyId(),
                message.GetOneTimePreKeyId(),
                message.GetNonce(),
                message.GetCiphertext()
            });
        }
        return Result<EncryptedMessage, ProtocolFailure>::Ok(std::move(message));
    }

    Result<std::string, ProtocolFailure> SessionStore::Receive(const EncryptedMessage &message) {
        const std::string &sender_id = message.GetSenderId();
        const auto fail = [&](ProtocolFailure failure) {
            ReportFailure(false, sender_id, failure);
            return Result<std::string, ProtocolFailure>::Err(std::move(failure));
        };
        if (message.GetReceiverId() != identity_.GetOwnerId()) {
            return fail(ProtocolFailure::InvalidInput(
                "Message addressed to '" + message.GetReceiverId() + "', not '" + identity_.GetOwnerId() + "'"));
        }
        if (sender_id.empty()) {
            return fail(ProtocolFailure::InvalidInput("Message has no sender"));
        }
        if (!contacts_.Contains(sender_id)) {
            return fail(ProtocolFailure::UnknownContact("No bundle learned for sender '" + sender_id + "'"));
        }
        // A missing one-time pre-key falls back to signed-pre-key-only
        // agreement, which then fails authentication.
        std::optional<OneTimePreKey> one_time_pre_key;
        if (const auto opk_id = message.GetOneTimePreKeyId(); opk_id.has_value()) {
            one_time_pre_key = identity_.TakeOneTimePreKey(*opk_id);
        }
        auto agreement_result = identity_.WithSignedPreKey(
            message.GetSignedPreKeyId(),
            [&](const SignedPreKeyPair &signed_pre_key) {
                return KeyAgreement::Respond(
                    identity_.GetOwnerId(),
                    signed_pre_key,
                    message.GetEphemeralPublic(),
                    one_time_pre_key.has_value() ? &*one_time_pre_key : nullptr,
                    sender_id);
            });
        if (agreement_result.IsErr()) {
            return fail(agreement_result.UnwrapErr());
        }
        auto outcome = std::move(agreement_result).Unwrap();
        auto open_result = MessageCipher::Decrypt(outcome.shared_secret, message);
        if (open_result.IsErr()) {
            return fail(open_result.UnwrapErr());
        }
        const auto plaintext_bytes = std::move(open_result).Unwrap();
        if (!IsValidUtf8(plaintext_bytes)) {
            return fail(ProtocolFailure::Decode("Plaintext is not valid UTF-8"));
        }
        std::string plaintext(plaintext_bytes.begin(), plaintext_bytes.end());
        {
            std::unique_lock lock(*lock_);
            AppendLocked(sender_id, message);
        }
        if (trace_sink_) {
            trace_sink_->OnMessageReceived(trace::ReceiveTrace{
                identity_.GetOwnerId(),
                sender_id,
                outcome.dh_output_bytes,
                message.GetSignedPreKeyId(),
                message.GetOneTimePreKeyId(),
                message.GetNonce(),
                message.GetCiphertext(),
                plaintext
            });
        }
        return Result<std::string, ProtocolFailure>::Ok(std::move(plaintext));
    }

    std::vector<EncryptedMessage> SessionStore::History(const std::string &contact_id) const {
        std::shared_lock lock(*lock_);
        const auto it = histories_.find(contact_id);
        if (it == histories_.end()) {
            return {};
        }
        return it->second.messages;
    }

    std::optional<std::vector<uint8_t>> SessionStore::LastEphemeralPublic(const std::string &contact_id) const {
        std::shared_lock lock(*lock_);
        const auto it = histories_.find(contact_id);
        if (it == histories_.end() || it->second.last_ephemeral_public.empty()) {
            return std::nullopt;
        }
        return it->second.last_ephemeral_public;
    }

    std::vector<std::string> SessionStore::ContactIds() const {
        std::shared_lock lock(*lock_);
        std::vector<std::string> ids;
        ids.reserve(histories_.size());
        for (const auto &[contact_id, history] : histories_) {
            ids.push_back(contact_id);
        }
        return ids;
    }

    bool SessionStore::Clear(const std::string &contact_id) {
        std::unique_lock lock(*lock_);
        return histories_.erase(contact_id) > 0;
    }

    void SessionStore::ClearAll() {
        std::unique_lock lock(*lock_);
        histories_.clear();
    }

    Result<proto::state::SessionHistoryState, ProtocolFailure> SessionStore::ToProtoState() const {
        std::shared_lock lock(*lock_);
        proto::state::SessionHistoryState proto;
        proto.set_version(kStateFormatVersion);
        proto.set_owner_id(identity_.GetOwnerId());
        for (const auto &[contact_id, history] : histories_) {
            auto *contact = proto.add_contacts();
            contact->set_contact_id(contact_id);
            contact->set_last_ephemeral_public(history.last_ephemeral_public.data(),
                                               history.last_ephemeral_public.size());
            for (const auto &message : history.messages) {
                *contact->add_messages() = StateCodec::ToProto(message);
            }
        }
        return Result<proto::state::SessionHistoryState, ProtocolFailure>::Ok(std::move(proto));
    }

    Result<Unit, ProtocolFailure> SessionStore::RestoreHistory(const proto::state::SessionHistoryState &state) {
        if (state.version() != kStateFormatVersion) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Unsupported history state version " + std::to_string(state.version())));
        }
        if (state.owner_id() != identity_.GetOwnerId()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                "History belongs to '" + state.owner_id() + "', not '" + identity_.GetOwnerId() + "'"));
        }
        std::map<std::string, ContactHistory> restored;
        for (const auto &contact : state.contacts()) {
            if (contact.contact_id().empty()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("History entry has no contact id"));
            }
            auto &history = restored[contact.contact_id()];
            history.last_ephemeral_public.assign(contact.last_ephemeral_public().begin(),
                                                 contact.last_ephemeral_public().end());
            for (const auto &message_proto : contact.messages()) {
                auto message_result = StateCodec::FromProto(message_proto);
                if (message_result.IsErr()) {
                    return Result<Unit, ProtocolFailure>::Err(message_result.UnwrapErr());
                }
                history.messages.push_back(std::move(message_result).Unwrap());
            }
        }
        std::unique_lock lock(*lock_);
        histories_ = std::move(restored);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
