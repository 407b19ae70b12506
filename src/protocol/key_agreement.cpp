#include "blackipher/protocol/key_agreement.hpp"
#include "blackipher/protocol/constants.hpp"
#include "blackipher/core/constants.hpp"
#include "blackipher/crypto/hkdf.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/debug/key_logger.hpp"
#include <algorithm>
#include <cstdio>
#include <string>

namespace blackipher::protocol {
    using crypto::Hkdf;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    namespace {
        struct DhInput {
            const SecureMemoryHandle &secret;
            std::span<const uint8_t> peer_public;
        };

        size_t IkmSize(const bool with_one_time_pre_key) {
            return kX25519SharedSecretBytes * (with_one_time_pre_key ? 3 : 2);
        }

        Result<SharedSecret, ProtocolFailure> CombineAgreement(
            const DhInput &first,
            const DhInput *second,
            const std::string_view sender_id,
            const std::string_view receiver_id) {
            auto ikm_alloc = SecureMemoryHandle::Allocate(IkmSize(second != nullptr));
            if (ikm_alloc.IsErr()) {
                return Result<SharedSecret, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(ikm_alloc.UnwrapErr()));
            }
            auto ikm = std::move(ikm_alloc).Unwrap();
            auto fill_result = ikm.WithWriteAccess([&](std::span<uint8_t> buffer) -> Result<Unit, ProtocolFailure> {
                std::fill_n(buffer.begin(), kX25519SharedSecretBytes, CryptoHashConstants::FILL_BYTE);
                auto dh1 = SodiumInterop::ComputeX25519SharedSecret(
                    first.secret, first.peer_public,
                    buffer.subspan(kX25519SharedSecretBytes, kX25519SharedSecretBytes));
                if (dh1.IsErr() || second == nullptr) {
                    return dh1;
                }
                return SodiumInterop::ComputeX25519SharedSecret(
                    second->secret, second->peer_public,
                    buffer.subspan(2 * kX25519SharedSecretBytes, kX25519SharedSecretBytes));
            });
            if (fill_result.IsErr()) {
                return Result<SharedSecret, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(fill_result.UnwrapErr()));
            }
            if (auto dh = std::move(fill_result).Unwrap(); dh.IsErr()) {
                return Result<SharedSecret, ProtocolFailure>::Err(std::move(dh).UnwrapErr());
            }
            const auto info = KeyAgreement::BuildAgreementInfo(sender_id, receiver_id);
            auto derive_result = ikm.WithReadAccess([&info](std::span<const uint8_t> material) {
                return Hkdf::DeriveKeyHandle(material, kSharedSecretBytes, {}, info);
            });
            if (derive_result.IsErr()) {
                return Result<SharedSecret, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
            }
            auto derived = std::move(derive_result).Unwrap();
            if (derived.IsErr()) {
                return Result<SharedSecret, ProtocolFailure>::Err(std::move(derived).UnwrapErr());
            }
            return Result<SharedSecret, ProtocolFailure>::Ok(SharedSecret(std::move(derived).Unwrap()));
        }
    }

    std::vector<uint8_t> KeyAgreement::BuildAgreementInfo(
        const std::string_view sender_id,
        const std::string_view receiver_id) {
        std::vector<uint8_t> info;
        info.reserve(kAgreementInfo.size() + sender_id.size() + 1 + receiver_id.size());
        info.insert(info.end(), kAgreementInfo.begin(), kAgreementInfo.end());
        info.insert(info.end(), sender_id.begin(), sender_id.end());
        info.push_back(0x00);
        info.insert(info.end(), receiver_id.begin(), receiver_id.end());
        return info;
    }

    Result<Unit, ProtocolFailure> KeyAgreement::VerifyPeerBundle(const ContactRecord &peer) {
        const auto &bundle = peer.bundle;
        if (bundle.GetSignedPreKeyPublic().size() != kX25519PublicKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::PeerPubKey("Signed pre-key of '" + peer.peer_id + "' has the wrong size"));
        }
        if (!SodiumInterop::VerifyDetached(
                bundle.GetIdentityEd25519Public(),
                bundle.GetSignedPreKeyPublic(),
                bundle.GetSignedPreKeySignature())) {
            fprintf(stderr, "[KEY-AGREEMENT] Signed pre-key %u of '%s' failed verification\n",
                    bundle.GetSignedPreKeyId(), peer.peer_id.c_str());
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SignatureVerification(std::string(ErrorMessages::SIGNED_PRE_KEY_FAILED)));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<AgreementOutcome, ProtocolFailure> KeyAgreement::Initiate(
        const std::string_view local_owner_id,
        const ContactRecord &peer,
        EphemeralKeyPair &&ephemeral,
        const std::optional<OneTimePreKeyPublic> &one_time_pre_key) {
        // Owned here so the scalar is freed on every return below.
        const EphemeralKeyPair consumed = std::move(ephemeral);
        if (consumed.IsConsumed()) {
            return Result<AgreementOutcome, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Ephemeral key pair was already used"));
        }
        const auto &bundle = peer.bundle;
        if (auto verified = VerifyPeerBundle(peer); verified.IsErr()) {
            return Result<AgreementOutcome, ProtocolFailure>::Err(verified.UnwrapErr());
        }
        const DhInput dh1{consumed.GetSecretKeyHandle(), bundle.GetSignedPreKeyPublic()};
        std::optional<DhInput> dh2;
        if (one_time_pre_key.has_value()) {
            dh2.emplace(DhInput{consumed.GetSecretKeyHandle(), one_time_pre_key->GetPublicKeySpan()});
        }
        auto secret_result = CombineAgreement(
            dh1, dh2.has_value() ? &*dh2 : nullptr, local_owner_id, peer.peer_id);
        if (secret_result.IsErr()) {
            fprintf(stderr, "[KEY-AGREEMENT] Initiate with '%s' failed: %s\n",
                    peer.peer_id.c_str(), secret_result.UnwrapErr().message.c_str());
            return Result<AgreementOutcome, ProtocolFailure>::Err(secret_result.UnwrapErr());
        }
        std::optional<uint32_t> opk_id;
        if (one_time_pre_key.has_value()) {
            opk_id = one_time_pre_key->GetOneTimePreKeyId();
        }
        debug::LogAgreement(debug::Side::Initiator, consumed.GetPublicKey(), bundle.GetSignedPreKeyId(),
                            opk_id.has_value(), opk_id.value_or(0), IkmSize(opk_id.has_value()));
        return Result<AgreementOutcome, ProtocolFailure>::Ok(AgreementOutcome{
            std::move(secret_result).Unwrap(),
            consumed.GetPublicKey(),
            bundle.GetSignedPreKeyId(),
            opk_id,
            kX25519SharedSecretBytes
        });
    }

    Result<AgreementOutcome, ProtocolFailure> KeyAgreement::Respond(
        const std::string_view local_owner_id,
        const SignedPreKeyPair &signed_pre_key,
        const std::span<const uint8_t> peer_ephemeral_public,
        const OneTimePreKey *one_time_pre_key,
        const std::string_view sender_id) {
        const DhInput dh1{signed_pre_key.GetSecretKeyHandle(), peer_ephemeral_public};
        std::optional<DhInput> dh2;
        if (one_time_pre_key != nullptr) {
            dh2.emplace(DhInput{one_time_pre_key->GetPrivateKeyHandle(), peer_ephemeral_public});
        }
        auto secret_result = CombineAgreement(
            dh1, dh2.has_value() ? &*dh2 : nullptr, sender_id, local_owner_id);
        if (secret_result.IsErr()) {
            fprintf(stderr, "[KEY-AGREEMENT] Respond to '%.*s' failed: %s\n",
                    static_cast<int>(sender_id.size()), sender_id.data(),
                    secret_result.UnwrapErr().message.c_str());
            return Result<AgreementOutcome, ProtocolFailure>::Err(secret_result.UnwrapErr());
        }
        std::optional<uint32_t> opk_id;
        if (one_time_pre_key != nullptr) {
            opk_id = one_time_pre_key->GetOneTimePreKeyId();
        }
        debug::LogAgreement(debug::Side::Responder, peer_ephemeral_public, signed_pre_key.GetId(),
                            opk_id.has_value(), opk_id.value_or(0), IkmSize(opk_id.has_value()));
        return Result<AgreementOutcome, ProtocolFailure>::Ok(AgreementOutcome{
            std::move(secret_result).Unwrap(),
            std::vector<uint8_t>(peer_ephemeral_public.begin(), peer_ephemeral_public.end()),
            signed_pre_key.GetId(),
            opk_id,
            kX25519SharedSecretBytes
        });
    }
}
