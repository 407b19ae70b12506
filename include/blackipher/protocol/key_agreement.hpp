#pragma once
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include "blackipher/models/contact_record.hpp"
#include "blackipher/models/key_materials/signed_pre_key_pair.hpp"
#include "blackipher/models/keys/ephemeral_key_pair.hpp"
#include "blackipher/models/keys/one_time_pre_key.hpp"
#include "blackipher/models/keys/one_time_pre_key_public.hpp"
#include "blackipher/models/keys/shared_secret.hpp"
#include <optional>
#include <span>
#include <string_view>
#include <vector>
#include <cstdint>
namespace blackipher::protocol {
using models::ContactRecord;
using models::EphemeralKeyPair;
using models::OneTimePreKey;
using models::OneTimePreKeyPublic;
using models::SharedSecret;
using models::SignedPreKeyPair;

/// What one side learned from an agreement. Only the secret is private.
struct AgreementOutcome {
    SharedSecret shared_secret;
    std::vector<uint8_t> ephemeral_public;
    uint32_t signed_pre_key_id;
    std::optional<uint32_t> one_time_pre_key_id;
    size_t dh_output_bytes;
};

/**
 * @brief Single-round pre-key agreement between a sender and a receiver.
 *
 * Input key material is 32 bytes of 0xFF followed by
 * DH1 = X25519(ephemeral, receiver signed pre-key) and, when a one-time
 * pre-key is in play, DH2 = X25519(ephemeral, receiver one-time pre-key).
 * HKDF-SHA256 with an empty salt and info
 * "BlacKipher-Agreement-v1" || sender || 0x00 || receiver
 * turns it into the 32-byte shared secret.
 *
 * All intermediate values live in secure memory and are released before
 * either call returns.
 */
class KeyAgreement {
public:
    /// Checks the peer's signed pre-key size and its signature under the peer identity.
    [[nodiscard]] static Result<Unit, ProtocolFailure> VerifyPeerBundle(const ContactRecord& peer);

    /**
     * @brief Sender side. Verifies the peer's signed pre-key, then agrees.
     *
     * @p ephemeral is consumed on every path.
     * @return SignatureVerification if the signed pre-key is not signed by
     *         the peer identity, PeerPubKey for an unusable peer key
     */
    [[nodiscard]] static Result<AgreementOutcome, ProtocolFailure> Initiate(
        std::string_view local_owner_id,
        const ContactRecord& peer,
        EphemeralKeyPair&& ephemeral,
        const std::optional<OneTimePreKeyPublic>& one_time_pre_key);

    /**
     * @brief Receiver side, mirroring Initiate with the private halves.
     *
     * @param one_time_pre_key Key already taken from the owner's pool, or
     *        nullptr for a signed-pre-key-only agreement
     */
    [[nodiscard]] static Result<AgreementOutcome, ProtocolFailure> Respond(
        std::string_view local_owner_id,
        const SignedPreKeyPair& signed_pre_key,
        std::span<const uint8_t> peer_ephemeral_public,
        const OneTimePreKey* one_time_pre_key,
        std::string_view sender_id);

    [[nodiscard]] static std::vector<uint8_t> BuildAgreementInfo(
        std::string_view sender_id,
        std::string_view receiver_id);
private:
    KeyAgreement() = delete;
};
}
