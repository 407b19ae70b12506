#include <catch2/catch_test_macros.hpp>
#include "blackipher/protocol/key_agreement.hpp"
#include "blackipher/identity/identity_manager.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/protocol/constants.hpp"
using namespace blackipher::protocol;
using blackipher::protocol::configuration::ProtocolConfig;
using blackipher::protocol::crypto::SodiumInterop;
using blackipher::protocol::identity::IdentityManager;

namespace {
Result<AgreementOutcome, ProtocolFailure> RespondAs(
    IdentityManager& receiver,
    const AgreementOutcome& initiated,
    const std::string& sender_id) {
    std::optional<models::OneTimePreKey> opk;
    if (initiated.one_time_pre_key_id.has_value()) {
        opk = receiver.TakeOneTimePreKey(*initiated.one_time_pre_key_id);
        if (!opk.has_value()) {
            return Result<AgreementOutcome, ProtocolFailure>::Err(
                ProtocolFailure::StalePreKey("one-time pre-key already used"));
        }
    }
    return receiver.WithSignedPreKey(initiated.signed_pre_key_id, [&](const models::SignedPreKeyPair& spk) {
        return KeyAgreement::Respond(receiver.GetOwnerId(), spk, initiated.ephemeral_public,
                                     opk.has_value() ? &*opk : nullptr, sender_id);
    });
}
}

TEST_CASE("KeyAgreement - Both sides derive the same secret", "[agreement]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bob = IdentityManager::Create("bob", ProtocolConfig::Classroom()).Unwrap();
    auto bundle = bob.CreatePublicBundle();

    SECTION("With a one-time pre-key") {
        const auto opk = bundle.PopOneTimePreKey();
        ContactRecord record{"bob", bundle};
        auto initiated = KeyAgreement::Initiate("alice", record, EphemeralKeyPair::Generate().Unwrap(), opk);
        REQUIRE(initiated.IsOk());
        REQUIRE(initiated.Unwrap().one_time_pre_key_id == std::optional<uint32_t>{1});
        REQUIRE(initiated.Unwrap().signed_pre_key_id == 1);
        REQUIRE(initiated.Unwrap().ephemeral_public.size() == kX25519PublicKeyBytes);
        REQUIRE(initiated.Unwrap().dh_output_bytes == kX25519SharedSecretBytes);

        auto responded = RespondAs(bob, initiated.Unwrap(), "alice");
        REQUIRE(responded.IsOk());
        REQUIRE(initiated.Unwrap().shared_secret.ConstantTimeEquals(responded.Unwrap().shared_secret).Unwrap());
    }
    SECTION("Signed pre-key only") {
        ContactRecord record{"bob", bundle};
        auto initiated = KeyAgreement::Initiate("alice", record, EphemeralKeyPair::Generate().Unwrap(), std::nullopt);
        REQUIRE(initiated.IsOk());
        REQUIRE_FALSE(initiated.Unwrap().one_time_pre_key_id.has_value());
        auto responded = RespondAs(bob, initiated.Unwrap(), "alice");
        REQUIRE(responded.IsOk());
        REQUIRE(initiated.Unwrap().shared_secret.ConstantTimeEquals(responded.Unwrap().shared_secret).Unwrap());
    }
}

TEST_CASE("KeyAgreement - Secrets are bound to context", "[agreement]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bob = IdentityManager::Create("bob", ProtocolConfig::SignedPreKeyOnly()).Unwrap();
    ContactRecord record{"bob", bob.CreatePublicBundle()};

    SECTION("Fresh ephemerals give fresh secrets") {
        auto first = KeyAgreement::Initiate("alice", record, EphemeralKeyPair::Generate().Unwrap(), std::nullopt);
        auto second = KeyAgreement::Initiate("alice", record, EphemeralKeyPair::Generate().Unwrap(), std::nullopt);
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(first.Unwrap().ephemeral_public != second.Unwrap().ephemeral_public);
        REQUIRE_FALSE(first.Unwrap().shared_secret.ConstantTimeEquals(second.Unwrap().shared_secret).Unwrap());
    }
    SECTION("Responder with the wrong sender id disagrees") {
        auto initiated = KeyAgreement::Initiate("alice", record, EphemeralKeyPair::Generate().Unwrap(), std::nullopt);
        REQUIRE(initiated.IsOk());
        auto responded = RespondAs(bob, initiated.Unwrap(), "mallory");
        REQUIRE(responded.IsOk());
        REQUIRE_FALSE(initiated.Unwrap().shared_secret.ConstantTimeEquals(responded.Unwrap().shared_secret).Unwrap());
    }
    SECTION("Agreement info separates sender and receiver") {
        REQUIRE(KeyAgreement::BuildAgreementInfo("ab", "c") != KeyAgreement::BuildAgreementInfo("a", "bc"));
        REQUIRE(KeyAgreement::BuildAgreementInfo("alice", "bob") != KeyAgreement::BuildAgreementInfo("bob", "alice"));
    }
}

TEST_CASE("KeyAgreement - Initiate rejects bad bundles", "[agreement][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bob = IdentityManager::Create("bob", ProtocolConfig::SignedPreKeyOnly()).Unwrap();
    const auto genuine = bob.CreatePublicBundle();

    SECTION("Bad signature") {
        auto signature = genuine.GetSignedPreKeySignature();
        signature[10] ^= 0x04;
        ContactRecord record{"bob", models::PublicKeyBundle(
            "bob", genuine.GetIdentityEd25519Public(), genuine.GetSignedPreKeyId(),
            genuine.GetSignedPreKeyPublic(), signature, {})};
        auto result = KeyAgreement::Initiate("alice", record, EphemeralKeyPair::Generate().Unwrap(), std::nullopt);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::SignatureVerification));
    }
    SECTION("Malformed signed pre-key") {
        ContactRecord record{"bob", models::PublicKeyBundle(
            "bob", genuine.GetIdentityEd25519Public(), genuine.GetSignedPreKeyId(),
            std::vector<uint8_t>(16, 0x09), genuine.GetSignedPreKeySignature(), {})};
        auto result = KeyAgreement::Initiate("alice", record, EphemeralKeyPair::Generate().Unwrap(), std::nullopt);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::PeerPubKey));
    }
    SECTION("Ephemeral cannot be used twice") {
        ContactRecord record{"bob", genuine};
        auto ephemeral = EphemeralKeyPair::Generate().Unwrap();
        REQUIRE(KeyAgreement::Initiate("alice", record, std::move(ephemeral), std::nullopt).IsOk());
        REQUIRE(ephemeral.IsConsumed());
        auto again = KeyAgreement::Initiate("alice", record, std::move(ephemeral), std::nullopt);
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().Is(ProtocolFailureType::InvalidState));
    }
}

TEST_CASE("KeyAgreement - Respond rejects low-order ephemeral keys", "[agreement][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bob = IdentityManager::Create("bob", ProtocolConfig::SignedPreKeyOnly()).Unwrap();
    const std::vector<uint8_t> zero_point(kX25519PublicKeyBytes, 0x00);
    auto result = bob.WithSignedPreKey(1, [&](const models::SignedPreKeyPair& spk) {
        return KeyAgreement::Respond("bob", spk, zero_point, nullptr, "alice");
    });
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::PeerPubKey));
}
