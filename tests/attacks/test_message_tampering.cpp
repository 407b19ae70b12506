#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_message.hpp>
#include "helpers/exchange_fixture.hpp"
#include "blackipher/trace/recording_trace_sink.hpp"
#include "blackipher/protocol/constants.hpp"
#include <string>
#include <vector>

using namespace blackipher::protocol;
using namespace blackipher::protocol::test_helpers;
using blackipher::protocol::trace::RecordingTraceSink;
using blackipher::protocol::trace::TraceDirection;

namespace {
struct Envelope {
    std::string sender;
    std::string receiver;
    std::vector<uint8_t> ephemeral;
    uint32_t spk_id;
    std::optional<uint32_t> opk_id;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> ciphertext;

    explicit Envelope(const EncryptedMessage& m)
        : sender(m.GetSenderId())
        , receiver(m.GetReceiverId())
        , ephemeral(m.GetEphemeralPublic())
        , spk_id(m.GetSignedPreKeyId())
        , opk_id(m.GetOneTimePreKeyId())
        , nonce(m.GetNonce())
        , ciphertext(m.GetCiphertext()) {}

    [[nodiscard]] EncryptedMessage Build() const {
        return {sender, receiver, ephemeral, spk_id, opk_id, nonce, ciphertext};
    }
};
}

TEST_CASE("Attack - Ciphertext bit flips", "[attacks][tampering]") {
    auto alice = MakeUser("alice", ProtocolConfig::SignedPreKeyOnly());
    auto bob = MakeUser("bob", ProtocolConfig::SignedPreKeyOnly());
    IntroduceBoth(alice, bob);
    const auto original = alice.sessions->Send("bob", "transfer 100 to carol").Unwrap();

    SECTION("Every bit of the ciphertext is authenticated") {
        for (size_t i = 0; i < original.GetCiphertext().size(); ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                Envelope tampered(original);
                tampered.ciphertext[i] ^= static_cast<uint8_t>(1u << bit);
                auto result = bob.sessions->Receive(tampered.Build());
                INFO("byte " << i << " bit " << bit);
                REQUIRE(result.IsErr());
                REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decryption));
            }
        }
        REQUIRE(bob.sessions->History("alice").empty());
        REQUIRE(bob.sessions->Receive(original).Unwrap() == "transfer 100 to carol");
    }
    SECTION("Appended bytes") {
        Envelope tampered(original);
        tampered.ciphertext.push_back(0x00);
        REQUIRE(bob.sessions->Receive(tampered.Build()).IsErr());
    }
    SECTION("Stripped tag") {
        Envelope tampered(original);
        tampered.ciphertext.resize(kAeadTagBytes - 1);
        auto result = bob.sessions->Receive(tampered.Build());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decryption));
    }
}

TEST_CASE("Attack - Nonce manipulation", "[attacks][tampering]") {
    auto alice = MakeUser("alice", ProtocolConfig::SignedPreKeyOnly());
    auto bob = MakeUser("bob", ProtocolConfig::SignedPreKeyOnly());
    IntroduceBoth(alice, bob);
    const auto original = alice.sessions->Send("bob", "hey").Unwrap();

    SECTION("Every bit of the nonce is authenticated") {
        for (size_t i = 0; i < kAeadNonceBytes; ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                Envelope tampered(original);
                tampered.nonce[i] ^= static_cast<uint8_t>(1u << bit);
                auto result = bob.sessions->Receive(tampered.Build());
                INFO("byte " << i << " bit " << bit);
                REQUIRE(result.IsErr());
                REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decryption));
            }
        }
        REQUIRE(bob.sessions->Receive(original).Unwrap() == "hey");
    }
    SECTION("Truncated nonce") {
        Envelope tampered(original);
        tampered.nonce.resize(12);
        auto result = bob.sessions->Receive(tampered.Build());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decryption));
    }
    SECTION("Nonce from another message") {
        const auto other = alice.sessions->Send("bob", "hey").Unwrap();
        Envelope tampered(original);
        tampered.nonce = other.GetNonce();
        REQUIRE(bob.sessions->Receive(tampered.Build()).IsErr());
    }
}

TEST_CASE("Attack - Header substitution", "[attacks][tampering]") {
    auto trace = std::make_shared<RecordingTraceSink>();
    auto alice = MakeUser("alice");
    auto bob = MakeUser("bob", ProtocolConfig::Classroom(), trace);
    auto mallory = MakeUser("mallory");
    IntroduceBoth(alice, bob);
    Introduce(bob, mallory);
    const auto original = alice.sessions->Send("bob", "meet at noon").Unwrap();

    SECTION("Claimed sender rewritten") {
        Envelope tampered(original);
        tampered.sender = "mallory";
        auto result = bob.sessions->Receive(tampered.Build());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decryption));
        const auto failures = trace->Failures();
        REQUIRE(failures.size() == 1);
        REQUIRE(failures[0].direction == TraceDirection::Receive);
        REQUIRE(failures[0].peer_id == "mallory");
        REQUIRE(bob.sessions->History("mallory").empty());
    }
    SECTION("Ephemeral key swapped for an attacker key") {
        Envelope tampered(original);
        tampered.ephemeral = alice.sessions->Send("bob", "other").Unwrap().GetEphemeralPublic();
        auto result = bob.sessions->Receive(tampered.Build());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decryption));
    }
    SECTION("One-time pre-key reference dropped") {
        Envelope tampered(original);
        tampered.opk_id.reset();
        auto result = bob.sessions->Receive(tampered.Build());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decryption));
        REQUIRE(bob.identity->AvailableOneTimePreKeyCount() == 2);
    }
    SECTION("One-time pre-key reference redirected") {
        Envelope tampered(original);
        tampered.opk_id = 2;
        auto result = bob.sessions->Receive(tampered.Build());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decryption));
        REQUIRE(bob.identity->AvailableOneTimePreKeyCount() == 1);
    }
    SECTION("Low-order ephemeral key") {
        Envelope tampered(original);
        tampered.ephemeral.assign(kX25519PublicKeyBytes, 0x00);
        auto result = bob.sessions->Receive(tampered.Build());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::PeerPubKey));
    }
}

TEST_CASE("Attack - Replay of an accepted message", "[attacks][replay]") {
    auto alice = MakeUser("alice");
    auto bob = MakeUser("bob");
    IntroduceBoth(alice, bob);
    const auto message = alice.sessions->Send("bob", "pay once").Unwrap();

    REQUIRE(bob.sessions->Receive(message).Unwrap() == "pay once");
    auto replay = bob.sessions->Receive(message);
    REQUIRE(replay.IsErr());
    REQUIRE(replay.UnwrapErr().Is(ProtocolFailureType::Decryption));
    REQUIRE(bob.sessions->History("alice").size() == 1);
}
