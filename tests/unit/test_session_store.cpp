#include <catch2/catch_test_macros.hpp>
#include "helpers/exchange_fixture.hpp"
#include "blackipher/trace/recording_trace_sink.hpp"
#include "blackipher/protocol/constants.hpp"
#include "blackipher/state.pb.h"
using namespace blackipher::protocol;
using namespace blackipher::protocol::test_helpers;
using blackipher::protocol::trace::RecordingTraceSink;
using blackipher::protocol::trace::TraceDirection;

TEST_CASE("SessionStore - Send and receive", "[session]") {
    auto alice_trace = std::make_shared<RecordingTraceSink>();
    auto bob_trace = std::make_shared<RecordingTraceSink>();
    auto alice = MakeUser("alice", ProtocolConfig::Classroom(), alice_trace);
    auto bob = MakeUser("bob", ProtocolConfig::Classroom(), bob_trace);
    IntroduceBoth(alice, bob);

    auto sent = alice.sessions->Send("bob", "hey");
    REQUIRE(sent.IsOk());
    const auto message = sent.Unwrap();
    REQUIRE(message.GetSenderId() == "alice");
    REQUIRE(message.GetReceiverId() == "bob");
    REQUIRE(message.GetOneTimePreKeyId() == std::optional<uint32_t>{1});

    auto received = bob.sessions->Receive(message);
    REQUIRE(received.IsOk());
    REQUIRE(received.Unwrap() == "hey");

    SECTION("Both sides record the message under the peer") {
        REQUIRE(alice.sessions->History("bob") == std::vector<EncryptedMessage>{message});
        REQUIRE(bob.sessions->History("alice") == std::vector<EncryptedMessage>{message});
        REQUIRE(alice.sessions->LastEphemeralPublic("bob") == message.GetEphemeralPublic());
        REQUIRE(bob.sessions->ContactIds() == std::vector<std::string>{"alice"});
    }
    SECTION("Referenced one-time pre-key is consumed") {
        REQUIRE(bob.identity->AvailableOneTimePreKeyCount() == 1);
        REQUIRE_FALSE(bob.identity->TakeOneTimePreKey(1).has_value());
    }
    SECTION("Trace events carry public values only") {
        const auto sent_events = alice_trace->Sent();
        REQUIRE(sent_events.size() == 1);
        REQUIRE(sent_events[0].signed_pre_key_verified);
        REQUIRE(sent_events[0].ephemeral_public == message.GetEphemeralPublic());
        REQUIRE(sent_events[0].dh_output_bytes == kX25519SharedSecretBytes);
        REQUIRE(sent_events[0].nonce == message.GetNonce());

        const auto received_events = bob_trace->Received();
        REQUIRE(received_events.size() == 1);
        REQUIRE(received_events[0].plaintext == "hey");
        REQUIRE(received_events[0].sender_id == "alice");
    }
    SECTION("Replaying the message fails") {
        auto replay = bob.sessions->Receive(message);
        REQUIRE(replay.IsErr());
        REQUIRE(replay.UnwrapErr().Is(ProtocolFailureType::Decryption));
        REQUIRE(bob.sessions->History("alice").size() == 1);
        REQUIRE(bob_trace->Failures().size() == 1);
    }
}

TEST_CASE("SessionStore - Send failures", "[session]") {
    auto trace = std::make_shared<RecordingTraceSink>();
    auto alice = MakeUser("alice", ProtocolConfig::Classroom(), trace);

    SECTION("Unknown contact") {
        auto result = alice.sessions->Send("nobody", "hey");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::UnknownContact));
        const auto failures = trace->Failures();
        REQUIRE(failures.size() == 1);
        REQUIRE(failures[0].direction == TraceDirection::Send);
        REQUIRE(failures[0].peer_id == "nobody");
        REQUIRE(failures[0].failure_type == ProtocolFailureType::UnknownContact);
    }
    SECTION("Plaintext above the configured limit") {
        auto bob = MakeUser("bob");
        Introduce(alice, bob);
        const std::string oversized(ProtocolConfig::Classroom().GetMaxPlaintextBytes() + 1, 'a');
        auto result = alice.sessions->Send("bob", oversized);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::InvalidInput));
        REQUIRE(alice.sessions->History("bob").empty());
    }
}

TEST_CASE("SessionStore - Receive failures", "[session]") {
    auto alice = MakeUser("alice");
    auto bob = MakeUser("bob");
    auto carol = MakeUser("carol");
    IntroduceBoth(alice, bob);

    const auto message = alice.sessions->Send("bob", "hey").Unwrap();

    SECTION("Message for someone else") {
        auto result = carol.sessions->Receive(message);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::InvalidInput));
    }
    SECTION("Sender without a learned bundle") {
        REQUIRE(bob.contacts->Remove("alice"));
        auto result = bob.sessions->Receive(message);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::UnknownContact));
        REQUIRE(bob.sessions->History("alice").empty());
        REQUIRE(bob.identity->AvailableOneTimePreKeyCount() == 2);
    }
    SECTION("Unknown signed pre-key id") {
        EncryptedMessage altered(message.GetSenderId(), message.GetReceiverId(), message.GetEphemeralPublic(),
                                 77, message.GetOneTimePreKeyId(), message.GetNonce(), message.GetCiphertext());
        auto result = bob.sessions->Receive(altered);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::StalePreKey));
    }
    SECTION("Invalid UTF-8 payload") {
        IntroduceBoth(carol, bob);
        const std::string not_utf8("\xC3\x28", 2);
        auto sent = carol.sessions->Send("bob", not_utf8);
        REQUIRE(sent.IsOk());
        auto result = bob.sessions->Receive(sent.Unwrap());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decode));
        REQUIRE(bob.sessions->History("carol").empty());
    }
    SECTION("Multi-byte UTF-8 is accepted") {
        auto sent = alice.sessions->Send("bob", "h\xC3\xA9llo \xF0\x9F\x94\x91");
        REQUIRE(sent.IsOk());
        auto result = bob.sessions->Receive(sent.Unwrap());
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == "h\xC3\xA9llo \xF0\x9F\x94\x91");
    }
}

TEST_CASE("SessionStore - History management", "[session]") {
    auto alice = MakeUser("alice");
    auto bob = MakeUser("bob");
    auto carol = MakeUser("carol");
    IntroduceBoth(alice, bob);
    Introduce(alice, carol);

    REQUIRE(alice.sessions->Send("bob", "one").IsOk());
    REQUIRE(alice.sessions->Send("carol", "two").IsOk());
    REQUIRE(alice.sessions->ContactIds() == std::vector<std::string>{"bob", "carol"});

    SECTION("Clear a single contact") {
        REQUIRE(alice.sessions->Clear("bob"));
        REQUIRE_FALSE(alice.sessions->Clear("bob"));
        REQUIRE(alice.sessions->History("bob").empty());
        REQUIRE_FALSE(alice.sessions->LastEphemeralPublic("bob").has_value());
        REQUIRE(alice.sessions->History("carol").size() == 1);
    }
    SECTION("Clear everything") {
        alice.sessions->ClearAll();
        REQUIRE(alice.sessions->ContactIds().empty());
    }
    SECTION("Export and restore") {
        auto state = alice.sessions->ToProtoState();
        REQUIRE(state.IsOk());
        const auto bob_history = alice.sessions->History("bob");
        alice.sessions->ClearAll();
        REQUIRE(alice.sessions->RestoreHistory(state.Unwrap()).IsOk());
        REQUIRE(alice.sessions->History("bob") == bob_history);
        REQUIRE(alice.sessions->ContactIds().size() == 2);
    }
    SECTION("Restore refuses another owner's history") {
        auto state = alice.sessions->ToProtoState().Unwrap();
        auto result = bob.sessions->RestoreHistory(state);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::InvalidState));
    }
}
