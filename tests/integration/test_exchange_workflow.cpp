#include <catch2/catch_test_macros.hpp>
#include "helpers/exchange_fixture.hpp"
#include "blackipher/trace/recording_trace_sink.hpp"
#include "blackipher/trace/trace_formatter.hpp"
#include <string>
#include <vector>

using namespace blackipher::protocol;
using namespace blackipher::protocol::test_helpers;
using namespace blackipher::protocol::trace;

TEST_CASE("Exchange - Two users trade greetings", "[integration][exchange]") {
    auto trace = std::make_shared<RecordingTraceSink>();
    auto alice = MakeUser("alice", ProtocolConfig::Classroom(), trace);
    auto bob = MakeUser("bob", ProtocolConfig::Classroom(), trace);
    IntroduceBoth(alice, bob);

    auto to_bob = alice.sessions->Send("bob", "hey");
    REQUIRE(to_bob.IsOk());
    auto at_bob = bob.sessions->Receive(to_bob.Unwrap());
    REQUIRE(at_bob.IsOk());
    REQUIRE(at_bob.Unwrap() == "hey");

    auto to_alice = bob.sessions->Send("alice", "hey yourself");
    REQUIRE(to_alice.IsOk());
    auto at_alice = alice.sessions->Receive(to_alice.Unwrap());
    REQUIRE(at_alice.IsOk());
    REQUIRE(at_alice.Unwrap() == "hey yourself");

    REQUIRE(alice.sessions->History("bob").size() == 2);
    REQUIRE(bob.sessions->History("alice").size() == 2);
    REQUIRE(to_bob.Unwrap().GetEphemeralPublic() != to_alice.Unwrap().GetEphemeralPublic());

    const auto sent = trace->Sent();
    const auto received = trace->Received();
    REQUIRE(sent.size() == 2);
    REQUIRE(received.size() == 2);
    REQUIRE(trace->Failures().empty());
    const auto block = TraceFormatter::FormatReceive(received[0]);
    REQUIRE(block.find("Plaintext: hey\n") != std::string::npos);
}

TEST_CASE("Exchange - One-time pre-keys run out then fall back", "[integration][exchange][opk]") {
    auto alice = MakeUser("alice");
    auto bob = MakeUser("bob");
    IntroduceBoth(alice, bob);

    std::vector<EncryptedMessage> messages;
    for (const char* text : {"first", "second", "third"}) {
        auto sent = alice.sessions->Send("bob", text);
        REQUIRE(sent.IsOk());
        messages.push_back(sent.Unwrap());
    }
    REQUIRE(messages[0].GetOneTimePreKeyId() == std::optional<uint32_t>{1});
    REQUIRE(messages[1].GetOneTimePreKeyId() == std::optional<uint32_t>{2});
    REQUIRE_FALSE(messages[2].GetOneTimePreKeyId().has_value());

    REQUIRE(bob.sessions->Receive(messages[0]).Unwrap() == "first");
    REQUIRE(bob.sessions->Receive(messages[1]).Unwrap() == "second");
    REQUIRE(bob.sessions->Receive(messages[2]).Unwrap() == "third");
    REQUIRE(bob.identity->AvailableOneTimePreKeyCount() == 0);

    SECTION("Replenished keys flow after relearning the bundle") {
        REQUIRE(bob.identity->ReplenishOneTimePreKeys(2).IsOk());
        Introduce(alice, bob);
        auto sent = alice.sessions->Send("bob", "fourth");
        REQUIRE(sent.IsOk());
        REQUIRE(sent.Unwrap().GetOneTimePreKeyId() == std::optional<uint32_t>{3});
        REQUIRE(bob.sessions->Receive(sent.Unwrap()).Unwrap() == "fourth");
    }
}

TEST_CASE("Exchange - Messages may arrive out of order", "[integration][exchange]") {
    auto alice = MakeUser("alice");
    auto bob = MakeUser("bob");
    IntroduceBoth(alice, bob);

    auto first = alice.sessions->Send("bob", "first").Unwrap();
    auto second = alice.sessions->Send("bob", "second").Unwrap();
    REQUIRE(bob.sessions->Receive(second).Unwrap() == "second");
    REQUIRE(bob.sessions->Receive(first).Unwrap() == "first");
}

TEST_CASE("Exchange - Signed pre-key rotation", "[integration][exchange][rotation]") {
    auto alice = MakeUser("alice", ProtocolConfig::SignedPreKeyOnly());
    auto bob = MakeUser("bob", ProtocolConfig::SignedPreKeyOnly());
    IntroduceBoth(alice, bob);

    auto before_rotation = alice.sessions->Send("bob", "old key").Unwrap();
    REQUIRE(before_rotation.GetSignedPreKeyId() == 1);

    REQUIRE(bob.identity->RotateSignedPreKey().IsOk());

    SECTION("In-flight message under the retained key still opens") {
        REQUIRE(bob.sessions->Receive(before_rotation).Unwrap() == "old key");
    }
    SECTION("Relearned bundle targets the new key") {
        Introduce(alice, bob);
        auto after = alice.sessions->Send("bob", "new key").Unwrap();
        REQUIRE(after.GetSignedPreKeyId() == 2);
        REQUIRE(bob.sessions->Receive(after).Unwrap() == "new key");
    }
    SECTION("Second rotation evicts the first key") {
        REQUIRE(bob.identity->RotateSignedPreKey().IsOk());
        auto result = bob.sessions->Receive(before_rotation);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::StalePreKey));
    }
    SECTION("Stale bundle is still accepted by the sender") {
        auto stale = alice.sessions->Send("bob", "stale bundle");
        REQUIRE(stale.IsOk());
        REQUIRE(stale.Unwrap().GetSignedPreKeyId() == 1);
        REQUIRE(bob.sessions->Receive(stale.Unwrap()).Unwrap() == "stale bundle");
    }
}

TEST_CASE("Exchange - Three users share one inbox", "[integration][exchange]") {
    auto alice = MakeUser("alice");
    auto bob = MakeUser("bob", ProtocolConfig::Default());
    auto carol = MakeUser("carol");
    IntroduceBoth(alice, bob);
    IntroduceBoth(carol, bob);

    auto from_alice = alice.sessions->Send("bob", "from alice").Unwrap();
    auto from_carol = carol.sessions->Send("bob", "from carol").Unwrap();
    REQUIRE(from_alice.GetOneTimePreKeyId() == from_carol.GetOneTimePreKeyId());

    REQUIRE(bob.sessions->Receive(from_alice).Unwrap() == "from alice");
    auto collided = bob.sessions->Receive(from_carol);
    REQUIRE(collided.IsErr());
    REQUIRE(collided.UnwrapErr().Is(ProtocolFailureType::Decryption));
    REQUIRE(bob.sessions->ContactIds() == std::vector<std::string>{"alice"});
}
