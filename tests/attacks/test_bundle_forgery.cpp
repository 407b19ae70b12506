#include <catch2/catch_test_macros.hpp>
#include "helpers/exchange_fixture.hpp"
#include "blackipher/persistence/state_codec.hpp"
#include "blackipher/trace/recording_trace_sink.hpp"
#include "blackipher/state.pb.h"

using namespace blackipher::protocol;
using namespace blackipher::protocol::test_helpers;
using blackipher::protocol::models::PublicKeyBundle;
using blackipher::protocol::persistence::StateCodec;
using blackipher::protocol::trace::RecordingTraceSink;

TEST_CASE("Attack - Signed pre-key from another identity", "[attacks][forgery]") {
    auto trace = std::make_shared<RecordingTraceSink>();
    auto alice = MakeUser("alice", ProtocolConfig::Classroom(), trace);
    auto bob = MakeUser("bob");
    auto mallory = MakeUser("mallory");
    Introduce(bob, alice);

    const auto genuine = bob.identity->CreatePublicBundle();
    const auto attacker = mallory.identity->CreatePublicBundle();

    SECTION("Attacker key and signature under the victim identity") {
        PublicKeyBundle forged("bob", genuine.GetIdentityEd25519Public(), attacker.GetSignedPreKeyId(),
                               attacker.GetSignedPreKeyPublic(), attacker.GetSignedPreKeySignature(),
                               attacker.GetOneTimePreKeys());
        REQUIRE(alice.contacts->LearnBundle("bob", forged).IsOk());
        auto result = alice.sessions->Send("bob", "secret");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::SignatureVerification));
        REQUIRE(alice.sessions->History("bob").empty());
        REQUIRE(trace->Sent().empty());
        REQUIRE(trace->Failures().size() == 1);
        REQUIRE(trace->Failures()[0].failure_type == ProtocolFailureType::SignatureVerification);
        REQUIRE(alice.contacts->Get("bob")->bundle.GetOneTimePreKeys() == attacker.GetOneTimePreKeys());
    }
    SECTION("Attacker key spliced next to the victim signature") {
        PublicKeyBundle forged("bob", genuine.GetIdentityEd25519Public(), genuine.GetSignedPreKeyId(),
                               attacker.GetSignedPreKeyPublic(), genuine.GetSignedPreKeySignature(), {});
        REQUIRE(alice.contacts->LearnBundle("bob", forged).IsOk());
        auto result = alice.sessions->Send("bob", "secret");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::SignatureVerification));
    }
    SECTION("Attacker identity is self-consistent but reaches the attacker only") {
        PublicKeyBundle relabelled("bob", attacker.GetIdentityEd25519Public(), attacker.GetSignedPreKeyId(),
                                   attacker.GetSignedPreKeyPublic(), attacker.GetSignedPreKeySignature(), {});
        REQUIRE(alice.contacts->LearnBundle("bob", relabelled).IsOk());
        auto sent = alice.sessions->Send("bob", "secret");
        REQUIRE(sent.IsOk());
        auto at_bob = bob.sessions->Receive(sent.Unwrap());
        REQUIRE(at_bob.IsErr());
        REQUIRE(at_bob.UnwrapErr().Is(ProtocolFailureType::Decryption));
    }
}

TEST_CASE("Attack - Forged bundle on the wire", "[attacks][forgery]") {
    auto alice = MakeUser("alice");
    auto bob = MakeUser("bob");
    Introduce(bob, alice);
    auto proto = StateCodec::ToProto(bob.identity->CreatePublicBundle());

    SECTION("Tampered signature survives decoding but not agreement") {
        auto* signature = proto.mutable_signed_pre_key_signature();
        (*signature)[5] = static_cast<char>((*signature)[5] ^ 0x20);
        auto decoded = StateCodec::FromProto(proto);
        REQUIRE(decoded.IsOk());
        REQUIRE(alice.contacts->LearnBundle("bob", std::move(decoded).Unwrap()).IsOk());
        auto result = alice.sessions->Send("bob", "hey");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::SignatureVerification));
    }
    SECTION("Truncated signature is rejected at decode") {
        proto.mutable_signed_pre_key_signature()->resize(32);
        auto decoded = StateCodec::FromProto(proto);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().Is(ProtocolFailureType::Decode));
    }
    SECTION("Replaced one-time pre-key is not trusted by the receiver") {
        auto attacker_key = blackipher::protocol::crypto::SodiumInterop::GenerateX25519KeyPair("attacker");
        REQUIRE(attacker_key.IsOk());
        const auto& attacker_public = attacker_key.Unwrap().second;
        proto.mutable_one_time_pre_keys(0)->set_public_key(attacker_public.data(), attacker_public.size());
        auto decoded = StateCodec::FromProto(proto);
        REQUIRE(decoded.IsOk());
        REQUIRE(alice.contacts->LearnBundle("bob", std::move(decoded).Unwrap()).IsOk());
        auto sent = alice.sessions->Send("bob", "hey");
        REQUIRE(sent.IsOk());
        auto result = bob.sessions->Receive(sent.Unwrap());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::Decryption));
    }
}
