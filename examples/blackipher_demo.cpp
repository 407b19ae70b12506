/**
 * @file blackipher_demo.cpp
 * @brief Walks three local users through bundle exchange and messaging
 */

#include "blackipher/configuration/protocol_config.hpp"
#include "blackipher/contacts/contact_book.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/identity/identity_manager.hpp"
#include "blackipher/interfaces/i_state_key_provider.hpp"
#include "blackipher/persistence/state_codec.hpp"
#include "blackipher/protocol/constants.hpp"
#include "blackipher/protocol/session_store.hpp"
#include "blackipher/trace/stream_trace_sink.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace blackipher::protocol;
using namespace blackipher::protocol::crypto;
using blackipher::protocol::configuration::ProtocolConfig;
using blackipher::protocol::persistence::StateCodec;

namespace {

/// Random per-process state key. A real client would derive or unwrap it.
class DemoStateKeyProvider final : public interfaces::IStateKeyProvider {
public:
    Result<SecureMemoryHandle, ProtocolFailure> GetStateEncryptionKey() override {
        if (key_.IsInvalid()) {
            auto random = SodiumInterop::GetRandomBytes(kStateKeyBytes);
            auto handle = SecureMemoryHandle::FromBytes(random);
            SodiumInterop::SecureWipe(std::span(random));
            if (handle.IsErr()) {
                return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
            }
            key_ = std::move(handle).Unwrap();
        }
        auto copy = key_.Clone();
        if (copy.IsErr()) {
            return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(copy.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(copy).Unwrap());
    }

private:
    SecureMemoryHandle key_;
};

struct DemoUser {
    IdentityManager identity;
    ContactBook contacts;
};

bool Introduce(DemoUser& learner, const DemoUser& peer) {
    auto learned = learner.contacts.LearnBundle(peer.identity.GetOwnerId(), peer.identity.CreatePublicBundle());
    if (learned.IsErr()) {
        std::cerr << "Failed to learn bundle: " << learned.UnwrapErr().message << std::endl;
        return false;
    }
    return true;
}

void Exchange(SessionStore& from, SessionStore& to, const std::string& text) {
    auto sent = from.Send(to.GetOwnerId(), text);
    if (sent.IsErr()) {
        std::cout << "   send failed: " << ToString(sent.UnwrapErr().type) << std::endl;
        return;
    }
    auto received = to.Receive(sent.Unwrap());
    if (received.IsErr()) {
        std::cout << "   receive failed: " << ToString(received.UnwrapErr().type) << std::endl;
    }
}

}

int main(int argc, char** argv) {
    std::cout << "=== BlacKipher - Pre-key Exchange Demo ===" << std::endl;
    std::cout << std::endl;

    const auto config = ProtocolConfig::Default();

    std::cout << "1. Creating identities..." << std::endl;
    auto me_result = IdentityManager::Create("katpercent", config);
    auto alice_result = IdentityManager::Create("alice", config);
    auto bob_result = IdentityManager::Create("bob", config);
    for (const auto* result : {&me_result, &alice_result, &bob_result}) {
        if (result->IsErr()) {
            std::cerr << "Failed to create identity: " << result->UnwrapErr().message << std::endl;
            return 1;
        }
    }
    DemoUser me{std::move(me_result).Unwrap(), ContactBook()};
    DemoUser alice{std::move(alice_result).Unwrap(), ContactBook()};
    DemoUser bob{std::move(bob_result).Unwrap(), ContactBook()};
    std::cout << "   ✓ katpercent, alice and bob each hold "
              << config.GetOneTimePreKeyBatchSize() << " one-time pre-keys" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Exchanging public bundles..." << std::endl;
    if (!Introduce(me, alice) || !Introduce(me, bob) || !Introduce(alice, me) || !Introduce(bob, me)) {
        return 1;
    }
    std::cout << "   ✓ katpercent knows " << me.contacts.Size() << " contacts" << std::endl;
    std::cout << std::endl;

    auto trace_sink = std::make_shared<trace::StreamTraceSink>(std::cout);
    SessionStore my_sessions(me.identity, me.contacts, trace_sink);
    SessionStore alice_sessions(alice.identity, alice.contacts, trace_sink);
    SessionStore bob_sessions(bob.identity, bob.contacts, trace_sink);

    std::cout << "3. Messaging..." << std::endl;
    Exchange(my_sessions, alice_sessions, "hey");
    Exchange(alice_sessions, my_sessions, "hey yourself");
    Exchange(my_sessions, bob_sessions, "hello bob");
    std::cout << std::endl;

    std::cout << "4. Rotating alice's signed pre-key..." << std::endl;
    auto rotated = alice.identity.RotateSignedPreKey();
    if (rotated.IsErr()) {
        std::cerr << "Rotation failed: " << rotated.UnwrapErr().message << std::endl;
    } else {
        std::cout << "   ✓ alice now advertises signed pre-key " << rotated.Unwrap() << std::endl;
        Exchange(my_sessions, alice_sessions, "still there?");
        if (Introduce(me, alice)) {
            Exchange(my_sessions, alice_sessions, "using your new key");
        }
    }
    std::cout << std::endl;

    std::cout << "5. Sealing katpercent's identity..." << std::endl;
    DemoStateKeyProvider key_provider;
    auto sealed = StateCodec::SealIdentity(me.identity, key_provider);
    if (sealed.IsErr()) {
        std::cerr << "Sealing failed: " << sealed.UnwrapErr().message << std::endl;
    } else {
        auto reopened = StateCodec::OpenIdentity(sealed.Unwrap(), key_provider, config);
        std::cout << "   ✓ " << sealed.Unwrap().size() << " sealed bytes, reopened: "
                  << (reopened.IsOk() ? "yes" : "no") << std::endl;
    }

    if (argc > 1) {
        auto history = StateCodec::EncodeHistory(my_sessions);
        if (history.IsErr()) {
            std::cerr << "History encoding failed: " << history.UnwrapErr().message << std::endl;
        } else {
            std::ofstream out(argv[1], std::ios::binary);
            out.write(reinterpret_cast<const char*>(history.Unwrap().data()),
                      static_cast<std::streamsize>(history.Unwrap().size()));
            std::cout << "   ✓ History written to " << argv[1] << std::endl;
        }
    }
    std::cout << std::endl;

    std::cout << "=== Demo completed ===" << std::endl;
    return 0;
}
