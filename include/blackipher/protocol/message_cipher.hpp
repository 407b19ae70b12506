#pragma once
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include "blackipher/models/encrypted_message.hpp"
#include "blackipher/models/keys/shared_secret.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <cstdint>
namespace blackipher::protocol {
using models::EncryptedMessage;
using models::SharedSecret;

/// Public fields of a message, all of which are authenticated.
struct MessageHeader {
    std::string sender_id;
    std::string receiver_id;
    std::vector<uint8_t> ephemeral_public;
    uint32_t signed_pre_key_id = 0;
    std::optional<uint32_t> one_time_pre_key_id;
};

/**
 * Seals and opens one message under a fresh agreement.
 *
 * The message key is HKDF-SHA256(shared secret, info "BlacKipher-Message-v1").
 * The AEAD is XChaCha20-Poly1305 with a random 24-byte nonce and associated
 * data built by BuildAssociatedData from the header.
 */
class MessageCipher {
public:
    [[nodiscard]] static Result<EncryptedMessage, ProtocolFailure> Encrypt(
        const SharedSecret& shared_secret,
        MessageHeader header,
        std::span<const uint8_t> plaintext);

    /// Any failure, including a malformed nonce or a short ciphertext, is
    /// reported as Decryption.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        const SharedSecret& shared_secret,
        const EncryptedMessage& message);

    /// label || u32 len || sender || u32 len || receiver || ephemeral public
    /// || u32 signed pre-key id || u8 flag || u32 one-time pre-key id.
    /// Integers are big-endian.
    [[nodiscard]] static std::vector<uint8_t> BuildAssociatedData(const MessageHeader& header);
private:
    MessageCipher() = delete;
};
}
