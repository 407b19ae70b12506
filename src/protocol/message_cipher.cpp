#include "blackipher/protocol/message_cipher.hpp"
#include "blackipher/protocol/constants.hpp"
#include "blackipher/core/constants.hpp"
#include "blackipher/crypto/hkdf.hpp"
#include "blackipher/crypto/xchacha20_poly1305.hpp"
#include "blackipher/debug/key_logger.hpp"

namespace blackipher::protocol {
    using crypto::Hkdf;
    using crypto::SecureMemoryHandle;
    using crypto::XChaCha20Poly1305;

    namespace {
        void AppendUint32(std::vector<uint8_t> &out, const uint32_t value) {
            out.push_back(static_cast<uint8_t>(value >> 24));
            out.push_back(static_cast<uint8_t>(value >> 16));
            out.push_back(static_cast<uint8_t>(value >> 8));
            out.push_back(static_cast<uint8_t>(value));
        }

        void AppendString(std::vector<uint8_t> &out, const std::string &value) {
            AppendUint32(out, static_cast<uint32_t>(value.size()));
            out.insert(out.end(), value.begin(), value.end());
        }

        Result<SecureMemoryHandle, ProtocolFailure> DeriveMessageKey(const SharedSecret &shared_secret) {
            const std::span<const uint8_t> info(
                reinterpret_cast<const uint8_t *>(kMessageKeyInfo.data()), kMessageKeyInfo.size());
            auto derive_result = shared_secret.GetHandle().WithReadAccess([info](std::span<const uint8_t> secret) {
                return Hkdf::DeriveKeyHandle(secret, kMessageKeyBytes, {}, info);
            });
            if (derive_result.IsErr()) {
                return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
            }
            return std::move(derive_result).Unwrap();
        }

        MessageHeader HeaderOf(const EncryptedMessage &message) {
            return {
                message.GetSenderId(),
                message.GetReceiverId(),
                message.GetEphemeralPublic(),
                message.GetSignedPreKeyId(),
                message.GetOneTimePreKeyId()
            };
        }
    }

    std::vector<uint8_t> MessageCipher::BuildAssociatedData(const MessageHeader &header) {
        std::vector<uint8_t> ad;
        ad.reserve(kAssociatedDataLabel.size() + 8 + header.sender_id.size() + header.receiver_id.size() +
                   header.ephemeral_public.size() + 9);
        ad.insert(ad.end(), kAssociatedDataLabel.begin(), kAssociatedDataLabel.end());
        AppendString(ad, header.sender_id);
        AppendString(ad, header.receiver_id);
        ad.insert(ad.end(), header.ephemeral_public.begin(), header.ephemeral_public.end());
        AppendUint32(ad, header.signed_pre_key_id);
        ad.push_back(header.one_time_pre_key_id.has_value() ? 1 : 0);
        AppendUint32(ad, header.one_time_pre_key_id.value_or(0));
        return ad;
    }

    Result<EncryptedMessage, ProtocolFailure> MessageCipher::Encrypt(
        const SharedSecret &shared_secret,
        MessageHeader header,
        const std::span<const uint8_t> plaintext) {
        auto key_result = DeriveMessageKey(shared_secret);
        if (key_result.IsErr()) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(key_result.UnwrapErr());
        }
        const auto message_key = std::move(key_result).Unwrap();
        auto nonce = XChaCha20Poly1305::GenerateNonce();
        const auto ad = BuildAssociatedData(header);
        auto seal_result = message_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return XChaCha20Poly1305::Encrypt(key, nonce, plaintext, ad);
        });
        if (seal_result.IsErr()) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(seal_result.UnwrapErr()));
        }
        auto ciphertext_result = std::move(seal_result).Unwrap();
        if (ciphertext_result.IsErr()) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(ciphertext_result.UnwrapErr());
        }
        auto ciphertext = std::move(ciphertext_result).Unwrap();
        debug::LogSeal(debug::Side::Initiator, nonce, ciphertext.size());
        return Result<EncryptedMessage, ProtocolFailure>::Ok(EncryptedMessage(
            std::move(header.sender_id),
            std::move(header.receiver_id),
            std::move(header.ephemeral_public),
            header.signed_pre_key_id,
            header.one_time_pre_key_id,
            std::move(nonce),
            std::move(ciphertext)));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> MessageCipher::Decrypt(
        const SharedSecret &shared_secret,
        const EncryptedMessage &message) {
        if (message.GetNonce().size() != kAeadNonceBytes) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Decryption("Nonce must be " + std::to_string(kAeadNonceBytes) + " bytes"));
        }
        if (message.GetCiphertext().size() < kAeadTagBytes) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Decryption(std::string(ErrorMessages::CIPHERTEXT_TOO_SMALL)));
        }
        auto key_result = DeriveMessageKey(shared_secret);
        if (key_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Decryption(key_result.UnwrapErr().message));
        }
        const auto message_key = std::move(key_result).Unwrap();
        const auto ad = BuildAssociatedData(HeaderOf(message));
        auto open_result = message_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return XChaCha20Poly1305::Decrypt(key, message.GetNonce(), message.GetCiphertext(), ad);
        });
        if (open_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Decryption(open_result.UnwrapErr().message));
        }
        auto plaintext_result = std::move(open_result).Unwrap();
        if (plaintext_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Decryption(plaintext_result.UnwrapErr().message));
        }
        debug::LogSeal(debug::Side::Responder, message.GetNonce(), message.GetCiphertext().size());
        return plaintext_result;
    }
}
