#pragma once
#include <optional>
#include <string>
#include <vector>
#include <cstdint>
namespace blackipher::protocol::models {

/**
 * @brief One sealed chat message plus the public header needed to open it.
 *
 * Immutable once built. The header (ids, ephemeral key, pre-key ids) is
 * bound into the AEAD associated data, so altering any field breaks
 * decryption.
 */
class EncryptedMessage {
public:
    EncryptedMessage(
        std::string sender_id,
        std::string receiver_id,
        std::vector<uint8_t> ephemeral_public,
        uint32_t signed_pre_key_id,
        std::optional<uint32_t> one_time_pre_key_id,
        std::vector<uint8_t> nonce,
        std::vector<uint8_t> ciphertext)
        : sender_id_(std::move(sender_id))
        , receiver_id_(std::move(receiver_id))
        , ephemeral_public_(std::move(ephemeral_public))
        , signed_pre_key_id_(signed_pre_key_id)
        , one_time_pre_key_id_(one_time_pre_key_id)
        , nonce_(std::move(nonce))
        , ciphertext_(std::move(ciphertext)) {}
    [[nodiscard]] const std::string& GetSenderId() const noexcept { return sender_id_; }
    [[nodiscard]] const std::string& GetReceiverId() const noexcept { return receiver_id_; }
    [[nodiscard]] const std::vector<uint8_t>& GetEphemeralPublic() const noexcept { return ephemeral_public_; }
    [[nodiscard]] uint32_t GetSignedPreKeyId() const noexcept { return signed_pre_key_id_; }
    [[nodiscard]] std::optional<uint32_t> GetOneTimePreKeyId() const noexcept { return one_time_pre_key_id_; }
    [[nodiscard]] const std::vector<uint8_t>& GetNonce() const noexcept { return nonce_; }
    [[nodiscard]] const std::vector<uint8_t>& GetCiphertext() const noexcept { return ciphertext_; }
    bool operator==(const EncryptedMessage&) const = default;
private:
    std::string sender_id_;
    std::string receiver_id_;
    std::vector<uint8_t> ephemeral_public_;
    uint32_t signed_pre_key_id_;
    std::optional<uint32_t> one_time_pre_key_id_;
    std::vector<uint8_t> nonce_;
    std::vector<uint8_t> ciphertext_;
};
}
