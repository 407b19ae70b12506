#pragma once
#include <vector>
#include <cstdint>
#include <span>
namespace blackipher::protocol::models {
class OneTimePreKeyPublic {
public:
    OneTimePreKeyPublic(uint32_t one_time_pre_key_id, std::vector<uint8_t> public_key)
        : one_time_pre_key_id_(one_time_pre_key_id)
        , public_key_(std::move(public_key)) {}
    [[nodiscard]] uint32_t GetOneTimePreKeyId() const noexcept {
        return one_time_pre_key_id_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::span<const uint8_t> GetPublicKeySpan() const noexcept {
        return std::span<const uint8_t>(public_key_);
    }
    bool operator==(const OneTimePreKeyPublic&) const = default;
private:
    uint32_t one_time_pre_key_id_;
    std::vector<uint8_t> public_key_;
};
}
