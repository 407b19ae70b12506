#pragma once

#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace blackipher::protocol::configuration {

/// Tunables for identity creation and message exchange.
///
/// A plain constexpr value. Presets cover the common cases and the
/// With* modifiers return adjusted copies:
///
/// ```cpp
/// auto config = ProtocolConfig::Default().WithOneTimePreKeyBatchSize(2);
/// if (auto check = config.Validate(); check.IsErr()) { ... }
/// ```
class ProtocolConfig {
public:
    /// Four one-time pre-keys per identity, one previous signed pre-key
    /// kept after rotation.
    [[nodiscard]] static constexpr ProtocolConfig Default() noexcept {
        return ProtocolConfig(4, 1, true, 64 * 1024);
    }

    /// Small batch used by demos and walkthroughs.
    [[nodiscard]] static constexpr ProtocolConfig Classroom() noexcept {
        return ProtocolConfig(2, 1, true, 4 * 1024);
    }

    /// Never draws one-time pre-keys; every agreement is ephemeral x signed pre-key.
    [[nodiscard]] static constexpr ProtocolConfig SignedPreKeyOnly() noexcept {
        return ProtocolConfig(0, 1, false, 64 * 1024);
    }

    [[nodiscard]] constexpr ProtocolConfig WithOneTimePreKeyBatchSize(const uint32_t count) const noexcept {
        ProtocolConfig copy = *this;
        copy.one_time_pre_key_batch_size_ = count;
        return copy;
    }

    /// 0 means a rotated-out signed pre-key is dropped immediately.
    [[nodiscard]] constexpr ProtocolConfig WithRetainedSignedPreKeys(const uint32_t count) const noexcept {
        ProtocolConfig copy = *this;
        copy.retained_signed_pre_keys_ = count;
        return copy;
    }

    [[nodiscard]] constexpr ProtocolConfig WithOneTimePreKeys(const bool enabled) const noexcept {
        ProtocolConfig copy = *this;
        copy.use_one_time_pre_keys_ = enabled;
        return copy;
    }

    [[nodiscard]] constexpr ProtocolConfig WithMaxPlaintextBytes(const size_t bytes) const noexcept {
        ProtocolConfig copy = *this;
        copy.max_plaintext_bytes_ = bytes;
        return copy;
    }

    [[nodiscard]] constexpr uint32_t GetOneTimePreKeyBatchSize() const noexcept {
        return one_time_pre_key_batch_size_;
    }

    [[nodiscard]] constexpr uint32_t GetRetainedSignedPreKeys() const noexcept {
        return retained_signed_pre_keys_;
    }

    [[nodiscard]] constexpr bool UsesOneTimePreKeys() const noexcept {
        return use_one_time_pre_keys_;
    }

    [[nodiscard]] constexpr size_t GetMaxPlaintextBytes() const noexcept {
        return max_plaintext_bytes_;
    }

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const {
        if (one_time_pre_key_batch_size_ > kMaxOneTimePreKeyBatch) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                "One-time pre-key batch size " + std::to_string(one_time_pre_key_batch_size_) +
                " exceeds " + std::to_string(kMaxOneTimePreKeyBatch)));
        }
        if (retained_signed_pre_keys_ > kMaxRetainedSignedPreKeys) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                "Retained signed pre-key count " + std::to_string(retained_signed_pre_keys_) +
                " exceeds " + std::to_string(kMaxRetainedSignedPreKeys)));
        }
        if (max_plaintext_bytes_ == 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Maximum plaintext size must be positive"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    constexpr bool operator==(const ProtocolConfig&) const noexcept = default;

    static constexpr uint32_t kMaxOneTimePreKeyBatch = 1000;
    static constexpr uint32_t kMaxRetainedSignedPreKeys = 16;

private:
    constexpr ProtocolConfig(
        const uint32_t one_time_pre_key_batch_size,
        const uint32_t retained_signed_pre_keys,
        const bool use_one_time_pre_keys,
        const size_t max_plaintext_bytes) noexcept
        : one_time_pre_key_batch_size_(one_time_pre_key_batch_size)
        , retained_signed_pre_keys_(retained_signed_pre_keys)
        , use_one_time_pre_keys_(use_one_time_pre_keys)
        , max_plaintext_bytes_(max_plaintext_bytes) {}

    uint32_t one_time_pre_key_batch_size_;
    uint32_t retained_signed_pre_keys_;
    bool use_one_time_pre_keys_;
    size_t max_plaintext_bytes_;
};

} // namespace blackipher::protocol::configuration
