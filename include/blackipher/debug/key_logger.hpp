#pragma once

/**
 * @file key_logger.hpp
 * @brief Developer tracing of public key material and protocol steps.
 *
 * Compiled in only with BLACKIPHER_DEBUG_KEYS (CMake option of the same
 * name). Only public keys, identifiers and byte counts are ever passed
 * here; private scalars, DH outputs and derived keys stay in secure memory.
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace blackipher::debug {

enum class Side {
    Initiator,
    Responder,
    Owner
};

#ifdef BLACKIPHER_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Initiator: return "INITIATOR";
        case Side::Responder: return "RESPONDER";
        default: return "OWNER";
    }
}

#define BKP_LOG_KEY(side, operation, key_name, data) \
    do { \
        fprintf(stdout, "[BKP-DEBUG] %s %s %s: %s\n", \
            ::blackipher::debug::SideToString(side), \
            operation, \
            key_name, \
            ::blackipher::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define BKP_LOG_VALUE(side, operation, name, value) \
    do { \
        fprintf(stdout, "[BKP-DEBUG] %s %s %s: %s\n", \
            ::blackipher::debug::SideToString(side), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define BKP_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[BKP-DEBUG] %s %s %s\n", \
            ::blackipher::debug::SideToString(side), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

inline void LogIdentityCreated(
    std::string_view owner_id,
    std::span<const uint8_t> identity_public,
    uint32_t signed_pre_key_id,
    std::span<const uint8_t> signed_pre_key_public,
    size_t one_time_pre_key_count) {
    BKP_LOG_MSG(Side::Owner, "IDENTITY", std::string(owner_id).c_str());
    BKP_LOG_KEY(Side::Owner, "IDENTITY", "ed25519_public", identity_public);
    BKP_LOG_VALUE(Side::Owner, "IDENTITY", "spk_id", signed_pre_key_id);
    BKP_LOG_KEY(Side::Owner, "IDENTITY", "spk_public", signed_pre_key_public);
    BKP_LOG_VALUE(Side::Owner, "IDENTITY", "opk_count", one_time_pre_key_count);
}

inline void LogSignedPreKeyRotated(uint32_t new_id, std::span<const uint8_t> new_public, size_t retained) {
    BKP_LOG_VALUE(Side::Owner, "ROTATE", "spk_id", new_id);
    BKP_LOG_KEY(Side::Owner, "ROTATE", "spk_public", new_public);
    BKP_LOG_VALUE(Side::Owner, "ROTATE", "retained", retained);
}

inline void LogAgreement(
    Side side,
    std::span<const uint8_t> ephemeral_public,
    uint32_t signed_pre_key_id,
    bool used_one_time_pre_key,
    uint32_t one_time_pre_key_id,
    size_t ikm_bytes) {
    BKP_LOG_KEY(side, "AGREE", "ephemeral_public", ephemeral_public);
    BKP_LOG_VALUE(side, "AGREE", "spk_id", signed_pre_key_id);
    if (used_one_time_pre_key) {
        BKP_LOG_VALUE(side, "AGREE", "opk_id", one_time_pre_key_id);
    } else {
        BKP_LOG_MSG(side, "AGREE", "no one-time pre-key");
    }
    BKP_LOG_VALUE(side, "AGREE", "ikm_bytes", ikm_bytes);
}

inline void LogSeal(Side side, std::span<const uint8_t> nonce, size_t ciphertext_bytes) {
    BKP_LOG_KEY(side, "AEAD", "nonce", nonce);
    BKP_LOG_VALUE(side, "AEAD", "ciphertext_bytes", ciphertext_bytes);
}

#else // !BLACKIPHER_DEBUG_KEYS

#define BKP_LOG_KEY(side, operation, key_name, data) ((void)0)
#define BKP_LOG_VALUE(side, operation, name, value) ((void)0)
#define BKP_LOG_MSG(side, operation, message) ((void)0)

inline void LogIdentityCreated(std::string_view, std::span<const uint8_t>, uint32_t,
    std::span<const uint8_t>, size_t) {}
inline void LogSignedPreKeyRotated(uint32_t, std::span<const uint8_t>, size_t) {}
inline void LogAgreement(Side, std::span<const uint8_t>, uint32_t, bool, uint32_t, size_t) {}
inline void LogSeal(Side, std::span<const uint8_t>, size_t) {}

#endif // BLACKIPHER_DEBUG_KEYS

} // namespace blackipher::debug
