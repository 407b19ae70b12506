#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace blackipher::protocol {

inline constexpr uint32_t kStateFormatVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kSharedSecretBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;
inline constexpr size_t kStateKeyBytes = 32;

// XChaCha20-Poly1305 (IETF)
inline constexpr size_t kAeadKeyBytes = 32;
inline constexpr size_t kAeadNonceBytes = 24;
inline constexpr size_t kAeadTagBytes = 16;

inline constexpr uint32_t kFirstSignedPreKeyId = 1;
inline constexpr uint32_t kFirstOneTimePreKeyId = 1;

inline constexpr std::string_view kAgreementInfo = "BlacKipher-Agreement-v1";
inline constexpr std::string_view kMessageKeyInfo = "BlacKipher-Message-v1";
inline constexpr std::string_view kAssociatedDataLabel = "BlacKipher-AD-v1";

// Key purpose strings used in failure messages
inline constexpr std::string_view kPurposeSignedPreKey = "signed-pre-key";
inline constexpr std::string_view kPurposeOneTimePreKey = "one-time-pre-key";
inline constexpr std::string_view kPurposeEphemeralX25519 = "ephemeral-x25519";

inline constexpr size_t kMaxProtobufMessageSize = static_cast<size_t>(std::numeric_limits<int>::max());

}  // namespace blackipher::protocol
