#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace blackipher::protocol {
struct Constants {
    static constexpr size_t MAX_SECURE_BUFFER_SIZE = 1'000'000'000;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct CryptoHashConstants {
    static constexpr uint8_t FILL_BYTE = 0xFF;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view SIGNED_PRE_KEY_FAILED = "Signed pre-key signature verification failed";
    static constexpr std::string_view AEAD_DECRYPTION_FAILED = "Message authentication failed";
    static constexpr std::string_view CIPHERTEXT_TOO_SMALL = "Ciphertext too small";
};
}
